#include "tfharvest/dispatcher.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>

#include "tfharvest/common.hpp"
#include "tfharvest/logging.hpp"
#include "tfharvest/progress.hpp"

namespace tfharvest
{

std::string worker_store_path(const std::string &store_dir, std::size_t worker_index)
{
    return (std::filesystem::path(store_dir) / ("store-" + std::to_string(current_pid()) + "-w" +
                                                std::to_string(worker_index) + kStoreFileExtension))
        .string();
}

nlohmann::json summary_to_json(const RunSummary &summary)
{
    nlohmann::json failures = nlohmann::json::array();
    for (const auto &f : summary.failures)
    {
        failures.push_back({{"id", f.id}, {"error", f.error}});
    }
    return {
        {"finished_at", now_string()},
        {"total_ids", summary.total_ids},
        {"already_done", summary.already_done},
        {"remaining_ids", summary.remaining_ids},
        {"batches_planned", summary.batches_planned},
        {"batches_dispatched", summary.batches_dispatched},
        {"batches_completed", summary.batches_completed},
        {"problem_batches", summary.problem_batches},
        {"problem_batch_indices", summary.problem_batch_indices},
        {"ids_logged", summary.ids_logged},
        {"empty_volumes", summary.empty_volumes},
        {"item_failures", summary.failures.size()},
        {"failed_ids", failures},
        {"checkpoint_errors", summary.checkpoint_errors},
        {"docs_rows", summary.docs_rows},
        {"corpus_rows", summary.corpus_rows},
        {"store_files", summary.store_files},
        {"elapsed_seconds", summary.elapsed_seconds},
        {"stopped", summary.stopped},
    };
}

bool write_run_summary(const RunSummary &summary, const std::string &path, std::string &err)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        err = "failed to write run summary: " + path;
        return false;
    }
    out << summary_to_json(summary).dump(2) << "\n";
    out.flush();
    if (!out)
    {
        err = "failed to flush run summary: " + path;
        return false;
    }
    return true;
}

Dispatcher::Dispatcher(const RunConfig &cfg, const VolumeDecoder &decoder, CheckpointLog &checkpoint,
                       std::shared_ptr<spdlog::logger> log)
    : cfg_(cfg), decoder_(decoder), checkpoint_(checkpoint), log_(std::move(log))
{
    store_factory_ = [this](std::size_t worker_index, std::string &) -> std::unique_ptr<BatchStore> {
        return std::make_unique<StoreWriter>(worker_store_path(cfg_.store_dir, worker_index));
    };
    logger_factory_ = [this](std::size_t worker_index, std::string &err) {
        return make_worker_logger(cfg_.log_dir, worker_index, err);
    };
}

bool Dispatcher::stop_requested() const
{
    return stop_.load(std::memory_order_relaxed) ||
           (external_stop_ && external_stop_->load(std::memory_order_relaxed));
}

void Dispatcher::warn_stalled()
{
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mu_);
    for (std::size_t w = 0; w < in_flight_.size(); ++w)
    {
        const auto &slot = in_flight_[w];
        if (!slot.busy)
        {
            continue;
        }
        double running = std::chrono::duration_cast<std::chrono::duration<double>>(now - slot.started).count();
        log_->warn("no batch finished for {}s; worker {} has run batch {} for {}", cfg_.stall_warning_seconds, w,
                   slot.batch_index, format_duration(running));
    }
}

void Dispatcher::handle_result(BatchResult &result, RunSummary &summary)
{
    ++summary.batches_completed;
    summary.empty_volumes += result.empty_volumes;
    summary.docs_rows += result.docs_rows;
    summary.corpus_rows += result.corpus_rows;
    for (auto &f : result.failures)
    {
        summary.failures.push_back(std::move(f));
    }

    bool problem = false;
    if (!result.done.empty())
    {
        std::string err;
        std::size_t written = 0;
        if (!checkpoint_.append(result.done, err, &written))
        {
            ++summary.checkpoint_errors;
            problem = true;
            // The unlogged batch must stay at the store tail for recover.
            request_stop();
            log_->error("batch {}: committed but not checkpointed ({} ids), stopping; run recover: {}",
                        result.batch_index, result.done.size(), err);
        }
        summary.ids_logged += written;
    }
    else
    {
        problem = true;
        if (!result.append_error.empty())
        {
            log_->error("batch {} (worker {}): nothing committed: {}", result.batch_index, result.worker_index,
                        result.append_error);
        }
        else
        {
            log_->error("batch {} (worker {}): no volume of {} succeeded", result.batch_index, result.worker_index,
                        result.batch_size);
        }
    }
    if (problem)
    {
        ++summary.problem_batches;
        summary.problem_batch_indices.push_back(result.batch_index);
    }
}

namespace
{

// Joins the workers on every exit from run(). When the controller unwinds
// early the workers are told to stop first, so they finish only the batch in
// hand.
struct WorkerJoin
{
    std::vector<std::thread> &threads;
    std::atomic<bool> &stop;

    void join_all()
    {
        for (auto &t : threads)
        {
            if (t.joinable())
            {
                t.join();
            }
        }
    }

    ~WorkerJoin()
    {
        bool pending = std::any_of(threads.begin(), threads.end(), [](const std::thread &t) { return t.joinable(); });
        if (pending)
        {
            stop.store(true);
            join_all();
        }
    }
};

} // namespace

bool Dispatcher::run(const std::vector<Batch> &batches, RunSummary &summary, std::string &err)
{
    auto start_time = std::chrono::steady_clock::now();
    summary.batches_planned = batches.size();
    if (batches.empty())
    {
        log_->info("nothing to do");
        return true;
    }

    const std::size_t num_workers = std::max<std::size_t>(1, std::min(effective_workers(cfg_), batches.size()));
    std::vector<std::unique_ptr<BatchStore>> stores;
    std::vector<std::unique_ptr<BatchProcessor>> processors;
    stores.reserve(num_workers);
    processors.reserve(num_workers);
    for (std::size_t w = 0; w < num_workers; ++w)
    {
        auto worker_log = logger_factory_(w, err);
        if (!worker_log)
        {
            return false;
        }
        auto store = store_factory_(w, err);
        if (!store)
        {
            if (err.empty())
            {
                err = "failed to set up store for worker " + std::to_string(w);
            }
            return false;
        }
        if (auto *writer = dynamic_cast<StoreWriter *>(store.get()))
        {
            summary.store_files.push_back(writer->path());
        }
        processors.push_back(std::make_unique<BatchProcessor>(cfg_, decoder_, *store, std::move(worker_log), w));
        stores.push_back(std::move(store));
    }

    {
        std::lock_guard<std::mutex> lock(mu_);
        finished_.clear();
        workers_done_ = 0;
        in_flight_.assign(num_workers, InFlight{});
    }
    log_->info("dispatching {} batches to {} workers", batches.size(), num_workers);

    ProgressTracker progress(batches.size(), "harvest", cfg_.progress_interval_ms);
    std::atomic<std::size_t> next_idx{0};
    std::atomic<std::size_t> dispatched{0};

    auto worker = [&](std::size_t w) {
        while (!stop_requested())
        {
            std::size_t idx = next_idx.fetch_add(1);
            if (idx >= batches.size())
            {
                break;
            }
            dispatched.fetch_add(1);
            {
                std::lock_guard<std::mutex> lock(mu_);
                in_flight_[w] = {batches[idx].index, std::chrono::steady_clock::now(), true};
            }
            BatchResult r;
            try
            {
                r = processors[w]->process(batches[idx]);
            }
            catch (const std::exception &e)
            {
                r = BatchResult{};
                r.batch_index = batches[idx].index;
                r.worker_index = w;
                r.batch_size = batches[idx].ids.size();
                r.append_error = std::string("worker failed: ") + e.what();
            }
            {
                std::lock_guard<std::mutex> lock(mu_);
                in_flight_[w].busy = false;
                finished_.push_back(std::move(r));
            }
            cv_.notify_one();
        }
        {
            std::lock_guard<std::mutex> lock(mu_);
            ++workers_done_;
        }
        cv_.notify_one();
    };

    std::vector<std::thread> threads;
    WorkerJoin join_guard{threads, stop_};
    threads.reserve(num_workers);
    for (std::size_t w = 0; w < num_workers; ++w)
    {
        threads.emplace_back(worker, w);
    }

    const auto stall = std::chrono::seconds(cfg_.stall_warning_seconds);
    while (true)
    {
        std::unique_lock<std::mutex> lock(mu_);
        auto ready = [&]() { return !finished_.empty() || workers_done_ == num_workers; };
        if (cfg_.stall_warning_seconds > 0)
        {
            if (!cv_.wait_for(lock, stall, ready))
            {
                lock.unlock();
                warn_stalled();
                continue;
            }
        }
        else
        {
            cv_.wait(lock, ready);
        }
        if (finished_.empty())
        {
            break;
        }
        BatchResult r = std::move(finished_.front());
        finished_.pop_front();
        lock.unlock();

        handle_result(r, summary);
        if (r.ok())
        {
            progress.add(1, r.done.size());
        }
        else
        {
            progress.add_problem(1);
        }
    }
    join_guard.join_all();
    progress.finish();

    summary.batches_dispatched = dispatched.load();
    summary.stopped = summary.batches_dispatched < batches.size();
    summary.elapsed_seconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(std::chrono::steady_clock::now() - start_time)
            .count();
    if (summary.stopped)
    {
        log_->warn("stopped after {} of {} batches; rerun to continue", summary.batches_dispatched, batches.size());
    }
    log_->info("{} batches completed, {} problem batches, {} ids logged, {} item failures in {}",
               summary.batches_completed, summary.problem_batches, summary.ids_logged, summary.failures.size(),
               format_duration(summary.elapsed_seconds));
    return true;
}

} // namespace tfharvest
