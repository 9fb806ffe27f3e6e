#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>
#include <spdlog/logger.h>

#include "tfharvest/batch_processor.hpp"
#include "tfharvest/checkpoint.hpp"

namespace tfharvest
{

struct RunSummary
{
    std::size_t total_ids = 0;
    std::size_t already_done = 0;
    std::size_t remaining_ids = 0;

    std::size_t batches_planned = 0;
    std::size_t batches_dispatched = 0;
    std::size_t batches_completed = 0;
    std::size_t problem_batches = 0;
    std::vector<std::size_t> problem_batch_indices;

    std::size_t ids_logged = 0;
    std::size_t empty_volumes = 0;
    std::vector<ItemFailure> failures;
    std::size_t checkpoint_errors = 0;

    std::uint64_t docs_rows = 0;
    std::uint64_t corpus_rows = 0;
    std::vector<std::string> store_files;

    double elapsed_seconds = 0.0;
    bool stopped = false;
};

nlohmann::json summary_to_json(const RunSummary &summary);
bool write_run_summary(const RunSummary &summary, const std::string &path, std::string &err);

// Runs batches on a pool of worker threads. Each worker owns one store and one
// log; the calling thread drains finished batches in completion order and
// appends their ids to the checkpoint.
class Dispatcher
{
  public:
    using StoreFactory = std::function<std::unique_ptr<BatchStore>(std::size_t worker_index, std::string &err)>;
    using LoggerFactory =
        std::function<std::shared_ptr<spdlog::logger>(std::size_t worker_index, std::string &err)>;

    Dispatcher(const RunConfig &cfg, const VolumeDecoder &decoder, CheckpointLog &checkpoint,
               std::shared_ptr<spdlog::logger> log);

    // Defaults: StoreWriter at <store_dir>/store-<pid>-w<k>.tfs and a worker
    // log under <log_dir>.
    void set_store_factory(StoreFactory factory)
    {
        store_factory_ = std::move(factory);
    }
    void set_logger_factory(LoggerFactory factory)
    {
        logger_factory_ = std::move(factory);
    }

    // Polled by workers before taking a batch; may be set from a signal handler.
    void set_stop_flag(const std::atomic<bool> *flag)
    {
        external_stop_ = flag;
    }
    void request_stop()
    {
        stop_.store(true);
    }

    // False only when the workers cannot be set up; batch failures are
    // reported through the summary.
    bool run(const std::vector<Batch> &batches, RunSummary &summary, std::string &err);

  private:
    struct InFlight
    {
        std::size_t batch_index = 0;
        std::chrono::steady_clock::time_point started;
        bool busy = false;
    };

    bool stop_requested() const;
    void handle_result(BatchResult &result, RunSummary &summary);
    void warn_stalled();

    const RunConfig &cfg_;
    const VolumeDecoder &decoder_;
    CheckpointLog &checkpoint_;
    std::shared_ptr<spdlog::logger> log_;
    StoreFactory store_factory_;
    LoggerFactory logger_factory_;

    std::atomic<bool> stop_{false};
    const std::atomic<bool> *external_stop_ = nullptr;

    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<BatchResult> finished_;
    std::size_t workers_done_ = 0;
    std::vector<InFlight> in_flight_;
};

std::string worker_store_path(const std::string &store_dir, std::size_t worker_index);

} // namespace tfharvest
