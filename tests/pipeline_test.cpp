#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "tfharvest/checkpoint.hpp"
#include "tfharvest/column_store.hpp"
#include "tfharvest/dispatcher.hpp"
#include "tfharvest/logging.hpp"
#include "tfharvest/partitioner.hpp"
#include "tfharvest/recovery.hpp"
#include "test_support.hpp"

using namespace tfharvest;
using tfharvest::testing::FailingStore;
using tfharvest::testing::make_volume;
using tfharvest::testing::MemoryDecoder;
using tfharvest::testing::read_file;
using tfharvest::testing::SlowDecoder;
using tfharvest::testing::TempDir;
using tfharvest::testing::ThrowingStore;

static std::string volume_id(int i)
{
    return "tst.v" + std::to_string(10000 + i);
}

static RunConfig config_for(const TempDir &dir, std::size_t workers)
{
    RunConfig cfg;
    cfg.store_dir = dir.file("stores");
    cfg.log_dir = dir.file("logs");
    cfg.checkpoint_path = dir.file("checkpoint.txt");
    cfg.batch_size = 25;
    cfg.workers = workers;
    cfg.progress_interval_ms = 60'000;
    return cfg;
}

static std::uint64_t stored_docs_rows(const std::string &store_dir)
{
    std::uint64_t rows = 0;
    for (const auto &path : list_store_files(store_dir))
    {
        StoreReader reader;
        std::string err;
        bool ok = reader.open(path, err);
        assert(ok);
        rows += reader.row_count(TableId::docs);
    }
    return rows;
}

// Throws on every message at warn level or above.
class ThrowingSink final : public spdlog::sinks::base_sink<std::mutex>
{
  protected:
    void sink_it_(const spdlog::details::log_msg &msg) override
    {
        if (msg.level >= spdlog::level::warn)
        {
            throw std::runtime_error("log sink failed");
        }
    }
    void flush_() override {}
};

// A logger whose failures reach the caller instead of being reported by spdlog.
static std::shared_ptr<spdlog::logger> throwing_logger(const std::string &name)
{
    auto log = std::make_shared<spdlog::logger>(name, std::make_shared<ThrowingSink>());
    log->set_error_handler([](const std::string &msg) { throw std::runtime_error(msg); });
    return log;
}

static void end_to_end_with_failures()
{
    TempDir dir("pipeline");
    RunConfig cfg = config_for(dir, 4);

    std::vector<std::string> ids;
    MemoryDecoder decoder;
    for (int i = 0; i < 1000; ++i)
    {
        ids.push_back(volume_id(i));
        decoder.add(make_volume(volume_id(i), i % 3 == 0 ? "fre" : "eng",
                                {{"common", 3}, {"w" + std::to_string(i % 17), 1 + i % 4}}));
    }
    decoder.fail(volume_id(137), "truncated gzip stream");
    decoder.fail(volume_id(802), "feature document has no page list");

    std::string err;
    CheckpointLog checkpoint(cfg.checkpoint_path);
    assert(checkpoint.load(err));
    auto batches = remaining_work(ids, checkpoint.done(), cfg.batch_size);
    assert(batches.size() == 40);

    RunSummary summary;
    Dispatcher dispatcher(cfg, decoder, checkpoint, make_null_logger("controller"));
    assert(dispatcher.run(batches, summary, err));
    assert(summary.batches_planned == 40);
    assert(summary.batches_dispatched == 40);
    assert(summary.batches_completed == 40);
    assert(summary.problem_batches == 0);
    assert(summary.ids_logged == 998);
    assert(summary.failures.size() == 2);
    assert(summary.docs_rows == 998 * 2);
    assert(summary.store_files.size() == 4);
    assert(!summary.stopped);

    // Failures are only in the worker logs, not in the checkpoint.
    std::string worker_logs;
    for (const auto &entry : std::filesystem::directory_iterator(cfg.log_dir))
    {
        worker_logs += read_file(entry.path().string());
    }
    assert(worker_logs.find(volume_id(137) + ": truncated gzip stream") != std::string::npos);
    assert(worker_logs.find(volume_id(802)) != std::string::npos);

    CheckpointLog reloaded(cfg.checkpoint_path);
    assert(reloaded.load(err));
    assert(reloaded.size() == 998);
    assert(!reloaded.contains(volume_id(137)));
    auto rest = remaining_work(ids, reloaded.done(), cfg.batch_size);
    assert(rest.size() == 1);
    assert((rest[0].ids == std::vector<std::string>{volume_id(137), volume_id(802)}));
    assert(stored_docs_rows(cfg.store_dir) == 998 * 2);

    // The rerun only sees the two broken volumes and adds no rows.
    RunSummary second;
    Dispatcher rerun(cfg, decoder, reloaded, make_null_logger("controller"));
    assert(rerun.run(rest, second, err));
    assert(second.batches_completed == 1);
    assert(second.problem_batches == 1);
    assert(second.ids_logged == 0);
    assert(stored_docs_rows(cfg.store_dir) == 998 * 2);

    nlohmann::json j = summary_to_json(summary);
    assert(j["ids_logged"] == 998);
    assert(j["failed_ids"].size() == 2);
    const std::string summary_path = dir.file("run_summary.json");
    assert(write_run_summary(summary, summary_path, err));
    assert(nlohmann::json::parse(read_file(summary_path))["batches_completed"] == 40);
}

static void failed_append_is_retried_next_run()
{
    TempDir dir("pipeline-atomic");
    RunConfig cfg = config_for(dir, 1);
    cfg.batch_size = 5;

    std::vector<std::string> ids;
    MemoryDecoder decoder;
    for (int i = 0; i < 20; ++i)
    {
        ids.push_back(volume_id(i));
        decoder.add(make_volume(volume_id(i), "eng", {{"a", 2}, {"b", 3}}));
    }

    std::string err;
    CheckpointLog checkpoint(cfg.checkpoint_path);
    assert(checkpoint.load(err));
    Dispatcher dispatcher(cfg, decoder, checkpoint, make_null_logger("controller"));
    dispatcher.set_store_factory([&](std::size_t w, std::string &) -> std::unique_ptr<BatchStore> {
        return std::make_unique<FailingStore>(worker_store_path(cfg.store_dir, w), std::vector<std::size_t>{2});
    });
    RunSummary summary;
    assert(dispatcher.run(remaining_work(ids, checkpoint.done(), cfg.batch_size), summary, err));
    assert(summary.batches_completed == 4);
    assert(summary.problem_batches == 1);
    assert(summary.problem_batch_indices.size() == 1 && summary.problem_batch_indices[0] == 1);
    assert(summary.ids_logged == 15);
    for (int i = 5; i < 10; ++i)
    {
        assert(!checkpoint.contains(volume_id(i)));
    }
    assert(stored_docs_rows(cfg.store_dir) == 15 * 2);

    auto rest = remaining_work(ids, checkpoint.done(), cfg.batch_size);
    assert(rest.size() == 1);
    assert(rest[0].ids.front() == volume_id(5) && rest[0].ids.back() == volume_id(9));

    RunSummary second;
    Dispatcher rerun(cfg, decoder, checkpoint, make_null_logger("controller"));
    assert(rerun.run(rest, second, err));
    assert(second.ids_logged == 5);
    assert(checkpoint.size() == 20);
    assert(remaining_work(ids, checkpoint.done(), cfg.batch_size).empty());
}

static void stop_flag_prevents_new_batches()
{
    TempDir dir("pipeline-stop");
    RunConfig cfg = config_for(dir, 2);
    MemoryDecoder decoder;
    std::vector<std::string> ids;
    for (int i = 0; i < 50; ++i)
    {
        ids.push_back(volume_id(i));
        decoder.add(make_volume(volume_id(i), "eng", {{"a", 2}}));
    }

    std::string err;
    CheckpointLog checkpoint(cfg.checkpoint_path);
    assert(checkpoint.load(err));
    std::atomic<bool> stop{true};
    Dispatcher dispatcher(cfg, decoder, checkpoint, make_null_logger("controller"));
    dispatcher.set_stop_flag(&stop);
    RunSummary summary;
    assert(dispatcher.run(remaining_work(ids, checkpoint.done(), 10), summary, err));
    assert(summary.batches_planned == 5);
    assert(summary.batches_dispatched == 0);
    assert(summary.stopped);
    assert(checkpoint.size() == 0);

    RunSummary nothing;
    assert(dispatcher.run({}, nothing, err));
    assert(nothing.batches_completed == 0 && !nothing.stopped);
}

static void throwing_store_fails_only_its_batch()
{
    TempDir dir("pipeline-throw");
    RunConfig cfg = config_for(dir, 1);
    cfg.batch_size = 5;

    std::vector<std::string> ids;
    MemoryDecoder decoder;
    for (int i = 0; i < 20; ++i)
    {
        ids.push_back(volume_id(i));
        decoder.add(make_volume(volume_id(i), "eng", {{"a", 2}, {"b", 3}}));
    }

    std::string err;
    CheckpointLog checkpoint(cfg.checkpoint_path);
    assert(checkpoint.load(err));
    Dispatcher dispatcher(cfg, decoder, checkpoint, make_null_logger("controller"));
    dispatcher.set_store_factory([&](std::size_t w, std::string &) -> std::unique_ptr<BatchStore> {
        return std::make_unique<ThrowingStore>(worker_store_path(cfg.store_dir, w), std::vector<std::size_t>{2});
    });
    RunSummary summary;
    assert(dispatcher.run(remaining_work(ids, checkpoint.done(), cfg.batch_size), summary, err));
    assert(summary.batches_completed == 4);
    assert(summary.problem_batches == 1);
    assert(summary.problem_batch_indices.size() == 1 && summary.problem_batch_indices[0] == 1);
    assert(summary.ids_logged == 15);
    assert(!summary.stopped);
    assert(!checkpoint.contains(volume_id(5)));
    assert(stored_docs_rows(cfg.store_dir) == 15 * 2);
}

static void exception_in_worker_fails_only_its_batch()
{
    TempDir dir("pipeline-worker-throw");
    RunConfig cfg = config_for(dir, 1);
    cfg.batch_size = 5;

    std::vector<std::string> ids;
    MemoryDecoder decoder;
    for (int i = 0; i < 20; ++i)
    {
        ids.push_back(volume_id(i));
        decoder.add(make_volume(volume_id(i), "eng", {{"a", 2}}));
    }
    // The item failure makes the worker log a warning, and its logger throws.
    decoder.fail(volume_id(7), "truncated gzip stream");

    std::string err;
    CheckpointLog checkpoint(cfg.checkpoint_path);
    assert(checkpoint.load(err));
    Dispatcher dispatcher(cfg, decoder, checkpoint, make_null_logger("controller"));
    dispatcher.set_logger_factory(
        [](std::size_t w, std::string &) { return throwing_logger("w" + std::to_string(w)); });
    RunSummary summary;
    assert(dispatcher.run(remaining_work(ids, checkpoint.done(), cfg.batch_size), summary, err));
    assert(summary.batches_completed == 4);
    assert(summary.problem_batches == 1);
    assert(summary.problem_batch_indices[0] == 1);
    assert(summary.ids_logged == 15);
    assert(checkpoint.size() == 15);
}

static void checkpoint_failure_stops_dispatch()
{
    TempDir dir("pipeline-ckpt");
    RunConfig cfg = config_for(dir, 1);
    cfg.batch_size = 5;

    std::vector<std::string> ids;
    MemoryDecoder memory;
    for (int i = 0; i < 40; ++i)
    {
        ids.push_back(volume_id(i));
        memory.add(make_volume(volume_id(i), "eng", {{"a", 2}, {"b", 3}}));
    }
    SlowDecoder decoder(memory, std::chrono::milliseconds(50));

    std::string err;
    CheckpointLog checkpoint(cfg.checkpoint_path);
    assert(checkpoint.load(err));
    // A directory in the checkpoint's place makes every append fail.
    std::filesystem::create_directories(cfg.checkpoint_path);

    Dispatcher dispatcher(cfg, decoder, checkpoint, make_null_logger("controller"));
    RunSummary summary;
    assert(dispatcher.run(remaining_work(ids, checkpoint.done(), cfg.batch_size), summary, err));
    assert(summary.stopped);
    assert(summary.batches_completed >= 1);
    assert(summary.batches_dispatched < 8);
    assert(summary.checkpoint_errors == summary.batches_completed);
    assert(summary.problem_batches == summary.batches_completed);
    assert(summary.ids_logged == 0);

    // Nothing was checkpointed after the failure, so every committed id is
    // still at the store tail and recover finds all of them.
    std::filesystem::remove_all(cfg.checkpoint_path);
    CheckpointLog fresh(cfg.checkpoint_path);
    assert(fresh.load(err));
    RecoveryOptions options;
    options.window_rows = 4;
    RecoveryScanner scanner(fresh.done(), options);
    auto missing = collect_missing(scanner.reconcile_directory(cfg.store_dir));
    assert(missing.size() == summary.batches_completed * cfg.batch_size);
    assert(missing.size() * 2 == stored_docs_rows(cfg.store_dir));
    assert(fresh.append(missing, err));
    auto rest = remaining_work(ids, fresh.done(), cfg.batch_size);
    assert(rest.size() == 8 - summary.batches_completed);
}

static void stalled_batch_is_reported()
{
    TempDir dir("pipeline-stall");
    RunConfig cfg = config_for(dir, 1);
    cfg.stall_warning_seconds = 1;

    MemoryDecoder memory;
    memory.add(make_volume(volume_id(0), "eng", {{"a", 2}}));
    SlowDecoder decoder(memory, std::chrono::milliseconds(2500));

    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    auto controller = std::make_shared<spdlog::logger>("controller", sink);

    std::string err;
    CheckpointLog checkpoint(cfg.checkpoint_path);
    assert(checkpoint.load(err));
    Dispatcher dispatcher(cfg, decoder, checkpoint, controller);
    RunSummary summary;
    assert(dispatcher.run(remaining_work({volume_id(0)}, checkpoint.done(), cfg.batch_size), summary, err));
    assert(summary.batches_completed == 1);
    assert(summary.ids_logged == 1);

    const std::string text = captured.str();
    assert(text.find("no batch finished for 1s; worker 0 has run batch 0") != std::string::npos);
}

static void controller_exception_joins_workers()
{
    TempDir dir("pipeline-controller-throw");
    RunConfig cfg = config_for(dir, 2);
    cfg.batch_size = 2;

    // No volume is known to the decoder, so every batch is a problem batch and
    // the controller logs an error for the first one it drains.
    MemoryDecoder decoder;
    std::vector<std::string> ids;
    for (int i = 0; i < 40; ++i)
    {
        ids.push_back(volume_id(i));
    }

    std::string err;
    CheckpointLog checkpoint(cfg.checkpoint_path);
    assert(checkpoint.load(err));
    Dispatcher dispatcher(cfg, decoder, checkpoint, throwing_logger("controller"));
    RunSummary summary;
    bool thrown = false;
    try
    {
        dispatcher.run(remaining_work(ids, checkpoint.done(), cfg.batch_size), summary, err);
    }
    catch (const std::runtime_error &)
    {
        thrown = true;
    }
    assert(thrown);
    assert(summary.batches_completed == 1);
    assert(checkpoint.size() == 0);
}

int main()
{
    end_to_end_with_failures();
    failed_append_is_retried_next_run();
    stop_flag_prevents_new_batches();
    throwing_store_fails_only_its_batch();
    exception_in_worker_fails_only_its_batch();
    checkpoint_failure_stops_dispatch();
    stalled_batch_is_reported();
    controller_exception_joins_workers();
    return 0;
}
