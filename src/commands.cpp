#include "tfharvest/commands.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

#include "tfharvest/checkpoint.hpp"
#include "tfharvest/column_store.hpp"
#include "tfharvest/decoder.hpp"
#include "tfharvest/dispatcher.hpp"
#include "tfharvest/logging.hpp"
#include "tfharvest/manifest.hpp"
#include "tfharvest/partitioner.hpp"
#include "tfharvest/recovery.hpp"

namespace tfharvest
{

static bool ensure_dir(const std::string &dir, const char *what, std::string &err)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        err = std::string("failed to create ") + what + ": " + dir + " (" + ec.message() + ")";
        return false;
    }
    return true;
}

static bool load_plan_inputs(const RunConfig &cfg, Manifest &manifest, CheckpointLog &checkpoint, std::string &err)
{
    if (!read_manifest(cfg.manifest_path, manifest, err))
    {
        return false;
    }
    return checkpoint.load(err);
}

int run_harvest(const RunConfig &cfg, const std::atomic<bool> *stop_flag)
{
    std::string err;
    if (!validate_config(cfg, err) || !ensure_dir(cfg.store_dir, "store dir", err) ||
        !ensure_dir(cfg.log_dir, "log dir", err))
    {
        std::cerr << err << "\n";
        return 1;
    }
    auto log = make_controller_logger(cfg.log_dir, err);
    if (!log)
    {
        std::cerr << err << "\n";
        return 1;
    }

    Manifest manifest;
    CheckpointLog checkpoint(cfg.checkpoint_path);
    if (!load_plan_inputs(cfg, manifest, checkpoint, err))
    {
        log->error("{}", err);
        return 1;
    }
    for (const auto &skip : manifest.skipped)
    {
        log->warn("manifest line {} does not name a volume: {}", skip.line_no, skip.text);
    }
    if (manifest.duplicates > 0)
    {
        log->warn("manifest lists {} duplicate volumes; each is processed once", manifest.duplicates);
    }
    if (checkpoint.torn_bytes() > 0)
    {
        log->warn("checkpoint ends in an interrupted line ({} bytes); it will be ignored", checkpoint.torn_bytes());
    }

    RunSummary summary;
    summary.total_ids = manifest.ids.size();
    std::vector<Batch> batches;
    try
    {
        batches = remaining_work(manifest.ids, checkpoint.done(), cfg.batch_size);
    }
    catch (const std::invalid_argument &e)
    {
        log->error("{}", e.what());
        return 1;
    }
    for (const auto &b : batches)
    {
        summary.remaining_ids += b.ids.size();
    }
    summary.already_done = summary.total_ids - summary.remaining_ids;

    log->info("tfharvest {} pid {}", TFHARVEST_VERSION, current_pid());
    log->info("manifest: {} ({} volumes)", cfg.manifest_path, summary.total_ids);
    log->info("checkpoint: {} ({} done)", cfg.checkpoint_path, summary.already_done);
    log->info("remaining: {} volumes in {} batches of {}", summary.remaining_ids, batches.size(), cfg.batch_size);
    log->info("store dir: {}, log dir: {}", cfg.store_dir, cfg.log_dir);

    FeatureDecodeOptions decode_options;
    decode_options.include_header_footer = cfg.include_header_footer;
    FeatureFileDecoder decoder(decode_options);

    Dispatcher dispatcher(cfg, decoder, checkpoint, log);
    dispatcher.set_stop_flag(stop_flag);
    if (!dispatcher.run(batches, summary, err))
    {
        log->error("{}", err);
        return 1;
    }

    const std::string summary_path = (std::filesystem::path(cfg.store_dir) / "run_summary.json").string();
    if (!write_run_summary(summary, summary_path, err))
    {
        log->error("{}", err);
        return 1;
    }
    if (summary.problem_batches > 0)
    {
        log->warn("{} problem batches; their volumes stay unlogged and are retried by the next run",
                  summary.problem_batches);
    }
    log->info("summary: {}", summary_path);
    log->flush();
    return 0;
}

int run_plan(const RunConfig &cfg)
{
    std::string err;
    if (!validate_config(cfg, err))
    {
        std::cerr << err << "\n";
        return 1;
    }
    Manifest manifest;
    CheckpointLog checkpoint(cfg.checkpoint_path);
    if (!load_plan_inputs(cfg, manifest, checkpoint, err))
    {
        std::cerr << err << "\n";
        return 1;
    }
    std::vector<Batch> batches = remaining_work(manifest.ids, checkpoint.done(), cfg.batch_size);
    std::size_t remaining = 0;
    for (const auto &b : batches)
    {
        remaining += b.ids.size();
    }
    std::unordered_set<std::string> listed(manifest.ids.begin(), manifest.ids.end());
    std::size_t foreign = 0;
    for (const auto &id : checkpoint.done())
    {
        if (listed.count(id) == 0)
        {
            ++foreign;
        }
    }

    std::cout << "manifest volumes:   " << manifest.ids.size() << "\n";
    std::cout << "skipped lines:      " << manifest.skipped.size() << "\n";
    std::cout << "duplicates:         " << manifest.duplicates << "\n";
    std::cout << "checkpointed:       " << (manifest.ids.size() - remaining) << "\n";
    std::cout << "not in manifest:    " << foreign << "\n";
    std::cout << "remaining volumes:  " << remaining << "\n";
    std::cout << "batches (size " << cfg.batch_size << "): " << batches.size() << "\n";
    return 0;
}

int run_recover(const RunConfig &cfg, bool apply, const std::vector<std::string> &store_files)
{
    std::string err;
    if (!validate_config(cfg, err) || !ensure_dir(cfg.log_dir, "log dir", err))
    {
        std::cerr << err << "\n";
        return 1;
    }
    auto log = make_controller_logger(cfg.log_dir, err);
    if (!log)
    {
        std::cerr << err << "\n";
        return 1;
    }
    CheckpointLog checkpoint(cfg.checkpoint_path);
    if (!checkpoint.load(err))
    {
        log->error("{}", err);
        return 1;
    }

    RecoveryOptions options;
    options.window_rows = cfg.recovery_window_rows;
    options.id_pattern = cfg.id_pattern;
    RecoveryScanner scanner(checkpoint.done(), options);

    std::vector<RecoveryReport> reports;
    if (store_files.empty())
    {
        reports = scanner.reconcile_directory(cfg.store_dir);
    }
    else
    {
        for (const auto &path : store_files)
        {
            reports.push_back(scanner.reconcile(path));
        }
    }

    bool damaged = false;
    for (const auto &r : reports)
    {
        if (!r.ok())
        {
            damaged = true;
            log->error("{}: {}", r.store_path, r.error);
            continue;
        }
        log->info("{}: {} rows, scanned {} in {} windows{}, {} missing", r.store_path, r.total_rows, r.rows_scanned,
                  r.windows, r.stopped_early ? " (stopped early)" : "", r.missing.size());
        if (r.torn_tail_bytes > 0)
        {
            log->warn("{}: {} uncommitted tail bytes, cut on next append", r.store_path, r.torn_tail_bytes);
        }
    }

    std::vector<std::string> missing = collect_missing(reports);
    for (const auto &id : missing)
    {
        std::cout << id << "\n";
    }
    std::cout.flush();

    if (apply)
    {
        std::size_t written = 0;
        if (!checkpoint.append(missing, err, &written))
        {
            log->error("{}", err);
            return 1;
        }
        log->info("appended {} ids to {}", written, cfg.checkpoint_path);
    }
    else if (!missing.empty())
    {
        log->info("{} ids missing from the checkpoint; rerun with --apply to add them", missing.size());
    }
    return damaged ? 2 : 0;
}

int run_inspect(const RunConfig &cfg, const std::vector<std::string> &store_files)
{
    std::vector<std::string> files = store_files.empty() ? list_store_files(cfg.store_dir) : store_files;
    if (files.empty())
    {
        std::cerr << "no store files in " << cfg.store_dir << "\n";
        return 0;
    }

    bool damaged = false;
    for (const auto &path : files)
    {
        StoreReader reader;
        std::string err;
        if (!reader.open(path, err))
        {
            std::cout << path << ": error: " << err << "\n";
            damaged = true;
            continue;
        }
        std::unordered_set<std::string> volumes;
        std::vector<std::string> ids;
        for (const auto *block : reader.table_blocks(TableId::docs))
        {
            if (!reader.read_string_column(*block, 0, ids, err))
            {
                break;
            }
            volumes.insert(ids.begin(), ids.end());
        }
        if (!err.empty())
        {
            std::cout << path << ": error: " << err << "\n";
            damaged = true;
            continue;
        }
        std::cout << path << "\n";
        std::cout << "  batches:          " << reader.committed_batches() << "\n";
        std::cout << "  " << kDocsTableName << " rows:   " << reader.row_count(TableId::docs) << "\n";
        std::cout << "  " << kCorpusTableName << " rows: " << reader.row_count(TableId::corpus) << "\n";
        std::cout << "  volumes:          " << volumes.size() << "\n";
        std::cout << "  torn tail bytes:  " << reader.torn_tail_bytes() << "\n";
    }
    return damaged ? 2 : 0;
}

} // namespace tfharvest
