#include "tfharvest/batch_processor.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <iterator>
#include <map>
#include <utility>

#include "tfharvest/volume_paths.hpp"

namespace tfharvest
{

std::vector<CorpusRow> fold_corpus(const TokenTable &rows, const TrimPolicy &trim, std::size_t *trimmed)
{
    std::map<std::pair<std::string, std::string>, std::int64_t> sums;
    for (const auto &row : rows)
    {
        sums[{row.language, row.token}] += row.count;
    }

    std::vector<CorpusRow> out;
    out.reserve(sums.size());
    std::size_t dropped = 0;
    for (auto &kv : sums)
    {
        if (trim.enabled && kv.first.first == trim.language && kv.second < trim.min_batch_count)
        {
            ++dropped;
            continue;
        }
        out.push_back({kv.first.first, kv.first.second, kv.second});
    }
    if (trimmed)
    {
        *trimmed = dropped;
    }
    return out;
}

std::vector<DocsRow> project_docs(const TokenTable &rows)
{
    std::vector<DocsRow> out;
    out.reserve(rows.size());
    for (const auto &row : rows)
    {
        out.push_back({row.volume_id, row.token, row.count});
    }
    return out;
}

BatchProcessor::BatchProcessor(const RunConfig &cfg, const VolumeDecoder &decoder, BatchStore &store,
                               std::shared_ptr<spdlog::logger> log, std::size_t worker_index)
    : cfg_(cfg), decoder_(decoder), store_(store), log_(std::move(log)), worker_index_(worker_index),
      extractor_(cfg.max_token_bytes)
{
}

bool BatchProcessor::load_volume(const std::string &id, ExtractResult &out, std::string &err) const
{
    if (id.size() > kIdWidth)
    {
        err = "volume id longer than " + std::to_string(kIdWidth) + " bytes";
        return false;
    }
    const std::string path =
        (std::filesystem::path(cfg_.feature_root) / id_to_relative_path(id, cfg_.volume_suffix)).string();

    Volume volume;
    if (!decoder_.decode(path, volume, err))
    {
        return false;
    }
    if (volume.id != id)
    {
        err = "feature file holds volume " + volume.id;
        return false;
    }
    if (resolve_language(volume.language).size() > kLanguageWidth)
    {
        err = "language code longer than " + std::to_string(kLanguageWidth) + " bytes";
        return false;
    }
    out = extractor_.extract(volume);
    if (out.status == ExtractStatus::failed)
    {
        err = out.error;
        return false;
    }
    return true;
}

BatchResult BatchProcessor::process(const Batch &batch)
{
    auto start = std::chrono::steady_clock::now();
    BatchResult result;
    result.batch_index = batch.index;
    result.worker_index = worker_index_;
    result.batch_size = batch.ids.size();

    TokenTable rows;
    std::vector<std::string> processed;
    processed.reserve(batch.ids.size());
    for (const auto &id : batch.ids)
    {
        ExtractResult extracted;
        std::string err;
        bool ok = false;
        try
        {
            ok = load_volume(id, extracted, err);
        }
        catch (const std::exception &e)
        {
            err = e.what();
        }
        if (!ok)
        {
            log_->warn("batch {}: skipping {}: {}", batch.index, id, err);
            result.failures.push_back({id, err});
            continue;
        }
        if (extracted.status == ExtractStatus::empty)
        {
            log_->info("batch {}: {} has no tokens", batch.index, id);
            ++result.empty_volumes;
        }
        else
        {
            rows.insert(rows.end(), std::make_move_iterator(extracted.table.begin()),
                        std::make_move_iterator(extracted.table.end()));
        }
        processed.push_back(id);
    }

    std::vector<DocsRow> docs = project_docs(rows);
    std::vector<CorpusRow> corpus = fold_corpus(rows, cfg_.trim, &result.trimmed_rows);
    rows.clear();
    rows.shrink_to_fit();

    std::string err;
    bool appended = false;
    try
    {
        appended = store_.append_batch(docs, corpus, err);
    }
    catch (const std::exception &e)
    {
        err = e.what();
    }
    if (!appended)
    {
        result.append_error = err.empty() ? "store append failed" : err;
        log_->error("batch {}: store append failed, {} ids not committed: {}", batch.index, processed.size(),
                    result.append_error);
    }
    else
    {
        result.done = std::move(processed);
        result.docs_rows = docs.size();
        result.corpus_rows = corpus.size();
    }

    result.seconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(std::chrono::steady_clock::now() - start).count();
    log_->info("batch {}: {}/{} ids done, {} failed, {} empty, docs {} corpus {} (trimmed {}) in {:.2f}s",
               batch.index, result.done.size(), result.batch_size, result.failures.size(), result.empty_volumes,
               result.docs_rows, result.corpus_rows, result.trimmed_rows, result.seconds);
    return result;
}

} // namespace tfharvest
