#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "tfharvest/column_store.hpp"
#include "tfharvest/config.hpp"
#include "tfharvest/decoder.hpp"
#include "tfharvest/extractor.hpp"
#include "tfharvest/partitioner.hpp"

namespace tfharvest
{

struct ItemFailure
{
    std::string id;
    std::string error;
};

struct BatchResult
{
    std::size_t batch_index = 0;
    std::size_t worker_index = 0;
    std::size_t batch_size = 0;

    // Ids whose rows are committed, empty volumes included. Empty whenever the
    // store append failed.
    std::vector<std::string> done;
    std::vector<ItemFailure> failures;
    std::size_t empty_volumes = 0;

    std::size_t docs_rows = 0;
    std::size_t corpus_rows = 0;
    std::size_t trimmed_rows = 0;
    std::string append_error;
    double seconds = 0.0;

    bool ok() const
    {
        return append_error.empty() && !done.empty();
    }
};

// Sums rows per (language, token) in that order and drops rows the trim
// policy rejects. Counts dropped rows in `trimmed` when given.
std::vector<CorpusRow> fold_corpus(const TokenTable &rows, const TrimPolicy &trim, std::size_t *trimmed = nullptr);

std::vector<DocsRow> project_docs(const TokenTable &rows);

class BatchProcessor
{
  public:
    BatchProcessor(const RunConfig &cfg, const VolumeDecoder &decoder, BatchStore &store,
                   std::shared_ptr<spdlog::logger> log, std::size_t worker_index = 0);

    BatchResult process(const Batch &batch);

  private:
    bool load_volume(const std::string &id, ExtractResult &out, std::string &err) const;

    const RunConfig &cfg_;
    const VolumeDecoder &decoder_;
    BatchStore &store_;
    std::shared_ptr<spdlog::logger> log_;
    std::size_t worker_index_;
    TokenExtractor extractor_;
};

} // namespace tfharvest
