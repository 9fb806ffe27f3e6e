#pragma once

#include <cstddef>
#include <cstdint>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace tfharvest
{

struct RecoveryOptions
{
    std::size_t window_rows = 10'000;
    std::string id_pattern = R"(^[a-z0-9]{2,8}\.\S+$)";
};

struct RecoveryReport
{
    std::string store_path;
    std::vector<std::string> missing; // store order, no duplicates
    std::uint64_t rows_scanned = 0;
    std::uint64_t total_rows = 0;
    std::size_t windows = 0;
    bool stopped_early = false;
    std::uint64_t torn_tail_bytes = 0;
    std::string error;

    bool ok() const
    {
        return error.empty();
    }
};

// Finds volumes whose rows reached a store but whose ids never reached the
// checkpoint (a crash between commit and checkpoint append).
class RecoveryScanner
{
  public:
    // Throws std::regex_error for an invalid id_pattern.
    RecoveryScanner(const std::unordered_set<std::string> &done, RecoveryOptions options);

    // Walks /tf/docs ids from the end in windows of window_rows and stops after
    // the first window whose ids are all checkpointed.
    RecoveryReport reconcile(const std::string &store_path) const;

    // One report per *.tfs file in dir; a bad file does not affect the others.
    std::vector<RecoveryReport> reconcile_directory(const std::string &dir) const;

  private:
    const std::unordered_set<std::string> &done_;
    RecoveryOptions options_;
    std::regex id_re_;
};

// Missing ids over all reports, first occurrence kept.
std::vector<std::string> collect_missing(const std::vector<RecoveryReport> &reports);

} // namespace tfharvest
