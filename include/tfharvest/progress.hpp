#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace tfharvest
{

// Rate-limited "[label] batches x/y ... ETA" lines on stderr.
class ProgressTracker
{
  public:
    ProgressTracker(std::uint64_t total_batches, const std::string &label, std::uint64_t interval_ms);
    void add(std::uint64_t batches, std::uint64_t volumes);
    void add_problem(std::uint64_t batches);
    void finish();

  private:
    void maybe_print(bool force);

    std::string label_;
    std::uint64_t total_ = 0;
    std::uint64_t interval_ms_ = 1000;
    std::atomic<std::uint64_t> done_batches_{0};
    std::atomic<std::uint64_t> done_volumes_{0};
    std::atomic<std::uint64_t> problem_batches_{0};
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point last_print_;
    std::mutex print_mu_;
};

} // namespace tfharvest
