#include "tfharvest/progress.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include "tfharvest/common.hpp"

namespace tfharvest
{

ProgressTracker::ProgressTracker(std::uint64_t total_batches, const std::string &label, std::uint64_t interval_ms)
    : label_(label), total_(total_batches), interval_ms_(interval_ms)
{
    start_ = std::chrono::steady_clock::now();
    last_print_ = start_;
}

void ProgressTracker::add(std::uint64_t batches, std::uint64_t volumes)
{
    done_batches_.fetch_add(batches, std::memory_order_relaxed);
    done_volumes_.fetch_add(volumes, std::memory_order_relaxed);
    maybe_print(false);
}

void ProgressTracker::add_problem(std::uint64_t batches)
{
    done_batches_.fetch_add(batches, std::memory_order_relaxed);
    problem_batches_.fetch_add(batches, std::memory_order_relaxed);
    maybe_print(false);
}

void ProgressTracker::finish()
{
    maybe_print(true);
}

void ProgressTracker::maybe_print(bool force)
{
    std::lock_guard<std::mutex> lock(print_mu_);
    auto now = std::chrono::steady_clock::now();
    if (!force)
    {
        auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_print_).count();
        if (delta < static_cast<long long>(interval_ms_))
        {
            return;
        }
    }
    last_print_ = now;
    std::uint64_t done = done_batches_.load(std::memory_order_relaxed);
    std::uint64_t volumes = done_volumes_.load(std::memory_order_relaxed);
    std::uint64_t problems = problem_batches_.load(std::memory_order_relaxed);
    double elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(now - start_).count();
    double batch_rate = elapsed > 0.0 ? static_cast<double>(done) / elapsed : 0.0;
    double pct = total_ > 0 ? 100.0 * static_cast<double>(done) / static_cast<double>(total_) : 0.0;
    double eta = (batch_rate > 0.0 && total_ > done) ? static_cast<double>(total_ - done) / batch_rate : 0.0;

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss << "[" << label_ << "] batches " << done << "/" << total_ << " (" << std::setprecision(1) << pct << "%)";
    if (volumes > 0)
    {
        oss << " vols " << volumes;
    }
    if (problems > 0)
    {
        oss << " problems " << problems;
    }
    if (batch_rate > 0.0)
    {
        oss << " rate " << std::setprecision(2) << batch_rate << " b/s";
    }
    if (eta > 0.0)
    {
        oss << " ETA " << format_duration(eta);
    }
    oss << "\n";
    std::cerr << oss.str();
}

} // namespace tfharvest
