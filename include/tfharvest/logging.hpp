#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace tfharvest
{

// Every line starts with a millisecond timestamp so controller and worker logs
// can be merge-sorted.
inline constexpr const char *kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

long current_pid();

std::string controller_log_path(const std::string &log_dir);
std::string worker_log_path(const std::string &log_dir, std::size_t worker_index);

// stderr plus controller-<pid>.log. Returns nullptr and sets err when the log
// file cannot be opened.
std::shared_ptr<spdlog::logger> make_controller_logger(const std::string &log_dir, std::string &err);

// worker-<pid>-w<index>.log only.
std::shared_ptr<spdlog::logger> make_worker_logger(const std::string &log_dir, std::size_t worker_index,
                                                   std::string &err);

// Discards everything.
std::shared_ptr<spdlog::logger> make_null_logger(const std::string &name);

} // namespace tfharvest
