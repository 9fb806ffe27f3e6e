#include "tfharvest/logging.hpp"

#include <filesystem>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <unistd.h>

namespace tfharvest
{

long current_pid()
{
    return static_cast<long>(::getpid());
}

std::string controller_log_path(const std::string &log_dir)
{
    return (std::filesystem::path(log_dir) / ("controller-" + std::to_string(current_pid()) + ".log")).string();
}

std::string worker_log_path(const std::string &log_dir, std::size_t worker_index)
{
    return (std::filesystem::path(log_dir) /
            ("worker-" + std::to_string(current_pid()) + "-w" + std::to_string(worker_index) + ".log"))
        .string();
}

static std::shared_ptr<spdlog::logger> build_logger(const std::string &name, std::vector<spdlog::sink_ptr> sinks,
                                                    spdlog::level::level_enum flush_level)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_pattern(kLogPattern);
    logger->set_level(spdlog::level::info);
    logger->flush_on(flush_level);
    return logger;
}

std::shared_ptr<spdlog::logger> make_controller_logger(const std::string &log_dir, std::string &err)
{
    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(controller_log_path(log_dir), false));
        return build_logger("controller", std::move(sinks), spdlog::level::warn);
    }
    catch (const spdlog::spdlog_ex &e)
    {
        err = std::string("failed to open controller log: ") + e.what();
        return nullptr;
    }
}

std::shared_ptr<spdlog::logger> make_worker_logger(const std::string &log_dir, std::size_t worker_index,
                                                   std::string &err)
{
    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(worker_log_path(log_dir, worker_index), false));
        return build_logger("w" + std::to_string(worker_index), std::move(sinks), spdlog::level::info);
    }
    catch (const spdlog::spdlog_ex &e)
    {
        err = "failed to open worker log " + std::to_string(worker_index) + ": " + e.what();
        return nullptr;
    }
}

std::shared_ptr<spdlog::logger> make_null_logger(const std::string &name)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    return build_logger(name, std::move(sinks), spdlog::level::off);
}

} // namespace tfharvest
