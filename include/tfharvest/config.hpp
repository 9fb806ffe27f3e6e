#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace tfharvest
{

// Thinning applied to /tf/corpus before each append. Only rows of `language`
// whose batch-local count is below `min_batch_count` are dropped; every other
// language keeps count=1 rows. Heuristic, pending validation.
struct TrimPolicy
{
    bool enabled = true;
    std::string language = "eng";
    std::int64_t min_batch_count = 2;
};

struct RunConfig
{
    std::string env_file = ".env";
    std::string manifest_path = "manifest.txt";
    std::string checkpoint_path = "checkpoint.txt";
    std::string feature_root = ".";
    std::string store_dir = "stores";
    std::string log_dir = "logs";
    std::string volume_suffix = ".json.gz";

    std::size_t batch_size = 25;
    std::size_t workers = 0; // 0 -> hardware threads
    std::size_t max_token_bytes = 50;
    bool include_header_footer = false;
    TrimPolicy trim;

    std::size_t progress_interval_ms = 1000;
    std::size_t stall_warning_seconds = 600;

    std::size_t recovery_window_rows = 10'000;
    std::string id_pattern = R"(^[a-z0-9]{2,8}\.\S+$)";
};

enum class Command
{
    run = 0,
    plan,
    recover,
    inspect
};

struct CliArgs
{
    Command command = Command::run;
    RunConfig config;
    bool apply = false;
    std::vector<std::string> store_files;
};

void apply_env_overrides(RunConfig &cfg, const std::unordered_map<std::string, std::string> &env);
bool validate_config(const RunConfig &cfg, std::string &err);
std::size_t effective_workers(const RunConfig &cfg);

void print_usage();

// Reads --env-file first, applies the .env values, then the remaining flags.
bool parse_args(int argc, char **argv, CliArgs &args, std::string &err);

} // namespace tfharvest
