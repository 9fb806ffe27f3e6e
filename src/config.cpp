#include "tfharvest/config.hpp"

#include <iostream>
#include <regex>
#include <thread>

#include "tfharvest/column_store.hpp"
#include "tfharvest/common.hpp"

namespace tfharvest
{

static std::size_t parse_size(const std::string &s, std::size_t def_val)
{
    std::size_t v = 0;
    return parse_size_arg(s, v) ? v : def_val;
}

void apply_env_overrides(RunConfig &cfg, const std::unordered_map<std::string, std::string> &env)
{
    auto get = [&](const std::string &key) -> const std::string * {
        auto it = env.find(key);
        if (it == env.end())
        {
            return nullptr;
        }
        return &it->second;
    };
    if (auto v = get("MANIFEST_PATH"))
        cfg.manifest_path = *v;
    if (auto v = get("CHECKPOINT_PATH"))
        cfg.checkpoint_path = *v;
    if (auto v = get("FEATURE_ROOT"))
        cfg.feature_root = *v;
    if (auto v = get("STORE_DIR"))
        cfg.store_dir = *v;
    if (auto v = get("LOG_DIR"))
        cfg.log_dir = *v;
    if (auto v = get("VOLUME_SUFFIX"))
        cfg.volume_suffix = *v;
    if (auto v = get("BATCH_SIZE"))
        cfg.batch_size = parse_size(*v, cfg.batch_size);
    if (auto v = get("WORKERS"))
        cfg.workers = parse_size(*v, cfg.workers);
    if (auto v = get("MAX_TOKEN_BYTES"))
        cfg.max_token_bytes = parse_size(*v, cfg.max_token_bytes);
    if (auto v = get("INCLUDE_HEADER_FOOTER"))
        cfg.include_header_footer = parse_bool(*v, cfg.include_header_footer);
    if (auto v = get("TRIM_ENABLED"))
        cfg.trim.enabled = parse_bool(*v, cfg.trim.enabled);
    if (auto v = get("TRIM_LANGUAGE"))
        cfg.trim.language = *v;
    if (auto v = get("TRIM_MIN_COUNT"))
        cfg.trim.min_batch_count =
            static_cast<std::int64_t>(parse_size(*v, static_cast<std::size_t>(cfg.trim.min_batch_count)));
    if (auto v = get("PROGRESS_INTERVAL_MS"))
        cfg.progress_interval_ms = parse_size(*v, cfg.progress_interval_ms);
    if (auto v = get("STALL_WARNING_SECONDS"))
        cfg.stall_warning_seconds = parse_size(*v, cfg.stall_warning_seconds);
    if (auto v = get("RECOVERY_WINDOW_ROWS"))
        cfg.recovery_window_rows = parse_size(*v, cfg.recovery_window_rows);
    if (auto v = get("ID_PATTERN"))
        cfg.id_pattern = *v;
}

bool validate_config(const RunConfig &cfg, std::string &err)
{
    if (cfg.batch_size == 0)
    {
        err = "batch size must be at least 1";
        return false;
    }
    if (cfg.max_token_bytes == 0 || cfg.max_token_bytes > kTokenWidth)
    {
        err = "max token bytes must be between 1 and " + std::to_string(kTokenWidth);
        return false;
    }
    if (cfg.recovery_window_rows == 0)
    {
        err = "recovery window must be at least 1 row";
        return false;
    }
    if (cfg.trim.min_batch_count < 0)
    {
        err = "trim min count must not be negative";
        return false;
    }
    try
    {
        std::regex re(cfg.id_pattern);
    }
    catch (const std::regex_error &e)
    {
        err = "invalid id pattern '" + cfg.id_pattern + "': " + e.what();
        return false;
    }
    return true;
}

std::size_t effective_workers(const RunConfig &cfg)
{
    if (cfg.workers > 0)
    {
        return cfg.workers;
    }
    const auto hw = std::thread::hardware_concurrency();
    return hw == 0 ? 4 : hw;
}

void print_usage()
{
    std::cerr << "tfharvest " << TFHARVEST_VERSION
              << ": per-volume and per-corpus token counts from extracted-features files (resumable)\n"
              << "Usage:\n"
              << "  tfharvest run [options]                 Process every volume not yet in the checkpoint\n"
              << "  tfharvest plan [options]                Show remaining work without processing it\n"
              << "  tfharvest recover [--apply] [stores...] Find stored volumes missing from the checkpoint\n"
              << "  tfharvest inspect [stores...]           Summarize store files\n\n"
              << "Options:\n"
              << "  --env-file <path>              Path to .env (default: .env)\n"
              << "  --manifest <path>              Relative volume paths, one per line (default: manifest.txt)\n"
              << "  --checkpoint <path>            Processed volume ids (default: checkpoint.txt)\n"
              << "  --feature-root <dir>           Root the manifest paths are relative to (default: .)\n"
              << "  --store-dir <dir>              Store file directory (default: stores)\n"
              << "  --log-dir <dir>                Per-worker log directory (default: logs)\n"
              << "  --volume-suffix <ext>          Feature file suffix (default: .json.gz)\n"
              << "  --batch-size <n>               Volumes per batch (default: 25)\n"
              << "  --workers <n>                  Worker count (0=auto)\n"
              << "  --max-token-bytes <n>          Token byte cap, at most 50 (default: 50)\n"
              << "  --all-sections                 Count header and footer tokens too\n"
              << "  --no-trim                      Keep low-count rows of the trimmed language\n"
              << "  --trim-language <code>         Language thinned in /tf/corpus (default: eng)\n"
              << "  --trim-min-count <n>           Drop its rows below this batch count (default: 2)\n"
              << "  --progress-interval-ms <n>     Progress print interval (default: 1000)\n"
              << "  --stall-warning-seconds <n>    Warn when no batch finishes for this long, 0=off (default: 600)\n"
              << "  --window-rows <n>              Recovery scan window (default: 10000)\n"
              << "  --id-pattern <regex>           Expected volume id shape for recovery\n"
              << "  --apply                        recover: append missing ids to the checkpoint\n"
              << "  --help                         Show this help\n";
}

static bool parse_command(const std::string &s, Command &out)
{
    if (s == "run")
        out = Command::run;
    else if (s == "plan")
        out = Command::plan;
    else if (s == "recover")
        out = Command::recover;
    else if (s == "inspect")
        out = Command::inspect;
    else
        return false;
    return true;
}

bool parse_args(int argc, char **argv, CliArgs &args, std::string &err)
{
    err.clear();
    if (argc < 2)
    {
        print_usage();
        err = "missing command";
        return false;
    }
    std::string first = argv[1];
    if (first == "--help" || first == "-h")
    {
        print_usage();
        return false;
    }
    if (!parse_command(first, args.command))
    {
        err = "unknown command: " + first;
        return false;
    }

    for (int i = 2; i + 1 < argc; ++i)
    {
        if (std::string(argv[i]) == "--env-file")
        {
            args.config.env_file = argv[i + 1];
        }
    }
    apply_env_overrides(args.config, read_env_file(args.config.env_file));

    RunConfig &cfg = args.config;
    for (int i = 2; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto need_value = [&](const std::string &name) -> const char * {
            if (i + 1 >= argc)
            {
                err = "missing value for " + name;
                return nullptr;
            }
            return argv[++i];
        };
        auto need_size = [&](const std::string &name, std::size_t &out) -> bool {
            const char *v = need_value(name);
            if (!v)
                return false;
            if (!parse_size_arg(v, out))
            {
                err = "invalid " + name + ": " + v;
                return false;
            }
            return true;
        };
        auto need_string = [&](const std::string &name, std::string &out) -> bool {
            const char *v = need_value(name);
            if (!v)
                return false;
            out = v;
            return true;
        };

        if (arg == "--help" || arg == "-h")
        {
            print_usage();
            return false;
        }
        else if (arg == "--env-file")
        {
            ++i;
        }
        else if (arg == "--manifest")
        {
            if (!need_string(arg, cfg.manifest_path))
                return false;
        }
        else if (arg == "--checkpoint")
        {
            if (!need_string(arg, cfg.checkpoint_path))
                return false;
        }
        else if (arg == "--feature-root")
        {
            if (!need_string(arg, cfg.feature_root))
                return false;
        }
        else if (arg == "--store-dir")
        {
            if (!need_string(arg, cfg.store_dir))
                return false;
        }
        else if (arg == "--log-dir")
        {
            if (!need_string(arg, cfg.log_dir))
                return false;
        }
        else if (arg == "--volume-suffix")
        {
            if (!need_string(arg, cfg.volume_suffix))
                return false;
        }
        else if (arg == "--batch-size")
        {
            if (!need_size(arg, cfg.batch_size))
                return false;
        }
        else if (arg == "--workers")
        {
            if (!need_size(arg, cfg.workers))
                return false;
        }
        else if (arg == "--max-token-bytes")
        {
            if (!need_size(arg, cfg.max_token_bytes))
                return false;
        }
        else if (arg == "--all-sections")
        {
            cfg.include_header_footer = true;
        }
        else if (arg == "--no-trim")
        {
            cfg.trim.enabled = false;
        }
        else if (arg == "--trim-language")
        {
            if (!need_string(arg, cfg.trim.language))
                return false;
        }
        else if (arg == "--trim-min-count")
        {
            std::size_t x = 0;
            if (!need_size(arg, x))
                return false;
            cfg.trim.min_batch_count = static_cast<std::int64_t>(x);
        }
        else if (arg == "--progress-interval-ms")
        {
            if (!need_size(arg, cfg.progress_interval_ms))
                return false;
        }
        else if (arg == "--stall-warning-seconds")
        {
            if (!need_size(arg, cfg.stall_warning_seconds))
                return false;
        }
        else if (arg == "--window-rows")
        {
            if (!need_size(arg, cfg.recovery_window_rows))
                return false;
        }
        else if (arg == "--id-pattern")
        {
            if (!need_string(arg, cfg.id_pattern))
                return false;
        }
        else if (arg == "--apply")
        {
            args.apply = true;
        }
        else if (!starts_with(arg, "--") &&
                 (args.command == Command::recover || args.command == Command::inspect))
        {
            args.store_files.push_back(arg);
        }
        else
        {
            err = "unknown argument: " + arg;
            return false;
        }
    }
    return validate_config(cfg, err);
}

} // namespace tfharvest
