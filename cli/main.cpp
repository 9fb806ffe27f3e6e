#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#include "tfharvest/commands.hpp"
#include "tfharvest/config.hpp"

namespace
{

std::atomic<bool> g_stop{false};

void handle_stop_signal(int)
{
    g_stop.store(true);
}

} // namespace

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);

    tfharvest::CliArgs args;
    std::string err;
    if (!tfharvest::parse_args(argc, argv, args, err))
    {
        if (err.empty())
        {
            return 0;
        }
        std::cerr << err << "\n";
        return 1;
    }

    switch (args.command)
    {
    case tfharvest::Command::run:
        std::signal(SIGINT, handle_stop_signal);
        std::signal(SIGTERM, handle_stop_signal);
        return tfharvest::run_harvest(args.config, &g_stop);
    case tfharvest::Command::plan:
        return tfharvest::run_plan(args.config);
    case tfharvest::Command::recover:
        return tfharvest::run_recover(args.config, args.apply, args.store_files);
    case tfharvest::Command::inspect:
        return tfharvest::run_inspect(args.config, args.store_files);
    }
    return 1;
}
