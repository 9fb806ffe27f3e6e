#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "tfharvest/config.hpp"

namespace tfharvest
{

// Exit codes: 0 success (problem batches included), 1 configuration or setup
// error, 2 a store file is structurally damaged (recover, inspect).
int run_harvest(const RunConfig &cfg, const std::atomic<bool> *stop_flag);
int run_plan(const RunConfig &cfg);
int run_recover(const RunConfig &cfg, bool apply, const std::vector<std::string> &store_files);
int run_inspect(const RunConfig &cfg, const std::vector<std::string> &store_files);

} // namespace tfharvest
