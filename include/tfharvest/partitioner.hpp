#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace tfharvest
{

struct Batch
{
    std::size_t index = 0;
    std::vector<std::string> ids;
};

// Ids of `all_ids` not in `done`, in manifest order, cut into batches of
// `batch_size` (the last one may be shorter). Throws std::invalid_argument
// for batch_size == 0.
std::vector<Batch> remaining_work(const std::vector<std::string> &all_ids, const std::unordered_set<std::string> &done,
                                  std::size_t batch_size);

} // namespace tfharvest
