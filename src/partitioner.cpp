#include "tfharvest/partitioner.hpp"

#include <stdexcept>

namespace tfharvest
{

std::vector<Batch> remaining_work(const std::vector<std::string> &all_ids, const std::unordered_set<std::string> &done,
                                  std::size_t batch_size)
{
    if (batch_size == 0)
    {
        throw std::invalid_argument("batch_size must be at least 1");
    }
    std::vector<Batch> batches;
    Batch current;
    for (const auto &id : all_ids)
    {
        if (done.count(id) != 0)
        {
            continue;
        }
        current.ids.push_back(id);
        if (current.ids.size() == batch_size)
        {
            current.index = batches.size();
            batches.push_back(std::move(current));
            current = Batch{};
        }
    }
    if (!current.ids.empty())
    {
        current.index = batches.size();
        batches.push_back(std::move(current));
    }
    return batches;
}

} // namespace tfharvest
