#include "tfharvest/recovery.hpp"

#include <algorithm>
#include <utility>

#include "tfharvest/column_store.hpp"

namespace tfharvest
{

RecoveryScanner::RecoveryScanner(const std::unordered_set<std::string> &done, RecoveryOptions options)
    : done_(done), options_(std::move(options)), id_re_(options_.id_pattern)
{
}

RecoveryReport RecoveryScanner::reconcile(const std::string &store_path) const
{
    RecoveryReport report;
    report.store_path = store_path;

    StoreReader reader;
    std::string err;
    if (!reader.open(store_path, err))
    {
        report.error = err;
        return report;
    }
    report.torn_tail_bytes = reader.torn_tail_bytes();
    report.total_rows = reader.row_count(TableId::docs);

    std::vector<const BlockInfo *> blocks = reader.table_blocks(TableId::docs);
    std::size_t bi = blocks.size();
    std::vector<std::string> ids;
    std::size_t pos = 0;
    auto next_block = [&]() {
        while (pos == 0 && bi > 0)
        {
            --bi;
            if (!reader.read_string_column(*blocks[bi], 0, ids, err))
            {
                return false;
            }
            pos = ids.size();
        }
        return true;
    };

    if (!next_block())
    {
        report.error = err;
        return report;
    }
    if (pos == 0)
    {
        return report;
    }
    if (!std::regex_search(ids[pos - 1], id_re_))
    {
        report.error = "last row id '" + ids[pos - 1] + "' does not match " + options_.id_pattern + " in " + store_path;
        return report;
    }

    std::vector<std::string> found; // newest first
    const std::size_t window = std::max<std::size_t>(options_.window_rows, 1);
    while (pos > 0)
    {
        std::size_t in_window = 0;
        bool all_done = true;
        while (in_window < window)
        {
            if (!next_block())
            {
                report.error = err;
                return report;
            }
            if (pos == 0)
            {
                break;
            }
            const std::string &id = ids[--pos];
            ++in_window;
            if (done_.count(id) == 0)
            {
                all_done = false;
                found.push_back(id);
            }
        }
        ++report.windows;
        report.rows_scanned += in_window;
        if (all_done)
        {
            if (!next_block())
            {
                report.error = err;
                return report;
            }
            report.stopped_early = pos > 0;
            break;
        }
        if (!next_block())
        {
            report.error = err;
            return report;
        }
    }

    std::unordered_set<std::string> seen;
    for (auto it = found.rbegin(); it != found.rend(); ++it)
    {
        if (seen.insert(*it).second)
        {
            report.missing.push_back(*it);
        }
    }
    return report;
}

std::vector<RecoveryReport> RecoveryScanner::reconcile_directory(const std::string &dir) const
{
    std::vector<RecoveryReport> reports;
    for (const auto &path : list_store_files(dir))
    {
        reports.push_back(reconcile(path));
    }
    return reports;
}

std::vector<std::string> collect_missing(const std::vector<RecoveryReport> &reports)
{
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto &r : reports)
    {
        for (const auto &id : r.missing)
        {
            if (seen.insert(id).second)
            {
                out.push_back(id);
            }
        }
    }
    return out;
}

} // namespace tfharvest
