#include "tfharvest/checkpoint.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

namespace tfharvest
{

CheckpointLog::CheckpointLog(std::string path) : path_(std::move(path)) {}

bool CheckpointLog::load(std::string &err)
{
    done_.clear();
    valid_bytes_ = 0;
    torn_bytes_ = 0;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec))
    {
        return true;
    }
    std::ifstream in(path_, std::ios::binary);
    if (!in)
    {
        err = "failed to open checkpoint: " + path_;
        return false;
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        err = "failed to read checkpoint: " + path_;
        return false;
    }

    std::size_t start = 0;
    while (start < data.size())
    {
        std::size_t nl = data.find('\n', start);
        if (nl == std::string::npos)
        {
            torn_bytes_ = data.size() - start;
            break;
        }
        std::string line = data.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (!line.empty())
        {
            done_.insert(std::move(line));
        }
        start = nl + 1;
    }
    valid_bytes_ = start;
    return true;
}

bool CheckpointLog::append(const std::vector<std::string> &ids, std::string &err, std::size_t *written)
{
    std::vector<const std::string *> fresh;
    std::unordered_set<std::string> seen;
    for (const auto &id : ids)
    {
        if (id.empty() || done_.count(id) != 0 || !seen.insert(id).second)
        {
            continue;
        }
        fresh.push_back(&id);
    }
    if (written)
    {
        *written = 0;
    }
    if (fresh.empty())
    {
        return true;
    }

    std::filesystem::path p(path_);
    if (p.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec)
        {
            err = "failed to create checkpoint dir: " + p.parent_path().string();
            return false;
        }
    }

    if (torn_bytes_ > 0)
    {
        std::error_code ec;
        std::filesystem::resize_file(path_, valid_bytes_, ec);
        if (ec)
        {
            err = "failed to cut interrupted checkpoint line: " + path_ + " (" + ec.message() + ")";
            return false;
        }
        torn_bytes_ = 0;
    }

    std::ofstream out(path_, std::ios::binary | std::ios::app);
    if (!out)
    {
        err = "failed to append checkpoint: " + path_;
        return false;
    }
    std::string block;
    for (const auto *id : fresh)
    {
        block += *id;
        block.push_back('\n');
    }
    out.write(block.data(), static_cast<std::streamsize>(block.size()));
    out.flush();
    if (!out)
    {
        err = "failed to flush checkpoint: " + path_;
        return false;
    }

    for (const auto *id : fresh)
    {
        valid_bytes_ += id->size() + 1;
        done_.insert(*id);
    }
    if (written)
    {
        *written = fresh.size();
    }
    return true;
}

} // namespace tfharvest
