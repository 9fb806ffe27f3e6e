#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace tfharvest
{

// Append-only list of finished volume ids, one per line. Only the controller
// writes it.
class CheckpointLog
{
  public:
    explicit CheckpointLog(std::string path);

    // Missing file -> empty set. A last line without '\n' is an interrupted
    // append; it is not counted and the next append cuts it off.
    bool load(std::string &err);

    // Writes the ids not yet present, in order, and flushes. Returns the
    // number of lines written through `written` when given.
    bool append(const std::vector<std::string> &ids, std::string &err, std::size_t *written = nullptr);

    bool contains(const std::string &id) const
    {
        return done_.count(id) != 0;
    }
    std::size_t size() const
    {
        return done_.size();
    }
    const std::unordered_set<std::string> &done() const
    {
        return done_;
    }
    const std::string &path() const
    {
        return path_;
    }
    std::size_t torn_bytes() const
    {
        return torn_bytes_;
    }

  private:
    std::string path_;
    std::unordered_set<std::string> done_;
    std::uint64_t valid_bytes_ = 0;
    std::size_t torn_bytes_ = 0;
};

} // namespace tfharvest
