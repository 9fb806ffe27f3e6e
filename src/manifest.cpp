#include "tfharvest/manifest.hpp"

#include <fstream>
#include <unordered_set>

#include "tfharvest/common.hpp"
#include "tfharvest/volume_paths.hpp"

namespace tfharvest
{

bool read_manifest(const std::string &path, Manifest &out, std::string &err)
{
    out = Manifest{};
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        err = "failed to open manifest: " + path;
        return false;
    }

    std::unordered_set<std::string> seen;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line))
    {
        ++line_no;
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#')
        {
            continue;
        }
        std::string id;
        if (!relative_path_to_id(entry, id))
        {
            out.skipped.push_back({line_no, entry});
            continue;
        }
        if (!seen.insert(id).second)
        {
            ++out.duplicates;
            continue;
        }
        out.ids.push_back(std::move(id));
    }
    if (in.bad())
    {
        err = "failed to read manifest: " + path;
        return false;
    }
    return true;
}

} // namespace tfharvest
