#include "tfharvest/volume_paths.hpp"

#include <array>
#include <filesystem>

#include "tfharvest/common.hpp"

namespace tfharvest
{

namespace
{
const std::array<const char *, 4> kFeatureSuffixes = {".json.gz", ".json.xz", ".json.bz2", ".json"};
} // namespace

std::string pairtree_clean(const std::string &s)
{
    std::string out = s;
    for (char &c : out)
    {
        if (c == ':')
            c = '+';
        else if (c == '/')
            c = '=';
        else if (c == '.')
            c = ',';
    }
    return out;
}

std::string pairtree_unclean(const std::string &s)
{
    std::string out = s;
    for (char &c : out)
    {
        if (c == '+')
            c = ':';
        else if (c == '=')
            c = '/';
        else if (c == ',')
            c = '.';
    }
    return out;
}

std::string id_to_relative_path(const std::string &id, const std::string &suffix)
{
    auto dot = id.find('.');
    std::string prefix = dot == std::string::npos ? std::string() : id.substr(0, dot);
    std::string cleaned = pairtree_clean(dot == std::string::npos ? id : id.substr(dot + 1));

    std::filesystem::path p(prefix);
    p /= "pairtree_root";
    for (std::size_t i = 0; i < cleaned.size(); i += 2)
    {
        p /= cleaned.substr(i, 2);
    }
    p /= cleaned;
    p /= prefix + "." + cleaned + suffix;
    return p.generic_string();
}

bool relative_path_to_id(const std::string &path, std::string &id)
{
    std::string name = std::filesystem::path(path).filename().string();
    bool stripped = false;
    for (const char *suffix : kFeatureSuffixes)
    {
        if (ends_with(name, suffix))
        {
            name.erase(name.size() - std::char_traits<char>::length(suffix));
            stripped = true;
            break;
        }
    }
    if (!stripped)
    {
        return false;
    }
    auto dot = name.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= name.size())
    {
        return false;
    }
    id = name.substr(0, dot) + "." + pairtree_unclean(name.substr(dot + 1));
    return true;
}

} // namespace tfharvest
