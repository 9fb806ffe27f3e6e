#include "tfharvest/common.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace tfharvest
{

std::string trim(const std::string &s)
{
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
    {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    {
        --end;
    }
    return s.substr(start, end - start);
}

bool starts_with(const std::string &s, const std::string &prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string &s, const std::string &suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool parse_u64_arg(const std::string &s, std::uint64_t &out)
{
    if (s.empty() || s[0] == '-' || s[0] == '+')
    {
        return false;
    }
    try
    {
        std::size_t pos = 0;
        std::uint64_t v = static_cast<std::uint64_t>(std::stoull(s, &pos, 10));
        if (pos != s.size())
        {
            return false;
        }
        out = v;
        return true;
    }
    catch (const std::invalid_argument &)
    {
        return false;
    }
    catch (const std::out_of_range &)
    {
        return false;
    }
}

bool parse_size_arg(const std::string &s, std::size_t &out)
{
    std::uint64_t v = 0;
    if (!parse_u64_arg(s, v))
    {
        return false;
    }
    if (v > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max()))
    {
        return false;
    }
    out = static_cast<std::size_t>(v);
    return true;
}

bool parse_bool(const std::string &s, bool def_val)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
    {
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on")
    {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off")
    {
        return false;
    }
    return def_val;
}

std::unordered_map<std::string, std::string> read_env_file(const std::string &path)
{
    std::unordered_map<std::string, std::string> env;
    std::ifstream in(path);
    if (!in)
    {
        return env;
    }
    bool first_line = true;
    std::string line;
    while (std::getline(in, line))
    {
        if (first_line)
        {
            first_line = false;
            if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
                static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF)
            {
                line.erase(0, 3);
            }
        }
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#')
        {
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        std::string key = trim(trimmed.substr(0, eq));
        std::string val = trim(trimmed.substr(eq + 1));
        if (val.size() >= 2 &&
            ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\'')))
        {
            val = val.substr(1, val.size() - 2);
        }
        env[key] = val;
    }
    return env;
}

std::string now_string()
{
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

std::string format_duration(double seconds)
{
    int sec = static_cast<int>(seconds + 0.5);
    int h = sec / 3600;
    int m = (sec % 3600) / 60;
    int s = sec % 60;
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << h << ":" << std::setw(2) << m << ":" << std::setw(2) << s;
    return oss.str();
}

static std::size_t sequence_length(unsigned char lead)
{
    if (lead < 0x80)
    {
        return 1;
    }
    if ((lead >> 5) == 0x6)
    {
        return 2;
    }
    if ((lead >> 4) == 0xE)
    {
        return 3;
    }
    if ((lead >> 3) == 0x1E)
    {
        return 4;
    }
    return 0;
}

bool is_valid_utf8(const std::string &s)
{
    std::size_t i = 0;
    while (i < s.size())
    {
        std::size_t n = sequence_length(static_cast<unsigned char>(s[i]));
        if (n == 0 || i + n > s.size())
        {
            return false;
        }
        for (std::size_t k = 1; k < n; ++k)
        {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80)
            {
                return false;
            }
        }
        i += n;
    }
    return true;
}

std::string truncate_utf8_bytes(const std::string &s, std::size_t max_bytes)
{
    if (s.size() <= max_bytes)
    {
        return s;
    }
    // Walk back from the cap to the first byte that starts a character.
    std::size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80)
    {
        --cut;
    }
    return s.substr(0, cut);
}

} // namespace tfharvest
