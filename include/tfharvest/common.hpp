#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace tfharvest
{

std::string trim(const std::string &s);
bool starts_with(const std::string &s, const std::string &prefix);
bool ends_with(const std::string &s, const std::string &suffix);

bool parse_u64_arg(const std::string &s, std::uint64_t &out);
bool parse_size_arg(const std::string &s, std::size_t &out);
bool parse_bool(const std::string &s, bool def_val);

// KEY=VALUE lines, '#' comments, optional quotes. Missing file -> empty map.
std::unordered_map<std::string, std::string> read_env_file(const std::string &path);

std::string now_string();
std::string format_duration(double seconds);

bool is_valid_utf8(const std::string &s);

// Drops trailing characters until the UTF-8 encoding is at most max_bytes.
// Never leaves a partial multi-byte sequence at the end.
std::string truncate_utf8_bytes(const std::string &s, std::size_t max_bytes);

} // namespace tfharvest
