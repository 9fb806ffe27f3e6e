#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tfharvest
{

struct SkippedLine
{
    std::size_t line_no = 0;
    std::string text;
};

struct Manifest
{
    std::vector<std::string> ids; // manifest order, first occurrence kept
    std::vector<SkippedLine> skipped;
    std::size_t duplicates = 0;
};

// One relative feature-file path per line; blank lines and '#' comments are
// ignored. Lines that do not name a volume land in `skipped`.
bool read_manifest(const std::string &path, Manifest &out, std::string &err);

} // namespace tfharvest
