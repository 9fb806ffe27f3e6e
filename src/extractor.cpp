#include "tfharvest/extractor.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

#include "tfharvest/common.hpp"

namespace tfharvest
{

std::string resolve_language(const LanguageTag &tag)
{
    if (const auto *single = std::get_if<SingleLanguage>(&tag))
    {
        return single->code.empty() ? kUndeterminedLanguage : single->code;
    }
    const auto &multiple = std::get<MultipleLanguages>(tag);
    if (multiple.codes.empty() || multiple.codes.front().empty())
    {
        return kUndeterminedLanguage;
    }
    return multiple.codes.front();
}

TokenExtractor::TokenExtractor(std::size_t max_token_bytes) : max_token_bytes_(max_token_bytes) {}

ExtractResult TokenExtractor::extract(const Volume &volume) const
{
    ExtractResult result;
    if (volume.token_pos_counts.empty())
    {
        result.status = ExtractStatus::empty;
        return result;
    }

    std::unordered_map<std::string, std::int64_t> counts;
    counts.reserve(volume.token_pos_counts.size());
    for (const auto &entry : volume.token_pos_counts)
    {
        if (entry.count <= 0 || entry.token.empty())
        {
            continue;
        }
        // The store's string columns are NUL padded, so a NUL would cut the token on read.
        std::string token = entry.token;
        token.erase(std::remove(token.begin(), token.end(), '\0'), token.end());
        token = truncate_utf8_bytes(token, max_token_bytes_);
        if (token.empty())
        {
            continue;
        }
        counts[token] += entry.count;
    }
    if (counts.empty())
    {
        result.status = ExtractStatus::empty;
        return result;
    }

    const std::string language = resolve_language(volume.language);
    result.table.reserve(counts.size());
    for (auto &kv : counts)
    {
        result.table.push_back({language, volume.id, kv.first, kv.second});
    }
    // One language and one id per volume, so token order is the full key order.
    std::sort(result.table.begin(), result.table.end(),
              [](const TokenRow &a, const TokenRow &b) { return a.token < b.token; });
    result.status = ExtractStatus::ok;
    return result;
}

} // namespace tfharvest
