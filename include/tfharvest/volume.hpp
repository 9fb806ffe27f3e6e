#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace tfharvest
{

struct SingleLanguage
{
    std::string code;
};

struct MultipleLanguages
{
    std::vector<std::string> codes;
};

// Volumes report either one language code or a list of them.
using LanguageTag = std::variant<SingleLanguage, MultipleLanguages>;

inline constexpr const char *kUndeterminedLanguage = "und";

// Multiple languages resolve to the first listed one. Missing or empty
// codes resolve to "und".
std::string resolve_language(const LanguageTag &tag);

struct TokenPosCount
{
    std::uint32_t page = 0;
    std::string token;
    std::string pos;
    std::int64_t count = 0;
};

struct Volume
{
    std::string id;
    LanguageTag language;
    std::vector<TokenPosCount> token_pos_counts;
};

struct TokenRow
{
    std::string language;
    std::string volume_id;
    std::string token;
    std::int64_t count = 0;
};

// Sorted by (language, volume_id, token), one row per key.
using TokenTable = std::vector<TokenRow>;

} // namespace tfharvest
