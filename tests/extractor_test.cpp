#include <cassert>
#include <string>

#include "tfharvest/common.hpp"
#include "tfharvest/extractor.hpp"
#include "test_support.hpp"

using namespace tfharvest;
using tfharvest::testing::make_volume;

static void collapses_pages_and_pos()
{
    Volume v;
    v.id = "mdp.001";
    v.language = SingleLanguage{"eng"};
    v.token_pos_counts = {
        {1, "the", "DT", 4}, {2, "the", "DT", 3}, {2, "run", "VB", 2}, {3, "run", "NN", 1}, {3, "cat", "NN", 1},
    };
    TokenExtractor ex;
    auto r = ex.extract(v);
    assert(r.status == ExtractStatus::ok);
    assert(r.table.size() == 3);
    assert(r.table[0].token == "cat" && r.table[0].count == 1);
    assert(r.table[1].token == "run" && r.table[1].count == 3);
    assert(r.table[2].token == "the" && r.table[2].count == 7);
    for (const auto &row : r.table)
    {
        assert(row.volume_id == "mdp.001");
        assert(row.language == "eng");
    }
}

static void empty_listing_is_not_an_error()
{
    TokenExtractor ex;
    auto r = ex.extract(make_volume("mdp.002", "eng", {}));
    assert(r.status == ExtractStatus::empty);
    assert(r.table.empty());
    assert(r.error.empty());

    // Only zero counts and empty tokens left.
    auto z = ex.extract(make_volume("mdp.003", "eng", {{"a", 0}, {"", 5}}));
    assert(z.status == ExtractStatus::empty);
}

static void truncation_keeps_valid_utf8_prefix()
{
    std::string accented;
    for (int i = 0; i < 30; ++i)
    {
        accented += "\xC3\xA9"; // é, 60 bytes total
    }
    std::string ascii_then_wide(49, 'x');
    ascii_then_wide += "\xE2\x82\xAC"; // €, would end at byte 52

    TokenExtractor ex(50);
    auto r = ex.extract(make_volume("mdp.004", "fre", {{accented, 2}, {ascii_then_wide, 1}}));
    assert(r.status == ExtractStatus::ok);
    assert(r.table.size() == 2);
    for (const auto &row : r.table)
    {
        assert(row.token.size() <= 50);
        assert(is_valid_utf8(row.token));
    }
    const auto &x = r.table[0].token[0] == 'x' ? r.table[0] : r.table[1];
    const auto &e = r.table[0].token[0] == 'x' ? r.table[1] : r.table[0];
    assert(x.token == std::string(49, 'x'));
    assert(e.token.size() == 50);
    assert(accented.compare(0, e.token.size(), e.token) == 0);
}

static void truncation_collisions_are_summed()
{
    std::string a = std::string(50, 'a') + "1";
    std::string b = std::string(50, 'a') + "2";
    TokenExtractor ex(50);
    auto r = ex.extract(make_volume("mdp.005", "eng", {{a, 3}, {b, 4}}));
    assert(r.table.size() == 1);
    assert(r.table[0].token == std::string(50, 'a'));
    assert(r.table[0].count == 7);

    TokenExtractor small(3);
    auto s = small.extract(make_volume("mdp.006", "eng", {{"abcd", 1}, {"abce", 1}, {"ab", 1}}));
    assert(s.table.size() == 2);
    assert(s.table[0].token == "ab" && s.table[0].count == 1);
    assert(s.table[1].token == "abc" && s.table[1].count == 2);
}

static void embedded_nul_is_stripped()
{
    std::string with_nul("ab\0c", 4);
    TokenExtractor ex;
    auto r = ex.extract(make_volume("mdp.008", "eng", {{with_nul, 2}, {"abc", 1}, {std::string(1, '\0'), 5}}));
    assert(r.status == ExtractStatus::ok);
    assert(r.table.size() == 1);
    assert(r.table[0].token == "abc");
    assert(r.table[0].count == 3);
}

static void language_resolution()
{
    assert(resolve_language(SingleLanguage{"ger"}) == "ger");
    assert(resolve_language(SingleLanguage{}) == kUndeterminedLanguage);
    assert(resolve_language(MultipleLanguages{{"spa", "eng"}}) == "spa");
    assert(resolve_language(MultipleLanguages{}) == kUndeterminedLanguage);

    Volume v = make_volume("mdp.007", "", {{"word", 1}});
    v.language = MultipleLanguages{{"lat", "eng"}};
    TokenExtractor ex;
    auto r = ex.extract(v);
    assert(r.table.size() == 1);
    assert(r.table[0].language == "lat");
}

int main()
{
    collapses_pages_and_pos();
    empty_listing_is_not_an_error();
    truncation_keeps_valid_utf8_prefix();
    truncation_collisions_are_summed();
    embedded_nul_is_stripped();
    language_resolution();
    return 0;
}
