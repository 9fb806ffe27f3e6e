#pragma once

#include <cstddef>
#include <string>

#include "tfharvest/volume.hpp"

namespace tfharvest
{

enum class ExtractStatus
{
    ok = 0,
    empty,  // nothing to count; not an error
    failed  // decode or structural failure, see error
};

struct ExtractResult
{
    ExtractStatus status = ExtractStatus::ok;
    TokenTable table;
    std::string error;
};

class TokenExtractor
{
  public:
    explicit TokenExtractor(std::size_t max_token_bytes = 50);

    // Collapses pages and parts of speech, truncates tokens to the byte cap,
    // tags every row with the volume id and its resolved language.
    [[nodiscard]] ExtractResult extract(const Volume &volume) const;

    [[nodiscard]] std::size_t max_token_bytes() const
    {
        return max_token_bytes_;
    }

  private:
    std::size_t max_token_bytes_;
};

} // namespace tfharvest
