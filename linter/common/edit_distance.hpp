#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace escapelint
{
    /**
     * Decodes UTF-8 into code points. Each byte of a malformed sequence
     * (stray continuation, truncation, overlong form, surrogate, value above
     * U+10FFFF) decodes to U+FFFD.
     */
    [[nodiscard]] std::u32string decodeUtf8(std::string_view text);

    // Levenshtein distance between two UTF-8 strings, counted in code points.
    [[nodiscard]] std::size_t editDistance(std::string_view lhs, std::string_view rhs);

    [[nodiscard]] bool isNearMiss(std::string_view lhs, std::string_view rhs, std::size_t threshold);
} // namespace escapelint
