// xmas/basic/utf8.hpp - UTF-8 character splitting
//
// Strings are stored as UTF-8 bytes; the language indexes, slices and
// measures them by character. A malformed byte counts as one character.
//
#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace xmas
{

/// Number of bytes of the character starting at byte `i` (1 to 4).
[[nodiscard]] size_t utf8_char_size(std::string_view s, size_t i) noexcept;

/// Number of characters in `s`.
[[nodiscard]] size_t utf8_length(std::string_view s) noexcept;

/// One view per character, in order.
[[nodiscard]] std::vector<std::string_view> utf8_chars(std::string_view s);

}  // namespace xmas
