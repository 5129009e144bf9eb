// xmas/basic/utf8.cpp - UTF-8 character splitting
//
#include "xmas/basic/utf8.hpp"

namespace xmas
{

namespace
{

bool is_continuation(std::string_view s, size_t i)
{
  return i < s.size() && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80;
}

}  // namespace

size_t utf8_char_size(std::string_view s, size_t i) noexcept
{
  const auto b0 = static_cast<unsigned char>(s[i]);
  size_t n = 1;
  if ((b0 & 0xE0) == 0xC0) {
    n = 2;
  } else if ((b0 & 0xF0) == 0xE0) {
    n = 3;
  } else if ((b0 & 0xF8) == 0xF0) {
    n = 4;
  }

  for (size_t k = 1; k < n; ++k) {
    if (!is_continuation(s, i + k)) {
      return 1;
    }
  }
  return n;
}

size_t utf8_length(std::string_view s) noexcept
{
  size_t count = 0;
  for (size_t i = 0; i < s.size(); i += utf8_char_size(s, i)) {
    ++count;
  }
  return count;
}

std::vector<std::string_view> utf8_chars(std::string_view s)
{
  std::vector<std::string_view> out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size();) {
    const size_t n = utf8_char_size(s, i);
    out.push_back(s.substr(i, n));
    i += n;
  }
  return out;
}

}  // namespace xmas
