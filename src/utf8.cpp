#include "utf8.hpp"
#include <cwchar>

bool utf8_is_continuation(unsigned char b) { return (b & 0xC0) == 0x80; }

size_t utf8_char_count(std::string_view s) {
  size_t n = 0;
  for (char c : s) {
    if (!utf8_is_continuation(static_cast<unsigned char>(c))) n++;
  }
  return n;
}

std::optional<size_t> utf8_byte_offset(std::string_view s, size_t n) {
  size_t seen = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (utf8_is_continuation(static_cast<unsigned char>(s[i]))) continue;
    if (seen == n) return i;
    seen++;
  }
  return std::nullopt;
}

size_t utf8_char_len(std::string_view s, size_t pos) {
  if (pos >= s.size()) return 0;
  size_t end = pos + 1;
  while (end < s.size() && utf8_is_continuation(static_cast<unsigned char>(s[end]))) end++;
  return end - pos;
}

std::string utf8_encode(char32_t cp) {
  if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
  std::string out;
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  return out;
}

// false for a malformed sequence at `pos`; `len` is its byte length when valid.
static bool decode_at(std::string_view s, size_t pos, char32_t& cp, size_t& len) {
  unsigned char b0 = static_cast<unsigned char>(s[pos]);
  if (b0 < 0x80) { cp = b0; len = 1; return true; }
  size_t n = 0;
  char32_t min = 0;
  if ((b0 & 0xE0) == 0xC0) { n = 2; cp = b0 & 0x1F; min = 0x80; }
  else if ((b0 & 0xF0) == 0xE0) { n = 3; cp = b0 & 0x0F; min = 0x800; }
  else if ((b0 & 0xF8) == 0xF0) { n = 4; cp = b0 & 0x07; min = 0x10000; }
  else return false;
  if (pos + n > s.size()) return false;
  for (size_t i = 1; i < n; ++i) {
    unsigned char b = static_cast<unsigned char>(s[pos + i]);
    if (!utf8_is_continuation(b)) return false;
    cp = (cp << 6) | (b & 0x3F);
  }
  if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
  len = n;
  return true;
}

char32_t utf8_decode(std::string_view s, size_t pos) {
  if (pos >= s.size()) return 0xFFFD;
  char32_t cp = 0;
  size_t len = 0;
  if (!decode_at(s, pos, cp, len)) return 0xFFFD;
  return cp;
}

bool utf8_valid(std::string_view s) {
  size_t i = 0;
  while (i < s.size()) {
    char32_t cp = 0;
    size_t len = 0;
    if (!decode_at(s, i, cp, len)) return false;
    i += len;
  }
  return true;
}

int char_width(char32_t cp) {
  int w = ::wcwidth(static_cast<wchar_t>(cp));
  return w < 0 ? 1 : w;
}

int utf8_width(std::string_view s) {
  int w = 0;
  for (size_t i = 0; i < s.size(); i += utf8_char_len(s, i)) w += char_width(utf8_decode(s, i));
  return w;
}

size_t utf8_prefix_for_width(std::string_view s, int cols, int& used) {
  used = 0;
  size_t i = 0;
  while (i < s.size()) {
    int w = char_width(utf8_decode(s, i));
    if (used + w > cols) break;
    used += w;
    i += utf8_char_len(s, i);
  }
  return i;
}
