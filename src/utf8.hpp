#pragma once
/*
 * Utf8
 *
 * Purpose: scalar-value aware helpers over UTF-8 std::string storage.
 * Note: character offsets are resolved by a linear scan (variable width);
 *       terminal widths come from wcwidth() and need a UTF-8 LC_CTYPE.
 */
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

bool utf8_is_continuation(unsigned char b);
size_t utf8_char_count(std::string_view s);
// Byte offset of the n-th scalar value; nullopt when n >= utf8_char_count(s).
std::optional<size_t> utf8_byte_offset(std::string_view s, size_t n);
// Byte length of the scalar starting at byte offset `pos`.
size_t utf8_char_len(std::string_view s, size_t pos);
// Invalid code points (surrogates, > U+10FFFF) encode as U+FFFD.
std::string utf8_encode(char32_t cp);
// Malformed sequences decode as U+FFFD.
char32_t utf8_decode(std::string_view s, size_t pos);
// Rejects stray continuation bytes, truncated and overlong sequences,
// surrogates and code points above U+10FFFF.
bool utf8_valid(std::string_view s);

// Terminal columns of one scalar: 2 for wide (CJK, emoji), 0 for combining
// marks; non-printable scalars count as 1.
int char_width(char32_t cp);
int utf8_width(std::string_view s);
// Byte length of the longest prefix of `s` that fits in `cols` columns;
// `used` receives the columns that prefix takes.
size_t utf8_prefix_for_width(std::string_view s, int cols, int& used);
