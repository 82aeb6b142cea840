#pragma once
/*
 * Line
 *
 * Purpose: one buffer line stored as UTF-8, always terminated by a sentinel space.
 * Invariant: every constructor appends the sentinel and no mutator can remove it,
 *            so a cursor column < char_count() always addresses a real cell.
 */
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

class Line {
public:
  static constexpr char kSentinel = ' ';

  Line();
  explicit Line(std::string_view text);

  // Counts include the sentinel.
  size_t char_count() const { return count_; }
  size_t text_char_count() const { return count_ - 1; }
  std::string_view text() const;
  const std::string& raw() const { return buf_; }
  bool has_sentinel() const;

  std::optional<size_t> byte_offset(size_t col) const;
  std::string_view char_at(size_t col) const;

  // Inserts before the character at `col`; false if `col` does not resolve.
  bool insert(size_t col, std::string_view s);
  // Removes the real character at `col`; the sentinel cannot be removed.
  bool erase(size_t col);
  // Keeps [0, col) plus a fresh sentinel, returns [col, end) including the old sentinel.
  Line split_at(size_t col);
  // Replaces this line's sentinel with the whole of `tail` (sentinel included).
  void append(const Line& tail);

private:
  struct RawTag {};
  Line(RawTag, std::string raw);

  std::string buf_;
  size_t count_ = 1;
};
