#include "line.hpp"
#include "utf8.hpp"
#include <utility>

Line::Line() : buf_(1, kSentinel), count_(1) {}

Line::Line(std::string_view text) : buf_(text), count_(0) {
  buf_.push_back(kSentinel);
  count_ = utf8_char_count(buf_);
}

Line::Line(RawTag, std::string raw) : buf_(std::move(raw)) {
  if (!has_sentinel()) buf_.push_back(kSentinel);
  count_ = utf8_char_count(buf_);
}

std::string_view Line::text() const {
  return std::string_view(buf_).substr(0, buf_.size() - 1);
}

bool Line::has_sentinel() const {
  return !buf_.empty() && buf_.back() == kSentinel;
}

std::optional<size_t> Line::byte_offset(size_t col) const {
  return utf8_byte_offset(buf_, col);
}

std::string_view Line::char_at(size_t col) const {
  auto i = byte_offset(col);
  if (!i) return std::string_view(buf_).substr(buf_.size() - 1);
  return std::string_view(buf_).substr(*i, utf8_char_len(buf_, *i));
}

bool Line::insert(size_t col, std::string_view s) {
  auto i = byte_offset(col);
  if (!i) return false;
  buf_.insert(*i, s);
  count_ += utf8_char_count(s);
  return true;
}

bool Line::erase(size_t col) {
  if (col >= text_char_count()) return false;
  auto i = byte_offset(col);
  if (!i) return false;
  buf_.erase(*i, utf8_char_len(buf_, *i));
  count_--;
  return true;
}

Line Line::split_at(size_t col) {
  size_t i = byte_offset(col).value_or(buf_.size() - 1);
  Line tail(RawTag{}, buf_.substr(i));
  buf_.resize(i);
  buf_.push_back(kSentinel);
  count_ = utf8_char_count(buf_);
  return tail;
}

void Line::append(const Line& tail) {
  // Drop the sentinel itself, never a trailing real character.
  if (has_sentinel()) {
    buf_.pop_back();
    count_--;
  }
  buf_ += tail.buf_;
  count_ += tail.count_;
}
