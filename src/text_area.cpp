#include "text_area.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include "config.hpp"
#include "utf8.hpp"

TextArea::TextArea() : lines_(1), tab_(TA_DEFAULT_TAB_WIDTH, ' ') {}

void TextArea::insert_char(char32_t c) {
  if (c == U'\n' || c == U'\r') { insert_newline(); return; }
  if (current_line().insert(cursor_.col, utf8_encode(c))) cursor_.col++;
}

void TextArea::insert_str(std::string_view s) {
  if (s.find_first_of("\r\n") != std::string_view::npos) {
    throw std::invalid_argument("string given to insert_str must not contain a line break");
  }
  if (!utf8_valid(s)) {
    throw std::invalid_argument("string given to insert_str must be valid UTF-8");
  }
  if (current_line().insert(cursor_.col, s)) cursor_.col += utf8_char_count(s);
}

void TextArea::insert_tab() {
  if (tab_.empty()) return;
  size_t len = tab_.size() - cursor_.col % tab_.size();
  insert_str(std::string_view(tab_).substr(0, len));
}

void TextArea::insert_newline() {
  size_t row = cursor_.row;
  Line next = lines_[row].split_at(cursor_.col);
  lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(row + 1), std::move(next));
  cursor_ = {row + 1, 0};
}

void TextArea::delete_char() {
  if (cursor_.col == 0) {
    if (cursor_.row == 0) return;
    size_t row = cursor_.row;
    Line& prev = lines_[row - 1];
    size_t join = prev.text_char_count();
    prev.append(lines_[row]);
    lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(row));
    cursor_ = {row - 1, join};
    return;
  }
  if (current_line().erase(cursor_.col - 1)) cursor_.col--;
}

void TextArea::cursor_forward() {
  if (cursor_.col + 1 >= current_line().char_count()) {
    if (cursor_.row + 1 < lines_.size()) cursor_ = {cursor_.row + 1, 0};
  } else {
    cursor_.col++;
  }
}

void TextArea::cursor_back() {
  if (cursor_.col == 0) {
    if (cursor_.row > 0) cursor_ = {cursor_.row - 1, lines_[cursor_.row - 1].char_count() - 1};
  } else {
    cursor_.col--;
  }
}

void TextArea::cursor_down() {
  if (cursor_.row + 1 >= lines_.size()) return;
  cursor_.row++;
  cursor_.col = std::min(cursor_.col, current_line().char_count() - 1);
}

void TextArea::cursor_up() {
  if (cursor_.row == 0) return;
  cursor_.row--;
  cursor_.col = std::min(cursor_.col, current_line().char_count() - 1);
}

void TextArea::cursor_start() { cursor_.col = 0; }

void TextArea::cursor_end() { cursor_.col = current_line().char_count() - 1; }

std::vector<std::string> TextArea::lines() const {
  std::vector<std::string> out;
  out.reserve(lines_.size());
  for (const auto& l : lines_) out.emplace_back(l.text());
  return out;
}

std::string TextArea::line(size_t row) const {
  if (row >= lines_.size()) return std::string();
  return std::string(lines_[row].text());
}

TextArea& TextArea::set_style(const Style& style) {
  style_ = style;
  return *this;
}

TextArea& TextArea::set_block(Block block) {
  block_ = std::move(block);
  return *this;
}

TextArea& TextArea::remove_block() {
  block_.reset();
  return *this;
}

TextArea& TextArea::set_tab(std::string tab) {
  if (std::any_of(tab.begin(), tab.end(), [](char c) { return c != ' '; })) {
    throw std::invalid_argument("tab string must consist of spaces but got \"" + tab + "\"");
  }
  tab_ = std::move(tab);
  return *this;
}

bool TextArea::check_invariants(std::string& msg) const {
  if (lines_.empty()) { msg = "no line in buffer"; return false; }
  for (size_t i = 0; i < lines_.size(); ++i) {
    if (!lines_[i].has_sentinel()) {
      msg = "line " + std::to_string(i + 1) + " does not end with space: \"" + lines_[i].raw() + "\"";
      return false;
    }
  }
  std::string pos = "(" + std::to_string(cursor_.row) + ", " + std::to_string(cursor_.col) + ")";
  if (cursor_.row >= lines_.size()) {
    msg = "cursor " + pos + " exceeds max lines " + std::to_string(lines_.size());
    return false;
  }
  const Line& l = lines_[cursor_.row];
  if (cursor_.col >= l.char_count()) {
    msg = "cursor " + pos + " exceeds max col " + std::to_string(l.char_count()) + " at line \"" + l.raw() + "\"";
    return false;
  }
  return true;
}
