#include "headless_terminal.hpp"
#include "utf8.hpp"
#include <utility>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
    : rows_(rows), cols_(cols), cells_(static_cast<size_t>(rows * cols)) {}

void HeadlessTerminal::clear() {
  for (auto& c : cells_) c = Cell{};
}

void HeadlessTerminal::put(int row, int col, std::string glyph, const Style& style) {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return;
  Cell& c = cells_[static_cast<size_t>(row * cols_ + col)];
  c.glyph = std::move(glyph);
  c.style = style;
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text, const Style& style) {
  size_t i = 0;
  while (i < text.size()) {
    size_t n = utf8_char_len(text, i);
    int w = char_width(utf8_decode(text, i));
    if (w == 0) {
      // combining mark joins the glyph to its left
      if (row >= 0 && row < rows_ && col > 0 && col <= cols_) {
        cells_[static_cast<size_t>(row * cols_ + col - 1)].glyph += text.substr(i, n);
      }
      i += n;
      continue;
    }
    if (col + w > cols_) break;
    put(row, col, text.substr(i, n), style);
    if (w == 2) put(row, col + 1, std::string(), style);
    i += n;
    col += w;
  }
}

void HeadlessTerminal::draw_box(const Rect& area, const std::string& title, const Style& style) {
  if (area.height < 2 || area.width < 2) return;
  int top = area.row, bottom = area.row + area.height - 1;
  int left = area.col, right = area.col + area.width - 1;
  for (int c = left + 1; c < right; ++c) {
    put(top, c, "-", style);
    put(bottom, c, "-", style);
  }
  for (int r = top + 1; r < bottom; ++r) {
    put(r, left, "|", style);
    put(r, right, "|", style);
  }
  put(top, left, "+", style);
  put(top, right, "+", style);
  put(bottom, left, "+", style);
  put(bottom, right, "+", style);
  if (title.empty()) return;
  int used = 0;
  size_t end = utf8_prefix_for_width(title, area.width - 2, used);
  draw_text(top, left + 1, title.substr(0, end), style);
}

const Cell& HeadlessTerminal::cell(int row, int col) const {
  return cells_.at(static_cast<size_t>(row * cols_ + col));
}

std::string HeadlessTerminal::row_text(int row) const {
  std::string s;
  for (int c = 0; c < cols_; ++c) s += cell(row, c).glyph;
  return s;
}
