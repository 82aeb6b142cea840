#include "renderer.hpp"
#include <algorithm>
#include "utf8.hpp"

static void fill_row(ITerminal& term, int row, int col, int width, const Style& style) {
  if (width <= 0) return;
  term.draw_text(row, col, std::string(static_cast<size_t>(width), ' '), style);
}

void Renderer::render(ITerminal& term, const TextAreaWidget& widget, const Rect& area) {
  Rect inner = area;
  if (widget.block) {
    term.draw_box(area, widget.block->title, widget.style);
    inner = Rect{area.row + 1, area.col + 1, area.height - 2, area.width - 2};
  }
  if (inner.height <= 0 || inner.width <= 0) return;
  int rows = std::min(inner.height, static_cast<int>(widget.lines.size()));
  for (int i = 0; i < rows; ++i) {
    int row = inner.row + i;
    int used = 0;
    for (const auto& span : widget.lines[static_cast<size_t>(i)]) {
      if (span.content.empty()) continue;
      int w = 0;
      size_t end = utf8_prefix_for_width(span.content, inner.width - used, w);
      if (end == 0) break;
      term.draw_text(row, inner.col + used, span.content.substr(0, end), widget.style.patch(span.style));
      used += w;
      // a wide glyph that did not fit leaves the rest of the row blank
      if (end < span.content.size()) break;
    }
    fill_row(term, row, inner.col + used, inner.width - used, widget.style);
  }
  for (int i = rows; i < inner.height; ++i) fill_row(term, inner.row + i, inner.col, inner.width, widget.style);
}

void Renderer::render_status(ITerminal& term, int row, const std::string& message) {
  TermSize sz = term.getSize();
  if (row < 0 || row >= sz.rows) return;
  int used = 0;
  size_t end = utf8_prefix_for_width(message, std::max(0, sz.cols), used);
  term.draw_text(row, 0, message.substr(0, end), Style{});
  fill_row(term, row, used, sz.cols - used, Style{});
}
