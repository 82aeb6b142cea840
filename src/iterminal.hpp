#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, refresh).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <string>
#include "types.hpp"
#include "widget.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  // `text` is UTF-8; wide scalars take two cells, clipped at the right edge.
  virtual void draw_text(int row, int col, const std::string& text, const Style& style) = 0;
  virtual void draw_box(const Rect& area, const std::string& title, const Style& style) = 0;
  virtual void refresh() = 0;
};
