#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: ITerminal that records into an in-memory cell grid, for tests and
 *          render verification without a tty.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

// The right half of a wide glyph is a cell with an empty glyph.
struct Cell {
  std::string glyph = " ";
  Style style;
};

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text, const Style& style) override;
  void draw_box(const Rect& area, const std::string& title, const Style& style) override;
  void refresh() override { refresh_count_++; }

  const Cell& cell(int row, int col) const;
  std::string row_text(int row) const;
  int refresh_count() const { return refresh_count_; }

private:
  void put(int row, int col, std::string glyph, const Style& style);

  int rows_;
  int cols_;
  std::vector<Cell> cells_;
  int refresh_count_ = 0;
};
