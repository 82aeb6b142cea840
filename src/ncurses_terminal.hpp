#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"
#include <map>
#include <utility>
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal();
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text, const Style& style) override;
  void draw_box(const Rect& area, const std::string& title, const Style& style) override;
  void refresh() override;
private:
  attr_t attrs_for(const Style& style);
  short pair_for(short fg, short bg);
  bool default_colors_ = false;
  std::map<std::pair<short, short>, short> pairs_;
  short next_pair_ = 1;
};
