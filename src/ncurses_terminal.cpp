#include "ncurses_terminal.hpp"
#include <algorithm>
#include "utf8.hpp"

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    default_colors_ = (use_default_colors() == OK);
  }
}
NcursesTerminal::~NcursesTerminal() {}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

short NcursesTerminal::pair_for(short fg, short bg) {
  if (!has_colors()) return 0;
  if (!default_colors_) {
    // fallback: -1 is only valid after use_default_colors()
    if (fg < 0) fg = COLOR_WHITE;
    if (bg < 0) bg = COLOR_BLACK;
  }
  auto key = std::make_pair(fg, bg);
  auto it = pairs_.find(key);
  if (it != pairs_.end()) return it->second;
  if (next_pair_ >= COLOR_PAIRS) return 0;
  short id = next_pair_++;
  init_pair(id, fg, bg);
  pairs_.emplace(key, id);
  return id;
}

attr_t NcursesTerminal::attrs_for(const Style& style) {
  attr_t a = A_NORMAL;
  if (style.has_modifier(Modifier::Bold)) a |= A_BOLD;
  if (style.has_modifier(Modifier::Underlined)) a |= A_UNDERLINE;
  if (style.has_modifier(Modifier::Reversed)) a |= A_REVERSE;
  if (style.fg != -1 || style.bg != -1) a |= COLOR_PAIR(pair_for(style.fg, style.bg));
  return a;
}

void NcursesTerminal::draw_text(int row, int col, const std::string& text, const Style& style) {
  int cols = getSize().cols;
  if (row < 0 || col < 0 || col >= cols) return;
  int used = 0;
  size_t end = utf8_prefix_for_width(text, cols - col, used);
  attr_t a = attrs_for(style);
  attron(a);
  mvaddnstr(row, col, text.c_str(), static_cast<int>(end));
  attroff(a);
}

void NcursesTerminal::draw_box(const Rect& area, const std::string& title, const Style& style) {
  if (area.height < 2 || area.width < 2) return;
  int top = area.row, bottom = area.row + area.height - 1;
  int left = area.col, right = area.col + area.width - 1;
  attr_t a = attrs_for(style);
  attron(a);
  mvhline(top, left + 1, ACS_HLINE, area.width - 2);
  mvhline(bottom, left + 1, ACS_HLINE, area.width - 2);
  mvvline(top + 1, left, ACS_VLINE, area.height - 2);
  mvvline(top + 1, right, ACS_VLINE, area.height - 2);
  mvaddch(top, left, ACS_ULCORNER);
  mvaddch(top, right, ACS_URCORNER);
  mvaddch(bottom, left, ACS_LLCORNER);
  mvaddch(bottom, right, ACS_LRCORNER);
  attroff(a);
  if (!title.empty()) {
    int used = 0;
    size_t end = utf8_prefix_for_width(title, area.width - 2, used);
    draw_text(top, left + 1, title.substr(0, end), style);
  }
}

void NcursesTerminal::refresh() { ::refresh(); }
