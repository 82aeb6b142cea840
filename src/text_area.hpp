#pragma once
/*
 * TextArea
 *
 * Purpose: editing buffer owning the lines and the single cursor.
 * Invariant: at least one Line; cursor.row < line_count();
 *            cursor.col < char_count(line[cursor.row]) (sentinel included).
 * Note: every edit/navigation op is total, it either mutates or is a no-op.
 */
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "line.hpp"
#include "types.hpp"
#include "widget.hpp"

class TextArea {
public:
  TextArea();

  // Routes one normalized input through the key bindings; false if unbound.
  bool input(const Input& in);

  void insert_char(char32_t c);
  // Throws std::invalid_argument if `s` contains a line break or is not valid UTF-8.
  void insert_str(std::string_view s);
  void insert_tab();
  void insert_newline();
  void delete_char();

  void cursor_forward();
  void cursor_back();
  void cursor_down();
  void cursor_up();
  void cursor_start();
  void cursor_end();

  // Logical lines, sentinel trimmed.
  std::vector<std::string> lines() const;
  std::string line(size_t row) const;
  size_t line_count() const { return lines_.size(); }
  Cursor cursor() const { return cursor_; }

  TextAreaWidget widget() const;

  TextArea& set_style(const Style& style);
  TextArea& set_block(Block block);
  TextArea& remove_block();
  // Throws std::invalid_argument unless `tab` consists of spaces only.
  TextArea& set_tab(std::string tab);
  const Style& style() const { return style_; }
  const std::optional<Block>& block() const { return block_; }
  const std::string& tab() const { return tab_; }

  // On-demand self check; false with a description of the first violation.
  bool check_invariants(std::string& msg) const;

private:
  Line& current_line() { return lines_[cursor_.row]; }

  std::vector<Line> lines_;
  Cursor cursor_;
  Style style_;
  std::optional<Block> block_;
  std::string tab_;
};
