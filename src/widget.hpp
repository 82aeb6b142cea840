#pragma once
/*
 * Widget
 *
 * Purpose: styled span decomposition handed to the rendering collaborator.
 * Note: Style and Block are opaque to the text area; only the Renderer reads them.
 */
#include <optional>
#include <string>
#include <vector>

enum class Modifier : unsigned {
  None = 0,
  Bold = 1u << 0,
  Underlined = 1u << 1,
  Reversed = 1u << 2,
};

// Colors are curses color numbers; -1 keeps the terminal default.
struct Style {
  short fg = -1;
  short bg = -1;
  unsigned modifiers = 0;

  Style add_modifier(Modifier m) const {
    Style s = *this;
    s.modifiers |= static_cast<unsigned>(m);
    return s;
  }
  bool has_modifier(Modifier m) const { return (modifiers & static_cast<unsigned>(m)) != 0; }
  // Fields set in `other` override this style; modifiers accumulate.
  Style patch(const Style& other) const {
    Style s = *this;
    if (other.fg != -1) s.fg = other.fg;
    if (other.bg != -1) s.bg = other.bg;
    s.modifiers |= other.modifiers;
    return s;
  }
  bool operator==(const Style&) const = default;
};

struct Block {
  std::string title;
  bool operator==(const Block&) const = default;
};

struct Span {
  std::string content;
  Style style;
};

using Spans = std::vector<Span>;

struct TextAreaWidget {
  std::vector<Spans> lines;
  Style style;
  std::optional<Block> block;
};
