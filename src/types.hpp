#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Cursor/Rect/Key/Input).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>

// 0-based, counted in Unicode scalar values (never bytes).
struct Cursor {
  size_t row = 0;
  size_t col = 0;
  bool operator==(const Cursor&) const = default;
};

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
};

enum class Key { Char, Backspace, Enter, Left, Right, Up, Down, Tab, Delete, Home, End, Null };

// Normalized key input. `ch` is only meaningful when key == Key::Char.
struct Input {
  Key key = Key::Null;
  char32_t ch = 0;
  bool ctrl = false;
  bool operator==(const Input&) const = default;
};
