#pragma once
/*
 * Renderer
 *
 * Purpose: paint a TextAreaWidget (and a status line) through ITerminal.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives widget snapshots to render.
 */
#include <string>
#include "iterminal.hpp"
#include "types.hpp"
#include "widget.hpp"

class Renderer {
public:
  // Draws the frame on the border of `area` when the widget has a block, then
  // the span lines inside, one cell per scalar value, clipped to the area.
  void render(ITerminal& term, const TextAreaWidget& widget, const Rect& area);
  void render_status(ITerminal& term, int row, const std::string& message);
};
