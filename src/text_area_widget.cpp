#include "text_area.hpp"

// Cursor line splits into before / cursor cell (reversed) / after; other
// lines keep their sentinel as a plain trailing blank.
TextAreaWidget TextArea::widget() const {
  TextAreaWidget w;
  w.style = style_;
  w.block = block_;
  w.lines.reserve(lines_.size());
  const Style cursor_style = Style{}.add_modifier(Modifier::Reversed);
  for (size_t i = 0; i < lines_.size(); ++i) {
    const std::string& raw = lines_[i].raw();
    if (i != cursor_.row) {
      w.lines.push_back(Spans{Span{raw, Style{}}});
      continue;
    }
    std::string_view cell = lines_[i].char_at(cursor_.col);
    size_t begin = static_cast<size_t>(cell.data() - raw.data());
    size_t end = begin + cell.size();
    w.lines.push_back(Spans{
      Span{raw.substr(0, begin), Style{}},
      Span{raw.substr(begin, end - begin), cursor_style},
      Span{raw.substr(end), Style{}},
    });
  }
  return w;
}
