#include "key_mapper.hpp"
#include <ncurses.h>
#include "config.hpp"

static Input plain(Key k) { return Input{k, 0, false}; }

static Input map_function_key(wint_t ch) {
  switch (ch) {
    case KEY_BACKSPACE: return plain(Key::Backspace);
    case KEY_ENTER: return plain(Key::Enter);
    case KEY_LEFT: return plain(Key::Left);
    case KEY_RIGHT: return plain(Key::Right);
    case KEY_UP: return plain(Key::Up);
    case KEY_DOWN: return plain(Key::Down);
    case KEY_DC: return plain(Key::Delete);
    case KEY_HOME: return plain(Key::Home);
    case KEY_END: return plain(Key::End);
    default: return Input{};
  }
}

Input map_key(int status, wint_t ch) {
  if (status == KEY_CODE_YES) return map_function_key(ch);
  if (status != OK) return Input{};
  switch (ch) {
    case '\t': return plain(Key::Tab);
    case '\n': case '\r': return plain(Key::Enter);
    case TA_KEY_DEL: return plain(Key::Backspace);
    case TA_KEY_ESC: return Input{};
    default: break;
  }
  // Terminals deliver Ctrl+letter as C0 codes 1..26, Ctrl+Space as NUL.
  if (ch == 0) return Input{Key::Char, U' ', true};
  if (ch >= 1 && ch <= 26) return Input{Key::Char, static_cast<char32_t>(U'a' + (ch - 1)), true};
  if (ch < 0x20 || (ch >= 0x80 && ch < 0xA0) || ch > 0x10FFFF) return Input{};
  return Input{Key::Char, static_cast<char32_t>(ch), false};
}
