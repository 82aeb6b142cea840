#include "key_mapper.hpp"
#include <ncurses.h>
#include <cassert>

static Input ch(char32_t c, bool ctrl = false) { return Input{Key::Char, c, ctrl}; }
static Input key(Key k) { return Input{k, 0, false}; }

int main() {
  assert(map_key(OK, 'a') == ch(U'a'));
  assert(map_key(OK, 'Z') == ch(U'Z'));
  assert(map_key(OK, ' ') == ch(U' '));
  assert(map_key(OK, 0x3042) == ch(U'あ'));
  assert(map_key(OK, 0x1F600) == ch(U'\U0001F600'));

  assert(map_key(OK, '\t') == key(Key::Tab));
  assert(map_key(OK, '\n') == key(Key::Enter));
  assert(map_key(OK, '\r') == key(Key::Enter));
  assert(map_key(OK, 127) == key(Key::Backspace));
  assert(map_key(OK, 27) == Input{});

  assert(map_key(OK, 'A' - 64) == ch(U'a', true));
  assert(map_key(OK, 'E' - 64) == ch(U'e', true));
  assert(map_key(OK, 'H' - 64) == ch(U'h', true));
  assert(map_key(OK, 0) == ch(U' ', true));
  assert(map_key(OK, 28) == Input{});
  assert(map_key(OK, 0x85) == Input{});

  assert(map_key(KEY_CODE_YES, KEY_BACKSPACE) == key(Key::Backspace));
  assert(map_key(KEY_CODE_YES, KEY_ENTER) == key(Key::Enter));
  assert(map_key(KEY_CODE_YES, KEY_LEFT) == key(Key::Left));
  assert(map_key(KEY_CODE_YES, KEY_RIGHT) == key(Key::Right));
  assert(map_key(KEY_CODE_YES, KEY_UP) == key(Key::Up));
  assert(map_key(KEY_CODE_YES, KEY_DOWN) == key(Key::Down));
  assert(map_key(KEY_CODE_YES, KEY_DC) == key(Key::Delete));
  assert(map_key(KEY_CODE_YES, KEY_HOME) == key(Key::Home));
  assert(map_key(KEY_CODE_YES, KEY_END) == key(Key::End));
  assert(map_key(KEY_CODE_YES, KEY_RESIZE) == Input{});
  assert(map_key(KEY_CODE_YES, KEY_F(1)) == Input{});

  assert(map_key(ERR, 'a') == Input{});
  assert(Input{}.key == Key::Null && !Input{}.ctrl);
  return 0;
}
