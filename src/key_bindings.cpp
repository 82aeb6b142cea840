#include "key_bindings.hpp"
#include "text_area.hpp"

static KeyBindings::Handler op(void (TextArea::*fn)()) {
  return [fn](TextArea& ta, const Input&) { (ta.*fn)(); };
}

static KeyBindings make_defaults() {
  KeyBindings kb;
  kb.bind_ctrl(U'h', op(&TextArea::delete_char));
  kb.bind_ctrl(U'm', op(&TextArea::insert_newline));
  kb.bind_ctrl(U'p', op(&TextArea::cursor_up));
  kb.bind_ctrl(U'n', op(&TextArea::cursor_down));
  kb.bind_ctrl(U'f', op(&TextArea::cursor_forward));
  kb.bind_ctrl(U'b', op(&TextArea::cursor_back));
  kb.bind_ctrl(U'a', op(&TextArea::cursor_start));
  kb.bind_ctrl(U'e', op(&TextArea::cursor_end));

  kb.bind_plain(Key::Char, [](TextArea& ta, const Input& in) { ta.insert_char(in.ch); });
  kb.bind_plain(Key::Backspace, op(&TextArea::delete_char));
  kb.bind_plain(Key::Tab, op(&TextArea::insert_tab));
  kb.bind_plain(Key::Enter, op(&TextArea::insert_newline));
  kb.bind_plain(Key::Up, op(&TextArea::cursor_up));
  kb.bind_plain(Key::Right, op(&TextArea::cursor_forward));
  kb.bind_plain(Key::Down, op(&TextArea::cursor_down));
  kb.bind_plain(Key::Left, op(&TextArea::cursor_back));
  kb.bind_plain(Key::Home, op(&TextArea::cursor_start));
  kb.bind_plain(Key::End, op(&TextArea::cursor_end));
  return kb;
}

const KeyBindings& KeyBindings::defaults() {
  static const KeyBindings kb = make_defaults();
  return kb;
}

bool KeyBindings::dispatch(TextArea& ta, const Input& in) const {
  if (in.ctrl) {
    if (in.key != Key::Char) return false;
    auto it = ctrl_.find(in.ch);
    if (it == ctrl_.end()) return false;
    it->second(ta, in);
    return true;
  }
  auto it = plain_.find(in.key);
  if (it == plain_.end()) return false;
  it->second(ta, in);
  return true;
}

bool TextArea::input(const Input& in) {
  return KeyBindings::defaults().dispatch(*this, in);
}
