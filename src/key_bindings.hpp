#pragma once
/*
 * KeyBindings
 *
 * Purpose: route a normalized Input to one TextArea operation.
 * Design: two tables, plain keys and ctrl-modified characters (Emacs style);
 *         unbound input is a silent no-op.
 */
#include <functional>
#include <unordered_map>
#include <utility>
#include "types.hpp"

class TextArea;

class KeyBindings {
public:
  using Handler = std::function<void(TextArea&, const Input&)>;

  // Table used by TextArea::input.
  static const KeyBindings& defaults();

  void bind_plain(Key key, Handler h) { plain_[key] = std::move(h); }
  void bind_ctrl(char32_t ch, Handler h) { ctrl_[ch] = std::move(h); }
  bool dispatch(TextArea& ta, const Input& in) const;

private:
  std::unordered_map<Key, Handler> plain_;
  std::unordered_map<char32_t, Handler> ctrl_;
};
