#include "text_area.hpp"
#include <cassert>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using Lines = std::vector<std::string>;

static void check(const TextArea& ta) {
  std::string msg;
  bool ok = ta.check_invariants(msg);
  assert(ok);
  (void)ok;
  assert(ta.lines().size() == ta.line_count());
}

static void type(TextArea& ta, const std::string& s) {
  for (char c : s) { ta.insert_char(static_cast<char32_t>(c)); check(ta); }
}

static void test_fresh() {
  TextArea ta;
  assert(ta.lines() == Lines{""});
  assert(ta.cursor() == (Cursor{0, 0}));
  assert(ta.tab() == "    ");
  assert(!ta.block());
  check(ta);
}

static void test_scenario_type() {
  TextArea ta;
  type(ta, "ab");
  assert(ta.lines() == Lines{"ab"});
  assert(ta.cursor() == (Cursor{0, 2}));
}

static void test_scenario_split() {
  TextArea ta;
  type(ta, "ab");
  ta.cursor_back();
  assert(ta.cursor() == (Cursor{0, 1}));
  ta.insert_newline();
  check(ta);
  assert(ta.lines() == (Lines{"a", "b"}));
  assert(ta.cursor() == (Cursor{1, 0}));

  // merging back lands on the join point
  ta.delete_char();
  check(ta);
  assert(ta.lines() == Lines{"ab"});
  assert(ta.cursor() == (Cursor{0, 1}));
}

static void test_round_trip_at_end() {
  TextArea ta;
  type(ta, "ab");
  ta.insert_newline();
  assert(ta.lines() == (Lines{"ab", ""}));
  assert(ta.cursor() == (Cursor{1, 0}));
  ta.delete_char();
  check(ta);
  assert(ta.lines() == Lines{"ab"});
  assert(ta.cursor() == (Cursor{0, 2}));
}

static void test_delete_on_empty() {
  TextArea ta;
  ta.delete_char();
  check(ta);
  assert(ta.lines() == Lines{""});
  assert(ta.cursor() == (Cursor{0, 0}));
  assert(ta.widget().lines.size() == 1);
}

static void test_delete_within_line() {
  TextArea ta;
  type(ta, "abc");
  ta.cursor_back();
  ta.delete_char();
  check(ta);
  assert(ta.lines() == Lines{"ac"});
  assert(ta.cursor() == (Cursor{0, 1}));
}

static void test_start_end() {
  TextArea ta;
  type(ta, "abc");
  ta.cursor_start();
  assert(ta.cursor() == (Cursor{0, 0}));
  ta.cursor_end();
  assert(ta.cursor() == (Cursor{0, 3}));  // on the sentinel

  TextArea empty;
  empty.cursor_end();
  assert(empty.cursor() == (Cursor{0, 0}));
}

static void test_forward_back_wrap() {
  TextArea ta;
  type(ta, "ab");
  ta.insert_newline();
  type(ta, "c");
  ta.cursor_start();
  ta.cursor_back();
  assert(ta.cursor() == (Cursor{0, 2}));
  ta.cursor_forward();
  assert(ta.cursor() == (Cursor{1, 0}));
  ta.cursor_end();
  ta.cursor_forward();
  assert(ta.cursor() == (Cursor{1, 1}));  // last line: stays on sentinel
  ta.cursor_up();
  ta.cursor_start();
  ta.cursor_back();
  assert(ta.cursor() == (Cursor{0, 0}));
  check(ta);
}

static void test_up_down_clamp() {
  TextArea ta;
  type(ta, "abcdef");
  ta.insert_newline();
  type(ta, "x");
  ta.insert_newline();
  type(ta, "0123456789");
  assert(ta.cursor() == (Cursor{2, 10}));
  ta.cursor_up();
  assert(ta.cursor() == (Cursor{1, 1}));
  ta.cursor_up();
  assert(ta.cursor() == (Cursor{0, 1}));
  ta.cursor_up();
  assert(ta.cursor() == (Cursor{0, 1}));
  ta.cursor_end();
  ta.cursor_down();
  assert(ta.cursor() == (Cursor{1, 1}));
  ta.cursor_down();
  ta.cursor_down();
  assert(ta.cursor() == (Cursor{2, 1}));
  check(ta);
}

static void test_multibyte() {
  TextArea ta;
  ta.insert_char(U'a');
  ta.insert_char(U'あ');
  ta.insert_char(U'\U0001F600');
  check(ta);
  assert(ta.cursor() == (Cursor{0, 3}));
  assert(ta.lines() == Lines{"a\xE3\x81\x82\xF0\x9F\x98\x80"});
  ta.cursor_back();
  assert(ta.cursor() == (Cursor{0, 2}));
  ta.cursor_back();
  assert(ta.cursor() == (Cursor{0, 1}));
  ta.cursor_forward();
  assert(ta.cursor() == (Cursor{0, 2}));
  ta.insert_newline();
  check(ta);
  assert(ta.lines() == (Lines{"a\xE3\x81\x82", "\xF0\x9F\x98\x80"}));
  ta.delete_char();
  assert(ta.cursor() == (Cursor{0, 2}));
  ta.delete_char();
  check(ta);
  assert(ta.lines() == Lines{"a\xF0\x9F\x98\x80"});
  assert(ta.cursor() == (Cursor{0, 1}));
}

static void test_insert_str() {
  TextArea ta;
  type(ta, "ad");
  ta.cursor_back();
  ta.insert_str("b\xC3\xA9");
  check(ta);
  assert(ta.lines() == Lines{"ab\xC3\xA9" "d"});
  assert(ta.cursor() == (Cursor{0, 3}));

  bool threw = false;
  try {
    ta.insert_str("x\ny");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(ta.lines() == Lines{"ab\xC3\xA9" "d"});
  assert(ta.cursor() == (Cursor{0, 3}));
}

static void test_insert_str_rejects_invalid_utf8() {
  TextArea ta;
  ta.insert_str("ab");
  ta.cursor_start();
  for (const char* bad : {"\x80", "x\xC3", "\xE0\x80\x80", "\xED\xA0\x80"}) {
    bool threw = false;
    try {
      ta.insert_str(bad);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
    assert(ta.lines() == Lines{"ab"});
    assert(ta.cursor() == (Cursor{0, 0}));
  }
  check(ta);
}

static void test_insert_char_line_break() {
  TextArea ta;
  type(ta, "ab");
  ta.cursor_back();
  ta.insert_char(U'\n');
  check(ta);
  assert(ta.lines() == (Lines{"a", "b"}));
}

static void test_tab() {
  TextArea ta;
  ta.insert_tab();
  assert(ta.lines() == Lines{"    "});
  assert(ta.cursor() == (Cursor{0, 4}));
  type(ta, "x");
  ta.insert_tab();
  assert(ta.lines() == Lines{"    x   "});
  assert(ta.cursor() == (Cursor{0, 8}));

  ta.set_tab("  ");
  type(ta, "y");
  ta.insert_tab();
  assert(ta.cursor() == (Cursor{0, 10}));

  ta.set_tab("");
  ta.insert_tab();
  assert(ta.cursor() == (Cursor{0, 10}));
  check(ta);
}

static void test_tab_rejects_non_spaces() {
  TextArea ta;
  bool threw = false;
  try {
    ta.set_tab(" \t");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(ta.tab() == "    ");
}

static void test_style_block_passthrough() {
  TextArea ta;
  Style s;
  s.fg = 3;
  s = s.add_modifier(Modifier::Bold);
  ta.set_style(s).set_block(Block{"title"});
  assert(ta.style() == s);
  assert(ta.block() && ta.block()->title == "title");
  ta.remove_block();
  assert(!ta.block());
}

// A scripted mix of every operation, checking the invariant after each one.
static void test_invariant_sequence() {
  TextArea ta;
  const std::string script = "aaT<NnB>^$uUdDbbbbNaa\xC3\xA9NBBBBBB>>>>>>>>>dduuuNN";
  for (char c : script) {
    switch (c) {
      case 'T': ta.insert_tab(); break;
      case 'N': ta.insert_newline(); break;
      case 'B': ta.delete_char(); break;
      case '<': ta.cursor_back(); break;
      case '>': ta.cursor_forward(); break;
      case 'u': ta.cursor_up(); break;
      case 'd': ta.cursor_down(); break;
      case '^': ta.cursor_start(); break;
      case '$': ta.cursor_end(); break;
      default: ta.insert_char(static_cast<unsigned char>(c)); break;
    }
    check(ta);
  }
  assert(ta.line_count() >= 1);
}

static Input random_input(std::mt19937& rng) {
  static const Key keys[] = {
    Key::Char, Key::Char, Key::Char, Key::Backspace, Key::Enter, Key::Left, Key::Right,
    Key::Up, Key::Down, Key::Tab, Key::Delete, Key::Home, Key::End, Key::Null,
  };
  static const char32_t chars[] = {
    U'a', U'z', U' ', U'h', U'm', U'p', U'n', U'f', U'b', U'a', U'e', U'\u00e9', U'\u3042', U'\U0001F600',
  };
  std::uniform_int_distribution<size_t> key_pick(0, std::size(keys) - 1);
  std::uniform_int_distribution<size_t> char_pick(0, std::size(chars) - 1);
  Input in;
  in.key = keys[key_pick(rng)];
  if (in.key == Key::Char) in.ch = chars[char_pick(rng)];
  in.ctrl = (rng() % 4 == 0);
  return in;
}

// Random dispatched input, invariant checked after every single step.
static void test_invariant_random_input() {
  std::mt19937 rng(20261018);
  for (int run = 0; run < 2000; ++run) {
    TextArea ta;
    if (run % 3 == 0) ta.set_tab("  ");
    for (int step = 0; step < 200; ++step) {
      ta.input(random_input(rng));
      check(ta);
    }
  }
}

int main() {
  test_fresh();
  test_scenario_type();
  test_scenario_split();
  test_round_trip_at_end();
  test_delete_on_empty();
  test_delete_within_line();
  test_start_end();
  test_forward_back_wrap();
  test_up_down_clamp();
  test_multibyte();
  test_insert_str();
  test_insert_str_rejects_invalid_utf8();
  test_insert_char_line_break();
  test_tab();
  test_tab_rejects_non_spaces();
  test_style_block_passthrough();
  test_invariant_sequence();
  test_invariant_random_input();
  return 0;
}
