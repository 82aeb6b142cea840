#include "demo_app.hpp"
#include <ncurses.h>
#include "config.hpp"
#include "key_mapper.hpp"
#include <utility>

DemoApp::DemoApp(ITerminal& term, const RcConfig& cfg, std::string message)
    : term(term), message(std::move(message)) {
  cfg.apply_to(textarea);
}

void DemoApp::run() {
  while (!should_quit) {
    render();
    wint_t ch = 0;
    int status = wget_wch(stdscr, &ch);
    handle_event(status, ch);
  }
}

bool DemoApp::handle_event(int status, wint_t ch) {
  if (status == OK && ch == TA_KEY_ESC) { should_quit = true; return false; }
  if (status == KEY_CODE_YES && ch == KEY_RESIZE) { message.clear(); return true; }
  bool handled = textarea.input(map_key(status, ch));
  update_status(handled);
  return true;
}

void DemoApp::update_status(bool handled) {
  Cursor c = textarea.cursor();
  message = std::to_string(textarea.line_count()) + " lines  " +
            std::to_string(c.row + 1) + ":" + std::to_string(c.col + 1);
  if (!handled) message += "  (unbound key)";
}

void DemoApp::render() {
  TermSize sz = term.getSize();
  term.clear();
  Rect area{0, 0, sz.rows - 1, sz.cols};
  renderer.render(term, textarea.widget(), area);
  renderer.render_status(term, sz.rows - 1, message);
  term.refresh();
}
