#pragma once
/*
 * DemoApp
 *
 * Purpose: drive one TextArea from terminal key events and paint it with a
 *          status line; Esc quits.
 * Flow: wget_wch -> map_key -> TextArea::input -> widget -> Renderer.
 */
#include <cwchar>
#include <string>
#include "iterminal.hpp"
#include "rc_config.hpp"
#include "renderer.hpp"
#include "text_area.hpp"

class DemoApp {
public:
  DemoApp(ITerminal& term, const RcConfig& cfg, std::string message);
  void run();
  // Returns false once the app should quit.
  bool handle_event(int status, wint_t ch);
  void render();

  const TextArea& text_area() const { return textarea; }
  const std::string& status() const { return message; }

private:
  void update_status(bool handled);

  ITerminal& term;
  TextArea textarea;
  Renderer renderer;
  std::string message;
  bool should_quit = false;
};
