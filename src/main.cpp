#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "demo_app.hpp"
#include "rc_config.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

static void usage(const char* prog) {
  std::cerr << "usage: " << prog << " [--rc FILE] [--tab N] [--title TEXT] [--no-block]\n";
}

int main(int argc, char** argv) {
  RcConfig cfg;
  std::string msg;
  std::optional<std::filesystem::path> rc = RcConfig::default_path();
  std::vector<std::string> overrides;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    bool has_value = (i + 1 < argc);
    if (a == "--rc" && has_value) rc = std::filesystem::path(argv[++i]);
    else if (a == "--tab" && has_value) overrides.push_back(std::string("set tab=") + argv[++i]);
    else if (a == "--title" && has_value) overrides.push_back(std::string("set title=") + argv[++i]);
    else if (a == "--no-block") overrides.push_back("set noblock");
    else { usage(argv[0]); return 2; }
  }
  std::error_code ec;
  if (rc && std::filesystem::exists(*rc, ec)) {
    if (!cfg.load_file(*rc, msg)) msg = "rc: " + msg;
  }
  for (const auto& o : overrides) {
    std::string err;
    if (!cfg.apply_line(o, err)) { std::cerr << err << "\n"; usage(argv[0]); return 2; }
  }
  Terminal term;
  NcursesTerminal nt;
  DemoApp app(nt, cfg, msg);
  app.run();
  return 0;
}
