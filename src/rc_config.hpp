#pragma once
/*
 * RcConfig
 *
 * Purpose: demo settings from compile-time defaults, ~/.textarearc and
 *          command-line overrides.
 * Format: one command per line, e.g. "set tab=2 bold" or "set title=notes";
 *         blank lines and lines starting with '#' or '"' are ignored,
 *         a leading ':' is accepted.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "config.hpp"
#include "widget.hpp"

class TextArea;

struct DemoSettings {
  int tab_width = TA_DEFAULT_TAB_WIDTH;
  bool show_block = true;
  std::string title = TA_DEFAULT_TITLE;
  Style style;
};

class RcConfig {
public:
  RcConfig();
  RcConfig(const RcConfig&) = delete;
  RcConfig& operator=(const RcConfig&) = delete;
  bool apply_line(const std::string& line, std::string& msg);
  // Bad lines do not stop loading; returns false with the first error.
  bool load_file(const std::filesystem::path& path, std::string& msg);
  static std::optional<std::filesystem::path> default_path();

  void apply_to(TextArea& ta) const;
  const DemoSettings& settings() const { return settings_; }

private:
  void register_commands();
  bool set_options(const std::vector<std::string>& args, std::string& msg);

  CommandRegistry registry_;
  DemoSettings settings_;
};
