#include "rc_config.hpp"
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include <system_error>
#include "file_reader.hpp"
#include "text_area.hpp"

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

static bool parse_int(const std::string& s, int lo, int hi, int& out) {
  int v = 0;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || p != s.data() + s.size()) return false;
  if (v < lo || v > hi) return false;
  out = v;
  return true;
}

static bool starts_with(const std::string& s, const char* prefix, std::string& rest) {
  std::string p(prefix);
  if (s.compare(0, p.size(), p) != 0) return false;
  rest = s.substr(p.size());
  return true;
}

RcConfig::RcConfig() { register_commands(); }

void RcConfig::register_commands() {
  registry_.register_command("set", [this](const std::vector<std::string>& args, std::string& msg) {
    return set_options(args, msg);
  });
}

bool RcConfig::set_options(const std::vector<std::string>& args, std::string& msg) {
  if (args.empty()) { msg = "set: missing option"; return false; }
  // all options of one line apply together or not at all
  DemoSettings next = settings_;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    std::string v;
    if (starts_with(a, "title=", v)) {
      // title takes the rest of the line
      for (size_t j = i + 1; j < args.size(); ++j) v += " " + args[j];
      next.title = v;
      next.show_block = true;
      break;
    }
    if (starts_with(a, "tab=", v)) {
      int w = 0;
      if (!parse_int(v, 0, 64, w)) { msg = "invalid tab width: " + v; return false; }
      next.tab_width = w;
    } else if (starts_with(a, "fg=", v)) {
      int c = 0;
      if (!parse_int(v, -1, 255, c)) { msg = "invalid color: " + v; return false; }
      next.style.fg = static_cast<short>(c);
    } else if (starts_with(a, "bg=", v)) {
      int c = 0;
      if (!parse_int(v, -1, 255, c)) { msg = "invalid color: " + v; return false; }
      next.style.bg = static_cast<short>(c);
    } else if (a == "block") {
      next.show_block = true;
    } else if (a == "noblock") {
      next.show_block = false;
    } else if (a == "bold") {
      next.style = next.style.add_modifier(Modifier::Bold);
    } else if (a == "underline") {
      next.style = next.style.add_modifier(Modifier::Underlined);
    } else {
      msg = "unknown option: " + a;
      return false;
    }
  }
  settings_ = next;
  return true;
}

bool RcConfig::apply_line(const std::string& line, std::string& msg) {
  std::string s = trim(line);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::string name;
  iss >> name;
  std::vector<std::string> args;
  for (std::string a; iss >> a;) args.push_back(a);
  return registry_.execute(name, args, msg);
}

bool RcConfig::load_file(const std::filesystem::path& path, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  bool ok = true;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string err;
    if (!apply_line(lines[i], err) && ok) {
      ok = false;
      msg = path.filename().string() + ":" + std::to_string(i + 1) + ": " + err;
    }
  }
  return ok;
}

std::optional<std::filesystem::path> RcConfig::default_path() {
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / TA_RC_FILE_NAME;
}

void RcConfig::apply_to(TextArea& ta) const {
  ta.set_tab(std::string(static_cast<size_t>(settings_.tab_width), ' '));
  ta.set_style(settings_.style);
  if (settings_.show_block) ta.set_block(Block{settings_.title});
  else ta.remove_block();
}
