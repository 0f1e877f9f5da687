#include "settings.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <vector>
#include <glog/logging.h>
#include "cmd_registry.hpp"
#include "file_reader.hpp"

static bool parse_switch(const std::vector<std::string>& args, bool& flag, const std::string& name, std::string& msg) {
  if (args.empty()) { flag = !flag; return true; }
  const std::string& v = args[0];
  if (v == "on" || v == "1" || v == "true") { flag = true; return true; }
  if (v == "off" || v == "0" || v == "false") { flag = false; return true; }
  msg = "set " + name + ": use :set " + name + " on|off";
  return false;
}

static bool parse_count(const std::vector<std::string>& args, int min, int& out, const std::string& name, std::string& msg) {
  if (args.empty()) { msg = "set " + name + ": missing value"; return false; }
  const std::string& s = args[0];
  bool ok = !s.empty() && s.size() < 6 &&
            std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!ok) { msg = "set " + name + ": value must be a number"; return false; }
  int v = std::stoi(s);
  if (v < min) { msg = "set " + name + ": value must be >= " + std::to_string(min); return false; }
  out = v;
  return true;
}

static CommandRegistry make_registry(Settings& s) {
  CommandRegistry registry;
  registry.register_command("set number", [&s](const std::vector<std::string>& args, std::string& msg){
    return parse_switch(args, s.line_numbers, "number", msg);
  });
  registry.register_command("set tabwidth", [&s](const std::vector<std::string>& args, std::string& msg){
    return parse_count(args, 1, s.tab_width, "tabwidth", msg);
  });
  registry.register_command("set scrollmargin", [&s](const std::vector<std::string>& args, std::string& msg){
    return parse_count(args, 0, s.scroll_margin, "scrollmargin", msg);
  });
  return registry;
}

bool apply_setting(const std::string& raw, Settings& s, std::string& msg) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < raw.size() && isspace_fn((unsigned char)raw[i])) i++;
  size_t j = raw.size(); while (j > i && isspace_fn((unsigned char)raw[j-1])) j--;
  std::string line = raw.substr(i, j - i);
  if (line.empty() || line[0] == '#' || line[0] == '"') return true;
  if (line.size() >= 2 && line[0] == '/' && line[1] == '/') return true;
  if (line[0] == ':') line.erase(line.begin());

  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd != "set" || args.empty()) { msg = "unknown command: " + line; return false; }
  std::string name = args[0];
  std::vector<std::string> subargs;
  size_t eq = name.find('=');
  if (eq != std::string::npos) {
    if (eq + 1 < name.size()) subargs.push_back(name.substr(eq + 1));
    name.resize(eq);
  }
  subargs.insert(subargs.end(), args.begin() + 1, args.end());
  CommandRegistry registry = make_registry(s);
  return registry.execute("set " + name, subargs, msg) == CommandRegistry::Outcome::Ok;
}

bool load_settings(const std::filesystem::path& path, Settings& s, std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::string text;
  if (!mmap_read_text(path, text, msg)) return false;
  bool ok = true;
  int lineno = 0;
  std::istringstream in(text);
  for (std::string line; std::getline(in, line); ) {
    lineno++;
    std::string m;
    if (!apply_setting(line, s, m)) {
      LOG(WARNING) << path.string() << ":" << lineno << ": " << m;
      if (ok) msg = path.filename().string() + ":" + std::to_string(lineno) + ": " + m;
      ok = false;
    }
  }
  return ok;
}

std::optional<std::filesystem::path> default_settings_path() {
  if (const char* rc = std::getenv("MEDIT_RC")) return std::filesystem::path(rc);
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / ".meditrc";
}
