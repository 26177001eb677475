#include "fnprof/Options.hpp"
#include <cerrno>
#include <cstdlib>
#include <string>

using namespace fnprof;

static bool parse_unsigned(std::string_view text, unsigned& out) {
  if (text.empty()) return false;
  std::string s(text);
  char* end = nullptr;
  errno = 0;
  unsigned long v = std::strtoul(s.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || s[0] == '-' || v > 0xFFFFFFFFul) return false;
  out = static_cast<unsigned>(v);
  return true;
}

bool Options::set(std::string_view key, std::string_view value) {
  if (key == "hook_count") {
    return parse_unsigned(value, hook_frequency);
  } else if (key == "sort") {
    auto m = parse_sort_method(value);
    if (!m) return false;
    sort_method = *m;
  } else if (key == "report") {
    if (value.empty()) return false;
    report_path = std::string(value);
  } else if (key == "clock") {
    auto c = parse_clock_kind(value);
    if (!c) return false;
    clock = *c;
  } else if (key == "autostart") {
    if (value == "1" || value == "on" || value == "normal") autostart = Autostart::Normal;
    else if (value == "once") autostart = Autostart::Once;
    else if (value == "0" || value == "off") autostart = Autostart::Off;
    else return false;
  } else if (key == "log") {
    auto l = parse_log_level(value);
    if (!l) return false;
    log_level = *l;
  } else {
    return false;
  }
  return true;
}

Options Options::from_env() {
  static const struct { const char* env; const char* key; } vars[] = {
    {"FNPROF_HOOK_COUNT", "hook_count"},
    {"FNPROF_SORT",       "sort"},
    {"FNPROF_REPORT",     "report"},
    {"FNPROF_CLOCK",      "clock"},
    {"FNPROF_AUTOSTART",  "autostart"},
    {"FNPROF_LOG",        "log"},
  };
  Options opt;
  for (const auto& v : vars) {
    const char* value = std::getenv(v.env);
    if (!value) continue;
    if (!opt.set(v.key, value)) log_warn("ignoring %s=%s", v.env, value);
  }
  return opt;
}
