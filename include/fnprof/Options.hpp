#pragma once
#include "fnprof/Clock.hpp"
#include "fnprof/Log.hpp"
#include "fnprof/ReportSorter.hpp"
#include <string>
#include <string_view>

namespace fnprof {

enum class Autostart { Off, Normal, Once };

struct Options {
  unsigned    hook_frequency = 0;               // 0 = every event
  SortMethod  sort_method    = SortMethod::Duration;
  std::string report_path    = "ProFi.txt";
  ClockKind   clock          = ClockKind::Process;
  Autostart   autostart      = Autostart::Off;  // start at load, report at exit
  LogLevel    log_level      = LogLevel::Info;

  // Keys: hook_count, sort, report, clock, autostart, log.
  // Returns false (and leaves the option untouched) on an unknown key or a
  // malformed value.
  bool set(std::string_view key, std::string_view value);

  // Defaults overlaid with FNPROF_HOOK_COUNT, FNPROF_SORT, FNPROF_REPORT,
  // FNPROF_CLOCK, FNPROF_AUTOSTART and FNPROF_LOG.
  static Options from_env();
};

} // namespace fnprof
