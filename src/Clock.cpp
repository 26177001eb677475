#include "fnprof/Clock.hpp"
#include <chrono>
#include <ctime>
#include <time.h>

using namespace fnprof;

double ProcessClock::now() {
  timespec ts;
  if (clock_gettime(CLOCK_PROCESS_CPUTIME_ID, &ts) != 0) {
    // Not expected on Linux.
    return static_cast<double>(std::clock()) / CLOCKS_PER_SEC;
  }
  return static_cast<double>(ts.tv_sec) + static_cast<double>(ts.tv_nsec) * 1e-9;
}

double SteadyClock::now() {
  using namespace std::chrono;
  return duration<double>(steady_clock::now().time_since_epoch()).count();
}

std::optional<ClockKind> fnprof::parse_clock_kind(std::string_view name) {
  if (name == "process" || name == "cpu") return ClockKind::Process;
  if (name == "steady" || name == "wall") return ClockKind::Steady;
  return std::nullopt;
}

const char* fnprof::to_string(ClockKind kind) {
  return kind == ClockKind::Steady ? "steady" : "process";
}

std::unique_ptr<Clock> fnprof::make_clock(ClockKind kind) {
  if (kind == ClockKind::Steady) return std::make_unique<SteadyClock>();
  return std::make_unique<ProcessClock>();
}
