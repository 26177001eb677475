#pragma once
#include <memory>
#include <optional>
#include <string_view>

namespace fnprof {

// Seconds as double, monotonic for the life of a session.
class Clock {
public:
  virtual ~Clock() = default;
  virtual double now() = 0;
};

// CPU time consumed by the whole process (CLOCK_PROCESS_CPUTIME_ID).
class ProcessClock : public Clock {
public:
  double now() override;
};

// Wall time from std::chrono::steady_clock.
class SteadyClock : public Clock {
public:
  double now() override;
};

enum class ClockKind { Process, Steady };

std::optional<ClockKind> parse_clock_kind(std::string_view name);
const char* to_string(ClockKind kind);
std::unique_ptr<Clock> make_clock(ClockKind kind);

} // namespace fnprof
