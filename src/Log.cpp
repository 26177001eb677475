#include "fnprof/Log.hpp"
#include <atomic>
#include <cstdarg>
#include <cstdio>

using namespace fnprof;

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

static void vlog(LogLevel level, const char* fmt, va_list ap) {
  if (static_cast<int>(level) > g_level.load(std::memory_order_relaxed)) return;
  static const char* const tags[] = {"error: ", "warning: ", "", "debug: "};
  char line[1024];
  std::vsnprintf(line, sizeof(line), fmt, ap);
  std::fprintf(stderr, "[fnprof] %s%s\n", tags[static_cast<int>(level)], line);
}

void fnprof::set_log_level(LogLevel level) {
  g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel fnprof::log_level() {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

std::optional<LogLevel> fnprof::parse_log_level(std::string_view name) {
  if (name == "error") return LogLevel::Error;
  if (name == "warn" || name == "warning") return LogLevel::Warn;
  if (name == "info") return LogLevel::Info;
  if (name == "debug") return LogLevel::Debug;
  return std::nullopt;
}

void fnprof::log_error(const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Error, fmt, ap); va_end(ap);
}

void fnprof::log_warn(const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Warn, fmt, ap); va_end(ap);
}

void fnprof::log_info(const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Info, fmt, ap); va_end(ap);
}

void fnprof::log_debug(const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Debug, fmt, ap); va_end(ap);
}
