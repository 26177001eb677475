#pragma once
#include <optional>
#include <string_view>

// stderr diagnostics, "[fnprof] ..." lines.
namespace fnprof {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void set_log_level(LogLevel level);
LogLevel log_level();

std::optional<LogLevel> parse_log_level(std::string_view name);

void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace fnprof
