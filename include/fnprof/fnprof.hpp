#pragma once
// Process-wide profiling session for code built with -finstrument-functions.
//
//   fnprof::start();
//   some_function();
//   fnprof::stop();
//   fnprof::write_report("MyProfilingReport.txt");
//
// Configured from the environment (see Options::from_env). Programs linked
// with the fnprof_autostart object start profiling at load when
// FNPROF_AUTOSTART=1 (or "once") and write the report at exit.

#include "fnprof/Options.hpp"
#include "fnprof/Session.hpp"
#include <string>

namespace fnprof {

Session& instance();
// Options the process-wide session was built from.
const Options& options();

void start(StartMode mode = StartMode::Normal);
void stop();
void reset();
bool write_report();
bool write_report(const std::string& path);
void set_hook_frequency(unsigned n);
void set_sort_method(SortMethod method);

// Profiles the enclosing block with the process-wide session.
class Scope {
public:
  explicit Scope(StartMode mode = StartMode::Normal);
  ~Scope();
  Scope(const Scope&) = delete;
  Scope& operator=(const Scope&) = delete;
};

} // namespace fnprof

#define FNPROF_SCOPE() ::fnprof::Scope __fnprof_scope__
