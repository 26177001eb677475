// Linked as an object file so the constructor survives static linking even in
// programs that never reference the fnprof API.
#include "fnprof/fnprof.hpp"
#include "fnprof/Log.hpp"
#include <cstdlib>

using namespace fnprof;

namespace {

void report_at_exit() {
  Session& s = instance();
  s.stop();
  if (!s.write_report()) log_error("autostart: report not written");
}

__attribute__((constructor)) void autostart() {
  const Options& opt = options();
  if (opt.autostart == Autostart::Off) return;
  instance().start(opt.autostart == Autostart::Once ? StartMode::Once : StartMode::Normal);
  if (std::atexit(report_at_exit) != 0) log_error("autostart: cannot register the exit report");
}

} // namespace
