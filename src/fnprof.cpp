#include "fnprof/fnprof.hpp"
#include "fnprof/Log.hpp"
#include <memory>

using namespace fnprof;

namespace {

struct DefaultSession {
  Options opt;
  CygProfileHooks hooks;
  DwflIntrospector introspector;
  std::unique_ptr<Clock> clock;
  Session session;

  explicit DefaultSession(const Options& o)
    : opt(o), clock(make_clock(o.clock)), session(hooks, introspector, *clock, o) {
    set_log_level(o.log_level);
  }
};

DefaultSession& default_session() {
  static DefaultSession d(Options::from_env());
  return d;
}

} // namespace

Session& fnprof::instance() {
  return default_session().session;
}

const Options& fnprof::options() {
  return default_session().opt;
}

void fnprof::start(StartMode mode) { instance().start(mode); }
void fnprof::stop() { instance().stop(); }
void fnprof::reset() { instance().reset(); }
bool fnprof::write_report() { return instance().write_report(); }
bool fnprof::write_report(const std::string& path) { return instance().write_report(path); }
void fnprof::set_hook_frequency(unsigned n) { instance().set_hook_frequency(n); }
void fnprof::set_sort_method(SortMethod method) { instance().set_sort_method(method); }

Scope::Scope(StartMode mode) { instance().start(mode); }
Scope::~Scope() { instance().stop(); }
