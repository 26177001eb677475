// demo_app.cpp
// Built with -finstrument-functions; every function below is profiled.
//
// Usage:
//   ./fnprof_demo [--out path] [--sort duration|count] [--hook-count N]
//                 [--clock process|steady] [--once]
//
// Environment variables (FNPROF_*) configure the session first; flags win.

#include "fnprof/fnprof.hpp"
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace {

struct Expression {
  const char* src;

  __attribute__((noinline))
  double evaluate(int iters) {
    volatile double acc = 0;
    for (int i = 0; i < iters; ++i) acc += std::sin(i * 0.01);
    return acc;
  }
};

__attribute__((noinline)) uint64_t hot_work(uint64_t n) {
  volatile uint64_t s = 0;
  for (uint64_t i = 0; i < n; ++i) {
    s += (i * 11400714819323198485ull) ^ (s + 0x9e3779b97f4a7c15ull);
  }
  return s;
}

// Recursive: only the innermost level of each chain is timed.
__attribute__((noinline)) uint64_t fib(unsigned n) {
  return n < 2 ? n : fib(n - 1) + fib(n - 2);
}

void mark_region() {
  uint64_t acc = 0;
  for (int r = 0; r < 40; ++r) acc ^= hot_work(120'000);
  Expression exprs[] = {{"a + b * c"}, {"sin(t) + cos(2t)"}};
  double sink = 0;
  for (int r = 0; r < 10; ++r)
    for (auto& e : exprs) sink += e.evaluate(6000);
  acc ^= fib(18);
  std::cerr << "sink=" << sink << " acc=" << acc << "\n";
}

struct Args {
  fnprof::Options opt = fnprof::Options::from_env();
  bool once = false;
};

void usage(const char* argv0) {
  std::cerr <<
    "Usage: " << argv0 << " [--out path] [--sort duration|count] [--hook-count N]\n"
    "                 [--clock process|steady] [--once]\n";
}

bool parse_args(int argc, char** argv, Args& a) {
  for (int i = 1; i < argc; ++i) {
    std::string_view s(argv[i]);
    auto next = [&](int& i) -> std::string { if (i + 1 >= argc) { usage(argv[0]); std::exit(2); } return argv[++i]; };
    bool ok = true;
    if (s == "--out") {
      ok = a.opt.set("report", next(i));
    } else if (s == "--sort") {
      ok = a.opt.set("sort", next(i));
    } else if (s == "--hook-count") {
      ok = a.opt.set("hook_count", next(i));
    } else if (s == "--clock") {
      ok = a.opt.set("clock", next(i));
    } else if (s == "--once") {
      a.once = true;
    } else if (s == "--help" || s == "-h") {
      usage(argv[0]); std::exit(0);
    } else {
      std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); return false;
    }
    if (!ok) { std::cerr << "Bad value for " << s << "\n"; return false; }
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  Args a;
  if (!parse_args(argc, argv, a)) return 2;

  fnprof::ProcessClock process_clock;
  fnprof::SteadyClock steady_clock;
  fnprof::Clock& clock = a.opt.clock == fnprof::ClockKind::Steady
                       ? static_cast<fnprof::Clock&>(steady_clock)
                       : static_cast<fnprof::Clock&>(process_clock);
  fnprof::set_log_level(a.opt.log_level);

  fnprof::CygProfileHooks hooks;
  fnprof::DwflIntrospector introspector;
  fnprof::Session prof(hooks, introspector, clock, a.opt);

  const fnprof::StartMode mode = a.once ? fnprof::StartMode::Once : fnprof::StartMode::Normal;
  prof.start(mode);
  mark_region();
  prof.stop();

  // In once mode the second region is not profiled.
  prof.start(mode);
  hot_work(500'000);
  prof.stop();

  if (!prof.write_report()) return 1;
  std::cout << "Profile written to: " << prof.report_path()
            << " (" << prof.events_delivered() << " events)\n";
  return 0;
}
