#pragma once
#include "fnprof/Clock.hpp"
#include "fnprof/EventCorrelator.hpp"
#include "fnprof/Hooks.hpp"
#include "fnprof/Introspector.hpp"
#include "fnprof/Options.hpp"
#include "fnprof/ReportRegistry.hpp"
#include "fnprof/ReportSorter.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace fnprof {

enum class StartMode { Normal, Once };

// One profiling session: hook lifecycle, run-once guard, the report registry
// and report writing.
//
//   Session s(hooks, introspector, clock);
//   s.start();
//   some_function();
//   s.stop();
//   s.write_report("MyProfilingReport.txt");
//
// Hook frequency, sort method and report path are configuration and survive
// reset(); the registry and the finished/run-once flags do not.
class Session : public HookSink {
public:
  Session(Hooks& hooks, Introspector& introspector, Clock& clock,
          const Options& opt = Options());
  ~Session() override;
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // In Once mode a session that already went through start/stop stays
  // stopped. Starting an active session does not re-arm the hooks.
  void start(StartMode mode = StartMode::Normal);
  void stop();
  void reset();

  // Sorts the registry with the configured method and truncates `path`.
  // Returns false if the file could not be written.
  bool write_report();
  bool write_report(const std::string& path);

  void set_hook_frequency(unsigned n);
  void set_sort_method(SortMethod method);
  // "duration" | "count"; anything else keeps the current method.
  bool set_sort_method(std::string_view name);
  void set_report_path(const std::string& path);

  bool active() const;
  bool finished() const;
  bool run_once() const;
  unsigned hook_frequency() const;
  SortMethod sort_method() const;
  std::string report_path() const;
  uint64_t events_delivered() const { return events_.load(std::memory_order_relaxed); }

  // Locks the registry for inspection.
  template <class Fn>
  auto with_registry(Fn&& fn) const {
    std::lock_guard<std::mutex> lk(mu_);
    return fn(static_cast<const ReportRegistry&>(registry_));
  }

  // HookSink
  void on_call(const void* fn) override;
  void on_return(const void* fn) override;

private:
  bool should_return() const { return run_once_ && finished_; }

  Hooks& hooks_;
  Introspector& introspector_;

  // Lifecycle and configuration. Taken before mu_ when both are needed.
  mutable std::mutex control_mu_;
  bool active_ = false;
  bool finished_ = false;
  bool run_once_ = false;
  unsigned hook_frequency_;
  SortMethod sort_method_;
  std::string report_path_;

  // Registry; the only lock taken on the event path.
  mutable std::mutex mu_;
  ReportRegistry registry_;
  EventCorrelator correlator_;
  std::atomic<uint64_t> events_{0};
};

} // namespace fnprof
