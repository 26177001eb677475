#pragma once
#include "fnprof/CallSite.hpp"
#include "fnprof/Clock.hpp"
#include "fnprof/ReportRegistry.hpp"

namespace fnprof {

// Turns call/return pairs into per-function counts and durations.
//
// Each record holds a single armed timer. A recursive call overwrites the
// outer start time; the inner return consumes it and the outer return is
// counted with no duration (see FunctionReport::unbalanced_returns). The same
// happens to a return whose call was never seen, e.g. hooks armed mid-call.
class EventCorrelator {
public:
  EventCorrelator(ReportRegistry& registry, Clock& clock)
    : registry_(registry), clock_(clock) {}

  void on_call(const FunctionIdentity& id);
  void on_return(const FunctionIdentity& id);

private:
  ReportRegistry& registry_;
  Clock& clock_;
};

} // namespace fnprof
