#include "fnprof/EventCorrelator.hpp"

using namespace fnprof;

void EventCorrelator::on_call(const FunctionIdentity& id) {
  FunctionReport& r = registry_.get_or_create(id);
  r.started_at = clock_.now();
}

void EventCorrelator::on_return(const FunctionIdentity& id) {
  FunctionReport& r = registry_.get_or_create(id);
  if (r.started_at) {
    double elapsed = clock_.now() - *r.started_at;
    if (elapsed > 0.0) r.accumulated += elapsed;
    r.started_at.reset();
  } else {
    r.unbalanced_returns++;
  }
  r.call_count++;
}
