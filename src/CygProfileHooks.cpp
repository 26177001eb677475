#include "fnprof/Hooks.hpp"
#include "fnprof/Log.hpp"
#include <atomic>
#include <thread>

using namespace fnprof;

namespace {

std::atomic<HookSink*> g_sink{nullptr};
std::atomic<unsigned>  g_frequency{0};
std::atomic<unsigned>  g_call_tick{0};
std::atomic<unsigned>  g_return_tick{0};
std::atomic<int>       g_inflight{0};

// Events raised while this thread is already inside the sink are dropped.
thread_local bool t_in_hook = false;

inline bool FNPROF_NO_INSTRUMENT sampled(std::atomic<unsigned>& tick) {
  unsigned f = g_frequency.load(std::memory_order_relaxed);
  if (f <= 1) return true;
  return (tick.fetch_add(1, std::memory_order_relaxed) + 1) % f == 0;
}

template <bool Call>
inline void FNPROF_NO_INSTRUMENT dispatch(void* fn) {
  if (!g_sink.load(std::memory_order_relaxed) || t_in_hook) return;
  t_in_hook = true;
  // seq_cst pairs with remove(): either it sees us in flight or we see null.
  g_inflight.fetch_add(1);
  HookSink* sink = g_sink.load();
  if (sink && sampled(Call ? g_call_tick : g_return_tick)) {
    if (Call) sink->on_call(fn);
    else      sink->on_return(fn);
  }
  g_inflight.fetch_sub(1);
  t_in_hook = false;
}

} // namespace

extern "C" void FNPROF_NO_INSTRUMENT __cyg_profile_func_enter(void* this_fn, void*) {
  dispatch<true>(this_fn);
}

extern "C" void FNPROF_NO_INSTRUMENT __cyg_profile_func_exit(void* this_fn, void*) {
  dispatch<false>(this_fn);
}

CygProfileHooks::~CygProfileHooks() {
  remove();
}

bool CygProfileHooks::install(HookSink& sink, unsigned frequency) {
  HookSink* owner = g_sink.load();
  if (owner && owner != &sink) {
    log_warn("another profiling session already owns the function hooks");
    return false;
  }
  g_frequency.store(frequency, std::memory_order_relaxed);
  g_call_tick.store(0, std::memory_order_relaxed);
  g_return_tick.store(0, std::memory_order_relaxed);

  HookSink* expected = nullptr;
  if (!g_sink.compare_exchange_strong(expected, &sink) && expected != &sink) {
    log_warn("another profiling session already owns the function hooks");
    return false;
  }
  sink_ = &sink;
  log_debug("function hooks installed, frequency %u", frequency);
  return true;
}

void CygProfileHooks::remove() {
  if (!sink_) return;
  HookSink* expected = sink_;
  (void)g_sink.compare_exchange_strong(expected, nullptr);
  sink_ = nullptr;
  while (g_inflight.load() != 0) std::this_thread::yield();
  log_debug("function hooks removed");
}

bool CygProfileHooks::installed() const {
  return sink_ != nullptr && g_sink.load() == sink_;
}
