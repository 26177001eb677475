#pragma once

#if defined(__GNUC__)
#define FNPROF_NO_INSTRUMENT __attribute__((no_instrument_function))
#else
#define FNPROF_NO_INSTRUMENT
#endif

namespace fnprof {

// Receives function entry/exit events. Called on whichever thread raised the
// event, possibly several at once.
class HookSink {
public:
  virtual ~HookSink() = default;
  virtual void on_call(const void* fn) = 0;
  virtual void on_return(const void* fn) = 0;
};

// The mechanism that delivers events to a sink.
// frequency 0 (or 1) delivers every event, N delivers every Nth call event and
// every Nth return event.
class Hooks {
public:
  virtual ~Hooks() = default;
  virtual bool install(HookSink& sink, unsigned frequency) = 0;
  // Returns once no event is inside the sink any more.
  virtual void remove() = 0;
  virtual bool installed() const = 0;
};

// __cyg_profile_func_enter/exit, emitted by -finstrument-functions.
// The hooks are process-wide, so only one sink can be installed at a time.
class CygProfileHooks : public Hooks {
public:
  CygProfileHooks() = default;
  ~CygProfileHooks() override;
  CygProfileHooks(const CygProfileHooks&) = delete;
  CygProfileHooks& operator=(const CygProfileHooks&) = delete;

  bool install(HookSink& sink, unsigned frequency) override;
  void remove() override;
  bool installed() const override;

private:
  HookSink* sink_ = nullptr;
};

} // namespace fnprof

extern "C" {
void __cyg_profile_func_enter(void* this_fn, void* call_site) FNPROF_NO_INSTRUMENT;
void __cyg_profile_func_exit(void* this_fn, void* call_site) FNPROF_NO_INSTRUMENT;
}
