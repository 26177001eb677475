#pragma once
#include "fnprof/CallSite.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>

namespace fnprof {

class DwflSession;

// Answers "which function starts at this address".
class Introspector {
public:
  virtual ~Introspector() = default;
  // The reference stays valid for the life of the introspector.
  virtual const FunctionIdentity& describe(const void* fn) = 0;
};

// DWARF-backed introspector for the current process. Resolution runs once per
// address; the DWFL session is opened on first use.
class DwflIntrospector : public Introspector {
public:
  DwflIntrospector();
  ~DwflIntrospector() override;
  DwflIntrospector(const DwflIntrospector&) = delete;
  DwflIntrospector& operator=(const DwflIntrospector&) = delete;

  const FunctionIdentity& describe(const void* fn) override;

  size_t cached() const;

private:
  CallSiteInfo lookup(const void* fn);
  DwflSession* session();

  std::unique_ptr<DwflSession> session_;
  bool session_failed_ = false;
  std::unordered_map<const void*, FunctionIdentity> cache_;
  mutable std::mutex mu_;
};

} // namespace fnprof
