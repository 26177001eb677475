#include "fnprof/Introspector.hpp"
#include "fnprof/DwflSession.hpp"
#include "fnprof/Log.hpp"
#include <dlfcn.h>

using namespace fnprof;

DwflIntrospector::DwflIntrospector() = default;
DwflIntrospector::~DwflIntrospector() = default;

DwflSession* DwflIntrospector::session() {
  if (session_) return session_.get();
  if (session_failed_) return nullptr;
  auto s = std::make_unique<DwflSession>();
  if (!s->ok()) {
    log_warn("DWARF session unavailable; function names fall back to dladdr");
    session_failed_ = true;
    return nullptr;
  }
  session_ = std::move(s);
  return session_.get();
}

CallSiteInfo DwflIntrospector::lookup(const void* fn) {
  CallSiteInfo info;
  const uint64_t addr = reinterpret_cast<uint64_t>(fn);

  if (DwflSession* dw = session()) {
    if (auto fd = dw->function_die(addr)) {
      std::string file = DwflSession::decl_file(&fd->die);
      if (!file.empty()) info.source = std::move(file);
      std::string name = DwflSession::die_name(&fd->die);
      if (!name.empty()) info.name = std::move(name);
      info.line_defined = DwflSession::decl_line(&fd->die);
    } else {
      info.native = true;
    }
    if (!info.name) {
      std::string sym = dw->symbol_name(addr);
      if (!sym.empty()) info.name = std::move(sym);
    }
  } else {
    info.native = true;
  }

  if (!info.name) {
    Dl_info dl{};
    if (dladdr(fn, &dl) && dl.dli_sname) info.name = demangle(dl.dli_sname);
  }
  return info;
}

const FunctionIdentity& DwflIntrospector::describe(const void* fn) {
  std::lock_guard<std::mutex> g(mu_);
  auto it = cache_.find(fn);
  if (it != cache_.end()) return it->second;
  FunctionIdentity id = resolve_identity(lookup(fn));
  log_debug("resolved %p -> %s:%s:%d", fn, id.source.c_str(), id.name.c_str(), id.line_defined);
  return cache_.emplace(fn, std::move(id)).first->second;
}

size_t DwflIntrospector::cached() const {
  std::lock_guard<std::mutex> g(mu_);
  return cache_.size();
}
