#include "fnprof/DwflSession.hpp"
#include "fnprof/Log.hpp"
#include <elfutils/libdw.h>
#include <elfutils/libdwfl.h>
#include <cxxabi.h>
#include <cstdlib>
#include <cstring>

using namespace fnprof;

static const Dwfl_Callbacks& callbacks() {
  static Dwfl_Callbacks cb = [] {
    Dwfl_Callbacks c{};
    c.find_elf = dwfl_linux_proc_find_elf;
    c.find_debuginfo = dwfl_standard_find_debuginfo;
    c.debuginfo_path = nullptr;
    return c;
  }();
  return cb;
}

std::string fnprof::demangle(const char* name) {
  if (!name) return {};
  int st = 0;
  char* d = abi::__cxa_demangle(name, nullptr, nullptr, &st);
  std::string out = (st == 0 && d) ? d : name;
  std::free(d);
  return out;
}

DwflSession::DwflSession(pid_t pid) : pid_(pid) {
  dwfl_ = dwfl_begin(&callbacks());
  if (!dwfl_) {
    log_error("dwfl_begin failed: %s", dwfl_errmsg(-1));
    return;
  }
  if (!report()) {
    dwfl_end(dwfl_); dwfl_ = nullptr;
  }
}

DwflSession::~DwflSession() {
  if (dwfl_) dwfl_end(dwfl_);
}

bool DwflSession::report() {
  dwfl_report_begin(dwfl_);
  if (dwfl_linux_proc_report(dwfl_, pid_) != 0) {
    log_error("dwfl_linux_proc_report failed: %s", dwfl_errmsg(-1));
    // Leave reporting state; modules reported so far stay usable.
    (void)dwfl_report_end(dwfl_, nullptr, nullptr);
    return false;
  }
  if (dwfl_report_end(dwfl_, nullptr, nullptr) != 0) {
    log_error("dwfl_report_end failed: %s", dwfl_errmsg(-1));
    return false;
  }
  return true;
}

bool DwflSession::refresh() {
  if (!dwfl_) return false;
  return report();
}

Dwfl_Module* DwflSession::module_for(uint64_t addr) {
  if (!dwfl_) return nullptr;
  Dwfl_Module* mod = dwfl_addrmodule(dwfl_, (Dwarf_Addr)addr);
  if (!mod && refresh()) mod = dwfl_addrmodule(dwfl_, (Dwarf_Addr)addr);
  return mod;
}

std::optional<DwflSession::FunctionDie> DwflSession::function_die(uint64_t addr) {
  Dwfl_Module* mod = module_for(addr);
  if (!mod) return std::nullopt;
  Dwarf_Addr bias = 0;
  Dwarf_Die* cu = dwfl_module_addrdie(mod, (Dwarf_Addr)addr, &bias);
  if (!cu) return std::nullopt;

  // Innermost scope first; the entry address of a function sits in its
  // subprogram, possibly under a lexical block or inlined call.
  Dwarf_Die* scopes = nullptr;
  int n = dwarf_getscopes(cu, (Dwarf_Addr)addr - bias, &scopes);
  std::optional<FunctionDie> out;
  for (int i = 0; i < n; ++i) {
    if (dwarf_tag(&scopes[i]) == DW_TAG_subprogram) {
      out = FunctionDie{mod, scopes[i], bias};
      break;
    }
  }
  std::free(scopes);
  return out;
}

std::string DwflSession::symbol_name(uint64_t addr) {
  Dwfl_Module* mod = module_for(addr);
  if (!mod) return {};
  const char* name = dwfl_module_addrname(mod, (Dwarf_Addr)addr);
  return name && *name ? demangle(name) : std::string();
}

std::string DwflSession::decl_file(Dwarf_Die* die) {
  const char* path = die ? dwarf_decl_file(die) : nullptr;
  if (!path || !*path) return {};
  const char* slash = std::strrchr(path, '/');
  return slash ? slash + 1 : path;
}

std::optional<int> DwflSession::decl_line(Dwarf_Die* die) {
  int line = 0;
  if (!die || dwarf_decl_line(die, &line) != 0) return std::nullopt;
  return line;
}

std::string DwflSession::die_name(Dwarf_Die* die) {
  if (!die) return {};
  if (const char* n = dwarf_diename(die)) if (*n) return n;

  // Out-of-line definitions and concrete instances carry the name on the
  // declaration they point at.
  Dwarf_Attribute a;
  if (dwarf_attr_integrate(die, DW_AT_name, &a)) {
    if (const char* n = dwarf_formstring(&a)) if (*n) return n;
  }
  return {};
}
