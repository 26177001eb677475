#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <elfutils/libdwfl.h>
#include <unistd.h>

namespace fnprof {

// RAII wrapper around a live DWFL session for this process.
class DwflSession {
public:
  explicit DwflSession(pid_t pid = ::getpid());
  ~DwflSession();
  DwflSession(const DwflSession&) = delete;
  DwflSession& operator=(const DwflSession&) = delete;

  bool ok() const { return dwfl_ != nullptr; }

  // Re-read /proc/<pid>/maps (after dlopen).
  bool refresh();

  // Map a function address -> (module, bias, DW_TAG_subprogram DIE).
  struct FunctionDie {
    Dwfl_Module* mod = nullptr;
    Dwarf_Die    die{};
    Dwarf_Addr   bias = 0;
  };
  std::optional<FunctionDie> function_die(uint64_t addr);

  // Demangled ELF symbol covering addr, empty if none.
  std::string symbol_name(uint64_t addr);

  // Declaration site of a subprogram DIE, follows DW_AT_specification and
  // DW_AT_abstract_origin.
  static std::string decl_file(Dwarf_Die* die);
  static std::optional<int> decl_line(Dwarf_Die* die);
  static std::string die_name(Dwarf_Die* die);

private:
  bool report();
  Dwfl_Module* module_for(uint64_t addr);

  pid_t pid_;
  Dwfl* dwfl_ = nullptr;
};

std::string demangle(const char* name);

} // namespace fnprof
