#pragma once
#include <optional>
#include <string>

namespace fnprof {

// Static metadata of one function as the introspector could recover it.
// Any field may be missing (no debug info, stripped symbols).
struct CallSiteInfo {
  std::optional<std::string> source;   // basename of the declaring file
  std::optional<std::string> name;     // demangled function name
  std::optional<int> line_defined;     // DW_AT_decl_line
  bool native = false;                 // no DWARF subprogram; source is ignored
};

// Defaulted identity of a function. `title` is both the registry key and the
// report's first three columns.
struct FunctionIdentity {
  std::string source;
  std::string name;
  int line_defined = 0;
  std::string title;
};

extern const char* const kNativeSource;    // "C_FUNC"
extern const char* const kAnonymousName;   // "anonymous"

// "%-50.50s: %-40.40s: %-20s" over (source, name, "%04i" line).
// Fields are truncated to their column, so colliding prefixes share a title.
std::string format_title(const std::string& source, const std::string& name, int line_defined);
std::string format_title(const CallSiteInfo& info);

FunctionIdentity resolve_identity(const CallSiteInfo& info);

} // namespace fnprof
