#include "fnprof/CallSite.hpp"
#include <cstdio>

using namespace fnprof;

const char* const fnprof::kNativeSource = "C_FUNC";
const char* const fnprof::kAnonymousName = "anonymous";

std::string fnprof::format_title(const std::string& source, const std::string& name, int line_defined) {
  char line[24];
  std::snprintf(line, sizeof(line), "%04i", line_defined);
  // 50 + 2 + 40 + 2 + 20 columns, longer line numbers widen the last one.
  char buf[160];
  int n = std::snprintf(buf, sizeof(buf), "%-50.50s: %-40.40s: %-20s",
                        source.c_str(), name.c_str(), line);
  if (n < 0) return {};
  return std::string(buf, static_cast<size_t>(n) < sizeof(buf) ? static_cast<size_t>(n) : sizeof(buf) - 1);
}

std::string fnprof::format_title(const CallSiteInfo& info) {
  return format_title((info.source && !info.native) ? *info.source : kNativeSource,
                      info.name ? *info.name : kAnonymousName,
                      info.line_defined ? *info.line_defined : 0);
}

FunctionIdentity fnprof::resolve_identity(const CallSiteInfo& info) {
  FunctionIdentity id;
  id.source = (info.source && !info.native) ? *info.source : kNativeSource;
  id.name = info.name ? *info.name : kAnonymousName;
  id.line_defined = info.line_defined ? *info.line_defined : 0;
  id.title = format_title(id.source, id.name, id.line_defined);
  return id;
}
