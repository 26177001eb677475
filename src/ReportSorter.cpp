#include "fnprof/ReportSorter.hpp"
#include <algorithm>

using namespace fnprof;

using Compare = bool (*)(const std::unique_ptr<FunctionReport>&, const std::unique_ptr<FunctionReport>&);

static bool by_duration_desc(const std::unique_ptr<FunctionReport>& a, const std::unique_ptr<FunctionReport>& b) {
  return a->accumulated > b->accumulated;
}

static bool by_count_desc(const std::unique_ptr<FunctionReport>& a, const std::unique_ptr<FunctionReport>& b) {
  return a->call_count > b->call_count;
}

// Indexed by SortMethod.
static const Compare kComparators[] = {by_duration_desc, by_count_desc};
static const char* const kNames[] = {"duration", "count"};

void fnprof::sort_reports(ReportList& reports, SortMethod method) {
  std::sort(reports.begin(), reports.end(), kComparators[static_cast<int>(method)]);
}

std::optional<SortMethod> fnprof::parse_sort_method(std::string_view name) {
  if (name == kNames[0]) return SortMethod::Duration;
  if (name == kNames[1]) return SortMethod::Count;
  return std::nullopt;
}

const char* fnprof::to_string(SortMethod method) {
  return kNames[static_cast<int>(method)];
}
