#pragma once
#include "fnprof/ReportRegistry.hpp"
#include <optional>
#include <string_view>

namespace fnprof {

enum class SortMethod { Duration = 0, Count = 1 };

// Unstable in-place sort, largest first. Ties land in any order.
void sort_reports(ReportList& reports, SortMethod method);

// "duration" | "count"
std::optional<SortMethod> parse_sort_method(std::string_view name);
const char* to_string(SortMethod method);

} // namespace fnprof
