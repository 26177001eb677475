#include "fnprof/ReportRegistry.hpp"
#include "fnprof/ReportSorter.hpp"

using namespace fnprof;

FunctionReport& ReportRegistry::get_or_create(const FunctionIdentity& id) {
  auto it = by_title_.find(id.title);
  if (it != by_title_.end()) return *it->second;

  auto report = std::make_unique<FunctionReport>();
  report->title = id.title;
  FunctionReport* raw = report.get();
  reports_.push_back(std::move(report));
  by_title_.emplace(id.title, raw);
  return *raw;
}

const FunctionReport* ReportRegistry::find(const std::string& title) const {
  auto it = by_title_.find(title);
  return it == by_title_.end() ? nullptr : it->second;
}

void ReportRegistry::sort(SortMethod method) {
  sort_reports(reports_, method);
}

void ReportRegistry::clear() {
  by_title_.clear();
  reports_.clear();
}
