#pragma once
#include "fnprof/CallSite.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fnprof {

enum class SortMethod;

struct FunctionReport {
  std::string title;
  uint64_t call_count = 0;
  double accumulated = 0.0;           // seconds over all completed calls
  std::optional<double> started_at;   // armed timer, one per record
  uint64_t unbalanced_returns = 0;    // returns that found no armed timer
};

using ReportList = std::vector<std::unique_ptr<FunctionReport>>;

// title -> record, plus the records in first-seen order.
// Not synchronized; Session serializes access.
class ReportRegistry {
public:
  ReportRegistry() = default;
  ReportRegistry(const ReportRegistry&) = delete;
  ReportRegistry& operator=(const ReportRegistry&) = delete;

  // The returned reference stays valid until clear().
  FunctionReport& get_or_create(const FunctionIdentity& id);

  const FunctionReport* find(const std::string& title) const;

  const ReportList& reports() const { return reports_; }
  size_t size() const { return reports_.size(); }
  bool empty() const { return reports_.empty(); }

  // Permutes reports() in place.
  void sort(SortMethod method);

  void clear();

private:
  std::unordered_map<std::string, FunctionReport*> by_title_;
  ReportList reports_;
};

} // namespace fnprof
