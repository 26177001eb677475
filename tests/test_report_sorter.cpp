#include <gtest/gtest.h>
#include "fnprof/ReportSorter.hpp"

using namespace fnprof;

namespace {

ReportList make_reports() {
  const double durations[] = {0.5, 2.0, 1.0};
  const uint64_t counts[] = {10, 1, 5};
  ReportList list;
  for (int i = 0; i < 3; ++i) {
    auto r = std::make_unique<FunctionReport>();
    r->title = "f" + std::to_string(i);
    r->accumulated = durations[i];
    r->call_count = counts[i];
    list.push_back(std::move(r));
  }
  return list;
}

} // namespace

TEST(ReportSorter, ByDurationDescending) {
  ReportList list = make_reports();
  sort_reports(list, SortMethod::Duration);
  EXPECT_DOUBLE_EQ(list[0]->accumulated, 2.0);
  EXPECT_DOUBLE_EQ(list[1]->accumulated, 1.0);
  EXPECT_DOUBLE_EQ(list[2]->accumulated, 0.5);
}

TEST(ReportSorter, ByCountDescending) {
  ReportList list = make_reports();
  sort_reports(list, SortMethod::Count);
  EXPECT_EQ(list[0]->call_count, 10u);
  EXPECT_EQ(list[1]->call_count, 5u);
  EXPECT_EQ(list[2]->call_count, 1u);
}

TEST(ReportSorter, EmptyListStaysEmpty) {
  ReportList list;
  sort_reports(list, SortMethod::Duration);
  sort_reports(list, SortMethod::Count);
  EXPECT_TRUE(list.empty());
}

TEST(ReportSorter, ParsesNames) {
  EXPECT_EQ(parse_sort_method("duration"), SortMethod::Duration);
  EXPECT_EQ(parse_sort_method("count"), SortMethod::Count);
  EXPECT_FALSE(parse_sort_method("name").has_value());
  EXPECT_FALSE(parse_sort_method("").has_value());
  EXPECT_STREQ(to_string(SortMethod::Count), "count");
  EXPECT_STREQ(to_string(SortMethod::Duration), "duration");
}
