#include <gtest/gtest.h>
#include "fnprof/ReportWriter.hpp"
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace fnprof;

namespace {

std::string temp_path(const char* tag) {
  return ::testing::TempDir() + "fnprof_writer_" + tag + "_" + std::to_string(::getpid()) + ".txt";
}

std::string slurp(const std::string& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::unique_ptr<FunctionReport> report(const char* name, double secs, uint64_t calls) {
  CallSiteInfo info;
  info.source = "w.cpp";
  info.name = name;
  info.line_defined = 3;
  auto r = std::make_unique<FunctionReport>();
  r->title = format_title(info);
  r->accumulated = secs;
  r->call_count = calls;
  return r;
}

} // namespace

TEST(ReportWriter, HeaderLayout) {
  std::string h = format_header();
  std::string expected = "| FILE" + std::string(46, ' ') + ": FUNCTION" + std::string(32, ' ')
                       + ": LINE" + std::string(16, ' ') + ": TIME" + std::string(16, ' ')
                       + ": CALLED" + std::string(14, ' ') + "|\n";
  EXPECT_EQ(h, expected);
}

TEST(ReportWriter, LineLayout) {
  auto r = report("f", 1.23456, 3);
  std::string line = format_report_line(*r);
  std::string expected = "| " + r->title + ": 1.235" + std::string(15, ' ')
                       + ": 0000003" + std::string(13, ' ') + "|\n";
  EXPECT_EQ(line, expected);
}

TEST(ReportWriter, WritesRowsInListOrderAndTruncates) {
  const std::string path = temp_path("rows");
  {
    std::ofstream pre(path);
    pre << "stale content that must disappear\n";
  }
  ReportList list;
  list.push_back(report("first", 0.5, 1));
  list.push_back(report("second", 0.25, 2));
  ASSERT_TRUE(write_report_file(path, list));

  std::string text = slurp(path);
  EXPECT_EQ(text.find("stale"), std::string::npos);
  EXPECT_EQ(text, format_header() + format_report_line(*list[0]) + format_report_line(*list[1]));
  ::unlink(path.c_str());
}

TEST(ReportWriter, EmptyListWritesHeaderOnly) {
  const std::string path = temp_path("empty");
  ASSERT_TRUE(write_report_file(path, ReportList{}));
  EXPECT_EQ(slurp(path), format_header());
  ::unlink(path.c_str());
}

TEST(ReportWriter, UnwritablePathFails) {
  EXPECT_FALSE(write_report_file("/nonexistent-fnprof-dir/report.txt", ReportList{}));
}
