#include "fnprof/ReportWriter.hpp"
#include "fnprof/Log.hpp"
#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <memory>

using namespace fnprof;

namespace {

struct FileCloser {
  void operator()(std::FILE* f) const { if (f) std::fclose(f); }
};
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

} // namespace

std::string fnprof::format_header() {
  char buf[256];
  std::snprintf(buf, sizeof(buf), "| %-50s: %-40s: %-20s: %-20s: %-20s|\n",
                "FILE", "FUNCTION", "LINE", "TIME", "CALLED");
  return buf;
}

std::string fnprof::format_report_line(const FunctionReport& report) {
  char timer[48], called[32];
  std::snprintf(timer, sizeof(timer), "%04.3f", report.accumulated);
  std::snprintf(called, sizeof(called), "%07" PRIu64, report.call_count);
  std::string out;
  out.reserve(report.title.size() + 52);
  out.append("| ").append(report.title).append(": ");
  char tail[96];
  std::snprintf(tail, sizeof(tail), "%-20s: %-20s|\n", timer, called);
  out.append(tail);
  return out;
}

bool fnprof::write_report_file(const std::string& path, const ReportList& reports) {
  FilePtr file(std::fopen(path.c_str(), "w"));
  if (!file) {
    log_error("cannot open %s: %s", path.c_str(), std::strerror(errno));
    return false;
  }

  const std::string header = format_header();
  if (std::fputs(header.c_str(), file.get()) == EOF) {
    log_error("cannot write %s: %s", path.c_str(), std::strerror(errno));
    return false;
  }
  for (const auto& r : reports) {
    const std::string line = format_report_line(*r);
    if (std::fputs(line.c_str(), file.get()) == EOF) {
      log_error("cannot write %s: %s", path.c_str(), std::strerror(errno));
      return false;
    }
  }

  // fclose flushes; a full disk shows up here.
  if (std::fclose(file.release()) != 0) {
    log_error("cannot write %s: %s", path.c_str(), std::strerror(errno));
    return false;
  }
  return true;
}
