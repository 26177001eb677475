#pragma once
#include "fnprof/ReportRegistry.hpp"
#include <string>

namespace fnprof {

// | FILE (50) : FUNCTION (40) : LINE (20) : TIME (20) : CALLED (20)|
std::string format_header();

// | <title>: <%04.3f seconds>: <%07 count>|
std::string format_report_line(const FunctionReport& report);

// Truncates `path` and writes the header plus one line per report in list
// order. Returns false, after logging the path and errno text, if the file
// cannot be opened, written or closed.
bool write_report_file(const std::string& path, const ReportList& reports);

} // namespace fnprof
