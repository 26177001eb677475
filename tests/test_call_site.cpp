#include <gtest/gtest.h>
#include "fnprof/CallSite.hpp"

using namespace fnprof;

static CallSiteInfo site(const char* source, const char* name, int line) {
  CallSiteInfo info;
  info.source = source;
  info.name = name;
  info.line_defined = line;
  return info;
}

TEST(CallSite, FormatsFixedWidthColumns) {
  std::string title = format_title(site("main.cpp", "run", 42));
  std::string expected = std::string("main.cpp") + std::string(42, ' ') + ": "
                       + "run" + std::string(37, ' ') + ": "
                       + "0042" + std::string(16, ' ');
  EXPECT_EQ(title, expected);
  EXPECT_EQ(title.size(), 50u + 2 + 40 + 2 + 20);
}

TEST(CallSite, MissingFieldsUseDefaults) {
  FunctionIdentity id = resolve_identity(CallSiteInfo{});
  EXPECT_EQ(id.source, "C_FUNC");
  EXPECT_EQ(id.name, "anonymous");
  EXPECT_EQ(id.line_defined, 0);
  EXPECT_EQ(id.title.substr(0, 6), "C_FUNC");
  EXPECT_NE(id.title.find(": anonymous"), std::string::npos);
  EXPECT_NE(id.title.find(": 0000"), std::string::npos);
}

TEST(CallSite, SameMetadataSameTitle) {
  EXPECT_EQ(format_title(site("a.cpp", "f", 7)), format_title(site("a.cpp", "f", 7)));
  EXPECT_NE(format_title(site("a.cpp", "f", 7)), format_title(site("a.cpp", "f", 8)));
  EXPECT_NE(format_title(site("a.cpp", "f", 7)), format_title(site("b.cpp", "f", 7)));
}

TEST(CallSite, LongFieldsAreTruncatedAndMayCollide) {
  std::string common(40, 'n');
  std::string a = format_title(site("x.cpp", (common + "_alpha").c_str(), 1));
  std::string b = format_title(site("x.cpp", (common + "_beta").c_str(), 1));
  EXPECT_EQ(a, b);
  EXPECT_EQ(a.find("_alpha"), std::string::npos);

  std::string src(80, 's');
  std::string t = format_title(site(src.c_str(), "f", 1));
  EXPECT_EQ(t.substr(0, 52), std::string(50, 's') + ": ");
}

TEST(CallSite, LineIsZeroPadded) {
  EXPECT_NE(format_title(site("a.cpp", "f", 7)).find(": 0007"), std::string::npos);
  EXPECT_NE(format_title(site("a.cpp", "f", 12345)).find(": 12345"), std::string::npos);
}

TEST(CallSite, NativeFunctionsUseSentinelSource) {
  CallSiteInfo info = site("libm.so.6", "cos", 0);
  info.native = true;
  FunctionIdentity id = resolve_identity(info);
  EXPECT_EQ(id.source, "C_FUNC");
  EXPECT_EQ(id.name, "cos");
  EXPECT_EQ(id.title, format_title(info));
  EXPECT_EQ(id.title.substr(0, 6), "C_FUNC");
}
