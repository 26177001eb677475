#include <gtest/gtest.h>
#include "fakes.hpp"
#include "fnprof/EventCorrelator.hpp"

using namespace fnprof;
using fnprof_test::FakeClock;

namespace {

FunctionIdentity ident(const char* name, int line = 10) {
  CallSiteInfo info;
  info.source = "corr.cpp";
  info.name = name;
  info.line_defined = line;
  return resolve_identity(info);
}

class EventCorrelatorTest : public ::testing::Test {
protected:
  FakeClock clock;
  ReportRegistry registry;
  EventCorrelator corr{registry, clock};

  const FunctionReport& report(const char* name) {
    const FunctionReport* r = registry.find(ident(name).title);
    EXPECT_NE(r, nullptr);
    return *r;
  }
};

} // namespace

TEST_F(EventCorrelatorTest, CallArmsTimer) {
  corr.on_call(ident("f"));
  const FunctionReport& r = report("f");
  ASSERT_TRUE(r.started_at.has_value());
  EXPECT_DOUBLE_EQ(*r.started_at, 100.0);
  EXPECT_EQ(r.call_count, 0u);
}

TEST_F(EventCorrelatorTest, BalancedPairsCountAndAccumulate) {
  const double durations[] = {0.5, 0.25, 1.0};
  for (double d : durations) {
    corr.on_call(ident("f"));
    clock.advance(d);
    corr.on_return(ident("f"));
    clock.advance(3.0);  // time between calls is not attributed
  }
  const FunctionReport& r = report("f");
  EXPECT_EQ(r.call_count, 3u);
  EXPECT_NEAR(r.accumulated, 1.75, 1e-12);
  EXPECT_FALSE(r.started_at.has_value());
  EXPECT_EQ(r.unbalanced_returns, 0u);
}

TEST_F(EventCorrelatorTest, NestedDistinctFunctionsAreTimedInclusively) {
  corr.on_call(ident("outer"));
  clock.advance(1.0);
  corr.on_call(ident("inner"));
  clock.advance(2.0);
  corr.on_return(ident("inner"));
  clock.advance(0.5);
  corr.on_return(ident("outer"));

  EXPECT_NEAR(report("inner").accumulated, 2.0, 1e-12);
  EXPECT_NEAR(report("outer").accumulated, 3.5, 1e-12);
  EXPECT_EQ(report("outer").call_count, 1u);
  EXPECT_EQ(report("inner").call_count, 1u);
}

TEST_F(EventCorrelatorTest, RecursionTimesOnlyInnermostLevel) {
  corr.on_call(ident("rec"));
  clock.advance(1.0);
  corr.on_call(ident("rec"));   // overwrites the outer start time
  clock.advance(2.0);
  corr.on_return(ident("rec"));
  clock.advance(4.0);
  corr.on_return(ident("rec"));

  const FunctionReport& r = report("rec");
  EXPECT_EQ(r.call_count, 2u);
  EXPECT_NEAR(r.accumulated, 2.0, 1e-12);
  EXPECT_EQ(r.unbalanced_returns, 1u);
  EXPECT_GE(r.accumulated, 0.0);
}

TEST_F(EventCorrelatorTest, ReturnWithoutCallIsTolerated) {
  corr.on_return(ident("late"));
  const FunctionReport& r = report("late");
  EXPECT_EQ(r.call_count, 1u);
  EXPECT_DOUBLE_EQ(r.accumulated, 0.0);
  EXPECT_EQ(r.unbalanced_returns, 1u);
}

TEST_F(EventCorrelatorTest, BackwardsClockAddsNothing) {
  corr.on_call(ident("f"));
  clock.advance(-5.0);
  corr.on_return(ident("f"));
  EXPECT_DOUBLE_EQ(report("f").accumulated, 0.0);
  EXPECT_EQ(report("f").call_count, 1u);
}
