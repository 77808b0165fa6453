#include <gtest/gtest.h>
#include <set>
#include "pathcast/core/constants.hpp"
#include "pathcast/core/error.hpp"
#include "pathcast/core/flow_predictor.hpp"
#include "pathcast/core/time_context.hpp"
#include "test_utils.hpp"

using namespace pathcast::core;
using namespace pathcast::core::test;

TEST(TimeContext, IndexCoversKeySpaceExactly) {
  std::set<std::size_t> keys;
  for (int h = 0; h < 24; ++h) {
    for (int d = 0; d < 7; ++d) {
      for (bool peak : {false, true}) {
        TimeContext ctx {h, d, peak};
        auto idx = ctx.index();
        EXPECT_LT(idx, kNumTimeContexts);
        EXPECT_TRUE(keys.insert(idx).second);
        EXPECT_EQ(TimeContext::from_index(idx), ctx);
      }
    }
  }
  EXPECT_EQ(keys.size(), kNumTimeContexts);
}

TEST(TimeContext, ValidateRejectsOutOfRange) {
  EXPECT_THROW((TimeContext{24, 0, false}.validate()), ValueError);
  EXPECT_THROW((TimeContext{-1, 0, false}.validate()), ValueError);
  EXPECT_THROW((TimeContext{9, 7, true}.validate()), ValueError);
  EXPECT_NO_THROW((TimeContext{23, 6, true}.validate()));
  EXPECT_THROW((void)TimeContext::from_index(kNumTimeContexts), ValueError);
}

TEST(TimeContext, FromHourDerivesPeak) {
  EXPECT_TRUE(TimeContext::from_hour(9, 1).is_peak);
  EXPECT_TRUE(TimeContext::from_hour(16, 4).is_peak);
  EXPECT_FALSE(TimeContext::from_hour(12, 1).is_peak);
  EXPECT_FALSE(TimeContext::from_hour(22, 6).is_peak);
}

TEST(BaselinePredictor, MatchesRuleOfThumb) {
  // peak at 12:00 on capacity 400: 100 + 160 + 10
  EXPECT_DOUBLE_EQ(baseline_flow(TimeContext{12, 2, true}, 400.0), 270.0);
  // off-peak at 00:00 on capacity 400: 100 + 40 + 0
  EXPECT_DOUBLE_EQ(baseline_flow(TimeContext{0, 2, false}, 400.0), 140.0);

  auto g = make_diamond_graph();
  auto p = make_baseline_predictor();
  auto flows = p->predict_all(TimeContext{12, 2, true}, g);
  ASSERT_EQ(flows.size(), 4u);
  for (auto f : flows) EXPECT_DOUBLE_EQ(f, 67.5);
}

TEST(FunctionPredictor, CallsFunctionPerEdgeInIndexOrder) {
  auto g = make_diamond_graph();
  auto p = make_function_predictor([](const TimeContext& ctx, const Edge& e) {
    return e.id == "AB" ? 90.0 : static_cast<double>(ctx.hour);
  });
  auto flows = p->predict_all(TimeContext{7, 0, false}, g);
  ASSERT_EQ(flows.size(), 4u);
  EXPECT_DOUBLE_EQ(flows[0], 90.0);
  EXPECT_DOUBLE_EQ(flows[1], 7.0);
  EXPECT_THROW((void)make_function_predictor(EdgeFlowFn{}), ValueError);
}

TEST(FeatureRows, FollowModelColumnOrder) {
  auto g = make_diamond_graph();
  auto rows = build_feature_rows(g, TimeContext{9, 1, true});
  ASSERT_EQ(rows.size(), 4u);
  EXPECT_EQ(kFeatureNames[0], "hour");
  EXPECT_EQ(kFeatureNames[6], "flow_lag2");
  const auto& r = rows[0];
  EXPECT_DOUBLE_EQ(r[0], 9.0);
  EXPECT_DOUBLE_EQ(r[1], 1.0);
  EXPECT_DOUBLE_EQ(r[2], 1.0);
  EXPECT_DOUBLE_EQ(r[3], 100.0);
  EXPECT_DOUBLE_EQ(r[4], 10.0);
  EXPECT_DOUBLE_EQ(r[5], 10.0);
  EXPECT_DOUBLE_EQ(r[6], 10.0);

  FeatureOptions opts;
  opts.lag_fraction = 0.5;
  EXPECT_DOUBLE_EQ(build_feature_rows(g, TimeContext{9, 1, true}, opts)[0][5], 50.0);
}
