#include <specsynth/core/error.hpp>
#include <specsynth/core/profile.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <numbers>
#include <vector>

namespace nc = specsynth::core;

TEST(Profile, CallableEvaluatedPerCoordinate) {
  nc::Profile p([](double x) { return 2.0 * x; });
  EXPECT_TRUE(p.is_callable());
  const std::vector<double> coords = {0.0, 1.0, 2.5};
  auto out = p.resolve(coords);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, (std::vector<double>{0.0, 2.0, 5.0}));
}

TEST(Profile, ArrayMustMatchLength) {
  nc::Profile p(std::vector<double>{1.0, 2.0, 3.0});
  EXPECT_TRUE(p.is_array());
  const std::vector<double> three = {0.0, 1.0, 2.0};
  const std::vector<double> four = {0.0, 1.0, 2.0, 3.0};
  auto ok = p.resolve(three);
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(*ok, (std::vector<double>{1.0, 2.0, 3.0}));
  auto bad = p.resolve(four);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), nc::SynthError::ShapeMismatch);
}

TEST(Profile, ScalarBroadcast) {
  nc::Profile p(4.0);
  EXPECT_TRUE(p.is_constant());
  const std::vector<double> coords(5, 0.0);
  auto out = p.resolve(coords);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, std::vector<double>(5, 4.0));
}

TEST(Profile, UnsetOrEmptyCallableUnsupported) {
  const std::vector<double> coords = {1.0};
  nc::Profile unset;
  auto a = unset.resolve(coords);
  ASSERT_FALSE(a.has_value());
  EXPECT_EQ(a.error(), nc::SynthError::UnsupportedProfileType);

  nc::Profile empty_fn{nc::ScalarFunction{}};
  auto b = empty_fn.resolve(coords);
  ASSERT_FALSE(b.has_value());
  EXPECT_EQ(b.error(), nc::SynthError::UnsupportedProfileType);
}

TEST(Profile, SubsampleAxisUsesIntervalMidpoints) {
  const std::vector<double> coords = {0.0, 10.0};
  const auto sub = nc::subsample_axis(coords, 10.0, 2);
  EXPECT_EQ(sub, (std::vector<double>{2.5, 7.5, 12.5, 17.5}));

  const auto centered = nc::subsample_axis(coords, 10.0, 2, -5.0);
  EXPECT_EQ(centered, (std::vector<double>{-2.5, 2.5, 7.5, 12.5}));
}

TEST(Profile, AverageGroups) {
  const std::vector<double> values = {1.0, 3.0, 5.0, 7.0, 9.0, 11.0};
  EXPECT_EQ(nc::average_groups(values, 2), (std::vector<double>{2.0, 6.0, 10.0}));
  EXPECT_EQ(nc::average_groups(values, 3), (std::vector<double>{3.0, 9.0}));
}

TEST(Profile, IntegratedLinearProfileEqualsIntervalMidpoint) {
  nc::Profile p([](double t) { return 3.0 * t + 1.0; });
  const std::vector<double> ts = {0.0, 2.0, 4.0};
  auto out = p.resolve_integrated(ts, 2.0, 10);
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->size(), 3u);
  for (std::size_t i = 0; i < ts.size(); ++i) {
    EXPECT_NEAR((*out)[i], 3.0 * (ts[i] + 1.0) + 1.0, 1e-12);
  }
}

TEST(Profile, IntegrationConvergesToIntervalMean) {
  // Mean of sin over [0, pi] is 2/pi.
  nc::Profile p([](double t) { return std::sin(t); });
  const std::vector<double> ts = {0.0};
  const double exact = 2.0 / std::numbers::pi;
  auto coarse = p.resolve_integrated(ts, std::numbers::pi, 4);
  auto fine = p.resolve_integrated(ts, std::numbers::pi, 400);
  ASSERT_TRUE(coarse.has_value());
  ASSERT_TRUE(fine.has_value());
  EXPECT_LT(std::abs((*fine)[0] - exact), std::abs((*coarse)[0] - exact));
  EXPECT_NEAR((*fine)[0], exact, 1e-5);
}

TEST(Profile, IntegrationLeavesArraysAndConstants) {
  const std::vector<double> ts = {0.0, 1.0};
  nc::Profile arr(std::vector<double>{5.0, 6.0});
  auto a = arr.resolve_integrated(ts, 1.0, 10);
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(*a, (std::vector<double>{5.0, 6.0}));

  nc::Profile c(2.0);
  auto b = c.resolve_integrated(ts, 1.0, 10);
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(*b, (std::vector<double>{2.0, 2.0}));
}

TEST(Profile, IntegrationRejectsNonPositiveSubsamples) {
  nc::Profile p([](double t) { return t; });
  const std::vector<double> ts = {0.0};
  auto out = p.resolve_integrated(ts, 1.0, 0);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), nc::SynthError::InvalidArgument);
}
