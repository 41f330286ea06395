#include <specsynth/core/axes.hpp>
#include <gtest/gtest.h>
#include <cstddef>

namespace nc = specsynth::core;

TEST(Axes, FrequencyAxisAscendingBelowFmax) {
  const auto fs = nc::derive_frequency_axis(1000.0, 8, 2.0);
  ASSERT_EQ(fs.size(), 8u);
  EXPECT_DOUBLE_EQ(fs.front(), 1000.0 - 16.0);
  EXPECT_DOUBLE_EQ(fs.back(), 1000.0 - 2.0);
  for (std::size_t i = 1; i < fs.size(); ++i) {
    EXPECT_NEAR(fs[i] - fs[i - 1], 2.0, 1e-12);
  }
}

TEST(Axes, LargeBandKeepsConstantStep) {
  const double df = 2.7939677238464355;
  const auto fs = nc::derive_frequency_axis(6095.214842353016e6, 1024, df);
  ASSERT_EQ(fs.size(), 1024u);
  for (std::size_t i = 1; i < fs.size(); ++i) {
    EXPECT_GT(fs[i], fs[i - 1]);
    EXPECT_NEAR(fs[i] - fs[i - 1], df, 1e-5);
  }
}

TEST(Axes, TimeAxisStartsAtZero) {
  const auto ts = nc::derive_time_axis(4, 18.25);
  ASSERT_EQ(ts.size(), 4u);
  EXPECT_DOUBLE_EQ(ts[0], 0.0);
  EXPECT_DOUBLE_EQ(ts[3], 3 * 18.25);
}

TEST(Axes, RecomputationIsIdempotent) {
  EXPECT_EQ(nc::derive_frequency_axis(50.0, 5, 0.5), nc::derive_frequency_axis(50.0, 5, 0.5));
  EXPECT_EQ(nc::derive_time_axis(7, 0.1), nc::derive_time_axis(7, 0.1));
}
