#include <specsynth/core/noise_stats.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <cstdint>

namespace nc = specsynth::core;

namespace {

cv::Mat gaussian_grid(int rows, int cols, double mean, double stddev, std::uint64_t seed) {
  cv::Mat m(rows, cols, CV_64FC1);
  cv::RNG rng(seed);
  rng.fill(m, cv::RNG::NORMAL, cv::Scalar(mean), cv::Scalar(stddev));
  return m;
}

}  // namespace

TEST(NoiseStats, GaussianGridRecovered) {
  const cv::Mat data = gaussian_grid(256, 256, 10.0, 2.0, 42);
  const nc::NoiseStats stats = nc::sigma_clipped_stats(data);
  EXPECT_NEAR(stats.mean, 10.0, 0.05);
  EXPECT_NEAR(stats.stddev, 2.0, 0.1);
}

TEST(NoiseStats, BrightOutliersRejected) {
  cv::Mat data = gaussian_grid(256, 256, 10.0, 2.0, 7);
  for (int i = 0; i < 20; ++i) {
    data.at<double>(i * 10, i * 5) = 1e4;
  }
  cv::Scalar raw_mean;
  cv::Scalar raw_std;
  cv::meanStdDev(data, raw_mean, raw_std);
  ASSERT_GT(raw_mean[0], 12.0);

  const nc::NoiseStats stats = nc::sigma_clipped_stats(data);
  EXPECT_NEAR(stats.mean, 10.0, 0.05);
  EXPECT_NEAR(stats.stddev, 2.0, 0.1);
}

TEST(NoiseStats, ConstantGridHasZeroStd) {
  const cv::Mat data(4, 8, CV_64FC1, cv::Scalar(3.0));
  const nc::NoiseStats stats = nc::sigma_clipped_stats(data);
  EXPECT_DOUBLE_EQ(stats.mean, 3.0);
  EXPECT_DOUBLE_EQ(stats.stddev, 0.0);
}

TEST(NoiseTracker, FirstInjectionTakenAtFaceValue) {
  nc::NoiseTracker tracker;
  EXPECT_FALSE(tracker.has_noise());
  const cv::Mat data = gaussian_grid(16, 16, 0.0, 1.0, 3);
  tracker.record_injection(5.0, 2.0, data);
  EXPECT_TRUE(tracker.has_noise());
  EXPECT_DOUBLE_EQ(tracker.mean(), 5.0);
  EXPECT_DOUBLE_EQ(tracker.stddev(), 2.0);
}

TEST(NoiseTracker, LaterInjectionsRecomputeFromData) {
  nc::NoiseTracker tracker;
  const cv::Mat data = gaussian_grid(256, 256, 10.0, 2.0, 11);
  tracker.record_injection(0.0, 1.0, data);
  tracker.record_injection(0.0, 1.0, data);
  EXPECT_NEAR(tracker.mean(), 10.0, 0.05);
  EXPECT_NEAR(tracker.stddev(), 2.0, 0.1);

  tracker.reset();
  EXPECT_FALSE(tracker.has_noise());
  EXPECT_DOUBLE_EQ(tracker.mean(), 0.0);
}
