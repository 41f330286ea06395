#include <specsynth/core/error.hpp>
#include <specsynth/core/noise.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <vector>

namespace nc = specsynth::core;

namespace {

/// Always returns the last candidate; lets tests see which path was taken.
class LastCandidateSampler : public nc::IParameterSampler {
 public:
  double sample(std::span<const double> candidates, cv::RNG&) override {
    ++calls;
    return candidates.back();
  }
  int calls{0};
};

}  // namespace

TEST(Noise, GaussianDrawMatchesParameters) {
  cv::RNG rng(1);
  auto noise = nc::draw_noise(rng, cv::Size(200, 100), {3.0, 0.5, std::nullopt});
  ASSERT_TRUE(noise.has_value());
  EXPECT_EQ(noise->rows, 100);
  EXPECT_EQ(noise->cols, 200);
  EXPECT_EQ(noise->type(), CV_64FC1);
  cv::Scalar mean;
  cv::Scalar stddev;
  cv::meanStdDev(*noise, mean, stddev);
  EXPECT_NEAR(mean[0], 3.0, 0.02);
  EXPECT_NEAR(stddev[0], 0.5, 0.02);
}

TEST(Noise, TruncatedDrawNeverBelowMin) {
  cv::RNG rng(2);
  auto noise = nc::draw_noise(rng, cv::Size(64, 64), {5.0, 2.0, 0.0});
  ASSERT_TRUE(noise.has_value());
  double min_value = 0.0;
  cv::minMaxLoc(*noise, &min_value);
  EXPECT_GE(min_value, 0.0);
}

TEST(Noise, FarTailTruncationTerminates) {
  cv::RNG rng(3);
  auto noise = nc::draw_noise(rng, cv::Size(32, 32), {0.0, 1.0, 8.0});
  ASSERT_TRUE(noise.has_value());
  double min_value = 0.0;
  double max_value = 0.0;
  cv::minMaxLoc(*noise, &min_value, &max_value);
  EXPECT_GE(min_value, 8.0);
  EXPECT_LT(max_value, 10.0);
}

TEST(Noise, ZeroStdTruncatedIsClampedConstant) {
  cv::RNG rng(4);
  EXPECT_DOUBLE_EQ(nc::sample_truncated_gaussian(rng, 1.0, 0.0, 3.0), 3.0);
  EXPECT_DOUBLE_EQ(nc::sample_truncated_gaussian(rng, 5.0, 0.0, 3.0), 5.0);
}

TEST(Noise, NegativeStdRejected) {
  cv::RNG rng(5);
  auto noise = nc::draw_noise(rng, cv::Size(4, 4), {0.0, -1.0, std::nullopt});
  ASSERT_FALSE(noise.has_value());
  EXPECT_EQ(noise.error(), nc::SynthError::InvalidArgument);
}

TEST(Noise, SharedIndexSelectsOneRow) {
  cv::RNG rng(6);
  const std::vector<double> means = {1.0, 2.0, 3.0};
  const std::vector<double> stds = {10.0, 20.0, 30.0};
  const std::vector<double> mins = {100.0, 200.0, 300.0};
  for (int i = 0; i < 20; ++i) {
    auto p = nc::select_obs_noise_params(means, stds, mins, {}, 1.0, rng);
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->stddev, 10.0 * p->mean);
    ASSERT_TRUE(p->min.has_value());
    EXPECT_DOUBLE_EQ(*p->min, 100.0 * p->mean);
  }
}

TEST(Noise, SharedIndexRequiresEqualLengths) {
  cv::RNG rng(7);
  const std::vector<double> means = {1.0, 2.0, 3.0};
  const std::vector<double> stds = {10.0, 20.0};
  auto p = nc::select_obs_noise_params(means, stds, {}, {}, 1.0, rng);
  ASSERT_FALSE(p.has_value());
  EXPECT_EQ(p.error(), nc::SynthError::LengthMismatch);
}

TEST(Noise, IndependentSamplingUsesSampler) {
  cv::RNG rng(8);
  const std::vector<double> means = {1.0, 2.0, 3.0};
  const std::vector<double> stds = {10.0, 20.0};
  LastCandidateSampler sampler;
  nc::ObsNoiseOptions options;
  options.share_index = false;
  options.sampler = &sampler;
  auto p = nc::select_obs_noise_params(means, stds, {}, options, 1.0, rng);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(sampler.calls, 2);
  EXPECT_DOUBLE_EQ(p->mean, 3.0);
  EXPECT_DOUBLE_EQ(p->stddev, 20.0);
  EXPECT_FALSE(p->min.has_value());
}

TEST(Noise, ReferenceResolutionRescales) {
  cv::RNG rng(9);
  const std::vector<double> means = {4.0};
  const std::vector<double> stds = {2.0};
  const std::vector<double> mins = {1.0};
  nc::ObsNoiseOptions options;
  options.reference_dt = 2.0;
  auto p = nc::select_obs_noise_params(means, stds, mins, options, 18.0, rng);
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(p->mean, 36.0);
  EXPECT_DOUBLE_EQ(p->stddev, 18.0);
  EXPECT_DOUBLE_EQ(*p->min, 9.0);
}

TEST(Noise, EmptyCandidatesRejected) {
  cv::RNG rng(10);
  const std::vector<double> empty;
  const std::vector<double> stds = {1.0};
  auto p = nc::select_obs_noise_params(empty, stds, {}, {}, 1.0, rng);
  ASSERT_FALSE(p.has_value());
  EXPECT_EQ(p.error(), nc::SynthError::InvalidArgument);
}
