#include <specsynth/profiles/intensity_profiles.hpp>
#include <specsynth/profiles/paths.hpp>
#include <gtest/gtest.h>

namespace nu = specsynth::core::units;
namespace np = specsynth::profiles;

TEST(Paths, ConstantDrift) {
  const auto path = np::constant_path(1000.0, -0.5);
  EXPECT_DOUBLE_EQ(path(0.0), 1000.0);
  EXPECT_DOUBLE_EQ(path(10.0), 995.0);
}

TEST(Paths, UnitsApplied) {
  const auto path = np::constant_path(nu::Frequency(1.0, nu::FrequencyUnit::MHz),
                                      nu::DriftRate(1.0, nu::FrequencyUnit::kHz, nu::TimeUnit::min));
  EXPECT_NEAR(path(60.0), 1e6 + 1e3, 1e-6);
}

TEST(Paths, SquaredDrift) {
  const auto path = np::squared_path(100.0, 2.0);
  EXPECT_DOUBLE_EQ(path(0.0), 100.0);
  EXPECT_DOUBLE_EQ(path(3.0), 109.0);
}

TEST(Paths, SineWobblesAroundLinearDrift) {
  const auto path = np::sine_path(100.0, 1.0, 4.0, 2.0);
  EXPECT_NEAR(path(0.0), 100.0, 1e-12);
  EXPECT_NEAR(path(1.0), 103.0, 1e-12);
  EXPECT_NEAR(path(2.0), 102.0, 1e-12);
  EXPECT_NEAR(path(3.0), 101.0, 1e-12);
}

TEST(IntensityProfiles, ConstantAndSine) {
  EXPECT_DOUBLE_EQ(np::constant_t_profile(4.0)(123.0), 4.0);
  EXPECT_DOUBLE_EQ(np::constant_bp_profile(0.5)(6e9), 0.5);

  const auto sine = np::sine_t_profile(8.0, 0.0, 1.0, 3.0);
  EXPECT_NEAR(sine(0.0), 3.0, 1e-12);
  EXPECT_NEAR(sine(2.0), 4.0, 1e-12);
  EXPECT_NEAR(sine(6.0), 2.0, 1e-12);

  const auto shifted = np::sine_t_profile(8.0, 2.0, 1.0, 3.0);
  EXPECT_NEAR(shifted(0.0), 4.0, 1e-12);
}
