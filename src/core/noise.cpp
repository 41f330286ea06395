#include <specsynth/core/noise.hpp>
#include <specsynth/core/error.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace specsynth::core {

namespace {

/// Below this standardized truncation point plain rejection accepts often enough.
constexpr double kTailThreshold = 0.5;

bool valid_params(const NoiseParams& params) {
  if (!std::isfinite(params.mean) || !std::isfinite(params.stddev)) return false;
  if (params.stddev < 0.0) return false;
  if (params.min.has_value() && !std::isfinite(*params.min)) return false;
  return true;
}

/// Standard normal conditioned on z >= a (Robert 1995 for the tail).
double sample_standard_tail(cv::RNG& rng, double a) {
  if (a < kTailThreshold) {
    while (true) {
      const double z = rng.gaussian(1.0);
      if (z >= a) return z;
    }
  }
  const double lambda = 0.5 * (a + std::sqrt(a * a + 4.0));
  while (true) {
    // uniform() is [0, 1); flip it so log() never sees zero.
    const double u1 = 1.0 - rng.uniform(0.0, 1.0);
    const double z = a - std::log(u1) / lambda;
    const double rho = std::exp(-0.5 * (z - lambda) * (z - lambda));
    if (rng.uniform(0.0, 1.0) <= rho) return z;
  }
}

}  // namespace

double UniformParameterSampler::sample(std::span<const double> candidates, cv::RNG& rng) {
  if (candidates.empty()) return 0.0;
  const int n = static_cast<int>(candidates.size());
  return candidates[static_cast<std::size_t>(rng.uniform(0, n))];
}

double sample_truncated_gaussian(cv::RNG& rng, double mean, double stddev, double min) {
  if (stddev <= 0.0) {
    return std::max(mean, min);
  }
  const double a = (min - mean) / stddev;
  return mean + stddev * sample_standard_tail(rng, a);
}

std::expected<cv::Mat, SynthError> draw_noise(cv::RNG& rng,
                                              cv::Size size,
                                              const NoiseParams& params) {
  if (!valid_params(params)) {
    return std::unexpected(SynthError::InvalidArgument);
  }

  cv::Mat noise(size, CV_64FC1);
  if (noise.empty()) return noise;

  if (!params.min.has_value()) {
    rng.fill(noise, cv::RNG::NORMAL, cv::Scalar(params.mean), cv::Scalar(params.stddev));
    return noise;
  }

  const double min = *params.min;
  for (int r = 0; r < noise.rows; ++r) {
    auto* row = noise.ptr<double>(r);
    for (int c = 0; c < noise.cols; ++c) {
      row[c] = sample_truncated_gaussian(rng, params.mean, params.stddev, min);
    }
  }
  return noise;
}

std::expected<NoiseParams, SynthError> select_obs_noise_params(
    std::span<const double> means,
    std::span<const double> stds,
    std::span<const double> mins,
    const ObsNoiseOptions& options,
    double frame_dt,
    cv::RNG& rng) {
  if (means.empty() || stds.empty()) {
    return std::unexpected(SynthError::InvalidArgument);
  }
  if (options.reference_dt.has_value() && !(*options.reference_dt > 0.0)) {
    return std::unexpected(SynthError::InvalidArgument);
  }

  NoiseParams params;
  if (options.share_index) {
    if (stds.size() != means.size() || (!mins.empty() && mins.size() != means.size())) {
      return std::unexpected(SynthError::LengthMismatch);
    }
    const auto i = static_cast<std::size_t>(rng.uniform(0, static_cast<int>(means.size())));
    params.mean = means[i];
    params.stddev = stds[i];
    if (!mins.empty()) params.min = mins[i];
  } else {
    UniformParameterSampler uniform;
    IParameterSampler& sampler = options.sampler ? *options.sampler : uniform;
    params.mean = sampler.sample(means, rng);
    params.stddev = sampler.sample(stds, rng);
    if (!mins.empty()) params.min = sampler.sample(mins, rng);
  }

  if (options.reference_dt.has_value()) {
    const double scale = frame_dt / *options.reference_dt;
    params.mean *= scale;
    params.stddev *= scale;
    if (params.min.has_value()) *params.min *= scale;
  }
  return params;
}

}  // namespace specsynth::core
