#pragma once

#include <specsynth/core/error.hpp>
#include <opencv2/core.hpp>
#include <expected>
#include <optional>
#include <span>

namespace specsynth::core {

/// Parameters of one noise draw. With `min` set the draw is left-truncated at min.
struct NoiseParams {
  double mean{0.0};
  double stddev{0.0};
  std::optional<double> min;
};

/// Draws one value from a set of observed candidates (the marginal
/// distribution of one noise parameter). Implementations must be usable
/// from the thread that owns the frame; nothing more is required.
class IParameterSampler {
 public:
  virtual ~IParameterSampler() = default;

  [[nodiscard]] virtual double sample(std::span<const double> candidates,
                                      cv::RNG& rng) = 0;
};

/// Picks one candidate uniformly at random.
class UniformParameterSampler : public IParameterSampler {
 public:
  [[nodiscard]] double sample(std::span<const double> candidates,
                              cv::RNG& rng) override;
};

/// How add_noise_from_obs turns candidate arrays into one NoiseParams.
struct ObsNoiseOptions {
  /// One shared random index into all arrays (they must have equal length).
  /// Otherwise each parameter is sampled independently through `sampler`.
  bool share_index{true};
  /// Time resolution the candidates were measured at; when set, the selected
  /// parameters are scaled by frame_dt / reference_dt.
  std::optional<double> reference_dt;
  /// Used when share_index is false. nullptr means UniformParameterSampler.
  IParameterSampler* sampler{nullptr};
};

/// Matrix of `size` (CV_64F) filled with N(mean, stddev), or with the same
/// distribution truncated below at `min`.
[[nodiscard]] std::expected<cv::Mat, SynthError> draw_noise(cv::RNG& rng,
                                                            cv::Size size,
                                                            const NoiseParams& params);

/// One value of N(mean, stddev) conditioned on value >= min.
[[nodiscard]] double sample_truncated_gaussian(cv::RNG& rng,
                                               double mean,
                                               double stddev,
                                               double min);

/// Selects (mean, std[, min]) from observed candidate arrays. `mins` may be empty.
[[nodiscard]] std::expected<NoiseParams, SynthError> select_obs_noise_params(
    std::span<const double> means,
    std::span<const double> stds,
    std::span<const double> mins,
    const ObsNoiseOptions& options,
    double frame_dt,
    cv::RNG& rng);

}  // namespace specsynth::core
