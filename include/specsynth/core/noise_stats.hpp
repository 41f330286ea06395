#pragma once

#include <opencv2/core/mat.hpp>

namespace specsynth::core {

/// Noise-floor estimate: mean and (population) standard deviation.
struct NoiseStats {
  double mean{0.0};
  double stddev{0.0};
};

/// Outlier rejection parameters for sigma_clipped_stats.
struct SigmaClipOptions {
  double sigma{3.0};
  int max_iterations{5};
};

/// Mean/std of `data` after iteratively masking samples further than
/// sigma * std from the current mean. Stops after max_iterations or when the
/// mask no longer changes. `data` must be single-channel and non-empty.
[[nodiscard]] NoiseStats sigma_clipped_stats(const cv::Mat& data,
                                             SigmaClipOptions options = {});

/// Running noise-floor estimate of one frame.
///
/// The first recorded injection is taken at face value; later ones trigger a
/// sigma-clipped recomputation over the accumulated grid, so bright signal
/// pixels already present do not inflate the estimate.
class NoiseTracker {
 public:
  /// Call after the noise has been added to `data`.
  void record_injection(double mean, double stddev, const cv::Mat& data);

  /// Recompute from `data` regardless of history; marks noise as present.
  void recompute(const cv::Mat& data, SigmaClipOptions options = {});

  void reset() noexcept { stats_ = {}; has_noise_ = false; }

  [[nodiscard]] bool has_noise() const noexcept { return has_noise_; }
  [[nodiscard]] double mean() const noexcept { return stats_.mean; }
  [[nodiscard]] double stddev() const noexcept { return stats_.stddev; }
  [[nodiscard]] const NoiseStats& stats() const noexcept { return stats_; }

 private:
  NoiseStats stats_{};
  bool has_noise_{false};
};

}  // namespace specsynth::core
