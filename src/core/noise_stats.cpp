#include <specsynth/core/noise_stats.hpp>
#include <opencv2/core.hpp>

namespace specsynth::core {

NoiseStats sigma_clipped_stats(const cv::Mat& data, SigmaClipOptions options) {
  NoiseStats stats;
  if (data.empty()) return stats;

  cv::Mat mask(data.size(), CV_8UC1, cv::Scalar(255));
  cv::Scalar mean;
  cv::Scalar stddev;
  cv::meanStdDev(data, mean, stddev, mask);
  stats.mean = mean[0];
  stats.stddev = stddev[0];

  cv::Mat deviation;
  cv::Mat next_mask;
  cv::Mat changed;
  for (int it = 0; it < options.max_iterations; ++it) {
    cv::absdiff(data, cv::Scalar(stats.mean), deviation);
    cv::compare(deviation, cv::Scalar(options.sigma * stats.stddev), next_mask, cv::CMP_LE);

    cv::compare(next_mask, mask, changed, cv::CMP_NE);
    if (cv::countNonZero(changed) == 0) break;
    // All samples rejected: keep the previous estimate.
    if (cv::countNonZero(next_mask) == 0) break;

    mask = next_mask.clone();
    cv::meanStdDev(data, mean, stddev, mask);
    stats.mean = mean[0];
    stats.stddev = stddev[0];
  }
  return stats;
}

void NoiseTracker::record_injection(double mean, double stddev, const cv::Mat& data) {
  if (!has_noise_) {
    stats_.mean = mean;
    stats_.stddev = stddev;
    has_noise_ = true;
    return;
  }
  recompute(data);
}

void NoiseTracker::recompute(const cv::Mat& data, SigmaClipOptions options) {
  stats_ = sigma_clipped_stats(data, options);
  has_noise_ = true;
}

}  // namespace specsynth::core
