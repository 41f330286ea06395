#include <specsynth/core/compositor.hpp>
#include <specsynth/core/error.hpp>
#include <specsynth/core/frame.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <vector>

namespace specsynth::core {

namespace {

std::size_t clamp_column(double position, std::size_t fchans) {
  return static_cast<std::size_t>(std::clamp(position, 0.0, static_cast<double>(fchans)));
}

std::expected<std::vector<double>, SynthError> resolve_over_time(const Profile& profile,
                                                                 const Frame& frame,
                                                                 bool integrate,
                                                                 int subsamples) {
  if (integrate) {
    return profile.resolve_integrated(frame.ts(), frame.dt(), subsamples);
  }
  return profile.resolve(frame.ts());
}

/// Bandpass values per evaluated frequency point. Arrays and constants are
/// per physical column and get repeated across that column's sub-points.
std::expected<std::vector<double>, SynthError> resolve_bandpass(
    const Profile& bp_profile,
    std::span<const double> columns,
    std::span<const double> eval_fs,
    std::size_t subsamples) {
  if (subsamples > 1 && bp_profile.is_callable()) {
    return bp_profile.resolve(eval_fs);
  }
  auto per_column = bp_profile.resolve(columns);
  if (!per_column || subsamples == 1) {
    return per_column;
  }
  std::vector<double> out;
  out.reserve(per_column->size() * subsamples);
  for (const double v : *per_column) {
    out.insert(out.end(), subsamples, v);
  }
  return out;
}

}  // namespace

std::expected<ColumnRange, SynthError> window_columns(
    const Frame& frame,
    const std::optional<FrequencyWindow>& window) {
  const std::size_t fchans = frame.fchans();
  if (!window) {
    return ColumnRange{0, fchans};
  }
  if (std::isnan(window->f_lo) || std::isnan(window->f_hi)) {
    return std::unexpected(SynthError::InvalidArgument);
  }
  const double lo = std::min(window->f_lo, window->f_hi);
  const double hi = std::max(window->f_lo, window->f_hi);
  ColumnRange range;
  range.begin = clamp_column(frame.column_position(lo), fchans);
  range.end = std::max(range.begin, clamp_column(frame.column_position(hi), fchans));
  return range;
}

std::expected<cv::Mat, SynthError> compose_signal(Frame& frame,
                                                  const Profile& path,
                                                  const Profile& t_profile,
                                                  const FrequencyShape& f_profile,
                                                  const Profile& bp_profile,
                                                  const CompositionOptions& options) {
  auto columns = window_columns(frame, options.freq_window);
  if (!columns) {
    return std::unexpected(columns.error());
  }
  return compose_signal_in_columns(frame,
                                   *columns,
                                   path,
                                   t_profile,
                                   f_profile,
                                   bp_profile,
                                   options);
}

std::expected<cv::Mat, SynthError> compose_signal_in_columns(
    Frame& frame,
    ColumnRange columns,
    const Profile& path,
    const Profile& t_profile,
    const FrequencyShape& f_profile,
    const Profile& bp_profile,
    const CompositionOptions& options) {
  if (!f_profile) {
    return std::unexpected(SynthError::UnsupportedProfileType);
  }
  if (options.integrate_f && options.f_subsamples < 1) {
    return std::unexpected(SynthError::InvalidArgument);
  }

  const std::size_t fchans = frame.fchans();
  const std::size_t tchans = frame.tchans();
  const int rows = static_cast<int>(tchans);

  auto t_values = resolve_over_time(t_profile, frame, options.integrate_t, options.t_subsamples);
  if (!t_values) {
    return std::unexpected(t_values.error());
  }
  auto centers = resolve_over_time(path, frame, options.integrate_path, options.t_subsamples);
  if (!centers) {
    return std::unexpected(centers.error());
  }

  cv::Mat full = cv::Mat::zeros(rows, static_cast<int>(fchans), CV_64FC1);
  columns.end = std::min(columns.end, fchans);
  columns.begin = std::min(columns.begin, columns.end);
  if (columns.empty()) {
    return full;
  }

  const std::size_t width = columns.width();
  const std::span<const double> restricted =
      std::span<const double>(frame.fs()).subspan(columns.begin, width);

  const std::size_t subsamples =
      options.integrate_f ? static_cast<std::size_t>(options.f_subsamples) : 1;
  const std::vector<double> eval_fs =
      subsamples > 1
          ? subsample_axis(restricted, frame.df(), static_cast<int>(subsamples), -0.5 * frame.df())
          : std::vector<double>(restricted.begin(), restricted.end());

  auto bp_values = resolve_bandpass(bp_profile, restricted, eval_fs, subsamples);
  if (!bp_values) {
    return std::unexpected(bp_values.error());
  }

  cv::Mat patch(rows, static_cast<int>(eval_fs.size()), CV_64FC1);
  for (int r = 0; r < rows; ++r) {
    auto* out = patch.ptr<double>(r);
    const double level = (*t_values)[static_cast<std::size_t>(r)];
    const double center = (*centers)[static_cast<std::size_t>(r)];
    for (std::size_t c = 0; c < eval_fs.size(); ++c) {
      out[c] = level * f_profile(eval_fs[c], center) * (*bp_values)[c];
    }
  }

  if (subsamples > 1) {
    // One row per (time, column) pair, one column per sub-point.
    cv::Mat grouped = patch.reshape(1, rows * static_cast<int>(width));
    cv::Mat averaged;
    cv::reduce(grouped, averaged, 1, cv::REDUCE_AVG);
    patch = averaged.reshape(1, rows);
  }

  const cv::Rect region(static_cast<int>(columns.begin), 0, static_cast<int>(width), rows);
  cv::Mat target = frame.mutable_data()(region);
  target += patch;
  patch.copyTo(full(region));
  return full;
}

}  // namespace specsynth::core
