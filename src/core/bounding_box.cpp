#include <specsynth/core/bounding_box.hpp>
#include <specsynth/core/compositor.hpp>
#include <specsynth/core/error.hpp>
#include <specsynth/profiles/frequency_shapes.hpp>
#include <specsynth/profiles/intensity_profiles.hpp>
#include <specsynth/profiles/paths.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace specsynth::core {

namespace {

/// Zero-width shape on a frame's grid: 1 in the column nearest f_center, so a
/// line between two column centers still lands on one column.
FrequencyShape nearest_column_shape(const Frame& frame) {
  const double fmin = frame.fmin();
  const double df = frame.df();
  return [fmin, df](double f, double f_center) {
    const double column = std::nearbyint((f_center - fmin) / df);
    return f == fmin + column * df ? 1.0 : 0.0;
  };
}

}  // namespace

Interval interval(double a, double b) noexcept {
  return Interval{std::min(a, b), std::max(a, b)};
}

ColumnRange constant_signal_window(const Frame& frame,
                                   double f_start_hz,
                                   double drift_rate_hz_s,
                                   double width_hz) {
  const double df = frame.df();
  const auto fchans = static_cast<double>(frame.fchans());

  const double start = frame.column_position(f_start_hz);
  const double direction = drift_rate_hz_s >= 0.0 ? 1.0 : -1.0;
  const double width_offset = direction * 2.0 * std::abs(width_hz) / df;
  const double drift_offset =
      frame.dt() * static_cast<double>(frame.tchans() - 1) * drift_rate_hz_s / df;

  const Interval span = interval(start - width_offset, start + width_offset + drift_offset);
  if (std::isnan(span.lo) || std::isnan(span.hi)) {
    return ColumnRange{};
  }
  const double lo = std::clamp(std::floor(span.lo), 0.0, fchans);
  const double hi = std::clamp(std::ceil(span.hi) + 1.0, 0.0, fchans);

  ColumnRange range;
  range.begin = static_cast<std::size_t>(lo);
  range.end = std::max(range.begin, static_cast<std::size_t>(hi));
  return range;
}

std::expected<cv::Mat, SynthError> add_constant_signal(Frame& frame,
                                                       units::Frequency f_start,
                                                       units::DriftRate drift_rate,
                                                       double level,
                                                       units::Frequency width,
                                                       std::string_view f_profile_type) {
  const double f_start_hz = f_start.hz();
  const double drift_hz_s = drift_rate.hz_per_s();
  const double width_hz = width.hz();
  if (!std::isfinite(f_start_hz) || !std::isfinite(drift_hz_s) || !std::isfinite(level) ||
      !std::isfinite(width_hz) || width_hz < 0.0) {
    return std::unexpected(SynthError::InvalidArgument);
  }

  auto shape = profiles::frequency_shape_by_name(f_profile_type, width_hz);
  if (!shape) {
    return std::unexpected(shape.error());
  }
  ColumnRange columns = constant_signal_window(frame, f_start_hz, drift_hz_s, width_hz);
  if (width_hz == 0.0) {
    shape = nearest_column_shape(frame);
    // Rounding ties along the path can land one column past the window.
    if (!columns.empty()) {
      columns.begin = columns.begin > 0 ? columns.begin - 1 : 0;
      columns.end = std::min(columns.end + 1, frame.fchans());
    }
  }
  return compose_signal_in_columns(frame,
                                   columns,
                                   profiles::constant_path(f_start_hz, drift_hz_s),
                                   profiles::constant_t_profile(level),
                                   *shape,
                                   profiles::constant_bp_profile(1.0));
}

}  // namespace specsynth::core
