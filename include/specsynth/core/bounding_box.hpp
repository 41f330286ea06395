#pragma once

#include <specsynth/core/error.hpp>
#include <specsynth/core/frame.hpp>
#include <specsynth/core/signal_options.hpp>
#include <specsynth/core/units.hpp>
#include <opencv2/core.hpp>
#include <expected>
#include <string_view>

namespace specsynth::core {

/// Closed interval [lo, hi] spanning two points in either order.
struct Interval {
  double lo{0.0};
  double hi{0.0};
};

[[nodiscard]] Interval interval(double a, double b) noexcept;

/// Columns that can receive energy from a constant-drift signal.
///
/// Starts from the column nearest f_start, widens by two spectral widths on
/// the side opposite to the drift (zero drift counts as positive) and extends
/// by the total drift over the frame, all in column units. The inclusive
/// interval [floor(lo), ceil(hi)] is clamped to the grid and returned half-open.
/// NaN inputs give an empty range.
[[nodiscard]] ColumnRange constant_signal_window(const Frame& frame,
                                                 double f_start_hz,
                                                 double drift_rate_hz_s,
                                                 double width_hz);

/// Injects a constant-drift, constant-intensity signal through the compositor,
/// restricted to constant_signal_window. A zero width puts the whole level in
/// the column nearest the path in each row, whatever the shape type.
[[nodiscard]] std::expected<cv::Mat, SynthError> add_constant_signal(
    Frame& frame,
    units::Frequency f_start,
    units::DriftRate drift_rate,
    double level,
    units::Frequency width,
    std::string_view f_profile_type = "gaussian");

}  // namespace specsynth::core
