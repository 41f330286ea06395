#pragma once

#include <specsynth/core/error.hpp>
#include <specsynth/core/frame.hpp>
#include <specsynth/core/profile.hpp>
#include <specsynth/core/signal_options.hpp>
#include <opencv2/core.hpp>
#include <expected>
#include <optional>

namespace specsynth::core {

/// Columns covered by a frequency window, clamped to [0, fchans]. Bounds may
/// lie anywhere outside the band, including +/-inf; a NaN bound is
/// InvalidArgument. No window means every column.
[[nodiscard]] std::expected<ColumnRange, SynthError> window_columns(
    const Frame& frame,
    const std::optional<FrequencyWindow>& window);

/// Composes a signal from a drift path (time -> center frequency), a time
/// profile, a spectral shape and a bandpass profile:
///
///   signal[r, c] = t_profile(ts[r]) * f_profile(fs[c], path(ts[r])) * bp_profile(fs[c])
///
/// evaluated only over options.freq_window. The patch is added to the frame's
/// grid in place; the returned matrix has the grid's shape and holds the patch
/// with zeros elsewhere. Noise statistics are left untouched.
///
/// integrate_path / integrate_t average the path / time profile over each row's
/// interval [t, t + dt] using t_subsamples points; integrate_f evaluates
/// f_subsamples points across each column's [f - df/2, f + df/2] and averages
/// them back to one column.
[[nodiscard]] std::expected<cv::Mat, SynthError> compose_signal(
    Frame& frame,
    const Profile& path,
    const Profile& t_profile,
    const FrequencyShape& f_profile,
    const Profile& bp_profile,
    const CompositionOptions& options = {});

/// compose_signal over an explicit column range; options.freq_window is ignored.
[[nodiscard]] std::expected<cv::Mat, SynthError> compose_signal_in_columns(
    Frame& frame,
    ColumnRange columns,
    const Profile& path,
    const Profile& t_profile,
    const FrequencyShape& f_profile,
    const Profile& bp_profile,
    const CompositionOptions& options = {});

}  // namespace specsynth::core
