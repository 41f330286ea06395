#pragma once

#include <specsynth/app/config.hpp>
#include <specsynth/core/error.hpp>
#include <specsynth/core/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace specsynth::app {

/// Ground truth for one injected signal.
struct SignalLabel {
  std::size_t start_index{0};
  double f_start_hz{0.0};
  double drift_rate_hz_s{0.0};
  double snr{0.0};
  double level{0.0};
  double width_hz{0.0};
  std::string f_profile_type;
};

/// One generated frame and the signals it contains.
struct LabeledFrame {
  std::uint64_t frame_id{0};
  core::Frame frame;
  std::vector<SignalLabel> labels;
};

/// Callback for each generated frame; may be invoked from worker threads.
/// Must be thread-safe if using generate_dataset_parallel or generate_dataset_tbb.
using LabeledFrameCallback = std::function<void(const LabeledFrame&)>;

/// Frame geometry described by the config.
[[nodiscard]] core::FrameGeometry geometry_from_config(const DatasetConfig& cfg);

/// Builds frame `frame_id`: noise from the config, then signals_per_frame
/// constant-drift signals with start column, drift, SNR and width drawn
/// uniformly from the configured ranges. The frame is seeded with
/// cfg.seed + frame_id, so output does not depend on scheduling.
[[nodiscard]] std::expected<LabeledFrame, core::SynthError> generate_frame(
    const DatasetConfig& cfg,
    std::uint64_t frame_id);

/// Generates frames 0..num_frames-1 sequentially; calls callback for each.
/// Returns the number of frames produced, or the first error.
[[nodiscard]] std::expected<std::size_t, core::SynthError> generate_dataset(
    const DatasetConfig& cfg,
    const LabeledFrameCallback& callback);

/// Same as generate_dataset using a pool of worker threads.
/// num_workers 0 = use hardware concurrency. Callback order is unspecified.
[[nodiscard]] std::expected<std::size_t, core::SynthError> generate_dataset_parallel(
    const DatasetConfig& cfg,
    const LabeledFrameCallback& callback,
    std::size_t num_workers = 0);

}  // namespace specsynth::app
