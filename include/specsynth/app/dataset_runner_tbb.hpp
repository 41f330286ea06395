#pragma once

#include <specsynth/app/config.hpp>
#include <specsynth/app/dataset_runner.hpp>
#include <specsynth/core/error.hpp>
#include <cstddef>
#include <expected>

#ifdef SPECSYNTH_HAS_TBB

namespace specsynth::app {

/// Generates frames 0..num_frames-1 in parallel with tbb::parallel_for.
///
/// Frames are independent (each owns its grid and is seeded from its id), so
/// the output matches generate_dataset up to callback order. The callback is
/// invoked from TBB worker threads and must be thread-safe. Returns the number
/// of frames produced, or the first error observed (remaining work is skipped).
[[nodiscard]] std::expected<std::size_t, core::SynthError> generate_dataset_tbb(
    const DatasetConfig& cfg,
    const LabeledFrameCallback& callback);

}  // namespace specsynth::app

#endif  // SPECSYNTH_HAS_TBB
