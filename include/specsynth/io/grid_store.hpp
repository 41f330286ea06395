#pragma once

#include <specsynth/core/error.hpp>
#include <specsynth/core/frame.hpp>
#include <expected>
#include <string>

namespace specsynth::io {

/// Writes grid + resolutions with cv::FileStorage. The format follows the
/// extension (.yml/.yaml, .xml, .json; append .gz to compress).
[[nodiscard]] std::expected<void, core::SynthError> save_grid_record(
    const std::string& path,
    const core::GridRecord& record);

/// Reads a record written by save_grid_record. Resolutions come back in Hz and s.
[[nodiscard]] std::expected<core::GridRecord, core::SynthError> load_grid_record(
    const std::string& path);

}  // namespace specsynth::io
