#pragma once

#include <string_view>

namespace specsynth::core {

/// Synthesis error codes; used with std::expected for recoverable failures.
enum class SynthError {
  None = 0,
  InvalidGeometry,
  ShapeMismatch,
  UnsupportedProfileType,
  UnsupportedProfile,
  LengthMismatch,
  NoNoisePresent,
  InvalidArgument,
  LoadFailed,
  SaveFailed,
  InvalidConfig,
};

/// Stable name of an error code, for diagnostics.
[[nodiscard]] std::string_view to_string(SynthError error) noexcept;

}  // namespace specsynth::core
