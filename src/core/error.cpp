#include <specsynth/core/error.hpp>

namespace specsynth::core {

std::string_view to_string(SynthError error) noexcept {
  switch (error) {
    case SynthError::None:
      return "None";
    case SynthError::InvalidGeometry:
      return "InvalidGeometry";
    case SynthError::ShapeMismatch:
      return "ShapeMismatch";
    case SynthError::UnsupportedProfileType:
      return "UnsupportedProfileType";
    case SynthError::UnsupportedProfile:
      return "UnsupportedProfile";
    case SynthError::LengthMismatch:
      return "LengthMismatch";
    case SynthError::NoNoisePresent:
      return "NoNoisePresent";
    case SynthError::InvalidArgument:
      return "InvalidArgument";
    case SynthError::LoadFailed:
      return "LoadFailed";
    case SynthError::SaveFailed:
      return "SaveFailed";
    case SynthError::InvalidConfig:
      return "InvalidConfig";
  }
  return "Unknown";
}

}  // namespace specsynth::core
