#pragma once

#include <specsynth/core/profile.hpp>
#include <specsynth/core/units.hpp>

namespace specsynth::profiles {

/// Time profiles: time (s) -> intensity.

[[nodiscard]] core::ScalarFunction constant_t_profile(double level);

/// level + amplitude * sin(2*pi*(t + phase) / period).
[[nodiscard]] core::ScalarFunction sine_t_profile(core::units::Duration period,
                                                  core::units::Duration phase,
                                                  double amplitude,
                                                  double level);

/// Bandpass profiles: frequency (Hz) -> gain.

[[nodiscard]] core::ScalarFunction constant_bp_profile(double level);

}  // namespace specsynth::profiles
