#pragma once

#include <specsynth/core/profile.hpp>
#include <specsynth/core/units.hpp>

namespace specsynth::profiles {

/// Drift paths: time (s) -> center frequency (Hz).

/// f_start + drift_rate * t.
[[nodiscard]] core::ScalarFunction constant_path(core::units::Frequency f_start,
                                                 core::units::DriftRate drift_rate);

/// f_start + 0.5 * drift_rate * t^2, with drift_rate taken per second squared.
[[nodiscard]] core::ScalarFunction squared_path(core::units::Frequency f_start,
                                                core::units::DriftRate drift_rate);

/// constant_path plus a sinusoidal wobble of the given period and amplitude.
[[nodiscard]] core::ScalarFunction sine_path(core::units::Frequency f_start,
                                             core::units::DriftRate drift_rate,
                                             core::units::Duration period,
                                             core::units::Frequency amplitude);

}  // namespace specsynth::profiles
