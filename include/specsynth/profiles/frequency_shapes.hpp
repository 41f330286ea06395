#pragma once

#include <specsynth/core/error.hpp>
#include <specsynth/core/profile.hpp>
#include <specsynth/core/units.hpp>
#include <complex>
#include <cstdint>
#include <expected>
#include <string_view>

namespace specsynth::profiles {

/// Spectral shapes: (f, f_center) -> intensity, peaking at `level` on f_center.
/// Widths are full widths (FWHM for the peaked shapes). A zero width gives a
/// delta: `level` exactly at f_center and zero elsewhere.

enum class FrequencyProfileType : std::uint8_t {
  Box,
  Gaussian,
  Lorentzian,
  Voigt,
};

/// "box" | "gaussian" | "lorentzian" | "voigt"; anything else is UnsupportedProfile.
[[nodiscard]] std::expected<FrequencyProfileType, core::SynthError> parse_frequency_profile_type(
    std::string_view name);

[[nodiscard]] std::string_view to_string(FrequencyProfileType type) noexcept;

/// `level` where |f - f_center| <= width / 2.
[[nodiscard]] core::FrequencyShape box_f_profile(core::units::Frequency width, double level = 1.0);

[[nodiscard]] core::FrequencyShape gaussian_f_profile(core::units::Frequency width,
                                                      double level = 1.0);

[[nodiscard]] core::FrequencyShape lorentzian_f_profile(core::units::Frequency width,
                                                        double level = 1.0);

/// Convolution of a Gaussian (g_width) and a Lorentzian (l_width), normalized to peak at level.
[[nodiscard]] core::FrequencyShape voigt_f_profile(core::units::Frequency g_width,
                                                   core::units::Frequency l_width,
                                                   double level = 1.0);

/// Shape for a named type; voigt uses `width` for both components.
[[nodiscard]] std::expected<core::FrequencyShape, core::SynthError> frequency_shape_by_name(
    std::string_view type,
    core::units::Frequency width,
    double level = 1.0);

/// Faddeeva function w(z) = exp(-z^2) erfc(-iz) for Im z >= 0, by Humlicek's
/// W4 rational approximation (relative error around 1e-4).
[[nodiscard]] std::complex<double> faddeeva(std::complex<double> z);

}  // namespace specsynth::profiles
