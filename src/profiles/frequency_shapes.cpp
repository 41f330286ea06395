#include <specsynth/profiles/frequency_shapes.hpp>
#include <specsynth/core/error.hpp>
#include <cmath>
#include <complex>
#include <numbers>

namespace specsynth::profiles {

namespace {

core::FrequencyShape delta_f_profile(double level) {
  return [level](double f, double f_center) { return f == f_center ? level : 0.0; };
}

}  // namespace

std::expected<FrequencyProfileType, core::SynthError> parse_frequency_profile_type(
    std::string_view name) {
  if (name == "box") return FrequencyProfileType::Box;
  if (name == "gaussian") return FrequencyProfileType::Gaussian;
  if (name == "lorentzian") return FrequencyProfileType::Lorentzian;
  if (name == "voigt") return FrequencyProfileType::Voigt;
  return std::unexpected(core::SynthError::UnsupportedProfile);
}

std::string_view to_string(FrequencyProfileType type) noexcept {
  switch (type) {
    case FrequencyProfileType::Box:
      return "box";
    case FrequencyProfileType::Gaussian:
      return "gaussian";
    case FrequencyProfileType::Lorentzian:
      return "lorentzian";
    case FrequencyProfileType::Voigt:
      return "voigt";
  }
  return "unknown";
}

core::FrequencyShape box_f_profile(core::units::Frequency width, double level) {
  const double half = 0.5 * std::abs(width.hz());
  return [half, level](double f, double f_center) {
    return std::abs(f - f_center) <= half ? level : 0.0;
  };
}

core::FrequencyShape gaussian_f_profile(core::units::Frequency width, double level) {
  const double fwhm = std::abs(width.hz());
  if (fwhm == 0.0) return delta_f_profile(level);
  const double sigma = fwhm / (2.0 * std::sqrt(2.0 * std::numbers::ln2));
  const double inv_two_var = 1.0 / (2.0 * sigma * sigma);
  return [inv_two_var, level](double f, double f_center) {
    const double d = f - f_center;
    return level * std::exp(-d * d * inv_two_var);
  };
}

core::FrequencyShape lorentzian_f_profile(core::units::Frequency width, double level) {
  const double fwhm = std::abs(width.hz());
  if (fwhm == 0.0) return delta_f_profile(level);
  const double gamma_sq = 0.25 * fwhm * fwhm;
  return [gamma_sq, level](double f, double f_center) {
    const double d = f - f_center;
    return level * gamma_sq / (d * d + gamma_sq);
  };
}

core::FrequencyShape voigt_f_profile(core::units::Frequency g_width,
                                     core::units::Frequency l_width,
                                     double level) {
  const double g = std::abs(g_width.hz());
  const double l = std::abs(l_width.hz());
  if (g == 0.0) return lorentzian_f_profile(l, level);
  if (l == 0.0) return gaussian_f_profile(g, level);

  const double sigma = g / (2.0 * std::sqrt(2.0 * std::numbers::ln2));
  const double scale = 1.0 / (sigma * std::numbers::sqrt2);
  const double y = 0.5 * l * scale;
  const double peak = faddeeva({0.0, y}).real();
  return [scale, y, peak, level](double f, double f_center) {
    return level * faddeeva({(f - f_center) * scale, y}).real() / peak;
  };
}

std::expected<core::FrequencyShape, core::SynthError> frequency_shape_by_name(
    std::string_view type,
    core::units::Frequency width,
    double level) {
  const auto parsed = parse_frequency_profile_type(type);
  if (!parsed) {
    return std::unexpected(parsed.error());
  }
  switch (*parsed) {
    case FrequencyProfileType::Box:
      return box_f_profile(width, level);
    case FrequencyProfileType::Gaussian:
      return gaussian_f_profile(width, level);
    case FrequencyProfileType::Lorentzian:
      return lorentzian_f_profile(width, level);
    case FrequencyProfileType::Voigt:
      return voigt_f_profile(width, width, level);
  }
  return std::unexpected(core::SynthError::UnsupportedProfile);
}

std::complex<double> faddeeva(std::complex<double> z) {
  const double x = z.real();
  const double y = z.imag();
  const std::complex<double> t(y, -x);
  const double s = std::abs(x) + y;

  if (s >= 15.0) {
    return t * 0.5641896 / (0.5 + t * t);
  }
  if (s >= 5.5) {
    const std::complex<double> u = t * t;
    return t * (1.410474 + u * 0.5641896) / (0.75 + u * (3.0 + u));
  }
  if (y >= 0.195 * std::abs(x) - 0.176) {
    return (16.4955 + t * (20.20933 + t * (11.96482 + t * (3.778987 + t * 0.5642236)))) /
           (16.4955 +
            t * (38.82363 + t * (39.27121 + t * (21.69274 + t * (6.699398 + t)))));
  }
  const std::complex<double> u = t * t;
  const std::complex<double> num =
      36183.31 -
      u * (3321.9905 -
           u * (1540.787 - u * (219.0313 - u * (35.76683 - u * (1.320522 - u * 0.56419)))));
  const std::complex<double> den =
      32066.6 -
      u * (24322.84 -
           u * (9022.228 -
                u * (2186.181 - u * (364.2191 - u * (61.57037 - u * (1.841439 - u))))));
  return std::exp(u) - t * num / den;
}

}  // namespace specsynth::profiles
