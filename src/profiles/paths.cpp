#include <specsynth/profiles/paths.hpp>
#include <cmath>
#include <numbers>

namespace specsynth::profiles {

core::ScalarFunction constant_path(core::units::Frequency f_start,
                                   core::units::DriftRate drift_rate) {
  const double f0 = f_start.hz();
  const double rate = drift_rate.hz_per_s();
  return [f0, rate](double t) { return f0 + rate * t; };
}

core::ScalarFunction squared_path(core::units::Frequency f_start,
                                  core::units::DriftRate drift_rate) {
  const double f0 = f_start.hz();
  const double rate = drift_rate.hz_per_s();
  return [f0, rate](double t) { return f0 + 0.5 * rate * t * t; };
}

core::ScalarFunction sine_path(core::units::Frequency f_start,
                               core::units::DriftRate drift_rate,
                               core::units::Duration period,
                               core::units::Frequency amplitude) {
  const double f0 = f_start.hz();
  const double rate = drift_rate.hz_per_s();
  const double p = period.seconds();
  const double a = amplitude.hz();
  return [f0, rate, p, a](double t) {
    return f0 + rate * t + a * std::sin(2.0 * std::numbers::pi * t / p);
  };
}

}  // namespace specsynth::profiles
