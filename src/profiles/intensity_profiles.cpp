#include <specsynth/profiles/intensity_profiles.hpp>
#include <cmath>
#include <numbers>

namespace specsynth::profiles {

core::ScalarFunction constant_t_profile(double level) {
  return [level](double) { return level; };
}

core::ScalarFunction sine_t_profile(core::units::Duration period,
                                    core::units::Duration phase,
                                    double amplitude,
                                    double level) {
  const double p = period.seconds();
  const double shift = phase.seconds();
  return [p, shift, amplitude, level](double t) {
    return level + amplitude * std::sin(2.0 * std::numbers::pi * (t + shift) / p);
  };
}

core::ScalarFunction constant_bp_profile(double level) {
  return [level](double) { return level; };
}

}  // namespace specsynth::profiles
