#include <specsynth/core/axes.hpp>
#include <cstddef>
#include <vector>

namespace specsynth::core {

std::vector<double> derive_frequency_axis(double fmax, std::size_t fchans, double df) {
  const double fmin = fmax - static_cast<double>(fchans) * df;
  std::vector<double> fs(fchans);
  for (std::size_t i = 0; i < fchans; ++i) {
    fs[i] = fmin + static_cast<double>(i) * df;
  }
  return fs;
}

std::vector<double> derive_time_axis(std::size_t tchans, double dt) {
  std::vector<double> ts(tchans);
  for (std::size_t j = 0; j < tchans; ++j) {
    ts[j] = static_cast<double>(j) * dt;
  }
  return ts;
}

}  // namespace specsynth::core
