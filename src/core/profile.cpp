#include <specsynth/core/profile.hpp>
#include <specsynth/core/error.hpp>
#include <cstddef>
#include <vector>

namespace specsynth::core {

std::vector<double> subsample_axis(std::span<const double> coords,
                                   double step,
                                   int subsamples,
                                   double offset) {
  const auto n = static_cast<std::size_t>(subsamples);
  const double sub_step = step / static_cast<double>(subsamples);
  std::vector<double> out;
  out.reserve(coords.size() * n);
  for (const double c : coords) {
    const double start = c + offset;
    for (std::size_t k = 0; k < n; ++k) {
      out.push_back(start + (static_cast<double>(k) + 0.5) * sub_step);
    }
  }
  return out;
}

std::vector<double> average_groups(std::span<const double> values, std::size_t group) {
  std::vector<double> out;
  if (group == 0) return out;
  out.reserve(values.size() / group);
  for (std::size_t i = 0; i + group <= values.size(); i += group) {
    double sum = 0.0;
    for (std::size_t k = 0; k < group; ++k) {
      sum += values[i + k];
    }
    out.push_back(sum / static_cast<double>(group));
  }
  return out;
}

std::expected<std::vector<double>, SynthError> Profile::resolve(
    std::span<const double> coords) const {
  if (const auto* fn = std::get_if<ScalarFunction>(&value_)) {
    if (!*fn) {
      return std::unexpected(SynthError::UnsupportedProfileType);
    }
    std::vector<double> out;
    out.reserve(coords.size());
    for (const double c : coords) {
      out.push_back((*fn)(c));
    }
    return out;
  }
  if (const auto* values = std::get_if<std::vector<double>>(&value_)) {
    if (values->size() != coords.size()) {
      return std::unexpected(SynthError::ShapeMismatch);
    }
    return *values;
  }
  if (const auto* constant = std::get_if<double>(&value_)) {
    return std::vector<double>(coords.size(), *constant);
  }
  return std::unexpected(SynthError::UnsupportedProfileType);
}

std::expected<std::vector<double>, SynthError> Profile::resolve_integrated(
    std::span<const double> coords,
    double step,
    int subsamples,
    double offset) const {
  if (subsamples < 1) {
    return std::unexpected(SynthError::InvalidArgument);
  }
  if (!is_callable()) {
    return resolve(coords);
  }

  const std::vector<double> sub = subsample_axis(coords, step, subsamples, offset);
  auto values = resolve(sub);
  if (!values) {
    return std::unexpected(values.error());
  }
  return average_groups(*values, static_cast<std::size_t>(subsamples));
}

}  // namespace specsynth::core
