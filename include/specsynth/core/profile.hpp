#pragma once

#include <specsynth/core/error.hpp>
#include <concepts>
#include <cstddef>
#include <expected>
#include <functional>
#include <span>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace specsynth::core {

/// Intensity (or frequency, for paths) as a function of one coordinate.
using ScalarFunction = std::function<double(double)>;

/// Spectral shape: intensity at frequency f for a signal centered at f_center.
using FrequencyShape = std::function<double(double f, double f_center)>;

/// Profile argument: a callable, a fixed per-sample array, or a constant.
/// Stateless; the same Profile may be resolved against any number of frames.
/// A default-constructed Profile holds nothing and fails to resolve.
class Profile {
 public:
  Profile() = default;

  template <typename F>
    requires std::is_invocable_r_v<double, F, double> &&
             (!std::same_as<std::remove_cvref_t<F>, Profile>)
  Profile(F fn) : value_(ScalarFunction(std::move(fn))) {}

  Profile(std::vector<double> values) : value_(std::move(values)) {}

  Profile(double constant) : value_(constant) {}

  [[nodiscard]] bool is_callable() const noexcept {
    return std::holds_alternative<ScalarFunction>(value_);
  }
  [[nodiscard]] bool is_array() const noexcept {
    return std::holds_alternative<std::vector<double>>(value_);
  }
  [[nodiscard]] bool is_constant() const noexcept {
    return std::holds_alternative<double>(value_);
  }

  /// One value per coordinate. Arrays must match coords.size() exactly.
  [[nodiscard]] std::expected<std::vector<double>, SynthError> resolve(
      std::span<const double> coords) const;

  /// Interval mean per coordinate by midpoint Riemann sum: sample i covers
  /// [coords[i] + offset, coords[i] + offset + step], split into `subsamples`
  /// pieces. Only callables are integrated; arrays and constants resolve as-is.
  [[nodiscard]] std::expected<std::vector<double>, SynthError> resolve_integrated(
      std::span<const double> coords,
      double step,
      int subsamples,
      double offset = 0.0) const;

 private:
  std::variant<std::monostate, ScalarFunction, std::vector<double>, double> value_;
};

/// Expands each coordinate into `subsamples` midpoint sub-points of
/// [c + offset, c + offset + step]. Output size is coords.size() * subsamples.
[[nodiscard]] std::vector<double> subsample_axis(std::span<const double> coords,
                                                 double step,
                                                 int subsamples,
                                                 double offset = 0.0);

/// Averages consecutive groups of `group` values. values.size() must be a multiple of group.
[[nodiscard]] std::vector<double> average_groups(std::span<const double> values,
                                                 std::size_t group);

}  // namespace specsynth::core
