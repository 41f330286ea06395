#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace specsynth::core::units {

/// Units accepted at the API boundary. Everything is stored in Hz and seconds.
enum class FrequencyUnit : std::uint8_t {
  Hz,
  kHz,
  MHz,
  GHz,
};

enum class TimeUnit : std::uint8_t {
  s,
  ms,
  us,
  min,
  h,
};

[[nodiscard]] double to_hz(double value, FrequencyUnit unit) noexcept;
[[nodiscard]] double to_seconds(double value, TimeUnit unit) noexcept;

/// Parse unit names as written in config files ("MHz", "ms", ...). Case-sensitive.
[[nodiscard]] std::optional<FrequencyUnit> parse_frequency_unit(std::string_view name);
[[nodiscard]] std::optional<TimeUnit> parse_time_unit(std::string_view name);

/// Frequency value with its unit; a bare double is taken as Hz.
struct Frequency {
  double value{0.0};
  FrequencyUnit unit{FrequencyUnit::Hz};

  Frequency() = default;
  Frequency(double v, FrequencyUnit u = FrequencyUnit::Hz) : value(v), unit(u) {}

  [[nodiscard]] double hz() const noexcept { return to_hz(value, unit); }
};

/// Duration value with its unit; a bare double is taken as seconds.
struct Duration {
  double value{0.0};
  TimeUnit unit{TimeUnit::s};

  Duration() = default;
  Duration(double v, TimeUnit u = TimeUnit::s) : value(v), unit(u) {}

  [[nodiscard]] double seconds() const noexcept { return to_seconds(value, unit); }
};

/// Drift rate (frequency per time); a bare double is taken as Hz/s.
struct DriftRate {
  double value{0.0};
  FrequencyUnit frequency_unit{FrequencyUnit::Hz};
  TimeUnit time_unit{TimeUnit::s};

  DriftRate() = default;
  DriftRate(double v,
            FrequencyUnit fu = FrequencyUnit::Hz,
            TimeUnit tu = TimeUnit::s)
      : value(v), frequency_unit(fu), time_unit(tu) {}

  [[nodiscard]] double hz_per_s() const noexcept {
    return to_hz(value, frequency_unit) / to_seconds(1.0, time_unit);
  }
};

}  // namespace specsynth::core::units
