#include <specsynth/core/units.hpp>

namespace specsynth::core::units {

double to_hz(double value, FrequencyUnit unit) noexcept {
  switch (unit) {
    case FrequencyUnit::kHz:
      return value * 1e3;
    case FrequencyUnit::MHz:
      return value * 1e6;
    case FrequencyUnit::GHz:
      return value * 1e9;
    case FrequencyUnit::Hz:
    default:
      return value;
  }
}

double to_seconds(double value, TimeUnit unit) noexcept {
  switch (unit) {
    case TimeUnit::ms:
      return value * 1e-3;
    case TimeUnit::us:
      return value * 1e-6;
    case TimeUnit::min:
      return value * 60.0;
    case TimeUnit::h:
      return value * 3600.0;
    case TimeUnit::s:
    default:
      return value;
  }
}

std::optional<FrequencyUnit> parse_frequency_unit(std::string_view name) {
  if (name == "Hz") return FrequencyUnit::Hz;
  if (name == "kHz") return FrequencyUnit::kHz;
  if (name == "MHz") return FrequencyUnit::MHz;
  if (name == "GHz") return FrequencyUnit::GHz;
  return std::nullopt;
}

std::optional<TimeUnit> parse_time_unit(std::string_view name) {
  if (name == "s") return TimeUnit::s;
  if (name == "ms") return TimeUnit::ms;
  if (name == "us") return TimeUnit::us;
  if (name == "min") return TimeUnit::min;
  if (name == "h") return TimeUnit::h;
  return std::nullopt;
}

}  // namespace specsynth::core::units
