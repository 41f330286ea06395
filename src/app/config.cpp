#include <specsynth/app/config.hpp>
#include <specsynth/profiles/frequency_shapes.hpp>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace specsynth::app {

namespace {

using core::SynthError;

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

/// Applies one key. Throws std::logic_error (from stod/stoull) on bad numbers;
/// returns false for bad enumerated values.
bool apply(DatasetConfig& c, const std::string& key, const std::string& value) {
  if (key == "fchans") c.fchans = std::stoull(value);
  else if (key == "tchans") c.tchans = std::stoull(value);
  else if (key == "df") c.df = std::stod(value);
  else if (key == "dt") c.dt = std::stod(value);
  else if (key == "fch1") c.fch1 = std::stod(value);
  else if (key == "df_unit" || key == "fch1_unit") {
    const auto unit = core::units::parse_frequency_unit(value);
    if (!unit) return false;
    (key == "df_unit" ? c.df_unit : c.fch1_unit) = *unit;
  }
  else if (key == "dt_unit") {
    const auto unit = core::units::parse_time_unit(value);
    if (!unit) return false;
    c.dt_unit = *unit;
  }
  else if (key == "noise_mean") c.noise_mean = std::stod(value);
  else if (key == "noise_std") c.noise_std = std::stod(value);
  else if (key == "noise_min") {
    if (value == "none") c.noise_min.reset();
    else c.noise_min = std::stod(value);
  }
  else if (key == "num_frames") c.num_frames = std::stoull(value);
  else if (key == "signals_per_frame") c.signals_per_frame = std::stoull(value);
  else if (key == "snr_min") c.snr_min = std::stod(value);
  else if (key == "snr_max") c.snr_max = std::stod(value);
  else if (key == "drift_rate_min") c.drift_rate_min = std::stod(value);
  else if (key == "drift_rate_max") c.drift_rate_max = std::stod(value);
  else if (key == "width_min") c.width_min = std::stod(value);
  else if (key == "width_max") c.width_max = std::stod(value);
  else if (key == "f_profile_type") c.f_profile_type = value;
  else if (key == "edge_margin") c.edge_margin = std::stoull(value);
  else if (key == "seed") c.seed = std::stoull(value);
  else if (key == "output_dir") c.output_dir = value;
  return true;
}

bool valid_range(double lo, double hi) {
  return std::isfinite(lo) && std::isfinite(hi) && lo <= hi;
}

}  // namespace

DatasetConfig default_config() {
  return DatasetConfig{};
}

std::expected<DatasetConfig, core::SynthError> load_config(const std::string& path) {
  DatasetConfig c = default_config();
  std::ifstream f(path);
  if (!f) return std::unexpected(SynthError::LoadFailed);

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    try {
      if (!apply(c, key, value)) return std::unexpected(SynthError::InvalidConfig);
    } catch (const std::logic_error&) {
      return std::unexpected(SynthError::InvalidConfig);
    }
  }
  return c;
}

std::expected<void, core::SynthError> validate_config(const DatasetConfig& cfg) {
  if (cfg.fchans == 0 || cfg.tchans == 0) return std::unexpected(SynthError::InvalidConfig);
  if (!(std::isfinite(cfg.df) && cfg.df != 0.0)) return std::unexpected(SynthError::InvalidConfig);
  if (!(std::isfinite(cfg.dt) && cfg.dt > 0.0)) return std::unexpected(SynthError::InvalidConfig);
  if (!std::isfinite(cfg.fch1)) return std::unexpected(SynthError::InvalidConfig);
  if (!std::isfinite(cfg.noise_mean) || !(cfg.noise_std >= 0.0)) {
    return std::unexpected(SynthError::InvalidConfig);
  }
  if (cfg.signals_per_frame > 0 && cfg.noise_std == 0.0) {
    return std::unexpected(SynthError::InvalidConfig);
  }
  if (!valid_range(cfg.snr_min, cfg.snr_max) ||
      !valid_range(cfg.drift_rate_min, cfg.drift_rate_max) ||
      !valid_range(cfg.width_min, cfg.width_max) || cfg.width_min < 0.0) {
    return std::unexpected(SynthError::InvalidConfig);
  }
  if (!profiles::parse_frequency_profile_type(cfg.f_profile_type)) {
    return std::unexpected(SynthError::InvalidConfig);
  }
  if (cfg.output_dir.empty()) return std::unexpected(SynthError::InvalidConfig);
  return {};
}

}  // namespace specsynth::app
