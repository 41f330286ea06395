#pragma once

#include <specsynth/core/error.hpp>
#include <specsynth/core/units.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace specsynth::app {

/// Dataset generation configuration: frame geometry, noise, signal ranges.
struct DatasetConfig {
  std::size_t fchans{1024};
  std::size_t tchans{32};
  double df{2.7939677238464355};
  core::units::FrequencyUnit df_unit{core::units::FrequencyUnit::Hz};
  double dt{18.253611008};
  core::units::TimeUnit dt_unit{core::units::TimeUnit::s};
  double fch1{6095.214842353016};
  core::units::FrequencyUnit fch1_unit{core::units::FrequencyUnit::MHz};

  double noise_mean{5.0};
  double noise_std{2.0};
  std::optional<double> noise_min{0.0};  // truncation point; nullopt = plain Gaussian

  std::size_t num_frames{10};
  std::size_t signals_per_frame{1};
  double snr_min{10.0};
  double snr_max{50.0};
  double drift_rate_min{-0.01};  // Hz/s
  double drift_rate_max{0.01};   // Hz/s
  double width_min{10.0};        // Hz
  double width_max{50.0};        // Hz
  std::string f_profile_type{"gaussian"};
  std::size_t edge_margin{64};   // columns kept free of signal starts at each edge

  std::uint64_t seed{1};
  std::string output_dir{"output"};
};

/// Load config from a simple key=value file (one per line, '#' comments).
/// Unknown keys are ignored; unparsable values give InvalidConfig; an
/// unreadable file gives LoadFailed. The result is not validated.
[[nodiscard]] std::expected<DatasetConfig, core::SynthError> load_config(const std::string& path);

/// Default config when no file is provided.
[[nodiscard]] DatasetConfig default_config();

/// InvalidConfig for non-positive geometry, inverted ranges, negative widths,
/// a profile type outside box|gaussian|lorentzian|voigt, or signals requested
/// without noise to calibrate their SNR against.
[[nodiscard]] std::expected<void, core::SynthError> validate_config(const DatasetConfig& cfg);

}  // namespace specsynth::app
