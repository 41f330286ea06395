#pragma once

#include <specsynth/core/error.hpp>
#include <specsynth/core/noise.hpp>
#include <specsynth/core/noise_stats.hpp>
#include <specsynth/core/profile.hpp>
#include <specsynth/core/signal_options.hpp>
#include <specsynth/core/units.hpp>
#include <opencv2/core.hpp>
#include <any>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace specsynth::core {

/// Memory: Frame owns its grid (cv::Mat, CV_64FC1, tchans x fchans) exclusively;
/// copies of a Frame deep-copy the grid.
/// Thread-safety: distinct Frame instances are independent; every mutating
/// call is a read-modify-write of the grid and noise estimate, so sharing one
/// Frame across threads requires external synchronization.

/// Explicit geometry for a blank (or caller-filled) frame.
struct FrameGeometry {
  std::size_t fchans{0};
  std::size_t tchans{0};
  units::Frequency df;
  units::Duration dt;
  /// Reference maximum frequency (top edge of the band).
  units::Frequency fch1;
};

/// Raw grid plus resolutions, as exchanged with file loaders and writers.
struct GridRecord {
  cv::Mat data;
  units::Frequency df;
  units::Duration dt;
  units::Frequency fmax;
};

/// Opaque user key-value store; never read by the engine.
using MetadataMap = std::unordered_map<std::string, std::any>;

/// Time-frequency intensity grid with its axes, noise estimate and metadata.
class Frame {
 public:
  Frame() = default;
  Frame(const Frame& other);
  Frame& operator=(const Frame& other);
  Frame(Frame&&) = default;
  Frame& operator=(Frame&&) = default;

  /// Blank frame (zeros), or `data` if given; data must be tchans x fchans.
  [[nodiscard]] static std::expected<Frame, SynthError> create(
      const FrameGeometry& geometry,
      const cv::Mat& data = cv::Mat());

  /// Frame around a loaded grid; shape gives (tchans, fchans).
  [[nodiscard]] static std::expected<Frame, SynthError> from_record(
      const GridRecord& record);

  /// Grid (shared with this frame) plus canonical resolutions.
  [[nodiscard]] GridRecord to_record() const;

  [[nodiscard]] std::size_t fchans() const noexcept { return fchans_; }
  [[nodiscard]] std::size_t tchans() const noexcept { return tchans_; }
  [[nodiscard]] double df() const noexcept { return df_; }
  [[nodiscard]] double dt() const noexcept { return dt_; }
  [[nodiscard]] double fmax() const noexcept { return fmax_; }
  [[nodiscard]] double fmin() const noexcept { return fmin_; }

  [[nodiscard]] const std::vector<double>& fs() const noexcept { return fs_; }
  [[nodiscard]] const std::vector<double>& ts() const noexcept { return ts_; }

  [[nodiscard]] const cv::Mat& data() const noexcept { return data_; }

  /// Header sharing this frame's buffer, for in-place additive updates.
  /// Reassigning the returned header does not affect the frame.
  [[nodiscard]] cv::Mat mutable_data() noexcept { return data_; }

  /// Copy of the grid; 10*log10(x) per sample when use_db.
  [[nodiscard]] cv::Mat get_data(bool use_db = false) const;

  /// Nearest column for a frequency (round half to even). Not clamped to the
  /// grid; saturates at +/-2^53 and maps NaN to 0.
  [[nodiscard]] std::ptrdiff_t get_index(units::Frequency frequency) const;

  /// get_index as a double: exact for any finite frequency, +/-inf and NaN
  /// pass through. Use this when the result is clamped to the grid afterwards.
  [[nodiscard]] double column_position(units::Frequency frequency) const;

  /// Center frequency of a column: fmin + index*df.
  [[nodiscard]] double get_frequency(std::ptrdiff_t index) const noexcept;

  /// Replaces the grid; (tchans, fchans) and both axes follow the new shape.
  [[nodiscard]] std::expected<void, SynthError> set_data(const cv::Mat& data);

  [[nodiscard]] std::expected<void, SynthError> set_df(units::Frequency df);
  [[nodiscard]] std::expected<void, SynthError> set_dt(units::Duration dt);
  [[nodiscard]] std::expected<void, SynthError> set_fmax(units::Frequency fmax);

  // Noise

  [[nodiscard]] bool has_noise() const noexcept { return noise_.has_noise(); }
  [[nodiscard]] double noise_mean() const noexcept { return noise_.mean(); }
  [[nodiscard]] double noise_std() const noexcept { return noise_.stddev(); }

  /// Adds Gaussian noise (left-truncated at `min` if given); returns the draw.
  [[nodiscard]] std::expected<cv::Mat, SynthError> add_noise(
      double mean,
      double stddev,
      std::optional<double> min = std::nullopt);

  /// Adds noise with parameters chosen from observed candidate arrays.
  [[nodiscard]] std::expected<cv::Mat, SynthError> add_noise_from_obs(
      std::span<const double> means,
      std::span<const double> stds,
      std::span<const double> mins = {},
      const ObsNoiseOptions& options = {});

  /// Re-estimates noise from the current grid (e.g. after loading observed data).
  void update_noise_stats();

  [[nodiscard]] std::expected<double, SynthError> intensity_from_snr(double snr) const;
  [[nodiscard]] std::expected<double, SynthError> snr_from_intensity(double intensity) const;

  // Signals

  /// See compose_signal.
  [[nodiscard]] std::expected<cv::Mat, SynthError> add_signal(
      const Profile& path,
      const Profile& t_profile,
      const FrequencyShape& f_profile,
      const Profile& bp_profile,
      const CompositionOptions& options = {});

  /// Constant drift, constant intensity signal, computed only inside its
  /// bounding window. f_profile_type: box | gaussian | lorentzian | voigt.
  [[nodiscard]] std::expected<cv::Mat, SynthError> add_constant_signal(
      units::Frequency f_start,
      units::DriftRate drift_rate,
      double level,
      units::Frequency width,
      std::string_view f_profile_type = "gaussian");

  // Metadata

  [[nodiscard]] const MetadataMap& get_metadata() const noexcept { return metadata_; }
  void set_metadata(MetadataMap metadata) { metadata_ = std::move(metadata); }
  /// Merges `metadata` in; existing keys are overwritten.
  void add_metadata(const MetadataMap& metadata);

  /// Generator used for every noise draw on this frame.
  [[nodiscard]] cv::RNG& rng() noexcept { return rng_; }
  void seed(std::uint64_t seed) { rng_ = cv::RNG(seed); }

 private:
  /// Rebuilds fmin, fs and ts from df, dt, fmax and the grid shape.
  void refresh_axes();

  std::size_t fchans_{0};
  std::size_t tchans_{0};
  double df_{0.0};
  double dt_{0.0};
  double fmax_{0.0};
  double fmin_{0.0};
  std::vector<double> fs_;
  std::vector<double> ts_;
  cv::Mat data_;
  NoiseTracker noise_;
  MetadataMap metadata_;
  cv::RNG rng_;
};

}  // namespace specsynth::core
