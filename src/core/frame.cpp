#include <specsynth/core/frame.hpp>
#include <specsynth/core/axes.hpp>
#include <specsynth/core/bounding_box.hpp>
#include <specsynth/core/compositor.hpp>
#include <specsynth/core/error.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

namespace specsynth::core {

namespace {

/// 2^53: every integer up to here is exact in a double and fits a ptrdiff_t.
constexpr double kMaxExactIndex = 9007199254740992.0;

bool valid_resolution(double value) {
  return std::isfinite(value) && value != 0.0;
}

/// Single-channel CV_64F copy of `data`, or an empty Mat if it cannot be one.
cv::Mat as_grid(const cv::Mat& data) {
  if (data.empty() || data.dims != 2 || data.channels() != 1) return cv::Mat();
  cv::Mat grid;
  data.convertTo(grid, CV_64FC1);
  return grid;
}

}  // namespace

Frame::Frame(const Frame& other)
    : fchans_(other.fchans_),
      tchans_(other.tchans_),
      df_(other.df_),
      dt_(other.dt_),
      fmax_(other.fmax_),
      fmin_(other.fmin_),
      fs_(other.fs_),
      ts_(other.ts_),
      data_(other.data_.clone()),
      noise_(other.noise_),
      metadata_(other.metadata_),
      rng_(other.rng_) {}

Frame& Frame::operator=(const Frame& other) {
  if (this != &other) {
    Frame copy(other);
    *this = std::move(copy);
  }
  return *this;
}

std::expected<Frame, SynthError> Frame::create(const FrameGeometry& geometry,
                                               const cv::Mat& data) {
  const double df = geometry.df.hz();
  const double dt = geometry.dt.seconds();
  const double fmax = geometry.fch1.hz();
  if (geometry.fchans == 0 || geometry.tchans == 0 || !valid_resolution(df) ||
      !valid_resolution(dt) || dt < 0.0 || !std::isfinite(fmax)) {
    return std::unexpected(SynthError::InvalidGeometry);
  }

  Frame frame;
  frame.fchans_ = geometry.fchans;
  frame.tchans_ = geometry.tchans;
  frame.df_ = std::abs(df);
  frame.dt_ = dt;
  frame.fmax_ = fmax;

  const int rows = static_cast<int>(geometry.tchans);
  const int cols = static_cast<int>(geometry.fchans);
  if (data.empty()) {
    frame.data_ = cv::Mat::zeros(rows, cols, CV_64FC1);
  } else {
    cv::Mat grid = as_grid(data);
    if (grid.empty() || grid.rows != rows || grid.cols != cols) {
      return std::unexpected(SynthError::ShapeMismatch);
    }
    frame.data_ = std::move(grid);
  }
  frame.refresh_axes();
  return frame;
}

std::expected<Frame, SynthError> Frame::from_record(const GridRecord& record) {
  cv::Mat grid = as_grid(record.data);
  if (grid.empty()) {
    return std::unexpected(SynthError::InvalidGeometry);
  }
  FrameGeometry geometry;
  geometry.fchans = static_cast<std::size_t>(grid.cols);
  geometry.tchans = static_cast<std::size_t>(grid.rows);
  geometry.df = record.df;
  geometry.dt = record.dt;
  geometry.fch1 = record.fmax;
  return create(geometry, grid);
}

GridRecord Frame::to_record() const {
  GridRecord record;
  record.data = data_;
  record.df = df_;
  record.dt = dt_;
  record.fmax = fmax_;
  return record;
}

void Frame::refresh_axes() {
  fchans_ = static_cast<std::size_t>(data_.cols);
  tchans_ = static_cast<std::size_t>(data_.rows);
  fmin_ = fmax_ - static_cast<double>(fchans_) * df_;
  fs_ = derive_frequency_axis(fmax_, fchans_, df_);
  ts_ = derive_time_axis(tchans_, dt_);
}

cv::Mat Frame::get_data(bool use_db) const {
  cv::Mat out = data_.clone();
  if (!use_db) return out;
  for (int r = 0; r < out.rows; ++r) {
    auto* row = out.ptr<double>(r);
    for (int c = 0; c < out.cols; ++c) {
      row[c] = 10.0 * std::log10(row[c]);
    }
  }
  return out;
}

double Frame::column_position(units::Frequency frequency) const {
  if (df_ == 0.0) return 0.0;
  return std::nearbyint((frequency.hz() - fmin_) / df_);
}

std::ptrdiff_t Frame::get_index(units::Frequency frequency) const {
  const double position = column_position(frequency);
  if (std::isnan(position)) return 0;
  return static_cast<std::ptrdiff_t>(std::clamp(position, -kMaxExactIndex, kMaxExactIndex));
}

double Frame::get_frequency(std::ptrdiff_t index) const noexcept {
  return fmin_ + static_cast<double>(index) * df_;
}

std::expected<void, SynthError> Frame::set_data(const cv::Mat& data) {
  cv::Mat grid = as_grid(data);
  if (grid.empty()) {
    return std::unexpected(SynthError::InvalidGeometry);
  }
  data_ = std::move(grid);
  refresh_axes();
  return {};
}

std::expected<void, SynthError> Frame::set_df(units::Frequency df) {
  const double value = df.hz();
  if (!valid_resolution(value)) {
    return std::unexpected(SynthError::InvalidGeometry);
  }
  df_ = std::abs(value);
  refresh_axes();
  return {};
}

std::expected<void, SynthError> Frame::set_dt(units::Duration dt) {
  const double value = dt.seconds();
  if (!valid_resolution(value) || value < 0.0) {
    return std::unexpected(SynthError::InvalidGeometry);
  }
  dt_ = value;
  refresh_axes();
  return {};
}

std::expected<void, SynthError> Frame::set_fmax(units::Frequency fmax) {
  const double value = fmax.hz();
  if (!std::isfinite(value)) {
    return std::unexpected(SynthError::InvalidGeometry);
  }
  fmax_ = value;
  refresh_axes();
  return {};
}

std::expected<cv::Mat, SynthError> Frame::add_noise(double mean,
                                                    double stddev,
                                                    std::optional<double> min) {
  auto noise = draw_noise(rng_, data_.size(), NoiseParams{mean, stddev, min});
  if (!noise) {
    return std::unexpected(noise.error());
  }
  data_ += *noise;
  noise_.record_injection(mean, stddev, data_);
  return noise;
}

std::expected<cv::Mat, SynthError> Frame::add_noise_from_obs(std::span<const double> means,
                                                             std::span<const double> stds,
                                                             std::span<const double> mins,
                                                             const ObsNoiseOptions& options) {
  auto params = select_obs_noise_params(means, stds, mins, options, dt_, rng_);
  if (!params) {
    return std::unexpected(params.error());
  }
  return add_noise(params->mean, params->stddev, params->min);
}

void Frame::update_noise_stats() {
  noise_.recompute(data_);
}

std::expected<double, SynthError> Frame::intensity_from_snr(double snr) const {
  if (!noise_.has_noise() || noise_.stddev() == 0.0) {
    return std::unexpected(SynthError::NoNoisePresent);
  }
  return snr * noise_.stddev() / std::sqrt(static_cast<double>(tchans_));
}

std::expected<double, SynthError> Frame::snr_from_intensity(double intensity) const {
  if (!noise_.has_noise() || noise_.stddev() == 0.0) {
    return std::unexpected(SynthError::NoNoisePresent);
  }
  return intensity * std::sqrt(static_cast<double>(tchans_)) / noise_.stddev();
}

std::expected<cv::Mat, SynthError> Frame::add_signal(const Profile& path,
                                                     const Profile& t_profile,
                                                     const FrequencyShape& f_profile,
                                                     const Profile& bp_profile,
                                                     const CompositionOptions& options) {
  return compose_signal(*this, path, t_profile, f_profile, bp_profile, options);
}

std::expected<cv::Mat, SynthError> Frame::add_constant_signal(units::Frequency f_start,
                                                              units::DriftRate drift_rate,
                                                              double level,
                                                              units::Frequency width,
                                                              std::string_view f_profile_type) {
  return core::add_constant_signal(*this, f_start, drift_rate, level, width, f_profile_type);
}

void Frame::add_metadata(const MetadataMap& metadata) {
  for (const auto& [key, value] : metadata) {
    metadata_.insert_or_assign(key, value);
  }
}

}  // namespace specsynth::core
