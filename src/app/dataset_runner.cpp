#include <specsynth/app/dataset_runner.hpp>
#include <specsynth/core/error.hpp>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace specsynth::app {

namespace {

using core::SynthError;

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

core::FrameGeometry geometry_from_config(const DatasetConfig& cfg) {
  core::FrameGeometry g;
  g.fchans = cfg.fchans;
  g.tchans = cfg.tchans;
  g.df = core::units::Frequency(cfg.df, cfg.df_unit);
  g.dt = core::units::Duration(cfg.dt, cfg.dt_unit);
  g.fch1 = core::units::Frequency(cfg.fch1, cfg.fch1_unit);
  return g;
}

std::expected<LabeledFrame, core::SynthError> generate_frame(const DatasetConfig& cfg,
                                                             std::uint64_t frame_id) {
  auto frame = core::Frame::create(geometry_from_config(cfg));
  if (!frame) {
    return std::unexpected(frame.error());
  }

  LabeledFrame out;
  out.frame_id = frame_id;
  out.frame = std::move(*frame);
  core::Frame& f = out.frame;
  f.seed(cfg.seed + frame_id);
  f.add_metadata({{"frame_id", frame_id}, {"seed", cfg.seed + frame_id}});

  auto noise = f.add_noise(cfg.noise_mean, cfg.noise_std, cfg.noise_min);
  if (!noise) {
    return std::unexpected(noise.error());
  }

  const int fchans = static_cast<int>(f.fchans());
  const int margin = 2 * cfg.edge_margin < f.fchans() ? static_cast<int>(cfg.edge_margin) : 0;
  cv::RNG& rng = f.rng();
  for (std::size_t i = 0; i < cfg.signals_per_frame; ++i) {
    SignalLabel label;
    label.start_index = static_cast<std::size_t>(rng.uniform(margin, fchans - margin));
    label.f_start_hz = f.get_frequency(static_cast<std::ptrdiff_t>(label.start_index));
    label.drift_rate_hz_s = rng.uniform(cfg.drift_rate_min, cfg.drift_rate_max);
    label.snr = rng.uniform(cfg.snr_min, cfg.snr_max);
    label.width_hz = rng.uniform(cfg.width_min, cfg.width_max);
    label.f_profile_type = cfg.f_profile_type;

    auto level = f.intensity_from_snr(label.snr);
    if (!level) {
      return std::unexpected(level.error());
    }
    label.level = *level;

    auto signal = f.add_constant_signal(label.f_start_hz,
                                        label.drift_rate_hz_s,
                                        label.level,
                                        label.width_hz,
                                        label.f_profile_type);
    if (!signal) {
      return std::unexpected(signal.error());
    }
    out.labels.push_back(std::move(label));
  }
  return out;
}

std::expected<std::size_t, core::SynthError> generate_dataset(const DatasetConfig& cfg,
                                                              const LabeledFrameCallback& callback) {
  if (auto valid = validate_config(cfg); !valid) {
    return std::unexpected(valid.error());
  }
  for (std::size_t i = 0; i < cfg.num_frames; ++i) {
    auto result = generate_frame(cfg, i);
    if (!result) {
      return std::unexpected(result.error());
    }
    if (callback) callback(*result);
  }
  return cfg.num_frames;
}

std::expected<std::size_t, core::SynthError> generate_dataset_parallel(
    const DatasetConfig& cfg,
    const LabeledFrameCallback& callback,
    std::size_t num_workers) {
  if (auto valid = validate_config(cfg); !valid) {
    return std::unexpected(valid.error());
  }
  const std::size_t n = cfg.num_frames;
  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    return generate_dataset(cfg, callback);
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }

  std::mutex queue_mutex;
  std::mutex error_mutex;
  std::optional<SynthError> first_error;
  std::atomic<bool> failed{false};

  auto worker = [&]() {
    while (!failed.load()) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }

      auto result = generate_frame(cfg, idx);
      if (!result) {
        std::lock_guard lock(error_mutex);
        if (!first_error) first_error = result.error();
        failed = true;
        break;
      }
      if (callback) callback(*result);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }

  if (first_error) {
    return std::unexpected(*first_error);
  }
  return n;
}

}  // namespace specsynth::app
