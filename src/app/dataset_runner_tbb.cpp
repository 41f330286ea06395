#include <specsynth/app/dataset_runner_tbb.hpp>

#ifdef SPECSYNTH_HAS_TBB

#include <specsynth/core/error.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>

namespace specsynth::app {

std::expected<std::size_t, core::SynthError> generate_dataset_tbb(
    const DatasetConfig& cfg,
    const LabeledFrameCallback& callback) {
  if (auto valid = validate_config(cfg); !valid) {
    return std::unexpected(valid.error());
  }
  const std::size_t n = cfg.num_frames;
  if (n == 0) return std::size_t{0};

  std::mutex error_mutex;
  std::optional<core::SynthError> first_error;
  std::atomic<bool> failed{false};

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          if (failed.load()) return;
          auto result = generate_frame(cfg, i);
          if (!result) {
            std::lock_guard lock(error_mutex);
            if (!first_error) first_error = result.error();
            failed = true;
            return;
          }
          if (callback) callback(*result);
        }
      });

  if (first_error) {
    return std::unexpected(*first_error);
  }
  return n;
}

}  // namespace specsynth::app

#endif  // SPECSYNTH_HAS_TBB
