/**
 * specsynth-cli: generate a labeled dataset of synthetic spectrogram frames.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/specsynth-cli/specsynth_cli [--config path] [--output dir] [--frames n]
 * Writes <output>/frame_<id>.yml.gz per frame and <output>/labels.csv for all injected signals.
 */

#include <specsynth/app/config.hpp>
#include <specsynth/app/dataset_runner.hpp>
#ifdef SPECSYNTH_HAS_TBB
#include <specsynth/app/dataset_runner_tbb.hpp>
#endif
#include <specsynth/core/error.hpp>
#include <specsynth/io/grid_store.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace {

std::string frame_file_name(std::uint64_t frame_id) {
  std::ostringstream name;
  name << "frame_" << std::setw(5) << std::setfill('0') << frame_id << ".yml.gz";
  return name.str();
}

void write_labels_csv(const std::filesystem::path &path,
                      std::vector<std::pair<std::uint64_t, specsynth::app::SignalLabel>> rows) {
  std::stable_sort(rows.begin(), rows.end(),
            [](const auto &a, const auto &b) { return a.first < b.first; });
  std::ofstream f(path);
  if (!f) {
    throw std::runtime_error("could not write " + path.string());
  }
  f << std::setprecision(17);
  f << "frame_id,start_index,f_start_hz,drift_rate_hz_s,snr,level,width_hz,f_profile_type\n";
  for (const auto &[frame_id, label] : rows) {
    f << frame_id << ',' << label.start_index << ',' << label.f_start_hz << ','
      << label.drift_rate_hz_s << ',' << label.snr << ',' << label.level << ','
      << label.width_hz << ',' << label.f_profile_type << '\n';
  }
}

} // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::string output_override;
  std::string frames_override;
  std::size_t workers = 1;
  bool use_tbb = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      output_override = argv[++i];
    } else if (arg == "--frames" && i + 1 < argc) {
      frames_override = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      try {
        workers = static_cast<std::size_t>(std::stoul(argv[++i]));
      } catch (const std::logic_error &) {
        std::cerr << "Invalid --workers value\n";
        return 1;
      }
    } else if (arg == "--tbb") {
      use_tbb = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: specsynth_cli [options]\n"
                << "  --config <path>   Dataset config (key=value file); default: built-in\n"
                << "  --output <dir>    Override output directory (default from config)\n"
                << "  --frames <n>      Override number of frames\n"
                << "  --workers <n>     Worker threads; 0 = hardware concurrency (default 1)\n"
                << "  --tbb             Use the TBB runner (when built with TBB)\n";
      return 0;
    }
  }

  specsynth::app::DatasetConfig cfg = specsynth::app::default_config();
  if (!config_path.empty()) {
    auto loaded = specsynth::app::load_config(config_path);
    if (!loaded) {
      std::cerr << "Failed to load config " << config_path << ": "
                << specsynth::core::to_string(loaded.error()) << "\n";
      return 1;
    }
    cfg = std::move(*loaded);
  }
  if (!output_override.empty()) {
    cfg.output_dir = output_override;
  }
  if (!frames_override.empty()) {
    try {
      cfg.num_frames = static_cast<std::size_t>(std::stoull(frames_override));
    } catch (const std::logic_error &) {
      std::cerr << "Invalid --frames value\n";
      return 1;
    }
  }
  if (auto valid = specsynth::app::validate_config(cfg); !valid) {
    std::cerr << "Invalid config: " << specsynth::core::to_string(valid.error()) << "\n";
    return 1;
  }

  const std::filesystem::path out_dir(cfg.output_dir);
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    std::cerr << "Cannot create output directory " << out_dir << ": " << ec.message() << "\n";
    return 1;
  }

  std::mutex mutex;
  std::vector<std::pair<std::uint64_t, specsynth::app::SignalLabel>> label_rows;
  std::size_t write_failures = 0;

  const specsynth::app::LabeledFrameCallback on_frame =
      [&](const specsynth::app::LabeledFrame &lf) {
        const auto path = out_dir / frame_file_name(lf.frame_id);
        auto saved = specsynth::io::save_grid_record(path.string(), lf.frame.to_record());
        std::lock_guard lock(mutex);
        if (!saved) {
          std::cerr << "Warning: could not write " << path << "\n";
          ++write_failures;
        }
        for (const auto &label : lf.labels) {
          label_rows.emplace_back(lf.frame_id, label);
        }
      };

  std::expected<std::size_t, specsynth::core::SynthError> produced =
      std::unexpected(specsynth::core::SynthError::InvalidConfig);
  if (use_tbb) {
#ifdef SPECSYNTH_HAS_TBB
    produced = specsynth::app::generate_dataset_tbb(cfg, on_frame);
#else
    std::cerr << "TBB runner not available (build with -DSPECSYNTH_USE_TBB=ON and TBB installed)\n";
    return 1;
#endif
  } else {
    produced = specsynth::app::generate_dataset_parallel(cfg, on_frame, workers);
  }

  if (!produced) {
    std::cerr << "Generation error: " << specsynth::core::to_string(produced.error()) << "\n";
    return 1;
  }

  try {
    write_labels_csv(out_dir / "labels.csv", std::move(label_rows));
  } catch (const std::runtime_error &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  std::cout << "frames=" << *produced << " signals_per_frame=" << cfg.signals_per_frame
            << " shape=" << cfg.tchans << "x" << cfg.fchans << " output=" << out_dir.string()
            << "\n";
  if (write_failures > 0) {
    std::cerr << write_failures << " frame(s) could not be written\n";
    return 1;
  }
  return 0;
}
