#pragma once

#include <cstddef>
#include <optional>

namespace specsynth::core {

/// Frequency interval in Hz; order of the bounds does not matter.
struct FrequencyWindow {
  double f_lo{0.0};
  double f_hi{0.0};
};

/// Half-open column range [begin, end) of a frame's grid.
struct ColumnRange {
  std::size_t begin{0};
  std::size_t end{0};

  [[nodiscard]] std::size_t width() const noexcept { return end > begin ? end - begin : 0; }
  [[nodiscard]] bool empty() const noexcept { return width() == 0; }
};

/// Options for signal composition (see compose_signal).
struct CompositionOptions {
  std::optional<FrequencyWindow> freq_window;
  bool integrate_path{false};
  bool integrate_t{false};
  bool integrate_f{false};
  int t_subsamples{10};
  int f_subsamples{10};
};

}  // namespace specsynth::core
