#pragma once

#include <cstddef>
#include <vector>

namespace specsynth::core {

/// Column centers, ascending: fs[i] = (fmax - fchans*df) + i*df. fmax is the top edge.
[[nodiscard]] std::vector<double> derive_frequency_axis(double fmax,
                                                        std::size_t fchans,
                                                        double df);

/// Row times: ts[j] = j*dt.
[[nodiscard]] std::vector<double> derive_time_axis(std::size_t tchans, double dt);

}  // namespace specsynth::core
