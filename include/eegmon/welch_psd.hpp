#pragma once

#include "eegmon/types.hpp"

#include <cstddef>
#include <vector>

namespace eegmon {

struct WelchOptions {
  // Segment length in samples, clamped to [8, x.size()]. The DFT has the same
  // length, so bins are spaced fs / nperseg apart.
  size_t nperseg{256};
  double overlap_fraction{0.5};  // 0..<1, overlap = floor(nperseg * fraction)
};

// Welch PSD: mean of the one-sided periodic-Hann periodograms of every full,
// mean-detrended segment. A trailing partial segment is not used.
PsdResult welch_psd(const std::vector<double>& x, double fs_hz, const WelchOptions& opt);

} // namespace eegmon
