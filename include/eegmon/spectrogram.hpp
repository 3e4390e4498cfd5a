#pragma once

#include <cstddef>
#include <vector>

namespace eegmon {

// Short-time spectrogram: one SegmentPeriodogram per frame, no averaging.

struct SpectrogramOptions {
  // Segment (and DFT) length in samples. 0 => 256. Clamped to [8, x.size()].
  size_t nperseg{0};

  // Advance between successive frames. 0 => nperseg - nperseg / 2.
  size_t hop{0};

  // Subtract the mean of each frame before windowing.
  bool detrend_mean{true};
};

struct SpectrogramResult {
  std::vector<double> times_sec;  // frame centers
  std::vector<double> freqs_hz;   // k * fs / nperseg, k = 0 .. nperseg / 2

  // Row-major [frame][freq], one-sided density.
  std::vector<double> psd;

  size_t n_frames{0};
  size_t n_freq{0};

  double at(size_t frame, size_t freq) const {
    return psd[frame * n_freq + freq];
  }
};

SpectrogramResult stft_spectrogram_psd(const std::vector<double>& x,
                                       double fs_hz,
                                       const SpectrogramOptions& opt);

} // namespace eegmon
