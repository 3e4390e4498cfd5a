#pragma once

#include "eegmon/fft.hpp"

#include <cstddef>
#include <vector>

namespace eegmon {

// Windowed periodogram of fixed-length segments: the per-segment step shared
// by Welch averaging and the STFT spectrogram.
//
// The DFT length equals the segment length, the window is a periodic Hann and
// the output is a one-sided power spectral density:
//   P_k = c_k |X_k|^2 / (fs * sum(w^2)),
// with c_k = 2 for every bin except DC and (for even lengths) Nyquist.
// Bin k sits at k * fs / nperseg, for k = 0 .. nperseg / 2.
class SegmentPeriodogram {
public:
  SegmentPeriodogram(size_t nperseg, double fs_hz);

  size_t nperseg() const { return nperseg_; }
  size_t n_freq() const { return freqs_hz_.size(); }
  const std::vector<double>& freqs_hz() const { return freqs_hz_; }

  // Density of x[0 .. nperseg), writing n_freq() values to out.
  // With detrend_mean the segment mean is removed before windowing.
  void compute(const double* x, bool detrend_mean, double* out);

private:
  size_t nperseg_{0};
  std::vector<double> window_;
  std::vector<double> freqs_hz_;
  double scale_{0.0};
  Dft dft_;
  ComplexVector buf_;
};

} // namespace eegmon
