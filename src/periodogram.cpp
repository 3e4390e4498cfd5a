#include "eegmon/periodogram.hpp"

#include <stdexcept>

namespace eegmon {

SegmentPeriodogram::SegmentPeriodogram(size_t nperseg, double fs_hz)
    : nperseg_(nperseg), dft_(nperseg == 0 ? 1 : nperseg) {
  if (nperseg == 0) throw std::runtime_error("SegmentPeriodogram: nperseg must be > 0");
  if (!(fs_hz > 0.0)) throw std::runtime_error("SegmentPeriodogram: fs_hz must be > 0");

  window_ = hann_window(nperseg_);
  double energy = 0.0;
  for (double w : window_) energy += w * w;
  if (!(energy > 0.0)) throw std::runtime_error("SegmentPeriodogram: window has no energy");
  scale_ = 1.0 / (fs_hz * energy);

  const size_t nfreq = nperseg_ / 2 + 1;
  freqs_hz_.resize(nfreq);
  for (size_t k = 0; k < nfreq; ++k) {
    freqs_hz_[k] = static_cast<double>(k) * fs_hz / static_cast<double>(nperseg_);
  }
  buf_.resize(nperseg_);
}

void SegmentPeriodogram::compute(const double* x, bool detrend_mean, double* out) {
  double mean = 0.0;
  if (detrend_mean) {
    for (size_t i = 0; i < nperseg_; ++i) mean += x[i];
    mean /= static_cast<double>(nperseg_);
  }
  for (size_t i = 0; i < nperseg_; ++i) {
    buf_[i] = std::complex<double>((x[i] - mean) * window_[i], 0.0);
  }

  dft_.forward(buf_);

  const size_t nfreq = freqs_hz_.size();
  const bool has_nyquist = (nperseg_ % 2 == 0);
  for (size_t k = 0; k < nfreq; ++k) {
    double p = std::norm(buf_[k]) * scale_;
    const bool single = (k == 0) || (has_nyquist && k == nfreq - 1);
    if (!single) p *= 2.0;
    out[k] = p;
  }
}

} // namespace eegmon
