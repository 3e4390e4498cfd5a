#include "eegmon/spectrogram.hpp"

#include "eegmon/periodogram.hpp"

#include <algorithm>
#include <stdexcept>

namespace eegmon {

SpectrogramResult stft_spectrogram_psd(const std::vector<double>& x,
                                       double fs_hz,
                                       const SpectrogramOptions& opt) {
  if (!(fs_hz > 0.0)) throw std::runtime_error("stft_spectrogram_psd: fs_hz must be > 0");
  if (x.empty()) throw std::runtime_error("stft_spectrogram_psd: input signal is empty");

  const size_t requested = (opt.nperseg == 0) ? 256 : opt.nperseg;
  const size_t nperseg = std::min(std::max<size_t>(requested, 8), x.size());
  const size_t hop = (opt.hop == 0) ? std::max<size_t>(1, nperseg - nperseg / 2) : opt.hop;

  SegmentPeriodogram periodogram(nperseg, fs_hz);

  SpectrogramResult out;
  out.n_frames = (x.size() - nperseg) / hop + 1;
  out.n_freq = periodogram.n_freq();
  out.freqs_hz = periodogram.freqs_hz();
  out.times_sec.resize(out.n_frames);
  out.psd.assign(out.n_frames * out.n_freq, 0.0);

  for (size_t frame = 0; frame < out.n_frames; ++frame) {
    const size_t start = frame * hop;
    periodogram.compute(x.data() + start, opt.detrend_mean, out.psd.data() + frame * out.n_freq);
    out.times_sec[frame] = (static_cast<double>(start) + 0.5 * static_cast<double>(nperseg)) / fs_hz;
  }
  return out;
}

} // namespace eegmon
