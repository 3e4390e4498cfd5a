#include "eegmon/welch_psd.hpp"

#include "eegmon/periodogram.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace eegmon {

PsdResult welch_psd(const std::vector<double>& x, double fs_hz, const WelchOptions& opt) {
  if (!(fs_hz > 0.0)) throw std::runtime_error("welch_psd: fs_hz must be > 0");
  if (x.empty()) throw std::runtime_error("welch_psd: input signal is empty");
  if (!(opt.overlap_fraction >= 0.0 && opt.overlap_fraction < 1.0)) {
    throw std::runtime_error("welch_psd: overlap_fraction must be in [0,1)");
  }

  const size_t nperseg = std::min(std::max<size_t>(opt.nperseg, 8), x.size());
  const size_t overlap = static_cast<size_t>(std::floor(static_cast<double>(nperseg) * opt.overlap_fraction));
  const size_t step = std::max<size_t>(1, nperseg - overlap);

  SegmentPeriodogram periodogram(nperseg, fs_hz);

  PsdResult out;
  out.freqs_hz = periodogram.freqs_hz();
  out.psd.assign(periodogram.n_freq(), 0.0);

  std::vector<double> seg(periodogram.n_freq());
  size_t count = 0;
  for (size_t start = 0; start + nperseg <= x.size(); start += step) {
    periodogram.compute(x.data() + start, true, seg.data());
    for (size_t k = 0; k < seg.size(); ++k) out.psd[k] += seg[k];
    ++count;
  }

  // nperseg <= x.size() guarantees one segment.
  for (double& p : out.psd) p /= static_cast<double>(count);
  return out;
}

} // namespace eegmon
