#include "eegmon/signal_processor.hpp"

#include "eegmon/bandpower.hpp"
#include "eegmon/spectrogram.hpp"
#include "eegmon/welch_psd.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace eegmon {

// A stage is skipped when its design is rejected (cutoff at or above
// Nyquist, non-positive cutoff, ...). The other stages are unaffected.
FilterPlan make_filter_plan(const FilterSettings& filter, double fs_hz) {
  FilterPlan plan;
  if (!filter.enabled || !(fs_hz > 0.0)) return plan;

  const double nyquist = 0.5 * fs_hz;

  if (filter.highpass_hz > 0.0 && filter.highpass_hz < nyquist) {
    plan.highpass = design_butterworth_highpass(fs_hz, filter.highpass_hz,
                                                SignalProcessor::kButterworthOrder);
  }
  if (filter.lowpass_hz > 0.0 && filter.lowpass_hz < nyquist) {
    plan.lowpass = design_butterworth_lowpass(fs_hz, filter.lowpass_hz,
                                              SignalProcessor::kButterworthOrder);
  }
  if (filter.notch_hz > 0.0 && filter.notch_hz < nyquist) {
    plan.notch.push_back(design_notch(fs_hz, filter.notch_hz, SignalProcessor::kNotchQ));
  }
  return plan;
}

SignalProcessor::SignalProcessor(const Settings& settings) {
  update_settings(settings);
}

void SignalProcessor::update_settings(const Settings& settings) {
  settings_ = settings;
  plan_ = make_filter_plan(settings_.filter, settings_.sampling_rate_hz);
}

std::vector<double> SignalProcessor::apply_filters(const std::vector<double>& data) const {
  std::vector<double> out = data;
  if (out.size() < kMinFilterSamples) return out;
  if (!settings_.filter.enabled) return out;

  filtfilt_inplace(&out, plan_.highpass);
  filtfilt_inplace(&out, plan_.lowpass);
  filtfilt_inplace(&out, plan_.notch);
  return out;
}

size_t SignalProcessor::segment_length() const {
  return static_cast<size_t>(settings_.sampling_rate_hz * 2.0);
}

std::optional<SpectrogramView> SignalProcessor::calculate_spectrogram(const std::vector<double>& data) const {
  const double fs = settings_.sampling_rate_hz;
  if (!(fs > 0.0)) return std::nullopt;
  if (static_cast<double>(data.size()) < fs) return std::nullopt;

  SpectrogramOptions opt;
  opt.nperseg = std::min(segment_length(), data.size());
  opt.hop = std::max<size_t>(1, opt.nperseg - opt.nperseg / 2);
  opt.detrend_mean = true;

  const SpectrogramResult s = stft_spectrogram_psd(data, fs, opt);

  SpectrogramView v;
  v.freqs_hz = s.freqs_hz;
  v.times_sec = s.times_sec;
  v.n_frames = s.n_frames;
  v.n_freq = s.n_freq;
  v.min_freq_hz = 0.0;
  v.max_freq_hz = kDisplayMaxFreqHz;
  v.power_db.resize(s.psd.size());
  for (size_t i = 0; i < s.psd.size(); ++i) {
    v.power_db[i] = 10.0 * std::log10(s.psd[i] + 1e-10);
  }
  if (!v.power_db.empty()) {
    const auto mm = std::minmax_element(v.power_db.begin(), v.power_db.end());
    v.db_min = *mm.first;
    v.db_max = *mm.second;
  }
  return v;
}

BandPowers SignalProcessor::calculate_bands(const std::vector<double>& data) const {
  const std::vector<BandDefinition> bands = default_eeg_bands();
  const double fs = settings_.sampling_rate_hz;

  if (!(fs > 0.0) || static_cast<double>(data.size()) < fs * 2.0) {
    BandPowers zeros;
    zeros.bands = bands;
    zeros.power.assign(bands.size(), 0.0);
    return zeros;
  }

  WelchOptions opt;
  opt.nperseg = segment_length();
  opt.overlap_fraction = 0.5;
  return compute_band_powers(welch_psd(data, fs, opt), bands);
}

} // namespace eegmon
