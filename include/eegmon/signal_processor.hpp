#pragma once

#include "eegmon/biquad.hpp"
#include "eegmon/settings.hpp"
#include "eegmon/types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace eegmon {

// Spectrogram in decibels, ready for display.
struct SpectrogramView {
  std::vector<double> freqs_hz;   // one-sided, 0..fs/2
  std::vector<double> times_sec;  // frame centers

  // Row-major [frame][freq], 10*log10(psd + 1e-10).
  std::vector<double> power_db;

  size_t n_frames{0};
  size_t n_freq{0};

  // Frequency range the display should show.
  double min_freq_hz{0.0};
  double max_freq_hz{70.0};

  double db_min{0.0};
  double db_max{0.0};

  double at(size_t frame, size_t freq) const {
    return power_db[frame * n_freq + freq];
  }
};

// Filter cascades derived from FilterSettings. A stage that is disabled, or
// whose cutoff cannot be designed at the sampling rate, is left empty.
struct FilterPlan {
  std::vector<BiquadCoeffs> highpass;
  std::vector<BiquadCoeffs> lowpass;
  std::vector<BiquadCoeffs> notch;

  bool empty() const { return highpass.empty() && lowpass.empty() && notch.empty(); }
};

FilterPlan make_filter_plan(const FilterSettings& filter, double fs_hz);

// Filtering, spectrogram and band power computations on a sample window.
class SignalProcessor {
public:
  static constexpr size_t kMinFilterSamples = 30;
  static constexpr int kButterworthOrder = 4;
  static constexpr double kNotchQ = 30.0;
  static constexpr double kDisplayMaxFreqHz = 70.0;

  explicit SignalProcessor(const Settings& settings);

  // Call after the filter or sampling settings change.
  void update_settings(const Settings& settings);

  const FilterPlan& plan() const { return plan_; }

  // Zero-phase highpass -> lowpass -> notch. Returns the input unchanged if
  // filtering is disabled or there are fewer than kMinFilterSamples samples.
  std::vector<double> apply_filters(const std::vector<double>& data) const;

  // Needs at least one second of data; returns nullopt otherwise.
  std::optional<SpectrogramView> calculate_spectrogram(const std::vector<double>& data) const;

  // Mean PSD density per default EEG band. All zeros with less than two
  // seconds of data.
  BandPowers calculate_bands(const std::vector<double>& data) const;

private:
  size_t segment_length() const;

  Settings settings_;
  FilterPlan plan_;
};

} // namespace eegmon
