#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace eegmon {

struct RGB {
  uint8_t r{0}, g{0}, b{0};
};

struct PsdResult {
  std::vector<double> freqs_hz;  // length = n_freq_bins
  std::vector<double> psd;       // same length, units ~ (signal_unit^2 / Hz)
};

struct BandDefinition {
  std::string name;
  double fmin_hz{0.0};
  double fmax_hz{0.0};
};

// Mean PSD density per band, in the same order as the band definitions used
// to compute it.
struct BandPowers {
  std::vector<BandDefinition> bands;
  std::vector<double> power;

  size_t size() const { return bands.size(); }
};

// A single-channel raw recording as stored on disk.
struct RawRecording {
  std::vector<int16_t> samples;
  double fs_hz{0.0};

  // Sidecar metadata ("key: value" lines), in file order.
  std::vector<std::pair<std::string, std::string>> metadata;

  size_t n_samples() const { return samples.size(); }
  double duration_sec() const {
    return (fs_hz > 0.0) ? static_cast<double>(samples.size()) / fs_hz : 0.0;
  }
};

// Outcome of an interactive acquisition action (connect, record, ...).
// The message is meant for display whether or not the action succeeded.
struct ActionResult {
  bool ok{false};
  std::string message;
};

} // namespace eegmon
