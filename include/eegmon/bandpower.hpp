#pragma once

#include "eegmon/types.hpp"

#include <string>
#include <vector>

namespace eegmon {

// Bands shown on the monitor: delta 0.5-4, theta 4-8, alpha 8-13,
// beta 13-30, gamma 30-70 Hz.
std::vector<BandDefinition> default_eeg_bands();

// Parse a band spec string like:
//   "delta:0.5-4,theta:4-8,alpha:8-13"
// An empty string yields default_eeg_bands().
std::vector<BandDefinition> parse_band_spec(const std::string& spec);

// Mean PSD value of the bins with fmin_hz <= f <= fmax_hz.
// Returns 0 when no bin falls inside the band.
double mean_band_density(const PsdResult& psd, double fmin_hz, double fmax_hz);

// Integrate PSD between [fmin_hz, fmax_hz] using trapezoidal rule.
double integrate_bandpower(const PsdResult& psd, double fmin_hz, double fmax_hz);

// mean_band_density() for every band.
BandPowers compute_band_powers(const PsdResult& psd, const std::vector<BandDefinition>& bands);

} // namespace eegmon
