#include "eegmon/bandpower.hpp"
#include "eegmon/welch_psd.hpp"

#include "test_support.hpp"

#include <cmath>
#include <iostream>
#include <vector>

using namespace eegmon;

static std::vector<double> sine_mix(double fs, double seconds) {
  const double pi = std::acos(-1.0);
  const size_t n = static_cast<size_t>(fs * seconds);
  std::vector<double> x(n);
  for (size_t i = 0; i < n; ++i) {
    const double t = static_cast<double>(i) / fs;
    x[i] = 10.0 * std::sin(2.0 * pi * 10.0 * t) + 2.0 * std::sin(2.0 * pi * 20.0 * t);
  }
  return x;
}

int main() {
  const double fs = 500.0;

  // Default bands.
  {
    const auto bands = default_eeg_bands();
    assert(bands.size() == 5);
    assert(bands[0].name == "delta" && bands[0].fmin_hz == 0.5 && bands[0].fmax_hz == 4.0);
    assert(bands[2].name == "alpha" && bands[2].fmin_hz == 8.0 && bands[2].fmax_hz == 13.0);
    assert(bands[4].name == "gamma" && bands[4].fmax_hz == 70.0);
  }

  // Band spec parsing.
  {
    const auto b = parse_band_spec(" alpha:8-12 , smr:12.5-15 ");
    assert(b.size() == 2);
    assert(b[0].name == "alpha" && b[0].fmin_hz == 8.0 && b[0].fmax_hz == 12.0);
    assert(b[1].name == "smr" && b[1].fmin_hz == 12.5);
    assert(parse_band_spec("").size() == 5);

    bool threw = false;
    try {
      (void)parse_band_spec("alpha:12-8");
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
  }

  // Welch PSD of a two-tone signal: alpha dominates, beta second.
  const std::vector<double> x = sine_mix(fs, 10.0);
  WelchOptions opt;
  opt.nperseg = static_cast<size_t>(2.0 * fs);
  opt.overlap_fraction = 0.5;
  const PsdResult psd = welch_psd(x, fs, opt);
  assert(psd.freqs_hz.size() == 501);
  assert(std::fabs(psd.freqs_hz[1] - 0.5) < 1e-12);

  size_t peak = 0;
  for (size_t k = 1; k < psd.psd.size(); ++k) {
    if (psd.psd[k] > psd.psd[peak]) peak = k;
  }
  assert(peak == 20);

  const BandPowers bp = compute_band_powers(psd, default_eeg_bands());
  assert(bp.size() == 5);
  assert(bp.power[2] > bp.power[3]);  // alpha > beta
  assert(bp.power[3] > bp.power[0]);  // beta > delta
  assert(bp.power[3] > bp.power[4]);  // beta > gamma

  // Integrated power of a sine ~ A^2 / 2.
  const double alpha_power = integrate_bandpower(psd, 8.0, 13.0);
  assert(std::fabs(alpha_power - 50.0) < 5.0);

  // Inclusive edges, and 0 when no bin falls inside.
  {
    PsdResult p;
    p.freqs_hz = {0.0, 1.0, 2.0, 3.0};
    p.psd = {1.0, 2.0, 4.0, 8.0};
    assert(mean_band_density(p, 1.0, 2.0) == 3.0);
    assert(mean_band_density(p, 1.2, 1.8) == 0.0);
    assert(std::fabs(integrate_bandpower(p, 0.0, 1.0) - 1.5) < 1e-12);
  }

  std::cout << "test_welch_bandpower OK\n";
  return 0;
}
