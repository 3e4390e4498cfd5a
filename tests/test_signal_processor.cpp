#include "eegmon/signal_processor.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

using namespace eegmon;

static std::vector<double> tone(double fs, double f, double seconds, double amp, double offset = 0.0) {
  const double pi = std::acos(-1.0);
  const size_t n = static_cast<size_t>(fs * seconds);
  std::vector<double> x(n);
  for (size_t i = 0; i < n; ++i) {
    x[i] = offset + amp * std::sin(2.0 * pi * f * static_cast<double>(i) / fs);
  }
  return x;
}

static double rms_mid(const std::vector<double>& x) {
  const size_t a = x.size() / 4;
  const size_t b = x.size() - a;
  double s = 0.0;
  for (size_t i = a; i < b; ++i) s += x[i] * x[i];
  return std::sqrt(s / static_cast<double>(b - a));
}

int main() {
  Settings s;  // fs 500, highpass 0.5, lowpass 70, notch 60

  // Filter plan follows the settings.
  {
    FilterPlan plan = make_filter_plan(s.filter, s.sampling_rate_hz);
    assert(plan.highpass.size() == 2);
    assert(plan.lowpass.size() == 2);
    assert(plan.notch.size() == 1);

    Settings t = s;
    t.disable_lowpass();  // fs/2 => no stage
    t.disable_notch();
    plan = make_filter_plan(t.filter, t.sampling_rate_hz);
    assert(!plan.highpass.empty());
    assert(plan.lowpass.empty());
    assert(plan.notch.empty());

    // An undesignable stage is skipped; the rest still run.
    t = s;
    t.filter.notch_hz = 300.0;
    plan = make_filter_plan(t.filter, t.sampling_rate_hz);
    assert(plan.notch.empty());
    assert(!plan.highpass.empty() && !plan.lowpass.empty());

    t = s;
    t.filter.enabled = false;
    assert(make_filter_plan(t.filter, t.sampling_rate_hz).empty());
  }

  SignalProcessor proc(s);

  // Fewer than 30 samples: unchanged.
  {
    std::vector<double> x(29, 100.0);
    assert(proc.apply_filters(x) == x);
  }

  // Disabled filtering: unchanged.
  {
    Settings t = s;
    t.filter.enabled = false;
    SignalProcessor off(t);
    const std::vector<double> x = tone(500.0, 60.0, 2.0, 10.0, 200.0);
    assert(off.apply_filters(x) == x);
  }

  // A constant offset is removed entirely.
  {
    const std::vector<double> y = proc.apply_filters(std::vector<double>(1000, 300.0));
    double worst = 0.0;
    for (double v : y) worst = std::max(worst, std::fabs(v));
    assert(worst < 1e-6);
  }

  // Mains hum is removed and 10 Hz passes unchanged in phase.
  {
    Settings t = s;
    t.disable_highpass();
    SignalProcessor no_hp(t);

    const std::vector<double> hum = tone(500.0, 60.0, 8.0, 50.0);
    const std::vector<double> eeg = tone(500.0, 10.0, 8.0, 20.0);
    std::vector<double> x(hum.size());
    for (size_t i = 0; i < x.size(); ++i) x[i] = hum[i] + eeg[i];

    const std::vector<double> y = no_hp.apply_filters(x);
    assert(y.size() == x.size());

    std::vector<double> residual(y.size());
    for (size_t i = 0; i < y.size(); ++i) residual[i] = y[i] - eeg[i];
    const double r = rms_mid(residual);
    if (!(r < 1.0)) {
      std::cerr << "residual rms after filtering: " << r << "\n";
      return 1;
    }
  }

  // Spectrogram: nothing below one second of data.
  {
    assert(!proc.calculate_spectrogram(std::vector<double>(499, 0.0)));

    const std::vector<double> x = tone(500.0, 10.0, 30.0, 20.0);
    const auto v = proc.calculate_spectrogram(x);
    assert(v);
    assert(v->n_frames == 29);  // (15000 - 1000) / 500 + 1
    assert(v->n_freq == 501);  // 2 s segments, 0.5 Hz bins
    assert(v->power_db.size() == v->n_frames * v->n_freq);
    assert(v->min_freq_hz == 0.0 && v->max_freq_hz == 70.0);
    assert(v->db_max > v->db_min);

    size_t peak = 0;
    for (size_t k = 0; k < v->n_freq; ++k) {
      if (v->at(0, k) > v->at(0, peak)) peak = k;
    }
    assert(peak == 20 && v->freqs_hz[peak] == 10.0);
    // Silent bins bottom out at 10*log10(1e-10).
    assert(v->db_min >= -100.0 - 1e-9);
  }

  // Bands: zeros below two seconds, alpha dominates a 10 Hz tone.
  {
    const BandPowers z = proc.calculate_bands(std::vector<double>(999, 1.0));
    assert(z.size() == 5);
    for (double p : z.power) assert(p == 0.0);

    const BandPowers bp = proc.calculate_bands(tone(500.0, 10.0, 10.0, 20.0));
    assert(bp.bands[2].name == "alpha");
    for (size_t i = 0; i < bp.size(); ++i) {
      if (i != 2) assert(bp.power[2] > 10.0 * bp.power[i]);
    }
  }

  // Band edges are inclusive: a 4 Hz tone counts toward delta and theta.
  // Values are mean densities over the 0.5 Hz bins of each band.
  {
    std::vector<double> x = tone(500.0, 4.0, 6.0, 20.0);
    const std::vector<double> y = tone(500.0, 13.0, 6.0, 5.0);
    for (size_t i = 0; i < x.size(); ++i) x[i] += y[i];

    const BandPowers bp = proc.calculate_bands(x);
    assert(bp.size() == 5);
    assert(std::fabs(bp.power[0] - 1000.0 / 24.0) < 1e-6);  // delta, 8 bins
    assert(std::fabs(bp.power[1] - 1000.0 / 27.0) < 1e-6);  // theta, 9 bins
    assert(std::fabs(bp.power[2] - 62.5 / 33.0) < 1e-6);    // alpha, 11 bins
    assert(std::fabs(bp.power[3] - 62.5 / 105.0) < 1e-6);   // beta, 35 bins
    assert(bp.power[4] < 1e-9);
  }

  // update_settings rebuilds the plan.
  {
    Settings t = s;
    t.disable_highpass();
    proc.update_settings(t);
    assert(proc.plan().highpass.empty());
  }

  std::cout << "test_signal_processor OK\n";
  return 0;
}
