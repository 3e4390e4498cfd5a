#include "eegmon/biquad.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <stdexcept>
#include <string>

namespace eegmon {

static constexpr double kPi = 3.141592653589793238462643383279502884;

Biquad::Biquad(const BiquadCoeffs& c) {
  set_coeffs(c);
}

void Biquad::set_coeffs(const BiquadCoeffs& c) {
  c_ = c;
  reset();
}

void Biquad::reset() {
  z1_ = 0.0;
  z2_ = 0.0;
}

void Biquad::reset_steady(double x) {
  // State of a section that has seen the constant input x forever.
  const double den = 1.0 + c_.a1 + c_.a2;
  const double gain = (den != 0.0) ? (c_.b0 + c_.b1 + c_.b2) / den : 0.0;
  const double y = gain * x;
  z1_ = y - c_.b0 * x;
  z2_ = c_.b2 * x - c_.a2 * y;
}

double Biquad::dc_gain() const {
  const double den = 1.0 + c_.a1 + c_.a2;
  return (den != 0.0) ? (c_.b0 + c_.b1 + c_.b2) / den : 0.0;
}

double Biquad::process(double x) {
  const double y = c_.b0 * x + z1_;
  z1_ = c_.b1 * x - c_.a1 * y + z2_;
  z2_ = c_.b2 * x - c_.a2 * y;
  return y;
}

BiquadChain::BiquadChain(const std::vector<BiquadCoeffs>& stages) {
  for (const auto& c : stages) add_stage(c);
}

void BiquadChain::add_stage(const BiquadCoeffs& c) {
  stages_.emplace_back(c);
}

void BiquadChain::reset() {
  for (auto& s : stages_) s.reset();
}

void BiquadChain::reset_steady(double x) {
  double v = x;
  for (auto& s : stages_) {
    s.reset_steady(v);
    v *= s.dc_gain();
  }
}

double BiquadChain::process(double x) {
  double y = x;
  for (auto& s : stages_) {
    y = s.process(y);
  }
  return y;
}

void BiquadChain::process_inplace(std::vector<double>* x) {
  if (!x) return;
  if (stages_.empty()) return;
  for (double& v : *x) {
    v = process(v);
  }
}

std::vector<BiquadCoeffs> BiquadChain::stage_coeffs() const {
  std::vector<BiquadCoeffs> out;
  out.reserve(stages_.size());
  for (const auto& s : stages_) out.push_back(s.coeffs());
  return out;
}

static void validate_design_inputs(double fs_hz, double f0_hz, double Q, const char* what) {
  if (fs_hz <= 0.0) throw std::runtime_error(std::string(what) + ": fs_hz must be > 0");
  if (!(f0_hz > 0.0)) throw std::runtime_error(std::string(what) + ": f0_hz must be > 0");
  if (!(f0_hz < 0.5 * fs_hz)) {
    throw std::runtime_error(std::string(what) + ": f0_hz must be < fs/2");
  }
  if (!(Q > 0.0)) throw std::runtime_error(std::string(what) + ": Q must be > 0");
}

static BiquadCoeffs normalize(double b0, double b1, double b2, double a0, double a1, double a2) {
  if (a0 == 0.0) throw std::runtime_error("biquad normalize: a0 is zero");
  BiquadCoeffs c;
  c.b0 = b0 / a0;
  c.b1 = b1 / a0;
  c.b2 = b2 / a0;
  c.a1 = a1 / a0;
  c.a2 = a2 / a0;
  return c;
}

BiquadCoeffs design_lowpass(double fs_hz, double f0_hz, double Q) {
  validate_design_inputs(fs_hz, f0_hz, Q, "design_lowpass");

  const double w0 = 2.0 * kPi * (f0_hz / fs_hz);
  const double cosw0 = std::cos(w0);
  const double sinw0 = std::sin(w0);
  const double alpha = sinw0 / (2.0 * Q);

  const double b0 = (1.0 - cosw0) / 2.0;
  const double b1 = (1.0 - cosw0);
  const double b2 = (1.0 - cosw0) / 2.0;
  const double a0 = 1.0 + alpha;
  const double a1 = -2.0 * cosw0;
  const double a2 = 1.0 - alpha;

  return normalize(b0, b1, b2, a0, a1, a2);
}

BiquadCoeffs design_highpass(double fs_hz, double f0_hz, double Q) {
  validate_design_inputs(fs_hz, f0_hz, Q, "design_highpass");

  const double w0 = 2.0 * kPi * (f0_hz / fs_hz);
  const double cosw0 = std::cos(w0);
  const double sinw0 = std::sin(w0);
  const double alpha = sinw0 / (2.0 * Q);

  const double b0 = (1.0 + cosw0) / 2.0;
  const double b1 = -(1.0 + cosw0);
  const double b2 = (1.0 + cosw0) / 2.0;
  const double a0 = 1.0 + alpha;
  const double a1 = -2.0 * cosw0;
  const double a2 = 1.0 - alpha;

  return normalize(b0, b1, b2, a0, a1, a2);
}

BiquadCoeffs design_notch(double fs_hz, double f0_hz, double Q) {
  validate_design_inputs(fs_hz, f0_hz, Q, "design_notch");

  // Bilinear notch with the -3 dB bandwidth prewarped to exactly f0 / Q.
  const double w0 = 2.0 * kPi * (f0_hz / fs_hz);
  const double cosw0 = std::cos(w0);
  const double beta = std::tan(0.5 * w0 / Q);

  const double b0 = 1.0;
  const double b1 = -2.0 * cosw0;
  const double b2 = 1.0;
  const double a0 = 1.0 + beta;
  const double a1 = -2.0 * cosw0;
  const double a2 = 1.0 - beta;

  return normalize(b0, b1, b2, a0, a1, a2);
}

static std::vector<double> butterworth_section_qs(int order) {
  std::vector<double> qs;
  const int pairs = order / 2;
  qs.reserve(static_cast<size_t>(pairs));
  // Pole angle from the negative real axis. Odd orders also have a real pole
  // at angle 0, which shifts the pairs by half a step.
  for (int k = 1; k <= pairs; ++k) {
    const double theta = static_cast<double>(2 * k - 1 + order % 2) * kPi / (2.0 * static_cast<double>(order));
    qs.push_back(1.0 / (2.0 * std::cos(theta)));
  }
  return qs;
}

static void validate_order(int order, const char* what) {
  if (order < 1 || order > 16) {
    throw std::runtime_error(std::string(what) + ": order must be in 1..16");
  }
}

std::vector<BiquadCoeffs> design_butterworth_lowpass(double fs_hz, double f0_hz, int order) {
  validate_order(order, "design_butterworth_lowpass");
  validate_design_inputs(fs_hz, f0_hz, 1.0, "design_butterworth_lowpass");

  std::vector<BiquadCoeffs> stages;
  for (double q : butterworth_section_qs(order)) {
    stages.push_back(design_lowpass(fs_hz, f0_hz, q));
  }
  if (order % 2 == 1) {
    // First-order bilinear section: H(s) = 1 / (1 + s/wc), prewarped.
    const double k = std::tan(kPi * f0_hz / fs_hz);
    stages.push_back(normalize(k, k, 0.0, 1.0 + k, k - 1.0, 0.0));
  }
  return stages;
}

std::vector<BiquadCoeffs> design_butterworth_highpass(double fs_hz, double f0_hz, int order) {
  validate_order(order, "design_butterworth_highpass");
  validate_design_inputs(fs_hz, f0_hz, 1.0, "design_butterworth_highpass");

  std::vector<BiquadCoeffs> stages;
  for (double q : butterworth_section_qs(order)) {
    stages.push_back(design_highpass(fs_hz, f0_hz, q));
  }
  if (order % 2 == 1) {
    // First-order bilinear section: H(s) = (s/wc) / (1 + s/wc), prewarped.
    const double k = std::tan(kPi * f0_hz / fs_hz);
    stages.push_back(normalize(1.0, -1.0, 0.0, 1.0 + k, k - 1.0, 0.0));
  }
  return stages;
}

double cascade_magnitude(const std::vector<BiquadCoeffs>& stages, double fs_hz, double f_hz) {
  if (fs_hz <= 0.0) throw std::runtime_error("cascade_magnitude: fs_hz must be > 0");
  const double w = 2.0 * kPi * f_hz / fs_hz;
  const std::complex<double> z1 = std::polar(1.0, -w);
  const std::complex<double> z2 = z1 * z1;
  double mag = 1.0;
  for (const auto& c : stages) {
    const std::complex<double> num = c.b0 + c.b1 * z1 + c.b2 * z2;
    const std::complex<double> den = 1.0 + c.a1 * z1 + c.a2 * z2;
    mag *= std::abs(num) / std::abs(den);
  }
  return mag;
}

// Odd reflection about the end points keeps the padded signal continuous in
// value and slope, which is what a highpass needs at the edges.
static void reflect_pad(const std::vector<double>& x, size_t padlen, std::vector<double>* out) {
  if (!out) return;
  out->clear();
  const size_t n = x.size();
  if (n == 0) return;

  padlen = std::min(padlen, (n > 0 ? n - 1 : 0));
  out->reserve(n + 2 * padlen);

  // Left pad: 2*x[0] - x[padlen], ..., 2*x[0] - x[1]
  for (size_t i = 0; i < padlen; ++i) {
    out->push_back(2.0 * x[0] - x[padlen - i]);
  }

  // Signal
  out->insert(out->end(), x.begin(), x.end());

  // Right pad: 2*x[n-1] - x[n-2], ..., 2*x[n-1] - x[n-1-padlen]
  for (size_t i = 0; i < padlen; ++i) {
    out->push_back(2.0 * x[n - 1] - x[n - 2 - i]);
  }
}

size_t default_filtfilt_padlen(const std::vector<BiquadCoeffs>& stages) {
  size_t order = 0;
  for (const auto& c : stages) {
    order += (c.b2 == 0.0 && c.a2 == 0.0) ? 1 : 2;
  }
  return 3 * (order + 1);
}

void filtfilt_inplace(std::vector<double>* x,
                      const std::vector<BiquadCoeffs>& stages,
                      size_t padlen) {
  if (!x) return;
  const size_t n = x->size();
  if (n < 2) return;
  if (stages.empty()) return;

  const size_t max_pad = n - 1;
  if (padlen == 0) {
    padlen = std::min(default_filtfilt_padlen(stages), max_pad);
  } else {
    padlen = std::min(padlen, max_pad);
  }

  std::vector<double> xp;
  reflect_pad(*x, padlen, &xp);

  // Forward, starting from the steady state of the first sample so that a DC
  // offset does not ring through a highpass.
  BiquadChain chain(stages);
  chain.reset_steady(xp.front());
  chain.process_inplace(&xp);

  // Backward
  std::reverse(xp.begin(), xp.end());
  chain.reset_steady(xp.front());
  chain.process_inplace(&xp);
  std::reverse(xp.begin(), xp.end());

  // Unpad
  for (size_t i = 0; i < n; ++i) {
    (*x)[i] = xp[i + padlen];
  }
}

} // namespace eegmon
