#pragma once

#include <cstddef>
#include <vector>

namespace eegmon {

// Normalized biquad coefficients for Direct Form II Transposed:
//
//   y[n] = b0*x[n] + b1*x[n-1] + b2*x[n-2] - a1*y[n-1] - a2*y[n-2]
//
// with a0 assumed to be 1.0 (i.e., b* and a* already divided by a0).
// First-order sections use b2 = a2 = 0.
struct BiquadCoeffs {
  double b0{1.0};
  double b1{0.0};
  double b2{0.0};
  double a1{0.0};
  double a2{0.0};
};

class Biquad {
public:
  Biquad() = default;
  explicit Biquad(const BiquadCoeffs& c);

  void set_coeffs(const BiquadCoeffs& c);
  const BiquadCoeffs& coeffs() const { return c_; }

  void reset();

  // Set the state to the steady response for a constant input x.
  void reset_steady(double x);

  double dc_gain() const;

  // Process one sample.
  double process(double x);

private:
  BiquadCoeffs c_{};
  double z1_{0.0};
  double z2_{0.0};
};

// A small cascade of biquad filters.
class BiquadChain {
public:
  BiquadChain() = default;
  explicit BiquadChain(const std::vector<BiquadCoeffs>& stages);

  void add_stage(const BiquadCoeffs& c);
  void reset();
  void reset_steady(double x);

  size_t n_stages() const { return stages_.size(); }
  bool empty() const { return stages_.empty(); }

  double process(double x);
  void process_inplace(std::vector<double>* x);

  std::vector<BiquadCoeffs> stage_coeffs() const;

private:
  std::vector<Biquad> stages_;
};

// Design helpers (RBJ-style biquad cookbook forms).
BiquadCoeffs design_lowpass(double fs_hz, double f0_hz, double Q);
BiquadCoeffs design_highpass(double fs_hz, double f0_hz, double Q);

// Second-order IIR notch at f0 whose -3 dB bandwidth is exactly f0 / Q:
// the cookbook notch with alpha replaced by beta = tan(pi f0 / (fs Q)).
// Unity gain at DC and Nyquist.
BiquadCoeffs design_notch(double fs_hz, double f0_hz, double Q);

// Butterworth filters of the given order as a cascade of second-order
// sections (plus one first-order section when the order is odd).
//
// Each pole pair k = 1..order/2 becomes an RBJ section with
//   Q_k = 1 / (2 cos(theta_k)),
//   theta_k = (2k - 1) pi / (2 order)   for even orders,
//   theta_k = k pi / order              for odd orders,
// at the same cutoff, which reproduces the bilinear-transform Butterworth
// response with prewarping at the cutoff.
std::vector<BiquadCoeffs> design_butterworth_lowpass(double fs_hz, double f0_hz, int order);
std::vector<BiquadCoeffs> design_butterworth_highpass(double fs_hz, double f0_hz, int order);

// Magnitude response |H(e^jw)| of a cascade at frequency f_hz.
double cascade_magnitude(const std::vector<BiquadCoeffs>& stages, double fs_hz, double f_hz);

// Default edge padding for filtfilt_inplace: 3 * (order + 1), where order
// counts 2 per biquad and 1 per first-order section (b2 == a2 == 0).
size_t default_filtfilt_padlen(const std::vector<BiquadCoeffs>& stages);

// Forward-backward filtering ("filtfilt"-style) using a cascade of biquads.
//
// - Applies the cascade forward, then reverses the signal and applies the same
//   cascade again.
// - Produces approximately zero phase distortion.
// - Pads both ends by odd reflection and starts each pass from the steady
//   state of its first sample to reduce edge transients.
//
// padlen:
// - If 0, default_filtfilt_padlen(stages) is used.
// - Clamped to x->size() - 1.
void filtfilt_inplace(std::vector<double>* x,
                      const std::vector<BiquadCoeffs>& stages,
                      size_t padlen = 0);

} // namespace eegmon
