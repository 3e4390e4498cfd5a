#pragma once

#include <complex>
#include <cstddef>
#include <vector>

namespace eegmon {

using ComplexVector = std::vector<std::complex<double>>;

// Returns true if n is a power of two (and n > 0).
bool is_power_of_two(size_t n);

// Returns the smallest power of two >= n (n must be > 0).
size_t next_power_of_two(size_t n);

// In-place radix-2 FFT. a.size() must be a power of two; the inverse is
// scaled by 1/N.
void fft_inplace(ComplexVector& a, bool inverse);

// Forward DFT of one fixed length N >= 1, exact at that length (no zero
// padding). Power-of-two lengths run the radix-2 kernel directly; any other
// length goes through Bluestein's chirp-z identity
//   X_k = w_k * sum_j (x_j w_j) conj(w_{k-j}),  w_k = exp(-i pi k^2 / N),
// evaluated as a circular convolution on a radix-2 size >= 2N - 1.
class Dft {
public:
  explicit Dft(size_t n);

  size_t size() const { return n_; }

  // a.size() must equal size().
  void forward(ComplexVector& a);

private:
  size_t n_{0};
  size_t m_{0};  // convolution size, 0 for power-of-two lengths
  ComplexVector chirp_;
  ComplexVector kernel_;  // transform of the conjugate chirp, wrapped to m_
  ComplexVector work_;
};

// Periodic ("DFT-even") Hann window: 0.5 - 0.5 cos(2 pi i / n).
// Length 1 gives {1}.
std::vector<double> hann_window(size_t n);

} // namespace eegmon
