#include "eegmon/fft.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace eegmon {

static constexpr double kPi = 3.141592653589793238462643383279502884;

bool is_power_of_two(size_t n) {
  return n != 0 && (n & (n - 1)) == 0;
}

size_t next_power_of_two(size_t n) {
  if (n == 0) throw std::runtime_error("next_power_of_two: n must be > 0");
  size_t p = 1;
  while (p < n) p <<= 1;
  return p;
}

void fft_inplace(ComplexVector& a, bool inverse) {
  const size_t n = a.size();
  if (!is_power_of_two(n)) {
    throw std::runtime_error("fft_inplace: size must be a power of two, got " + std::to_string(n));
  }

  // Bit-reversal permutation, j tracks the reversed counter.
  for (size_t i = 1, j = 0; i < n; ++i) {
    size_t bit = n >> 1;
    for (; j & bit; bit >>= 1) j ^= bit;
    j ^= bit;
    if (i < j) std::swap(a[i], a[j]);
  }

  // One polar() per twiddle, no recurrence.
  const double sign = inverse ? 1.0 : -1.0;
  for (size_t half = 1; half < n; half <<= 1) {
    const double step = sign * kPi / static_cast<double>(half);
    for (size_t j = 0; j < half; ++j) {
      const std::complex<double> w = std::polar(1.0, step * static_cast<double>(j));
      for (size_t i = j; i < n; i += 2 * half) {
        const std::complex<double> v = a[i + half] * w;
        a[i + half] = a[i] - v;
        a[i] += v;
      }
    }
  }

  if (inverse) {
    const double s = 1.0 / static_cast<double>(n);
    for (auto& x : a) x *= s;
  }
}

Dft::Dft(size_t n) : n_(n) {
  if (n == 0) throw std::runtime_error("Dft: length must be > 0");
  if (is_power_of_two(n)) return;

  m_ = next_power_of_two(2 * n - 1);

  // k^2 is reduced mod 2N first: the chirp has that period, and large angles
  // lose precision in cos/sin.
  const unsigned long long period = 2ULL * static_cast<unsigned long long>(n);
  chirp_.resize(n);
  for (size_t k = 0; k < n; ++k) {
    const unsigned long long kk = static_cast<unsigned long long>(k);
    const unsigned long long k2 = (kk * kk) % period;
    chirp_[k] = std::polar(1.0, -kPi * static_cast<double>(k2) / static_cast<double>(n));
  }

  kernel_.assign(m_, std::complex<double>(0.0, 0.0));
  kernel_[0] = std::conj(chirp_[0]);
  for (size_t k = 1; k < n; ++k) {
    kernel_[k] = std::conj(chirp_[k]);
    kernel_[m_ - k] = std::conj(chirp_[k]);
  }
  fft_inplace(kernel_, false);

  work_.resize(m_);
}

void Dft::forward(ComplexVector& a) {
  if (a.size() != n_) {
    throw std::runtime_error("Dft::forward: expected " + std::to_string(n_) + " points, got " +
                             std::to_string(a.size()));
  }
  if (m_ == 0) {
    fft_inplace(a, false);
    return;
  }

  std::fill(work_.begin(), work_.end(), std::complex<double>(0.0, 0.0));
  for (size_t k = 0; k < n_; ++k) work_[k] = a[k] * chirp_[k];

  fft_inplace(work_, false);
  for (size_t k = 0; k < m_; ++k) work_[k] *= kernel_[k];
  fft_inplace(work_, true);

  for (size_t k = 0; k < n_; ++k) a[k] = work_[k] * chirp_[k];
}

std::vector<double> hann_window(size_t n) {
  std::vector<double> w(n, 1.0);
  if (n <= 1) return w;
  for (size_t i = 0; i < n; ++i) {
    w[i] = 0.5 - 0.5 * std::cos(2.0 * kPi * static_cast<double>(i) / static_cast<double>(n));
  }
  return w;
}

} // namespace eegmon
