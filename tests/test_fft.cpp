#include "eegmon/fft.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <iostream>
#include <vector>

static bool approx(double a, double b, double eps = 1e-9) {
  return (a > b ? a - b : b - a) <= eps;
}

int main() {
  using namespace eegmon;

  TEST_CHECK(is_power_of_two(1));
  TEST_CHECK(is_power_of_two(1024));
  TEST_CHECK(!is_power_of_two(0));
  TEST_CHECK(!is_power_of_two(1000));
  TEST_CHECK(next_power_of_two(1000) == 1024);
  TEST_CHECK(next_power_of_two(1024) == 1024);
  TEST_CHECK(next_power_of_two(1) == 1);

  // FFT of impulse should be all ones
  {
    std::vector<std::complex<double>> a(4);
    a[0] = {1.0, 0.0};

    fft_inplace(a, false);
    for (auto& x : a) {
      TEST_CHECK(approx(x.real(), 1.0, 1e-9));
      TEST_CHECK(approx(x.imag(), 0.0, 1e-9));
    }

    fft_inplace(a, true);
    TEST_CHECK(approx(a[0].real(), 1.0, 1e-9));
    TEST_CHECK(approx(a[1].real(), 0.0, 1e-9));
    TEST_CHECK(approx(a[2].real(), 0.0, 1e-9));
    TEST_CHECK(approx(a[3].real(), 0.0, 1e-9));
  }

  // A cosine on bin 3 puts N/2 into bins 3 and N-3.
  {
    const size_t n = 32;
    const double pi = std::acos(-1.0);
    std::vector<std::complex<double>> a(n);
    for (size_t i = 0; i < n; ++i) {
      a[i] = {std::cos(2.0 * pi * 3.0 * static_cast<double>(i) / static_cast<double>(n)), 0.0};
    }
    fft_inplace(a, false);
    for (size_t k = 0; k < n; ++k) {
      const double mag = std::abs(a[k]);
      if (k == 3 || k == n - 3) {
        TEST_CHECK(approx(mag, 16.0, 1e-9));
      } else {
        TEST_CHECK(mag < 1e-9);
      }
    }
  }

  // Non power-of-two sizes are rejected.
  {
    std::vector<std::complex<double>> a(6);
    bool threw = false;
    try {
      fft_inplace(a, false);
    } catch (const std::exception&) {
      threw = true;
    }
    TEST_CHECK(threw);
  }

  // Periodic Hann: zero at the start only, peak at n/2.
  {
    const std::vector<double> w = hann_window(4);
    TEST_CHECK(w.size() == 4);
    TEST_CHECK(approx(w[0], 0.0));
    TEST_CHECK(approx(w[1], 0.5));
    TEST_CHECK(approx(w[2], 1.0));
    TEST_CHECK(approx(w[3], 0.5));
    TEST_CHECK(hann_window(1).size() == 1 && hann_window(1)[0] == 1.0);
  }

  // Dft matches a direct O(N^2) transform at lengths that are not powers of two.
  {
    const double pi = std::acos(-1.0);
    const size_t sizes[] = {6, 7, 1000, 16};
    for (size_t n : sizes) {
      ComplexVector x(n);
      for (size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i);
        x[i] = {std::sin(0.37 * t) + 0.25 * std::cos(1.9 * t), 0.1 * t};
      }

      ComplexVector ref(n);
      for (size_t k = 0; k < n; ++k) {
        std::complex<double> acc(0.0, 0.0);
        for (size_t i = 0; i < n; ++i) {
          const double ang = -2.0 * pi * static_cast<double>((k * i) % n) / static_cast<double>(n);
          acc += x[i] * std::polar(1.0, ang);
        }
        ref[k] = acc;
      }

      Dft dft(n);
      TEST_CHECK(dft.size() == n);
      dft.forward(x);
      double max_err = 0.0;
      double max_ref = 0.0;
      for (size_t k = 0; k < n; ++k) {
        max_err = std::max(max_err, std::abs(x[k] - ref[k]));
        max_ref = std::max(max_ref, std::abs(ref[k]));
      }
      TEST_CHECK(max_err <= 1e-9 * max_ref);
    }
  }

  // Dft rejects inputs of the wrong length and a zero size.
  {
    Dft dft(10);
    ComplexVector a(12);
    bool threw = false;
    try {
      dft.forward(a);
    } catch (const std::exception&) {
      threw = true;
    }
    TEST_CHECK(threw);

    threw = false;
    try {
      Dft zero(0);
    } catch (const std::exception&) {
      threw = true;
    }
    TEST_CHECK(threw);
  }

  std::cout << "All tests passed.\n";
  return 0;
}
