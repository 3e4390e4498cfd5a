#include "eegmon/bandpower.hpp"

#include "eegmon/utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace eegmon {

std::vector<BandDefinition> default_eeg_bands() {
  return {
      {"delta", 0.5, 4.0},
      {"theta", 4.0, 8.0},
      {"alpha", 8.0, 13.0},
      {"beta", 13.0, 30.0},
      {"gamma", 30.0, 70.0},
  };
}

static BandDefinition parse_one_band(const std::string& token) {
  // token: name:fmin-fmax
  const auto parts = split(token, ':');
  if (parts.size() != 2) {
    throw std::runtime_error("Invalid band token (expected name:fmin-fmax): " + token);
  }
  const std::string name = trim(parts[0]);
  if (name.empty()) throw std::runtime_error("Invalid band token (empty name): " + token);
  const auto edges = split(parts[1], '-');
  if (edges.size() != 2) {
    throw std::runtime_error("Invalid band edges (expected fmin-fmax): " + token);
  }
  const double fmin = to_double(edges[0]);
  const double fmax = to_double(edges[1]);
  if (!(fmin >= 0.0 && fmax > fmin)) {
    throw std::runtime_error("Invalid band range in: " + token);
  }
  return {name, fmin, fmax};
}

std::vector<BandDefinition> parse_band_spec(const std::string& spec) {
  const std::string s = trim(spec);
  if (s.empty()) return default_eeg_bands();

  std::vector<BandDefinition> out;
  for (const auto& tok : split(s, ',')) {
    const std::string t = trim(tok);
    if (t.empty()) continue;
    out.push_back(parse_one_band(t));
  }
  if (out.empty()) return default_eeg_bands();
  return out;
}

static void check_psd(const PsdResult& psd, const char* what) {
  if (psd.freqs_hz.size() != psd.psd.size()) {
    throw std::runtime_error(std::string(what) + ": invalid psd input");
  }
}

double mean_band_density(const PsdResult& psd, double fmin_hz, double fmax_hz) {
  check_psd(psd, "mean_band_density");
  double sum = 0.0;
  size_t n = 0;
  for (size_t i = 0; i < psd.freqs_hz.size(); ++i) {
    const double f = psd.freqs_hz[i];
    if (f >= fmin_hz && f <= fmax_hz) {
      sum += psd.psd[i];
      ++n;
    }
  }
  return (n > 0) ? sum / static_cast<double>(n) : 0.0;
}

double integrate_bandpower(const PsdResult& psd, double fmin_hz, double fmax_hz) {
  check_psd(psd, "integrate_bandpower");
  if (psd.freqs_hz.size() < 2) {
    throw std::runtime_error("integrate_bandpower: invalid psd input");
  }
  if (!(fmax_hz > fmin_hz)) {
    throw std::runtime_error("integrate_bandpower: fmax must be > fmin");
  }

  auto lerp = [](double x0, double y0, double x1, double y1, double x) -> double {
    if (x1 == x0) return y0;
    const double t = (x - x0) / (x1 - x0);
    return y0 + t * (y1 - y0);
  };

  double area = 0.0;
  for (size_t i = 0; i + 1 < psd.freqs_hz.size(); ++i) {
    const double f0 = psd.freqs_hz[i];
    const double f1 = psd.freqs_hz[i + 1];
    const double p0 = psd.psd[i];
    const double p1 = psd.psd[i + 1];

    // Overlap with [fmin, fmax]
    const double a = std::max(f0, fmin_hz);
    const double b = std::min(f1, fmax_hz);
    if (b <= a) continue;

    const double pa = lerp(f0, p0, f1, p1, a);
    const double pb = lerp(f0, p0, f1, p1, b);
    area += 0.5 * (pa + pb) * (b - a);
  }
  return area;
}

BandPowers compute_band_powers(const PsdResult& psd, const std::vector<BandDefinition>& bands) {
  BandPowers out;
  out.bands = bands;
  out.power.reserve(bands.size());
  for (const auto& b : bands) {
    out.power.push_back(mean_band_density(psd, b.fmin_hz, b.fmax_hz));
  }
  return out;
}

} // namespace eegmon
