#include "eegmon/display.hpp"

#include "eegmon/bandpower.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace eegmon {

std::vector<double> amplitude_markers(double scale_uv) {
  std::vector<double> out;
  out.reserve(11);
  for (int i = -5; i <= 5; ++i) out.push_back(static_cast<double>(i) * scale_uv);
  return out;
}

std::vector<double> time_markers(double display_duration_sec) {
  std::vector<double> out;
  if (!(display_duration_sec > 0.0)) return out;
  const double interval = (display_duration_sec <= 5.0) ? 0.5 : 1.0;
  for (int k = 1;; ++k) {
    const double t = interval * static_cast<double>(k);
    if (t >= display_duration_sec - 1e-9) break;
    out.push_back(t);
  }
  return out;
}

std::optional<SpectralPeak> latest_spectral_peak(const SpectrogramView& view) {
  if (view.n_frames == 0 || view.freqs_hz.size() != view.n_freq ||
      view.power_db.size() != view.n_frames * view.n_freq) {
    return std::nullopt;
  }
  const size_t frame = view.n_frames - 1;
  std::optional<SpectralPeak> best;
  for (size_t k = 0; k < view.n_freq; ++k) {
    const double f = view.freqs_hz[k];
    if (f < view.min_freq_hz || f > view.max_freq_hz) continue;
    const double db = view.at(frame, k);
    if (!best || db > best->power_db) {
      SpectralPeak p;
      p.time_sec = frame < view.times_sec.size() ? view.times_sec[frame] : 0.0;
      p.freq_hz = f;
      p.power_db = db;
      best = p;
    }
  }
  return best;
}

static WaveformFrame empty_frame(const Settings& settings) {
  WaveformFrame f;
  f.x_min = 0.0;
  f.x_max = settings.display_duration_sec;
  f.y_min = -5.0 * settings.display.scale_uv;
  f.y_max = 5.0 * settings.display.scale_uv;
  f.amplitude_markers = amplitude_markers(settings.display.scale_uv);
  f.time_markers = time_markers(settings.display_duration_sec);
  return f;
}

WaveformFrame build_waveform_frame(const std::vector<double>& times,
                                   const std::vector<double>& values,
                                   const Settings& settings) {
  WaveformFrame f = empty_frame(settings);
  const size_t n = std::min(times.size(), values.size());
  if (n < 2) return f;

  const double window_start = times[n - 1] - settings.display_duration_sec;
  const double gain = settings.display.sensitivity;
  for (size_t i = 0; i < n; ++i) {
    if (times[i] < window_start) continue;
    f.times.push_back(times[i] - window_start);
    f.values.push_back(values[i] * gain);
  }
  return f;
}

WaveformFrame build_fixed_waveform(const std::vector<double>& values, const Settings& settings) {
  WaveformFrame f = empty_frame(settings);
  const size_t size = settings.display_buffer_size();
  if (size == 0) return f;

  const size_t take = std::min(size, values.size());
  const size_t pad = size - take;
  const double gain = settings.display.sensitivity;

  f.values.assign(pad, 0.0);
  for (size_t i = values.size() - take; i < values.size(); ++i) {
    f.values.push_back(values[i] * gain);
  }

  f.times.resize(size);
  const double denom = (size > 1) ? static_cast<double>(size - 1) : 1.0;
  for (size_t i = 0; i < size; ++i) {
    f.times[i] = settings.display_duration_sec * static_cast<double>(i) / denom;
  }
  return f;
}

std::vector<double> band_boundary_lines() {
  std::vector<double> out;
  const std::vector<BandDefinition> bands = default_eeg_bands();
  for (const auto& b : bands) out.push_back(b.fmin_hz);
  if (!bands.empty()) out.push_back(bands.back().fmax_hz);
  return out;
}

void render_spectrogram_bmp(const std::string& path,
                            const SpectrogramView& view,
                            const SpectrogramImageOptions& opt) {
  if (view.n_frames == 0 || view.n_freq == 0 ||
      view.power_db.size() != view.n_frames * view.n_freq ||
      view.freqs_hz.size() != view.n_freq) {
    throw std::runtime_error("render_spectrogram_bmp: empty or inconsistent spectrogram");
  }
  const double fmin = view.min_freq_hz;
  const double fmax = view.max_freq_hz;
  if (!(fmax > fmin)) throw std::runtime_error("render_spectrogram_bmp: invalid frequency range");

  double vmin = view.db_min;
  double vmax = view.db_max;
  if (!(vmax > vmin)) vmax = vmin + 1e-12;

  const int w = opt.width;
  const int h = opt.height;
  Canvas img(w, h, RGB{0, 0, 0});

  const double df = (view.n_freq > 1) ? (view.freqs_hz[1] - view.freqs_hz[0]) : 1.0;
  const double f_per_row = (fmax - fmin) / static_cast<double>(h);

  for (int y = 0; y < h; ++y) {
    const double f = fmax - (static_cast<double>(y) + 0.5) * f_per_row;
    long k = std::lround((f - view.freqs_hz[0]) / df);
    k = std::max(0L, std::min(k, static_cast<long>(view.n_freq) - 1));
    for (int x = 0; x < w; ++x) {
      const size_t frame = std::min(view.n_frames - 1,
                                    static_cast<size_t>(x) * view.n_frames / static_cast<size_t>(w));
      const double t01 = (view.at(frame, static_cast<size_t>(k)) - vmin) / (vmax - vmin);
      img.set_pixel(x, y, colormap_heat(t01));
    }
  }

  auto row_of = [&](double f) {
    return static_cast<int>(std::lround((fmax - f) / (fmax - fmin) * static_cast<double>(h - 1)));
  };

  if (opt.draw_band_lines) {
    for (double f : band_boundary_lines()) {
      if (f < fmin || f > fmax) continue;
      img.draw_dashed_hline(0, w - 1, row_of(f), opt.line_color);
    }
  }

  if (opt.draw_band_labels) {
    for (const auto& b : default_eeg_bands()) {
      const double mid = 0.5 * (b.fmin_hz + b.fmax_hz);
      if (mid < fmin || mid > fmax || b.name.empty()) continue;
      const std::string label(1, static_cast<char>(std::toupper(static_cast<unsigned char>(b.name[0]))));
      img.draw_text(3, row_of(mid) - 3, label, opt.line_color);
    }
  }

  write_bmp24_with_vertical_colorbar(path, img, vmin, vmax, opt.colorbar);
}

void render_waveform_bmp(const std::string& path,
                         const WaveformFrame& frame,
                         const WaveformImageOptions& opt) {
  if (!(frame.x_max > frame.x_min) || !(frame.y_max > frame.y_min)) {
    throw std::runtime_error("render_waveform_bmp: invalid axis range");
  }

  const int w = opt.width;
  const int h = opt.height;
  Canvas img(w, h, opt.background);

  auto px = [&](double t) {
    return static_cast<int>(std::lround((t - frame.x_min) / (frame.x_max - frame.x_min) * static_cast<double>(w - 1)));
  };
  auto py = [&](double v) {
    const double y = (frame.y_max - v) / (frame.y_max - frame.y_min) * static_cast<double>(h - 1);
    return static_cast<int>(std::lround(std::max(0.0, std::min(y, static_cast<double>(h - 1)))));
  };

  for (double a : frame.amplitude_markers) {
    if (a < frame.y_min || a > frame.y_max) continue;
    if (a == 0.0) {
      img.draw_line(0, py(a), w - 1, py(a), opt.zero_line);
    } else {
      img.draw_dashed_hline(0, w - 1, py(a), opt.grid);
    }
  }
  for (double t : frame.time_markers) {
    img.draw_dashed_vline(px(t), 0, h - 1, opt.grid);
  }

  const size_t n = std::min(frame.times.size(), frame.values.size());
  for (size_t i = 1; i < n; ++i) {
    img.draw_line(px(frame.times[i - 1]), py(frame.values[i - 1]),
                  px(frame.times[i]), py(frame.values[i]), opt.trace);
  }

  write_bmp24(path, img.width, img.height, img.pixels);
}

} // namespace eegmon
