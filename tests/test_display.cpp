#include "eegmon/display.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <vector>

using namespace eegmon;

static bool approx(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

static int failures = 0;

static void check(bool cond, const char* what) {
  if (!cond) {
    std::cerr << "FAILED: " << what << "\n";
    ++failures;
  }
}

int main() {
  // Grid markers.
  {
    const std::vector<double> a = amplitude_markers(100.0);
    check(a.size() == 11, "eleven amplitude markers");
    check(a.front() == -500.0 && a[5] == 0.0 && a.back() == 500.0, "amplitude marker values");

    const std::vector<double> t4 = time_markers(4.0);
    check(t4.size() == 7 && approx(t4.front(), 0.5) && approx(t4.back(), 3.5), "half-second markers");
    check(time_markers(5.0).size() == 9, "5 s window keeps half-second markers");
    const std::vector<double> t10 = time_markers(10.0);
    check(t10.size() == 9 && approx(t10.front(), 1.0) && approx(t10.back(), 9.0), "one-second markers");
    check(time_markers(0.0).empty(), "no markers for an empty window");
  }

  // Scrolling window: keeps the last display_duration seconds.
  {
    Settings s;
    s.display_duration_sec = 2.0;
    s.display.scale_uv = 50.0;
    s.display.sensitivity = 2.0;

    std::vector<double> times;
    std::vector<double> values;
    for (int i = 0; i <= 8; ++i) {
      times.push_back(0.5 * i);
      values.push_back(static_cast<double>(i));
    }
    const WaveformFrame f = build_waveform_frame(times, values, s);
    check(f.values.size() == 5, "window sample count");
    check(approx(f.times.front(), 0.0) && approx(f.times.back(), 2.0), "window re-based to its start");
    check(f.values.front() == 8.0 && f.values.back() == 16.0, "sensitivity applied");
    check(f.x_min == 0.0 && f.x_max == 2.0, "x axis fixed to the window");
    check(f.y_min == -250.0 && f.y_max == 250.0, "y axis is five divisions each way");
    check(f.amplitude_markers.size() == 11, "frame carries amplitude markers");
    check(f.time_markers.size() == 3, "frame carries time markers");

    const WaveformFrame one = build_waveform_frame({1.0}, {3.0}, s);
    check(one.empty(), "single sample gives an empty series");
    check(one.x_max == 2.0 && one.y_max == 250.0, "axes set without data");
  }

  // Fixed window: left-padded while the buffer fills.
  {
    Settings s;
    s.sampling_rate_hz = 10.0;
    s.display_duration_sec = 1.0;
    s.display.sensitivity = 0.5;

    const WaveformFrame partial = build_fixed_waveform({2.0, 4.0, 6.0}, s);
    check(partial.values.size() == 10, "fixed window size");
    check(partial.values[6] == 0.0 && partial.values[7] == 1.0 && partial.values[9] == 3.0,
          "zeros then scaled samples");
    check(approx(partial.times.front(), 0.0) && approx(partial.times.back(), 1.0), "fixed time axis");

    std::vector<double> many;
    for (int i = 0; i < 15; ++i) many.push_back(static_cast<double>(i));
    const WaveformFrame full = build_fixed_waveform(many, s);
    check(full.values.size() == 10 && full.values.front() == 2.5 && full.values.back() == 7.0,
          "newest samples only");
  }

  {
    const std::vector<double> lines = band_boundary_lines();
    check((lines == std::vector<double>{0.5, 4.0, 8.0, 13.0, 30.0, 70.0}), "band boundaries");
  }

  const std::filesystem::path dir = std::filesystem::temp_directory_path() / "eegmon_test_display";
  std::filesystem::create_directories(dir);

  // Spectrogram image: heat map plus colorbar.
  {
    SpectrogramView v;
    v.n_frames = 4;
    v.n_freq = 101;
    for (size_t k = 0; k < v.n_freq; ++k) v.freqs_hz.push_back(static_cast<double>(k));
    for (size_t i = 0; i < v.n_frames; ++i) {
      v.times_sec.push_back(1.0 + static_cast<double>(i));
      for (size_t k = 0; k < v.n_freq; ++k) v.power_db.push_back(-static_cast<double>(k));
    }
    v.db_min = -100.0;
    v.db_max = 0.0;

    const std::string path = (dir / "spec.bmp").u8string();
    render_spectrogram_bmp(path, v);
    // 4 + 600 + 6 + 16 + 6 + ("-100": 4 * 12 + 4) + 4 wide, 20 + 280 + 20 high
    const uintmax_t row = static_cast<uintmax_t>(688) * 3;
    check(std::filesystem::file_size(std::filesystem::u8path(path)) == 54 + row * 320, "spectrogram BMP size");

    v.power_db.pop_back();
    bool threw = false;
    try {
      render_spectrogram_bmp(path, v);
    } catch (const std::exception&) {
      threw = true;
    }
    check(threw, "inconsistent spectrogram throws");
  }

  // Peak of the newest spectrogram frame, within the displayed range.
  {
    SpectrogramView v;
    check(!latest_spectral_peak(v), "no peak without frames");

    v.n_frames = 2;
    v.n_freq = 5;
    v.freqs_hz = {0.0, 25.0, 50.0, 75.0, 100.0};
    v.times_sec = {1.0, 2.0};
    v.power_db = {-10.0, -20.0, -30.0, -40.0, -50.0,
                  -60.0, -40.0, -15.0, -35.0, 0.0};
    v.min_freq_hz = 0.0;
    v.max_freq_hz = 70.0;
    const std::optional<SpectralPeak> p = latest_spectral_peak(v);
    check(p.has_value(), "peak found");
    check(approx(p->freq_hz, 50.0) && approx(p->power_db, -15.0), "100 Hz bin is out of range");
    check(approx(p->time_sec, 2.0), "peak comes from the newest frame");

    v.min_freq_hz = 200.0;
    v.max_freq_hz = 300.0;
    check(!latest_spectral_peak(v), "no bins in range");
  }

  // Waveform image.
  {
    Settings s;
    s.display_duration_sec = 1.0;
    std::vector<double> times;
    std::vector<double> values;
    for (int i = 0; i < 100; ++i) {
      times.push_back(0.01 * i);
      values.push_back(300.0 * std::sin(0.2 * i));
    }
    const std::string path = (dir / "wave.bmp").u8string();
    WaveformImageOptions opt;
    opt.width = 200;
    opt.height = 100;
    render_waveform_bmp(path, build_waveform_frame(times, values, s), opt);
    check(std::filesystem::file_size(std::filesystem::u8path(path)) == 54 + 600 * 100, "waveform BMP size");

    bool threw = false;
    try {
      render_waveform_bmp(path, WaveformFrame{});
    } catch (const std::exception&) {
      threw = true;
    }
    check(threw, "degenerate axes throw");
  }

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  if (failures) {
    std::cerr << failures << " display check(s) failed\n";
    return 1;
  }
  std::cout << "test_display OK\n";
  return 0;
}
