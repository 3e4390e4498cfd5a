#pragma once

#include "eegmon/bmp_writer.hpp"
#include "eegmon/settings.hpp"
#include "eegmon/signal_processor.hpp"
#include "eegmon/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace eegmon {

// A waveform window ready to plot: series plus fixed axes and grid.
struct WaveformFrame {
  std::vector<double> times;   // seconds from the left edge of the window
  std::vector<double> values;  // scaled by the display sensitivity

  double x_min{0.0};
  double x_max{0.0};
  double y_min{0.0};
  double y_max{0.0};

  std::vector<double> amplitude_markers;  // horizontal grid lines
  std::vector<double> time_markers;       // vertical grid lines

  bool empty() const { return values.empty(); }
};

// i * scale for i in -5..5.
std::vector<double> amplitude_markers(double scale_uv);

// Every 0.5 s for windows up to 5 s, otherwise every second, strictly inside
// (0, duration).
std::vector<double> time_markers(double display_duration_sec);

// Scrolling window ending at the newest sample: keeps samples with
// t >= t_last - display_duration and re-bases their time to the window start.
// With fewer than two samples the series is empty but the axes are set.
WaveformFrame build_waveform_frame(const std::vector<double>& times,
                                   const std::vector<double>& values,
                                   const Settings& settings);

// The last display_buffer_size samples on a fixed 0..display_duration axis,
// left-padded with zeros while the buffer fills.
WaveformFrame build_fixed_waveform(const std::vector<double>& values, const Settings& settings);

// Horizontal lines drawn over the spectrogram: the lower edge of every
// default band plus the top of the highest one.
std::vector<double> band_boundary_lines();

// Strongest bin of the newest frame inside [min_freq_hz, max_freq_hz].
struct SpectralPeak {
  double time_sec{0.0};
  double freq_hz{0.0};
  double power_db{0.0};
};

// nullopt when the view has no frames or no bin in range.
std::optional<SpectralPeak> latest_spectral_peak(const SpectrogramView& view);

struct SpectrogramImageOptions {
  int width{600};
  int height{280};
  bool draw_band_lines{true};
  bool draw_band_labels{true};
  RGB line_color{255, 255, 255};
  VerticalColorbarOptions colorbar{};
};

// Heat map of power_db over [min_freq_hz, max_freq_hz] (low frequencies at
// the bottom, time left to right) with a dB colorbar.
void render_spectrogram_bmp(const std::string& path,
                            const SpectrogramView& view,
                            const SpectrogramImageOptions& opt = SpectrogramImageOptions{});

struct WaveformImageOptions {
  int width{800};
  int height{300};
  RGB background{0, 0, 0};
  RGB trace{255, 255, 0};
  RGB grid{90, 90, 90};
  RGB zero_line{200, 200, 200};
};

void render_waveform_bmp(const std::string& path,
                         const WaveformFrame& frame,
                         const WaveformImageOptions& opt = WaveformImageOptions{});

} // namespace eegmon
