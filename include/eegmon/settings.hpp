#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace eegmon {

struct FilterSettings {
  // 0 => disabled.
  double highpass_hz{0.5};

  // Values >= fs/2 disable the lowpass stage.
  double lowpass_hz{70.0};

  // Power line frequency. 0 => disabled.
  double notch_hz{60.0};

  bool enabled{true};
};

struct DisplaySettings {
  double scale_uv{100.0};    // microvolts per vertical division
  double sensitivity{1.0};   // amplification factor applied before display
  int channel_count{1};
};

// Runtime configuration of the monitor.
//
// Settings can be read from a small "key = value" text file:
//
//   # comment
//   serial_port = /dev/ttyUSB0
//   sampling_rate = 500
//   notch = 50
//
// Command-line flags are applied on top of the file, then validate() is called.
struct Settings {
  // Serial connection
  std::string serial_port{"/dev/ttyUSB0"};
  uint32_t baud_rate{115200};

  // Bluetooth serial headset (e.g. an rfcomm device). When use_bluetooth is
  // set, a port whose device path contains bluetooth_device_name is preferred
  // over serial_port during auto-detection.
  bool use_bluetooth{true};
  std::string bluetooth_device_name{"404-BrainNotFound"};

  double sampling_rate_hz{500.0};

  // Display
  double display_duration_sec{10.0};  // seconds of waveform shown
  double display_speed_mm_s{25.0};    // standard EEG paper speed
  int update_interval_ms{20};         // waveform refresh period

  // Spectrogram
  double spectrogram_duration_sec{30.0};
  int spectrogram_update_ms{500};

  FilterSettings filter;
  DisplaySettings display;

  std::string recordings_dir{"recordings"};

  size_t display_buffer_size() const;
  size_t spectrogram_buffer_size() const;

  // Acquisition poll period: a quarter of the display refresh, at least 1 ms.
  int poll_interval_ms() const;

  // Slider level 1..10 => sensitivity 0.2 .. 2.0.
  void set_sensitivity_level(int level);

  // Paper speed in mm/s. The window keeps the width of a 10 s page at
  // 25 mm/s, so display_duration = 250 / speed.
  void set_display_speed(double mm_per_sec);

  void disable_highpass() { filter.highpass_hz = 0.0; }
  void disable_lowpass() { filter.lowpass_hz = 0.5 * sampling_rate_hz; }
  void disable_notch() { filter.notch_hz = 0.0; }

  // Apply one "key = value" assignment. Throws on unknown keys or bad values.
  void set(const std::string& key, const std::string& value);

  // Throws std::runtime_error describing the first invalid field.
  void validate() const;

  // Serialize in the same format load_settings_file() reads.
  std::string to_text() const;
};

// Load settings from a file on top of defaults. Throws on I/O or parse errors.
Settings load_settings_file(const std::string& path);

// Apply a settings file on top of an existing Settings object.
void apply_settings_file(const std::string& path, Settings* settings);

// Write settings to a file. Throws on I/O errors.
void save_settings_file(const std::string& path, const Settings& settings);

} // namespace eegmon
