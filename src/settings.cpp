#include "eegmon/settings.hpp"

#include "eegmon/utils.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <initializer_list>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace eegmon {

static size_t seconds_to_samples(double sec, double fs_hz) {
  if (!(sec > 0.0) || !(fs_hz > 0.0)) return 0;
  // Truncate like int(duration * rate).
  return static_cast<size_t>(sec * fs_hz);
}

size_t Settings::display_buffer_size() const {
  return seconds_to_samples(display_duration_sec, sampling_rate_hz);
}

size_t Settings::spectrogram_buffer_size() const {
  return seconds_to_samples(spectrogram_duration_sec, sampling_rate_hz);
}

int Settings::poll_interval_ms() const {
  const int ms = update_interval_ms / 4;
  return (ms < 1) ? 1 : ms;
}

void Settings::set_sensitivity_level(int level) {
  if (level < 1 || level > 10) {
    throw std::runtime_error("sensitivity level must be in 1..10");
  }
  display.sensitivity = static_cast<double>(level) / 5.0;
}

void Settings::set_display_speed(double mm_per_sec) {
  if (!(mm_per_sec > 0.0)) throw std::runtime_error("display speed must be > 0");
  display_speed_mm_s = mm_per_sec;
  display_duration_sec = 250.0 / mm_per_sec;
}

static uint32_t to_baud(const std::string& v) {
  const int b = to_int(v);
  if (b <= 0) throw std::runtime_error("baud_rate must be > 0");
  return static_cast<uint32_t>(b);
}

void Settings::set(const std::string& key_in, const std::string& value) {
  const std::string key = to_lower(trim(key_in));
  const std::string v = trim(value);

  if (key == "serial_port") {
    serial_port = v;
  } else if (key == "baud_rate") {
    baud_rate = to_baud(v);
  } else if (key == "use_bluetooth") {
    use_bluetooth = to_bool(v);
  } else if (key == "bluetooth_device_name") {
    bluetooth_device_name = v;
  } else if (key == "sampling_rate") {
    sampling_rate_hz = to_double(v);
  } else if (key == "display_duration") {
    display_duration_sec = to_double(v);
  } else if (key == "display_speed") {
    set_display_speed(to_double(v));
  } else if (key == "update_interval_ms") {
    update_interval_ms = to_int(v);
  } else if (key == "spectrogram_duration") {
    spectrogram_duration_sec = to_double(v);
  } else if (key == "spectrogram_update_ms") {
    spectrogram_update_ms = to_int(v);
  } else if (key == "highpass") {
    filter.highpass_hz = to_double(v);
  } else if (key == "lowpass") {
    filter.lowpass_hz = to_double(v);
  } else if (key == "notch") {
    filter.notch_hz = to_double(v);
  } else if (key == "enable_filter") {
    filter.enabled = to_bool(v);
  } else if (key == "scale") {
    display.scale_uv = to_double(v);
  } else if (key == "sensitivity") {
    display.sensitivity = to_double(v);
  } else if (key == "channel_count") {
    display.channel_count = to_int(v);
  } else if (key == "recordings_dir") {
    recordings_dir = v;
  } else {
    throw std::runtime_error("Unknown settings key: " + key_in);
  }
}

void Settings::validate() const {
  if (baud_rate == 0) throw std::runtime_error("Settings: baud_rate must be > 0");
  if (!(sampling_rate_hz > 0.0)) throw std::runtime_error("Settings: sampling_rate must be > 0");
  if (!(display_duration_sec > 0.0)) throw std::runtime_error("Settings: display_duration must be > 0");
  if (!(spectrogram_duration_sec > 0.0)) {
    throw std::runtime_error("Settings: spectrogram_duration must be > 0");
  }
  if (update_interval_ms <= 0) throw std::runtime_error("Settings: update_interval_ms must be > 0");
  if (spectrogram_update_ms <= 0) throw std::runtime_error("Settings: spectrogram_update_ms must be > 0");
  if (filter.highpass_hz < 0.0) throw std::runtime_error("Settings: highpass must be >= 0");
  if (filter.lowpass_hz < 0.0) throw std::runtime_error("Settings: lowpass must be >= 0");
  if (filter.notch_hz < 0.0) throw std::runtime_error("Settings: notch must be >= 0");
  if (!(display.scale_uv > 0.0)) throw std::runtime_error("Settings: scale must be > 0");
  if (!(display.sensitivity > 0.0)) throw std::runtime_error("Settings: sensitivity must be > 0");
  if (display.channel_count < 1) throw std::runtime_error("Settings: channel_count must be >= 1");
}

// Shortest of 15 or 17 significant digits that reads back to the same value.
static std::string format_exact(double v) {
  for (int digits : {15, 17}) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(digits) << v;
    std::istringstream in(oss.str());
    in.imbue(std::locale::classic());
    double back = 0.0;
    if (digits == 17 || ((in >> back) && back == v)) return oss.str();
  }
  return std::string();
}

std::string Settings::to_text() const {
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  // display_speed precedes display_duration: loading the speed rewrites the
  // duration, and an explicit duration must win.
  oss << "# eegmon settings\n"
      << "serial_port = " << serial_port << "\n"
      << "baud_rate = " << baud_rate << "\n"
      << "use_bluetooth = " << (use_bluetooth ? "true" : "false") << "\n"
      << "bluetooth_device_name = " << bluetooth_device_name << "\n"
      << "sampling_rate = " << format_exact(sampling_rate_hz) << "\n"
      << "display_speed = " << format_exact(display_speed_mm_s) << "\n"
      << "display_duration = " << format_exact(display_duration_sec) << "\n"
      << "update_interval_ms = " << update_interval_ms << "\n"
      << "spectrogram_duration = " << format_exact(spectrogram_duration_sec) << "\n"
      << "spectrogram_update_ms = " << spectrogram_update_ms << "\n"
      << "highpass = " << format_exact(filter.highpass_hz) << "\n"
      << "lowpass = " << format_exact(filter.lowpass_hz) << "\n"
      << "notch = " << format_exact(filter.notch_hz) << "\n"
      << "enable_filter = " << (filter.enabled ? "true" : "false") << "\n"
      << "scale = " << format_exact(display.scale_uv) << "\n"
      << "sensitivity = " << format_exact(display.sensitivity) << "\n"
      << "channel_count = " << display.channel_count << "\n"
      << "recordings_dir = " << recordings_dir << "\n";
  return oss.str();
}

void apply_settings_file(const std::string& path, Settings* settings) {
  if (!settings) throw std::runtime_error("apply_settings_file: settings is null");

  std::ifstream f(std::filesystem::u8path(path));
  if (!f) throw std::runtime_error("Failed to open settings file: " + path);

  std::string line;
  size_t lineno = 0;
  while (std::getline(f, line)) {
    ++lineno;
    if (lineno == 1) line = strip_utf8_bom(line);
    const std::string t = trim(line);
    if (t.empty() || starts_with(t, "#")) continue;

    const size_t eq = t.find('=');
    if (eq == std::string::npos) {
      throw std::runtime_error(path + ":" + std::to_string(lineno) + ": expected key = value");
    }
    try {
      settings->set(t.substr(0, eq), t.substr(eq + 1));
    } catch (const std::exception& e) {
      throw std::runtime_error(path + ":" + std::to_string(lineno) + ": " + e.what());
    }
  }
}

Settings load_settings_file(const std::string& path) {
  Settings s;
  apply_settings_file(path, &s);
  return s;
}

void save_settings_file(const std::string& path, const Settings& settings) {
  if (!write_text_file(path, settings.to_text())) {
    throw std::runtime_error("Failed to write settings file: " + path);
  }
}

} // namespace eegmon
