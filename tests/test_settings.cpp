#include "eegmon/settings.hpp"
#include "eegmon/utils.hpp"

#include "test_support.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>

using namespace eegmon;

static bool nearly(double a, double b, double eps = 1e-12) {
  return std::fabs(a - b) <= eps;
}

template <typename F>
static bool throws(F&& f) {
  try {
    f();
  } catch (const std::exception&) {
    return true;
  }
  return false;
}

int main() {
  // Defaults and derived sizes.
  {
    Settings s;
    assert(s.serial_port == "/dev/ttyUSB0");
    assert(s.baud_rate == 115200);
    assert(s.sampling_rate_hz == 500.0);
    assert(s.display_buffer_size() == 5000);
    assert(s.spectrogram_buffer_size() == 15000);
    assert(s.poll_interval_ms() == 5);
    assert(s.filter.enabled);
    s.validate();

    s.update_interval_ms = 2;
    assert(s.poll_interval_ms() == 1);
  }

  // Control mappings.
  {
    Settings s;
    s.set_sensitivity_level(1);
    assert(nearly(s.display.sensitivity, 0.2));
    s.set_sensitivity_level(10);
    assert(nearly(s.display.sensitivity, 2.0));
    assert(throws([&] { s.set_sensitivity_level(11); }));

    s.set_display_speed(12.5);
    assert(nearly(s.display_duration_sec, 20.0));
    assert(s.display_buffer_size() == 10000);
    s.set_display_speed(100.0);
    assert(nearly(s.display_duration_sec, 2.5));
    assert(s.display_buffer_size() == 1250);

    s.disable_lowpass();
    assert(s.filter.lowpass_hz == 250.0);
    s.disable_highpass();
    s.disable_notch();
    assert(s.filter.highpass_hz == 0.0 && s.filter.notch_hz == 0.0);
  }

  // Buffer sizes truncate.
  {
    Settings s;
    s.sampling_rate_hz = 256.0;
    s.display_duration_sec = 2.5;
    assert(s.display_buffer_size() == 640);
    s.display_duration_sec = 0.003;
    assert(s.display_buffer_size() == 0);
  }

  // key = value assignments.
  {
    Settings s;
    s.set("Notch", " 50 ");
    assert(s.filter.notch_hz == 50.0);
    s.set("enable_filter", "off");
    assert(!s.filter.enabled);
    s.set("use_bluetooth", "no");
    assert(!s.use_bluetooth);
    s.set("display_speed", "50");
    assert(nearly(s.display_duration_sec, 5.0));
    assert(throws([&] { s.set("bogus", "1"); }));
    assert(throws([&] { s.set("baud_rate", "fast"); }));
    assert(throws([&] { s.set("baud_rate", "0"); }));
  }

  // Validation.
  {
    Settings s;
    s.sampling_rate_hz = 0.0;
    assert(throws([&] { s.validate(); }));
    s = Settings();
    s.display.sensitivity = 0.0;
    assert(throws([&] { s.validate(); }));
    s = Settings();
    s.filter.notch_hz = -1.0;
    assert(throws([&] { s.validate(); }));
    s = Settings();
    s.display.channel_count = 0;
    assert(throws([&] { s.validate(); }));
  }

  // File round trip, comments, BOM, and error locations.
  {
    const std::string dir = (std::filesystem::temp_directory_path() / "eegmon_test_settings").u8string();
    ensure_directory(dir);

    Settings s;
    s.serial_port = "/dev/rfcomm0";
    s.sampling_rate_hz = 250.0;
    s.set_display_speed(50.0);
    s.filter.notch_hz = 50.0;
    s.display.scale_uv = 75.5;
    s.recordings_dir = "/tmp/rec";
    const std::string path = join_path(dir, "settings.txt");
    save_settings_file(path, s);

    const Settings r = load_settings_file(path);
    assert(r.serial_port == "/dev/rfcomm0");
    assert(r.sampling_rate_hz == 250.0);
    assert(nearly(r.display_duration_sec, 5.0));
    assert(nearly(r.display_speed_mm_s, 50.0));
    assert(r.filter.notch_hz == 50.0);
    assert(r.display.scale_uv == 75.5);
    assert(r.recordings_dir == "/tmp/rec");
    assert(r.to_text() == s.to_text());

    // Full double precision survives the file.
    Settings precise;
    precise.filter.highpass_hz = 0.123456789;
    precise.filter.lowpass_hz = 100.0 / 3.0;
    precise.display.sensitivity = 0.1;
    const std::string precise_path = join_path(dir, "precise.txt");
    save_settings_file(precise_path, precise);
    const Settings q = load_settings_file(precise_path);
    assert(q.filter.highpass_hz == 0.123456789);
    assert(q.filter.lowpass_hz == 100.0 / 3.0);
    assert(q.display.sensitivity == 0.1);
    const std::string text = precise.to_text();
    assert(text.find("highpass = 0.123456789\n") != std::string::npos);
    assert(text.find("sensitivity = 0.1\n") != std::string::npos);
    assert(text.find("sampling_rate = 500\n") != std::string::npos);

    const std::string p2 = join_path(dir, "partial.txt");
    assert(write_text_file(p2, "\xEF\xBB\xBF# header\n\nlowpass = 40\n  # indented comment\nhighpass=1\n"));
    Settings base;
    base.baud_rate = 57600;
    apply_settings_file(p2, &base);
    assert(base.filter.lowpass_hz == 40.0);
    assert(base.filter.highpass_hz == 1.0);
    assert(base.baud_rate == 57600);

    const std::string p3 = join_path(dir, "bad.txt");
    assert(write_text_file(p3, "notch = 50\nunknown_key = 1\n"));
    bool threw = false;
    try {
      (void)load_settings_file(p3);
    } catch (const std::exception& e) {
      threw = true;
      const std::string msg = e.what();
      assert(msg.find(":2:") != std::string::npos);
      assert(msg.find("unknown_key") != std::string::npos);
    }
    assert(threw);

    assert(throws([&] { (void)load_settings_file(join_path(dir, "missing.txt")); }));

    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::u8path(dir), ec);
  }

  std::cout << "test_settings OK\n";
  return 0;
}
