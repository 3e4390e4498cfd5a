#include "eegmon/acquisition_thread.hpp"
#include "eegmon/byte_source.hpp"
#include "eegmon/display.hpp"
#include "eegmon/recording_io.hpp"
#include "eegmon/serial_port.hpp"
#include "eegmon/serial_reader.hpp"
#include "eegmon/settings.hpp"
#include "eegmon/signal_processor.hpp"
#include "eegmon/utils.hpp"
#include "eegmon/version.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace eegmon;

static volatile std::sig_atomic_t g_stop = 0;

static void on_sigint(int) {
  g_stop = 1;
}

namespace {

// The waveform is not drawn until this many samples are buffered.
constexpr size_t kMinDisplaySamples = 10;

constexpr double kStatusPeriodSec = 1.0;

// Simulator sines boosted by --more-alpha / --more-beta, and the step.
constexpr size_t kAlphaComponent = 1;  // 10 Hz
constexpr size_t kBetaComponent = 2;   // 30 Hz
constexpr double kAmplitudeStep = 5.0;
constexpr double kConnectionCheckSec = 5.0;

struct Args {
  bool list_ports{false};
  bool simulate{false};
  bool test_connection{false};
  bool record{false};
  bool snapshot{false};
  bool export_csv{false};
  bool quiet{false};

  std::string port;  // empty => settings / auto-detect
  std::string replay_path;
  double replay_speed{1.0};
  bool replay_loop{false};

  std::string config_path;
  std::string save_config_path;

  double seconds{0.0};  // 0 => until interrupted

  // Simulator amplitude boosts, applied every boost_period seconds.
  int more_alpha{0};
  int more_beta{0};
  double boost_period{0.0};  // 0 => all at start

  // "key = value" overrides applied on top of the settings file, in order.
  std::vector<std::pair<std::string, std::string>> overrides;
};

void print_help() {
  std::cout
    << "eegmon_monitor_cli (headless live EEG monitor)\n\n"
    << "Usage:\n"
    << "  eegmon_monitor_cli --list-ports\n"
    << "  eegmon_monitor_cli --port /dev/ttyUSB0 --seconds 60 --record --snapshot\n"
    << "  eegmon_monitor_cli --simulate --notch 50 --seconds 10\n"
    << "  eegmon_monitor_cli --replay recordings/EEG_RECORDING_20260101-120000.dat\n\n"
    << "Source:\n"
    << "  --list-ports            List candidate serial ports and exit\n"
    << "  --port PATH|auto        Serial port (default: auto-detect)\n"
    << "  --baud N                Baud rate (default: 115200)\n"
    << "  --simulate              Use the built-in synthetic EEG generator\n"
    << "  --replay FILE.dat       Replay a raw recording at its sample rate\n"
    << "  --replay-speed X        Replay speed multiplier (default: 1)\n"
    << "  --replay-loop           Restart the replay at the end of the file\n"
    << "  --test-connection       Connect, show the first waiting bytes, and exit\n"
    << "  --more-alpha            Simulator: raise the 10 Hz amplitude by 5 (repeatable)\n"
    << "  --more-beta             Simulator: raise the 30 Hz amplitude by 5 (repeatable)\n"
    << "  --boost-every S         Apply one queued boost every S seconds (default: all at start)\n\n"
    << "Settings:\n"
    << "  --config FILE           Load key = value settings before applying flags\n"
    << "  --save-config FILE      Write the effective settings to FILE\n"
    << "  --fs HZ                 Sampling rate (default: 500)\n"
    << "  --highpass HZ|off       Highpass cutoff (default: 0.5)\n"
    << "  --lowpass HZ|off        Lowpass cutoff (default: 70)\n"
    << "  --notch HZ|off          Notch frequency (default: 60)\n"
    << "  --no-filter             Disable all filters\n"
    << "  --sensitivity-level N   Display sensitivity level 1..10 (level/5)\n"
    << "  --speed MM_S            Display speed: 12.5, 25, 50 or 100 mm/s\n"
    << "  --scale UV              Microvolts per division (default: 100)\n\n"
    << "Run:\n"
    << "  --seconds S             Stop after S seconds (default: 0 = until Ctrl+C)\n"
    << "  --record                Record raw samples while running\n"
    << "  --outdir DIR            Recordings/snapshot directory (default: recordings)\n"
    << "  --snapshot              Save spectrogram and waveform BMPs at exit\n"
    << "  --export-csv            Export the buffered samples as CSV at exit\n"
    << "  --quiet                 Only print status changes and the summary\n"
    << "  --version               Print version and exit\n"
    << "  -h, --help              Show this help\n";
}

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << version_banner("eegmon_monitor_cli") << "\n";
      std::exit(0);
    } else if (arg == "--list-ports") {
      a.list_ports = true;
    } else if (arg == "--port" && i + 1 < argc) {
      a.port = argv[++i];
    } else if (arg == "--baud" && i + 1 < argc) {
      a.overrides.emplace_back("baud_rate", argv[++i]);
    } else if (arg == "--simulate") {
      a.simulate = true;
    } else if (arg == "--replay" && i + 1 < argc) {
      a.replay_path = argv[++i];
    } else if (arg == "--replay-speed" && i + 1 < argc) {
      a.replay_speed = to_double(argv[++i]);
    } else if (arg == "--replay-loop") {
      a.replay_loop = true;
    } else if (arg == "--test-connection") {
      a.test_connection = true;
    } else if (arg == "--more-alpha") {
      ++a.more_alpha;
    } else if (arg == "--more-beta") {
      ++a.more_beta;
    } else if (arg == "--boost-every" && i + 1 < argc) {
      a.boost_period = to_double(argv[++i]);
    } else if (arg == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
    } else if (arg == "--save-config" && i + 1 < argc) {
      a.save_config_path = argv[++i];
    } else if (arg == "--fs" && i + 1 < argc) {
      a.overrides.emplace_back("sampling_rate", argv[++i]);
    } else if (arg == "--highpass" && i + 1 < argc) {
      a.overrides.emplace_back("highpass", argv[++i]);
    } else if (arg == "--lowpass" && i + 1 < argc) {
      a.overrides.emplace_back("lowpass", argv[++i]);
    } else if (arg == "--notch" && i + 1 < argc) {
      a.overrides.emplace_back("notch", argv[++i]);
    } else if (arg == "--no-filter") {
      a.overrides.emplace_back("enable_filter", "false");
    } else if (arg == "--sensitivity-level" && i + 1 < argc) {
      a.overrides.emplace_back("sensitivity_level", argv[++i]);
    } else if (arg == "--speed" && i + 1 < argc) {
      a.overrides.emplace_back("display_speed", argv[++i]);
    } else if (arg == "--scale" && i + 1 < argc) {
      a.overrides.emplace_back("scale", argv[++i]);
    } else if (arg == "--outdir" && i + 1 < argc) {
      a.overrides.emplace_back("recordings_dir", argv[++i]);
    } else if (arg == "--seconds" && i + 1 < argc) {
      a.seconds = to_double(argv[++i]);
    } else if (arg == "--record") {
      a.record = true;
    } else if (arg == "--snapshot") {
      a.snapshot = true;
    } else if (arg == "--export-csv") {
      a.export_csv = true;
    } else if (arg == "--quiet") {
      a.quiet = true;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

bool is_off(const std::string& v) {
  const std::string t = to_lower(trim(v));
  return t == "off" || t == "none";
}

// Flag overrides. "off" is accepted for the three filter cutoffs.
void apply_override(Settings* s, const std::string& key, const std::string& value) {
  try {
    if (key == "highpass" && is_off(value)) {
      s->disable_highpass();
    } else if (key == "lowpass" && is_off(value)) {
      s->disable_lowpass();
    } else if (key == "notch" && is_off(value)) {
      s->disable_notch();
    } else if (key == "sensitivity_level") {
      s->set_sensitivity_level(to_int(value));
    } else {
      s->set(key, value);
    }
  } catch (const std::exception& e) {
    throw std::runtime_error("--" + key + " " + value + ": " + e.what());
  }
}

// The replay's sidecar knows the rate it was recorded at.
void apply_replay_metadata(const std::string& replay_path, Settings* s) {
  const std::string meta_path = metadata_path_for(replay_path);
  if (!file_exists(meta_path)) return;
  const Metadata meta = load_metadata(meta_path);
  const std::string fs = metadata_value(meta, "sample_rate");
  if (fs.empty()) return;
  try {
    s->sampling_rate_hz = to_double(fs);
  } catch (const std::exception& e) {
    std::cerr << "Warning: ignoring sample_rate in " << meta_path << ": " << e.what() << "\n";
  }
}

void print_ports(const Settings& s) {
  const std::vector<PortInfo> ports = list_serial_ports(s);
  if (ports.empty()) {
    std::cout << "No serial ports found.\n";
  }
  for (const auto& p : ports) {
    std::cout << p.device << " - " << p.description;
    if (p.is_bluetooth) std::cout << " [bluetooth]";
    std::cout << "\n";
  }
  std::cout << "Auto-detect would use: " << find_eeg_device(s, ports) << "\n";
}

double peak_to_peak(const std::vector<double>& v) {
  if (v.empty()) return 0.0;
  const auto mm = std::minmax_element(v.begin(), v.end());
  return *mm.second - *mm.first;
}

std::string format_status(double elapsed, const SerialReader& reader,
                          const SignalProcessor& proc, const Settings& s) {
  std::vector<double> values;
  std::vector<double> times;
  reader.get_data(&values, &times);

  char head[128];
  std::snprintf(head, sizeof(head), "[%7.1fs] samples=%llu buffered=%zu", elapsed,
                static_cast<unsigned long long>(reader.total_samples()), values.size());
  std::string line = head;
  if (values.size() < kMinDisplaySamples) return line;

  const std::vector<double> filtered = proc.apply_filters(values);
  const WaveformFrame frame = build_waveform_frame(times, filtered, s);

  char buf[64];
  std::snprintf(buf, sizeof(buf), " p2p=%.1fuV", peak_to_peak(frame.values));
  line += buf;

  const BandPowers bp = proc.calculate_bands(filtered);
  for (size_t i = 0; i < bp.size(); ++i) {
    std::snprintf(buf, sizeof(buf), " %s=%.3g", bp.bands[i].name.c_str(), bp.power[i]);
    line += buf;
  }
  return line;
}

// Dominant frequency of the newest spectrogram frame.
std::optional<std::string> format_spectrogram_status(const SerialReader& reader,
                                                     const SignalProcessor& proc) {
  std::vector<double> values;
  std::vector<double> times;
  reader.get_data(&values, &times);
  if (values.size() < kMinDisplaySamples) return std::nullopt;

  const std::optional<SpectrogramView> view = proc.calculate_spectrogram(proc.apply_filters(values));
  if (!view) return std::nullopt;
  const std::optional<SpectralPeak> peak = latest_spectral_peak(*view);
  if (!peak) return std::nullopt;

  char buf[128];
  std::snprintf(buf, sizeof(buf), "  spectrogram: frames=%zu peak=%.1f Hz (%.1f dB)", view->n_frames,
                peak->freq_hz, peak->power_db);
  return std::string(buf);
}

void save_snapshots(const SerialReader& reader, const SignalProcessor& proc, const Settings& s) {
  std::vector<double> values;
  std::vector<double> times;
  reader.get_data(&values, &times);
  if (values.size() < kMinDisplaySamples) {
    std::cerr << "Warning: not enough data for a snapshot (" << values.size() << " samples)\n";
    return;
  }

  const std::vector<double> filtered = proc.apply_filters(values);

  const std::optional<SpectrogramView> view = proc.calculate_spectrogram(filtered);
  if (view) {
    const std::string path = generate_filename(s.recordings_dir, "EEG_SPEC", ".bmp");
    render_spectrogram_bmp(path, *view);
    std::cout << "Wrote: " << path << "\n";
  } else {
    std::cerr << "Warning: spectrogram needs at least one second of data\n";
  }

  const WaveformFrame frame = build_waveform_frame(times, filtered, s);
  const std::string wave_path = generate_filename(s.recordings_dir, "EEG_WAVE", ".bmp");
  render_waveform_bmp(wave_path, frame);
  std::cout << "Wrote: " << wave_path << "\n";
}

void export_buffer(const SerialReader& reader, const Settings& s) {
  std::vector<double> values;
  std::vector<double> times;
  reader.get_data(&values, &times);
  if (values.empty()) {
    std::cerr << "Warning: no data to export\n";
    return;
  }
  const ActionResult r = export_csv(values, times, generate_filename(s.recordings_dir, "EEG_EXPORT", ".csv"));
  if (r.ok) {
    std::cout << r.message << "\n";
  } else {
    std::cerr << "Warning: " << r.message << "\n";
  }
}

std::unique_ptr<ByteSource> make_source(const Args& args, const Settings& s) {
  if (args.simulate) {
    SyntheticEegOptions opt;
    opt.fs_hz = s.sampling_rate_hz;
    return std::make_unique<SyntheticByteSource>(opt);
  }
  if (!args.replay_path.empty()) {
    return std::make_unique<FileByteSource>(args.replay_path, s.sampling_rate_hz, args.replay_speed,
                                            args.replay_loop);
  }
  return nullptr;
}

} // namespace

int main(int argc, char** argv) {
  try {
    Args args = parse_args(argc, argv);
    if (args.simulate && !args.replay_path.empty()) {
      throw std::runtime_error("--simulate and --replay are mutually exclusive");
    }
    if (args.seconds < 0.0) throw std::runtime_error("--seconds must be >= 0");
    if ((args.more_alpha > 0 || args.more_beta > 0) && !args.simulate) {
      throw std::runtime_error("--more-alpha and --more-beta need --simulate");
    }
    if (args.boost_period < 0.0) throw std::runtime_error("--boost-every must be >= 0");
    if (!(args.replay_speed > 0.0)) throw std::runtime_error("--replay-speed must be > 0");

    Settings settings;
    if (!args.config_path.empty()) apply_settings_file(args.config_path, &settings);
    if (!args.replay_path.empty()) apply_replay_metadata(args.replay_path, &settings);
    for (const auto& kv : args.overrides) apply_override(&settings, kv.first, kv.second);
    settings.validate();

    if (!args.save_config_path.empty()) {
      save_settings_file(args.save_config_path, settings);
      std::cout << "Wrote: " << args.save_config_path << "\n";
    }

    if (args.list_ports) {
      print_ports(settings);
      return 0;
    }

    if (!is_supported_baud_rate(settings.baud_rate)) {
      std::cerr << "Warning: baud rate " << settings.baud_rate
                << " is not supported by the serial driver\n";
    }

    SerialReader reader(settings);
    reader.set_connection_callback([](bool connected, const std::string& message) {
      std::cout << (connected ? "[connected] " : "[disconnected] ") << message << "\n";
    });

    std::unique_ptr<ByteSource> source = make_source(args, settings);
    const ActionResult connected =
        source ? reader.connect_source(std::move(source)) : reader.connect(args.port);
    if (!connected.ok) throw std::runtime_error(connected.message);

    if (args.test_connection) {
      // Give the device a moment to fill the input queue.
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      const ActionResult r = reader.test_connection();
      std::cout << r.message << "\n";
      reader.disconnect();
      return r.ok ? 0 : 1;
    }

    SignalProcessor proc(settings);

    if (args.record) {
      const ActionResult r = reader.start_recording();
      if (r.ok) {
        std::cout << r.message << "\n";
      } else {
        std::cerr << "Warning: " << r.message << "\n";
      }
    }

    // Boosts, alpha first, one per period (or all now when no period is set).
    std::vector<size_t> boosts(static_cast<size_t>(args.more_alpha), kAlphaComponent);
    boosts.insert(boosts.end(), static_cast<size_t>(args.more_beta), kBetaComponent);
    size_t next_boost = 0;
    auto apply_boost = [&]() {
      const ActionResult r = reader.adjust_simulator_amplitude(boosts[next_boost++], kAmplitudeStep);
      if (r.ok) {
        std::cout << r.message << "\n";
      } else {
        std::cerr << "Warning: " << r.message << "\n";
      }
    };
    if (args.boost_period <= 0.0) {
      while (next_boost < boosts.size()) apply_boost();
    }

    std::signal(SIGINT, on_sigint);

    AcquisitionThread worker(&reader, settings.poll_interval_ms());
    worker.start();

    const double t0 = monotonic_seconds();
    double next_status = kStatusPeriodSec;
    double next_check = kConnectionCheckSec;
    const double spectrogram_period = settings.spectrogram_update_ms / 1000.0;
    double next_spectrogram = spectrogram_period;
    double next_boost_at = args.boost_period;
    while (!g_stop) {
      std::this_thread::sleep_for(std::chrono::milliseconds(settings.update_interval_ms));
      const double elapsed = monotonic_seconds() - t0;

      if (!worker.running() || !reader.is_connected()) break;
      if (args.seconds > 0.0 && elapsed >= args.seconds) break;

      if (elapsed >= next_status) {
        next_status += kStatusPeriodSec;
        if (!args.quiet) std::cout << format_status(elapsed, reader, proc, settings) << "\n";
      }
      if (elapsed >= next_spectrogram) {
        next_spectrogram += spectrogram_period;
        if (!args.quiet) {
          const std::optional<std::string> line = format_spectrogram_status(reader, proc);
          if (line) std::cout << *line << "\n";
        }
      }
      if (next_boost < boosts.size() && elapsed >= next_boost_at) {
        next_boost_at += args.boost_period;
        apply_boost();
      }
      if (elapsed >= next_check) {
        next_check += kConnectionCheckSec;
        const ActionResult st = reader.connection_status();
        if (!st.ok) {
          std::cerr << "Warning: " << st.message << "\n";
        } else if (!args.quiet) {
          std::cout << "Connection: " << st.message << "\n";
        }
      }
    }
    const double wall = monotonic_seconds() - t0;

    worker.stop();
    if (!worker.last_error().empty()) {
      std::cerr << "Warning: acquisition stopped: " << worker.last_error() << "\n";
    }

    if (reader.is_recording()) {
      const ActionResult r = reader.stop_recording();
      if (r.ok) {
        std::cout << r.message << "\n";
      } else {
        std::cerr << "Warning: " << r.message << "\n";
      }
    }

    if (args.snapshot) save_snapshots(reader, proc, settings);
    if (args.export_csv) export_buffer(reader, settings);

    const uint64_t total = reader.total_samples();
    reader.disconnect();

    std::cout << "Summary: " << total << " samples in " << wall << " s";
    if (wall > 0.0) {
      std::cout << " (" << static_cast<double>(total) / wall << " samples/s, nominal "
                << settings.sampling_rate_hz << ")";
    }
    std::cout << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
