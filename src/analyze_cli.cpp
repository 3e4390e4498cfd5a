#include "eegmon/bandpower.hpp"
#include "eegmon/display.hpp"
#include "eegmon/recording_io.hpp"
#include "eegmon/settings.hpp"
#include "eegmon/signal_processor.hpp"
#include "eegmon/utils.hpp"
#include "eegmon/version.hpp"
#include "eegmon/welch_psd.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <locale>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace eegmon;

struct Args {
  std::string input_path;
  std::string outdir{"out"};
  std::string config_path;

  double fs_hz{0.0};  // 0 => sidecar sample_rate, else the settings default

  std::string bands;  // empty => default EEG bands

  double waveform_start_sec{0.0};

  bool export_csv{true};
  bool spectrogram_csv{true};

  std::vector<std::pair<std::string, std::string>> overrides;
};

static void print_help() {
  std::cout
    << "eegmon_analyze_cli (offline analysis of a raw eegmon recording)\n\n"
    << "Usage:\n"
    << "  eegmon_analyze_cli --input recordings/EEG_RECORDING_20260101-120000.dat --outdir out\n"
    << "  eegmon_analyze_cli --input rec.dat --fs 250 --notch 50 --bands alpha:8-12,beta:13-30\n\n"
    << "Options:\n"
    << "  --input PATH            Raw int16 little-endian recording (.dat)\n"
    << "  --outdir DIR            Output directory (default: out)\n"
    << "  --config FILE           Load key = value settings (filters, display)\n"
    << "  --fs HZ                 Sampling rate (default: from the _meta.txt sidecar, else 500)\n"
    << "  --highpass HZ|off       Highpass cutoff (default: 0.5)\n"
    << "  --lowpass HZ|off        Lowpass cutoff (default: 70)\n"
    << "  --notch HZ|off          Notch frequency (default: 60)\n"
    << "  --no-filter             Analyze the raw samples\n"
    << "  --bands SPEC            Band spec, e.g. delta:0.5-4,theta:4-8 (default: EEG bands)\n"
    << "  --waveform-start S      Start of the waveform snapshot window (default: 0)\n"
    << "  --sensitivity-level N   Waveform sensitivity level 1..10\n"
    << "  --speed MM_S            Waveform display speed (window = 250 / speed seconds)\n"
    << "  --scale UV              Waveform microvolts per division (default: 100)\n"
    << "  --no-csv                Do not export the filtered samples as CSV\n"
    << "  --no-spectrogram-csv    Do not export the spectrogram matrix as CSV\n"
    << "  --version               Print version and exit\n"
    << "  -h, --help              Show this help\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << version_banner("eegmon_analyze_cli") << "\n";
      std::exit(0);
    } else if (arg == "--input" && i + 1 < argc) {
      a.input_path = argv[++i];
    } else if (arg == "--outdir" && i + 1 < argc) {
      a.outdir = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
    } else if (arg == "--fs" && i + 1 < argc) {
      a.fs_hz = to_double(argv[++i]);
    } else if (arg == "--highpass" && i + 1 < argc) {
      a.overrides.emplace_back("highpass", argv[++i]);
    } else if (arg == "--lowpass" && i + 1 < argc) {
      a.overrides.emplace_back("lowpass", argv[++i]);
    } else if (arg == "--notch" && i + 1 < argc) {
      a.overrides.emplace_back("notch", argv[++i]);
    } else if (arg == "--no-filter") {
      a.overrides.emplace_back("enable_filter", "false");
    } else if (arg == "--bands" && i + 1 < argc) {
      a.bands = argv[++i];
    } else if (arg == "--waveform-start" && i + 1 < argc) {
      a.waveform_start_sec = to_double(argv[++i]);
    } else if (arg == "--sensitivity-level" && i + 1 < argc) {
      a.overrides.emplace_back("sensitivity_level", argv[++i]);
    } else if (arg == "--speed" && i + 1 < argc) {
      a.overrides.emplace_back("display_speed", argv[++i]);
    } else if (arg == "--scale" && i + 1 < argc) {
      a.overrides.emplace_back("scale", argv[++i]);
    } else if (arg == "--no-csv") {
      a.export_csv = false;
    } else if (arg == "--no-spectrogram-csv") {
      a.spectrogram_csv = false;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

static void apply_override(Settings* s, const std::string& key, const std::string& value) {
  const std::string v = to_lower(trim(value));
  const bool off = (v == "off" || v == "none");
  try {
    if (key == "highpass" && off) {
      s->disable_highpass();
    } else if (key == "lowpass" && off) {
      s->disable_lowpass();
    } else if (key == "notch" && off) {
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

static std::string cutoff_text(const std::vector<BiquadCoeffs>& stages, double hz) {
  if (stages.empty()) return "off";
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << hz << " Hz";
  return oss.str();
}

// Long format: time_sec,freq_hz,power_db for frequencies in the display range.
static void write_spectrogram_csv(const std::string& path, const SpectrogramView& view) {
  std::ofstream f(std::filesystem::u8path(path));
  if (!f) throw std::runtime_error("Failed to write CSV: " + path);
  f.imbue(std::locale::classic());
  f << "time_sec,freq_hz,power_db\n";
  for (size_t t = 0; t < view.n_frames; ++t) {
    for (size_t k = 0; k < view.n_freq; ++k) {
      const double fr = view.freqs_hz[k];
      if (fr < view.min_freq_hz || fr > view.max_freq_hz) continue;
      f << view.times_sec[t] << "," << fr << "," << view.at(t, k) << "\n";
    }
  }
  if (!f) throw std::runtime_error("Failed to write CSV: " + path);
}

static void write_bandpower_csv(const std::string& path,
                                const BandPowers& bp,
                                const PsdResult& psd) {
  std::ofstream f(std::filesystem::u8path(path));
  if (!f) throw std::runtime_error("Failed to write CSV: " + path);
  f.imbue(std::locale::classic());
  f << "band,fmin_hz,fmax_hz,mean_density,integrated_power\n";
  for (size_t i = 0; i < bp.size(); ++i) {
    const BandDefinition& b = bp.bands[i];
    const double integrated = psd.freqs_hz.empty() ? 0.0
                                                   : integrate_bandpower(psd, b.fmin_hz, b.fmax_hz);
    f << b.name << "," << b.fmin_hz << "," << b.fmax_hz << "," << bp.power[i] << ","
      << integrated << "\n";
  }
  if (!f) throw std::runtime_error("Failed to write CSV: " + path);
}

int main(int argc, char** argv) {
  try {
    Args args = parse_args(argc, argv);
    if (args.input_path.empty()) {
      print_help();
      throw std::runtime_error("--input is required");
    }
    if (args.fs_hz < 0.0) throw std::runtime_error("--fs must be > 0");
    if (args.waveform_start_sec < 0.0) throw std::runtime_error("--waveform-start must be >= 0");

    Settings settings;
    if (!args.config_path.empty()) apply_settings_file(args.config_path, &settings);

    RawRecording rec = load_recording(args.input_path, settings.sampling_rate_hz);
    if (args.fs_hz > 0.0) rec.fs_hz = args.fs_hz;
    settings.sampling_rate_hz = rec.fs_hz;

    for (const auto& kv : args.overrides) apply_override(&settings, kv.first, kv.second);
    settings.validate();

    if (rec.n_samples() == 0) throw std::runtime_error("Recording is empty: " + args.input_path);

    std::cout << "Loaded recording: " << rec.n_samples() << " samples, fs=" << rec.fs_hz
              << " Hz, duration=" << rec.duration_sec() << " s\n";
    for (const auto& kv : rec.metadata) {
      std::cout << "  " << kv.first << ": " << kv.second << "\n";
    }

    ensure_directory(args.outdir);
    const std::string stem = std::filesystem::u8path(args.input_path).stem().u8string();
    const std::string base = join_path(args.outdir, stem);

    std::vector<double> raw(rec.samples.begin(), rec.samples.end());
    std::vector<double> times(raw.size());
    for (size_t i = 0; i < times.size(); ++i) {
      times[i] = static_cast<double>(i) / rec.fs_hz;
    }

    SignalProcessor proc(settings);
    const std::vector<double> data = proc.apply_filters(raw);
    const FilterPlan& plan = proc.plan();
    std::cout << "Filters: " << (settings.filter.enabled ? "" : "disabled ")
              << "highpass=" << cutoff_text(plan.highpass, settings.filter.highpass_hz)
              << " lowpass=" << cutoff_text(plan.lowpass, settings.filter.lowpass_hz)
              << " notch=" << cutoff_text(plan.notch, settings.filter.notch_hz)
              << "\n";

    if (args.export_csv) {
      const ActionResult r = export_csv(data, times, base + "_filtered.csv");
      if (!r.ok) throw std::runtime_error(r.message);
      std::cout << r.message << "\n";
    }

    const std::optional<SpectrogramView> view = proc.calculate_spectrogram(data);
    if (view) {
      const std::string bmp_path = base + "_spectrogram.bmp";
      render_spectrogram_bmp(bmp_path, *view);
      std::cout << "Wrote: " << bmp_path << " (" << view->n_frames << " frames, "
                << view->db_min << ".." << view->db_max << " dB)\n";
      if (args.spectrogram_csv) {
        const std::string csv_path = base + "_spectrogram.csv";
        write_spectrogram_csv(csv_path, *view);
        std::cout << "Wrote: " << csv_path << "\n";
      }
    } else {
      std::cerr << "Warning: recording shorter than one second; no spectrogram\n";
    }

    // Band powers: the monitor's computation for the default bands, or a
    // Welch PSD with the same segmenting for a custom band list.
    const size_t nperseg = static_cast<size_t>(2.0 * rec.fs_hz);
    PsdResult psd;
    if (data.size() >= nperseg && nperseg >= 2) {
      WelchOptions wopt;
      wopt.nperseg = nperseg;
      wopt.overlap_fraction = 0.5;
      psd = welch_psd(data, rec.fs_hz, wopt);
    } else {
      std::cerr << "Warning: recording shorter than two seconds; band powers are zero\n";
    }
    BandPowers bp;
    if (args.bands.empty()) {
      bp = proc.calculate_bands(data);
    } else if (!psd.freqs_hz.empty()) {
      bp = compute_band_powers(psd, parse_band_spec(args.bands));
    } else {
      bp.bands = parse_band_spec(args.bands);
      bp.power.assign(bp.bands.size(), 0.0);
    }
    const std::string bp_path = base + "_bandpower.csv";
    write_bandpower_csv(bp_path, bp, psd);
    std::cout << "Wrote: " << bp_path << "\n";
    for (size_t i = 0; i < bp.size(); ++i) {
      std::cout << "  " << bp.bands[i].name << ": " << bp.power[i] << "\n";
    }

    // Waveform snapshot of one display window.
    const size_t start = std::min(data.size(), static_cast<size_t>(args.waveform_start_sec * rec.fs_hz));
    const size_t end = std::min(data.size(), start + settings.display_buffer_size());
    if (end - start >= 2) {
      std::vector<double> wv(data.begin() + static_cast<std::ptrdiff_t>(start),
                             data.begin() + static_cast<std::ptrdiff_t>(end));
      std::vector<double> wt(times.begin() + static_cast<std::ptrdiff_t>(start),
                             times.begin() + static_cast<std::ptrdiff_t>(end));
      const WaveformFrame frame = build_waveform_frame(wt, wv, settings);
      const std::string wave_path = base + "_waveform.bmp";
      render_waveform_bmp(wave_path, frame);
      std::cout << "Wrote: " << wave_path << "\n";
    } else {
      std::cerr << "Warning: --waveform-start is past the end of the recording; no waveform\n";
    }

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
