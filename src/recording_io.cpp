#include "eegmon/recording_io.hpp"

#include "eegmon/sample_decoder.hpp"
#include "eegmon/utils.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <iterator>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace eegmon {

std::string generate_filename(const std::string& dir,
                              const std::string& prefix,
                              const std::string& ext) {
  ensure_directory(dir);
  return join_path(dir, prefix + "_" + now_string_compact() + ext);
}

std::string metadata_path_for(const std::string& recording_path) {
  std::filesystem::path p = std::filesystem::u8path(recording_path);
  p.replace_extension();
  return p.u8string() + "_meta.txt";
}

RawRecorder::~RawRecorder() {
  if (out_.is_open()) out_.close();
}

void RawRecorder::open(const std::string& path) {
  if (out_.is_open()) throw std::runtime_error("RawRecorder: already recording to " + path_);
  out_.open(std::filesystem::u8path(path), std::ios::binary | std::ios::trunc);
  if (!out_) throw std::runtime_error("Failed to create recording file: " + path);
  path_ = path;
  samples_ = 0;
}

void RawRecorder::write_samples(const int16_t* samples, size_t n) {
  if (!out_.is_open()) throw std::runtime_error("RawRecorder: no open recording");
  if (n == 0) return;
  std::vector<uint8_t> bytes;
  bytes.reserve(n * 2);
  for (size_t i = 0; i < n; ++i) append_int16_le(samples[i], &bytes);
  out_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out_) throw std::runtime_error("Failed to write recording file: " + path_);
  samples_ += n;
}

void RawRecorder::close() {
  if (!out_.is_open()) return;
  out_.flush();
  const bool ok = static_cast<bool>(out_);
  out_.close();
  if (!ok) throw std::runtime_error("Failed to write recording file: " + path_);
}

std::string save_metadata(const std::string& recording_path, const Metadata& metadata) {
  const std::string path = metadata_path_for(recording_path);
  std::ostringstream oss;
  for (const auto& kv : metadata) {
    oss << kv.first << ": " << kv.second << "\n";
  }
  if (!write_text_file(path, oss.str())) {
    throw std::runtime_error("Failed to write metadata file: " + path);
  }
  return path;
}

Metadata load_metadata(const std::string& path) {
  std::ifstream f(std::filesystem::u8path(path));
  if (!f) throw std::runtime_error("Failed to open metadata file: " + path);

  Metadata out;
  std::string line;
  bool first = true;
  while (std::getline(f, line)) {
    if (first) {
      line = strip_utf8_bom(line);
      first = false;
    }
    const size_t colon = line.find(':');
    if (colon == std::string::npos) continue;
    out.emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
  }
  return out;
}

std::string metadata_value(const Metadata& metadata, const std::string& key) {
  for (const auto& kv : metadata) {
    if (kv.first == key) return kv.second;
  }
  return std::string();
}

RawRecording load_recording(const std::string& path, double default_fs_hz) {
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open recording: " + path);
  const std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

  RawRecording rec;
  rec.samples.reserve(bytes.size() / 2);
  for (size_t i = 0; i + 1 < bytes.size(); i += 2) {
    rec.samples.push_back(decode_int16_le(bytes[i], bytes[i + 1]));
  }

  const std::string meta_path = metadata_path_for(path);
  if (file_exists(meta_path)) {
    rec.metadata = load_metadata(meta_path);
  }

  rec.fs_hz = default_fs_hz;
  const std::string fs = metadata_value(rec.metadata, "sample_rate");
  if (!fs.empty()) {
    try {
      rec.fs_hz = to_double(fs);
    } catch (const std::exception& e) {
      throw std::runtime_error(meta_path + ": invalid sample_rate: " + e.what());
    }
  }
  if (!(rec.fs_hz > 0.0)) {
    throw std::runtime_error("load_recording: sample rate must be > 0 for " + path);
  }
  return rec;
}

ActionResult export_csv(const std::vector<double>& values,
                        const std::vector<double>& times,
                        const std::string& path) {
  ActionResult r;
  std::ofstream out(std::filesystem::u8path(path));
  if (!out) {
    r.message = "Error exporting data: cannot open " + path;
    return r;
  }
  out.imbue(std::locale::classic());
  out.precision(10);
  out << "Time,EEG\n";

  const size_t n = std::min(values.size(), times.size());
  char tbuf[64];
  for (size_t i = 0; i < n; ++i) {
    std::snprintf(tbuf, sizeof(tbuf), "%.6f", times[i]);
    out << tbuf << "," << values[i] << "\n";
  }
  out.flush();
  if (!out) {
    r.message = "Error exporting data: write failed for " + path;
    return r;
  }
  r.ok = true;
  r.message = "Exported data to " + path;
  return r;
}

} // namespace eegmon
