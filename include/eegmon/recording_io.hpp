#pragma once

#include "eegmon/types.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace eegmon {

using Metadata = std::vector<std::pair<std::string, std::string>>;

// "<dir>/<prefix>_<YYYYmmdd-HHMMSS><ext>". Creates dir if needed.
std::string generate_filename(const std::string& dir,
                              const std::string& prefix,
                              const std::string& ext);

// Sidecar path: the recording path without its extension, plus "_meta.txt".
std::string metadata_path_for(const std::string& recording_path);

// Writes raw little-endian int16 samples, exactly as a device sends them.
class RawRecorder {
public:
  RawRecorder() = default;
  ~RawRecorder();

  RawRecorder(const RawRecorder&) = delete;
  RawRecorder& operator=(const RawRecorder&) = delete;

  // Throws if the file cannot be created or a recording is already open.
  void open(const std::string& path);
  bool is_open() const { return out_.is_open(); }

  void write_samples(const int16_t* samples, size_t n);
  void write_samples(const std::vector<int16_t>& samples) {
    write_samples(samples.data(), samples.size());
  }

  void close();

  const std::string& path() const { return path_; }
  uint64_t samples_written() const { return samples_; }

private:
  std::ofstream out_;
  std::string path_;
  uint64_t samples_{0};
};

// Write "key: value" lines next to a recording. Returns the sidecar path.
std::string save_metadata(const std::string& recording_path, const Metadata& metadata);

// Parse a sidecar. Lines without ':' are skipped; keys and values are trimmed.
Metadata load_metadata(const std::string& path);

// Value for key, or empty string.
std::string metadata_value(const Metadata& metadata, const std::string& key);

// Read a raw recording and its sidecar (if present). The sample rate comes
// from the sidecar's sample_rate entry, else default_fs_hz. An odd trailing
// byte is ignored.
RawRecording load_recording(const std::string& path, double default_fs_hz);

// "Time,EEG" CSV, one row per sample, times with 6 decimals.
ActionResult export_csv(const std::vector<double>& values,
                        const std::vector<double>& times,
                        const std::string& path);

} // namespace eegmon
