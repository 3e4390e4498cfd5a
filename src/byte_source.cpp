#include "eegmon/byte_source.hpp"

#include "eegmon/sample_decoder.hpp"
#include "eegmon/utils.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <utility>

namespace eegmon {

SerialByteSource::SerialByteSource(const SerialConfig& config) {
  port_.open(config);
}

static std::vector<uint8_t> read_all_bytes(const std::string& path) {
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open recording: " + path);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

FileByteSource::FileByteSource(const std::string& path, double fs_hz, double speed,
                               bool loop, ClockFn clock)
    : path_(path), fs_hz_(fs_hz), speed_(speed), loop_(loop), clock_(std::move(clock)) {
  if (!(fs_hz_ > 0.0)) throw std::runtime_error("FileByteSource: fs_hz must be > 0");
  if (!(speed_ > 0.0)) throw std::runtime_error("FileByteSource: speed must be > 0");
  if (!clock_) clock_ = monotonic_seconds;
  data_ = read_all_bytes(path);
  // Odd trailing byte is not a sample.
  if (data_.size() % 2 != 0) data_.pop_back();
  if (data_.empty()) throw std::runtime_error("Recording is empty: " + path);
}

uint64_t FileByteSource::bytes_due() {
  const double now = clock_();
  if (!started_) {
    started_ = true;
    t0_ = now;
  }
  const double elapsed = std::max(0.0, now - t0_);
  const uint64_t samples = static_cast<uint64_t>(std::floor(elapsed * fs_hz_ * speed_));
  uint64_t due = samples * 2;
  if (!loop_) due = std::min<uint64_t>(due, data_.size());
  return due;
}

size_t FileByteSource::bytes_available() {
  if (!open_) return 0;
  const uint64_t due = bytes_due();
  return (due > delivered_) ? static_cast<size_t>(due - delivered_) : 0;
}

size_t FileByteSource::read(uint8_t* buf, size_t n) {
  if (!open_) throw std::runtime_error("FileByteSource: not open");
  const size_t avail = bytes_available();
  const size_t count = std::min(n, avail);
  for (size_t i = 0; i < count; ++i) {
    buf[i] = data_[static_cast<size_t>(delivered_ % data_.size())];
    ++delivered_;
  }
  return count;
}

bool FileByteSource::exhausted() const {
  return !loop_ && delivered_ >= data_.size();
}

SyntheticEeg::SyntheticEeg(const SyntheticEegOptions& opt)
    : opt_(opt),
      rng_(opt.seed),
      noise_(0.0, opt.noise_sigma > 0.0 ? opt.noise_sigma : 1.0),
      artifact_(0.0, opt.artifact_sigma > 0.0 ? opt.artifact_sigma : 1.0) {
  if (!(opt_.fs_hz > 0.0)) throw std::runtime_error("SyntheticEeg: fs_hz must be > 0");
  if (opt_.freqs_hz.size() != opt_.amplitudes.size()) {
    throw std::runtime_error("SyntheticEeg: freqs_hz and amplitudes must have the same size");
  }
}

void SyntheticEeg::add_amplitude(size_t component, double delta) {
  if (component >= opt_.amplitudes.size()) {
    throw std::runtime_error("SyntheticEeg::add_amplitude: component out of range");
  }
  opt_.amplitudes[component] += delta;
}

int16_t SyntheticEeg::next_sample() {
  const double pi = std::acos(-1.0);
  const double t = static_cast<double>(counter_) / opt_.fs_hz;

  double v = 0.0;
  for (size_t i = 0; i < opt_.freqs_hz.size(); ++i) {
    v += opt_.amplitudes[i] * std::sin(2.0 * pi * opt_.freqs_hz[i] * t);
  }
  if (opt_.noise_sigma > 0.0) v += noise_(rng_);
  if (opt_.artifact_probability > 0.0 && uniform_(rng_) < opt_.artifact_probability) {
    v += artifact_(rng_);
  }
  ++counter_;

  // Truncate toward zero, then saturate to the 16-bit range.
  v = std::trunc(v);
  v = std::max(v, static_cast<double>(std::numeric_limits<int16_t>::min()));
  v = std::min(v, static_cast<double>(std::numeric_limits<int16_t>::max()));
  return static_cast<int16_t>(v);
}

SyntheticByteSource::SyntheticByteSource(const SyntheticEegOptions& opt, ClockFn clock)
    : gen_(opt), clock_(std::move(clock)) {
  if (!clock_) clock_ = monotonic_seconds;
}

uint64_t SyntheticByteSource::samples_due() {
  const double now = clock_();
  if (!started_) {
    started_ = true;
    t0_ = now;
  }
  const double elapsed = std::max(0.0, now - t0_);
  const uint64_t total = static_cast<uint64_t>(std::floor(elapsed * gen_.options().fs_hz));
  const uint64_t done = gen_.samples_generated();
  return (total > done) ? (total - done) : 0;
}

size_t SyntheticByteSource::bytes_available() {
  if (!open_) return 0;
  return static_cast<size_t>(samples_due() * 2);
}

// Only whole samples are handed out, so an odd n leaves one byte unused.
size_t SyntheticByteSource::read(uint8_t* buf, size_t n) {
  if (!open_) throw std::runtime_error("SyntheticByteSource: not open");
  const uint64_t due = samples_due();
  const size_t count = static_cast<size_t>(std::min<uint64_t>(due, n / 2));
  std::vector<uint8_t> bytes;
  bytes.reserve(count * 2);
  for (size_t i = 0; i < count; ++i) append_int16_le(gen_.next_sample(), &bytes);
  std::copy(bytes.begin(), bytes.end(), buf);
  return bytes.size();
}

} // namespace eegmon
