#pragma once

#include "eegmon/serial_port.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

namespace eegmon {

// Seconds on some monotonic clock. Injected so tests can drive time.
using ClockFn = std::function<double()>;

// Where acquisition bytes come from: a serial device, a recording being
// replayed, or a signal generator.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Shown in status messages ("Connected to <name>").
  virtual std::string name() const = 0;

  virtual bool is_open() const = 0;

  // Bytes that read() can return right now without waiting.
  virtual size_t bytes_available() = 0;

  // Read up to n bytes; never blocks. Throws on I/O errors.
  virtual size_t read(uint8_t* buf, size_t n) = 0;

  virtual void close() = 0;

  // True when the source will never produce more bytes (end of a replay).
  virtual bool exhausted() const { return false; }
};

class SerialByteSource : public ByteSource {
public:
  // Opens the port; throws on failure.
  explicit SerialByteSource(const SerialConfig& config);

  std::string name() const override { return port_.device(); }
  bool is_open() const override { return port_.is_open(); }
  size_t bytes_available() override { return port_.bytes_available(); }
  size_t read(uint8_t* buf, size_t n) override { return port_.read(buf, n); }
  void close() override { port_.close(); }

private:
  SerialPort port_;
};

// Plays back a raw recording at its sample rate, as if a device were
// streaming it.
class FileByteSource : public ByteSource {
public:
  // speed: playback rate multiplier (1 = real time).
  // loop: restart from the beginning at the end of the file.
  FileByteSource(const std::string& path, double fs_hz, double speed = 1.0,
                 bool loop = false, ClockFn clock = ClockFn());

  std::string name() const override { return path_; }
  bool is_open() const override { return open_; }
  size_t bytes_available() override;
  size_t read(uint8_t* buf, size_t n) override;
  void close() override { open_ = false; }

  // True once every byte has been delivered (never when looping).
  bool exhausted() const override;

private:
  uint64_t bytes_due();

  std::string path_;
  std::vector<uint8_t> data_;
  double fs_hz_{0.0};
  double speed_{1.0};
  bool loop_{false};
  ClockFn clock_;
  bool open_{true};
  bool started_{false};
  double t0_{0.0};
  uint64_t delivered_{0};  // total bytes handed out, across loops
};

struct SyntheticEegOptions {
  double fs_hz{500.0};

  // Sum of sines.
  std::vector<double> freqs_hz{3.0, 10.0, 30.0};
  std::vector<double> amplitudes{10.0, 5.0, 2.0};

  double noise_sigma{2.0};

  // Per-sample probability of a large spike, and its spread.
  double artifact_probability{0.001};
  double artifact_sigma{50.0};

  uint32_t seed{12345};
};

// Simulated single-channel EEG, in raw device units.
class SyntheticEeg {
public:
  explicit SyntheticEeg(const SyntheticEegOptions& opt = SyntheticEegOptions());

  int16_t next_sample();

  // Increase (or decrease) the amplitude of one component.
  void add_amplitude(size_t component, double delta);

  const SyntheticEegOptions& options() const { return opt_; }
  uint64_t samples_generated() const { return counter_; }

private:
  SyntheticEegOptions opt_;
  std::mt19937 rng_;
  std::normal_distribution<double> noise_;
  std::normal_distribution<double> artifact_;
  std::uniform_real_distribution<double> uniform_{0.0, 1.0};
  uint64_t counter_{0};
};

// Streams SyntheticEeg samples in real time.
class SyntheticByteSource : public ByteSource {
public:
  explicit SyntheticByteSource(const SyntheticEegOptions& opt = SyntheticEegOptions(),
                               ClockFn clock = ClockFn());

  std::string name() const override { return "simulator"; }
  bool is_open() const override { return open_; }
  size_t bytes_available() override;
  size_t read(uint8_t* buf, size_t n) override;
  void close() override { open_ = false; }

  SyntheticEeg& generator() { return gen_; }

private:
  uint64_t samples_due();

  SyntheticEeg gen_;
  ClockFn clock_;
  bool open_{true};
  bool started_{false};
  double t0_{0.0};
};

} // namespace eegmon
