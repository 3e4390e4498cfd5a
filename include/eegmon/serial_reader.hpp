#pragma once

#include "eegmon/byte_source.hpp"
#include "eegmon/recording_io.hpp"
#include "eegmon/sample_decoder.hpp"
#include "eegmon/sample_ring.hpp"
#include "eegmon/serial_port.hpp"
#include "eegmon/settings.hpp"
#include "eegmon/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace eegmon {

// Acquisition front end: owns the byte source, decodes samples, timestamps
// them, keeps the rolling sample history and writes the active recording.
//
// Every public method may be called from any thread. Callbacks run on the
// thread that triggered them (normally the acquisition thread) after the
// internal lock has been released, so they may call back into the reader.
class SerialReader {
public:
  using ConnectionCallback = std::function<void(bool connected, const std::string& message)>;
  using DataCallback = std::function<void()>;
  using SourceFactory =
      std::function<std::unique_ptr<ByteSource>(const std::string& port, uint32_t baud_rate)>;

  static constexpr size_t kTestReadBytes = 20;
  static constexpr size_t kMaxReadBytes = 65536;

  explicit SerialReader(const Settings& settings, ClockFn clock = ClockFn());
  ~SerialReader();

  SerialReader(const SerialReader&) = delete;
  SerialReader& operator=(const SerialReader&) = delete;

  void set_connection_callback(ConnectionCallback cb);
  void set_data_callback(DataCallback cb);

  // How connect() opens a port. Defaults to a SerialByteSource.
  void set_source_factory(SourceFactory factory);

  std::vector<PortInfo> available_ports() const;

  // Open a serial port. An empty port or "auto" picks find_eeg_device().
  // Any existing connection is closed first.
  ActionResult connect(const std::string& port = "auto");

  // Attach an already-open source (replay, simulator).
  ActionResult connect_source(std::unique_ptr<ByteSource> source);

  // Returns false when nothing was open.
  bool disconnect();

  bool is_connected() const;
  std::string port() const;

  // Read everything waiting on the source into the buffers. Returns the
  // number of samples added.
  size_t poll();

  ActionResult start_recording();
  ActionResult stop_recording();
  ActionResult toggle_recording();
  bool is_recording() const;
  std::string recording_path() const;

  // Peek at up to kTestReadBytes waiting bytes and report them in hex.
  ActionResult test_connection();

  // ok == true when a source is open.
  ActionResult connection_status() const;

  // Change the amplitude of one sine of the attached simulator (see
  // SyntheticEegOptions). Fails when the source is not a simulator or the
  // component does not exist.
  ActionResult adjust_simulator_amplitude(size_t component, double delta);

  // Oldest -> newest values and their timestamps (seconds).
  void get_data(std::vector<double>* values, std::vector<double>* times) const;

  size_t buffered_samples() const;
  uint64_t total_samples() const;

  // Apply new settings; the history capacity follows
  // Settings::spectrogram_buffer_size().
  void resize_buffers(const Settings& settings);

  Settings settings() const;

private:
  struct Notice {
    bool connected{false};
    std::string message;
  };

  struct Pending {
    std::vector<Notice> notices;
    bool data{false};
  };

  ActionResult attach_locked(std::unique_ptr<ByteSource> source, const std::string& port,
                             Pending* pending);
  bool close_locked(Pending* pending);
  size_t ingest_locked(const uint8_t* bytes, size_t n, Pending* pending);
  ActionResult stop_recording_locked();
  void dispatch(const Pending& pending);

  mutable std::mutex mu_;

  Settings settings_;
  ClockFn clock_;
  SourceFactory factory_;
  ConnectionCallback on_connection_;
  DataCallback on_data_;

  std::unique_ptr<ByteSource> source_;
  std::string port_;

  SampleDecoder decoder_;
  SampleRing ring_;
  double last_read_time_{0.0};
  uint64_t total_samples_{0};

  RawRecorder recorder_;
  bool recording_{false};
  double record_start_{0.0};
  std::string record_start_local_;
};

} // namespace eegmon
