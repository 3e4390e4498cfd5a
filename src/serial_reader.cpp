#include "eegmon/serial_reader.hpp"

#include "eegmon/utils.hpp"

#include <algorithm>
#include <cstdio>
#include <locale>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace eegmon {

static std::unique_ptr<ByteSource> open_serial_source(const std::string& port, uint32_t baud_rate) {
  SerialConfig cfg;
  cfg.device = port;
  cfg.baud_rate = baud_rate;
  return std::make_unique<SerialByteSource>(cfg);
}

static std::string format_number(double v) {
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << v;
  return oss.str();
}

static size_t history_capacity(const Settings& s) {
  return std::max<size_t>(1, s.spectrogram_buffer_size());
}

SerialReader::SerialReader(const Settings& settings, ClockFn clock)
    : settings_(settings),
      clock_(std::move(clock)),
      factory_(open_serial_source),
      ring_(history_capacity(settings)) {
  if (!clock_) clock_ = monotonic_seconds;
  last_read_time_ = clock_();
}

SerialReader::~SerialReader() {
  std::lock_guard<std::mutex> lock(mu_);
  if (recording_) {
    // Nobody is left to show the result.
    (void)stop_recording_locked();
  }
  if (source_) source_->close();
}

void SerialReader::set_connection_callback(ConnectionCallback cb) {
  std::lock_guard<std::mutex> lock(mu_);
  on_connection_ = std::move(cb);
}

void SerialReader::set_data_callback(DataCallback cb) {
  std::lock_guard<std::mutex> lock(mu_);
  on_data_ = std::move(cb);
}

void SerialReader::set_source_factory(SourceFactory factory) {
  std::lock_guard<std::mutex> lock(mu_);
  factory_ = factory ? std::move(factory) : SourceFactory(open_serial_source);
}

std::vector<PortInfo> SerialReader::available_ports() const {
  Settings s = settings();
  return list_serial_ports(s);
}

void SerialReader::dispatch(const Pending& pending) {
  ConnectionCallback on_connection;
  DataCallback on_data;
  {
    std::lock_guard<std::mutex> lock(mu_);
    on_connection = on_connection_;
    on_data = on_data_;
  }
  if (on_connection) {
    for (const auto& n : pending.notices) on_connection(n.connected, n.message);
  }
  if (pending.data && on_data) on_data();
}

bool SerialReader::close_locked(Pending* pending) {
  if (!source_ || !source_->is_open()) return false;
  if (recording_) {
    const ActionResult r = stop_recording_locked();
    pending->notices.push_back({true, r.message});
  }
  source_->close();
  decoder_.reset();
  return true;
}

ActionResult SerialReader::attach_locked(std::unique_ptr<ByteSource> source,
                                         const std::string& port,
                                         Pending* pending) {
  source_ = std::move(source);
  port_ = port;
  settings_.serial_port = port;

  ring_.clear();
  decoder_.reset();
  last_read_time_ = clock_();

  ActionResult r;
  r.ok = true;
  r.message = "Connected to " + port;
  pending->notices.push_back({true, r.message});
  return r;
}

ActionResult SerialReader::connect(const std::string& port_in) {
  Pending pending;
  ActionResult r;
  {
    std::lock_guard<std::mutex> lock(mu_);

    std::string port = trim(port_in);
    if (port.empty() || port == "auto") {
      port = find_eeg_device(settings_, list_serial_ports(settings_));
    }

    close_locked(&pending);

    try {
      std::unique_ptr<ByteSource> src = factory_(port, settings_.baud_rate);
      if (!src || !src->is_open()) throw std::runtime_error("could not open " + port);
      r = attach_locked(std::move(src), port, &pending);
    } catch (const std::exception& e) {
      r.ok = false;
      r.message = std::string("Error connecting: ") + e.what();
      pending.notices.push_back({false, r.message});
    }
  }
  dispatch(pending);
  return r;
}

ActionResult SerialReader::connect_source(std::unique_ptr<ByteSource> source) {
  Pending pending;
  ActionResult r;
  {
    std::lock_guard<std::mutex> lock(mu_);
    close_locked(&pending);
    if (!source || !source->is_open()) {
      r.ok = false;
      r.message = "Error connecting: source is not open";
      pending.notices.push_back({false, r.message});
    } else {
      const std::string name = source->name();
      r = attach_locked(std::move(source), name, &pending);
    }
  }
  dispatch(pending);
  return r;
}

bool SerialReader::disconnect() {
  Pending pending;
  bool closed = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed = close_locked(&pending);
    if (closed) pending.notices.push_back({false, "Disconnected from " + port_});
  }
  dispatch(pending);
  return closed;
}

bool SerialReader::is_connected() const {
  std::lock_guard<std::mutex> lock(mu_);
  return source_ && source_->is_open();
}

std::string SerialReader::port() const {
  std::lock_guard<std::mutex> lock(mu_);
  return port_;
}

// Samples of one read are spread evenly over the time since the previous
// read that produced samples.
size_t SerialReader::ingest_locked(const uint8_t* bytes, size_t n, Pending* pending) {
  std::vector<int16_t> samples;
  decoder_.feed(bytes, n, &samples);
  if (samples.empty()) return 0;

  const double now = clock_();
  const double elapsed = now - last_read_time_;
  last_read_time_ = now;

  const double t_last = ring_.last_time();
  const double count = static_cast<double>(samples.size());
  for (size_t i = 0; i < samples.size(); ++i) {
    const double t = t_last + elapsed * static_cast<double>(i + 1) / count;
    ring_.push(static_cast<double>(samples[i]), t);
  }
  total_samples_ += samples.size();

  if (recording_) {
    try {
      recorder_.write_samples(samples);
    } catch (const std::exception& e) {
      recording_ = false;
      std::string msg = std::string("Error writing recording: ") + e.what();
      try {
        recorder_.close();
      } catch (const std::exception& e2) {
        msg += std::string("; ") + e2.what();
      }
      pending->notices.push_back({true, msg});
    }
  }

  pending->data = true;
  return samples.size();
}

size_t SerialReader::poll() {
  Pending pending;
  size_t added = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!source_ || !source_->is_open()) return 0;

    try {
      const size_t avail = source_->bytes_available();
      if (avail > 0) {
        std::vector<uint8_t> buf(std::min(avail, kMaxReadBytes));
        const size_t got = source_->read(buf.data(), buf.size());
        added = ingest_locked(buf.data(), got, &pending);
      } else if (source_->exhausted()) {
        close_locked(&pending);
        pending.notices.push_back({false, "End of stream: " + port_});
      }
    } catch (const std::exception& e) {
      close_locked(&pending);
      pending.notices.push_back({false, std::string("Error reading data: ") + e.what()});
    }
  }
  dispatch(pending);
  return added;
}

ActionResult SerialReader::start_recording() {
  std::lock_guard<std::mutex> lock(mu_);
  ActionResult r;
  if (!source_ || !source_->is_open()) {
    r.message = "Not connected to any port. Cannot record.";
    return r;
  }
  if (recording_) {
    r.message = "Already recording to " + recorder_.path();
    return r;
  }

  try {
    const std::string path = generate_filename(settings_.recordings_dir, "EEG_RECORDING", ".dat");
    recorder_.open(path);
  } catch (const std::exception& e) {
    r.message = std::string("Error starting recording: ") + e.what();
    return r;
  }

  recording_ = true;
  record_start_ = clock_();
  record_start_local_ = now_string_local();
  r.ok = true;
  r.message = "Recording to " + recorder_.path();
  return r;
}

ActionResult SerialReader::stop_recording_locked() {
  ActionResult r;
  if (!recording_) {
    r.message = "Not recording";
    return r;
  }
  recording_ = false;

  const double duration = clock_() - record_start_;
  const std::string path = recorder_.path();
  try {
    recorder_.close();

    Metadata meta;
    meta.emplace_back("sample_rate", format_number(settings_.sampling_rate_hz));
    meta.emplace_back("format", "int16le");
    meta.emplace_back("channels", std::to_string(settings_.display.channel_count));
    meta.emplace_back("port", port_);
    meta.emplace_back("baud_rate", std::to_string(settings_.baud_rate));
    meta.emplace_back("start_time", record_start_local_);
    meta.emplace_back("duration_sec", format_number(duration));
    meta.emplace_back("samples", std::to_string(recorder_.samples_written()));
    save_metadata(path, meta);
  } catch (const std::exception& e) {
    r.message = std::string("Error saving recording: ") + e.what();
    return r;
  }

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.1f", duration);
  r.ok = true;
  r.message = "Saved " + path + " (" + buf + " sec)";
  return r;
}

ActionResult SerialReader::stop_recording() {
  std::lock_guard<std::mutex> lock(mu_);
  return stop_recording_locked();
}

ActionResult SerialReader::toggle_recording() {
  if (is_recording()) return stop_recording();
  return start_recording();
}

bool SerialReader::is_recording() const {
  std::lock_guard<std::mutex> lock(mu_);
  return recording_;
}

std::string SerialReader::recording_path() const {
  std::lock_guard<std::mutex> lock(mu_);
  return recording_ ? recorder_.path() : std::string();
}

ActionResult SerialReader::test_connection() {
  Pending pending;
  ActionResult r;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!source_ || !source_->is_open()) {
      r.message = "Not connected to any port.";
      return r;
    }

    try {
      const size_t avail = source_->bytes_available();
      if (avail > 0) {
        uint8_t buf[kTestReadBytes];
        const size_t got = source_->read(buf, std::min(avail, kTestReadBytes));
        // The bytes are real data: keep them in the stream.
        ingest_locked(buf, got, &pending);
        r.ok = true;
        r.message = "Data received (" + std::to_string(got) + " bytes): " + hex_bytes(buf, got);
      } else {
        r.ok = true;
        r.message = "No data in buffer. Verify device is sending data.";
      }
    } catch (const std::exception& e) {
      r.ok = false;
      r.message = std::string("Connection test error: ") + e.what();
    }
  }
  dispatch(pending);
  return r;
}

ActionResult SerialReader::adjust_simulator_amplitude(size_t component, double delta) {
  std::lock_guard<std::mutex> lock(mu_);
  ActionResult r;
  SyntheticByteSource* sim = dynamic_cast<SyntheticByteSource*>(source_.get());
  if (!sim) {
    r.message = source_ ? "Source is not the simulator: " + port_ : "Not connected";
    return r;
  }
  const SyntheticEegOptions& opt = sim->generator().options();
  if (component >= opt.amplitudes.size()) {
    r.message = "Simulator has no component " + std::to_string(component);
    return r;
  }
  sim->generator().add_amplitude(component, delta);
  r.ok = true;
  r.message = "Simulator " + format_number(opt.freqs_hz[component]) + " Hz amplitude now " +
              format_number(opt.amplitudes[component]);
  return r;
}

ActionResult SerialReader::connection_status() const {
  std::lock_guard<std::mutex> lock(mu_);
  ActionResult r;
  if (!source_) {
    r.message = "Not connected";
    return r;
  }
  if (!source_->is_open()) {
    r.message = "Port closed";
    return r;
  }
  try {
    const size_t waiting = source_->bytes_available();
    r.ok = true;
    r.message = "Active (" + std::to_string(waiting) + " bytes waiting)";
  } catch (const std::exception& e) {
    r.message = std::string("Connection error: ") + e.what();
  }
  return r;
}

void SerialReader::get_data(std::vector<double>* values, std::vector<double>* times) const {
  std::lock_guard<std::mutex> lock(mu_);
  ring_.extract(values, times);
}

size_t SerialReader::buffered_samples() const {
  std::lock_guard<std::mutex> lock(mu_);
  return ring_.size();
}

uint64_t SerialReader::total_samples() const {
  std::lock_guard<std::mutex> lock(mu_);
  return total_samples_;
}

void SerialReader::resize_buffers(const Settings& settings) {
  std::lock_guard<std::mutex> lock(mu_);
  const std::string port = settings_.serial_port;
  settings_ = settings;
  if (source_ && source_->is_open()) settings_.serial_port = port;
  ring_.resize(history_capacity(settings_));
}

Settings SerialReader::settings() const {
  std::lock_guard<std::mutex> lock(mu_);
  return settings_;
}

} // namespace eegmon
