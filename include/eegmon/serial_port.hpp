#pragma once

#include "eegmon/settings.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace eegmon {

struct SerialConfig {
  std::string device;
  uint32_t baud_rate{115200};

  // Request exclusive access (TIOCEXCL) so a second process cannot open the
  // same device while we are reading it.
  bool exclusive{true};
};

// POSIX serial port: 8N1, raw mode, no flow control, non-blocking reads.
//
// Errors are thrown as std::runtime_error carrying the OS message.
class SerialPort {
public:
  SerialPort();
  ~SerialPort();

  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  void open(const SerialConfig& config);
  void close();
  bool is_open() const;

  const std::string& device() const;

  // Bytes waiting in the input queue.
  size_t bytes_available() const;

  // Read up to n bytes. Returns 0 when nothing is waiting.
  size_t read(uint8_t* buf, size_t n);

  size_t write(const uint8_t* buf, size_t n);

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

bool is_supported_baud_rate(uint32_t baud);

struct PortInfo {
  std::string device;       // full path, e.g. /dev/ttyUSB0
  std::string description;  // product name when the kernel exposes one
  bool is_bluetooth{false};
};

// Candidate EEG serial devices in dev_dir (ttyUSB*, ttyACM*, rfcomm*, cu.*,
// tty.*), sorted by name. Ports whose device path contains
// settings.bluetooth_device_name come first.
std::vector<PortInfo> list_serial_ports(const Settings& settings,
                                        const std::string& dev_dir = "/dev");

// The Bluetooth headset port if use_bluetooth is set and one is listed,
// otherwise settings.serial_port.
std::string find_eeg_device(const Settings& settings, const std::vector<PortInfo>& ports);
std::string find_eeg_device(const Settings& settings);

} // namespace eegmon
