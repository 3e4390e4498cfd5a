#include "eegmon/serial_port.hpp"
#include "eegmon/utils.hpp"

#include "test_support.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <pty.h>
#include <unistd.h>

using namespace eegmon;

static size_t wait_available(SerialPort& port, size_t want) {
  for (int i = 0; i < 200; ++i) {
    const size_t n = port.bytes_available();
    if (n >= want) return n;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return port.bytes_available();
}

static void test_pty_io() {
  int master = -1;
  int slave = -1;
  char name[256] = {0};
  if (::openpty(&master, &slave, name, nullptr, nullptr) != 0) {
    std::cout << "openpty unavailable; skipping pty checks\n";
    return;
  }

  SerialConfig cfg;
  cfg.device = name;
  cfg.baud_rate = 115200;

  SerialPort port;
  assert(!port.is_open());
  port.open(cfg);
  assert(port.is_open());
  assert(port.device() == name);

  // Nothing waiting: non-blocking read returns 0.
  uint8_t buf[64];
  assert(port.read(buf, sizeof(buf)) == 0);

  // Device -> host. Raw mode: 0x0A and 0x0D arrive untouched.
  const uint8_t sent[] = {0x01, 0x00, 0x0A, 0x0D, 0xFF, 0x7F};
  assert(::write(master, sent, sizeof(sent)) == static_cast<ssize_t>(sizeof(sent)));
  assert(wait_available(port, sizeof(sent)) == sizeof(sent));
  const size_t got = port.read(buf, sizeof(buf));
  assert(got == sizeof(sent));
  for (size_t i = 0; i < got; ++i) assert(buf[i] == sent[i]);

  // Host -> device.
  const uint8_t cmd[] = {'b', 'x'};
  assert(port.write(cmd, sizeof(cmd)) == sizeof(cmd));
  uint8_t echo[4] = {0};
  ssize_t r = -1;
  for (int i = 0; i < 200 && r <= 0; ++i) {
    r = ::read(master, echo, sizeof(echo));
    if (r <= 0) std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  assert(r == 2 && echo[0] == 'b' && echo[1] == 'x');

  // Opening twice through the same object is an error.
  bool threw = false;
  try {
    port.open(cfg);
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);

  port.close();
  assert(!port.is_open());
  port.close();

  threw = false;
  try {
    (void)port.bytes_available();
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);

  ::close(slave);
  ::close(master);
}

static void test_open_errors() {
  assert(is_supported_baud_rate(115200));
  assert(is_supported_baud_rate(9600));
  assert(!is_supported_baud_rate(12345));

  SerialPort port;
  SerialConfig cfg;
  cfg.device = "/dev/null";
  cfg.baud_rate = 12345;
  bool threw = false;
  try {
    port.open(cfg);
  } catch (const std::exception& e) {
    threw = true;
    assert(std::string(e.what()) == "Unsupported baud rate: 12345");
  }
  assert(threw);

  cfg.device = "/dev/eegmon-no-such-device";
  cfg.baud_rate = 115200;
  threw = false;
  try {
    port.open(cfg);
  } catch (const std::exception& e) {
    threw = true;
    assert(std::string(e.what()).find("/dev/eegmon-no-such-device") != std::string::npos);
  }
  assert(threw);
  assert(!port.is_open());
}

static void test_port_listing() {
  const std::filesystem::path dir = std::filesystem::temp_directory_path() / "eegmon_test_ports";
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir);

  const char* names[] = {"ttyUSB97", "ttyACM97", "rfcomm97", "tty.404-BrainNotFound-SPP",
                         "ttyS0", "sda", "null"};
  for (const char* n : names) {
    assert(write_text_file((dir / n).u8string(), ""));
  }

  Settings s;
  const std::vector<PortInfo> ports = list_serial_ports(s, dir.u8string());
  assert(ports.size() == 4);
  // The headset comes first, the rest sorted by path.
  assert(ends_with(ports[0].device, "tty.404-BrainNotFound-SPP"));
  assert(ports[0].is_bluetooth);
  assert(ends_with(ports[1].device, "rfcomm97"));
  assert(ports[1].is_bluetooth);
  assert(ports[1].description == "Bluetooth RFCOMM serial");
  assert(ends_with(ports[2].device, "ttyACM97"));
  assert(ends_with(ports[3].device, "ttyUSB97"));
  assert(!ports[3].description.empty());

  assert(find_eeg_device(s, ports) == ports[0].device);

  s.use_bluetooth = false;
  assert(find_eeg_device(s, ports) == "/dev/ttyUSB0");

  s.use_bluetooth = true;
  s.bluetooth_device_name = "SomeOtherHeadset";
  assert(find_eeg_device(s, ports) == "/dev/ttyUSB0");

  // A missing directory yields no ports.
  assert(list_serial_ports(s, (dir / "missing").u8string()).empty());

  std::filesystem::remove_all(dir, ec);
}

int main() {
  test_open_errors();
  test_port_listing();
  test_pty_io();
  std::cout << "test_serial_port OK\n";
  return 0;
}
