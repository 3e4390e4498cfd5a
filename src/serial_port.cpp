#include "eegmon/serial_port.hpp"

#include "eegmon/utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace eegmon {

struct SerialPort::Impl {
  int fd{-1};
  std::string device;
};

static std::runtime_error os_error(const std::string& what) {
  return std::runtime_error(what + ": " + std::strerror(errno));
}

static bool baud_to_speed(uint32_t baud, speed_t* out) {
  switch (baud) {
    case 9600:   *out = B9600;   return true;
    case 19200:  *out = B19200;  return true;
    case 38400:  *out = B38400;  return true;
    case 57600:  *out = B57600;  return true;
    case 115200: *out = B115200; return true;
    case 230400: *out = B230400; return true;
#ifdef B460800
    case 460800: *out = B460800; return true;
#endif
#ifdef B921600
    case 921600: *out = B921600; return true;
#endif
    default: return false;
  }
}

bool is_supported_baud_rate(uint32_t baud) {
  speed_t s;
  return baud_to_speed(baud, &s);
}

SerialPort::SerialPort() : impl_(std::make_unique<Impl>()) {}

SerialPort::~SerialPort() {
  close();
}

void SerialPort::open(const SerialConfig& config) {
  if (impl_->fd >= 0) throw std::runtime_error("Serial port already open: " + impl_->device);
  if (config.device.empty()) throw std::runtime_error("Serial port: device path is empty");

  speed_t speed = B115200;
  if (!baud_to_speed(config.baud_rate, &speed)) {
    throw std::runtime_error("Unsupported baud rate: " + std::to_string(config.baud_rate));
  }

  const int fd = ::open(config.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) throw os_error(config.device);

  auto fail = [fd](const std::string& what) {
    const std::runtime_error err = os_error(what);
    ::close(fd);
    return err;
  };

  if (config.exclusive && ::ioctl(fd, TIOCEXCL) < 0) {
    throw fail("Failed to set exclusive access on " + config.device);
  }

  struct termios tty;
  std::memset(&tty, 0, sizeof(tty));
  if (::tcgetattr(fd, &tty) != 0) throw fail("tcgetattr " + config.device);

  tty.c_cflag &= ~PARENB;
  tty.c_cflag &= ~CSTOPB;
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8;
#ifdef CRTSCTS
  tty.c_cflag &= ~CRTSCTS;
#endif
  tty.c_cflag |= CREAD | CLOCAL;

  tty.c_lflag &= ~(ICANON | ECHO | ECHOE | ISIG | IEXTEN);
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);
  tty.c_iflag &= ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL);
  tty.c_oflag &= ~(OPOST | ONLCR);

  // Poll-style reads: return whatever is waiting, possibly nothing.
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  ::cfsetispeed(&tty, speed);
  ::cfsetospeed(&tty, speed);

  if (::tcsetattr(fd, TCSANOW, &tty) != 0) throw fail("tcsetattr " + config.device);

  impl_->fd = fd;
  impl_->device = config.device;
}

void SerialPort::close() {
  if (impl_ && impl_->fd >= 0) {
    ::close(impl_->fd);
    impl_->fd = -1;
  }
}

bool SerialPort::is_open() const {
  return impl_->fd >= 0;
}

const std::string& SerialPort::device() const {
  return impl_->device;
}

size_t SerialPort::bytes_available() const {
  if (impl_->fd < 0) throw std::runtime_error("Serial port not open");
  int n = 0;
  if (::ioctl(impl_->fd, FIONREAD, &n) < 0) throw os_error("FIONREAD " + impl_->device);
  return (n > 0) ? static_cast<size_t>(n) : 0;
}

size_t SerialPort::read(uint8_t* buf, size_t n) {
  if (impl_->fd < 0) throw std::runtime_error("Serial port not open");
  if (n == 0) return 0;
  for (;;) {
    const ssize_t r = ::read(impl_->fd, buf, n);
    if (r >= 0) return static_cast<size_t>(r);
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return 0;
    throw os_error("read " + impl_->device);
  }
}

size_t SerialPort::write(const uint8_t* buf, size_t n) {
  if (impl_->fd < 0) throw std::runtime_error("Serial port not open");
  size_t done = 0;
  while (done < n) {
    const ssize_t w = ::write(impl_->fd, buf + done, n - done);
    if (w < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) break;
      throw os_error("write " + impl_->device);
    }
    done += static_cast<size_t>(w);
  }
  return done;
}

static bool is_candidate_name(const std::string& name) {
  return starts_with(name, "ttyUSB") || starts_with(name, "ttyACM") ||
         starts_with(name, "rfcomm") || starts_with(name, "cu.") ||
         starts_with(name, "tty.");
}

static std::string read_first_line(const std::filesystem::path& p) {
  std::ifstream f(p);
  if (!f) return std::string();
  std::string line;
  std::getline(f, line);
  return trim(line);
}

// USB adapters expose the product string a level or two above the tty's
// device node in sysfs.
static std::string describe_port(const std::string& name) {
  if (starts_with(name, "rfcomm")) return "Bluetooth RFCOMM serial";

  const std::filesystem::path dev = std::filesystem::path("/sys/class/tty") / name / "device";
  const std::filesystem::path candidates[] = {
      dev / ".." / "product",
      dev / ".." / ".." / "product",
  };
  for (const auto& c : candidates) {
    std::error_code ec;
    if (!std::filesystem::exists(c, ec)) continue;
    const std::string s = read_first_line(c);
    if (!s.empty()) return s;
  }
  return "n/a";
}

std::vector<PortInfo> list_serial_ports(const Settings& settings, const std::string& dev_dir) {
  std::vector<PortInfo> ports;

  std::error_code ec;
  std::filesystem::directory_iterator it(std::filesystem::u8path(dev_dir), ec);
  if (ec) return ports;

  for (const auto& entry : it) {
    const std::string name = entry.path().filename().u8string();
    if (!is_candidate_name(name)) continue;

    PortInfo info;
    info.device = entry.path().u8string();
    info.description = describe_port(name);
    info.is_bluetooth = starts_with(name, "rfcomm") ||
                        info.description.find("Bluetooth") != std::string::npos ||
                        (!settings.bluetooth_device_name.empty() &&
                         info.device.find(settings.bluetooth_device_name) != std::string::npos);
    ports.push_back(info);
  }

  std::sort(ports.begin(), ports.end(),
            [](const PortInfo& a, const PortInfo& b) { return a.device < b.device; });

  if (!settings.bluetooth_device_name.empty()) {
    const std::string& bt = settings.bluetooth_device_name;
    std::stable_partition(ports.begin(), ports.end(), [&bt](const PortInfo& p) {
      return p.device.find(bt) != std::string::npos;
    });
  }
  return ports;
}

std::string find_eeg_device(const Settings& settings, const std::vector<PortInfo>& ports) {
  if (settings.use_bluetooth && !settings.bluetooth_device_name.empty()) {
    for (const auto& p : ports) {
      if (p.device.find(settings.bluetooth_device_name) != std::string::npos) return p.device;
    }
  }
  return settings.serial_port;
}

std::string find_eeg_device(const Settings& settings) {
  return find_eeg_device(settings, list_serial_ports(settings));
}

} // namespace eegmon
