#include "eegmon/acquisition_thread.hpp"

#include "eegmon/serial_reader.hpp"

#include <chrono>
#include <stdexcept>

namespace eegmon {

AcquisitionThread::AcquisitionThread(SerialReader* reader, int poll_interval_ms)
    : reader_(reader), interval_ms_(poll_interval_ms < 1 ? 1 : poll_interval_ms) {
  if (!reader_) throw std::runtime_error("AcquisitionThread: reader is null");
}

AcquisitionThread::~AcquisitionThread() {
  stop();
}

void AcquisitionThread::start() {
  if (thread_.joinable()) throw std::runtime_error("AcquisitionThread: already started");
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = false;
    last_error_.clear();
  }
  running_ = true;
  thread_ = std::thread(&AcquisitionThread::run, this);
}

void AcquisitionThread::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

std::string AcquisitionThread::last_error() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_error_;
}

void AcquisitionThread::run() {
  const auto period = std::chrono::milliseconds(interval_ms_);
  auto next = std::chrono::steady_clock::now();

  for (;;) {
    try {
      reader_->poll();
    } catch (const std::exception& e) {
      std::lock_guard<std::mutex> lock(mu_);
      last_error_ = e.what();
      break;
    }
    ++polls_;

    next += period;
    const auto now = std::chrono::steady_clock::now();
    if (next < now) next = now;  // fell behind: do not try to catch up

    std::unique_lock<std::mutex> lock(mu_);
    if (cv_.wait_until(lock, next, [this] { return stop_requested_; })) break;
  }
  running_ = false;
}

} // namespace eegmon
