#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace eegmon {

class SerialReader;

// Background worker that calls SerialReader::poll() at a fixed period.
// The reader must outlive the thread.
class AcquisitionThread {
public:
  AcquisitionThread(SerialReader* reader, int poll_interval_ms);
  ~AcquisitionThread();

  AcquisitionThread(const AcquisitionThread&) = delete;
  AcquisitionThread& operator=(const AcquisitionThread&) = delete;

  void start();

  // Blocks until the worker has exited. Safe to call more than once.
  void stop();

  bool running() const { return running_.load(); }
  uint64_t polls() const { return polls_.load(); }

  // Message of the exception that ended the worker, if any.
  std::string last_error() const;

private:
  void run();

  SerialReader* reader_{nullptr};
  int interval_ms_{5};

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> polls_{0};

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  std::string last_error_;
};

} // namespace eegmon
