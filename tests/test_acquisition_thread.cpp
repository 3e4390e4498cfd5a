#include "eegmon/acquisition_thread.hpp"
#include "eegmon/serial_reader.hpp"

#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <thread>

using namespace eegmon;

static bool wait_for(const std::function<bool()>& cond, int timeout_ms) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (cond()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return cond();
}

int main() {
  Settings settings;
  settings.sampling_rate_hz = 500.0;
  SerialReader reader(settings);

  std::atomic<int> data_events{0};
  std::atomic<size_t> seen_in_callback{0};
  // Callbacks run without the reader's lock held, so they may query it.
  reader.set_data_callback([&] {
    ++data_events;
    seen_in_callback = reader.buffered_samples();
  });

  SyntheticEegOptions opt;
  opt.fs_hz = 500.0;
  const ActionResult r = reader.connect_source(std::make_unique<SyntheticByteSource>(opt));
  TEST_CHECK(r.ok);
  TEST_CHECK(r.message == "Connected to simulator");

  bool threw = false;
  try {
    AcquisitionThread bad(nullptr, 5);
  } catch (const std::exception&) {
    threw = true;
  }
  TEST_CHECK(threw);

  AcquisitionThread worker(&reader, settings.poll_interval_ms());
  TEST_CHECK(!worker.running());
  worker.start();
  TEST_CHECK(worker.running());

  threw = false;
  try {
    worker.start();
  } catch (const std::exception&) {
    threw = true;
  }
  TEST_CHECK(threw);

  TEST_CHECK(wait_for([&] { return reader.total_samples() >= 50; }, 5000));
  TEST_CHECK(data_events.load() > 0);
  TEST_CHECK(seen_in_callback.load() > 0);

  worker.stop();
  TEST_CHECK(!worker.running());
  TEST_CHECK(worker.polls() > 0);
  TEST_CHECK(worker.last_error().empty());
  worker.stop();

  // Stopped means no more polling.
  const uint64_t polls = worker.polls();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  TEST_CHECK(worker.polls() == polls);

  // A stopped worker can be started again.
  worker.start();
  TEST_CHECK(wait_for([&] { return worker.polls() > polls; }, 5000));

  // The worker keeps running after the source goes away; polls become no-ops.
  TEST_CHECK(reader.disconnect());
  const uint64_t total = reader.total_samples();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  TEST_CHECK(worker.running());
  TEST_CHECK(reader.total_samples() == total);
  worker.stop();

  std::cout << "test_acquisition_thread OK\n";
  return 0;
}
