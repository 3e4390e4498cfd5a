#pragma once

#include <cstddef>
#include <vector>

namespace eegmon {

// Fixed-capacity history of (value, timestamp) pairs. When full, each push
// evicts the oldest pair.
class SampleRing {
public:
  explicit SampleRing(size_t capacity);

  size_t capacity() const { return values_.size(); }
  size_t size() const { return count_; }
  bool empty() const { return count_ == 0; }
  bool full() const { return count_ == values_.size(); }

  void push(double value, double t_sec);
  void clear();

  // Timestamp of the newest pair, or 0 when empty.
  double last_time() const;

  // Change the capacity, keeping the newest min(size, capacity) pairs.
  void resize(size_t capacity);

  // Oldest -> newest.
  void extract(std::vector<double>* values, std::vector<double>* times) const;

private:
  std::vector<double> values_;
  std::vector<double> times_;
  size_t head_{0};
  size_t count_{0};
};

} // namespace eegmon
