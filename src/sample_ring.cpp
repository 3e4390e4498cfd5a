#include "eegmon/sample_ring.hpp"

#include <algorithm>
#include <stdexcept>

namespace eegmon {

SampleRing::SampleRing(size_t capacity) : values_(capacity, 0.0), times_(capacity, 0.0) {
  if (capacity == 0) throw std::runtime_error("SampleRing: capacity must be > 0");
}

void SampleRing::push(double value, double t_sec) {
  values_[head_] = value;
  times_[head_] = t_sec;
  head_ = (head_ + 1) % values_.size();
  if (count_ < values_.size()) {
    ++count_;
  }
}

void SampleRing::clear() {
  head_ = 0;
  count_ = 0;
}

double SampleRing::last_time() const {
  if (count_ == 0) return 0.0;
  const size_t cap = times_.size();
  return times_[(head_ + cap - 1) % cap];
}

void SampleRing::resize(size_t capacity) {
  if (capacity == 0) throw std::runtime_error("SampleRing: capacity must be > 0");
  if (capacity == values_.size()) return;

  std::vector<double> v;
  std::vector<double> t;
  extract(&v, &t);

  const size_t keep = std::min(v.size(), capacity);
  const size_t skip = v.size() - keep;

  values_.assign(capacity, 0.0);
  times_.assign(capacity, 0.0);
  std::copy(v.begin() + static_cast<std::ptrdiff_t>(skip), v.end(), values_.begin());
  std::copy(t.begin() + static_cast<std::ptrdiff_t>(skip), t.end(), times_.begin());
  count_ = keep;
  head_ = keep % capacity;
}

void SampleRing::extract(std::vector<double>* values, std::vector<double>* times) const {
  const size_t cap = values_.size();
  // Oldest element is head when full, otherwise at 0.
  const size_t start = (count_ == cap) ? head_ : 0;
  if (values) {
    values->resize(count_);
    for (size_t i = 0; i < count_; ++i) (*values)[i] = values_[(start + i) % cap];
  }
  if (times) {
    times->resize(count_);
    for (size_t i = 0; i < count_; ++i) (*times)[i] = times_[(start + i) % cap];
  }
}

} // namespace eegmon
