#include "eegmon/sample_ring.hpp"

#include "test_support.hpp"

#include <iostream>
#include <vector>

int main() {
  using namespace eegmon;

  SampleRing r(4);
  assert(r.capacity() == 4);
  assert(r.empty());
  assert(r.last_time() == 0.0);

  r.push(1.0, 0.1);
  r.push(2.0, 0.2);
  assert(r.size() == 2);
  assert(r.last_time() == 0.2);

  std::vector<double> v;
  std::vector<double> t;
  r.extract(&v, &t);
  assert((v == std::vector<double>{1.0, 2.0}));
  assert((t == std::vector<double>{0.1, 0.2}));

  // Overflow evicts the oldest pairs.
  for (int i = 3; i <= 7; ++i) r.push(static_cast<double>(i), 0.1 * i);
  assert(r.full());
  assert(r.size() == 4);
  r.extract(&v, &t);
  assert((v == std::vector<double>{4.0, 5.0, 6.0, 7.0}));
  assert(t.front() == 0.1 * 4 && t.back() == 0.1 * 7);
  assert(r.last_time() == 0.1 * 7);

  // Shrinking keeps the newest pairs, growing keeps everything.
  r.resize(2);
  r.extract(&v, nullptr);
  assert((v == std::vector<double>{6.0, 7.0}));
  r.resize(5);
  assert(r.capacity() == 5 && r.size() == 2);
  r.push(8.0, 0.8);
  r.extract(&v, &t);
  assert((v == std::vector<double>{6.0, 7.0, 8.0}));
  assert(r.last_time() == 0.8);

  r.clear();
  assert(r.empty());
  r.extract(&v, &t);
  assert(v.empty() && t.empty());

  bool threw = false;
  try {
    SampleRing bad(0);
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);

  std::cout << "test_sample_ring OK\n";
  return 0;
}
