#include "eegmon/sample_decoder.hpp"

#include <stdexcept>

namespace eegmon {

size_t SampleDecoder::feed(const uint8_t* data, size_t n, std::vector<int16_t>* out) {
  if (!out) throw std::runtime_error("SampleDecoder::feed: out is null");
  if (n == 0) return 0;
  if (!data) throw std::runtime_error("SampleDecoder::feed: data is null");

  const size_t before = out->size();
  size_t i = 0;

  if (has_pending_) {
    out->push_back(decode_int16_le(pending_, data[0]));
    has_pending_ = false;
    i = 1;
  }

  for (; i + 1 < n; i += 2) {
    out->push_back(decode_int16_le(data[i], data[i + 1]));
  }

  if (i < n) {
    pending_ = data[i];
    has_pending_ = true;
  }

  return out->size() - before;
}

void SampleDecoder::reset() {
  has_pending_ = false;
  pending_ = 0;
}

} // namespace eegmon
