#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace eegmon {

// Little-endian two's complement 16-bit sample.
inline int16_t decode_int16_le(uint8_t lo, uint8_t hi) {
  return static_cast<int16_t>(static_cast<uint16_t>(lo) | (static_cast<uint16_t>(hi) << 8));
}

inline void append_int16_le(int16_t v, std::vector<uint8_t>* out) {
  const uint16_t u = static_cast<uint16_t>(v);
  out->push_back(static_cast<uint8_t>(u & 0xFF));
  out->push_back(static_cast<uint8_t>((u >> 8) & 0xFF));
}

// Turns an unframed byte stream into int16 samples.
//
// Reads do not have to end on a sample boundary: a trailing odd byte is held
// and completed by the first byte of the next feed().
class SampleDecoder {
public:
  // Appends the decoded samples to *out and returns how many were added.
  size_t feed(const uint8_t* data, size_t n, std::vector<int16_t>* out);

  bool has_pending_byte() const { return has_pending_; }

  void reset();

private:
  bool has_pending_{false};
  uint8_t pending_{0};
};

} // namespace eegmon
