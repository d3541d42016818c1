#ifndef RANDSTREAM_ENDIAN_HPP
#define RANDSTREAM_ENDIAN_HPP

#include <cstddef>
#include <cstdint>

// Little-endian load/store helpers. Every multi-byte integer randstream puts
// on a stream goes through these.

namespace randstream {

inline size_t storeU16(uint8_t *p, uint16_t v) {
  p[0] = static_cast<uint8_t>(v);
  p[1] = static_cast<uint8_t>(v >> 8);
  return sizeof(v);
}

inline size_t storeU32(uint8_t *p, uint32_t v) {
  for (size_t i = 0; i < sizeof(v); ++i) {
    p[i] = static_cast<uint8_t>(v >> (8 * i));
  }
  return sizeof(v);
}

inline size_t storeU64(uint8_t *p, uint64_t v) {
  storeU32(p + 0, static_cast<uint32_t>(v));
  storeU32(p + 4, static_cast<uint32_t>(v >> 32));
  return sizeof(v);
}

inline uint16_t loadU16(const uint8_t *p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t loadU32(const uint8_t *p) {
  return (static_cast<uint32_t>(p[0]) << 0) |
         (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

inline uint64_t loadU64(const uint8_t *p) {
  return static_cast<uint64_t>(loadU32(p)) |
         (static_cast<uint64_t>(loadU32(p + 4)) << 32);
}

} // namespace randstream

#endif // RANDSTREAM_ENDIAN_HPP
