#ifndef RANDSTREAM_CHUNK_FRAMER_HPP
#define RANDSTREAM_CHUNK_FRAMER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace randstream {

/// Bytes appended after each payload.
inline constexpr size_t CHECKSUM_SIZE = 4;

/**
 * @brief A framed chunk: payload plus CRC-32 of that payload.
 *
 * On a stream it is laid out as payload followed by the checksum in
 * little-endian order.
 */
struct Chunk {
  uint64_t index{0};
  std::vector<uint8_t> payload;
  uint32_t checksum{0};

  /// Payload length + CHECKSUM_SIZE.
  size_t onStreamSize() const { return payload.size() + CHECKSUM_SIZE; }

  /// Append the on-stream representation to @p out.
  void appendTo(std::vector<uint8_t> &out) const;

  /// On-stream representation as a new buffer.
  std::vector<uint8_t> serialize() const;
};

/**
 * @brief Computes the per-chunk integrity code.
 *
 * The checksum is the IEEE 802.3 CRC-32 (zlib) of the payload. It detects
 * accidental corruption only; it is not a MAC.
 */
class ChunkFramer {
public:
  /// Wrap @p payload into a Chunk with its checksum.
  static Chunk frame(uint64_t index, std::vector<uint8_t> payload);

  /// CRC-32 of @p size bytes at @p data.
  static uint32_t checksum(const uint8_t *data, size_t size);

  /// True if the stored checksum matches the payload.
  static bool verify(const Chunk &chunk);
};

} // namespace randstream

#endif // RANDSTREAM_CHUNK_FRAMER_HPP
