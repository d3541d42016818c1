#include "randstream/chunk_framer.hpp"
#include "randstream/endian.hpp"

#include <utility>
#include <zlib.h> // For crc32_z

namespace randstream {

void Chunk::appendTo(std::vector<uint8_t> &out) const {
  out.insert(out.end(), payload.begin(), payload.end());
  uint8_t trailer[CHECKSUM_SIZE];
  storeU32(trailer, checksum);
  out.insert(out.end(), trailer, trailer + CHECKSUM_SIZE);
}

std::vector<uint8_t> Chunk::serialize() const {
  std::vector<uint8_t> out;
  out.reserve(onStreamSize());
  appendTo(out);
  return out;
}

uint32_t ChunkFramer::checksum(const uint8_t *data, size_t size) {
  uLong crc = crc32_z(0L, Z_NULL, 0);
  crc = crc32_z(crc, data, size);
  return static_cast<uint32_t>(crc);
}

Chunk ChunkFramer::frame(uint64_t index, std::vector<uint8_t> payload) {
  Chunk chunk;
  chunk.index = index;
  chunk.checksum = checksum(payload.data(), payload.size());
  chunk.payload = std::move(payload);
  return chunk;
}

bool ChunkFramer::verify(const Chunk &chunk) {
  return checksum(chunk.payload.data(), chunk.payload.size()) ==
         chunk.checksum;
}

} // namespace randstream
