#include "randstream/work_partitioner.hpp"
#include "randstream/chunk_framer.hpp"
#include "randstream/errors.hpp"

#include <stdexcept>
#include <string>

namespace randstream {

WorkPartitioner::WorkPartitioner(uint64_t total_size, uint64_t chunk_size)
    : total_size_(total_size), chunk_size_(chunk_size), chunk_count_(0) {
  if (total_size_ == 0) {
    throw ConfigurationError("stream size must be greater than zero");
  }
  if (chunk_size_ == 0) {
    throw ConfigurationError("chunk size must be greater than zero");
  }
  chunk_count_ = total_size_ / chunk_size_ + (total_size_ % chunk_size_ != 0);
}

ChunkDescriptor WorkPartitioner::at(uint64_t index) const {
  if (index >= chunk_count_) {
    throw std::out_of_range("chunk index " + std::to_string(index) +
                            " is past the last chunk (" +
                            std::to_string(chunk_count_ - 1) + ")");
  }
  ChunkDescriptor desc;
  desc.index = index;
  desc.offset = index * chunk_size_;
  uint64_t remaining = total_size_ - desc.offset;
  desc.length = remaining < chunk_size_ ? remaining : chunk_size_;
  return desc;
}

std::optional<ChunkDescriptor> WorkPartitioner::next() {
  if (cursor_ >= chunk_count_) {
    return std::nullopt;
  }
  return at(cursor_++);
}

uint64_t WorkPartitioner::framedSize() const {
  return total_size_ + chunk_count_ * CHECKSUM_SIZE;
}

uint64_t WorkPartitioner::streamOffset(const ChunkDescriptor &desc,
                                       uint64_t header_size) {
  return header_size + desc.offset + desc.index * CHECKSUM_SIZE;
}

uint64_t WorkPartitioner::logicalSizeForCapacity(uint64_t capacity,
                                                 uint64_t header_size,
                                                 uint64_t chunk_size) {
  if (chunk_size == 0) {
    throw ConfigurationError("chunk size must be greater than zero");
  }
  if (capacity <= header_size + CHECKSUM_SIZE) {
    throw ConfigurationError("capacity of " + std::to_string(capacity) +
                             " bytes cannot hold a stream header and one "
                             "chunk");
  }
  uint64_t room = capacity - header_size;
  uint64_t full_frame = chunk_size + CHECKSUM_SIZE;
  uint64_t full_chunks = room / full_frame;
  uint64_t tail_room = room % full_frame;
  uint64_t tail = tail_room > CHECKSUM_SIZE ? tail_room - CHECKSUM_SIZE : 0;
  return full_chunks * chunk_size + tail;
}

} // namespace randstream
