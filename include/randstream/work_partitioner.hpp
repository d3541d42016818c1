#ifndef RANDSTREAM_WORK_PARTITIONER_HPP
#define RANDSTREAM_WORK_PARTITIONER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>

namespace randstream {

/// Position and length of one chunk in the logical stream.
struct ChunkDescriptor {
  uint64_t index{0};
  uint64_t offset{0}; ///< Logical offset, headers and checksums excluded.
  uint64_t length{0}; ///< Payload length.

  bool operator==(const ChunkDescriptor &other) const = default;
};

/**
 * @brief Splits a stream into ordered, contiguous chunk descriptors.
 *
 * Every chunk but the last is chunk_size long; the last holds the remainder
 * (or a full chunk when the size divides evenly). Descriptors can be pulled
 * lazily with next(), or addressed directly with at(). The partitioner keeps
 * no state besides its cursor, so reset() restarts the exact same sequence.
 */
class WorkPartitioner {
public:
  /**
   * @throw ConfigurationError If total_size or chunk_size is 0.
   */
  WorkPartitioner(uint64_t total_size, uint64_t chunk_size);

  uint64_t totalSize() const { return total_size_; }
  uint64_t chunkSize() const { return chunk_size_; }
  uint64_t chunkCount() const { return chunk_count_; }

  /// Descriptor of chunk @p index. @throw std::out_of_range past the end.
  ChunkDescriptor at(uint64_t index) const;

  /// Next descriptor in stream order, or std::nullopt once exhausted.
  std::optional<ChunkDescriptor> next();

  /// Rewind the cursor to chunk 0.
  void reset() { cursor_ = 0; }

  /// Bytes the chunk area occupies on a stream (payloads + checksums).
  uint64_t framedSize() const;

  /// Absolute stream offset of a chunk, given the header length.
  static uint64_t streamOffset(const ChunkDescriptor &desc,
                               uint64_t header_size);

  /**
   * @brief Largest logical size whose stream fits in @p capacity bytes.
   *
   * Used to fill an existing file or block device: header + payloads + one
   * checksum per chunk must not exceed the capacity.
   *
   * @throw ConfigurationError If not even a one-byte stream fits.
   */
  static uint64_t logicalSizeForCapacity(uint64_t capacity,
                                         uint64_t header_size,
                                         uint64_t chunk_size);

private:
  uint64_t total_size_;
  uint64_t chunk_size_;
  uint64_t chunk_count_;
  uint64_t cursor_{0};
};

} // namespace randstream

#endif // RANDSTREAM_WORK_PARTITIONER_HPP
