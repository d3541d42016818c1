#ifndef RANDSTREAM_STREAM_HEADER_HPP
#define RANDSTREAM_STREAM_HEADER_HPP

#include "randstream/job_config.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace randstream {

class ByteSource;

/**
 * @brief Serialisation of the self-describing stream header.
 *
 * Layout, all integers little-endian:
 *
 *   offset  size  field
 *   0       4     magic "RSTM"
 *   4       2     format version
 *   6       2     seed length L
 *   8       L     seed bytes
 *   8+L     8     chunk payload size
 *   16+L    8     total logical size
 *
 * The header is the only state needed to regenerate or validate the rest of
 * the stream.
 */
class StreamHeader {
public:
  static constexpr std::array<uint8_t, 4> MAGIC = {'R', 'S', 'T', 'M'};
  static constexpr uint16_t VERSION = 1;

  /// Bytes before the seed: magic, version, seed length.
  static constexpr size_t PREFIX_SIZE = 8;
  /// Bytes after the seed: chunk size, total size.
  static constexpr size_t TRAILER_SIZE = 16;

  /// Encoded size of a header carrying a seed of @p seed_size bytes.
  static constexpr size_t encodedSize(size_t seed_size) {
    return PREFIX_SIZE + seed_size + TRAILER_SIZE;
  }

  /**
   * @brief Encode stream parameters.
   * @throw ConfigurationError If the parameters are not valid.
   */
  static std::vector<uint8_t> encode(const StreamParameters &params);
  static std::vector<uint8_t> encode(const JobConfiguration &config) {
    return encode(config.stream);
  }

  /**
   * @brief Decode a header from the start of @p data.
   *
   * Trailing bytes after the header are ignored.
   *
   * @throw FormatError On a bad magic marker, an unsupported version, a
   *        truncated buffer or parameters describing no valid stream.
   */
  static StreamParameters decode(const uint8_t *data, size_t size);
  static StreamParameters decode(const std::vector<uint8_t> &data) {
    return decode(data.data(), data.size());
  }

  /**
   * @brief Read and decode a header from the current position of @p source.
   *
   * Consumes exactly the header bytes.
   *
   * @throw FormatError If the source ends before a full header was read or
   *        the header is invalid.
   * @throw IOError If reading fails.
   */
  static StreamParameters read(ByteSource &source);
};

} // namespace randstream

#endif // RANDSTREAM_STREAM_HEADER_HPP
