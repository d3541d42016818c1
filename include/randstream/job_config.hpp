#ifndef RANDSTREAM_JOB_CONFIG_HPP
#define RANDSTREAM_JOB_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace randstream {

/// Default payload bytes per chunk (checksum excluded).
inline constexpr uint64_t DEFAULT_CHUNK_SIZE = 32 * 1024;

/// Largest seed the header can describe (16-bit length field).
inline constexpr size_t MAX_SEED_SIZE = 0xFFFF;

/// Number of random bytes drawn when the user supplies no seed.
inline constexpr size_t GENERATED_SEED_SIZE = 16;

/**
 * @brief Everything that determines the bytes of a stream.
 *
 * This is exactly what the stream header carries: two runs with equal
 * parameters produce identical streams.
 */
struct StreamParameters {
  std::vector<uint8_t> seed;
  uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
  uint64_t total_size{0};

  bool operator==(const StreamParameters &other) const = default;

  /**
   * @brief Check the parameters describe a stream that can be produced.
   * @throw ConfigurationError on an empty or oversized seed, a zero total
   *        size or a zero chunk size.
   */
  void validate() const;
};

/**
 * @brief Parameters of a single generate or validate run.
 *
 * Built once by the caller and read-only for the lifetime of the run. The
 * worker count only affects speed, never the produced bytes.
 */
struct JobConfiguration {
  StreamParameters stream;
  unsigned jobs{1};

  /// Same checks as StreamParameters::validate() plus jobs >= 1.
  void validate() const;

  /// Worker count used when the caller expresses no preference.
  static unsigned defaultJobs();
};

} // namespace randstream

#endif // RANDSTREAM_JOB_CONFIG_HPP
