#ifndef RANDSTREAM_BYTE_EXPANDER_HPP
#define RANDSTREAM_BYTE_EXPANDER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <sodium.h> // For BLAKE2b and ChaCha20
#include <vector>

namespace randstream {

/**
 * @brief Deterministic expansion of (seed, chunk index) into payload bytes.
 *
 * The seed is hashed once into a master key. Every chunk then gets its own
 * ChaCha20 key, derived as keyed BLAKE2b(master key, LE64(chunk index)), and
 * its payload is the start of that key's keystream. A chunk therefore never
 * depends on the chunks before it and any worker can compute any chunk.
 *
 * expand() is const and touches no shared mutable state, so one instance can
 * be used from every worker thread at once.
 */
class ByteExpander {
public:
  using Key = std::array<unsigned char, crypto_stream_chacha20_KEYBYTES>;

  /**
   * @brief Construct an expander for a stream seed.
   * @param seed Raw seed bytes, any length.
   * @throw std::runtime_error If libsodium cannot be initialised.
   */
  explicit ByteExpander(const std::vector<uint8_t> &seed);

  /**
   * @brief Produce the payload of a chunk.
   * @param chunk_index 0-based chunk position in the stream.
   * @param length Payload length, must be > 0.
   * @throw std::invalid_argument If length is 0.
   */
  std::vector<uint8_t> expand(uint64_t chunk_index, size_t length) const;

  // Same as expand() but writes into caller-owned memory.
  void expandInto(uint64_t chunk_index, uint8_t *out, size_t length) const;

  /// Key used for a given chunk. Exposed for tests.
  Key chunkKey(uint64_t chunk_index) const;

  /// One-shot form: expand(seed, index, length).
  static std::vector<uint8_t> expand(const std::vector<uint8_t> &seed,
                                     uint64_t chunk_index, size_t length);

private:
  Key master_key_{};
};

} // namespace randstream

#endif // RANDSTREAM_BYTE_EXPANDER_HPP
