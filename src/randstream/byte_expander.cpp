#include "randstream/byte_expander.hpp"

#include <stdexcept> // For std::runtime_error, std::invalid_argument

namespace randstream {

namespace {

// Domain separation for the master key, so the same seed used by another
// BLAKE2b consumer never yields the same key.
constexpr unsigned char SEED_DOMAIN[] = "randstream.seed.v1";

} // namespace

ByteExpander::ByteExpander(const std::vector<uint8_t> &seed) {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }

  crypto_generichash_state state;
  crypto_generichash_init(&state, nullptr, 0, master_key_.size());
  crypto_generichash_update(&state, SEED_DOMAIN, sizeof(SEED_DOMAIN) - 1);
  if (!seed.empty()) {
    crypto_generichash_update(&state, seed.data(), seed.size());
  }
  crypto_generichash_final(&state, master_key_.data(), master_key_.size());
}

ByteExpander::Key ByteExpander::chunkKey(uint64_t chunk_index) const {
  unsigned char index_bytes[8];
  for (int i = 0; i < 8; ++i) {
    index_bytes[i] = static_cast<unsigned char>(chunk_index >> (8 * i));
  }

  Key key;
  crypto_generichash(key.data(), key.size(), index_bytes, sizeof(index_bytes),
                     master_key_.data(), master_key_.size());
  return key;
}

void ByteExpander::expandInto(uint64_t chunk_index, uint8_t *out,
                              size_t length) const {
  if (length == 0) {
    throw std::invalid_argument("chunk payload length must be > 0");
  }
  // Every chunk has its own key, so a zero nonce never repeats a keystream.
  static constexpr unsigned char nonce[crypto_stream_chacha20_NONCEBYTES] = {};
  Key key = chunkKey(chunk_index);
  crypto_stream_chacha20(out, length, nonce, key.data());
  sodium_memzero(key.data(), key.size());
}

std::vector<uint8_t> ByteExpander::expand(uint64_t chunk_index,
                                          size_t length) const {
  std::vector<uint8_t> payload(length);
  expandInto(chunk_index, payload.data(), length);
  return payload;
}

std::vector<uint8_t> ByteExpander::expand(const std::vector<uint8_t> &seed,
                                          uint64_t chunk_index,
                                          size_t length) {
  return ByteExpander(seed).expand(chunk_index, length);
}

} // namespace randstream
