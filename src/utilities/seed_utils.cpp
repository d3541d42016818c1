#include "utilities/seed_utils.hpp"
#include "randstream/errors.hpp"
#include "randstream/job_config.hpp"

#include <cctype> // For std::isxdigit
#include <sodium.h>
#include <stdexcept>

namespace randstream {

std::vector<uint8_t> parse_seed_hex(const std::string &text) {
  std::string hex = text;
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex = hex.substr(2);
  }
  if (hex.empty()) {
    throw ConfigurationError("seed must not be empty");
  }
  if (hex.size() % 2 != 0) {
    throw ConfigurationError("seed '" + text +
                             "' has an odd number of hex digits");
  }
  for (char c : hex) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      throw ConfigurationError("seed '" + text + "' is not hexadecimal");
    }
  }
  if (hex.size() / 2 > MAX_SEED_SIZE) {
    throw ConfigurationError("seed is longer than " +
                             std::to_string(MAX_SEED_SIZE) + " bytes");
  }

  std::vector<uint8_t> seed(hex.size() / 2);
  size_t seed_len = 0;
  if (sodium_hex2bin(seed.data(), seed.size(), hex.data(), hex.size(), nullptr,
                     &seed_len, nullptr) != 0 ||
      seed_len != seed.size()) {
    throw ConfigurationError("seed '" + text + "' cannot be decoded");
  }
  return seed;
}

std::string seed_to_hex(const std::vector<uint8_t> &seed) {
  std::string hex(seed.size() * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), seed.data(), seed.size());
  hex.pop_back(); // terminating NUL
  return hex;
}

std::vector<uint8_t> generate_seed(size_t size) {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  std::vector<uint8_t> seed(size);
  randombytes_buf(seed.data(), seed.size());
  return seed;
}

} // namespace randstream
