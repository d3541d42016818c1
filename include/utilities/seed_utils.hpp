#ifndef RANDSTREAM_SEED_UTILS_HPP
#define RANDSTREAM_SEED_UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace randstream {

/**
 * @brief Decode a seed given as hexadecimal text.
 *
 * An optional "0x" prefix is accepted; digits may be upper or lower case.
 *
 * @throw ConfigurationError If the text is empty, has an odd number of
 *        digits, contains a non-hex character or is too long for a header.
 */
std::vector<uint8_t> parse_seed_hex(const std::string &text);

/// Lower-case hexadecimal form of @p seed.
std::string seed_to_hex(const std::vector<uint8_t> &seed);

/**
 * @brief Fresh random seed from the system CSPRNG.
 * @throw std::runtime_error If libsodium cannot be initialised.
 */
std::vector<uint8_t> generate_seed(size_t size);

} // namespace randstream

#endif // RANDSTREAM_SEED_UTILS_HPP
