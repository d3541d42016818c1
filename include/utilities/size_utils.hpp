#ifndef RANDSTREAM_SIZE_UTILS_HPP
#define RANDSTREAM_SIZE_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace randstream {

/**
 * @brief Parse a human readable byte count.
 *
 * Accepts a decimal number with an optional fraction and an optional,
 * case-insensitive unit: "", "B", binary multiples "K", "M", "G", "T",
 * "P", "E" and "KiB".."EiB" (powers of 1024), and decimal multiples
 * "KB".."EB" (powers of 1000). Examples: "4096", "32k", "1.5GiB", "10MB".
 *
 * @throw ConfigurationError On malformed input or overflow.
 */
uint64_t parse_size(const std::string &text);

/// Render a byte count with a binary unit, e.g. "1.50 MiB".
std::string format_size(uint64_t bytes);

/// Render a duration as "1h 02m 03.456s", "2m 05.000s" or "0.123s".
std::string format_duration(std::chrono::nanoseconds duration);

/// Render bytes/second as "123.45 MiB/s".
std::string format_throughput(uint64_t bytes, std::chrono::nanoseconds elapsed);

} // namespace randstream

#endif // RANDSTREAM_SIZE_UTILS_HPP
