#include "utilities/size_utils.hpp"
#include "randstream/errors.hpp"

#include <algorithm> // For std::transform
#include <cctype>    // For std::isdigit, std::tolower
#include <cmath>     // For std::floor
#include <cstdio>    // For std::snprintf
#include <limits>

namespace randstream {

namespace {

struct Unit {
  const char *name;
  uint64_t multiplier;
};

constexpr uint64_t KIB = 1024ULL;
constexpr uint64_t KB = 1000ULL;

// Lower-case unit names, longest first within each family.
const Unit UNITS[] = {
    {"", 1},
    {"b", 1},
    {"k", KIB},
    {"kib", KIB},
    {"kb", KB},
    {"m", KIB * KIB},
    {"mib", KIB * KIB},
    {"mb", KB * KB},
    {"g", KIB * KIB * KIB},
    {"gib", KIB * KIB * KIB},
    {"gb", KB * KB * KB},
    {"t", KIB * KIB * KIB * KIB},
    {"tib", KIB * KIB * KIB * KIB},
    {"tb", KB * KB * KB * KB},
    {"p", KIB * KIB * KIB * KIB * KIB},
    {"pib", KIB * KIB * KIB * KIB * KIB},
    {"pb", KB * KB * KB * KB * KB},
    {"e", KIB * KIB * KIB * KIB * KIB * KIB},
    {"eib", KIB * KIB * KIB * KIB * KIB * KIB},
    {"eb", KB * KB * KB * KB * KB * KB},
};

} // namespace

uint64_t parse_size(const std::string &text) {
  size_t begin = text.find_first_not_of(" \t");
  size_t end = text.find_last_not_of(" \t");
  if (begin == std::string::npos) {
    throw ConfigurationError("empty size");
  }
  const std::string s = text.substr(begin, end - begin + 1);

  size_t pos = 0;
  uint64_t integer = 0;
  const uint64_t max = std::numeric_limits<uint64_t>::max();
  while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
    uint64_t digit = static_cast<uint64_t>(s[pos] - '0');
    if (integer > (max - digit) / 10) {
      throw ConfigurationError("size out of range: " + text);
    }
    integer = integer * 10 + digit;
    ++pos;
  }
  if (pos == 0) {
    throw ConfigurationError("size must start with a number: " + text);
  }

  // Optional fraction, only meaningful together with a unit.
  std::string fraction;
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    while (pos < s.size() &&
           std::isdigit(static_cast<unsigned char>(s[pos]))) {
      fraction += s[pos++];
    }
    if (fraction.empty()) {
      throw ConfigurationError("missing digits after the decimal point: " +
                               text);
    }
  }

  while (pos < s.size() && s[pos] == ' ') {
    ++pos;
  }
  std::string unit = s.substr(pos);
  std::transform(unit.begin(), unit.end(), unit.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  const Unit *match = nullptr;
  for (const Unit &u : UNITS) {
    if (unit == u.name) {
      match = &u;
      break;
    }
  }
  if (!match) {
    throw ConfigurationError("unknown size unit '" + s.substr(pos) +
                             "' in " + text);
  }

  if (integer > max / match->multiplier) {
    throw ConfigurationError("size out of range: " + text);
  }
  uint64_t value = integer * match->multiplier;

  if (!fraction.empty()) {
    double part = std::stod("0." + fraction) *
                  static_cast<double>(match->multiplier);
    uint64_t extra = static_cast<uint64_t>(std::floor(part));
    if (value > max - extra) {
      throw ConfigurationError("size out of range: " + text);
    }
    value += extra;
  }
  return value;
}

std::string format_size(uint64_t bytes) {
  static const char *const names[] = {"B",   "KiB", "MiB", "GiB",
                                      "TiB", "PiB", "EiB"};
  if (bytes < KIB) {
    return std::to_string(bytes) + " B";
  }
  double value = static_cast<double>(bytes);
  int unit = 0;
  while (value >= 1024.0 && unit < 6) {
    value /= 1024.0;
    ++unit;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f %s", value, names[unit]);
  return buf;
}

std::string format_duration(std::chrono::nanoseconds duration) {
  double seconds = std::chrono::duration<double>(duration).count();
  long long whole = static_cast<long long>(seconds);
  long long hours = whole / 3600;
  long long minutes = (whole % 3600) / 60;
  double rest = seconds - static_cast<double>(hours * 3600 + minutes * 60);

  char buf[64];
  if (hours > 0) {
    std::snprintf(buf, sizeof(buf), "%lldh %02lldm %06.3fs", hours, minutes,
                  rest);
  } else if (minutes > 0) {
    std::snprintf(buf, sizeof(buf), "%lldm %06.3fs", minutes, rest);
  } else {
    std::snprintf(buf, sizeof(buf), "%.3fs", rest);
  }
  return buf;
}

std::string format_throughput(uint64_t bytes,
                              std::chrono::nanoseconds elapsed) {
  double seconds = std::chrono::duration<double>(elapsed).count();
  if (seconds <= 0.0) {
    return "n/a";
  }
  return format_size(static_cast<uint64_t>(static_cast<double>(bytes) /
                                           seconds)) +
         "/s";
}

} // namespace randstream
