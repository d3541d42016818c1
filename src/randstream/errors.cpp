#include "randstream/errors.hpp"

#include <cstring> // For std::strerror

namespace randstream {

CorruptionError::CorruptionError(uint64_t offset, uint64_t chunk_index,
                                 const std::string &detail)
    : Error("corruption detected in chunk " + std::to_string(chunk_index) +
            " at offset " + std::to_string(offset) +
            (detail.empty() ? std::string() : ": " + detail)),
      offset_(offset), chunk_index_(chunk_index) {}

IOError::IOError(const std::string &message, int error_code)
    : Error("I/O error: " + message +
            (error_code != 0 ? std::string(" (") + std::strerror(error_code) +
                                   ")"
                             : std::string())),
      error_code_(error_code) {}

} // namespace randstream
