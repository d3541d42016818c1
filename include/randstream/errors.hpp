#ifndef RANDSTREAM_ERRORS_HPP
#define RANDSTREAM_ERRORS_HPP

#include <cstdint>   // For uint64_t
#include <stdexcept> // For std::runtime_error
#include <string>

namespace randstream {

/**
 * @brief Base class of every error raised by the stream engine.
 *
 * Callers that only need a message can catch this type; the CLI catches the
 * concrete subclasses to pick an exit code.
 */
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &message) : std::runtime_error(message) {}
};

/// Invalid job parameters: zero size, zero chunk size, malformed seed.
class ConfigurationError : public Error {
public:
  explicit ConfigurationError(const std::string &message)
      : Error("configuration error: " + message) {}
};

/// Stream header missing, truncated or of an unsupported format.
class FormatError : public Error {
public:
  explicit FormatError(const std::string &message)
      : Error("format error: " + message) {}
};

/**
 * @brief Regenerated bytes differ from the bytes read back.
 *
 * offset() is the absolute position in the source (header included) of the
 * first differing byte, chunk_index() the chunk containing it.
 */
class CorruptionError : public Error {
public:
  CorruptionError(uint64_t offset, uint64_t chunk_index,
                  const std::string &detail);

  uint64_t offset() const { return offset_; }
  uint64_t chunk_index() const { return chunk_index_; }

private:
  uint64_t offset_;
  uint64_t chunk_index_;
};

/// Read or write failure on a sink or source. error_code() is an errno value
/// or 0 when the failure did not come from the operating system.
class IOError : public Error {
public:
  IOError(const std::string &message, int error_code = 0);

  int error_code() const { return error_code_; }

private:
  int error_code_;
};

} // namespace randstream

#endif // RANDSTREAM_ERRORS_HPP
