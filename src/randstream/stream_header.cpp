#include "randstream/stream_header.hpp"
#include "randstream/byte_io.hpp"
#include "randstream/endian.hpp"
#include "randstream/errors.hpp"

#include <algorithm> // For std::equal, std::copy
#include <string>

namespace randstream {

std::vector<uint8_t> StreamHeader::encode(const StreamParameters &params) {
  params.validate();

  std::vector<uint8_t> out(encodedSize(params.seed.size()));
  uint8_t *p = out.data();
  p = std::copy(MAGIC.begin(), MAGIC.end(), p);
  p += storeU16(p, VERSION);
  p += storeU16(p, static_cast<uint16_t>(params.seed.size()));
  p = std::copy(params.seed.begin(), params.seed.end(), p);
  p += storeU64(p, params.chunk_size);
  storeU64(p, params.total_size);
  return out;
}

namespace {

// Validates magic and version and returns the declared seed length.
size_t checkPrefix(const uint8_t *data, size_t size) {
  if (size < StreamHeader::PREFIX_SIZE) {
    throw FormatError("stream header truncated: " + std::to_string(size) +
                      " bytes, at least " +
                      std::to_string(StreamHeader::PREFIX_SIZE) + " expected");
  }
  if (!std::equal(StreamHeader::MAGIC.begin(), StreamHeader::MAGIC.end(),
                  data)) {
    throw FormatError("bad magic marker, not a randstream stream");
  }
  uint16_t version = loadU16(data + 4);
  if (version != StreamHeader::VERSION) {
    throw FormatError("unsupported format version " + std::to_string(version) +
                      " (supported: " + std::to_string(StreamHeader::VERSION) +
                      ")");
  }
  return loadU16(data + 6);
}

} // namespace

StreamParameters StreamHeader::decode(const uint8_t *data, size_t size) {
  size_t seed_size = checkPrefix(data, size);
  size_t needed = encodedSize(seed_size);
  if (size < needed) {
    throw FormatError("stream header truncated: " + std::to_string(size) +
                      " bytes, " + std::to_string(needed) + " expected");
  }

  StreamParameters params;
  const uint8_t *seed = data + PREFIX_SIZE;
  params.seed.assign(seed, seed + seed_size);
  params.chunk_size = loadU64(seed + seed_size);
  params.total_size = loadU64(seed + seed_size + 8);

  try {
    params.validate();
  } catch (const ConfigurationError &e) {
    throw FormatError(std::string("header describes no valid stream (") +
                      e.what() + ")");
  }
  return params;
}

StreamParameters StreamHeader::read(ByteSource &source) {
  std::vector<uint8_t> buffer(PREFIX_SIZE);
  size_t got = source.read(buffer.data(), PREFIX_SIZE);
  if (got == 0) {
    throw FormatError("stream header missing: input is empty");
  }
  size_t seed_size = checkPrefix(buffer.data(), got);

  size_t rest = encodedSize(seed_size) - PREFIX_SIZE;
  buffer.resize(PREFIX_SIZE + rest);
  got = source.read(buffer.data() + PREFIX_SIZE, rest);
  return decode(buffer.data(), PREFIX_SIZE + got);
}

} // namespace randstream
