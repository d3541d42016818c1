#include "randstream/ordered_emitter.hpp"
#include "randstream/errors.hpp"
#include "utilities/logger.h"

#include <algorithm> // For std::mismatch
#include <optional>
#include <string>
#include <utility>

namespace randstream {

OrderedEmitter::OrderedEmitter(CompletionSink &sink,
                               const WorkPartitioner &partitioner,
                               ProgressCallback progress)
    : sink_(sink), partitioner_(partitioner), progress_(std::move(progress)) {}

void OrderedEmitter::reportProgress(uint64_t index, uint64_t processed,
                                    uint64_t total, bool last) {
  if (!progress_) {
    return;
  }
  if (last || (index + 1) % PROGRESS_INTERVAL == 0) {
    progress_(processed, total);
  }
}

size_t OrderedEmitter::firstFrameSize() const {
  // Chunk 0 is the longest; the chunk size may exceed the whole stream.
  return static_cast<size_t>(partitioner_.at(0).length) + CHECKSUM_SIZE;
}

uint64_t OrderedEmitter::emitGenerate(const std::vector<uint8_t> &header,
                                      ByteSink &out) {
  const uint64_t total = header.size() + partitioner_.framedSize();
  const uint64_t last_index = partitioner_.chunkCount() - 1;

  out.write(header.data(), header.size());
  uint64_t written = header.size();

  std::vector<uint8_t> frame;
  frame.reserve(firstFrameSize());
  while (std::optional<Chunk> chunk = sink_.takeNext()) {
    frame.clear();
    chunk->appendTo(frame);
    out.write(frame.data(), frame.size());
    written += frame.size();
    reportProgress(chunk->index, written, total, chunk->index == last_index);
  }

  out.flush();
  if (written != total) {
    // takeNext() only stops early when the run was cancelled.
    throw Error("generation cancelled after " + std::to_string(written) +
                  " of " + std::to_string(total) + " bytes");
  }
  return written;
}

void OrderedEmitter::emitValidate(uint64_t header_size, ByteSource &in) {
  const uint64_t total = header_size + partitioner_.framedSize();
  const uint64_t last_index = partitioner_.chunkCount() - 1;
  uint64_t validated = header_size;

  std::vector<uint8_t> expected;
  std::vector<uint8_t> actual;
  expected.reserve(firstFrameSize());
  while (std::optional<Chunk> chunk = sink_.takeNext()) {
    const ChunkDescriptor desc = partitioner_.at(chunk->index);
    const uint64_t stream_offset =
        WorkPartitioner::streamOffset(desc, header_size);

    expected.clear();
    chunk->appendTo(expected);
    actual.resize(expected.size());
    size_t got = in.read(actual.data(), actual.size());

    auto diff = std::mismatch(expected.begin(), expected.begin() + got,
                              actual.begin());
    if (diff.first != expected.begin() + got) {
      uint64_t pos = static_cast<uint64_t>(diff.first - expected.begin());
      const char *where =
          pos >= desc.length ? "checksum differs" : "payload differs";
      throw CorruptionError(stream_offset + pos, desc.index, where);
    }
    if (got < expected.size()) {
      throw CorruptionError(stream_offset + got, desc.index,
                            "stream ends early (" + std::to_string(got) +
                                " of " + std::to_string(expected.size()) +
                                " chunk bytes present)");
    }

    validated += expected.size();
    reportProgress(chunk->index, validated, total, chunk->index == last_index);
  }

  if (validated != total) {
    throw Error("validation cancelled after " + std::to_string(validated) +
                  " of " + std::to_string(total) + " bytes");
  }
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Validated " + std::to_string(validated) +
                                " stream bytes");
}

} // namespace randstream
