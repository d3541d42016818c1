#ifndef RANDSTREAM_ORDERED_EMITTER_HPP
#define RANDSTREAM_ORDERED_EMITTER_HPP

#include "randstream/byte_io.hpp"
#include "randstream/completion_sink.hpp"
#include "randstream/work_partitioner.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace randstream {

/**
 * @brief Progress notification: stream bytes handled so far and the total
 * stream size, header included.
 */
using ProgressCallback =
    std::function<void(uint64_t processed_bytes, uint64_t total_bytes)>;

/**
 * @brief Terminal stage of a run, acting on chunks in strict index order.
 *
 * Chunks come out of the CompletionSink already ordered; the emitter either
 * writes them after the header (generate) or compares them with the bytes
 * of a source (validate). The first failure stops the loop and propagates;
 * the caller is responsible for stopping the workers.
 */
class OrderedEmitter {
public:
  /// Chunks between two progress notifications.
  static constexpr uint64_t PROGRESS_INTERVAL = 64;

  OrderedEmitter(CompletionSink &sink, const WorkPartitioner &partitioner,
                 ProgressCallback progress = {});

  /**
   * @brief Write @p header then every chunk to @p out.
   * @return Bytes written, header included.
   * @throw IOError If the sink fails. Errors raised by the workers are
   *        rethrown as is.
   */
  uint64_t emitGenerate(const std::vector<uint8_t> &header, ByteSink &out);

  /**
   * @brief Compare every chunk with the next bytes of @p in.
   *
   * The header (@p header_size bytes) must already have been consumed from
   * @p in. Bytes after the last chunk are not read.
   *
   * @throw CorruptionError At the first differing or missing byte.
   * @throw IOError If reading fails.
   */
  void emitValidate(uint64_t header_size, ByteSource &in);

private:
  /// On-stream size of chunk 0, the largest frame of the run.
  size_t firstFrameSize() const;
  void reportProgress(uint64_t index, uint64_t processed, uint64_t total,
                      bool last);

  CompletionSink &sink_;
  const WorkPartitioner &partitioner_;
  ProgressCallback progress_;
};

} // namespace randstream

#endif // RANDSTREAM_ORDERED_EMITTER_HPP
