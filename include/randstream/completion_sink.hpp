#ifndef RANDSTREAM_COMPLETION_SINK_HPP
#define RANDSTREAM_COMPLETION_SINK_HPP

#include "randstream/chunk_framer.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <mutex>
#include <optional>

namespace randstream {

/**
 * @brief Hand-off point between the workers and the ordered emitter.
 *
 * Workers deposit chunks in completion order; the emitter takes them back in
 * index order. Early chunks wait in an index-keyed map until every lower
 * index has been taken.
 *
 * The buffer is bounded: put() blocks while the chunk is @c window or more
 * indices ahead of the next one the emitter expects. Descriptors are handed
 * out in index order, so the chunk the emitter waits for is always inside
 * the window and the producers cannot starve the consumer.
 *
 * Any side can end the run: fail() records the first error and wakes
 * everybody, cancel() does the same without an error.
 */
class CompletionSink {
public:
  /**
   * @param total_chunks Number of chunks the run produces.
   * @param window Maximum distance between the next expected index and the
   *        highest index allowed into the buffer. Must be >= 1.
   */
  CompletionSink(uint64_t total_chunks, size_t window);

  CompletionSink(const CompletionSink &) = delete;
  CompletionSink &operator=(const CompletionSink &) = delete;

  /**
   * @brief Deposit a finished chunk.
   * @return false if the run was cancelled; the chunk is dropped.
   * @throw std::logic_error On a duplicate or out-of-range index.
   */
  bool put(Chunk chunk);

  /**
   * @brief Take the chunk with the next index, waiting for it if needed.
   * @return The chunk, or std::nullopt once every chunk was delivered or the
   *         run was cancelled.
   * @throw Rethrows the error passed to fail().
   */
  std::optional<Chunk> takeNext();

  /// Record @p error (first one wins) and cancel the run.
  void fail(std::exception_ptr error);

  /// Wake every waiter and make put()/takeNext() return immediately.
  void cancel();

  bool cancelled() const;

  /// Index takeNext() will return next.
  uint64_t nextIndex() const;

  /// Chunks currently parked in the buffer.
  size_t buffered() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable producer_cv_;
  std::condition_variable consumer_cv_;
  std::map<uint64_t, Chunk> pending_;
  uint64_t total_chunks_;
  size_t window_;
  uint64_t next_{0};
  bool cancelled_{false};
  std::exception_ptr error_;
};

} // namespace randstream

#endif // RANDSTREAM_COMPLETION_SINK_HPP
