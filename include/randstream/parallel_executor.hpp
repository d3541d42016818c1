#ifndef RANDSTREAM_PARALLEL_EXECUTOR_HPP
#define RANDSTREAM_PARALLEL_EXECUTOR_HPP

#include "randstream/byte_expander.hpp"
#include "randstream/completion_sink.hpp"
#include "randstream/work_partitioner.hpp"

#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace randstream {

/**
 * @brief FIFO of chunk descriptors shared by the workers.
 *
 * Descriptors are produced lazily from the partitioner, in index order, one
 * per pop(). close() makes every later pop() return std::nullopt.
 */
class DescriptorQueue {
public:
  explicit DescriptorQueue(WorkPartitioner partitioner)
      : partitioner_(std::move(partitioner)) {}

  std::optional<ChunkDescriptor> pop();
  void close();

private:
  std::mutex mutex_;
  WorkPartitioner partitioner_;
  bool closed_{false};
};

/**
 * @brief Fixed pool of workers computing framed chunks.
 *
 * Each worker pulls a descriptor, expands the payload, frames it and
 * deposits the chunk in the CompletionSink. Workers share nothing but the
 * queue, the sink and the read-only expander, and finish in no particular
 * order. An exception in a worker is handed to CompletionSink::fail(), which
 * stops the others and surfaces the error to the consumer.
 *
 * stop() (also run by the destructor) closes the queue, cancels the sink and
 * joins every worker, discarding chunks still in flight.
 */
class ParallelExecutor {
public:
  /**
   * @param expander Shared, must outlive the executor.
   * @param jobs Worker count, >= 1.
   * @throw ConfigurationError If @p jobs is 0.
   */
  ParallelExecutor(const ByteExpander &expander, unsigned jobs);
  ~ParallelExecutor();

  ParallelExecutor(const ParallelExecutor &) = delete;
  ParallelExecutor &operator=(const ParallelExecutor &) = delete;

  /// Spawn the workers. @p queue and @p sink must outlive join()/stop().
  void start(DescriptorQueue &queue, CompletionSink &sink);

  /// Wait for the workers to run out of descriptors.
  void join();

  /// Abort: close the queue, cancel the sink, join.
  void stop();

private:
  void workerLoop(DescriptorQueue &queue, CompletionSink &sink);

  const ByteExpander &expander_;
  unsigned jobs_;
  std::vector<std::thread> workers_;
  DescriptorQueue *queue_{nullptr};
  CompletionSink *sink_{nullptr};
};

} // namespace randstream

#endif // RANDSTREAM_PARALLEL_EXECUTOR_HPP
