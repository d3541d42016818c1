#include "randstream/parallel_executor.hpp"
#include "randstream/chunk_framer.hpp"
#include "randstream/errors.hpp"
#include "utilities/logger.h"

#include <exception>
#include <functional>
#include <stdexcept>
#include <string>

namespace randstream {

std::optional<ChunkDescriptor> DescriptorQueue::pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return std::nullopt;
  }
  return partitioner_.next();
}

void DescriptorQueue::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
}

ParallelExecutor::ParallelExecutor(const ByteExpander &expander, unsigned jobs)
    : expander_(expander), jobs_(jobs) {
  if (jobs_ == 0) {
    throw ConfigurationError("job count must be at least 1");
  }
}

ParallelExecutor::~ParallelExecutor() { stop(); }

void ParallelExecutor::start(DescriptorQueue &queue, CompletionSink &sink) {
  if (!workers_.empty()) {
    throw std::logic_error("ParallelExecutor::start() called twice");
  }
  queue_ = &queue;
  sink_ = &sink;
  workers_.reserve(jobs_);
  for (unsigned i = 0; i < jobs_; ++i) {
    workers_.emplace_back(&ParallelExecutor::workerLoop, this, std::ref(queue),
                          std::ref(sink));
  }
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Started " + std::to_string(jobs_) + " workers");
}

void ParallelExecutor::workerLoop(DescriptorQueue &queue,
                                  CompletionSink &sink) {
  try {
    while (!sink.cancelled()) {
      std::optional<ChunkDescriptor> desc = queue.pop();
      if (!desc) {
        break;
      }
      Chunk chunk = ChunkFramer::frame(
          desc->index,
          expander_.expand(desc->index, static_cast<size_t>(desc->length)));
      if (!sink.put(std::move(chunk))) {
        break;
      }
    }
  } catch (...) {
    // Hand the error to the consumer thread, which rethrows it.
    queue.close();
    sink.fail(std::current_exception());
  }
}

void ParallelExecutor::join() {
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

void ParallelExecutor::stop() {
  if (queue_) {
    queue_->close();
  }
  if (sink_) {
    sink_->cancel();
  }
  join();
}

} // namespace randstream
