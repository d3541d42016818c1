#include "randstream/completion_sink.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace randstream {

CompletionSink::CompletionSink(uint64_t total_chunks, size_t window)
    : total_chunks_(total_chunks), window_(window == 0 ? 1 : window) {}

bool CompletionSink::put(Chunk chunk) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (chunk.index >= total_chunks_) {
    throw std::logic_error("chunk index " + std::to_string(chunk.index) +
                           " is out of range");
  }
  if (chunk.index < next_ || pending_.count(chunk.index) != 0) {
    throw std::logic_error("chunk " + std::to_string(chunk.index) +
                           " delivered twice");
  }

  producer_cv_.wait(lock, [&] {
    return cancelled_ || chunk.index < next_ + window_;
  });
  if (cancelled_) {
    return false;
  }

  uint64_t index = chunk.index;
  pending_.emplace(index, std::move(chunk));
  if (index == next_) {
    consumer_cv_.notify_one();
  }
  return true;
}

std::optional<Chunk> CompletionSink::takeNext() {
  std::unique_lock<std::mutex> lock(mutex_);
  consumer_cv_.wait(lock, [&] {
    return cancelled_ || next_ >= total_chunks_ ||
           pending_.count(next_) != 0;
  });
  if (error_) {
    std::rethrow_exception(error_);
  }
  if (cancelled_ || next_ >= total_chunks_) {
    return std::nullopt;
  }

  auto it = pending_.find(next_);
  Chunk chunk = std::move(it->second);
  pending_.erase(it);
  ++next_;
  // The window moved; producers holding the new last slot can go.
  producer_cv_.notify_all();
  return chunk;
}

void CompletionSink::fail(std::exception_ptr error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!error_) {
      error_ = std::move(error);
    }
    cancelled_ = true;
    pending_.clear();
  }
  producer_cv_.notify_all();
  consumer_cv_.notify_all();
}

void CompletionSink::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    pending_.clear();
  }
  producer_cv_.notify_all();
  consumer_cv_.notify_all();
}

bool CompletionSink::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

uint64_t CompletionSink::nextIndex() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_;
}

size_t CompletionSink::buffered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

} // namespace randstream
