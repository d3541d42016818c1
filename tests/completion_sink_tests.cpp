#include "gtest/gtest.h"
#include "randstream/chunk_framer.hpp"
#include "randstream/completion_sink.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using randstream::Chunk;
using randstream::ChunkFramer;
using randstream::CompletionSink;

namespace {

Chunk chunkFor(uint64_t index) {
  return ChunkFramer::frame(index, std::vector<uint8_t>(8, uint8_t(index)));
}

} // namespace

TEST(CompletionSinkTest, OutOfOrderDeliveryDrainsInOrder) {
  CompletionSink sink(4, 4);
  EXPECT_TRUE(sink.put(chunkFor(2)));
  EXPECT_TRUE(sink.put(chunkFor(0)));
  EXPECT_TRUE(sink.put(chunkFor(3)));
  EXPECT_TRUE(sink.put(chunkFor(1)));
  EXPECT_EQ(sink.buffered(), 4u);

  for (uint64_t i = 0; i < 4; ++i) {
    auto chunk = sink.takeNext();
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->index, i);
    EXPECT_EQ(chunk->payload[0], uint8_t(i));
  }
  EXPECT_FALSE(sink.takeNext().has_value());
  EXPECT_EQ(sink.nextIndex(), 4u);
}

TEST(CompletionSinkTest, DuplicateIndexThrows) {
  CompletionSink sink(4, 4);
  EXPECT_TRUE(sink.put(chunkFor(1)));
  EXPECT_THROW(sink.put(chunkFor(1)), std::logic_error);

  EXPECT_TRUE(sink.put(chunkFor(0)));
  ASSERT_TRUE(sink.takeNext().has_value());
  // Already consumed.
  EXPECT_THROW(sink.put(chunkFor(0)), std::logic_error);
}

TEST(CompletionSinkTest, OutOfRangeIndexThrows) {
  CompletionSink sink(2, 4);
  EXPECT_THROW(sink.put(chunkFor(2)), std::logic_error);
}

TEST(CompletionSinkTest, WindowBlocksProducerUntilConsumed) {
  CompletionSink sink(8, 2);
  std::atomic<bool> delivered{false};
  std::thread producer([&] {
    sink.put(chunkFor(2)); // outside the window [0, 2)
    delivered = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(delivered.load());

  sink.put(chunkFor(0));
  ASSERT_TRUE(sink.takeNext().has_value());
  producer.join();
  EXPECT_TRUE(delivered.load());
  EXPECT_EQ(sink.buffered(), 1u);
}

TEST(CompletionSinkTest, CancelWakesConsumerAndProducers) {
  CompletionSink sink(8, 1);
  std::thread producer([&] { EXPECT_FALSE(sink.put(chunkFor(3))); });
  std::thread consumer([&] { EXPECT_FALSE(sink.takeNext().has_value()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  sink.cancel();
  producer.join();
  consumer.join();
  EXPECT_TRUE(sink.cancelled());
}

TEST(CompletionSinkTest, FailRethrowsOnConsumer) {
  CompletionSink sink(4, 4);
  sink.put(chunkFor(0));
  sink.fail(std::make_exception_ptr(std::runtime_error("worker died")));
  sink.fail(std::make_exception_ptr(std::runtime_error("second error")));
  try {
    sink.takeNext();
    FAIL() << "takeNext() should rethrow the recorded error";
  } catch (const std::runtime_error &e) {
    EXPECT_STREQ(e.what(), "worker died");
  }
  EXPECT_FALSE(sink.put(chunkFor(1)));
}

TEST(CompletionSinkTest, ConcurrentProducers) {
  const uint64_t total = 200;
  CompletionSink sink(total, 8);
  std::vector<std::thread> producers;
  for (uint64_t t = 0; t < 4; ++t) {
    producers.emplace_back([&, t] {
      for (uint64_t i = t; i < total; i += 4)
        sink.put(chunkFor(i));
    });
  }

  uint64_t expected = 0;
  while (auto chunk = sink.takeNext()) {
    EXPECT_EQ(chunk->index, expected++);
  }
  for (auto &p : producers)
    p.join();
  EXPECT_EQ(expected, total);
}
