#include "gtest/gtest.h"
#include "randstream/byte_io.hpp"
#include "randstream/chunk_framer.hpp"
#include "randstream/completion_sink.hpp"
#include "randstream/errors.hpp"
#include "randstream/ordered_emitter.hpp"
#include "randstream/work_partitioner.hpp"

#include <vector>

using namespace randstream;

namespace {

Chunk chunkFor(uint64_t index, size_t length) {
  return ChunkFramer::frame(index, std::vector<uint8_t>(length, uint8_t(index)));
}

} // namespace

// Buffers are sized from the chunks actually present, not the chunk size.
TEST(OrderedEmitterTest, HugeChunkSizeSmallStream) {
  WorkPartitioner partitioner(100, 1ULL << 50);
  ASSERT_EQ(partitioner.chunkCount(), 1u);
  const std::vector<uint8_t> header = {'h', 'd', 'r'};

  CompletionSink generated(1, 2);
  ASSERT_TRUE(generated.put(chunkFor(0, 100)));
  MemorySink sink;
  OrderedEmitter writer(generated, partitioner);
  EXPECT_EQ(writer.emitGenerate(header, sink), 3u + 100u + CHECKSUM_SIZE);

  std::vector<uint8_t> chunk_area(sink.data().begin() + 3, sink.data().end());
  MemorySource source(chunk_area);
  CompletionSink expected(1, 2);
  ASSERT_TRUE(expected.put(chunkFor(0, 100)));
  OrderedEmitter checker(expected, partitioner);
  EXPECT_NO_THROW(checker.emitValidate(header.size(), source));
}

TEST(OrderedEmitterTest, ValidateReportsAbsoluteOffset) {
  WorkPartitioner partitioner(20, 10);
  CompletionSink sink(2, 4);
  ASSERT_TRUE(sink.put(chunkFor(0, 10)));
  ASSERT_TRUE(sink.put(chunkFor(1, 10)));

  std::vector<uint8_t> data = chunkFor(0, 10).serialize();
  std::vector<uint8_t> second = chunkFor(1, 10).serialize();
  second[2] = 0xEE;
  data.insert(data.end(), second.begin(), second.end());
  MemorySource source(data);

  OrderedEmitter checker(sink, partitioner);
  try {
    checker.emitValidate(7, source);
    FAIL() << "mismatch went unnoticed";
  } catch (const CorruptionError &e) {
    EXPECT_EQ(e.chunk_index(), 1u);
    EXPECT_EQ(e.offset(), 7u + 14u + 2u);
  }
}
