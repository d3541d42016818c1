#include "gtest/gtest.h"
#include "randstream/chunk_framer.hpp"
#include "test_helpers.hpp"

using randstream::CHECKSUM_SIZE;
using randstream::Chunk;
using randstream::ChunkFramer;
using randstream::test::bytes;

TEST(ChunkFramerTest, Crc32CheckValue) {
  std::vector<uint8_t> data = bytes("123456789");
  EXPECT_EQ(ChunkFramer::checksum(data.data(), data.size()), 0xCBF43926u);
}

TEST(ChunkFramerTest, FrameAppendsLittleEndianChecksum) {
  Chunk chunk = ChunkFramer::frame(5, bytes("123456789"));
  EXPECT_EQ(chunk.index, 5u);
  EXPECT_EQ(chunk.checksum, 0xCBF43926u);
  EXPECT_EQ(chunk.onStreamSize(), 9u + CHECKSUM_SIZE);

  std::vector<uint8_t> wire = chunk.serialize();
  ASSERT_EQ(wire.size(), 13u);
  EXPECT_EQ(std::vector<uint8_t>(wire.begin(), wire.begin() + 9),
            bytes("123456789"));
  EXPECT_EQ(wire[9], 0x26);
  EXPECT_EQ(wire[10], 0x39);
  EXPECT_EQ(wire[11], 0xF4);
  EXPECT_EQ(wire[12], 0xCB);
}

TEST(ChunkFramerTest, AppendToKeepsExistingBytes) {
  std::vector<uint8_t> out = bytes("hdr");
  ChunkFramer::frame(0, bytes("abc")).appendTo(out);
  ASSERT_EQ(out.size(), 3u + 3u + CHECKSUM_SIZE);
  EXPECT_EQ(out[0], 'h');
  EXPECT_EQ(out[3], 'a');
}

TEST(ChunkFramerTest, VerifyDetectsChanges) {
  Chunk chunk = ChunkFramer::frame(0, bytes("payload"));
  EXPECT_TRUE(ChunkFramer::verify(chunk));

  chunk.payload[2] ^= 0x01;
  EXPECT_FALSE(ChunkFramer::verify(chunk));

  chunk.payload[2] ^= 0x01;
  chunk.checksum ^= 0x80000000u;
  EXPECT_FALSE(ChunkFramer::verify(chunk));
}
