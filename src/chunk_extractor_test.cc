#include "chunk_extractor.hh"
#include "memory_file.hh"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace chunkspan;

class ChunkExtractorTest : public ::testing::Test {
protected:
  Result<ChunkRecord> extract(MemoryFile &file, ChunkIndex index) {
    auto reader = file.open_seekable();
    EXPECT_TRUE(reader);
    return extractor_.extract(file.id(), index, *reader.value());
  }

  static constexpr uint32_t chunk_size = 4;
  ChunkExtractor extractor_{chunk_size};
};

TEST_F(ChunkExtractorTest, full_and_partial_chunks) {
  MemoryFile file("ten.bin", "0123456789");

  auto c1 = extract(file, 1);
  ASSERT_TRUE(c1);
  EXPECT_EQ(c1.value().file_id, "ten.bin");
  EXPECT_EQ(c1.value().index, 1);
  EXPECT_EQ(c1.value().data, "0123");

  auto c2 = extract(file, 2);
  ASSERT_TRUE(c2);
  EXPECT_EQ(c2.value().data, "4567");

  auto c3 = extract(file, 3);
  ASSERT_TRUE(c3);
  EXPECT_EQ(c3.value().data, "89");
}

TEST_F(ChunkExtractorTest, chunk_past_end_is_empty) {
  MemoryFile file("eight.bin", "01234567");
  auto c3 = extract(file, 3);
  ASSERT_TRUE(c3);
  EXPECT_TRUE(c3.value().data.empty());
  EXPECT_EQ(c3.value().index, 3);
}

TEST_F(ChunkExtractorTest, short_reads_fill_the_chunk) {
  MemoryFile file("slow.bin", make_pattern(10), FaultPlan{.max_read = 3});
  auto c1 = extract(file, 1);
  ASSERT_TRUE(c1);
  EXPECT_EQ(c1.value().data, "0123");
  auto c3 = extract(file, 3);
  ASSERT_TRUE(c3);
  EXPECT_EQ(c3.value().data, "89");
}

TEST_F(ChunkExtractorTest, same_index_same_bytes) {
  MemoryFile file("again.bin", make_pattern(20));
  auto first = extract(file, 4);
  auto second = extract(file, 4);
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(first.value(), second.value());
  EXPECT_EQ(first.value().data, make_pattern(20).substr(12, 4));
}

TEST_F(ChunkExtractorTest, seek_failure_names_file_and_offset) {
  MemoryFile file("bad_seek.bin", make_pattern(10),
                  FaultPlan{.fail_seek_at = 4});
  EXPECT_TRUE(extract(file, 1));

  auto res = extract(file, 2);
  ASSERT_FALSE(res);
  EXPECT_TRUE(res.error() == ChunkErrc::seek_failed);
  auto message = fmt::format("{}", res.error());
  EXPECT_NE(message.find("bad_seek.bin"), std::string::npos) << message;
  EXPECT_NE(message.find("offset=4"), std::string::npos) << message;
}

TEST_F(ChunkExtractorTest, read_failure) {
  MemoryFile file("bad_read.bin", make_pattern(10),
                  FaultPlan{.fail_read_at = 8});
  EXPECT_TRUE(extract(file, 2));

  auto res = extract(file, 3);
  ASSERT_FALSE(res);
  EXPECT_TRUE(res.error() == ChunkErrc::read_failed);
  auto message = fmt::format("{}", res.error());
  EXPECT_NE(message.find("bad_read.bin"), std::string::npos) << message;
}

TEST_F(ChunkExtractorTest, index_zero_is_rejected) {
  MemoryFile file("zero.bin", make_pattern(10));
  auto res = extract(file, 0);
  ASSERT_FALSE(res);
  EXPECT_TRUE(res.error() == ChunkErrc::invalid_argument);
}

TEST(chunk_extractor, zero_chunk_size) {
  EXPECT_THROW(ChunkExtractor(0), std::invalid_argument);
}
