#include "chunk_range.hh"

#include <gtest/gtest.h>

#include <limits>

using namespace chunkspan;

namespace {

void test_initial(uint64_t total_bytes, uint32_t chunk_size, OffsetRange want) {
  SCOPED_TRACE(fmt::format("{} bytes, chunk {}", total_bytes, chunk_size));
  ASSERT_EQ(initial_restriction(total_bytes, chunk_size), want);
}

}  // namespace

TEST(initial_restriction, reserves_one_slot_past_full_chunks) {
  test_initial(10, 4, {1, 4});
  test_initial(3, 4, {1, 2});
  test_initial(4, 4, {1, 3});
  test_initial(8, 4, {1, 4});
  test_initial(1, 1, {1, 3});
}

TEST(initial_restriction, empty_file) {
  test_initial(0, 4, {1, 2});
  test_initial(0, 1, {1, 2});
}

TEST(initial_restriction, large_file) {
  constexpr uint64_t total = 5ULL << 32;
  test_initial(total, 1U << 20, {1, 2 + (total >> 20)});
  test_initial(total, std::numeric_limits<uint32_t>::max(), {1, 7});
}

TEST(initial_restriction, matches_formula) {
  for (uint64_t total = 0; total < 64; total++) {
    for (uint32_t chunk = 1; chunk < 10; chunk++) {
      auto r = initial_restriction(total, chunk);
      ASSERT_EQ(r.from_, 1);
      ASSERT_EQ(r.to_, 2 + total / chunk) << total << " " << chunk;
    }
  }
}

TEST(chunk_byte_offset, one_based) {
  EXPECT_EQ(chunk_byte_offset(1, 4), 0);
  EXPECT_EQ(chunk_byte_offset(2, 4), 4);
  EXPECT_EQ(chunk_byte_offset(3, 4), 8);
  EXPECT_EQ(chunk_byte_offset(3, std::numeric_limits<uint32_t>::max()),
            2ULL * std::numeric_limits<uint32_t>::max());
}

namespace {

void test_contiguous(OffsetRange range, const std::vector<OffsetRange> &pieces) {
  if (range.empty()) {
    ASSERT_TRUE(pieces.empty());
    return;
  }
  ASSERT_FALSE(pieces.empty());
  ASSERT_EQ(pieces.front().from_, range.from_);
  ASSERT_EQ(pieces.back().to_, range.to_);
  for (size_t i = 0; i < pieces.size(); i++) {
    ASSERT_FALSE(pieces[i].empty());
    if (i > 0) {
      ASSERT_EQ(pieces[i - 1].to_, pieces[i].from_);
    }
  }
}

}  // namespace

TEST(split_into_unit_restrictions, one_piece_per_index) {
  OffsetRange range{3, 7};
  auto pieces = split_into_unit_restrictions(range);
  ASSERT_EQ(pieces.size(), 4);
  for (size_t i = 0; i < pieces.size(); i++) {
    EXPECT_EQ(pieces[i], (OffsetRange{3 + i, 4 + i}));
  }
  test_contiguous(range, pieces);
}

TEST(split_into_unit_restrictions, empty_range) {
  EXPECT_TRUE(split_into_unit_restrictions({5, 5}).empty());
}

TEST(split_into_unit_restrictions, reconstructs_input) {
  for (uint64_t from = 1; from < 8; from++) {
    for (uint64_t to = from; to < 20; to++) {
      SCOPED_TRACE(fmt::format("[{}, {})", from, to));
      OffsetRange range{from, to};
      auto pieces = split_into_unit_restrictions(range);
      ASSERT_EQ(pieces.size(), to - from);
      test_contiguous(range, pieces);
    }
  }
}

TEST(offset_range_split, fixed_size_pieces) {
  auto pieces = OffsetRange{1, 11}.split(3, 1);
  std::vector<OffsetRange> want{{1, 4}, {4, 7}, {7, 10}, {10, 11}};
  EXPECT_EQ(pieces, want);
}

TEST(offset_range_split, short_tail_is_merged) {
  {
    SCOPED_TRACE("tail below min_per_split");
    auto pieces = OffsetRange{1, 11}.split(3, 2);
    std::vector<OffsetRange> want{{1, 4}, {4, 7}, {7, 11}};
    EXPECT_EQ(pieces, want);
  }
  {
    SCOPED_TRACE("tail below a quarter of desired");
    auto pieces = OffsetRange{1, 90}.split(40, 1);
    std::vector<OffsetRange> want{{1, 41}, {41, 90}};
    EXPECT_EQ(pieces, want);
  }
}

TEST(offset_range_split, larger_than_range) {
  auto pieces = OffsetRange{2, 5}.split(100, 1);
  ASSERT_EQ(pieces.size(), 1);
  EXPECT_EQ(pieces[0], (OffsetRange{2, 5}));
}

TEST(offset_range_split, reconstructs_input) {
  for (uint64_t desired = 1; desired < 12; desired++) {
    for (uint64_t min = 0; min < 4; min++) {
      for (uint64_t to = 1; to < 40; to++) {
        SCOPED_TRACE(fmt::format("[1, {}) by {} min {}", to, desired, min));
        OffsetRange range{1, to};
        test_contiguous(range, range.split(desired, min));
      }
    }
  }
}

TEST(offset_range, format) {
  EXPECT_EQ(fmt::format("{}", OffsetRange{1, 4}), "[1, 4)");
}
