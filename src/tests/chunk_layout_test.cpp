#include <gtest/gtest.h>
#include "core/chunk_layout.hpp"
#include "test_utils.hpp"

using namespace chunkvault::core;

class ChunkLayoutTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
  }

  static std::vector<Chunk> to_chunks(const std::vector<ChunkBounds>& bounds) {
    std::vector<Chunk> chunks;
    for (const auto& b : bounds) {
      Chunk chunk;
      chunk.index = b.index;
      chunk.start_offset = b.start;
      chunk.end_offset = b.end;
      chunks.push_back(chunk);
    }
    return chunks;
  }
};

TEST_F(ChunkLayoutTest, TenGigabytesAtDefaultChunkSize) {
  const int64_t total = 10LL * 1000 * 1000 * 1000;
  auto bounds = plan(total, MAX_CHUNK_SIZE);

  ASSERT_EQ(bounds.size(), 3u);
  EXPECT_EQ(bounds[0].start, 0);
  EXPECT_EQ(bounds[0].end, MAX_CHUNK_SIZE);
  EXPECT_EQ(bounds[1].start, MAX_CHUNK_SIZE);
  EXPECT_EQ(bounds[1].end, 2 * MAX_CHUNK_SIZE);
  EXPECT_EQ(bounds[2].start, 2 * MAX_CHUNK_SIZE);
  EXPECT_EQ(bounds[2].end, total);
  EXPECT_EQ(bounds[2].size(), total - 2 * MAX_CHUNK_SIZE);
}

TEST_F(ChunkLayoutTest, DecimalSizesFromDocumentation) {
  // 10 GB in 4.5 GB chunks
  const int64_t chunk = 4500LL * 1000 * 1000;
  auto bounds = plan(10LL * 1000 * 1000 * 1000, chunk);

  ASSERT_EQ(bounds.size(), 3u);
  EXPECT_EQ(bounds[0].end, 4500000000LL);
  EXPECT_EQ(bounds[1].start, 4500000000LL);
  EXPECT_EQ(bounds[1].end, 9000000000LL);
  EXPECT_EQ(bounds[2].start, 9000000000LL);
  EXPECT_EQ(bounds[2].end, 10000000000LL);
}

TEST_F(ChunkLayoutTest, LayoutIsCompleteForManySizes) {
  const int64_t chunk_size = 1000;
  for (int64_t total : {1LL, 999LL, 1000LL, 1001LL, 2000LL, 12345LL}) {
    auto bounds = plan(total, chunk_size);

    EXPECT_EQ(static_cast<int64_t>(bounds.size()), chunk_count(total, chunk_size));
    EXPECT_EQ(bounds.front().start, 0);
    EXPECT_EQ(bounds.back().end, total);

    int64_t sum = 0;
    for (size_t i = 0; i < bounds.size(); ++i) {
      EXPECT_EQ(bounds[i].index, static_cast<int>(i));
      if (i > 0) {
        EXPECT_EQ(bounds[i].start, bounds[i - 1].end);
      }
      EXPECT_LE(bounds[i].size(), chunk_size);
      sum += bounds[i].size();
    }
    EXPECT_EQ(sum, total) << "total " << total;
    EXPECT_NO_THROW(validate_layout(to_chunks(bounds), total, chunk_size));
  }
}

TEST_F(ChunkLayoutTest, EmptyFileHasNoChunks) {
  EXPECT_EQ(chunk_count(0, MAX_CHUNK_SIZE), 0);
  EXPECT_TRUE(plan(0, MAX_CHUNK_SIZE).empty());
  EXPECT_NO_THROW(validate_layout({}, 0, MAX_CHUNK_SIZE));
}

TEST_F(ChunkLayoutTest, InvalidSizesAreRejected) {
  EXPECT_THROW(chunk_count(100, 0), ConfigurationError);
  EXPECT_THROW(chunk_count(100, -5), ConfigurationError);
  EXPECT_THROW(plan(-1, 100), ConfigurationError);
}

TEST_F(ChunkLayoutTest, ThresholdDecision) {
  EXPECT_FALSE(requires_chunking(CHUNK_THRESHOLD - 1));
  EXPECT_TRUE(requires_chunking(CHUNK_THRESHOLD));
  EXPECT_TRUE(requires_chunking(CHUNK_THRESHOLD + 1));
  EXPECT_FALSE(requires_chunking(0));
  EXPECT_TRUE(requires_chunking(10, 10));
  EXPECT_LT(MAX_CHUNK_SIZE, CHUNK_THRESHOLD);
}

TEST_F(ChunkLayoutTest, ValidationDetectsBrokenLayouts) {
  auto good = to_chunks(plan(2500, 1000));
  ASSERT_NO_THROW(validate_layout(good, 2500, 1000));

  auto gap = good;
  gap[1].start_offset = 1001;
  EXPECT_THROW(validate_layout(gap, 2500, 1000), LayoutError);

  auto missing_tail = good;
  missing_tail.pop_back();
  EXPECT_THROW(validate_layout(missing_tail, 2500, 1000), LayoutError);

  auto bad_index = good;
  bad_index[2].index = 5;
  EXPECT_THROW(validate_layout(bad_index, 2500, 1000), LayoutError);

  auto short_middle = to_chunks(plan(2500, 1000));
  short_middle[0].end_offset = 900;
  short_middle[1].start_offset = 900;
  EXPECT_THROW(validate_layout(short_middle, 2500, 1000), LayoutError);

  EXPECT_THROW(validate_layout({}, 10, 1000), LayoutError);
}
