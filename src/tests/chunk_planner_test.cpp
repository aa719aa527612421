#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sstream>
#include "planner/chunk_planner.hpp"
#include "io/section_reader.hpp"
#include "test_utils.hpp"

using namespace chunkvault;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

class MockChunkStore : public planner::ChunkStore {
public:
  MOCK_METHOD(planner::StoredObject, store_chunk,
              (const std::string& name, io::ByteSource& source, int64_t size,
               const planner::ProgressFn& progress),
              (override));
  MOCK_METHOD(bool, remove, (const std::string& remote_ref), (override));
};

// Keeps every stored object in memory
class RecordingChunkStore : public planner::ChunkStore {
public:
  planner::StoredObject store_chunk(const std::string& name, io::ByteSource& source,
                                    int64_t size, const planner::ProgressFn& progress) override {
    std::string data;
    std::vector<char> buffer(50);
    while (static_cast<int64_t>(data.size()) < size) {
      std::size_t count = source.read(buffer.data(), buffer.size());
      if (count == 0) {
        break;
      }
      data.append(buffer.data(), count);
      if (progress) {
        progress(static_cast<double>(data.size()) / static_cast<double>(size));
      }
    }
    if (fail_at_name == name) {
      throw std::runtime_error("backend rejected upload");
    }

    names.push_back(name);
    objects.push_back(data);
    return {"obj-" + std::to_string(names.size()), "sum-" + std::to_string(names.size())};
  }

  bool remove(const std::string&) override { return true; }

  std::vector<std::string> names;
  std::vector<std::string> objects;
  std::string fail_at_name;
};

class ChunkPlannerTest : public ::testing::Test {
protected:
  std::filesystem::path staging_dir;
  planner::PlannerConfig config;
  RecordingChunkStore store;

  void SetUp() override {
    init_logging(boost::log::trivial::fatal);
    staging_dir = make_test_dir("planner_test");
    config.max_chunk_size = 100;
    config.chunk_threshold = 250;
    config.staging_dir = staging_dir;
  }

  void TearDown() override {
    std::filesystem::remove_all(staging_dir);
  }

  bool staging_is_empty() const {
    return std::filesystem::is_empty(staging_dir);
  }
};

TEST_F(ChunkPlannerTest, UploadsChunksInIndexOrder) {
  const std::string data = make_payload(350);
  planner::ChunkPlanner chunk_planner(store, config);

  auto result = chunk_planner.upload_chunked("video.mkv", io::MemoryBuffer(data));

  ASSERT_EQ(result.chunks.size(), 4u);
  EXPECT_EQ(store.names, (std::vector<std::string>{
    "video.mkv.chunk0", "video.mkv.chunk1", "video.mkv.chunk2", "video.mkv.chunk3"}));

  std::string joined;
  for (size_t i = 0; i < result.chunks.size(); ++i) {
    const auto& chunk = result.chunks[i];
    EXPECT_EQ(chunk.index, static_cast<int>(i));
    EXPECT_EQ(chunk.start_offset, static_cast<int64_t>(i) * 100);
    EXPECT_EQ(chunk.remote_ref, "obj-" + std::to_string(i + 1));
    EXPECT_EQ(chunk.checksum, "sum-" + std::to_string(i + 1));
    joined += store.objects[i];
  }
  EXPECT_EQ(result.chunks.back().end_offset, 350);
  EXPECT_EQ(joined, data);

  EXPECT_TRUE(result.file.chunked);
  EXPECT_EQ(result.file.total_size, 350);
  EXPECT_EQ(result.file.chunk_size, 100);
  EXPECT_EQ(result.file.name, "video.mkv");
}

TEST_F(ChunkPlannerTest, ReportsOverallProgress) {
  planner::ChunkPlanner chunk_planner(store, config);
  std::vector<double> reports;

  chunk_planner.upload_chunked("file", io::MemoryBuffer(make_payload(400)),
                               [&reports](double percent) { reports.push_back(percent); });

  ASSERT_FALSE(reports.empty());
  EXPECT_DOUBLE_EQ(reports.back(), 100.0);
  for (size_t i = 1; i < reports.size(); ++i) {
    EXPECT_GE(reports[i], reports[i - 1]);
  }
  // Chunk 1 half done is 37.5% of four chunks
  EXPECT_NE(std::find(reports.begin(), reports.end(), 37.5), reports.end());
}

TEST_F(ChunkPlannerTest, StoreFailureAbortsWithChunkIndex) {
  store.fail_at_name = "file.chunk2";
  planner::ChunkPlanner chunk_planner(store, config);

  try {
    chunk_planner.upload_chunked("file", io::MemoryBuffer(make_payload(500)));
    FAIL() << "Expected StorageError";
  } catch (const core::StorageError& e) {
    EXPECT_EQ(e.chunk_index(), 2);
    EXPECT_NE(std::string(e.what()).find("backend rejected upload"), std::string::npos);
  }
  // Earlier chunks stay, nothing after the failure is attempted
  EXPECT_EQ(store.names.size(), 2u);
}

TEST_F(ChunkPlannerTest, CancellationIsCheckedBetweenChunks) {
  MockChunkStore mock;
  planner::CancellationToken cancel;
  planner::ChunkPlanner chunk_planner(mock, config);

  EXPECT_CALL(mock, store_chunk("file.chunk0", _, 100, _))
    .WillOnce(Invoke([&cancel](const std::string&, io::ByteSource&, int64_t,
                               const planner::ProgressFn&) {
      cancel.cancel();
      return planner::StoredObject{"ref0", "sum0"};
    }));
  EXPECT_CALL(mock, store_chunk("file.chunk1", _, _, _)).Times(0);

  EXPECT_THROW(chunk_planner.upload_chunked("file", io::MemoryBuffer(make_payload(300)), {}, &cancel),
               core::CancelledError);
}

TEST_F(ChunkPlannerTest, EmptyInputCannotBeChunked) {
  planner::ChunkPlanner chunk_planner(store, config);
  EXPECT_THROW(chunk_planner.upload_chunked("empty", io::MemoryBuffer("")), core::ConfigurationError);
}

TEST_F(ChunkPlannerTest, SmallInputIsStoredAsOneObject) {
  MockChunkStore mock;
  planner::ChunkPlanner chunk_planner(mock, config);
  EXPECT_CALL(mock, store_chunk("notes.txt", _, 249, _))
    .WillOnce(Return(planner::StoredObject{"single", "abc"}));

  std::istringstream input(make_payload(249));
  auto result = chunk_planner.plan_and_upload("notes.txt", input, 249);

  EXPECT_FALSE(result.file.chunked);
  EXPECT_TRUE(result.chunks.empty());
  EXPECT_EQ(result.file.remote_ref, "single");
  EXPECT_EQ(result.file.checksum, "abc");
  EXPECT_EQ(result.file.total_size, 249);
  EXPECT_TRUE(staging_is_empty());
}

TEST_F(ChunkPlannerTest, InputAtThresholdIsChunked) {
  planner::ChunkPlanner chunk_planner(store, config);
  const std::string data = make_payload(250);
  std::istringstream input(data);

  auto result = chunk_planner.plan_and_upload("big.bin", input, 250);

  EXPECT_TRUE(result.file.chunked);
  EXPECT_EQ(result.chunks.size(), 3u);
  EXPECT_EQ(store.objects[0] + store.objects[1] + store.objects[2], data);
  EXPECT_TRUE(staging_is_empty());
}

TEST_F(ChunkPlannerTest, DeclaredSizeMustMatchStream) {
  planner::ChunkPlanner chunk_planner(store, config);
  std::istringstream input(make_payload(120));

  EXPECT_THROW(chunk_planner.plan_and_upload("file", input, 300), core::ConfigurationError);
  EXPECT_TRUE(store.names.empty());
  EXPECT_TRUE(staging_is_empty());
}

TEST_F(ChunkPlannerTest, StagingFileIsRemovedAfterFailure) {
  store.fail_at_name = "file.chunk1";
  planner::ChunkPlanner chunk_planner(store, config);
  std::istringstream input(make_payload(300));

  EXPECT_THROW(chunk_planner.plan_and_upload("file", input, 300), core::StorageError);
  EXPECT_TRUE(staging_is_empty());
}

TEST_F(ChunkPlannerTest, ChunkNamesFollowConvention) {
  EXPECT_EQ(planner::chunk_object_name("movie.mp4", 0), "movie.mp4.chunk0");
  EXPECT_EQ(planner::chunk_object_name("movie.mp4", 12), "movie.mp4.chunk12");
}

TEST_F(ChunkPlannerTest, RejectsInvalidChunkSize) {
  config.max_chunk_size = 0;
  EXPECT_THROW(planner::ChunkPlanner(store, config), core::ConfigurationError);
}
