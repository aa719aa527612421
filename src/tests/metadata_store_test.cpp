#include <gtest/gtest.h>
#include "metadata/metadata_store.hpp"
#include "core/errors.hpp"
#include "test_utils.hpp"

using namespace chunkvault;

class MetadataStoreTest : public ::testing::Test {
protected:
  metadata::MemoryMetadataStore store;

  void SetUp() override {
    init_logging(boost::log::trivial::fatal);
  }

  std::string add_chunked(const std::string& name, int64_t total, int64_t chunk_size) {
    core::LogicalFile file;
    file.name = name;
    file.total_size = total;
    file.chunk_size = chunk_size;
    file.chunked = true;
    return store.create_logical_file(file);
  }
};

TEST_F(MetadataStoreTest, CreatedFileIsFoundById) {
  std::string id = add_chunked("archive.tar", 300, 100);

  auto file = store.find_file(id);
  ASSERT_TRUE(file.has_value());
  EXPECT_EQ(file->id, id);
  EXPECT_EQ(file->name, "archive.tar");
  EXPECT_EQ(file->total_size, 300);
  EXPECT_TRUE(file->chunked);
  EXPECT_FALSE(file->deleted);

  EXPECT_FALSE(store.find_file("missing").has_value());
}

TEST_F(MetadataStoreTest, IdsAreUnique) {
  std::string first = add_chunked("a", 10, 5);
  std::string second = add_chunked("a", 10, 5);
  EXPECT_NE(first, second);
  EXPECT_EQ(store.list_files().size(), 2u);
}

TEST_F(MetadataStoreTest, ChunksAreListedInIndexOrder) {
  std::string id = add_chunked("archive.tar", 300, 100);
  auto chunks = make_chunks(300, 100);

  // Recorded out of order
  store.create_chunk(id, chunks[2]);
  store.create_chunk(id, chunks[0]);
  store.create_chunk(id, chunks[1]);

  auto listed = store.list_chunks(id);
  ASSERT_EQ(listed.size(), 3u);
  for (size_t i = 0; i < listed.size(); ++i) {
    EXPECT_EQ(listed[i].index, static_cast<int>(i));
    EXPECT_EQ(listed[i].remote_ref, chunks[i].remote_ref);
  }
}

TEST_F(MetadataStoreTest, DuplicateChunkIndexIsRejected) {
  std::string id = add_chunked("archive.tar", 200, 100);
  auto chunks = make_chunks(200, 100);
  store.create_chunk(id, chunks[0]);

  EXPECT_THROW(store.create_chunk(id, chunks[0]), core::MetadataError);
  EXPECT_EQ(store.list_chunks(id).size(), 1u);
}

TEST_F(MetadataStoreTest, SingleObjectFileTakesNoChunks) {
  core::LogicalFile file;
  file.name = "small.txt";
  file.total_size = 10;
  file.remote_ref = "obj";
  std::string id = store.create_logical_file(file);

  EXPECT_THROW(store.create_chunk(id, make_chunks(10, 10)[0]), core::MetadataError);
}

TEST_F(MetadataStoreTest, UnknownFileIsAnError) {
  EXPECT_THROW(store.create_chunk("nope", make_chunks(10, 10)[0]), core::MetadataError);
  EXPECT_THROW(store.list_chunks("nope"), core::MetadataError);
  EXPECT_THROW(store.mark_deleted("nope"), core::MetadataError);
  EXPECT_THROW(store.erase("nope"), core::MetadataError);
}

TEST_F(MetadataStoreTest, SoftDeleteHidesFileAndChunks) {
  std::string kept = add_chunked("kept", 100, 100);
  std::string gone = add_chunked("gone", 200, 100);
  for (const auto& chunk : make_chunks(200, 100)) {
    store.create_chunk(gone, chunk);
  }

  store.mark_deleted(gone);

  auto visible = store.list_files();
  ASSERT_EQ(visible.size(), 1u);
  EXPECT_EQ(visible[0].id, kept);
  EXPECT_EQ(store.list_files(true).size(), 2u);

  EXPECT_TRUE(store.list_chunks(gone).empty());
  auto all = store.list_chunks(gone, true);
  ASSERT_EQ(all.size(), 2u);
  EXPECT_TRUE(all[0].deleted);
  EXPECT_TRUE(all[1].deleted);

  // Still reachable by id so it can be purged
  auto file = store.find_file(gone);
  ASSERT_TRUE(file.has_value());
  EXPECT_TRUE(file->deleted);
}

TEST_F(MetadataStoreTest, EraseDropsEveryRecord) {
  std::string id = add_chunked("archive", 100, 100);
  store.create_chunk(id, make_chunks(100, 100)[0]);

  store.erase(id);

  EXPECT_FALSE(store.find_file(id).has_value());
  EXPECT_TRUE(store.list_files(true).empty());
  EXPECT_THROW(store.list_chunks(id, true), core::MetadataError);
}
