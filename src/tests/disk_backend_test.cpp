#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>
#include "grid/grid_file.hpp"
#include "store/checksum.hpp"
#include "store/disk_backend.hpp"
#include "test_utils.hpp"

using namespace gridstore::store;
using gridstore::test::make_temp_dir;
using gridstore::test::random_data;
using gridstore::test::read_file;
using gridstore::test::write_file;

class DiskBackendTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<DiskBackend> backend;

  void SetUp() override {
    test_dir = make_temp_dir("disk_backend_test");
    ASSERT_TRUE(std::filesystem::exists(test_dir));
    backend = std::make_unique<DiskBackend>(test_dir.string());
    ASSERT_NE(backend, nullptr);
  }

  void TearDown() override {
    if (backend) {
      backend->clear();
      backend.reset();
    }
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  static FileRecord make_record(const std::string& id, const std::string& filename, int64_t uploaded_ms) {
    FileRecord record;
    record.id = id;
    record.filename = filename;
    record.content_type = "text/plain";
    record.length = 3;
    record.chunk_size = 4;
    record.upload_date = Timestamp(std::chrono::milliseconds(uploaded_ms));
    record.aliases = {"alias"};
    record.metadata = {{"k", "v"}};
    record.md5 = "900150983cd24fb0d6963f7d28e17f72";
    return record;
  }

  static ChunkRecord make_chunk(const std::string& id, uint32_t n, const std::string& data) {
    return ChunkRecord{id, n, Bytes(data.begin(), data.end())};
  }

  std::size_t count_regular_files() const {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir)) {
      if (entry.is_regular_file()) {
        ++count;
      }
    }
    return count;
  }
};

TEST_F(DiskBackendTest, FileRecordsPersist) {
  backend->insert_file("fs", make_record("id1", "abc.txt", 1000));

  DiskBackend reopened(test_dir.string());
  auto found = reopened.find_file("fs", "abc.txt");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->id, "id1");
  EXPECT_EQ(found->length, 3u);
  EXPECT_EQ(found->upload_date, Timestamp(std::chrono::milliseconds(1000)));
  EXPECT_EQ(found->aliases, std::vector<std::string>{"alias"});
  EXPECT_EQ(found->metadata.at("k"), "v");
  EXPECT_EQ(found->md5, "900150983cd24fb0d6963f7d28e17f72");
}

TEST_F(DiskBackendTest, FindFilesInUploadOrder) {
  backend->insert_file("fs", make_record("zz", "late.txt", 3000));
  backend->insert_file("fs", make_record("aa", "early.txt", 1000));
  backend->insert_file("fs", make_record("mm", "middle.txt", 2000));

  auto records = backend->find_files("fs");
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0].filename, "early.txt");
  EXPECT_EQ(records[1].filename, "middle.txt");
  EXPECT_EQ(records[2].filename, "late.txt");
  EXPECT_TRUE(backend->find_files("other").empty());
}

TEST_F(DiskBackendTest, DuplicateIdIsRejected) {
  backend->insert_file("fs", make_record("id1", "a.txt", 1000));
  EXPECT_THROW(backend->insert_file("fs", make_record("id1", "b.txt", 2000)), StoreError);
}

TEST_F(DiskBackendTest, RemoveFileCleansDirectories) {
  backend->insert_file("fs", make_record("id1", "a.txt", 1000));
  backend->remove_file("fs", "id1");
  EXPECT_FALSE(backend->find_file("fs", "a.txt").has_value());
  EXPECT_TRUE(std::filesystem::is_empty(test_dir / "fs.files"));

  EXPECT_NO_THROW(backend->remove_file("fs", "never_stored"));
}

TEST_F(DiskBackendTest, RenameRewritesRecords) {
  backend->insert_file("fs", make_record("id1", "a.txt", 1000));
  EXPECT_EQ(backend->rename_file("fs", "a.txt", "b.txt"), 1u);
  EXPECT_FALSE(backend->find_file("fs", "a.txt").has_value());
  EXPECT_EQ(backend->find_file("fs", "b.txt")->id, "id1");
}

TEST_F(DiskBackendTest, ChunkOperations) {
  backend->create_chunk_index("fs");
  EXPECT_TRUE(std::filesystem::exists(test_dir / "fs.chunks"));

  backend->save_chunk("fs", make_chunk("id1", 0, "Hell"));
  backend->save_chunk("fs", make_chunk("id1", 1, "o, w"));
  backend->save_chunk("fs", make_chunk("id1", 2, "orld"));
  backend->save_chunk("fs", make_chunk("id1", 3, "!"));
  backend->save_chunk("fs", make_chunk("id1", 10, "xx"));
  backend->save_chunk("fs", make_chunk("id1", 10, "y"));

  auto chunk = backend->find_chunk("fs", "id1", 10);
  ASSERT_TRUE(chunk.has_value());
  EXPECT_EQ(std::string(chunk->data.begin(), chunk->data.end()), "y");
  EXPECT_FALSE(backend->find_chunk("fs", "id1", 4).has_value());
  EXPECT_FALSE(backend->find_chunk("fs", "id2", 0).has_value());

  // Numeric, not lexical, chunk order
  backend->remove_chunks("fs", "id1", 4);
  EXPECT_EQ(backend->file_md5("fs", "id1"), "6cd3556deb0da54bca060b4c39479839");

  backend->remove_chunks("fs", "id1");
  EXPECT_FALSE(backend->find_chunk("fs", "id1", 0).has_value());
  EXPECT_EQ(count_regular_files(), 0u);
}

TEST_F(DiskBackendTest, CorruptRecordIsStoreError) {
  backend->save_chunk("fs", make_chunk("id1", 0, "data"));

  for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir)) {
    if (entry.is_regular_file()) {
      std::ofstream(entry.path(), std::ios::binary | std::ios::trunc) << "garbage";
    }
  }
  EXPECT_THROW(backend->find_chunk("fs", "id1", 0), StoreError);
}

TEST_F(DiskBackendTest, FailedWriteIsStoreError) {
  if (!std::filesystem::exists("/dev/full")) {
    GTEST_SKIP() << "/dev/full not available";
  }
  backend->save_chunk("fs", make_chunk("id1", 0, "data"));

  // Redirect the stored chunk to a device that rejects every write
  std::filesystem::path chunk_path;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir)) {
    if (entry.is_regular_file()) {
      chunk_path = entry.path();
    }
  }
  ASSERT_FALSE(chunk_path.empty());
  std::filesystem::remove(chunk_path);
  std::filesystem::create_symlink("/dev/full", chunk_path);

  EXPECT_THROW(backend->save_chunk("fs", make_chunk("id1", 0, "more data")), StoreError);
  std::filesystem::remove(chunk_path);
}

TEST_F(DiskBackendTest, GridFileOverDisk) {
  const std::string data = random_data(5000, 21);
  write_file(*backend, "big.bin", data, 1024);

  DiskBackend reopened(test_dir.string());
  EXPECT_EQ(read_file(reopened, "big.bin"), data);

  gridstore::grid::GridFile file(reopened, "big.bin", gridstore::grid::Mode::Read);
  EXPECT_EQ(file.length(), data.size());
  EXPECT_EQ(file.md5(), Digest::md5_hex(data));
}
