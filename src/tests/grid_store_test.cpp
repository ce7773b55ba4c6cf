#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include "grid/grid_store.hpp"
#include "store/memory_backend.hpp"
#include "test_utils.hpp"

using namespace gridstore::grid;
using gridstore::store::MemoryBackend;
using gridstore::test::random_data;
using gridstore::test::read_file;
using gridstore::test::write_file;

class GridStoreTest : public ::testing::Test {
protected:
  MemoryBackend backend;

  void SetUp() override {
    write_file(backend, "alpha.txt", "first\nsecond\nthird", 4);
    write_file(backend, "beta.bin", random_data(100, 9), 16);
  }
};

TEST_F(GridStoreTest, Exists) {
  EXPECT_TRUE(GridStore::exists(backend, "alpha.txt"));
  EXPECT_FALSE(GridStore::exists(backend, "gamma.txt"));
  EXPECT_FALSE(GridStore::exists(backend, "alpha.txt", "other"));
}

TEST_F(GridStoreTest, ListReturnsStoredNames) {
  EXPECT_EQ(GridStore::list(backend), (std::vector<std::string>{"alpha.txt", "beta.bin"}));
  EXPECT_TRUE(GridStore::list(backend, "other").empty());
}

TEST_F(GridStoreTest, ReadWholeFile) {
  EXPECT_EQ(GridStore::read(backend, "alpha.txt"), "first\nsecond\nthird");
  EXPECT_EQ(GridStore::read(backend, "beta.bin"), random_data(100, 9));
}

TEST_F(GridStoreTest, ReadWithLengthAndOffset) {
  EXPECT_EQ(GridStore::read(backend, "alpha.txt", 5), "first");
  EXPECT_EQ(GridStore::read(backend, "alpha.txt", 6, 6), "second");
  EXPECT_EQ(GridStore::read(backend, "alpha.txt", std::nullopt, 13), "third");
  EXPECT_EQ(GridStore::read(backend, "alpha.txt", 100, 13), "third");
}

TEST_F(GridStoreTest, ReadMissingFileIsEmpty) {
  EXPECT_EQ(GridStore::read(backend, "missing.txt"), "");
  EXPECT_FALSE(GridStore::exists(backend, "missing.txt"));
}

TEST_F(GridStoreTest, ReadLines) {
  EXPECT_EQ(GridStore::read_lines(backend, "alpha.txt"),
            (std::vector<std::string>{"first\n", "second\n", "third"}));
  EXPECT_EQ(GridStore::read_lines(backend, "alpha.txt", "ir"),
            (std::vector<std::string>{"fir", "st\nsecond\nthir", "d"}));
}

TEST_F(GridStoreTest, RemoveDeletesRecordAndChunks) {
  auto record = backend.find_file(DEFAULT_ROOT_COLLECTION, "beta.bin");
  ASSERT_TRUE(record.has_value());

  GridStore::remove(backend, {"beta.bin", "unknown.txt"});

  EXPECT_FALSE(GridStore::exists(backend, "beta.bin"));
  EXPECT_TRUE(backend.chunks_of(DEFAULT_ROOT_COLLECTION, record->id).empty());
  EXPECT_TRUE(GridStore::exists(backend, "alpha.txt"));
  EXPECT_EQ(read_file(backend, "alpha.txt"), "first\nsecond\nthird");
}

TEST_F(GridStoreTest, RenameKeepsContent) {
  EXPECT_EQ(GridStore::rename(backend, "alpha.txt", "renamed.txt"), 1u);

  EXPECT_FALSE(GridStore::exists(backend, "alpha.txt"));
  EXPECT_TRUE(GridStore::exists(backend, "renamed.txt"));
  EXPECT_EQ(GridStore::read(backend, "renamed.txt"), "first\nsecond\nthird");

  EXPECT_EQ(GridStore::rename(backend, "alpha.txt", "again.txt"), 0u);
}

TEST_F(GridStoreTest, ScopedOpenReturnsResultAndCloses) {
  uint64_t written = GridStore::open(backend, "scoped.txt", Mode::Write, [](GridFile& file) {
    file.write("scoped content");
    return file.tell();
  });
  EXPECT_EQ(written, 14u);
  EXPECT_EQ(read_file(backend, "scoped.txt"), "scoped content");

  OpenOptions options;
  options.chunk_size = 3;
  GridStore::open(backend, "scoped.txt", Mode::Append, OpenOptions(), [](GridFile& file) {
    file.write("!");
  });
  EXPECT_EQ(read_file(backend, "scoped.txt"), "scoped content!");
  EXPECT_THROW(GridStore::open(backend, "scoped.txt", Mode::Append, options, [](GridFile&) {}), ConfigError);
}

TEST_F(GridStoreTest, ScopedOpenClosesOnException) {
  EXPECT_THROW(GridStore::open(backend, "partial.txt", Mode::Write, [](GridFile& file) {
    file.write("written before failure");
    throw std::runtime_error("processing failed");
  }), std::runtime_error);

  // The cursor was still closed, so the written bytes were committed
  EXPECT_EQ(read_file(backend, "partial.txt"), "written before failure");
}

TEST_F(GridStoreTest, OperationsHonorRoot) {
  write_file(backend, "alpha.txt", "in archive", 4, "archive");

  EXPECT_EQ(GridStore::list(backend, "archive"), (std::vector<std::string>{"alpha.txt"}));
  EXPECT_EQ(GridStore::read(backend, "alpha.txt", std::nullopt, std::nullopt, "archive"), "in archive");

  GridStore::remove(backend, {"alpha.txt"}, "archive");
  EXPECT_FALSE(GridStore::exists(backend, "alpha.txt", "archive"));
  EXPECT_TRUE(GridStore::exists(backend, "alpha.txt"));
}
