#include <gtest/gtest.h>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>
#include "store/backend.hpp"
#include "store/record_codec.hpp"

using namespace gridstore::store;

namespace {
// Buffers writes but cannot hand them to the device, like a full disk
class UnflushableBuffer : public std::streambuf {
public:
  UnflushableBuffer() : storage_(4096) {
    setp(storage_.data(), storage_.data() + storage_.size());
  }

protected:
  int_type overflow(int_type) override { return traits_type::eof(); }
  int sync() override { return -1; }

private:
  std::vector<char> storage_;
};
}

class RecordCodecTest : public ::testing::Test {
protected:
  RecordCodec codec;

  std::string encode(const ChunkRecord& chunk) {
    std::stringstream ss;
    codec.serialize(chunk, ss);
    return ss.str();
  }
};

TEST_F(RecordCodecTest, ChunkLayoutIsBigEndian) {
  ChunkRecord chunk{"ab", 258, Bytes{'x', 'y'}};
  std::string encoded = encode(chunk);

  const std::string expected(
    "C\x01"
    "\x00\x00\x00\x02" "ab"
    "\x00\x00\x01\x02"
    "\x00\x00\x00\x02" "xy", 18);
  EXPECT_EQ(encoded, expected);
}

TEST_F(RecordCodecTest, SerializeReportsSize) {
  std::stringstream ss;
  EXPECT_EQ(codec.serialize(ChunkRecord{"id", 0, Bytes(100, 0x7f)}, ss), 2u + 4 + 2 + 4 + 4 + 100);
  EXPECT_EQ(ss.str().size(), 116u);
}

TEST_F(RecordCodecTest, FileRecordWithoutUploadDate) {
  FileRecord record;
  record.id = "id";
  record.filename = "name";
  record.chunk_size = 4;

  std::stringstream ss;
  codec.serialize(record, ss);
  FileRecord decoded = codec.deserialize_file(ss);
  EXPECT_FALSE(decoded.upload_date.has_value());
  EXPECT_EQ(decoded.filename, "name");
  EXPECT_TRUE(decoded.metadata.empty());
}

TEST_F(RecordCodecTest, UploadDateKeepsMilliseconds) {
  FileRecord record;
  record.id = "id";
  record.upload_date = Timestamp(std::chrono::milliseconds(1700000000123));

  std::stringstream ss;
  codec.serialize(record, ss);
  EXPECT_EQ(codec.deserialize_file(ss).upload_date, record.upload_date);
}

TEST_F(RecordCodecTest, TruncatedInputThrows) {
  std::string encoded = encode(ChunkRecord{"files", 1, Bytes{1, 2, 3, 4}});

  for (std::size_t cut : {std::size_t(0), std::size_t(1), std::size_t(5), encoded.size() - 1}) {
    std::stringstream ss(encoded.substr(0, cut));
    EXPECT_THROW(codec.deserialize_chunk(ss), StoreError) << "cut at " << cut;
  }
}

TEST_F(RecordCodecTest, WrongTagThrows) {
  std::stringstream ss(encode(ChunkRecord{"id", 0, Bytes{}}));
  EXPECT_THROW(codec.deserialize_file(ss), StoreError);
}

TEST_F(RecordCodecTest, UnknownVersionThrows) {
  std::string encoded = encode(ChunkRecord{"id", 0, Bytes{}});
  encoded[1] = 2;
  std::stringstream ss(encoded);
  EXPECT_THROW(codec.deserialize_chunk(ss), StoreError);
}

TEST_F(RecordCodecTest, OversizedLengthPrefixThrows) {
  std::string encoded("C\x01\xff\xff\xff\xff", 6);
  std::stringstream ss(encoded);
  EXPECT_THROW(codec.deserialize_chunk(ss), StoreError);
}

TEST_F(RecordCodecTest, BadStreamThrows) {
  std::stringstream ss;
  ss.setstate(std::ios::badbit);
  EXPECT_THROW(codec.serialize(ChunkRecord{"id", 0, Bytes{}}, ss), StoreError);
  EXPECT_THROW(codec.deserialize_chunk(ss), StoreError);
}

TEST_F(RecordCodecTest, FailedFlushThrows) {
  UnflushableBuffer chunk_buffer;
  std::ostream chunk_out(&chunk_buffer);
  EXPECT_THROW(codec.serialize(ChunkRecord{"id", 0, Bytes(1000, 7)}, chunk_out), StoreError);

  FileRecord record;
  record.id = "id";
  record.filename = "name";
  UnflushableBuffer record_buffer;
  std::ostream record_out(&record_buffer);
  EXPECT_THROW(codec.serialize(record, record_out), StoreError);
}
