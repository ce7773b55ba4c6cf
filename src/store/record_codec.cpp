#include "store/record_codec.hpp"
#include "store/backend.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <chrono>

namespace gridstore {
namespace store {

namespace {
// Upper bound for a single length prefix, guards against reading garbage as a size
constexpr uint32_t MAX_FIELD_SIZE = 1u << 30;
}

//==============================================
// SERIALIZATION
//==============================================

std::size_t RecordCodec::serialize(const FileRecord& record, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "RecordCodec: Invalid output stream state";
    throw StoreError("RecordCodec: Invalid output stream");
  }

  total_bytes_ = 0;
  write_header(output, FILE_RECORD_TAG);
  write_string(output, record.id);
  write_string(output, record.filename);
  write_string(output, record.content_type);
  write_u64(output, record.length);
  write_u32(output, record.chunk_size);

  // Upload date as milliseconds since the epoch, preceded by a presence flag
  write_u8(output, record.upload_date ? 1 : 0);
  if (record.upload_date) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
      record.upload_date->time_since_epoch()).count();
    write_u64(output, static_cast<uint64_t>(millis));
  }

  write_u32(output, static_cast<uint32_t>(record.aliases.size()));
  for (const auto& alias : record.aliases) {
    write_string(output, alias);
  }

  write_u32(output, static_cast<uint32_t>(record.metadata.size()));
  for (const auto& [key, value] : record.metadata) {
    write_string(output, key);
    write_string(output, value);
  }

  write_string(output, record.md5);
  flush(output);

  BOOST_LOG_TRIVIAL(debug) << "RecordCodec: Serialized file record " << record.id
                           << " (" << total_bytes_ << " bytes)";
  return total_bytes_;
}

std::size_t RecordCodec::serialize(const ChunkRecord& chunk, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "RecordCodec: Invalid output stream state";
    throw StoreError("RecordCodec: Invalid output stream");
  }

  total_bytes_ = 0;
  write_header(output, CHUNK_RECORD_TAG);
  write_string(output, chunk.files_id);
  write_u32(output, chunk.n);
  write_blob(output, chunk.data);
  flush(output);

  BOOST_LOG_TRIVIAL(debug) << "RecordCodec: Serialized chunk " << chunk.n << " of " << chunk.files_id
                           << " (" << total_bytes_ << " bytes)";
  return total_bytes_;
}


//==============================================
// DESERIALIZATION
//==============================================

FileRecord RecordCodec::deserialize_file(std::istream& input) {
  total_bytes_ = 0;
  read_header(input, FILE_RECORD_TAG);

  FileRecord record;
  record.id = read_string(input);
  record.filename = read_string(input);
  record.content_type = read_string(input);
  record.length = read_u64(input);
  record.chunk_size = read_u32(input);

  uint8_t has_upload_date = read_u8(input);
  if (has_upload_date > 1) {
    BOOST_LOG_TRIVIAL(error) << "RecordCodec: Invalid upload date flag: " << static_cast<int>(has_upload_date);
    throw StoreError("RecordCodec: Malformed file record");
  }
  if (has_upload_date) {
    auto millis = static_cast<int64_t>(read_u64(input));
    record.upload_date = Timestamp(std::chrono::milliseconds(millis));
  }

  uint32_t alias_count = read_u32(input);
  for (uint32_t i = 0; i < alias_count; ++i) {
    record.aliases.push_back(read_string(input));
  }

  uint32_t metadata_count = read_u32(input);
  for (uint32_t i = 0; i < metadata_count; ++i) {
    std::string key = read_string(input);
    record.metadata[key] = read_string(input);
  }

  record.md5 = read_string(input);

  BOOST_LOG_TRIVIAL(debug) << "RecordCodec: Deserialized file record " << record.id
                           << " (" << total_bytes_ << " bytes)";
  return record;
}

ChunkRecord RecordCodec::deserialize_chunk(std::istream& input) {
  total_bytes_ = 0;
  read_header(input, CHUNK_RECORD_TAG);

  ChunkRecord chunk;
  chunk.files_id = read_string(input);
  chunk.n = read_u32(input);
  chunk.data = read_blob(input);

  BOOST_LOG_TRIVIAL(debug) << "RecordCodec: Deserialized chunk " << chunk.n << " of " << chunk.files_id
                           << " (" << total_bytes_ << " bytes)";
  return chunk;
}


//==============================================
// HEADER
//==============================================

void RecordCodec::write_header(std::ostream& output, uint8_t tag) {
  write_u8(output, tag);
  write_u8(output, FORMAT_VERSION);
}

void RecordCodec::read_header(std::istream& input, uint8_t expected_tag) {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "RecordCodec: Invalid input stream state";
    throw StoreError("RecordCodec: Invalid input stream");
  }

  uint8_t tag = read_u8(input);
  if (tag != expected_tag) {
    BOOST_LOG_TRIVIAL(error) << "RecordCodec: Unexpected record tag: " << static_cast<int>(tag);
    throw StoreError("RecordCodec: Unexpected record type");
  }

  uint8_t version = read_u8(input);
  if (version != FORMAT_VERSION) {
    BOOST_LOG_TRIVIAL(error) << "RecordCodec: Unsupported format version: " << static_cast<int>(version);
    throw StoreError("RecordCodec: Unsupported format version");
  }
}


//==============================================
// FIELD ENCODING
//==============================================

void RecordCodec::write_u8(std::ostream& output, uint8_t value) {
  write_bytes(output, &value, sizeof(value));
}

void RecordCodec::write_u32(std::ostream& output, uint32_t value) {
  uint32_t network_value = boost::endian::native_to_big(value);
  write_bytes(output, &network_value, sizeof(network_value));
}

void RecordCodec::write_u64(std::ostream& output, uint64_t value) {
  uint64_t network_value = boost::endian::native_to_big(value);
  write_bytes(output, &network_value, sizeof(network_value));
}

void RecordCodec::write_string(std::ostream& output, const std::string& value) {
  write_u32(output, static_cast<uint32_t>(value.size()));
  write_bytes(output, value.data(), value.size());
}

void RecordCodec::write_blob(std::ostream& output, const Bytes& value) {
  write_u32(output, static_cast<uint32_t>(value.size()));
  write_bytes(output, value.data(), value.size());
}

uint8_t RecordCodec::read_u8(std::istream& input) {
  uint8_t value;
  read_bytes(input, &value, sizeof(value));
  return value;
}

uint32_t RecordCodec::read_u32(std::istream& input) {
  uint32_t network_value;
  read_bytes(input, &network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

uint64_t RecordCodec::read_u64(std::istream& input) {
  uint64_t network_value;
  read_bytes(input, &network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

std::string RecordCodec::read_string(std::istream& input) {
  uint32_t size = read_u32(input);
  if (size > MAX_FIELD_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "RecordCodec: String field too large: " << size;
    throw StoreError("RecordCodec: Malformed record field");
  }
  std::string value(size, '\0');
  read_bytes(input, value.data(), size);
  return value;
}

Bytes RecordCodec::read_blob(std::istream& input) {
  uint32_t size = read_u32(input);
  if (size > MAX_FIELD_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "RecordCodec: Data field too large: " << size;
    throw StoreError("RecordCodec: Malformed record field");
  }
  Bytes value(size);
  read_bytes(input, value.data(), size);
  return value;
}


//==============================================
// STREAM OPERATIONS
//==============================================

void RecordCodec::flush(std::ostream& output) {
  if (!output.flush()) {
    BOOST_LOG_TRIVIAL(error) << "RecordCodec: Failed to flush " << total_bytes_ << " bytes to output stream";
    throw StoreError("RecordCodec: Failed to flush output stream");
  }
}

void RecordCodec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "RecordCodec: Failed to write " << size << " bytes to output stream";
    throw StoreError("RecordCodec: Failed to write to output stream");
  }
  total_bytes_ += size;
}

void RecordCodec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "RecordCodec: Failed to read " << size << " bytes from input stream";
    throw StoreError("RecordCodec: Failed to read from input stream");
  }
  total_bytes_ += size;
}

} // namespace store
} // namespace gridstore
