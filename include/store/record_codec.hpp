#ifndef GRIDSTORE_STORE_RECORD_CODEC_HPP
#define GRIDSTORE_STORE_RECORD_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include "store/records.hpp"

namespace gridstore {
namespace store {

// Binary encoding of file and chunk records used by the disk backend.
// Integers are big-endian, strings and byte arrays are u32 length-prefixed.
class RecordCodec {
public:
  static constexpr uint8_t FILE_RECORD_TAG = 0x46;   // 'F'
  static constexpr uint8_t CHUNK_RECORD_TAG = 0x43;  // 'C'
  static constexpr uint8_t FORMAT_VERSION = 1;


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Serializes a record to an output stream, returns the number of bytes written
  std::size_t serialize(const FileRecord& record, std::ostream& output);
  std::size_t serialize(const ChunkRecord& chunk, std::ostream& output);
  // Deserializes a record, throws StoreError on short or malformed input
  FileRecord deserialize_file(std::istream& input);
  ChunkRecord deserialize_chunk(std::istream& input);

private:
  // ---- PARAMETERS ----
  std::size_t total_bytes_ = 0;


  // ---- HEADER ----
  void write_header(std::ostream& output, uint8_t tag);
  void read_header(std::istream& input, uint8_t expected_tag);


  // ---- FIELD ENCODING ----
  void write_u8(std::ostream& output, uint8_t value);
  void write_u32(std::ostream& output, uint32_t value);
  void write_u64(std::ostream& output, uint64_t value);
  void write_string(std::ostream& output, const std::string& value);
  void write_blob(std::ostream& output, const Bytes& value);

  uint8_t read_u8(std::istream& input);
  uint32_t read_u32(std::istream& input);
  uint64_t read_u64(std::istream& input);
  std::string read_string(std::istream& input);
  Bytes read_blob(std::istream& input);


  // ---- STREAM OPERATIONS ----
  // Writes bytes to an output stream
  void write_bytes(std::ostream& output, const void* data, std::size_t size);
  // Pushes buffered bytes to the device, throws StoreError if they do not get there
  void flush(std::ostream& output);
  // Reads bytes from an input stream
  void read_bytes(std::istream& input, void* data, std::size_t size);
};

} // namespace store
} // namespace gridstore

#endif // GRIDSTORE_STORE_RECORD_CODEC_HPP
