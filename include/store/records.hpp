#ifndef GRIDSTORE_STORE_RECORDS_HPP
#define GRIDSTORE_STORE_RECORDS_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gridstore {
namespace store {

using Bytes = std::vector<uint8_t>;
using Metadata = std::map<std::string, std::string>;
using Timestamp = std::chrono::system_clock::time_point;

// One record of the <root>.files collection
struct FileRecord {
  std::string id;
  std::string filename;
  std::string content_type;
  uint64_t length = 0;
  uint32_t chunk_size = 0;
  // Unset until the file has been saved once
  std::optional<Timestamp> upload_date;
  std::vector<std::string> aliases;
  Metadata metadata;
  std::string md5;
};

// One record of the <root>.chunks collection, identified by (files_id, n)
struct ChunkRecord {
  std::string files_id;
  uint32_t n = 0;
  Bytes data;
};

} // namespace store
} // namespace gridstore

#endif // GRIDSTORE_STORE_RECORDS_HPP
