#ifndef GRIDSTORE_STORE_BACKEND_HPP
#define GRIDSTORE_STORE_BACKEND_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "store/records.hpp"

namespace gridstore {
namespace store {

// Document store holding the two record sets of every namespace root:
// <root>.files and <root>.chunks. Made virtual so cursors can run against
// a persistent store, an in-process one, or a mock.
class Backend {
public:
  virtual ~Backend() = default;


  // ---- FILE RECORDS ----
  // Returns the first file record whose filename matches
  virtual std::optional<FileRecord> find_file(const std::string& root, const std::string& filename) = 0;
  // Returns every file record of the root in natural order
  virtual std::vector<FileRecord> find_files(const std::string& root) = 0;
  // Inserts a new record, throws StoreError if the id is already present
  virtual void insert_file(const std::string& root, const FileRecord& record) = 0;
  virtual void remove_file(const std::string& root, const std::string& files_id) = 0;
  // Sets filename = dest on every record named src, returns the number of matches
  virtual std::size_t rename_file(const std::string& root, const std::string& src, const std::string& dest) = 0;


  // ---- CHUNK RECORDS ----
  virtual std::optional<ChunkRecord> find_chunk(const std::string& root, const std::string& files_id, uint32_t n) = 0;
  // Upserts the chunk keyed by (files_id, n)
  virtual void save_chunk(const std::string& root, const ChunkRecord& chunk) = 0;
  // Removes every chunk of files_id with n >= first_n
  virtual void remove_chunks(const std::string& root, const std::string& files_id, uint32_t first_n = 0) = 0;
  // Ensures the composite (files_id, n) index exists
  virtual void create_chunk_index(const std::string& root) = 0;


  // ---- COMMANDS ----
  // Server-side checksum: MD5 over the file's chunks in n order, lowercase hex
  virtual std::string file_md5(const std::string& root, const std::string& files_id) = 0;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Collection names under a namespace root
inline std::string files_collection(const std::string& root) { return root + ".files"; }
inline std::string chunks_collection(const std::string& root) { return root + ".chunks"; }

} // namespace store
} // namespace gridstore

#endif // GRIDSTORE_STORE_BACKEND_HPP
