#ifndef GRIDSTORE_STORE_MEMORY_BACKEND_HPP
#define GRIDSTORE_STORE_MEMORY_BACKEND_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>
#include "store/backend.hpp"

namespace gridstore {
namespace store {

// In-process document store. File records keep insertion order, chunk
// records are ordered by (files_id, n).
class MemoryBackend : public Backend {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  MemoryBackend() = default;
  ~MemoryBackend() override = default;


  // ---- FILE RECORDS ----
  std::optional<FileRecord> find_file(const std::string& root, const std::string& filename) override;
  std::vector<FileRecord> find_files(const std::string& root) override;
  void insert_file(const std::string& root, const FileRecord& record) override;
  void remove_file(const std::string& root, const std::string& files_id) override;
  std::size_t rename_file(const std::string& root, const std::string& src, const std::string& dest) override;


  // ---- CHUNK RECORDS ----
  std::optional<ChunkRecord> find_chunk(const std::string& root, const std::string& files_id, uint32_t n) override;
  void save_chunk(const std::string& root, const ChunkRecord& chunk) override;
  void remove_chunks(const std::string& root, const std::string& files_id, uint32_t first_n = 0) override;
  void create_chunk_index(const std::string& root) override;


  // ---- COMMANDS ----
  std::string file_md5(const std::string& root, const std::string& files_id) override;


  // ---- INSPECTION ----
  // All chunks of a file in n order
  std::vector<ChunkRecord> chunks_of(const std::string& root, const std::string& files_id) const;
  std::size_t chunk_count(const std::string& root) const;
  bool has_chunk_index(const std::string& root) const;

private:
  using ChunkKey = std::pair<std::string, uint32_t>;

  struct Collections {
    std::vector<FileRecord> files;
    std::map<ChunkKey, Bytes> chunks;
    bool chunk_index = false;
  };

  // ---- PARAMETERS ----
  std::map<std::string, Collections> roots_;

  Collections& collections(const std::string& root);
  const Collections* find_collections(const std::string& root) const;
};

} // namespace store
} // namespace gridstore

#endif // GRIDSTORE_STORE_MEMORY_BACKEND_HPP
