#ifndef GRIDSTORE_STORE_DISK_BACKEND_HPP
#define GRIDSTORE_STORE_DISK_BACKEND_HPP

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "store/backend.hpp"
#include "store/record_codec.hpp"

namespace gridstore {
namespace store {

// Persistent document store rooted at a directory:
//   {base_path}/{root}.files/{hash path of id}             one file record
//   {base_path}/{root}.chunks/{hash path of files_id}/{n}  one chunk record
// Hash paths are {hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash} of the
// SHA-256 of the id. The per-file chunk directory serves as the (files_id, n) index.
class DiskBackend : public Backend {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DiskBackend(const std::string& base_path);
  ~DiskBackend() override = default;


  // ---- FILE RECORDS ----
  std::optional<FileRecord> find_file(const std::string& root, const std::string& filename) override;
  // Records ordered by upload date, then id
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


  // ---- MAINTENANCE ----
  // Removes all stored data and resets the store
  void clear();
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all collections
  std::filesystem::path base_path_;
  RecordCodec codec_;


  // ---- PATH LAYOUT ----
  std::filesystem::path files_dir(const std::string& root) const;
  std::filesystem::path chunks_dir(const std::string& root) const;
  std::filesystem::path file_record_path(const std::string& root, const std::string& files_id) const;
  std::filesystem::path chunk_dir_for(const std::string& root, const std::string& files_id) const;
  // Creates a directory structure using parts of the hash
  std::filesystem::path get_path_for_hash(const std::filesystem::path& base, const std::string& hash) const;


  // ---- RECORD I/O ----
  void write_file_record(const std::filesystem::path& path, const FileRecord& record);
  FileRecord read_file_record(const std::filesystem::path& path);
  ChunkRecord read_chunk_record(const std::filesystem::path& path);
  // Closes a written record file, throws StoreError if its bytes did not reach the disk
  void close_checked(std::ofstream& file, const std::filesystem::path& path);
  // Chunk numbers present in a chunk directory, ascending
  std::vector<uint32_t> list_chunk_numbers(const std::filesystem::path& dir) const;


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Removes empty directories from path up to (not including) stop
  void prune_empty_parents(std::filesystem::path path, const std::filesystem::path& stop) const;
};

} // namespace store
} // namespace gridstore

#endif // GRIDSTORE_STORE_DISK_BACKEND_HPP
