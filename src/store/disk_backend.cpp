#include "store/disk_backend.hpp"
#include "store/checksum.hpp"
#include <algorithm>
#include <fstream>
#include <boost/log/trivial.hpp>

namespace gridstore {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
DiskBackend::DiskBackend(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "DiskBackend: Initializing with base path: " << base_path;
  try {
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "DiskBackend: Failed to create base directory: " << e.what();
    throw StoreError("DiskBackend: Failed to create base directory: " + std::string(e.what()));
  }
  BOOST_LOG_TRIVIAL(debug) << "DiskBackend: Store directory created/verified at: " << base_path;
}


//==============================================
// FILE RECORDS
//==============================================

std::optional<FileRecord> DiskBackend::find_file(const std::string& root, const std::string& filename) {
  BOOST_LOG_TRIVIAL(debug) << "DiskBackend: Looking up " << filename << " in " << files_collection(root);

  for (auto& record : find_files(root)) {
    if (record.filename == filename) {
      return std::move(record);
    }
  }
  return std::nullopt;
}

std::vector<FileRecord> DiskBackend::find_files(const std::string& root) {
  std::vector<FileRecord> records;
  std::filesystem::path dir = files_dir(root);

  try {
    if (!std::filesystem::exists(dir)) {
      return records;
    }
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
      if (entry.is_regular_file()) {
        records.push_back(read_file_record(entry.path()));
      }
    }
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "DiskBackend: Failed to scan " << dir.string() << ": " << e.what();
    throw StoreError("DiskBackend: Failed to scan file records: " + std::string(e.what()));
  }

  // Directory order is arbitrary, present records in upload order
  std::sort(records.begin(), records.end(), [](const FileRecord& a, const FileRecord& b) {
    if (a.upload_date != b.upload_date) {
      return a.upload_date < b.upload_date;
    }
    return a.id < b.id;
  });
  return records;
}

void DiskBackend::insert_file(const std::string& root, const FileRecord& record) {
  std::filesystem::path path = file_record_path(root, record.id);

  try {
    if (std::filesystem::exists(path)) {
      BOOST_LOG_TRIVIAL(error) << "DiskBackend: Duplicate id in " << files_collection(root) << ": " << record.id;
      throw StoreError("DiskBackend: Duplicate key " + record.id + " in " + files_collection(root));
    }
    check_directory_exists(path.parent_path());
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "DiskBackend: Failed to prepare " << path.string() << ": " << e.what();
    throw StoreError("DiskBackend: Failed to insert file record: " + std::string(e.what()));
  }

  write_file_record(path, record);
  BOOST_LOG_TRIVIAL(debug) << "DiskBackend: Inserted file record " << record.id << " at " << path.string();
}

void DiskBackend::remove_file(const std::string& root, const std::string& files_id) {
  std::filesystem::path path = file_record_path(root, files_id);

  try {
    if (std::filesystem::remove(path)) {
      prune_empty_parents(path.parent_path(), files_dir(root));
      BOOST_LOG_TRIVIAL(debug) << "DiskBackend: Removed file record " << files_id;
    }
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "DiskBackend: Failed to remove file record " << files_id << ": " << e.what();
    throw StoreError("DiskBackend: Failed to remove file record: " + std::string(e.what()));
  }
}

std::size_t DiskBackend::rename_file(const std::string& root, const std::string& src, const std::string& dest) {
  std::size_t matched = 0;
  for (auto& record : find_files(root)) {
    if (record.filename != src) {
      continue;
    }
    record.filename = dest;
    write_file_record(file_record_path(root, record.id), record);
    ++matched;
  }
  return matched;
}


//==============================================
// CHUNK RECORDS
//==============================================

std::optional<ChunkRecord> DiskBackend::find_chunk(const std::string& root, const std::string& files_id, uint32_t n) {
  std::filesystem::path path = chunk_dir_for(root, files_id) / std::to_string(n);

  try {
    if (!std::filesystem::exists(path)) {
      return std::nullopt;
    }
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("DiskBackend: Failed to look up chunk: " + std::string(e.what()));
  }

  ChunkRecord chunk = read_chunk_record(path);
  if (chunk.files_id != files_id || chunk.n != n) {
    BOOST_LOG_TRIVIAL(error) << "DiskBackend: Chunk record at " << path.string() << " does not match its key";
    throw StoreError("DiskBackend: Corrupt chunk record for " + files_id);
  }
  return chunk;
}

void DiskBackend::save_chunk(const std::string& root, const ChunkRecord& chunk) {
  std::filesystem::path dir = chunk_dir_for(root, chunk.files_id);
  std::filesystem::path path = dir / std::to_string(chunk.n);

  try {
    check_directory_exists(dir);
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("DiskBackend: Failed to create chunk directory: " + std::string(e.what()));
  }

  // Open output file in binary mode, truncating any previous version
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "DiskBackend: Failed to create chunk file: " << path.string();
    throw StoreError("DiskBackend: Failed to create file: " + path.string());
  }
  codec_.serialize(chunk, file);
  close_checked(file, path);

  BOOST_LOG_TRIVIAL(debug) << "DiskBackend: Saved chunk " << chunk.n << " of " << chunk.files_id
                           << " (" << chunk.data.size() << " bytes)";
}

void DiskBackend::remove_chunks(const std::string& root, const std::string& files_id, uint32_t first_n) {
  std::filesystem::path dir = chunk_dir_for(root, files_id);

  try {
    if (!std::filesystem::exists(dir)) {
      return;
    }

    std::size_t removed = 0;
    for (uint32_t n : list_chunk_numbers(dir)) {
      if (n >= first_n && std::filesystem::remove(dir / std::to_string(n))) {
        ++removed;
      }
    }

    if (std::filesystem::is_empty(dir)) {
      std::filesystem::remove(dir);
      prune_empty_parents(dir.parent_path(), chunks_dir(root));
    }
    BOOST_LOG_TRIVIAL(debug) << "DiskBackend: Removed " << removed << " chunks of " << files_id
                             << " starting at n=" << first_n;
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "DiskBackend: Failed to remove chunks of " << files_id << ": " << e.what();
    throw StoreError("DiskBackend: Failed to remove chunks: " + std::string(e.what()));
  }
}

void DiskBackend::create_chunk_index(const std::string& root) {
  try {
    check_directory_exists(chunks_dir(root));
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("DiskBackend: Failed to create chunk collection: " + std::string(e.what()));
  }
}


//==============================================
// COMMANDS
//==============================================

std::string DiskBackend::file_md5(const std::string& root, const std::string& files_id) {
  Digest digest(Digest::Algorithm::Md5);
  std::filesystem::path dir = chunk_dir_for(root, files_id);

  try {
    if (std::filesystem::exists(dir)) {
      for (uint32_t n : list_chunk_numbers(dir)) {
        ChunkRecord chunk = read_chunk_record(dir / std::to_string(n));
        digest.update(chunk.data.data(), chunk.data.size());
      }
    }
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("DiskBackend: Failed to read chunks for checksum: " + std::string(e.what()));
  }
  return digest.hex_digest();
}


//==============================================
// MAINTENANCE
//==============================================

void DiskBackend::clear() {
  BOOST_LOG_TRIVIAL(info) << "DiskBackend: Clearing entire store at: " << base_path_;
  try {
    std::filesystem::remove_all(base_path_);
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("DiskBackend: Failed to clear store: " + std::string(e.what()));
  }
}


//==============================================
// PATH LAYOUT
//==============================================

std::filesystem::path DiskBackend::files_dir(const std::string& root) const {
  return base_path_ / files_collection(root);
}

std::filesystem::path DiskBackend::chunks_dir(const std::string& root) const {
  return base_path_ / chunks_collection(root);
}

std::filesystem::path DiskBackend::file_record_path(const std::string& root, const std::string& files_id) const {
  return get_path_for_hash(files_dir(root), Digest::sha256_hex(files_id));
}

std::filesystem::path DiskBackend::chunk_dir_for(const std::string& root, const std::string& files_id) const {
  return get_path_for_hash(chunks_dir(root), Digest::sha256_hex(files_id));
}

std::filesystem::path DiskBackend::get_path_for_hash(const std::filesystem::path& base, const std::string& hash) const {
  std::filesystem::path path = base;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}


//==============================================
// RECORD I/O
//==============================================

void DiskBackend::write_file_record(const std::filesystem::path& path, const FileRecord& record) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "DiskBackend: Failed to create file: " << path.string();
    throw StoreError("DiskBackend: Failed to create file: " + path.string());
  }
  codec_.serialize(record, file);
  close_checked(file, path);
}

FileRecord DiskBackend::read_file_record(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "DiskBackend: Failed to open file: " << path.string();
    throw StoreError("DiskBackend: Failed to open file: " + path.string());
  }
  return codec_.deserialize_file(file);
}

ChunkRecord DiskBackend::read_chunk_record(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "DiskBackend: Failed to open file: " << path.string();
    throw StoreError("DiskBackend: Failed to open file: " + path.string());
  }
  return codec_.deserialize_chunk(file);
}

void DiskBackend::close_checked(std::ofstream& file, const std::filesystem::path& path) {
  file.close();
  if (file.fail()) {
    BOOST_LOG_TRIVIAL(error) << "DiskBackend: Failed to write file: " << path.string();
    throw StoreError("DiskBackend: Failed to write file: " + path.string());
  }
}

std::vector<uint32_t> DiskBackend::list_chunk_numbers(const std::filesystem::path& dir) const {
  std::vector<uint32_t> numbers;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    const std::string name = entry.path().filename().string();
    if (!entry.is_regular_file() || name.empty() ||
        !std::all_of(name.begin(), name.end(), [](char c) { return c >= '0' && c <= '9'; })) {
      BOOST_LOG_TRIVIAL(warning) << "DiskBackend: Ignoring unexpected entry in chunk directory: " << entry.path().string();
      continue;
    }
    numbers.push_back(static_cast<uint32_t>(std::stoul(name)));
  }
  std::sort(numbers.begin(), numbers.end());
  return numbers;
}


//==============================================
// UTILITY METHODS
//==============================================

void DiskBackend::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void DiskBackend::prune_empty_parents(std::filesystem::path path, const std::filesystem::path& stop) const {
  while (path != stop && path.has_parent_path() && std::filesystem::exists(path)) {
    if (!std::filesystem::is_empty(path)) {
      break;
    }
    std::filesystem::remove(path);
    path = path.parent_path();
  }
}

} // namespace store
} // namespace gridstore
