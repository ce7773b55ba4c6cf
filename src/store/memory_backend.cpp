#include "store/memory_backend.hpp"
#include "store/checksum.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace gridstore {
namespace store {

//==============================================
// FILE RECORDS
//==============================================

std::optional<FileRecord> MemoryBackend::find_file(const std::string& root, const std::string& filename) {
  const Collections* cols = find_collections(root);
  if (!cols) {
    return std::nullopt;
  }

  auto it = std::find_if(cols->files.begin(), cols->files.end(),
    [&filename](const FileRecord& record) { return record.filename == filename; });
  if (it == cols->files.end()) {
    return std::nullopt;
  }
  return *it;
}

std::vector<FileRecord> MemoryBackend::find_files(const std::string& root) {
  const Collections* cols = find_collections(root);
  if (!cols) {
    return {};
  }
  return cols->files;
}

void MemoryBackend::insert_file(const std::string& root, const FileRecord& record) {
  Collections& cols = collections(root);

  auto it = std::find_if(cols.files.begin(), cols.files.end(),
    [&record](const FileRecord& existing) { return existing.id == record.id; });
  if (it != cols.files.end()) {
    BOOST_LOG_TRIVIAL(error) << "MemoryBackend: Duplicate id in " << files_collection(root) << ": " << record.id;
    throw StoreError("MemoryBackend: Duplicate key " + record.id + " in " + files_collection(root));
  }

  cols.files.push_back(record);
  BOOST_LOG_TRIVIAL(debug) << "MemoryBackend: Inserted file record " << record.id << " into " << files_collection(root);
}

void MemoryBackend::remove_file(const std::string& root, const std::string& files_id) {
  Collections& cols = collections(root);
  cols.files.erase(std::remove_if(cols.files.begin(), cols.files.end(),
    [&files_id](const FileRecord& record) { return record.id == files_id; }), cols.files.end());
}

std::size_t MemoryBackend::rename_file(const std::string& root, const std::string& src, const std::string& dest) {
  Collections& cols = collections(root);
  std::size_t matched = 0;
  for (auto& record : cols.files) {
    if (record.filename == src) {
      record.filename = dest;
      ++matched;
    }
  }
  return matched;
}


//==============================================
// CHUNK RECORDS
//==============================================

std::optional<ChunkRecord> MemoryBackend::find_chunk(const std::string& root, const std::string& files_id, uint32_t n) {
  const Collections* cols = find_collections(root);
  if (!cols) {
    return std::nullopt;
  }

  auto it = cols->chunks.find(ChunkKey(files_id, n));
  if (it == cols->chunks.end()) {
    return std::nullopt;
  }
  return ChunkRecord{files_id, n, it->second};
}

void MemoryBackend::save_chunk(const std::string& root, const ChunkRecord& chunk) {
  collections(root).chunks[ChunkKey(chunk.files_id, chunk.n)] = chunk.data;
}

void MemoryBackend::remove_chunks(const std::string& root, const std::string& files_id, uint32_t first_n) {
  Collections& cols = collections(root);
  auto first = cols.chunks.lower_bound(ChunkKey(files_id, first_n));
  auto last = first;
  while (last != cols.chunks.end() && last->first.first == files_id) {
    ++last;
  }
  cols.chunks.erase(first, last);
}

void MemoryBackend::create_chunk_index(const std::string& root) {
  collections(root).chunk_index = true;
}


//==============================================
// COMMANDS
//==============================================

std::string MemoryBackend::file_md5(const std::string& root, const std::string& files_id) {
  Digest digest(Digest::Algorithm::Md5);
  for (const auto& chunk : chunks_of(root, files_id)) {
    digest.update(chunk.data.data(), chunk.data.size());
  }
  return digest.hex_digest();
}


//==============================================
// INSPECTION
//==============================================

std::vector<ChunkRecord> MemoryBackend::chunks_of(const std::string& root, const std::string& files_id) const {
  std::vector<ChunkRecord> result;
  const Collections* cols = find_collections(root);
  if (!cols) {
    return result;
  }

  for (auto it = cols->chunks.lower_bound(ChunkKey(files_id, 0));
       it != cols->chunks.end() && it->first.first == files_id; ++it) {
    result.push_back(ChunkRecord{files_id, it->first.second, it->second});
  }
  return result;
}

std::size_t MemoryBackend::chunk_count(const std::string& root) const {
  const Collections* cols = find_collections(root);
  return cols ? cols->chunks.size() : 0;
}

bool MemoryBackend::has_chunk_index(const std::string& root) const {
  const Collections* cols = find_collections(root);
  return cols && cols->chunk_index;
}

MemoryBackend::Collections& MemoryBackend::collections(const std::string& root) {
  return roots_[root];
}

const MemoryBackend::Collections* MemoryBackend::find_collections(const std::string& root) const {
  auto it = roots_.find(root);
  return it == roots_.end() ? nullptr : &it->second;
}

} // namespace store
} // namespace gridstore
