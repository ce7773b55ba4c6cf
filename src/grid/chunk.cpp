#include "grid/chunk.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <boost/log/trivial.hpp>

namespace gridstore::grid {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Chunk::Chunk(store::Backend& backend, std::string root, std::string files_id, uint32_t n)
  : backend_(backend)
  , root_(std::move(root))
  , files_id_(std::move(files_id))
  , n_(n) {
}

Chunk::Chunk(store::Backend& backend, std::string root, store::ChunkRecord record)
  : backend_(backend)
  , root_(std::move(root))
  , files_id_(std::move(record.files_id))
  , n_(record.n)
  , data_(std::move(record.data)) {
}

std::unique_ptr<Chunk> Chunk::fetch(store::Backend& backend, const std::string& root,
                                    const std::string& files_id, uint32_t n) {
  auto record = backend.find_chunk(root, files_id, n);
  if (!record) {
    BOOST_LOG_TRIVIAL(debug) << "Chunk: No chunk " << n << " stored for " << files_id << ", using empty chunk";
    return std::make_unique<Chunk>(backend, root, files_id, n);
  }
  BOOST_LOG_TRIVIAL(debug) << "Chunk: Loaded chunk " << n << " of " << files_id
                           << " (" << record->data.size() << " bytes)";
  return std::make_unique<Chunk>(backend, root, std::move(*record));
}


//==============================================
// BYTE OPERATIONS
//==============================================

uint8_t Chunk::get_byte() {
  if (eof()) {
    throw std::out_of_range("Chunk: Read past end of chunk " + std::to_string(n_));
  }
  return data_[pos_++];
}

void Chunk::put_byte(uint8_t byte) {
  write(&byte, 1);
}

std::size_t Chunk::read(uint8_t* out, std::size_t size) {
  if (eof()) {
    return 0;
  }
  std::size_t count = std::min(size, data_.size() - pos_);
  std::memcpy(out, data_.data() + pos_, count);
  pos_ += count;
  return count;
}

void Chunk::write(const uint8_t* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  fill_to_pos();
  if (pos_ + size > data_.size()) {
    data_.resize(pos_ + size);
  }
  std::memcpy(data_.data() + pos_, data, size);
  pos_ += size;
  dirty_ = true;
}


//==============================================
// PERSISTENCE
//==============================================

void Chunk::save() {
  backend_.save_chunk(root_, store::ChunkRecord{files_id_, n_, data_});
  dirty_ = false;
  BOOST_LOG_TRIVIAL(debug) << "Chunk: Saved chunk " << n_ << " of " << files_id_ << " (" << data_.size() << " bytes)";
}

void Chunk::truncate() {
  if (pos_ < data_.size()) {
    data_.resize(pos_);
    dirty_ = true;
  }
}

void Chunk::fill_to_pos() {
  if (pos_ > data_.size()) {
    data_.resize(pos_, 0);
    dirty_ = true;
  }
}

} // namespace gridstore::grid
