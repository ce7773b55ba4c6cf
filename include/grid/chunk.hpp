#ifndef GRIDSTORE_GRID_CHUNK_HPP
#define GRIDSTORE_GRID_CHUNK_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "store/backend.hpp"

namespace gridstore::grid {

// One fixed-size unit of file data: sequence number, byte buffer and an
// intra-chunk cursor. The buffer grows as bytes are written at its end.
class Chunk {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // New, empty chunk n of files_id
  Chunk(store::Backend& backend, std::string root, std::string files_id, uint32_t n);
  // Chunk loaded from the store
  Chunk(store::Backend& backend, std::string root, store::ChunkRecord record);

  Chunk(const Chunk&) = delete;
  Chunk& operator=(const Chunk&) = delete;

  // Loads chunk n from the store, or an empty placeholder numbered n if there is none
  static std::unique_ptr<Chunk> fetch(store::Backend& backend, const std::string& root,
                                      const std::string& files_id, uint32_t n);


  // ---- BYTE OPERATIONS ----
  // Returns the byte at the cursor and advances, throws std::out_of_range at eof
  uint8_t get_byte();
  // Writes at the cursor, overwriting or extending the buffer, and advances
  void put_byte(uint8_t byte);
  // Copies up to size bytes from the cursor into out, returns the number copied
  std::size_t read(uint8_t* out, std::size_t size);
  // Copies size bytes into the buffer at the cursor
  void write(const uint8_t* data, std::size_t size);


  // ---- PERSISTENCE ----
  // Upserts the chunk keyed by (files_id, n)
  void save();
  // Cuts the buffer at the cursor
  void truncate();


  // ---- STATUS ----
  bool eof() const { return pos_ >= data_.size(); }
  bool dirty() const { return dirty_; }
  uint32_t number() const { return n_; }
  std::size_t pos() const { return pos_; }
  void set_pos(std::size_t pos) { pos_ = pos; }
  std::size_t size() const { return data_.size(); }
  const store::Bytes& data() const { return data_; }

private:
  // ---- PARAMETERS ----
  store::Backend& backend_;
  std::string root_;
  std::string files_id_;
  uint32_t n_;
  store::Bytes data_;
  std::size_t pos_ = 0;
  // Buffer differs from what was last loaded or saved
  bool dirty_ = false;

  // Zero-fills the buffer up to the cursor when it sits past the end
  void fill_to_pos();
};

} // namespace gridstore::grid

#endif // GRIDSTORE_GRID_CHUNK_HPP
