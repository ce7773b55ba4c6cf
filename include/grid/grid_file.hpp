#ifndef GRIDSTORE_GRID_FILE_HPP
#define GRIDSTORE_GRID_FILE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "grid/chunk.hpp"
#include "grid/grid_error.hpp"
#include "grid/iterators.hpp"
#include "grid/options.hpp"
#include "store/backend.hpp"

namespace gridstore::grid {

// Stream-like cursor over a file stored as a sequence of fixed-size chunk
// records. Opening loads (or creates in memory) the file record; Write and
// Append persist chunks as they fill and write the file record on close.
// Read never mutates the store.
//
// A cursor that is destroyed while open closes itself. Use GridStore::open
// to scope a cursor and see close failures.
//
// Opening for Write deletes the file's chunks immediately, two writers on the
// same filename race and the last close wins.
class GridFile {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  GridFile(store::Backend& backend, const std::string& filename, Mode mode,
           const OpenOptions& options = OpenOptions());
  // Mode given as "r", "w" or "w+"
  GridFile(store::Backend& backend, const std::string& filename, const std::string& mode,
           const OpenOptions& options = OpenOptions());
  ~GridFile();

  GridFile(const GridFile&) = delete;
  GridFile& operator=(const GridFile&) = delete;


  // ---- READING ----
  // Next byte, or no value at end-of-file
  std::optional<uint8_t> get_byte();
  // Next byte, throws EndOfFile at end-of-file
  uint8_t read_byte_strict();
  // Replays byte on the next read and steps the position back by one
  void unget_byte(uint8_t byte);
  // Everything from the current position to the end
  std::string read();
  // Up to length bytes, fewer at end-of-file
  std::string read(std::size_t length);
  // Bytes up to and including the separator, or to end-of-file; no value at end-of-file
  std::optional<std::string> read_line(const std::string& separator = DEFAULT_LINE_SEPARATOR);
  std::string read_line_strict(const std::string& separator = DEFAULT_LINE_SEPARATOR);
  std::vector<std::string> read_lines(const std::string& separator = DEFAULT_LINE_SEPARATOR);
  ByteRange bytes();
  LineRange lines(const std::string& separator = DEFAULT_LINE_SEPARATOR);


  // ---- WRITING ----
  void put_byte(uint8_t byte);
  // Returns the number of bytes written
  std::size_t write(const uint8_t* data, std::size_t size);
  std::size_t write(const std::string& data);
  // Persists the current chunk
  void flush();


  // ---- POSITIONING ----
  // Moves to an absolute position and returns it
  uint64_t seek(int64_t offset, Whence whence = Whence::Set);
  uint64_t tell() const { return position_; }
  // Read: back to the first byte. Write/Append: discards every chunk and starts over empty
  void rewind();
  // Only valid in Read mode
  bool eof() const;


  // ---- CLOSING ----
  // Write/Append: persists the last chunk and replaces the file record. Idempotent
  void close();
  bool closed() const { return closed_; }


  // ---- GETTERS/SETTERS ----
  const std::string& filename() const { return filename_; }
  const std::string& files_id() const { return files_id_; }
  const std::string& root() const { return root_; }
  Mode mode() const { return mode_; }
  // Length as of the last close
  uint64_t length() const { return length_; }
  uint32_t chunk_size() const { return chunk_size_; }
  const std::string& content_type() const { return content_type_; }
  const std::optional<store::Timestamp>& upload_date() const { return upload_date_; }
  const std::vector<std::string>& aliases() const { return aliases_; }
  const store::Metadata& metadata() const { return metadata_; }
  const std::string& md5() const { return md5_; }
  uint64_t line_number() const { return line_number_; }

  // Only while open for Write, before any byte has been written
  void set_chunk_size(uint32_t size);
  // Write/Append only, take effect on close
  void set_filename(const std::string& filename);
  void set_content_type(const std::string& content_type);
  void set_aliases(const std::vector<std::string>& aliases);
  void set_metadata(const store::Metadata& metadata);

private:
  // ---- PARAMETERS ----
  store::Backend& backend_;
  std::string root_;
  std::string filename_;
  Mode mode_;
  bool closed_ = false;

  // File record attributes
  std::string files_id_;
  std::string content_type_;
  uint64_t length_ = 0;
  uint32_t chunk_size_ = DEFAULT_CHUNK_SIZE;
  std::optional<store::Timestamp> upload_date_;
  std::vector<std::string> aliases_;
  store::Metadata metadata_;
  std::string md5_;
  // A record for this file was found at open
  bool existed_ = false;

  // Cursor state
  std::unique_ptr<Chunk> current_;
  uint64_t position_ = 0;
  // Bytes of data the file currently holds while writing
  uint64_t extent_ = 0;
  std::optional<uint8_t> pushback_;
  uint64_t line_number_ = 0;


  // ---- OPENING ----
  void load_record();
  void open_for_read();
  void open_for_write(const OpenOptions& options);
  void open_for_append(const OpenOptions& options);


  // ---- CHUNK MANAGEMENT ----
  // Makes chunk n current, saving the previous one first when it holds unsaved data
  void switch_to_chunk(uint32_t n);
  // Moves to the successor of a fully read chunk
  void next_read_chunk();
  std::unique_ptr<Chunk> new_chunk(uint32_t n);


  // ---- CLOSING ----
  void finalize_write();
  store::FileRecord to_record() const;


  // ---- VALIDATION ----
  bool writable() const { return mode_ == Mode::Write || mode_ == Mode::Append; }
  void require_open(const char* operation) const;
  void require_readable(const char* operation) const;
  void require_writable(const char* operation) const;
};

} // namespace gridstore::grid

#endif // GRIDSTORE_GRID_FILE_HPP
