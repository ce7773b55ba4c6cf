#include "grid/grid_file.hpp"
#include "store/object_id.hpp"
#include <algorithm>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace gridstore::grid {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

GridFile::GridFile(store::Backend& backend, const std::string& filename, Mode mode,
                   const OpenOptions& options)
  : backend_(backend)
  , root_(options.root)
  , filename_(filename)
  , mode_(mode) {
  BOOST_LOG_TRIVIAL(info) << "GridFile: Opening " << filename_ << " in " << store::files_collection(root_)
                          << " with mode " << to_string(mode_);

  if (options.chunk_size && *options.chunk_size == 0) {
    BOOST_LOG_TRIVIAL(error) << "GridFile: Rejecting chunk size 0 for " << filename_;
    throw ConfigError("chunk size must be at least one byte");
  }

  load_record();

  switch (mode_) {
    case Mode::Read:
      open_for_read();
      break;
    case Mode::Write:
      open_for_write(options);
      break;
    case Mode::Append:
      open_for_append(options);
      break;
  }

  BOOST_LOG_TRIVIAL(debug) << "GridFile: Opened " << filename_ << " (id " << files_id_ << ", length "
                           << length_ << ", chunk size " << chunk_size_ << ")";
}

GridFile::GridFile(store::Backend& backend, const std::string& filename, const std::string& mode,
                   const OpenOptions& options)
  : GridFile(backend, filename, parse_mode(mode), options) {
}

GridFile::~GridFile() {
  if (closed_) {
    return;
  }
  try {
    close();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "GridFile: Failed to close " << filename_ << " on destruction: " << e.what();
  }
}


//==============================================
// OPENING
//==============================================

void GridFile::load_record() {
  auto record = backend_.find_file(root_, filename_);
  if (!record) {
    files_id_ = store::generate_object_id();
    content_type_ = DEFAULT_CONTENT_TYPE;
    chunk_size_ = DEFAULT_CHUNK_SIZE;
    length_ = 0;
    BOOST_LOG_TRIVIAL(debug) << "GridFile: No record for " << filename_ << ", allocated id " << files_id_;
    return;
  }

  if (record->chunk_size == 0) {
    BOOST_LOG_TRIVIAL(error) << "GridFile: Record " << record->id << " has chunk size 0";
    throw store::StoreError("GridFile: Corrupt file record " + record->id + " in " + store::files_collection(root_));
  }

  existed_ = true;
  files_id_ = record->id;
  content_type_ = record->content_type;
  chunk_size_ = record->chunk_size;
  upload_date_ = record->upload_date;
  aliases_ = record->aliases;
  length_ = record->length;
  metadata_ = record->metadata;
  md5_ = record->md5;
}

void GridFile::open_for_read() {
  current_ = Chunk::fetch(backend_, root_, files_id_, 0);
  position_ = 0;
}

void GridFile::open_for_write(const OpenOptions& options) {
  backend_.create_chunk_index(root_);
  backend_.remove_chunks(root_, files_id_);
  current_ = new_chunk(0);
  position_ = 0;
  extent_ = 0;
  length_ = 0;

  if (options.content_type) {
    content_type_ = *options.content_type;
  }
  if (options.chunk_size) {
    set_chunk_size(*options.chunk_size);
  }
  if (options.metadata) {
    metadata_ = *options.metadata;
  }
}

void GridFile::open_for_append(const OpenOptions& options) {
  if (options.chunk_size && *options.chunk_size != chunk_size_) {
    BOOST_LOG_TRIVIAL(error) << "GridFile: Chunk size change requested while appending to " << filename_;
    throw ConfigError("can only change chunk size if open for write and no data written");
  }

  backend_.create_chunk_index(root_);

  // The last chunk holds length mod chunk_size bytes, or none when length is a multiple
  auto last = static_cast<uint32_t>(length_ / chunk_size_);
  current_ = Chunk::fetch(backend_, root_, files_id_, last);
  if (current_->size() != length_ % chunk_size_) {
    BOOST_LOG_TRIVIAL(error) << "GridFile: Chunk " << last << " of " << files_id_ << " holds "
                             << current_->size() << " bytes, expected " << (length_ % chunk_size_);
    throw store::StoreError("GridFile: Chunk sequence of " + files_id_ + " does not match its length");
  }
  current_->set_pos(current_->size());
  position_ = length_;
  extent_ = length_;

  if (options.metadata) {
    metadata_ = *options.metadata;
  }
}


//==============================================
// READING
//==============================================

std::optional<uint8_t> GridFile::get_byte() {
  require_readable("get_byte");

  if (pushback_) {
    uint8_t byte = *pushback_;
    pushback_.reset();
    ++position_;
    return byte;
  }
  if (position_ >= length_) {
    return std::nullopt;
  }
  if (current_->eof()) {
    next_read_chunk();
  }
  ++position_;
  return current_->get_byte();
}

uint8_t GridFile::read_byte_strict() {
  auto byte = get_byte();
  if (!byte) {
    throw EndOfFile("no more bytes in " + filename_);
  }
  return *byte;
}

void GridFile::unget_byte(uint8_t byte) {
  require_readable("unget_byte");

  if (pushback_) {
    throw StateError("only one byte of pushback is supported");
  }
  if (position_ == 0) {
    throw StateError("cannot push back before the start of " + filename_);
  }
  pushback_ = byte;
  --position_;
}

std::string GridFile::read() {
  require_readable("read");
  uint64_t remaining = position_ < length_ ? length_ - position_ : 0;
  return read(static_cast<std::size_t>(remaining));
}

std::string GridFile::read(std::size_t length) {
  require_readable("read");

  std::string buffer;
  if (length == 0) {
    return buffer;
  }

  if (pushback_) {
    buffer.push_back(static_cast<char>(*pushback_));
    pushback_.reset();
    ++position_;
    --length;
  }

  uint64_t available = position_ < length_ ? length_ - position_ : 0;
  auto remaining = static_cast<std::size_t>(std::min<uint64_t>(length, available));
  buffer.reserve(buffer.size() + remaining);

  // Copy chunk by chunk, slicing relative to each chunk's own cursor
  while (remaining > 0) {
    if (current_->eof()) {
      next_read_chunk();
    }
    std::size_t offset = buffer.size();
    buffer.resize(offset + remaining);
    std::size_t copied = current_->read(reinterpret_cast<uint8_t*>(&buffer[offset]), remaining);
    buffer.resize(offset + copied);
    position_ += copied;
    remaining -= copied;
  }
  return buffer;
}

std::optional<std::string> GridFile::read_line(const std::string& separator) {
  require_readable("read_line");
  if (separator.empty()) {
    throw std::invalid_argument("GridFile: Line separator must not be empty");
  }

  auto byte = get_byte();
  if (!byte) {
    return std::nullopt;
  }

  std::string line;
  while (byte) {
    line.push_back(static_cast<char>(*byte));
    if (line.size() >= separator.size() &&
        line.compare(line.size() - separator.size(), separator.size(), separator) == 0) {
      break;
    }
    byte = get_byte();
  }
  ++line_number_;
  return line;
}

std::string GridFile::read_line_strict(const std::string& separator) {
  auto line = read_line(separator);
  if (!line) {
    throw EndOfFile("no more lines in " + filename_);
  }
  return *line;
}

std::vector<std::string> GridFile::read_lines(const std::string& separator) {
  std::vector<std::string> lines;
  while (auto line = read_line(separator)) {
    lines.push_back(std::move(*line));
  }
  return lines;
}

ByteRange GridFile::bytes() {
  require_readable("bytes");
  return ByteRange(*this);
}

LineRange GridFile::lines(const std::string& separator) {
  require_readable("lines");
  return LineRange(*this, separator);
}


//==============================================
// WRITING
//==============================================

void GridFile::put_byte(uint8_t byte) {
  require_writable("put_byte");

  if (current_->pos() >= chunk_size_) {
    switch_to_chunk(current_->number() + 1);
  }
  current_->put_byte(byte);
  ++position_;
  extent_ = std::max(extent_, position_);
}

std::size_t GridFile::write(const uint8_t* data, std::size_t size) {
  require_writable("write");

  std::size_t to_write = size;
  while (to_write > 0) {
    if (current_->pos() >= chunk_size_) {
      switch_to_chunk(current_->number() + 1);
    }
    std::size_t available = chunk_size_ - current_->pos();
    std::size_t step = std::min(to_write, available);
    current_->write(data + (size - to_write), step);
    to_write -= step;
    position_ += step;
    extent_ = std::max(extent_, position_);

    if (current_->pos() >= chunk_size_) {
      current_->save();
    }
  }
  return size - to_write;
}

std::size_t GridFile::write(const std::string& data) {
  return write(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

void GridFile::flush() {
  require_open("flush");
  if (writable() && current_->dirty()) {
    current_->save();
  }
}


//==============================================
// POSITIONING
//==============================================

uint64_t GridFile::seek(int64_t offset, Whence whence) {
  require_open("seek");

  uint64_t end = writable() ? extent_ : length_;
  int64_t base = 0;
  switch (whence) {
    case Whence::Set:
      base = 0;
      break;
    case Whence::Cur:
      base = static_cast<int64_t>(position_);
      break;
    case Whence::End:
      base = static_cast<int64_t>(end);
      break;
  }

  if (offset > 0 && base > std::numeric_limits<int64_t>::max() - offset) {
    BOOST_LOG_TRIVIAL(error) << "GridFile: Seek offset " << offset << " from " << base
                             << " overflows the position in " << filename_;
    throw std::invalid_argument("GridFile: Seek position overflows");
  }
  int64_t target = base + offset;
  if (target < 0) {
    BOOST_LOG_TRIVIAL(error) << "GridFile: Seek to negative position " << target << " in " << filename_;
    throw std::invalid_argument("GridFile: Seek to a negative position");
  }
  auto target_pos = static_cast<uint64_t>(target);
  if (writable() && target_pos > extent_) {
    BOOST_LOG_TRIVIAL(error) << "GridFile: Seek to " << target_pos << " past written data (" << extent_
                             << " bytes) in " << filename_;
    throw std::invalid_argument("GridFile: Seek past the end of written data");
  }

  // Chunk numbers are 32-bit, positions beyond the last addressable chunk are unreachable
  if (target_pos / chunk_size_ > std::numeric_limits<uint32_t>::max()) {
    BOOST_LOG_TRIVIAL(error) << "GridFile: Seek to " << target_pos << " is past the last chunk number in "
                             << filename_;
    throw std::invalid_argument("GridFile: Seek past the last addressable chunk");
  }
  auto target_chunk = static_cast<uint32_t>(target_pos / chunk_size_);
  if (target_chunk != current_->number()) {
    switch_to_chunk(target_chunk);
  }

  pushback_.reset();
  position_ = target_pos;
  current_->set_pos(static_cast<std::size_t>(target_pos % chunk_size_));
  return position_;
}

void GridFile::rewind() {
  require_open("rewind");

  if (writable()) {
    BOOST_LOG_TRIVIAL(debug) << "GridFile: Rewinding " << filename_ << " for write, discarding its chunks";
    backend_.remove_chunks(root_, files_id_);
    current_ = new_chunk(0);
    extent_ = 0;
    length_ = 0;
  } else {
    current_ = Chunk::fetch(backend_, root_, files_id_, 0);
  }

  current_->set_pos(0);
  pushback_.reset();
  position_ = 0;
  line_number_ = 0;
}

bool GridFile::eof() const {
  require_readable("eof");
  return position_ >= length_;
}


//==============================================
// CLOSING
//==============================================

void GridFile::close() {
  if (closed_) {
    return;
  }
  // Marked first so a failed close is not retried by the destructor
  closed_ = true;

  if (writable()) {
    finalize_write();
  }
  pushback_.reset();
  current_.reset();
  BOOST_LOG_TRIVIAL(info) << "GridFile: Closed " << filename_ << " (" << length_ << " bytes)";
}

void GridFile::finalize_write() {
  current_->truncate();
  uint64_t final_length = static_cast<uint64_t>(current_->number()) * chunk_size_ + current_->pos();

  // An empty file still owns its zero-length chunk 0
  if (current_->dirty() || final_length == 0) {
    current_->save();
  }

  // Drop chunks past the final length, left behind after seeking backwards
  if (extent_ > final_length) {
    uint64_t kept = std::max<uint64_t>(1, (final_length + chunk_size_ - 1) / chunk_size_);
    BOOST_LOG_TRIVIAL(debug) << "GridFile: Truncating " << filename_ << " to " << final_length
                             << " bytes, removing chunks from " << kept;
    backend_.remove_chunks(root_, files_id_, static_cast<uint32_t>(kept));
  }

  if (existed_) {
    backend_.remove_file(root_, files_id_);
  }
  if (!upload_date_) {
    upload_date_ = std::chrono::system_clock::now();
  }

  length_ = final_length;
  extent_ = final_length;
  md5_ = backend_.file_md5(root_, files_id_);
  backend_.insert_file(root_, to_record());
  existed_ = true;
}

store::FileRecord GridFile::to_record() const {
  store::FileRecord record;
  record.id = files_id_;
  record.filename = filename_;
  record.content_type = content_type_;
  record.length = length_;
  record.chunk_size = chunk_size_;
  record.upload_date = upload_date_;
  record.aliases = aliases_;
  record.metadata = metadata_;
  record.md5 = md5_;
  return record;
}


//==============================================
// GETTERS/SETTERS
//==============================================

void GridFile::set_chunk_size(uint32_t size) {
  require_open("set_chunk_size");
  if (mode_ != Mode::Write || position_ != 0 || extent_ != 0) {
    BOOST_LOG_TRIVIAL(error) << "GridFile: Illegal chunk size change for " << filename_;
    throw ConfigError("can only change chunk size if open for write and no data written");
  }
  if (size == 0) {
    throw ConfigError("chunk size must be at least one byte");
  }
  chunk_size_ = size;
}

void GridFile::set_filename(const std::string& filename) {
  require_writable("set_filename");
  filename_ = filename;
}

void GridFile::set_content_type(const std::string& content_type) {
  require_writable("set_content_type");
  content_type_ = content_type;
}

void GridFile::set_aliases(const std::vector<std::string>& aliases) {
  require_writable("set_aliases");
  aliases_ = aliases;
}

void GridFile::set_metadata(const store::Metadata& metadata) {
  require_writable("set_metadata");
  metadata_ = metadata;
}


//==============================================
// CHUNK MANAGEMENT
//==============================================

void GridFile::switch_to_chunk(uint32_t n) {
  if (writable()) {
    if (current_->dirty()) {
      current_->save();
    }
    // Chunks inside the written extent live in the store, beyond it they are new
    if (static_cast<uint64_t>(n) * chunk_size_ < extent_) {
      current_ = Chunk::fetch(backend_, root_, files_id_, n);
    } else {
      current_ = new_chunk(n);
    }
  } else {
    current_ = Chunk::fetch(backend_, root_, files_id_, n);
  }
  BOOST_LOG_TRIVIAL(debug) << "GridFile: Switched " << filename_ << " to chunk " << n;
}

void GridFile::next_read_chunk() {
  uint32_t next = current_->number() + 1;
  current_ = Chunk::fetch(backend_, root_, files_id_, next);
  if (current_->eof()) {
    BOOST_LOG_TRIVIAL(error) << "GridFile: Chunk " << next << " of " << files_id_ << " missing before position "
                             << length_;
    throw store::StoreError("GridFile: Missing chunk " + std::to_string(next) + " of " + files_id_);
  }
}

std::unique_ptr<Chunk> GridFile::new_chunk(uint32_t n) {
  return std::make_unique<Chunk>(backend_, root_, files_id_, n);
}


//==============================================
// VALIDATION
//==============================================

void GridFile::require_open(const char* operation) const {
  if (closed_) {
    BOOST_LOG_TRIVIAL(error) << "GridFile: " << operation << " on closed file " << filename_;
    throw StateError(filename_ + " is closed");
  }
}

void GridFile::require_readable(const char* operation) const {
  require_open(operation);
  if (mode_ != Mode::Read) {
    BOOST_LOG_TRIVIAL(error) << "GridFile: " << operation << " on " << filename_ << " opened with mode "
                             << to_string(mode_);
    throw StateError(filename_ + " not opened for read");
  }
}

void GridFile::require_writable(const char* operation) const {
  require_open(operation);
  if (!writable()) {
    BOOST_LOG_TRIVIAL(error) << "GridFile: " << operation << " on " << filename_ << " opened with mode "
                             << to_string(mode_);
    throw StateError(filename_ + " not opened for write");
  }
}

} // namespace gridstore::grid
