#ifndef GRIDSTORE_GRID_ITERATORS_HPP
#define GRIDSTORE_GRID_ITERATORS_HPP

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace gridstore::grid {

// Forward declaration
class GridFile;

// Single-pass iterators bound to a read cursor's current position. Each
// increment consumes from the cursor; the sequence ends at end-of-file and
// cannot be restarted without seeking or rewinding the cursor.

class ByteIterator {
public:
  using iterator_category = std::input_iterator_tag;
  using value_type = uint8_t;
  using difference_type = std::ptrdiff_t;
  using pointer = const uint8_t*;
  using reference = const uint8_t&;

  // End iterator
  ByteIterator() = default;
  // Reads the first byte from the cursor
  explicit ByteIterator(GridFile& file);

  reference operator*() const { return *current_; }
  pointer operator->() const { return &*current_; }
  ByteIterator& operator++();

  // Iterators compare equal when both are exhausted, or both are live on the same cursor
  bool operator==(const ByteIterator& other) const { return file_ == other.file_; }
  bool operator!=(const ByteIterator& other) const { return !(*this == other); }

private:
  GridFile* file_ = nullptr;
  std::optional<uint8_t> current_;

  void fetch();
};

class LineIterator {
public:
  using iterator_category = std::input_iterator_tag;
  using value_type = std::string;
  using difference_type = std::ptrdiff_t;
  using pointer = const std::string*;
  using reference = const std::string&;

  // End iterator
  LineIterator() = default;
  // Reads the first line from the cursor
  LineIterator(GridFile& file, std::string separator);

  reference operator*() const { return *current_; }
  pointer operator->() const { return &*current_; }
  LineIterator& operator++();

  bool operator==(const LineIterator& other) const { return file_ == other.file_; }
  bool operator!=(const LineIterator& other) const { return !(*this == other); }

private:
  GridFile* file_ = nullptr;
  std::string separator_;
  std::optional<std::string> current_;

  void fetch();
};

class ByteRange {
public:
  explicit ByteRange(GridFile& file) : file_(file) {}
  ByteIterator begin() const { return ByteIterator(file_); }
  ByteIterator end() const { return ByteIterator(); }

private:
  GridFile& file_;
};

class LineRange {
public:
  LineRange(GridFile& file, std::string separator)
    : file_(file), separator_(std::move(separator)) {}
  LineIterator begin() const { return LineIterator(file_, separator_); }
  LineIterator end() const { return LineIterator(); }

private:
  GridFile& file_;
  std::string separator_;
};

} // namespace gridstore::grid

#endif // GRIDSTORE_GRID_ITERATORS_HPP
