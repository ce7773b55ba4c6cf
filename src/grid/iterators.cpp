#include "grid/iterators.hpp"
#include "grid/grid_file.hpp"
#include <utility>

namespace gridstore::grid {

//==============================================
// BYTE ITERATION
//==============================================

ByteIterator::ByteIterator(GridFile& file) : file_(&file) {
  fetch();
}

ByteIterator& ByteIterator::operator++() {
  fetch();
  return *this;
}

void ByteIterator::fetch() {
  current_ = file_->get_byte();
  if (!current_) {
    file_ = nullptr;
  }
}


//==============================================
// LINE ITERATION
//==============================================

LineIterator::LineIterator(GridFile& file, std::string separator)
  : file_(&file)
  , separator_(std::move(separator)) {
  fetch();
}

LineIterator& LineIterator::operator++() {
  fetch();
  return *this;
}

void LineIterator::fetch() {
  current_ = file_->read_line(separator_);
  if (!current_) {
    file_ = nullptr;
  }
}

} // namespace gridstore::grid
