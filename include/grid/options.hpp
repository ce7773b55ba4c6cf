#ifndef GRIDSTORE_GRID_OPTIONS_HPP
#define GRIDSTORE_GRID_OPTIONS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "store/records.hpp"

namespace gridstore::grid {

inline constexpr const char* DEFAULT_ROOT_COLLECTION = "fs";
inline constexpr const char* DEFAULT_CONTENT_TYPE = "text/plain";
inline constexpr uint32_t DEFAULT_CHUNK_SIZE = 256 * 1024;
inline constexpr const char* DEFAULT_LINE_SEPARATOR = "\n";

enum class Mode {
  Read,
  Write,
  Append
};

// Resolves "r", "w" and "w+", throws ConfigError for anything else
Mode parse_mode(const std::string& mode);
const char* to_string(Mode mode);

enum class Whence {
  Set,
  Cur,
  End
};

// Settings recognized when a file is opened.
// Write applies chunk_size, content_type and metadata; Append applies
// metadata only and rejects a chunk_size that differs from the file's; Read
// only uses root.
struct OpenOptions {
  std::string root = DEFAULT_ROOT_COLLECTION;
  std::optional<store::Metadata> metadata;
  std::optional<uint32_t> chunk_size;
  std::optional<std::string> content_type;
};

} // namespace gridstore::grid

#endif // GRIDSTORE_GRID_OPTIONS_HPP
