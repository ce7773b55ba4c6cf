#ifndef GRIDSTORE_GRID_STORE_HPP
#define GRIDSTORE_GRID_STORE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "grid/grid_file.hpp"
#include "grid/options.hpp"
#include "store/backend.hpp"

namespace gridstore::grid {

// One-shot operations over the backing store and scoped cursor access
class GridStore {
public:
  // ---- SCOPED ACCESS ----
  // Opens name, passes the cursor to fn and closes it on every exit path.
  // Returns fn's result; close failures propagate when fn returned normally.
  template <typename Fn>
  static auto open(store::Backend& backend, const std::string& name, Mode mode,
                   const OpenOptions& options, Fn&& fn) {
    GridFile file(backend, name, mode, options);
    using Result = std::invoke_result_t<Fn&, GridFile&>;
    if constexpr (std::is_void_v<Result>) {
      fn(file);
      file.close();
    } else {
      Result result = fn(file);
      file.close();
      return result;
    }
  }

  template <typename Fn>
  static auto open(store::Backend& backend, const std::string& name, Mode mode, Fn&& fn) {
    return open(backend, name, mode, OpenOptions(), std::forward<Fn>(fn));
  }


  // ---- QUERY OPERATIONS ----
  static bool exists(store::Backend& backend, const std::string& name,
                     const std::string& root = DEFAULT_ROOT_COLLECTION);
  // Filenames of every stored file
  static std::vector<std::string> list(store::Backend& backend,
                                       const std::string& root = DEFAULT_ROOT_COLLECTION);
  // Reads length bytes (or everything) starting at offset (or the beginning)
  static std::string read(store::Backend& backend, const std::string& name,
                          std::optional<std::size_t> length = std::nullopt,
                          std::optional<uint64_t> offset = std::nullopt,
                          const std::string& root = DEFAULT_ROOT_COLLECTION);
  static std::vector<std::string> read_lines(store::Backend& backend, const std::string& name,
                                             const std::string& separator = DEFAULT_LINE_SEPARATOR,
                                             const std::string& root = DEFAULT_ROOT_COLLECTION);


  // ---- MUTATIONS ----
  // Removes each named file's chunks and record, unknown names are skipped
  static void remove(store::Backend& backend, const std::vector<std::string>& names,
                     const std::string& root = DEFAULT_ROOT_COLLECTION);
  // Changes the filename field only, returns the number of records renamed
  static std::size_t rename(store::Backend& backend, const std::string& src, const std::string& dest,
                            const std::string& root = DEFAULT_ROOT_COLLECTION);
};

} // namespace gridstore::grid

#endif // GRIDSTORE_GRID_STORE_HPP
