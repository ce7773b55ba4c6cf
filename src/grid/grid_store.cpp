#include "grid/grid_store.hpp"
#include <boost/log/trivial.hpp>

namespace gridstore::grid {

//==============================================
// QUERY OPERATIONS
//==============================================

bool GridStore::exists(store::Backend& backend, const std::string& name, const std::string& root) {
  bool found = backend.find_file(root, name).has_value();
  BOOST_LOG_TRIVIAL(debug) << "GridStore: " << name << (found ? " exists" : " not found")
                           << " in " << store::files_collection(root);
  return found;
}

std::vector<std::string> GridStore::list(store::Backend& backend, const std::string& root) {
  std::vector<std::string> names;
  for (const auto& record : backend.find_files(root)) {
    names.push_back(record.filename);
  }
  return names;
}

std::string GridStore::read(store::Backend& backend, const std::string& name,
                            std::optional<std::size_t> length, std::optional<uint64_t> offset,
                            const std::string& root) {
  OpenOptions options;
  options.root = root;
  return open(backend, name, Mode::Read, options, [&](GridFile& file) {
    if (offset) {
      file.seek(static_cast<int64_t>(*offset));
    }
    return length ? file.read(*length) : file.read();
  });
}

std::vector<std::string> GridStore::read_lines(store::Backend& backend, const std::string& name,
                                               const std::string& separator, const std::string& root) {
  OpenOptions options;
  options.root = root;
  return open(backend, name, Mode::Read, options, [&](GridFile& file) {
    return file.read_lines(separator);
  });
}


//==============================================
// MUTATIONS
//==============================================

void GridStore::remove(store::Backend& backend, const std::vector<std::string>& names, const std::string& root) {
  for (const auto& name : names) {
    auto record = backend.find_file(root, name);
    if (!record) {
      BOOST_LOG_TRIVIAL(debug) << "GridStore: Nothing to remove for " << name;
      continue;
    }
    backend.remove_chunks(root, record->id);
    backend.remove_file(root, record->id);
    BOOST_LOG_TRIVIAL(info) << "GridStore: Removed " << name << " (id " << record->id << ")";
  }
}

std::size_t GridStore::rename(store::Backend& backend, const std::string& src, const std::string& dest,
                              const std::string& root) {
  std::size_t renamed = backend.rename_file(root, src, dest);
  BOOST_LOG_TRIVIAL(info) << "GridStore: Renamed " << src << " to " << dest << " (" << renamed << " records)";
  return renamed;
}

} // namespace gridstore::grid
