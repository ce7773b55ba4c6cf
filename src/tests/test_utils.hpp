#ifndef GRIDSTORE_TEST_UTILS_HPP
#define GRIDSTORE_TEST_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include "grid/grid_file.hpp"
#include "logger/logger.hpp"
#include "store/backend.hpp"

namespace gridstore::test {

// Keep test output readable, only warnings and errors reach the console
inline void init_test_logging() {
  logging::init_console_logging(logging::severity_level::warning);
}

// Deterministic binary payload covering every byte value
inline std::string random_data(std::size_t size, unsigned seed = 42) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dis(0, 255);
  std::string result(size, '\0');
  for (std::size_t i = 0; i < size; ++i) {
    result[i] = static_cast<char>(dis(gen));
  }
  return result;
}

inline void write_file(store::Backend& backend, const std::string& name, const std::string& data,
                       uint32_t chunk_size, const std::string& root = grid::DEFAULT_ROOT_COLLECTION) {
  grid::OpenOptions options;
  options.root = root;
  options.chunk_size = chunk_size;
  grid::GridFile file(backend, name, grid::Mode::Write, options);
  file.write(data);
  file.close();
}

inline std::string read_file(store::Backend& backend, const std::string& name,
                             const std::string& root = grid::DEFAULT_ROOT_COLLECTION) {
  grid::OpenOptions options;
  options.root = root;
  grid::GridFile file(backend, name, grid::Mode::Read, options);
  std::string data = file.read();
  file.close();
  return data;
}

inline std::filesystem::path make_temp_dir(const std::string& prefix) {
  auto dir = std::filesystem::temp_directory_path() /
    (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
  std::filesystem::create_directories(dir);
  return dir;
}

} // namespace gridstore::test

#endif // GRIDSTORE_TEST_UTILS_HPP
