#ifndef GRIDSTORE_GRID_ERROR_HPP
#define GRIDSTORE_GRID_ERROR_HPP

#include <stdexcept>
#include <string>

namespace gridstore::grid {

class GridError : public std::runtime_error {
public:
  explicit GridError(const std::string& message)
    : std::runtime_error(message) {}
};

// Unknown open mode, or an illegal chunk size change
class ConfigError : public GridError {
public:
  explicit ConfigError(const std::string& message)
    : GridError("Configuration error: " + message) {}
};

// Operation not allowed in the cursor's current mode or after close
class StateError : public GridError {
public:
  explicit StateError(const std::string& message)
    : GridError("State error: " + message) {}
};

// Raised only by the strict read operations
class EndOfFile : public GridError {
public:
  explicit EndOfFile(const std::string& message)
    : GridError("End of file: " + message) {}
};

} // namespace gridstore::grid

#endif // GRIDSTORE_GRID_ERROR_HPP
