#include "grid/options.hpp"
#include "grid/grid_error.hpp"
#include <boost/log/trivial.hpp>

namespace gridstore::grid {

Mode parse_mode(const std::string& mode) {
  if (mode == "r") {
    return Mode::Read;
  }
  if (mode == "w") {
    return Mode::Write;
  }
  if (mode == "w+") {
    return Mode::Append;
  }
  BOOST_LOG_TRIVIAL(error) << "Options: Illegal mode: " << mode;
  throw ConfigError("illegal mode " + mode);
}

const char* to_string(Mode mode) {
  switch (mode) {
    case Mode::Read:   return "r";
    case Mode::Write:  return "w";
    case Mode::Append: return "w+";
    default:           return "unknown";
  }
}

} // namespace gridstore::grid
