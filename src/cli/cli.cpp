#include "cli/cli.hpp"
#include "grid/grid_store.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace gridstore {
namespace cli {

namespace {
constexpr std::size_t COPY_BUFFER_SIZE = 64 * 1024;

std::string format_timestamp(const std::optional<store::Timestamp>& timestamp) {
  if (!timestamp) {
    return "-";
  }
  std::time_t time = std::chrono::system_clock::to_time_t(*timestamp);
  std::tm utc{};
  gmtime_r(&time, &utc);
  std::ostringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%d %H:%M:%S UTC");
  return ss.str();
}
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::Backend& backend, const std::string& root, std::optional<uint32_t> chunk_size,
         std::istream& input, std::ostream& output)
  : backend_(backend)
  , root_(root)
  , chunk_size_(chunk_size)
  , input_(input)
  , output_(output)
  , running_(false) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized for root " << root_;
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "GridStore> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << "GridStore> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  std::vector<std::string> args;
  std::string arg;
  while (iss >> arg) {
    args.push_back(arg);
  }

  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  try {
    if (command == "help" && args.empty()) {
      handle_help_command();
    }
    else if (command == "ls" && args.empty()) {
      handle_list_command();
    }
    else if (command == "put" && (args.size() == 1 || args.size() == 2)) {
      handle_put_command(args);
    }
    else if (command == "get" && (args.size() == 1 || args.size() == 2)) {
      handle_get_command(args);
    }
    else if (command == "cat" && args.size() == 1) {
      handle_cat_command(args[0]);
    }
    else if (command == "stat" && args.size() == 1) {
      handle_stat_command(args[0]);
    }
    else if (command == "exists" && args.size() == 1) {
      handle_exists_command(args[0]);
    }
    else if (command == "rm" && !args.empty()) {
      handle_remove_command(args);
    }
    else if (command == "mv" && args.size() == 2) {
      handle_move_command(args[0], args[1]);
    }
    else {
      output_ << "Unknown command or invalid arguments, type 'help' for usage" << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error executing " + command, e.what());
  }
}

void CLI::handle_list_command() {
  for (const auto& name : grid::GridStore::list(backend_, root_)) {
    output_ << "  " << name << std::endl;
  }
}

void CLI::handle_put_command(const std::vector<std::string>& args) {
  const std::string& local = args[0];
  const std::string& name = args.size() == 2 ? args[1] : args[0];

  std::ifstream file(local, std::ios::binary);
  if (!file) {
    output_ << "Error opening file: " << local << std::endl;
    return;
  }

  grid::OpenOptions options;
  options.root = root_;
  options.chunk_size = chunk_size_;

  bool read_failed = false;
  uint64_t length = grid::GridStore::open(backend_, name, grid::Mode::Write, options, [&](grid::GridFile& out) {
    std::vector<char> buffer(COPY_BUFFER_SIZE);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
      out.write(reinterpret_cast<const uint8_t*>(buffer.data()), static_cast<std::size_t>(file.gcount()));
    }
    read_failed = file.bad();
    return out.tell();
  });

  // A local read error leaves a truncated copy behind, drop it
  if (read_failed) {
    grid::GridStore::remove(backend_, {name}, root_);
    log_and_display_error("Error reading file", local);
    return;
  }

  output_ << "Stored " << local << " as " << name << " (" << length << " bytes)" << std::endl;
}

void CLI::handle_get_command(const std::vector<std::string>& args) {
  const std::string& name = args[0];
  const std::string& local = args.size() == 2 ? args[1] : args[0];

  if (!grid::GridStore::exists(backend_, name, root_)) {
    output_ << "No such file: " << name << std::endl;
    return;
  }

  std::ofstream file(local, std::ios::binary | std::ios::trunc);
  if (!file) {
    output_ << "Error creating file: " << local << std::endl;
    return;
  }

  grid::OpenOptions options;
  options.root = root_;
  grid::GridStore::open(backend_, name, grid::Mode::Read, options, [&](grid::GridFile& in) {
    while (!in.eof()) {
      std::string block = in.read(COPY_BUFFER_SIZE);
      file.write(block.data(), static_cast<std::streamsize>(block.size()));
    }
  });

  if (!file) {
    output_ << "Error writing file: " << local << std::endl;
    return;
  }
  output_ << "Retrieved " << name << " into " << local << std::endl;
}

void CLI::handle_cat_command(const std::string& name) {
  if (!grid::GridStore::exists(backend_, name, root_)) {
    output_ << "No such file: " << name << std::endl;
    return;
  }
  output_ << grid::GridStore::read(backend_, name, std::nullopt, std::nullopt, root_) << std::endl;
}

void CLI::handle_stat_command(const std::string& name) {
  if (!grid::GridStore::exists(backend_, name, root_)) {
    output_ << "No such file: " << name << std::endl;
    return;
  }

  grid::OpenOptions options;
  options.root = root_;
  grid::GridStore::open(backend_, name, grid::Mode::Read, options, [&](grid::GridFile& file) {
    output_ << "  filename:     " << file.filename() << std::endl;
    output_ << "  id:           " << file.files_id() << std::endl;
    output_ << "  content type: " << file.content_type() << std::endl;
    output_ << "  length:       " << file.length() << std::endl;
    output_ << "  chunk size:   " << file.chunk_size() << std::endl;
    output_ << "  uploaded:     " << format_timestamp(file.upload_date()) << std::endl;
    output_ << "  md5:          " << file.md5() << std::endl;
    for (const auto& [key, value] : file.metadata()) {
      output_ << "  meta " << key << ": " << value << std::endl;
    }
  });
}

void CLI::handle_exists_command(const std::string& name) {
  output_ << (grid::GridStore::exists(backend_, name, root_) ? "yes" : "no") << std::endl;
}

void CLI::handle_remove_command(const std::vector<std::string>& names) {
  grid::GridStore::remove(backend_, names, root_);
  output_ << "Removed " << names.size() << (names.size() == 1 ? " file" : " files") << std::endl;
}

void CLI::handle_move_command(const std::string& src, const std::string& dest) {
  std::size_t renamed = grid::GridStore::rename(backend_, src, dest, root_);
  if (renamed == 0) {
    output_ << "No such file: " << src << std::endl;
    return;
  }
  output_ << "Renamed " << src << " to " << dest << std::endl;
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                 Display this help message" << std::endl;
  output_ << "  ls                   List stored files" << std::endl;
  output_ << "  put <local> [name]   Store local file <local> as <name>" << std::endl;
  output_ << "  get <name> [local]   Copy stored file <name> to <local>" << std::endl;
  output_ << "  cat <name>           Print the contents of <name>" << std::endl;
  output_ << "  stat <name>          Show the file record of <name>" << std::endl;
  output_ << "  exists <name>        Check whether <name> is stored" << std::endl;
  output_ << "  rm <name>...         Remove stored files" << std::endl;
  output_ << "  mv <src> <dest>      Rename a stored file" << std::endl;
  output_ << "  quit                 Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace gridstore
