#include "cli/cli.hpp"
#include "grid/options.hpp"
#include "logger/logger.hpp"
#include "store/disk_backend.hpp"
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string dir{"gridstore_data"};
  std::string root{gridstore::grid::DEFAULT_ROOT_COLLECTION};
  std::optional<uint32_t> chunk_size;
  std::string log_file{"gridstore.log"};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-d <dir>] [-r <root>] [-c <bytes>] [-l <log file>]\n"
        << "Optional arguments:\n"
        << "  -d, --dir         Store directory (default: gridstore_data)\n"
        << "  -r, --root        Collection root (default: fs)\n"
        << "  -c, --chunk-size  Chunk size for newly stored files (default: 262144)\n"
        << "  -l, --log-file    Log file (default: gridstore.log)\n"
        << "Example: " << program_name << " -d /var/lib/gridstore -c 65536\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-d", "--dir", "-r", "--root", "-c", "--chunk-size", "-l", "--log-file"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-d" || flag == "--dir") {
      options.dir = value;
    } else if (flag == "-r" || flag == "--root") {
      options.root = value;
    } else if (flag == "-c" || flag == "--chunk-size") {
      try {
        unsigned long size = std::stoul(value);
        if (size == 0 || size > UINT32_MAX) {
          throw std::out_of_range("chunk size");
        }
        options.chunk_size = static_cast<uint32_t>(size);
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid chunk size\n";
        print_usage(argv[0]);
        return options;
      }
    } else if (flag == "-l" || flag == "--log-file") {
      options.log_file = value;
    }
  }

  if (options.dir.empty() || options.root.empty()) {
    std::cerr << "Error: Store directory and root must not be empty\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    gridstore::logging::init_logging(options.log_file, gridstore::logging::severity_level::debug);
    gridstore::store::DiskBackend backend(options.dir);
    gridstore::cli::CLI cli(backend, options.root, options.chunk_size);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start shell: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
