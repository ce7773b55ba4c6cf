#ifndef GRIDSTORE_CLI_HPP
#define GRIDSTORE_CLI_HPP

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "store/backend.hpp"

namespace gridstore {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(store::Backend& backend, const std::string& root, std::optional<uint32_t> chunk_size,
      std::istream& input = std::cin, std::ostream& output = std::cout);


  // ---- STARTUP ----
  void run();
  // Executes one command line, returns false once the shell should stop
  bool execute(const std::string& line);

private:
  // ---- PARAMETERS ----
  store::Backend& backend_;
  std::string root_;
  std::optional<uint32_t> chunk_size_;
  std::istream& input_;
  std::ostream& output_;
  bool running_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::vector<std::string>& args);
  void handle_list_command();
  void handle_put_command(const std::vector<std::string>& args);
  void handle_get_command(const std::vector<std::string>& args);
  void handle_cat_command(const std::string& name);
  void handle_stat_command(const std::string& name);
  void handle_exists_command(const std::string& name);
  void handle_remove_command(const std::vector<std::string>& names);
  void handle_move_command(const std::string& src, const std::string& dest);
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace gridstore

#endif // GRIDSTORE_CLI_HPP
