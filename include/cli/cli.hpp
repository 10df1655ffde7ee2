#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "client/client.hpp"
#include "cli/renderer.hpp"

namespace backuper {
namespace cli {

enum class Command {
  none,
  submit_data,
  retrieve_data,
  check_data,
  list_data,
  repair_data
};

struct ProgramOptions {
  Command command{Command::none};
  std::vector<std::string> arguments;
  std::string server_url{network::ClientConfig::DEFAULT_SERVER_URL};
  int timeout_seconds{5};
  bool debug{false};
  bool loose_tls{false};
  std::string log_file;
  bool help{false};
  bool valid{false};
  std::string error;
};

// ---- COMMAND LINE PARSING ----
// args excludes the program name. Options may appear before or after the
// positional arguments of the command.
ProgramOptions parse_command_line(const std::vector<std::string>& args);
void print_usage(std::ostream& out, const std::string& program_name);

// Exit statuses
constexpr int EXIT_OK = 0;
constexpr int EXIT_OPERATION_FAILED = 1;
constexpr int EXIT_USAGE = 2;

class CLI {
public:
  // ---- CONSTRUCTOR ----
  CLI(std::ostream& out, std::ostream& err);


  // ---- STARTUP ----
  // Runs the parsed command once and returns the process exit status
  int run(const ProgramOptions& options);

private:
  // ---- PARAMETERS ----
  std::ostream& err_;
  Renderer renderer_;
  Renderer error_renderer_;


  // ---- COMMAND PROCESSING ----
  void process_command(client::Client& client, const ProgramOptions& options);
  void handle_submit_command(client::Client& client, const std::string& name, const std::string& path);
  void handle_retrieve_command(client::Client& client, const std::string& name, const std::string& path);
  void handle_check_command(client::Client& client, const std::string& name);
  void handle_list_command(client::Client& client);
  void handle_repair_command(client::Client& client, const std::string& name);
  void log_and_display_error(const client::OperationError& error);
};

} // namespace cli
} // namespace backuper
