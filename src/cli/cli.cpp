#include "cli/cli.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <unordered_map>
#include <boost/asio/io_context.hpp>
#include <boost/log/trivial.hpp>

namespace backuper {
namespace cli {

namespace {

struct CommandEntry {
  Command command;
  std::size_t arity;
};

const std::unordered_map<std::string, CommandEntry>& command_table() {
  static const std::unordered_map<std::string, CommandEntry> table = {
    {"submit-data",   {Command::submit_data, 2}},
    {"retrieve-data", {Command::retrieve_data, 2}},
    {"check-data",    {Command::check_data, 1}},
    {"list-data",     {Command::list_data, 0}},
    {"repair-data",   {Command::repair_data, 1}}
  };
  return table;
}

ProgramOptions invalid(ProgramOptions options, const std::string& error) {
  options.valid = false;
  options.error = error;
  return options;
}

bool parse_timeout(const std::string& value, int& seconds) {
  if (value.empty() || value.size() > 9 ||
      !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return false;
  }
  seconds = std::stoi(value);
  return seconds > 0;
}

} // namespace


//==============================================
// COMMAND LINE PARSING
//==============================================

ProgramOptions parse_command_line(const std::vector<std::string>& args) {
  ProgramOptions options;

  if (args.empty()) {
    return invalid(options, "Missing command");
  }

  if (args[0] == "-h" || args[0] == "--help") {
    options.help = true;
    options.valid = true;
    return options;
  }

  const auto entry = command_table().find(args[0]);
  if (entry == command_table().end()) {
    return invalid(options, "Unknown command: " + args[0]);
  }
  options.command = entry->second.command;

  bool options_ended = false;
  for (std::size_t i = 1; i < args.size(); ++i) {
    std::string flag = args[i];

    if (options_ended || flag.size() < 2 || flag[0] != '-') {
      options.arguments.push_back(flag);
      continue;
    }
    if (flag == "--") {
      options_ended = true;
      continue;
    }

    // Long options also accept --name=value
    std::string value;
    bool inline_value = false;
    const std::size_t equals = flag.find('=');
    if (flag.compare(0, 2, "--") == 0 && equals != std::string::npos) {
      value = flag.substr(equals + 1);
      flag = flag.substr(0, equals);
      inline_value = true;
    }

    auto take_value = [&](std::string& out) -> bool {
      if (inline_value) {
        out = value;
        return true;
      }
      if (i + 1 >= args.size()) {
        return false;
      }
      out = args[++i];
      return true;
    };

    if (flag == "-s" || flag == "--server-url") {
      if (!take_value(options.server_url) || options.server_url.empty()) {
        return invalid(options, "Option " + flag + " requires a server address");
      }
    } else if (flag == "-t" || flag == "--timeout") {
      std::string timeout;
      if (!take_value(timeout) || !parse_timeout(timeout, options.timeout_seconds)) {
        return invalid(options, "Option " + flag + " requires a positive number of seconds");
      }
    } else if (flag == "--log-file") {
      if (!take_value(options.log_file) || options.log_file.empty()) {
        return invalid(options, "Option --log-file requires a path");
      }
    } else if (inline_value) {
      return invalid(options, "Option " + flag + " does not take a value");
    } else if (flag == "--debug") {
      options.debug = true;
    } else if (flag == "--no-debug") {
      options.debug = false;
    } else if (flag == "-k" || flag == "--loose-tls") {
      options.loose_tls = true;
    } else if (flag == "-h" || flag == "--help") {
      options.help = true;
    } else {
      return invalid(options, "Unknown argument: " + flag);
    }
  }

  if (options.help) {
    options.valid = true;
    return options;
  }

  if (options.arguments.size() != entry->second.arity) {
    return invalid(options, args[0] + " expects " + std::to_string(entry->second.arity) +
                            " argument(s), got " + std::to_string(options.arguments.size()));
  }

  options.valid = true;
  return options;
}

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " <command> [options] [arguments]\n"
      << "Commands:\n"
      << "  submit-data <name> <path>      Submit data to archive\n"
      << "  retrieve-data <name> <dest>    Retrieve data by file name\n"
      << "  check-data <name>              Check data integrity\n"
      << "  list-data                      List data\n"
      << "  repair-data <name>             Repair damaged data\n"
      << "Options:\n"
      << "  -s, --server-url <url>   Backuper server URL (default "
      << network::ClientConfig::DEFAULT_SERVER_URL << ")\n"
      << "  -t, --timeout <seconds>  Seconds before timeout (default 5)\n"
      << "  --debug / --no-debug     Enable debug logging\n"
      << "  -k, --loose-tls          Disable strict TLS certificate verification\n"
      << "  --log-file <path>        Also write the log to <path>\n"
      << "  -h, --help               Display this help message\n"
      << "Example: " << program_name << " submit-data notes.txt ./notes.txt -s https://backup.local:44987\n";
}


//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(std::ostream& out, std::ostream& err)
  : err_(err)
  , renderer_(out)
  , error_renderer_(err) {
}


//==============================================
// STARTUP
//==============================================

int CLI::run(const ProgramOptions& options) {
  std::unique_ptr<network::ClientConfig> config;
  try {
    config = std::make_unique<network::ClientConfig>(
      options.server_url, std::chrono::seconds(options.timeout_seconds), !options.loose_tls);
  } catch (const std::invalid_argument& e) {
    BOOST_LOG_TRIVIAL(debug) << "CLI: Invalid configuration: " << e.what();
    err_ << "Error: " << e.what() << std::endl;
    return EXIT_USAGE;
  }

  // The only runtime the client's exchanges run on
  boost::asio::io_context io_context;
  client::Client client(io_context, *config);

  try {
    process_command(client, options);
  } catch (const client::OperationError& e) {
    log_and_display_error(e);
    return EXIT_OPERATION_FAILED;
  }
  return EXIT_OK;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(client::Client& client, const ProgramOptions& options) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command with " << options.arguments.size() << " argument(s)";

  const auto& args = options.arguments;
  switch (options.command) {
    case Command::submit_data:
      handle_submit_command(client, args.at(0), args.at(1));
      break;
    case Command::retrieve_data:
      handle_retrieve_command(client, args.at(0), args.at(1));
      break;
    case Command::check_data:
      handle_check_command(client, args.at(0));
      break;
    case Command::list_data:
      handle_list_command(client);
      break;
    case Command::repair_data:
      handle_repair_command(client, args.at(0));
      break;
    case Command::none:
      throw std::logic_error("CLI: No command to process");
  }
}

void CLI::handle_submit_command(client::Client& client, const std::string& name, const std::string& path) {
  renderer_.render(client.submit(name, path));
}

void CLI::handle_retrieve_command(client::Client& client, const std::string& name, const std::string& path) {
  client.retrieve(name, path);
  renderer_.render_retrieved(name, path);
}

void CLI::handle_check_command(client::Client& client, const std::string& name) {
  renderer_.render(client.check(name));
}

void CLI::handle_list_command(client::Client& client) {
  renderer_.render(client.list());
}

void CLI::handle_repair_command(client::Client& client, const std::string& name) {
  renderer_.render(client.repair(name));
}

void CLI::log_and_display_error(const client::OperationError& error) {
  // The rendered message is what the user sees, the log only keeps the details
  BOOST_LOG_TRIVIAL(debug) << "CLI: Operation failed (" << client::error_kind_to_string(error.kind())
                           << ", status " << error.status() << "): " << error.what();
  error_renderer_.render_error(error);
}

} // namespace cli
} // namespace backuper
