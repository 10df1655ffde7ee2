#include <exception>
#include <iostream>
#include <string>
#include <vector>
#include "cli/cli.hpp"
#include "logger/logger.hpp"

int main(int argc, char* argv[]) {
  const std::string program_name = argc > 0 ? argv[0] : "backuper";
  const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  const auto options = backuper::cli::parse_command_line(args);
  if (!options.valid) {
    std::cerr << "Error: " << options.error << '\n';
    backuper::cli::print_usage(std::cerr, program_name);
    return backuper::cli::EXIT_USAGE;
  }
  if (options.help) {
    backuper::cli::print_usage(std::cout, program_name);
    return backuper::cli::EXIT_OK;
  }

  try {
    backuper::logging::init_logging(options.debug, options.log_file);
    backuper::cli::CLI cli(std::cout, std::cerr);
    return cli.run(options);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return backuper::cli::EXIT_OPERATION_FAILED;
  }
}
