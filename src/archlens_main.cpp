#include <archlens/archlens_cli.h>
#include <archlens/cli_exit_codes.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout
      << "Usage: archlens <command> [options]\n\n"
      << "Commands:\n"
      << "  analyze   Analyze compiled-unit metadata (default if no command "
         "is given).\n"
      << "  rules     List the registered architectural rules.\n\n"
      << "Run 'archlens analyze --help' for analysis options.\n";
}
} // namespace

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintGlobalUsage();
      return archlens::kExitClean;
    }

    std::string command = "analyze";
    std::size_t first_argument_index = 0;
    if (!arguments.empty() && arguments.front().rfind('-', 0) != 0) {
      command = arguments.front();
      first_argument_index = 1;
    }
    const std::vector<std::string> command_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());

    if (command == "analyze") {
      return archlens::RunAnalyze(command_arguments);
    }
    if (command == "rules") {
      return archlens::RunListRules(command_arguments);
    }

    throw std::invalid_argument("Unknown command: " + command);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return archlens::kExitError;
  }
}
