#include <tabledep/cli_exit_codes.h>
#include <tabledep/scan_command.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout
      << "Usage: tabledep-scan <command> [options]\n\n"
      << "Commands:\n"
      << "  scan       Find tables that depend on a target table (default if "
         "no command is given).\n"
      << "  scanners   List the registered scanners in run order.\n\n"
      << "Run 'tabledep-scan scan --help' for scan options.\n";
}
}

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintGlobalUsage();
      return 0;
    }

    std::string command = "scan";
    std::size_t first_argument_index = 0;
    if (!arguments.empty() && arguments.front().rfind('-', 0) != 0) {
      command = arguments.front();
      first_argument_index = 1;
    }
    const std::vector<std::string> command_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());

    if (command == "scan") {
      return tabledep::RunScan(command_arguments);
    }
    if (command == "scanners") {
      return tabledep::RunListScanners(command_arguments);
    }

    throw std::invalid_argument("Unknown command: " + command);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return tabledep::kExitError;
  }
}
