#include <pgrails/pgrails_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout
      << "Usage: pgrails-analyze <command> [options]\n\n"
      << "Commands:\n"
      << "  indexes     Missing indexes, boolean and WHERE clause columns.\n"
      << "  n-plus-one  Likely N+1 queries in controllers and views.\n"
      << "  config      Connection settings in config/database.yml.\n\n"
      << "Run 'pgrails-analyze <command> --help' for command options.\n";
}
} // namespace

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (arguments.empty() || arguments.front() == "--help" ||
        arguments.front() == "-h") {
      PrintGlobalUsage();
      return arguments.empty() ? 1 : 0;
    }

    const auto suite = pgrails::ParseSuite(arguments.front());
    const std::vector<std::string> command_arguments(arguments.begin() + 1,
                                                     arguments.end());
    return pgrails::RunCommand(suite, command_arguments);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return 1;
  }
}
