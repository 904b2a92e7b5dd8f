#include "cli/registry.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  using namespace gitdock::cli;
  register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    print_usage(std::cerr);
    return kExitUsage;
  }
  const std::string cmd = argv[1];
  if (cmd == "help" || cmd == "--help" || cmd == "-h") {
    print_usage(std::cout);
    return kExitOk;
  }

  const auto *info = find_command(cmd);
  if (info == nullptr) {
    std::cerr << "unknown command: " << cmd << "\n";
    print_usage(std::cerr);
    return kExitUsage;
  }
  // argv[0] of the handler is the subcommand name
  return info->fn(argc - 1, argv + 1);
}
