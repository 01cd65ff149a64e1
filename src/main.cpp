#include "cli/registry.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  addonsync::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    addonsync::cli::print_usage();
    return 2;
  }
  std::string name = argv[1];
  if (name == "-h" || name == "--help")
    name = "help";

  const auto *cmd = addonsync::cli::find_command(name);
  if (!cmd) {
    std::cerr << "unknown command: " << name << "\n";
    addonsync::cli::print_usage();
    return 2;
  }
  // argv[0] of the handler is the subcommand name
  return cmd->run(argc - 1, argv + 1);
}
