#pragma once
#include <iostream>
#include <string_view>
#include "cli/command.hpp"

namespace addonsync::cli {

// Commands are listed in registration order; registering a name twice replaces it.
void register_command(command cmd);
const command* find_command(std::string_view name);

void print_usage(std::ostream& os = std::cerr);
void print_command_usage(const command& cmd, std::ostream& os = std::cerr);

// `help [command]`
int run_help(int argc, char** argv);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace addonsync::cli
