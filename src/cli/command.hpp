#pragma once
#include <string>

namespace addonsync::cli {

// argv[0] is the subcommand name
using command_fn = int (*)(int argc, char **argv);

struct command {
  std::string name;
  command_fn run;
  std::string summary; // one line for the command list
  std::string usage;   // argument synopsis, without the program name
};

} // namespace addonsync::cli
