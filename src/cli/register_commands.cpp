#include "cli/registry.hpp"

int cmd_sync(int argc, char **argv);
int cmd_status(int, char **);
int cmd_copy(int, char **);

namespace addonsync::cli {

void register_all_commands() {
  register_command({.name = "sync",
                    .run = ::cmd_sync,
                    .summary = "Copy every addon into the project",
                    .usage = "[project-dir]"});
  register_command({.name = "status",
                    .run = ::cmd_status,
                    .summary = "Show files a sync would add or overwrite",
                    .usage = "[project-dir]"});
  register_command({.name = "copy",
                    .run = ::cmd_copy,
                    .summary = "Filtered copy of a single tree",
                    .usage = "<src> <dest> [--include <path>]... [--exclude <path>]..."});
  register_command({.name = "help",
                    .run = run_help,
                    .summary = "List commands, or show one command's arguments",
                    .usage = "[command]"});
}

} // namespace addonsync::cli
