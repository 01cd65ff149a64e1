#include "cli/registry.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace addonsync::cli {

namespace {

std::vector<command> &commands() {
  static std::vector<command> list;
  return list;
}

} // namespace

void register_command(command cmd) {
  auto &list = commands();
  const auto it =
      std::ranges::find_if(list, [&](const command &c) { return c.name == cmd.name; });
  if (it != list.end())
    *it = std::move(cmd);
  else
    list.push_back(std::move(cmd));
}

const command *find_command(std::string_view name) {
  const auto &list = commands();
  const auto it = std::ranges::find_if(list, [&](const command &c) { return c.name == name; });
  return it == list.end() ? nullptr : &*it;
}

void print_usage(std::ostream &os) {
  std::size_t width = 0;
  for (const auto &c : commands())
    width = std::max(width, c.name.size());

  os << "usage: addonsync <command> [args]\n\n";
  os << "commands:\n";
  for (const auto &c : commands())
    os << "  " << c.name << std::string(width - c.name.size() + 2, ' ') << c.summary << "\n";
  os << "\nrun `addonsync help <command>` for a command's arguments\n";
}

void print_command_usage(const command &cmd, std::ostream &os) {
  os << "usage: addonsync " << cmd.name;
  if (!cmd.usage.empty())
    os << ' ' << cmd.usage;
  os << "\n\n  " << cmd.summary << "\n";
}

int run_help(int argc, char **argv) {
  if (argc < 2) {
    print_usage(std::cout);
    return 0;
  }
  const auto *cmd = find_command(argv[1]);
  if (!cmd) {
    std::cerr << "help: unknown command: " << argv[1] << "\n";
    return 2;
  }
  print_command_usage(*cmd, std::cout);
  return 0;
}

} // namespace addonsync::cli
