#include "addonsync/filter.hpp"
#include "addonsync/reporter.hpp"
#include "addonsync/sync.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string_view>
#include <vector>

static int copy_usage() {
  std::cerr << "usage: addonsync copy <src> <dest> [--include <path>]... [--exclude <path>]...\n";
  return 2;
}

int cmd_copy(int argc, char **argv) {
  std::vector<std::filesystem::path> positional;
  std::optional<addonsync::PathList> includes;
  std::optional<addonsync::PathList> excludes;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--include" || arg == "--exclude") {
      if (i + 1 >= argc)
        return copy_usage();
      auto &rules = arg == "--include" ? includes : excludes;
      if (!rules)
        rules.emplace();
      rules->emplace_back(argv[++i]);
    } else if (arg.starts_with("--")) {
      std::cerr << "copy: unknown option: " << arg << "\n";
      return copy_usage();
    } else {
      positional.emplace_back(arg);
    }
  }
  if (positional.size() != 2)
    return copy_usage();

  addonsync::StreamReporter reporter;
  try {
    const auto stats =
        addonsync::sync_tree(positional[0], positional[1], includes, excludes, reporter);
    std::cout << stats.files_copied << " file(s) copied, " << stats.dirs << " dir(s)";
    if (stats.skipped)
      std::cout << ", " << stats.skipped << " entries skipped";
    std::cout << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "copy: " << e.what() << "\n";
    return 1;
  }
}
