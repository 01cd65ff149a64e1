#include "addonsync/project.hpp"
#include "addonsync/reporter.hpp"
#include "addonsync/status.hpp"

#include <filesystem>
#include <iostream>

using addonsync::ChangeKind;

int cmd_status(int argc, char **argv) {
  if (argc > 2) {
    std::cerr << "usage: addonsync status [project-dir]\n";
    return 2;
  }
  const std::filesystem::path root = argc == 2 ? std::filesystem::path{argv[1]}
                                               : std::filesystem::current_path();
  addonsync::StreamReporter reporter;
  try {
    const auto project = addonsync::load_project_spec(root);
    const auto changes = addonsync::compute_addon_status(project, root, reporter);
    if (changes.empty()) {
      std::cout << "up to date\n";
      return 0;
    }
    for (const auto &c : changes) {
      const char code = c.kind == ChangeKind::Added ? 'A' : 'M';
      std::cout << "  " << code << "  " << c.addon << ": " << c.path << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "status: " << e.what() << "\n";
    return 1;
  }
}
