#include "addonsync/addons.hpp"
#include "addonsync/project.hpp"
#include "addonsync/reporter.hpp"

#include <filesystem>
#include <iostream>

int cmd_sync(int argc, char **argv) {
  if (argc > 2) {
    std::cerr << "usage: addonsync sync [project-dir]\n";
    return 2;
  }
  const std::filesystem::path root = argc == 2 ? std::filesystem::path{argv[1]}
                                               : std::filesystem::current_path();
  addonsync::StreamReporter reporter;
  try {
    const auto project = addonsync::load_project_spec(root);
    const auto summary = addonsync::sync_addons(project, root, reporter);
    for (const auto &name : summary.synced)
      std::cout << "synced " << name << "\n";
    std::cout << summary.synced.size() << " addon(s) synced, " << summary.skipped.size()
              << " skipped, " << summary.totals.files_copied << " file(s) copied\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "sync: " << e.what() << "\n";
    return 1;
  }
}
