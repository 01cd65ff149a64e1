#include "addonsync/addons.hpp"
#include "addonsync/consts.hpp"
#include "addonsync/project.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct RecordingReporter final : addonsync::Reporter {
  std::vector<std::string> warnings;
  void warn(std::string_view message) override { warnings.emplace_back(message); }
  void info(std::string_view /*message*/) override {}
};

void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

} // namespace

int main() {
  const fs::path base =
      fs::temp_directory_path() / ("addonsync_addons_" + std::to_string(std::random_device{}()));
  const fs::path deps = base / "deps";
  const fs::path project = base / "project";
  fs::create_directories(project);

  try {
    // Two addon checkouts plus a newer revision of the first one
    write_file(deps / "addon1/addons/test-addon1/plugin.cfg", "addon1 v1\n");
    write_file(deps / "addon1/README.md", "addon1 readme\n");
    write_file(deps / "addon1v2/addons/test-addon1/plugin.cfg", "addon1 v2\n");
    write_file(deps / "addon1v2/addons/test-addon1/new.gd", "extends Node\n");
    write_file(deps / "addon2/addons/test-addon2/plugin.cfg", "addon2\n");
    write_file(deps / "addon2/file-not-part-of-addon.txt", "nope\n");

    write_file(project / addonsync::consts::kProjectFile,
               "[godot]\n"
               "version = \"4.6.0-stable\"\n"
               "\n"
               "[addon.test-addon1]\n"
               "path = \"" + (deps / "addon1").generic_string() + "\"\n"
               "include = [\"addons\"]\n"
               "\n"
               "[addon.test-addon2]\n"
               "path = \"../deps/addon2\"\n"
               "exclude = [\"file-not-part-of-addon.txt\"]\n"
               "\n"
               "[addon.test-addon1v2]\n"
               "path = \"" + (deps / "addon1v2").generic_string() + "\"\n"
               "include = [\"addons\"]\n"
               "\n"
               "[addon.missing]\n"
               "path = \"../deps/not-there\"\n");

    const auto spec = addonsync::load_project_spec(project);
    RecordingReporter reporter;
    const auto summary = addonsync::sync_addons(spec, project, reporter);

    if (!fs::exists(project / "addons/test-addon1/plugin.cfg") ||
        !fs::exists(project / "addons/test-addon2/plugin.cfg")) {
      std::cerr << "addon plugin.cfg files missing\n";
      return 1;
    }
    if (fs::exists(project / "file-not-part-of-addon.txt") || fs::exists(project / "README.md")) {
      std::cerr << "filtered files were copied\n";
      return 1;
    }
    // name order: test-addon1 before test-addon1v2, so v2 wins
    if (!fs::exists(project / "addons/test-addon1/new.gd")) {
      std::cerr << "second revision not applied\n";
      return 1;
    }

    // Scenario C: the missing addon is skipped with a warning, nothing created for it
    if (summary.skipped != std::vector<std::string>{"missing"}) {
      std::cerr << "expected exactly 'missing' to be skipped\n";
      return 1;
    }
    if (summary.synced != std::vector<std::string>{"test-addon1", "test-addon1v2", "test-addon2"}) {
      std::cerr << "unexpected synced list\n";
      return 1;
    }
    if (reporter.warnings.size() != 1 ||
        reporter.warnings[0].find("missing") == std::string::npos) {
      std::cerr << "expected one warning naming the missing addon\n";
      return 1;
    }
    if (fs::exists(project / "not-there") || fs::exists(deps / "not-there")) {
      std::cerr << "missing addon produced entries\n";
      return 1;
    }

    // The first fatal error propagates and later addons are not attempted
    {
      addonsync::ProjectSpec broken;
      broken.project_path = "out";
      broken.addons["a-blocked"].path = (deps / "addon2").string();
      broken.addons["b-later"].path = (deps / "addon1").string();
      // a file where the destination directory should go
      write_file(project / "out/addons", "in the way\n");

      bool threw = false;
      try {
        addonsync::sync_addons(broken, project, reporter);
      } catch (const addonsync::SyncError &e) {
        threw = e.operation() == addonsync::consts::kOpCreateDir;
      }
      if (!threw) {
        std::cerr << "expected create-dir SyncError\n";
        return 1;
      }
      if (fs::exists(project / "out/README.md")) {
        std::cerr << "addon after the failure was synced\n";
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(base);
    return 1;
  }

  fs::remove_all(base);
  std::cout << "OK\n";
  return 0;
}
