#include "addonsync/consts.hpp"
#include "addonsync/reporter.hpp"
#include "addonsync/sync.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <random>
#include <string>

namespace fs = std::filesystem;
using addonsync::PathList;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

// relative path -> contents ("<dir>" for directories)
static std::map<std::string, std::string> snapshot(const fs::path &root) {
  std::map<std::string, std::string> m;
  for (const auto &e : fs::recursive_directory_iterator(root)) {
    const auto rel = fs::relative(e.path(), root).generic_string();
    m[rel] = e.is_directory() ? "<dir>" : slurp(e.path());
  }
  return m;
}

struct CountingReporter final : addonsync::Reporter {
  int warnings = 0;
  void warn(std::string_view /*message*/) override { ++warnings; }
  void info(std::string_view /*message*/) override {}
};

static fs::path fresh_dir(const fs::path &base, const std::string &name) {
  const auto p = base / name;
  fs::create_directories(p);
  return p;
}

int main() {
  const fs::path base =
      fs::temp_directory_path() / ("addonsync_sync_tree_" + std::to_string(std::random_device{}()));
  fs::create_directories(base);
  addonsync::NullReporter quiet;

  try {
    // Scenario A: include = ["addons"]
    {
      const auto src = fresh_dir(base, "a_src");
      const auto dst = base / "a_dst";
      write_file(src / "addons/foo/plugin.cfg", "[plugin]\nname=\"foo\"\n");
      write_file(src / "notes.txt", "not part of the addon\n");

      const auto stats = addonsync::sync_tree(src, dst, PathList{"addons"}, std::nullopt, quiet);
      if (slurp(dst / "addons/foo/plugin.cfg") != "[plugin]\nname=\"foo\"\n") {
        std::cerr << "A: plugin.cfg missing or wrong\n";
        return 1;
      }
      if (fs::exists(dst / "notes.txt")) {
        std::cerr << "A: notes.txt should not be copied\n";
        return 1;
      }
      if (stats.files_copied != 1 || stats.skipped != 0) {
        std::cerr << "A: unexpected stats " << stats.files_copied << "/" << stats.skipped << "\n";
        return 1;
      }
    }

    // Scenario B: exclude = ["secret.txt"]
    {
      const auto src = fresh_dir(base, "b_src");
      const auto dst = base / "b_dst";
      write_file(src / "addons/bar/plugin.cfg", "bar\n");
      write_file(src / "secret.txt", "hunter2\n");
      write_file(src / "secret.txt.d/keep.txt", "kept\n");

      addonsync::sync_tree(src, dst, std::nullopt, PathList{"secret.txt"}, quiet);
      if (!fs::exists(dst / "addons/bar/plugin.cfg")) {
        std::cerr << "B: plugin.cfg missing\n";
        return 1;
      }
      if (fs::exists(dst / "secret.txt")) {
        std::cerr << "B: secret.txt should be excluded\n";
        return 1;
      }
      if (!fs::exists(dst / "secret.txt.d/keep.txt")) {
        std::cerr << "B: exclude must match whole components only\n";
        return 1;
      }
    }

    // Deep include: ancestors are created, siblings and look-alikes are not
    {
      const auto src = fresh_dir(base, "deep_src");
      const auto dst = base / "deep_dst";
      write_file(src / "addons/foo/plugin.cfg", "foo\n");
      write_file(src / "addons/foo/icons/icon.svg", "<svg/>\n");
      write_file(src / "addons/other/plugin.cfg", "other\n");
      write_file(src / "addons2/plugin.cfg", "lookalike\n");
      write_file(src / "addons/foo/tests/test_foo.gd", "extends Node\n");

      addonsync::sync_tree(src, dst, PathList{"addons/foo"}, PathList{"addons/foo/tests"}, quiet);
      if (!fs::exists(dst / "addons/foo/icons/icon.svg")) {
        std::cerr << "deep: nested file under include missing\n";
        return 1;
      }
      if (fs::exists(dst / "addons/other") || fs::exists(dst / "addons2")) {
        std::cerr << "deep: sibling directories should not be created\n";
        return 1;
      }
      if (fs::exists(dst / "addons/foo/tests")) {
        std::cerr << "deep: excluded subtree inside include was copied\n";
        return 1;
      }
    }

    // Scenario D + non-deletion: existing destination content is overwritten, strays survive
    {
      const auto src = fresh_dir(base, "d_src");
      const auto dst = fresh_dir(base, "d_dst");
      write_file(src / "addons/foo/plugin.cfg", "new contents\n");
      write_file(dst / "addons/foo/plugin.cfg", "old, longer contents that must go away\n");
      write_file(dst / "addons/foo/stale.gd", "stale\n");
      write_file(dst / "project.godot", "project\n");

      addonsync::sync_tree(src, dst, PathList{"addons"}, std::nullopt, quiet);
      if (slurp(dst / "addons/foo/plugin.cfg") != "new contents\n") {
        std::cerr << "D: destination was not overwritten\n";
        return 1;
      }
      if (slurp(dst / "addons/foo/stale.gd") != "stale\n" || !fs::exists(dst / "project.godot")) {
        std::cerr << "D: sync must not delete destination files\n";
        return 1;
      }
    }

    // Idempotence: a second run leaves the same tree
    {
      const auto src = fresh_dir(base, "idem_src");
      const auto dst = base / "idem_dst";
      write_file(src / "addons/foo/plugin.cfg", "foo\n");
      write_file(src / "addons/foo/scripts/main.gd", "extends Node\n");
      fs::create_directories(src / "addons/foo/empty");
      write_file(src / "README.md", "readme\n");

      addonsync::sync_tree(src, dst, std::nullopt, PathList{"README.md"}, quiet);
      const auto once = snapshot(dst);
      addonsync::sync_tree(src, dst, std::nullopt, PathList{"README.md"}, quiet);
      if (snapshot(dst) != once) {
        std::cerr << "idempotence: second sync changed the destination\n";
        return 1;
      }
      if (!once.contains("addons/foo/empty") || once.contains("README.md")) {
        std::cerr << "idempotence: unexpected first-run tree\n";
        return 1;
      }
    }

    // No rules: everything is copied, including empty directories
    {
      const auto src = fresh_dir(base, "all_src");
      const auto dst = base / "all_dst";
      write_file(src / "a.txt", "a\n");
      write_file(src / "x/y/z.txt", "z\n");
      fs::create_directories(src / "empty");

      addonsync::sync_tree(src, dst, std::nullopt, std::nullopt, quiet);
      if (snapshot(dst) != snapshot(src)) {
        std::cerr << "all: destination differs from source\n";
        return 1;
      }
    }

    // A source that is not a directory is fatal and names the path
    {
      const auto file = base / "plain.txt";
      write_file(file, "x\n");
      bool threw = false;
      try {
        addonsync::sync_tree(file, base / "plain_dst", std::nullopt, std::nullopt, quiet);
      } catch (const addonsync::SyncError &e) {
        threw = e.operation() == addonsync::consts::kOpReadSource && e.source() == file;
      }
      if (!threw) {
        std::cerr << "expected read-source SyncError\n";
        return 1;
      }
    }

    // A directory that vanishes before it is listed is skipped with a warning
    {
      const auto src = fresh_dir(base, "vanish_src");
      write_file(src / "gone/inner.txt", "inner\n");
      write_file(src / "kept.txt", "kept\n");
      CountingReporter counting;
      int visited_files = 0;
      const auto skipped = addonsync::for_each_filtered_entry(
          src, std::nullopt, std::nullopt, counting, [&](const addonsync::FilteredEntry &e) {
            if (e.rel_path == "gone")
              fs::remove_all(e.path);
            else if (!e.is_directory)
              ++visited_files;
          });
      if (skipped != 1 || counting.warnings != 1) {
        std::cerr << "vanish: expected one skipped entry and one warning, got " << skipped
                  << "/" << counting.warnings << "\n";
        return 1;
      }
      if (visited_files != 1) {
        std::cerr << "vanish: walk did not continue past the vanished directory\n";
        return 1;
      }
    }

    // Syncing a tree onto itself is refused before anything is copied
    {
      const auto self = fresh_dir(base, "self");
      write_file(self / "a.txt", "keep me\n");
      bool threw = false;
      try {
        addonsync::sync_tree(self, self / ".", std::nullopt, std::nullopt, quiet);
      } catch (const addonsync::SyncError &e) {
        threw = e.operation() == addonsync::consts::kOpReadSource &&
                std::string(e.what()).find("source is the destination") != std::string::npos;
      }
      if (!threw || slurp(self / "a.txt") != "keep me\n") {
        std::cerr << "expected same-tree SyncError with the file left intact\n";
        return 1;
      }
    }

    // Copy failure is fatal and carries the path pair: a directory blocks the target file
    {
      const auto src = fresh_dir(base, "err_src");
      const auto dst = fresh_dir(base, "err_dst");
      write_file(src / "addons/plugin.cfg", "cfg\n");
      fs::create_directories(dst / "addons/plugin.cfg");
      bool threw = false;
      try {
        addonsync::sync_tree(src, dst, std::nullopt, std::nullopt, quiet);
      } catch (const addonsync::SyncError &e) {
        threw = e.operation() == addonsync::consts::kOpCopy &&
                e.source() == src / "addons/plugin.cfg" &&
                e.destination() == dst / "addons/plugin.cfg" && e.code() &&
                std::string(e.what()).find("plugin.cfg") != std::string::npos;
      }
      if (!threw) {
        std::cerr << "expected copy SyncError with path pair\n";
        return 1;
      }
    }

    // Directory symlinks are recreated as directories, not followed
    {
      const auto src = fresh_dir(base, "link_src");
      const auto dst = base / "link_dst";
      write_file(base / "outside/big.bin", "outside\n");
      std::error_code ec;
      fs::create_directory_symlink(base / "outside", src / "linked", ec);
      if (!ec) {
        addonsync::sync_tree(src, dst, std::nullopt, std::nullopt, quiet);
        if (!fs::is_directory(dst / "linked") || fs::exists(dst / "linked/big.bin")) {
          std::cerr << "symlinked directory should be created but not descended\n";
          return 1;
        }
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
