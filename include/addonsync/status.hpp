#pragma once
#include "addonsync/project.hpp"
#include "addonsync/reporter.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace addonsync {

// Sync never deletes, so there is no "Deleted" kind.
enum class ChangeKind : std::uint8_t { Added, Modified };

struct Change {
  ChangeKind kind;
  std::string addon;
  std::string path; // source-relative, generic separators
};

// Dry run of sync_addons: which destination files a sync would create or overwrite
// with different content. Nothing is written. Missing addon sources are skipped with
// a warning, as in a sync. Result is sorted by (addon, path).
auto compute_addon_status(const ProjectSpec &project, const std::filesystem::path &working_dir,
                          Reporter &reporter) -> std::vector<Change>;

} // namespace addonsync
