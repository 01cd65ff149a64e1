#pragma once
#include "addonsync/project.hpp"
#include "addonsync/reporter.hpp"
#include "addonsync/sync.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace addonsync {

struct AddonSyncSummary {
  std::vector<std::string> synced;  // in processing (name) order
  std::vector<std::string> skipped; // source path missing
  SyncStats totals;
};

// working_dir / (addon.path or "."); an absolute addon path is used as is
auto resolve_source(const AddonSpec &addon, const std::filesystem::path &working_dir)
    -> std::filesystem::path;

// working_dir / project.project_path
auto resolve_destination(const ProjectSpec &project, const std::filesystem::path &working_dir)
    -> std::filesystem::path;

// Run sync_tree once per addon, in name order, into the shared project destination.
// An addon whose source does not exist is skipped with a warning; the first SyncError
// aborts the remaining addons and propagates.
auto sync_addons(const ProjectSpec &project, const std::filesystem::path &working_dir,
                 Reporter &reporter) -> AddonSyncSummary;

} // namespace addonsync
