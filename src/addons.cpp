#include "addonsync/addons.hpp"

#include "addonsync/consts.hpp"
#include "addonsync/fs.hpp"

namespace addonsync {

std::filesystem::path resolve_source(const AddonSpec &addon,
                                     const std::filesystem::path &working_dir) {
  return working_dir / addon.path.value_or(std::string(consts::kDefaultSourcePath));
}

std::filesystem::path resolve_destination(const ProjectSpec &project,
                                          const std::filesystem::path &working_dir) {
  return working_dir / project.project_path;
}

AddonSyncSummary sync_addons(const ProjectSpec &project, const std::filesystem::path &working_dir,
                             Reporter &reporter) {
  AddonSyncSummary summary;
  const auto dest_base = resolve_destination(project, working_dir);

  for (const auto &[name, addon] : project.addons) {
    const auto source_base = resolve_source(addon, working_dir);
    if (!fs::exists(source_base)) {
      reporter.warn("addon '" + name + "' path '" + source_base.string() +
                    "' does not exist, skipping");
      summary.skipped.push_back(name);
      continue;
    }
    summary.totals += sync_tree(source_base, dest_base, addon.include, addon.exclude, reporter);
    summary.synced.push_back(name);
  }
  return summary;
}

} // namespace addonsync
