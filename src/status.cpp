#include "addonsync/status.hpp"

#include "addonsync/addons.hpp"
#include "addonsync/fs.hpp"
#include "addonsync/hash.hpp"
#include "addonsync/sync.hpp"

#include <algorithm>
#include <tuple>

namespace addonsync {

std::vector<Change> compute_addon_status(const ProjectSpec &project,
                                         const std::filesystem::path &working_dir,
                                         Reporter &reporter) {
  std::vector<Change> changes;
  const auto dest_base = resolve_destination(project, working_dir);

  for (const auto &item : project.addons) {
    const std::string &name = item.first;
    const AddonSpec &addon = item.second;
    const auto source_base = resolve_source(addon, working_dir);
    if (!fs::exists(source_base)) {
      reporter.warn("addon '" + name + "' path '" + source_base.string() +
                    "' does not exist, skipping");
      continue;
    }

    auto compare = [&](const FilteredEntry &e) {
      if (e.is_directory)
        return;
      const auto target = dest_base / e.rel_path;
      std::error_code ec;
      if (!std::filesystem::exists(target, ec)) {
        changes.push_back({ChangeKind::Added, name, e.rel_path.generic_string()});
        return;
      }
      // something other than a file in the way counts as a modification
      if (!std::filesystem::is_regular_file(target, ec) ||
          sha1_file(e.path) != sha1_file(target))
        changes.push_back({ChangeKind::Modified, name, e.rel_path.generic_string()});
    };
    for_each_filtered_entry(source_base, addon.include, addon.exclude, reporter, compare);
  }

  std::ranges::sort(changes, [](const Change &a, const Change &b) {
    return std::tie(a.addon, a.path) < std::tie(b.addon, b.path);
  });
  return changes;
}

} // namespace addonsync
