#pragma once
#include <filesystem>
#include <optional>
#include <vector>

namespace addonsync {

// Ordered list of source-relative path rules. An absent list (std::nullopt)
// is not the same as an empty one.
using PathList = std::vector<std::filesystem::path>;

// Component-wise prefix test: `addons/foo` starts with `addons`, `addons2` does not.
// Empty and "." components are ignored, so the empty path is a prefix of everything.
[[nodiscard]] auto path_starts_with(const std::filesystem::path &path,
                                    const std::filesystem::path &prefix) -> bool;

// Decide whether a path relative to the source root takes part in a sync.
// Excludes are checked first and always win. With includes present, a path passes
// when it lies inside an include or is an ancestor directory of one.
[[nodiscard]] auto should_include(const std::filesystem::path &rel_path,
                                  const std::optional<PathList> &excludes,
                                  const std::optional<PathList> &includes) -> bool;

} // namespace addonsync
