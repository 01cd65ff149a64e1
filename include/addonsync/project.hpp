#pragma once
#include "addonsync/consts.hpp"
#include "addonsync/filter.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace addonsync {

struct AddonSpec {
  std::optional<std::string> path; // source location; "." when absent
  std::optional<PathList> include;
  std::optional<PathList> exclude;
};

struct ProjectSpec {
  std::string project_path{consts::kDefaultProjectPath}; // destination shared by all addons
  std::map<std::string, AddonSpec> addons; // by name
};

class ProjectSpecError : public std::runtime_error {
public:
  ProjectSpecError(std::size_t line, const std::string &what);

  // 1-based line of the offending input, 0 if not tied to a line
  [[nodiscard]] std::size_t line() const { return line_; }

private:
  std::size_t line_;
};

// Parse the text of an addonsync.toml file. Throws ProjectSpecError.
auto parse_project_spec(std::string_view text) -> ProjectSpec;

// Read <project_dir>/addonsync.toml. Throws ProjectSpecError if it is missing or malformed.
auto load_project_spec(const std::filesystem::path &project_dir) -> ProjectSpec;

} // namespace addonsync
