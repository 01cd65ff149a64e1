#pragma once
#include "addonsync/filter.hpp"
#include "addonsync/reporter.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace addonsync {

// Fatal failure of one sync call. Carries the failing operation (see consts::kOp*),
// the path pair involved and the underlying I/O cause.
class SyncError : public std::runtime_error {
public:
  SyncError(std::string_view operation, std::filesystem::path source,
            std::filesystem::path destination, std::error_code code, std::string_view detail = {});

  [[nodiscard]] const std::string &operation() const { return operation_; }
  [[nodiscard]] const std::filesystem::path &source() const { return source_; }
  [[nodiscard]] const std::filesystem::path &destination() const { return destination_; }
  [[nodiscard]] std::error_code code() const { return code_; }

private:
  std::string operation_;
  std::filesystem::path source_;
  std::filesystem::path destination_;
  std::error_code code_;
};

struct SyncStats {
  std::size_t dirs = 0;         // destination directories created (or already present)
  std::size_t files_copied = 0;
  std::size_t skipped = 0;      // entries that could not be listed

  SyncStats &operator+=(const SyncStats &other) {
    dirs += other.dirs;
    files_copied += other.files_copied;
    skipped += other.skipped;
    return *this;
  }
};

// One accepted entry of a filtered walk. `rel_path` is empty for the source root.
struct FilteredEntry {
  const std::filesystem::path &path;
  const std::filesystem::path &rel_path;
  bool is_directory;
};

using EntryVisitor = std::function<void(const FilteredEntry &)>;

// Walk everything under source_base (the root included) and call `visit` for each
// entry that passes should_include(). Rejected directories are not descended into;
// none of their descendants could pass either. Symlinked directories are reported
// as directories but never followed.
//
// Unreadable entries are reported through `reporter` and skipped; the return value
// counts them. Throws SyncError if source_base is not a directory or a walked path
// does not lie under it. Exceptions thrown by `visit` propagate unchanged.
auto for_each_filtered_entry(const std::filesystem::path &source_base,
                             const std::optional<PathList> &includes,
                             const std::optional<PathList> &excludes, Reporter &reporter,
                             const EntryVisitor &visit) -> std::size_t;

// Copy the filtered subset of source_base into dest_base.
// - accepted directories are created (with missing ancestors)
// - accepted files are copied, overwriting whatever is at the destination
// Destination entries with no counterpart in the source are left alone.
// Throws SyncError on the first fatal failure; the destination may then be partially synced.
auto sync_tree(const std::filesystem::path &source_base, const std::filesystem::path &dest_base,
               const std::optional<PathList> &includes, const std::optional<PathList> &excludes,
               Reporter &reporter) -> SyncStats;

} // namespace addonsync
