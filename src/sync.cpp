#include "addonsync/sync.hpp"

#include "addonsync/consts.hpp"
#include "addonsync/fs.hpp"

#include <utility>

namespace stdfs = std::filesystem;

namespace addonsync {

namespace {

std::string describe(std::string_view operation, const stdfs::path &source,
                     const stdfs::path &destination, std::error_code code,
                     std::string_view detail) {
  std::string msg{operation};
  msg += " failed: ";
  msg += source.string();
  if (!destination.empty()) {
    msg += " -> ";
    msg += destination.string();
  }
  msg += ": ";
  msg += detail.empty() ? code.message() : std::string(detail);
  return msg;
}

bool is_trivial(const stdfs::path &component) { return component.empty() || component == "."; }

// Path of `path` relative to `base`, or nullopt if it does not lie under it.
std::optional<stdfs::path> strip_prefix(const stdfs::path &path, const stdfs::path &base) {
  auto p = path.begin();
  auto b = base.begin();
  for (;;) {
    while (p != path.end() && is_trivial(*p))
      ++p;
    while (b != base.end() && is_trivial(*b))
      ++b;
    if (b == base.end())
      break;
    if (p == path.end() || *p != *b)
      return std::nullopt;
    ++p;
    ++b;
  }
  stdfs::path rel;
  for (; p != path.end(); ++p) {
    if (!is_trivial(*p))
      rel /= *p;
  }
  return rel;
}

struct Walk {
  const stdfs::path &source_base;
  const std::optional<PathList> &includes;
  const std::optional<PathList> &excludes;
  Reporter &reporter;
  const EntryVisitor &visit;
  std::size_t skipped = 0;

  void skip(const stdfs::path &p, std::string_view what, std::error_code ec) {
    ++skipped;
    reporter.warn("skipping " + p.string() + ": " + std::string(what) + ": " + ec.message());
  }

  void descend(const stdfs::path &dir) {
    std::error_code ec;
    stdfs::directory_iterator it(dir, ec);
    if (ec) {
      skip(dir, "cannot list directory", ec);
      return;
    }
    const stdfs::directory_iterator end;
    while (it != end) {
      const stdfs::directory_entry entry = *it;
      on_entry(entry);
      it.increment(ec);
      if (ec) {
        skip(dir, "listing interrupted", ec);
        return;
      }
    }
  }

  void on_entry(const stdfs::directory_entry &entry) {
    const stdfs::path &path = entry.path();
    const auto rel = strip_prefix(path, source_base);
    if (!rel) {
      throw SyncError(consts::kOpStripPrefix, path, {},
                      std::make_error_code(std::errc::invalid_argument),
                      "not under " + source_base.string());
    }
    if (!should_include(*rel, excludes, includes))
      return;

    std::error_code ec;
    const auto link_status = entry.symlink_status(ec);
    if (ec) {
      skip(path, "cannot stat", ec);
      return;
    }
    const bool is_link = stdfs::is_symlink(link_status);
    // a dangling link is treated as a file and fails in the copy
    const bool is_dir = is_link ? stdfs::is_directory(path, ec) : stdfs::is_directory(link_status);

    visit(FilteredEntry{.path = path, .rel_path = *rel, .is_directory = is_dir});
    if (is_dir && !is_link)
      descend(path);
  }
};

} // namespace

SyncError::SyncError(std::string_view operation, stdfs::path source, stdfs::path destination,
                     std::error_code code, std::string_view detail)
    : std::runtime_error(describe(operation, source, destination, code, detail)),
      operation_(operation), source_(std::move(source)), destination_(std::move(destination)),
      code_(code) {}

std::size_t for_each_filtered_entry(const stdfs::path &source_base,
                                    const std::optional<PathList> &includes,
                                    const std::optional<PathList> &excludes, Reporter &reporter,
                                    const EntryVisitor &visit) {
  std::error_code ec;
  if (!stdfs::is_directory(source_base, ec)) {
    throw SyncError(consts::kOpReadSource, source_base, {},
                    ec ? ec : std::make_error_code(std::errc::not_a_directory));
  }

  Walk walk{.source_base = source_base,
            .includes = includes,
            .excludes = excludes,
            .reporter = reporter,
            .visit = visit};
  const stdfs::path root_rel;
  if (should_include(root_rel, excludes, includes)) {
    visit(FilteredEntry{.path = source_base, .rel_path = root_rel, .is_directory = true});
    walk.descend(source_base);
  }
  return walk.skipped;
}

SyncStats sync_tree(const stdfs::path &source_base, const stdfs::path &dest_base,
                    const std::optional<PathList> &includes,
                    const std::optional<PathList> &excludes, Reporter &reporter) {
  // every file would be copied onto itself
  if (std::error_code ec; stdfs::equivalent(source_base, dest_base, ec)) {
    throw SyncError(consts::kOpReadSource, source_base, dest_base,
                    std::make_error_code(std::errc::invalid_argument),
                    "source is the destination");
  }

  SyncStats stats;
  auto copy_entry = [&](const FilteredEntry &e) {
    // dest_base / "" would add a trailing separator
    const stdfs::path target = e.rel_path.empty() ? dest_base : dest_base / e.rel_path;
    if (e.is_directory) {
      if (auto ec = fs::create_dirs(target))
        throw SyncError(consts::kOpCreateDir, e.path, target, ec);
      ++stats.dirs;
      return;
    }
    if (const auto parent = target.parent_path(); !parent.empty()) {
      if (auto ec = fs::create_dirs(parent))
        throw SyncError(consts::kOpCreateDir, e.path, parent, ec);
    }
    if (auto ec = fs::copy_over(e.path, target))
      throw SyncError(consts::kOpCopy, e.path, target, ec);
    ++stats.files_copied;
  };

  stats.skipped = for_each_filtered_entry(source_base, includes, excludes, reporter, copy_entry);
  return stats;
}

} // namespace addonsync
