#include "addonsync/filter.hpp"

#include <algorithm>

namespace addonsync {

namespace {

// Advance `it` past empty and "." components.
void skip_trivial(std::filesystem::path::const_iterator &it,
                  const std::filesystem::path::const_iterator &end) {
  while (it != end && (it->empty() || *it == ".")) {
    ++it;
  }
}

} // namespace

bool path_starts_with(const std::filesystem::path &path, const std::filesystem::path &prefix) {
  auto p = path.begin();
  auto q = prefix.begin();
  for (;;) {
    skip_trivial(p, path.end());
    skip_trivial(q, prefix.end());
    if (q == prefix.end()) {
      return true;
    }
    if (p == path.end() || *p != *q) {
      return false;
    }
    ++p;
    ++q;
  }
}

bool should_include(const std::filesystem::path &rel_path,
                    const std::optional<PathList> &excludes,
                    const std::optional<PathList> &includes) {
  if (excludes && std::ranges::any_of(*excludes, [&](const std::filesystem::path &ex) {
        return path_starts_with(rel_path, ex);
      })) {
    return false;
  }
  if (!includes) {
    return true;
  }
  return std::ranges::any_of(*includes, [&](const std::filesystem::path &inc) {
    return path_starts_with(rel_path, inc) || path_starts_with(inc, rel_path);
  });
}

} // namespace addonsync
