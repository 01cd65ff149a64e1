#include "addonsync/project.hpp"

#include "addonsync/consts.hpp"
#include "addonsync/fs.hpp"

#include <cctype>
#include <cstdint>
#include <set>
#include <sstream>
#include <utility>
#include <variant>
#include <vector>

namespace {

using Value = std::variant<std::string, std::vector<std::string>>;

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

void skip_blanks(std::string_view sv, std::size_t &pos) {
  while (pos < sv.size() && (sv[pos] == ' ' || sv[pos] == '\t'))
    ++pos;
}

bool is_bare_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

// Only blanks or a comment may follow a complete value or header.
void expect_line_end(std::string_view sv, std::size_t pos, std::size_t line) {
  skip_blanks(sv, pos);
  if (pos < sv.size() && sv[pos] != '#')
    throw addonsync::ProjectSpecError(line, "unexpected trailing text: " + trim(sv.substr(pos)));
}

// Basic double-quoted string starting at sv[pos] == '"'. Leaves pos after the closing quote.
std::string parse_string(std::string_view sv, std::size_t &pos, std::size_t line) {
  std::string out;
  ++pos; // opening quote
  while (pos < sv.size()) {
    const char c = sv[pos++];
    if (c == '"')
      return out;
    if (c != '\\') {
      out.push_back(c);
      continue;
    }
    if (pos >= sv.size())
      break;
    switch (const char esc = sv[pos++]; esc) {
    case '"':
    case '\\':
      out.push_back(esc);
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'n':
      out.push_back('\n');
      break;
    default:
      throw addonsync::ProjectSpecError(line, std::string("unsupported escape: \\") + esc);
    }
  }
  throw addonsync::ProjectSpecError(line, "unterminated string");
}

std::vector<std::string> parse_array(std::string_view sv, std::size_t &pos, std::size_t line) {
  std::vector<std::string> out;
  ++pos; // '['
  for (;;) {
    skip_blanks(sv, pos);
    if (pos >= sv.size())
      throw addonsync::ProjectSpecError(line, "unterminated array");
    if (sv[pos] == ']') {
      ++pos;
      return out;
    }
    if (sv[pos] != '"')
      throw addonsync::ProjectSpecError(line, "array elements must be quoted strings");
    out.push_back(parse_string(sv, pos, line));
    skip_blanks(sv, pos);
    if (pos < sv.size() && sv[pos] == ',') {
      ++pos;
    } else if (pos >= sv.size() || sv[pos] != ']') {
      throw addonsync::ProjectSpecError(line, "expected ',' or ']' in array");
    }
  }
}

Value parse_value(std::string_view sv, std::size_t pos, std::size_t line) {
  skip_blanks(sv, pos);
  if (pos >= sv.size())
    throw addonsync::ProjectSpecError(line, "missing value");
  Value v;
  if (sv[pos] == '"') {
    v = parse_string(sv, pos, line);
  } else if (sv[pos] == '[') {
    v = parse_array(sv, pos, line);
  } else {
    throw addonsync::ProjectSpecError(line, "values must be quoted strings or arrays of them");
  }
  expect_line_end(sv, pos, line);
  return v;
}

std::string expect_string(Value v, std::string_view key, std::size_t line) {
  if (auto *s = std::get_if<std::string>(&v))
    return std::move(*s);
  throw addonsync::ProjectSpecError(line, "'" + std::string(key) + "' must be a string");
}

addonsync::PathList expect_rules(Value v, std::string_view key, std::size_t line) {
  auto *xs = std::get_if<std::vector<std::string>>(&v);
  if (!xs)
    throw addonsync::ProjectSpecError(line, "'" + std::string(key) + "' must be an array");
  addonsync::PathList rules;
  rules.reserve(xs->size());
  for (auto &x : *xs) {
    std::filesystem::path p{x};
    if ((!x.empty() && x.front() == '/') || p.is_absolute() || p.has_root_path())
      throw addonsync::ProjectSpecError(line, "'" + std::string(key) +
                                                  "' entries must be relative paths: " + x);
    rules.push_back(std::move(p));
  }
  return rules;
}

enum class Section : std::uint8_t { Top, Addon, Other };

} // namespace

namespace addonsync {

ProjectSpecError::ProjectSpecError(std::size_t line, const std::string &what)
    : std::runtime_error(line ? "line " + std::to_string(line) + ": " + what : what),
      line_(line) {}

ProjectSpec parse_project_spec(std::string_view text) {
  ProjectSpec out{};
  Section section = Section::Top;
  AddonSpec *addon = nullptr;
  std::set<std::string> seen_keys; // keys of the current section

  std::istringstream iss{std::string(text)};
  std::string raw;
  std::size_t line = 0;
  while (std::getline(iss, raw)) {
    ++line;
    const std::string stripped = trim(raw);
    const std::string_view sv{stripped};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments

    if (sv[0] == '[') {
      std::size_t pos = 1;
      skip_blanks(sv, pos);
      std::string name;
      const bool is_addon = sv.substr(pos).starts_with(consts::kAddonSection);
      if (is_addon) {
        pos += consts::kAddonSection.size();
        if (pos < sv.size() && sv[pos] == '"') {
          name = parse_string(sv, pos, line);
        } else {
          while (pos < sv.size() && is_bare_char(sv[pos]))
            name.push_back(sv[pos++]);
        }
        if (name.empty())
          throw ProjectSpecError(line, "empty addon name");
      } else {
        while (pos < sv.size() && sv[pos] != ']')
          ++pos;
      }
      skip_blanks(sv, pos);
      if (pos >= sv.size() || sv[pos] != ']')
        throw ProjectSpecError(line, "malformed section header: " + stripped);
      expect_line_end(sv, pos + 1, line);

      seen_keys.clear();
      if (!is_addon) {
        section = Section::Other;
        addon = nullptr;
        continue;
      }
      auto [it, inserted] = out.addons.try_emplace(name);
      if (!inserted)
        throw ProjectSpecError(line, "duplicate addon: " + name);
      section = Section::Addon;
      addon = &it->second;
      continue;
    }

    std::size_t pos = 0;
    std::string key;
    while (pos < sv.size() && is_bare_char(sv[pos]))
      key.push_back(sv[pos++]);
    skip_blanks(sv, pos);
    if (key.empty() || pos >= sv.size() || sv[pos] != '=')
      throw ProjectSpecError(line, "expected key = value: " + stripped);
    Value value = parse_value(sv, pos + 1, line);

    if (section == Section::Other)
      continue; // settings for other tools
    if (!seen_keys.insert(key).second)
      throw ProjectSpecError(line, "duplicate key: " + key);

    if (section == Section::Top) {
      if (key == consts::kKeyProjectPath)
        out.project_path = expect_string(std::move(value), key, line);
      // other top-level keys belong to other tools
      continue;
    }

    if (key == consts::kKeyPath) {
      addon->path = expect_string(std::move(value), key, line);
    } else if (key == consts::kKeyInclude) {
      addon->include = expect_rules(std::move(value), key, line);
    } else if (key == consts::kKeyExclude) {
      addon->exclude = expect_rules(std::move(value), key, line);
    } else {
      throw ProjectSpecError(line, "unknown addon key: " + key);
    }
  }
  return out;
}

ProjectSpec load_project_spec(const std::filesystem::path &project_dir) {
  const auto path = project_dir / consts::kProjectFile;
  if (!fs::exists(path))
    throw ProjectSpecError(0, "no " + std::string(consts::kProjectFile) + " in " +
                                  project_dir.string());
  return parse_project_spec(fs::read_text(path));
}

} // namespace addonsync
