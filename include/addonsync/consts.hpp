#pragma once
#include <cstddef>
#include <string_view>

namespace addonsync::consts {

// Project file and defaults
inline constexpr std::string_view kProjectFile       = "addonsync.toml";
inline constexpr std::string_view kDefaultSourcePath = ".";
inline constexpr std::string_view kDefaultProjectPath = ".";

// Project file sections and keys
inline constexpr std::string_view kAddonSection  = "addon.";
inline constexpr std::string_view kKeyProjectPath = "project_path";
inline constexpr std::string_view kKeyPath       = "path";
inline constexpr std::string_view kKeyInclude    = "include";
inline constexpr std::string_view kKeyExclude    = "exclude";

// ——— Digest sizes ———
inline constexpr std::size_t kDigestRawLen = 20; // 20 bytes (SHA-1)
inline constexpr std::size_t kDigestHexLen = 40; // 40 hex chars (SHA-1)

// ——— SyncError operation names ———
inline constexpr std::string_view kOpReadSource  = "read-source";
inline constexpr std::string_view kOpStripPrefix = "strip-prefix";
inline constexpr std::string_view kOpCreateDir   = "create-dir";
inline constexpr std::string_view kOpCopy        = "copy";

} // namespace addonsync::consts
