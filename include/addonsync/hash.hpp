#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace addonsync {

// Raw 20-byte SHA-1 digest (binary, not hex)
using digest = std::array<std::uint8_t, 20>;

/** Compute SHA-1 of arbitrary bytes. */
digest sha1(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/**
 * SHA-1 of a file's contents, streamed in fixed-size chunks.
 * Throws std::runtime_error if the file cannot be read.
 */
digest sha1_file(const std::filesystem::path &p);

/** Convert binary digest to 40-char lowercase hex. */
std::string to_hex(const digest &d);

} // namespace addonsync
