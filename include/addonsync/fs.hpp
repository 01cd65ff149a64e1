#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace addonsync::fs {

bool exists(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
std::string read_text(const std::filesystem::path& p);

// mkdir -p; an already existing directory is success
std::error_code create_dirs(const std::filesystem::path& p);

// Copy the bytes of src to dst, replacing dst if it exists
std::error_code copy_over(const std::filesystem::path& src, const std::filesystem::path& dst);

} // namespace addonsync::fs
