#include "addonsync/fs.hpp"

#include <fstream>
#include <stdexcept>

namespace addonsync::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw std::runtime_error("read failed: " + p.string());
  return buf;
}

std::string read_text(const std::filesystem::path &p) {
  const auto bytes = read_file(p);
  return {bytes.begin(), bytes.end()};
}

std::error_code create_dirs(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  std::error_code probe;
  if (ec && std::filesystem::is_directory(p, probe)) {
    // lost a race with another writer; the directory is there
    ec.clear();
  }
  return ec;
}

std::error_code copy_over(const std::filesystem::path &src, const std::filesystem::path &dst) {
  std::error_code ec;
  std::filesystem::copy_file(src, dst, std::filesystem::copy_options::overwrite_existing, ec);
  return ec;
}

} // namespace addonsync::fs
