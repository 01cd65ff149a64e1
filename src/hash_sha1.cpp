#include "addonsync/hash.hpp"
#include "addonsync/consts.hpp"

#include <fstream>
#include <memory>
#include <openssl/evp.h> // EVP_* digest API
#include <stdexcept>
#include <vector>

namespace addonsync {

namespace {

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

md_ctx_ptr new_sha1_ctx() {
  md_ctx_ptr ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
  }
  return ctx;
}

digest finish(EVP_MD_CTX *ctx) {
  digest out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (len != out.size()) {
    throw std::runtime_error("SHA-1 produced unexpected length");
  }
  return out;
}

} // namespace

digest sha1(std::span<const std::uint8_t> data) {
  auto ctx = new_sha1_ctx();
  if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return finish(ctx.get());
}

digest sha1_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  auto ctx = new_sha1_ctx();
  std::vector<char> buf(64 * 1024);
  while (ifs) {
    ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto got = ifs.gcount();
    if (got > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<std::size_t>(got)) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }
  if (ifs.bad()) {
    throw std::runtime_error("read failed: " + p.string());
  }
  return finish(ctx.get());
}

std::string to_hex(const digest &d) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(consts::kDigestHexLen);
  for (std::size_t i = 0; i < consts::kDigestRawLen; ++i) {
    unsigned b = d[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

} // namespace addonsync
