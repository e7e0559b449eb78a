#include "treeprep/content_hasher.hh"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <stdexcept>

#include "treeprep/fault.hh"
#include "treeprep/fs_ops.hh"

namespace treeprep {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

// RAII wrapper for libcrypto digest context.
class md_ctx_t {
  EVP_MD_CTX *_ctx;

 public:
  md_ctx_t() {
    _ctx = EVP_MD_CTX_new();
    if (_ctx == nullptr) {
      throw std::runtime_error("EVP_MD_CTX_new failed");
    }
  }
  ~md_ctx_t() noexcept { EVP_MD_CTX_free(_ctx); }

  md_ctx_t(const md_ctx_t &rhs) = delete;
  md_ctx_t(md_ctx_t &&rhs) = delete;
  md_ctx_t &operator=(const md_ctx_t &rhs) = delete;
  md_ctx_t &operator=(md_ctx_t &&rhs) = delete;

  void reset(const EVP_MD *md) {
    if (EVP_DigestInit_ex(_ctx, md, nullptr) != 1) {
      throw std::runtime_error("EVP_DigestInit_ex failed");
    }
  }
  void update(const char *data, const std::size_t size) {
    if (EVP_DigestUpdate(_ctx, data, size) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }
  digest_t digest() {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(_ctx, md, &len) != 1) {
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return {md, len};
  }
};

}  // namespace

digest_t::digest_t(const unsigned char *bytes, unsigned int len) noexcept
    : _len(std::min<unsigned int>(len, EVP_MAX_MD_SIZE)) {
  std::copy(bytes, bytes + _len, _bytes.begin());
}

std::string digest_t::hex() const {
  static constexpr char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(_len * 2);
  for (auto byte : bytes()) {
    out += digits[byte >> 4];
    out += digits[byte & 0xF];
  }
  return out;
}

content_hasher_t::content_hasher_t(const std::string &hash_algo)
    : _md(EVP_get_digestbyname(hash_algo.c_str())) {
  if (_md == nullptr) {
    throw std::invalid_argument("invalid hash algorithm: " + hash_algo);
  }
}

const char *content_hasher_t::name() const noexcept {
  return EVP_MD_name(_md);
}

digest_t content_hasher_t::hash(const fs::path &path, std::error_code &ec) {
  ec.clear();
  auto fd = open_long(path, O_RDONLY | O_NOFOLLOW, ec);
  if (!fd) {
    return {};
  }
  if (_buf.empty()) {
    _buf.resize(buf_sz);
  }
  md_ctx_t ctx;
  ctx.reset(_md);
  while (true) {
    const auto read_len = ::read(fd.get(), _buf.data(), _buf.size());
    if (read_len < 0) {
      if (errno == EINTR) {
        continue;
      }
      ec = {errno, std::system_category()};
      return {};
    }
    if (read_len == 0) {
      break;
    }
    ctx.update(_buf.data(), static_cast<std::size_t>(read_len));
  }
  return ctx.digest();
}

}  // namespace detail_v1

}  // namespace treeprep
