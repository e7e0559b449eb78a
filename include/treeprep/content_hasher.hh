#pragma once

#include <openssl/evp.h>

#include <array>
#include <compare>
#include <filesystem>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "config.hh"

namespace treeprep {

inline namespace detail_v1 {

// content identity of a file, independent of its name and path
class digest_t {
  std::array<unsigned char, EVP_MAX_MD_SIZE> _bytes{};
  unsigned int _len = 0;

 public:
  digest_t() noexcept = default;
  digest_t(const unsigned char *bytes, unsigned int len) noexcept;

  inline std::span<const unsigned char> bytes() const noexcept {
    return {_bytes.data(), _len};
  }
  std::string hex() const;

  auto operator<=>(const digest_t &rhs) const noexcept = default;
};

/**
 * @brief streams file content through an OpenSSL digest.
 * One instance per thread, the read buffer is reused between files.
 */
class content_hasher_t {
  const EVP_MD *_md;
  std::vector<char> _buf;

 public:
  /**
   * @param hash_algo digest algorithm supported by libcrypto
   * @throws std::invalid_argument if the algorithm is unknown
   */
  explicit content_hasher_t(const std::string &hash_algo = default_hash_algo);

  /**
   * @brief digest of a file's bytes, paths beyond PATH_MAX are supported
   *
   * @param path regular file
   * @param[out] ec system error on failure, the caller records UnreadableFile
   */
  digest_t hash(const std::filesystem::path &path, std::error_code &ec);

  const char *name() const noexcept;
};

}  // namespace detail_v1

}  // namespace treeprep
