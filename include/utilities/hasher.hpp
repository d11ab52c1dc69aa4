#ifndef WTTP_HASHER_HPP
#define WTTP_HASHER_HPP

#include <cstddef>
#include <cstdint>
#include <sodium.h>
#include <string>
#include <string_view>
#include <vector>

#include "blake3.h"
#include "utilities/digest.hpp"

namespace wttp {

/**
 * @brief Incremental digest builder over libsodium SHA-256 or BLAKE3.
 *
 * Integers are fed in big-endian order and variable-length fields are
 * length-prefixed by the typed helpers, so two different field sequences can
 * never produce the same byte stream.
 */
class Hasher {
public:
  /**
   * @brief Construct a hasher for the given algorithm.
   * @throw std::runtime_error If libsodium cannot be initialised.
   */
  explicit Hasher(HashAlgorithm algo = HashAlgorithm::SHA256);

  // Appends raw bytes to the running digest.
  void ingest(const void *data, size_t size);

  void ingest(const std::vector<std::byte> &data);

  /** Feed an unsigned integer as 8 big-endian bytes. */
  void ingestU64(uint64_t value);

  /** Feed a boolean as a single byte. */
  void ingestBool(bool value);

  /** Feed a length-prefixed string. */
  void ingestString(std::string_view value);

  /** Feed a fixed-size digest. */
  void ingestDigest(const Digest &value);

  /**
   * @brief Finalize and return the digest.
   * @throw std::logic_error If called more than once.
   */
  Digest finalize();


private:
  void checkOpen() const;

  HashAlgorithm algo_;
  crypto_hash_sha256_state sha_state_;
  blake3_hasher blake3_state_;
  bool finalized_ = false;
};

/// One-shot SHA-256 of a byte range.
Digest sha256(const void *data, size_t size);

/// One-shot BLAKE3 of a byte range.
Digest blake3(const void *data, size_t size);

} // namespace wttp

#endif // WTTP_HASHER_HPP
