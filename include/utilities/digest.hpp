#ifndef WTTP_DIGEST_HPP
#define WTTP_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace wttp {

/// Supported hashing algorithms.
enum class HashAlgorithm { SHA256, BLAKE3 };

/// Digest size for supported algorithms (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

using Digest = std::array<uint8_t, DIGEST_SIZE>;

/// All-zero digest; used as the "unset" value for header refs, etags and roles.
inline constexpr Digest ZERO_DIGEST{};

inline bool isZero(const Digest &d) { return d == ZERO_DIGEST; }

/// Hash functor so digests can key unordered containers.
struct DigestHash {
  size_t operator()(const Digest &d) const noexcept {
    size_t h;
    std::memcpy(&h, d.data(), sizeof(h));
    return h;
  }
};

} // namespace wttp

#endif // WTTP_DIGEST_HPP
