#ifndef WTTP_CID_UTILS_HPP
#define WTTP_CID_UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "utilities/digest.hpp"

namespace wttp {

extern const std::vector<uint8_t> CID_PREFIX_SHA256;
extern const std::vector<uint8_t> CID_PREFIX_BLAKE3;

/**
 * @brief Converts a digest to a CIDv1 string.
 * @param digest The hash digest.
 * @param algo Algorithm that produced the digest; selects the multihash code.
 * @return The base32 encoded CIDv1 string.
 */
std::string digestToCid(const Digest &digest,
                        HashAlgorithm algo = HashAlgorithm::SHA256);

/**
 * @brief Converts a CIDv1 string to its digest.
 * @param cid The CIDv1 string.
 * @param algo_out Receives the algorithm recorded in the prefix when non-null.
 * @return The extracted digest.
 * @throws std::runtime_error if the CID is invalid.
 */
Digest cidToDigest(const std::string &cid, HashAlgorithm *algo_out = nullptr);

/// Base64 encoding of opaque bytes, used for chunk payloads in state files.
std::string encodeBase64(const std::vector<std::byte> &data);

/// @throws std::runtime_error on malformed input.
std::vector<std::byte> decodeBase64(const std::string &text);

} // namespace wttp

#endif // WTTP_CID_UTILS_HPP
