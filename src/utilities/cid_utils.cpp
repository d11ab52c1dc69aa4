#include "utilities/cid_utils.hpp"
#include "cppcodec/base32_rfc4648.hpp"
#include "cppcodec/base64_rfc4648.hpp"

#include <algorithm>

namespace wttp {

// CIDv1 (0x01)
// multicodec for raw binary (0x55)
// multihash code for SHA2-256 (0x12) or BLAKE3 (0x1e)
// length of hash (0x20)
const std::vector<uint8_t> CID_PREFIX_SHA256 = {0x01, 0x55, 0x12, 0x20};
const std::vector<uint8_t> CID_PREFIX_BLAKE3 = {0x01, 0x55, 0x1e, 0x20};

std::string digestToCid(const Digest &digest, HashAlgorithm algo) {
  const auto &prefix =
      algo == HashAlgorithm::SHA256 ? CID_PREFIX_SHA256 : CID_PREFIX_BLAKE3;
  std::vector<uint8_t> bytes;
  bytes.reserve(prefix.size() + digest.size());
  bytes.insert(bytes.end(), prefix.begin(), prefix.end());
  bytes.insert(bytes.end(), digest.begin(), digest.end());
  return cppcodec::base32_rfc4648::encode(bytes);
}

Digest cidToDigest(const std::string &cid, HashAlgorithm *algo_out) {
  if (cid.empty()) {
    throw std::runtime_error("CID string cannot be empty.");
  }

  std::vector<uint8_t> decoded;
  try {
    decoded = cppcodec::base32_rfc4648::decode(cid.data(), cid.length());
  } catch (const std::exception &e) {
    throw std::runtime_error("Failed to decode Base32 CID: " +
                             std::string(e.what()));
  }

  if (decoded.size() != CID_PREFIX_SHA256.size() + DIGEST_SIZE) {
    throw std::runtime_error("Invalid CID: unexpected length " +
                             std::to_string(decoded.size()));
  }

  HashAlgorithm algo;
  if (std::equal(CID_PREFIX_SHA256.begin(), CID_PREFIX_SHA256.end(),
                 decoded.begin())) {
    algo = HashAlgorithm::SHA256;
  } else if (std::equal(CID_PREFIX_BLAKE3.begin(), CID_PREFIX_BLAKE3.end(),
                        decoded.begin())) {
    algo = HashAlgorithm::BLAKE3;
  } else {
    throw std::runtime_error("Invalid CID: Prefix mismatch.");
  }

  Digest digest{};
  std::copy(decoded.begin() + CID_PREFIX_SHA256.size(), decoded.end(),
            digest.begin());
  if (algo_out) {
    *algo_out = algo;
  }
  return digest;
}

std::string encodeBase64(const std::vector<std::byte> &data) {
  return cppcodec::base64_rfc4648::encode(
      reinterpret_cast<const uint8_t *>(data.data()), data.size());
}

std::vector<std::byte> decodeBase64(const std::string &text) {
  std::vector<uint8_t> raw;
  try {
    raw = cppcodec::base64_rfc4648::decode(text.data(), text.size());
  } catch (const std::exception &e) {
    throw std::runtime_error("Failed to decode Base64 payload: " +
                             std::string(e.what()));
  }
  std::vector<std::byte> out(raw.size());
  std::transform(raw.begin(), raw.end(), out.begin(),
                 [](uint8_t b) { return static_cast<std::byte>(b); });
  return out;
}

} // namespace wttp
