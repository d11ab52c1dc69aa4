#include "utilities/hasher.hpp"

#include <stdexcept>

namespace wttp {

Hasher::Hasher(HashAlgorithm algo) : algo_(algo) {
  // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }

  if (algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_init(&sha_state_);
  } else {
    blake3_hasher_init(&blake3_state_);
  }
}

void Hasher::checkOpen() const {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after finalize() has been called.");
  }
}

void Hasher::ingest(const void *data, size_t size) {
  checkOpen();
  if (data == nullptr || size == 0) {
    return;
  }
  if (algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_update(
        &sha_state_, static_cast<const unsigned char *>(data), size);
  } else {
    blake3_hasher_update(&blake3_state_, data, size);
  }
}

void Hasher::ingest(const std::vector<std::byte> &data) {
  ingest(data.data(), data.size());
}

void Hasher::ingestU64(uint64_t value) {
  unsigned char buf[8];
  for (int i = 7; i >= 0; --i) {
    buf[i] = static_cast<unsigned char>(value & 0xff);
    value >>= 8;
  }
  ingest(buf, sizeof(buf));
}

void Hasher::ingestBool(bool value) {
  unsigned char b = value ? 1 : 0;
  ingest(&b, 1);
}

void Hasher::ingestString(std::string_view value) {
  ingestU64(value.size());
  ingest(value.data(), value.size());
}

void Hasher::ingestDigest(const Digest &value) {
  ingest(value.data(), value.size());
}

Digest Hasher::finalize() {
  if (finalized_) {
    throw std::logic_error("finalize() already called.");
  }
  Digest out{};
  if (algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_final(&sha_state_, out.data());
  } else {
    blake3_hasher_finalize(&blake3_state_, out.data(), DIGEST_SIZE);
  }
  finalized_ = true;
  return out;
}

Digest sha256(const void *data, size_t size) {
  Hasher h(HashAlgorithm::SHA256);
  h.ingest(data, size);
  return h.finalize();
}

Digest blake3(const void *data, size_t size) {
  Hasher h(HashAlgorithm::BLAKE3);
  h.ingest(data, size);
  return h.finalize();
}

} // namespace wttp
