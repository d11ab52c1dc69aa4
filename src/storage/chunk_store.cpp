#include "storage/chunk_store.hpp"
#include "utilities/cid_utils.hpp"
#include "utilities/errors.h"
#include "utilities/hasher.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

namespace wttp {

ChunkStore::ChunkStore() : table_(&ChunkStore::addressOf) {}

Digest ChunkStore::addressOf(const Bytes &data) {
  // Empty chunks are still hashed to produce a unique address.
  Hasher h(HashAlgorithm::BLAKE3);
  h.ingest(data);
  h.ingest(&VERSION_TAG, 1);
  return h.finalize();
}

Digest ChunkStore::write(const Bytes &data, bool *inserted) {
  auto [address, added] = table_.intern(data);
  if (added) {
    storedBytes_ += data.size();
    Logger::getInstance().log(
        LogLevel::DEBUG, "Chunk stored",
        {{"chunk", digestToCid(address, HashAlgorithm::BLAKE3)},
         {"size", std::to_string(data.size())}});
    MetricsRegistry::instance().incrementCounter("wttp_chunks_written_total");
    publishGauges();
  }
  if (inserted) {
    *inserted = added;
  }
  return address;
}

bool ChunkStore::exists(const Digest &address) const {
  return table_.contains(address);
}

Bytes ChunkStore::read(const Digest &address) const {
  const Bytes *chunk = table_.find(address);
  return chunk ? *chunk : Bytes{};
}

uint64_t ChunkStore::size(const Digest &address) const {
  const Bytes *chunk = table_.find(address);
  return chunk ? chunk->size() : 0;
}

size_t ChunkStore::chunkCount() const { return table_.size(); }

void ChunkStore::publishGauges() const {
  auto &metrics = MetricsRegistry::instance();
  metrics.setGauge("wttp_chunks_stored", static_cast<double>(chunkCount()));
  metrics.setGauge("wttp_chunk_bytes_stored",
                   static_cast<double>(storedBytes()));
}

YAML::Node ChunkStore::exportState() const {
  YAML::Node node(YAML::NodeType::Sequence);
  table_.forEach([&node](const Digest &address, const Bytes &data) {
    YAML::Node entry;
    entry["address"] = digestToCid(address, HashAlgorithm::BLAKE3);
    entry["data"] = encodeBase64(data);
    node.push_back(entry);
  });
  return node;
}

void ChunkStore::importState(const YAML::Node &node) {
  if (!node || !node.IsSequence()) {
    return;
  }
  for (const auto &entry : node) {
    Digest address = cidToDigest(entry["address"].as<std::string>());
    Bytes data = decodeBase64(entry["data"].as<std::string>());
    if (addressOf(data) != address) {
      ThrowInvalidState("Chunk content does not match address " +
                        entry["address"].as<std::string>());
    }
    if (table_.insertAt(address, std::move(data))) {
      storedBytes_ += size(address);
    }
  }
  publishGauges();
}

} // namespace wttp
