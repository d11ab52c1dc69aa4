#ifndef WTTP_CHUNK_STORE_HPP
#define WTTP_CHUNK_STORE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <yaml-cpp/yaml.h>

#include "storage/content_table.hpp"
#include "storage/types.hpp"
#include "utilities/digest.hpp"

namespace wttp {

/**
 * @brief Content-addressed storage of immutable byte chunks.
 *
 * The address of a chunk is BLAKE3(bytes || VERSION_TAG). Writing bytes
 * whose address is already present is a no-op, so the content stored at an
 * address never changes.
 */
class ChunkStore {
public:
  /// Appended to chunk bytes before hashing; changes when the format does.
  static constexpr uint8_t VERSION_TAG = 0x02;

  ChunkStore();

  /// Address the given bytes would be stored under.
  static Digest addressOf(const Bytes &data);

  /**
   * @brief Store a chunk.
   * @param data Raw bytes that make up the chunk.
   * @param inserted Set to false when the address already existed.
   * @return The chunk address.
   */
  Digest write(const Bytes &data, bool *inserted = nullptr);

  bool exists(const Digest &address) const;

  /**
   * @brief Retrieve a chunk by address.
   * @return The chunk data, or an empty vector if not found.
   */
  Bytes read(const Digest &address) const;

  /// Size of a chunk in bytes, 0 if the address is unknown.
  uint64_t size(const Digest &address) const;

  size_t chunkCount() const;
  uint64_t storedBytes() const { return storedBytes_.load(); }

  YAML::Node exportState() const;

  /**
   * @brief Load chunks from a state snapshot.
   * @throw InvalidState If a chunk does not hash to its recorded address.
   */
  void importState(const YAML::Node &node);

private:
  void publishGauges() const;

  ContentTable<Bytes> table_;
  std::atomic<uint64_t> storedBytes_{0};
};

} // namespace wttp

#endif // WTTP_CHUNK_STORE_HPP
