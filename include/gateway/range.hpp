#ifndef WTTP_RANGE_HPP
#define WTTP_RANGE_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "catalog/types.hpp"
#include "protocol/messages.hpp"

namespace wttp {

/// Absolute [start, end) inside a resource of known length.
struct ResolvedRange {
  uint64_t start = 0;
  uint64_t end = 0;
  bool full = false; ///< covers [0, total)

  uint64_t length() const { return end - start; }
};

/**
 * @brief Turn a relative range into absolute offsets.
 *
 * Negative start/end count back from @p total, end 0 means @p total.
 * @return std::nullopt when the range is not satisfiable.
 */
std::optional<ResolvedRange> resolveRange(const Range &range, uint64_t total);

struct BytePosition {
  size_t chunk = 0;
  uint64_t offset = 0; ///< within the chunk
};

/// Chunk holding byte @p offset; std::nullopt past the end.
std::optional<BytePosition> locateByte(const std::vector<uint64_t> &sizes,
                                       uint64_t offset);

using ChunkLoader = std::function<Bytes(size_t index)>;

/**
 * @brief Copy the bytes of @p range out of an ordered chunk sequence.
 *
 * Only chunks overlapping the range are loaded.
 */
Bytes assembleBytes(const std::vector<uint64_t> &sizes,
                    const ChunkLoader &load, const ResolvedRange &range);

ChunkList sliceChunks(const ChunkList &chunks, const ResolvedRange &range);

} // namespace wttp

#endif // WTTP_RANGE_HPP
