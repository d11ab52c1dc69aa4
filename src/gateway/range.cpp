#include "gateway/range.hpp"
#include "utilities/errors.h"

#include <algorithm>

namespace wttp {

namespace {

// Resolve one negative-capable bound; std::nullopt if it reaches before 0.
std::optional<uint64_t> fromEnd(int64_t value, uint64_t total) {
  if (value >= 0) {
    return static_cast<uint64_t>(value);
  }
  // -INT64_MIN overflows, compare in unsigned space.
  uint64_t magnitude = static_cast<uint64_t>(-(value + 1)) + 1;
  if (magnitude > total) {
    return std::nullopt;
  }
  return total - magnitude;
}

} // namespace

std::optional<ResolvedRange> resolveRange(const Range &range, uint64_t total) {
  auto start = fromEnd(range.start, total);
  if (!start) {
    return std::nullopt;
  }
  std::optional<uint64_t> end =
      range.end == 0 ? std::optional<uint64_t>(total) : fromEnd(range.end, total);
  if (!end) {
    return std::nullopt;
  }
  if (*start > *end || *end > total) {
    return std::nullopt;
  }
  ResolvedRange resolved;
  resolved.start = *start;
  resolved.end = *end;
  resolved.full = *start == 0 && *end == total;
  return resolved;
}

std::optional<BytePosition> locateByte(const std::vector<uint64_t> &sizes,
                                       uint64_t offset) {
  uint64_t base = 0;
  for (size_t i = 0; i < sizes.size(); ++i) {
    if (offset < base + sizes[i]) {
      return BytePosition{i, offset - base};
    }
    base += sizes[i];
  }
  return std::nullopt;
}

Bytes assembleBytes(const std::vector<uint64_t> &sizes,
                    const ChunkLoader &load, const ResolvedRange &range) {
  Bytes out;
  if (range.length() == 0) {
    return out;
  }
  auto first = locateByte(sizes, range.start);
  if (!first) {
    ThrowInvalidState("Range start " + std::to_string(range.start) +
                      " beyond assembled content");
  }
  out.reserve(range.length());

  uint64_t offset = first->offset;
  for (size_t i = first->chunk; i < sizes.size() && out.size() < range.length();
       ++i) {
    if (sizes[i] == 0) {
      continue;
    }
    Bytes chunk = load(i);
    if (chunk.size() != sizes[i]) {
      ThrowInvalidState("Chunk " + std::to_string(i) + " has " +
                        std::to_string(chunk.size()) + " bytes, expected " +
                        std::to_string(sizes[i]));
    }
    uint64_t take = std::min<uint64_t>(chunk.size() - offset,
                                       range.length() - out.size());
    out.insert(out.end(), chunk.begin() + offset,
               chunk.begin() + offset + take);
    offset = 0;
  }
  if (out.size() != range.length()) {
    ThrowInvalidState("Range end " + std::to_string(range.end) +
                      " beyond assembled content");
  }
  return out;
}

ChunkList sliceChunks(const ChunkList &chunks, const ResolvedRange &range) {
  uint64_t end = std::min<uint64_t>(range.end, chunks.size());
  uint64_t start = std::min<uint64_t>(range.start, end);
  return ChunkList(chunks.begin() + start, chunks.begin() + end);
}

} // namespace wttp
