#include "gateway/range.hpp"
#include "utilities/errors.h"

#include <gtest/gtest.h>
#include <string>

using namespace wttp;

namespace {

struct Chunked {
  std::vector<std::string> parts;

  std::vector<uint64_t> sizes() const {
    std::vector<uint64_t> out;
    for (const auto &p : parts)
      out.push_back(p.size());
    return out;
  }

  std::string read(int64_t start, int64_t end) const {
    uint64_t total = 0;
    for (const auto &p : parts)
      total += p.size();
    auto resolved = resolveRange(Range{start, end}, total);
    if (!resolved)
      return "<416>";
    Bytes out = assembleBytes(
        sizes(), [this](size_t i) { return toBytes(parts[i]); }, *resolved);
    return bytesToString(out);
  }
};

} // namespace

TEST(ResolveRangeTest, FullContentForms) {
  auto zero = resolveRange(Range{0, 0}, 20);
  ASSERT_TRUE(zero);
  EXPECT_EQ(zero->start, 0u);
  EXPECT_EQ(zero->end, 20u);
  EXPECT_TRUE(zero->full);

  auto explicitEnd = resolveRange(Range{0, 20}, 20);
  ASSERT_TRUE(explicitEnd);
  EXPECT_TRUE(explicitEnd->full);

  auto negativeAll = resolveRange(Range{-20, 0}, 20);
  ASSERT_TRUE(negativeAll);
  EXPECT_TRUE(negativeAll->full);
}

TEST(ResolveRangeTest, PartialRanges) {
  auto mid = resolveRange(Range{5, 15}, 20);
  ASSERT_TRUE(mid);
  EXPECT_EQ(mid->start, 5u);
  EXPECT_EQ(mid->end, 15u);
  EXPECT_EQ(mid->length(), 10u);
  EXPECT_FALSE(mid->full);

  auto tail = resolveRange(Range{-3, 0}, 20);
  ASSERT_TRUE(tail);
  EXPECT_EQ(tail->start, 17u);
  EXPECT_EQ(tail->end, 20u);

  auto trimmed = resolveRange(Range{2, -2}, 20);
  ASSERT_TRUE(trimmed);
  EXPECT_EQ(trimmed->start, 2u);
  EXPECT_EQ(trimmed->end, 18u);

  auto empty = resolveRange(Range{7, 7}, 20);
  ASSERT_TRUE(empty);
  EXPECT_EQ(empty->length(), 0u);
  EXPECT_FALSE(empty->full);
}

TEST(ResolveRangeTest, Unsatisfiable) {
  EXPECT_FALSE(resolveRange(Range{0, 21}, 20));
  EXPECT_FALSE(resolveRange(Range{-21, 0}, 20));
  EXPECT_FALSE(resolveRange(Range{0, -21}, 20));
  EXPECT_FALSE(resolveRange(Range{15, 5}, 20));
  EXPECT_FALSE(resolveRange(Range{21, 0}, 20));
  EXPECT_FALSE(resolveRange(Range{-5, -10}, 20));
  EXPECT_FALSE(resolveRange(Range{INT64_MIN, 0}, 20));
}

TEST(ResolveRangeTest, EmptyContent) {
  auto whole = resolveRange(Range{0, 0}, 0);
  ASSERT_TRUE(whole);
  EXPECT_TRUE(whole->full);
  EXPECT_EQ(whole->length(), 0u);
  EXPECT_FALSE(resolveRange(Range{-1, 0}, 0));
  EXPECT_FALSE(resolveRange(Range{0, 1}, 0));
}

TEST(LocateByteTest, FindsChunkAndOffset) {
  std::vector<uint64_t> sizes = {4, 0, 3, 5};
  auto first = locateByte(sizes, 0);
  ASSERT_TRUE(first);
  EXPECT_EQ(first->chunk, 0u);
  EXPECT_EQ(first->offset, 0u);

  auto boundary = locateByte(sizes, 4);
  ASSERT_TRUE(boundary);
  EXPECT_EQ(boundary->chunk, 2u);
  EXPECT_EQ(boundary->offset, 0u);

  auto inside = locateByte(sizes, 8);
  ASSERT_TRUE(inside);
  EXPECT_EQ(inside->chunk, 3u);
  EXPECT_EQ(inside->offset, 1u);

  EXPECT_FALSE(locateByte(sizes, 12));
}

TEST(AssembleBytesTest, CrossesChunkBoundaries) {
  Chunked content{{"This is ", "test", " content"}};
  EXPECT_EQ(content.read(0, 0), "This is test content");
  EXPECT_EQ(content.read(5, 15), "is test co");
  EXPECT_EQ(content.read(8, 12), "test");
  EXPECT_EQ(content.read(7, 13), " test ");
  EXPECT_EQ(content.read(-7, 0), "content");
  EXPECT_EQ(content.read(-1, 0), "t");
  EXPECT_EQ(content.read(0, 1), "T");
  EXPECT_EQ(content.read(0, 100), "<416>");
}

TEST(AssembleBytesTest, LastKBytesForEveryK) {
  Chunked content{{"ab", "", "cde", "f", "ghij"}};
  const std::string all = "abcdefghij";
  for (int64_t k = 1; k <= static_cast<int64_t>(all.size()); ++k) {
    EXPECT_EQ(content.read(-k, 0), all.substr(all.size() - k)) << "k=" << k;
  }
  for (int64_t a = 0; a <= static_cast<int64_t>(all.size()); ++a) {
    EXPECT_EQ(content.read(a, static_cast<int64_t>(all.size())),
              all.substr(a))
        << "a=" << a;
  }
}

TEST(AssembleBytesTest, LoadsOnlyOverlappingChunks) {
  std::vector<uint64_t> sizes = {3, 3, 3, 3};
  std::vector<size_t> loaded;
  auto resolved = resolveRange(Range{4, 7}, 12);
  ASSERT_TRUE(resolved);
  Bytes out = assembleBytes(
      sizes,
      [&](size_t i) {
        loaded.push_back(i);
        return toBytes(std::string(3, static_cast<char>('a' + i)));
      },
      *resolved);
  EXPECT_EQ(bytesToString(out), "bbc");
  EXPECT_EQ(loaded, (std::vector<size_t>{1, 2}));
}

TEST(AssembleBytesTest, ShortChunkIsInvalidState) {
  std::vector<uint64_t> sizes = {3, 3};
  auto resolved = resolveRange(Range{0, 0}, 6);
  ASSERT_TRUE(resolved);
  EXPECT_THROW(assembleBytes(
                   sizes, [](size_t) { return toBytes("x"); }, *resolved),
               InvalidState);
}

TEST(SliceChunksTest, SlicesAddresses) {
  ChunkList chunks;
  for (uint8_t i = 0; i < 5; ++i) {
    Digest d{};
    d[0] = i;
    chunks.push_back(d);
  }
  auto resolved = resolveRange(Range{-2, 0}, chunks.size());
  ASSERT_TRUE(resolved);
  ChunkList tail = sliceChunks(chunks, *resolved);
  ASSERT_EQ(tail.size(), 2u);
  EXPECT_EQ(tail[0][0], 3);
  EXPECT_EQ(tail[1][0], 4);

  auto middle = resolveRange(Range{1, 3}, chunks.size());
  ASSERT_TRUE(middle);
  EXPECT_EQ(sliceChunks(chunks, *middle).size(), 2u);
}
