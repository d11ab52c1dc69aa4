#include "storage/chunk_store.hpp"
#include "storage/content_table.hpp"
#include "utilities/cid_utils.hpp"
#include "utilities/errors.h"
#include "utilities/hasher.hpp"
#include "utilities/metrics.h"

#include <gtest/gtest.h>
#include <string>

using namespace wttp;

TEST(ContentTableTest, InternDeduplicates) {
  ContentTable<std::string> table([](const std::string &s) {
    return sha256(s.data(), s.size());
  });
  auto first = table.intern("alpha");
  auto second = table.intern("alpha");
  auto third = table.intern("beta");

  EXPECT_TRUE(first.second);
  EXPECT_FALSE(second.second);
  EXPECT_TRUE(third.second);
  EXPECT_EQ(first.first, second.first);
  EXPECT_EQ(table.size(), 2u);
  ASSERT_NE(table.find(first.first), nullptr);
  EXPECT_EQ(*table.find(first.first), "alpha");
  EXPECT_EQ(table.find(ZERO_DIGEST), nullptr);
}

TEST(ContentTableTest, PointersStayValidAcrossGrowth) {
  ContentTable<std::string> table([](const std::string &s) {
    return sha256(s.data(), s.size());
  });
  Digest key = table.intern("anchor").first;
  const std::string *anchor = table.find(key);
  for (int i = 0; i < 1000; ++i) {
    table.intern("value " + std::to_string(i));
  }
  EXPECT_EQ(table.find(key), anchor);
  EXPECT_EQ(*anchor, "anchor");

  std::vector<std::string> seen;
  table.forEach([&](const Digest &, const std::string &v) { seen.push_back(v); });
  ASSERT_EQ(seen.size(), 1001u);
  EXPECT_EQ(seen.front(), "anchor");
}

class ChunkStoreTest : public ::testing::Test {
protected:
  void SetUp() override { MetricsRegistry::instance().reset(); }
  ChunkStore store;
};

TEST_F(ChunkStoreTest, WriteIsIdempotent) {
  Bytes data = toBytes("hello");
  bool inserted = false;
  Digest a = store.write(data, &inserted);
  EXPECT_TRUE(inserted);
  Digest b = store.write(data, &inserted);
  EXPECT_FALSE(inserted);

  EXPECT_EQ(a, b);
  EXPECT_EQ(a, ChunkStore::addressOf(data));
  EXPECT_EQ(store.chunkCount(), 1u);
  EXPECT_EQ(store.size(a), 5u);
  EXPECT_EQ(store.storedBytes(), 5u);
  EXPECT_EQ(bytesToString(store.read(a)), "hello");
  EXPECT_DOUBLE_EQ(
      MetricsRegistry::instance().counterValue("wttp_chunks_written_total"),
      1.0);
  EXPECT_DOUBLE_EQ(
      MetricsRegistry::instance().gaugeValue("wttp_chunk_bytes_stored"), 5.0);
}

TEST_F(ChunkStoreTest, AddressIncludesVersionTag) {
  Bytes data = toBytes("hello");
  EXPECT_NE(ChunkStore::addressOf(data), blake3(data.data(), data.size()));
}

TEST_F(ChunkStoreTest, UnknownAddressReadsEmpty) {
  Digest unknown = ChunkStore::addressOf(toBytes("never written"));
  EXPECT_FALSE(store.exists(unknown));
  EXPECT_TRUE(store.read(unknown).empty());
  EXPECT_EQ(store.size(unknown), 0u);
}

TEST_F(ChunkStoreTest, ZeroLengthChunkHasAnAddress) {
  Digest empty = store.write(Bytes{});
  EXPECT_TRUE(store.exists(empty));
  EXPECT_EQ(store.size(empty), 0u);
}

TEST_F(ChunkStoreTest, ExportImportVerifiesAddresses) {
  store.write(toBytes("one"));
  store.write(toBytes("two"));
  YAML::Node exported = store.exportState();
  ASSERT_EQ(exported.size(), 2u);

  ChunkStore restored;
  restored.importState(exported);
  EXPECT_EQ(restored.chunkCount(), 2u);
  EXPECT_EQ(restored.storedBytes(), 6u);
  EXPECT_EQ(bytesToString(restored.read(ChunkStore::addressOf(toBytes("two")))),
            "two");

  YAML::Node tampered = YAML::Clone(exported);
  tampered[0]["data"] = encodeBase64(toBytes("evil"));
  ChunkStore victim;
  EXPECT_THROW(victim.importState(tampered), InvalidState);
}
