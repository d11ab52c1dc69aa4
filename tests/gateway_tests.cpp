#include "gateway/gateway.h"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace wttp;
using namespace wttp::test;

class GatewayTest : public ::testing::Test {
protected:
  void SetUp() override {
    site.engine().handlePut(test::put("/content",
                                      {chunk("This is ", 0, OWNER),
                                       chunk("test", 1, OWNER),
                                       chunk(" content", 2, OWNER)}),
                            OWNER);
  }

  Gateway &gateway() { return site.gateway(); }

  FakeClock clock;
  Site site{testConfig(), clock.fn()};
};

TEST_F(GatewayTest, FullGetIs200) {
  GetResponse response = gateway().handleGet(get("/content"), BOB);
  EXPECT_EQ(response.head.code, Status::OK);
  EXPECT_EQ(bytesToString(response.data), "This is test content");
  EXPECT_EQ(response.head.metadata.size, 20u);

  GetResponse explicitEnd = gateway().handleGet(get("/content", 0, 20), BOB);
  EXPECT_EQ(explicitEnd.head.code, Status::OK);
}

TEST_F(GatewayTest, ByteRangeIs206) {
  GetResponse response = gateway().handleGet(get("/content", 5, 15), BOB);
  EXPECT_EQ(response.head.code, Status::PARTIAL_CONTENT);
  EXPECT_EQ(bytesToString(response.data), "is test co");

  GetResponse tail = gateway().handleGet(get("/content", -7, 0), BOB);
  EXPECT_EQ(tail.head.code, Status::PARTIAL_CONTENT);
  EXPECT_EQ(bytesToString(tail.data), "content");
}

TEST_F(GatewayTest, UnsatisfiableByteRangeIs416) {
  GetResponse response = gateway().handleGet(get("/content", 0, 21), BOB);
  EXPECT_EQ(response.head.code, Status::RANGE_NOT_SATISFIABLE);
  EXPECT_TRUE(response.data.empty());
  EXPECT_EQ(gateway().handleGet(get("/content", -30, 0), BOB).head.code,
            Status::RANGE_NOT_SATISFIABLE);
}

TEST_F(GatewayTest, ChunkRanges) {
  ChunkList all = site.catalog().readChunkList("/content");
  ASSERT_EQ(all.size(), 3u);

  LocateResponse full = gateway().handleLocate(locate("/content"), BOB);
  EXPECT_EQ(full.head.code, Status::OK);
  EXPECT_EQ(full.chunks, all);

  LocateResponse last = gateway().handleLocate(locate("/content", -1, 0), BOB);
  EXPECT_EQ(last.head.code, Status::PARTIAL_CONTENT);
  ASSERT_EQ(last.chunks.size(), 1u);
  EXPECT_EQ(last.chunks[0], all[2]);

  LocateResponse middle = gateway().handleLocate(locate("/content", 1, 2), BOB);
  EXPECT_EQ(middle.head.code, Status::PARTIAL_CONTENT);
  ASSERT_EQ(middle.chunks.size(), 1u);
  EXPECT_EQ(middle.chunks[0], all[1]);

  LocateResponse bad = gateway().handleLocate(locate("/content", 2, 5), BOB);
  EXPECT_EQ(bad.head.code, Status::RANGE_NOT_SATISFIABLE);
  EXPECT_TRUE(bad.chunks.empty());
}

TEST_F(GatewayTest, NonOkResultsPassThrough) {
  GetResponse missing = gateway().handleGet(get("/missing", 5, 15), BOB);
  EXPECT_EQ(missing.head.code, Status::NOT_FOUND);
  EXPECT_TRUE(missing.data.empty());

  LocateResponse missingChunks =
      gateway().handleLocate(locate("/missing", 0, 99), BOB);
  EXPECT_EQ(missingChunks.head.code, Status::NOT_FOUND);

  GetRequest wrongVersion = get("/content", 0, 99);
  wrongVersion.head.line.protocol = "WTTP/2.0";
  EXPECT_EQ(gateway().handleGet(wrongVersion, BOB).head.code,
            Status::VERSION_NOT_SUPPORTED);
}

TEST_F(GatewayTest, HeadAndOptionsPassThrough) {
  HeadRequest request = head("/content");
  HeadResponse direct = site.engine().handleHead(request, BOB);
  HeadResponse viaGateway = gateway().handleHead(request, BOB);
  EXPECT_EQ(viaGateway.code, direct.code);
  EXPECT_EQ(viaGateway.etag, direct.etag);
  EXPECT_EQ(viaGateway.metadata, direct.metadata);

  RequestLine line;
  line.path = "/content";
  OptionsResponse options = gateway().handleOptions(line, BOB);
  EXPECT_EQ(options.code, Status::NO_CONTENT);
  EXPECT_EQ(options.allow, MethodLayout::fullMask());
}

TEST_F(GatewayTest, PatchedContentIsReassembled) {
  site.engine().handlePatch(test::patch("/content", {chunk("TEST", 1, OWNER),
                                                     chunk("!", 3, OWNER)}),
                            OWNER);
  GetResponse response = gateway().handleGet(get("/content"), BOB);
  EXPECT_EQ(bytesToString(response.data), "This is TEST content!");
  EXPECT_EQ(response.head.metadata.size, 21u);
}
