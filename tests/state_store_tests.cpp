#include "protocol/site.h"
#include "test_support.hpp"
#include "utilities/errors.h"

#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>

using namespace wttp;
using namespace wttp::test;

class StateStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    path_ = (varDir() / "state_store_test.yaml").string();
    std::remove(path_.c_str());
  }
  void TearDown() override { std::remove(path_.c_str()); }

  SiteConfig persistentConfig() {
    SiteConfig config = testConfig();
    config.stateFile = path_;
    return config;
  }

  std::string path_;
  FakeClock clock;
};

TEST_F(StateStoreTest, SaveAndReloadEveryTable) {
  Digest etag;
  {
    Site site(persistentConfig(), clock.fn());
    site.access().grantRole(OWNER, AccessControl::SITE_ADMIN_ROLE, SITE_ADMIN);
    site.engine().handleDefine(define("/a", publicHeader()), OWNER);
    site.engine().handleDefine(define("/b", publicHeader()), OWNER);
    site.engine().handlePut(test::put("/a", {chunk("shared", 0, ALICE),
                                             chunk("tail", 1, ALICE)}),
                            ALICE);
    site.engine().handlePut(test::put("/b", {chunk("shared", 0, BOB)}), BOB,
                            41000);
    etag = site.catalog().etag("/a");
    ASSERT_TRUE(site.saveState());
  }

  Site restored(persistentConfig(), clock.fn());
  EXPECT_EQ(restored.chunks().chunkCount(), 2u);
  EXPECT_EQ(restored.registry().balanceOf(ALICE), 36900u);
  EXPECT_TRUE(restored.access().isSiteAdmin(SITE_ADMIN));
  EXPECT_EQ(restored.catalog().etag("/a"), etag);
  EXPECT_EQ(restored.catalog().readMetadata("/a").size, 10u);

  GetResponse body = restored.gateway().handleGet(get("/a"), BOB);
  EXPECT_EQ(body.head.code, Status::OK);
  EXPECT_EQ(bytesToString(body.data), "sharedtail");

  // Royalty records survive: a third writer still pays.
  EXPECT_EQ(restored.registry().quote(toBytes("shared"), "carol"), 41000u);
}

TEST_F(StateStoreTest, MissingFileLoadsNothing) {
  Site site(testConfig(), clock.fn());
  EXPECT_FALSE(site.loadState(path_));
  EXPECT_THROW(site.saveState(), InvalidState);
}

TEST_F(StateStoreTest, TamperedChunkIsRejected) {
  {
    Site site(persistentConfig(), clock.fn());
    site.engine().handlePut(test::put("/x", {chunk("original", 0, OWNER)}),
                            OWNER);
    ASSERT_TRUE(site.saveState());
  }
  YAML::Node doc = YAML::LoadFile(path_);
  doc["chunks"][0]["data"] = "dGFtcGVyZWQ=";
  {
    std::ofstream ofs(path_, std::ios::trunc);
    YAML::Emitter out;
    out << doc;
    ofs << out.c_str();
  }
  EXPECT_THROW(Site site(persistentConfig(), clock.fn()), InvalidState);
}

TEST_F(StateStoreTest, UnknownFormatIsRejected) {
  {
    std::ofstream ofs(path_, std::ios::trunc);
    ofs << "format: something-else\n";
  }
  Site site(testConfig(), clock.fn());
  EXPECT_THROW(site.loadState(path_), InvalidState);
}

TEST_F(StateStoreTest, SnapshotIsPlainYaml) {
  Site site(persistentConfig(), clock.fn());
  site.engine().handlePut(test::put("/y", {chunk("abc", 0, OWNER)}), OWNER);
  ASSERT_TRUE(site.saveState());

  YAML::Node doc = YAML::LoadFile(path_);
  EXPECT_EQ(doc["format"].as<std::string>(), StateStore::FORMAT);
  EXPECT_EQ(doc["chunks"].size(), 1u);
  EXPECT_EQ(doc["chunks"][0]["data"].as<std::string>(), "YWJj");
  EXPECT_TRUE(doc["catalog"]["resources"]["/y"]);
  EXPECT_EQ(doc["access"]["super_admin"].as<std::string>(), OWNER);
}
