#include "protocol/site_config.hpp"
#include "catalog/access_control.h"
#include "test_support.hpp"
#include "utilities/errors.h"

#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>

using namespace wttp;

static std::string getConfigPath() {
  namespace fs = std::filesystem;
  fs::path p = fs::current_path();
  p = p.parent_path() / "wttp_config.yaml";
  if (fs::exists(p))
    return p.string();
  // Fallback when running directly from source directory
  fs::path alt =
      fs::path(__FILE__).parent_path().parent_path() / "wttp_config.yaml";
  return alt.string();
}

TEST(SiteConfigTest, Defaults) {
  SiteConfig config = SiteConfig::fromYaml(YAML::Node());
  EXPECT_EQ(config.protocol, "WTTP/3.0");
  EXPECT_EQ(config.royalty.rate, 1u);
  EXPECT_EQ(config.royalty.publisherSharePercent, 90u);
  EXPECT_EQ(config.royalty.baseCost, 21000u);
  EXPECT_EQ(config.royalty.costPerWord, 20000u);
  EXPECT_FALSE(config.strictValidation);
  EXPECT_EQ(config.methods.bit(Method::HEAD), 0);
  EXPECT_EQ(config.methods.bit(Method::DEFINE), 8);
  EXPECT_EQ(config.defaultHeader.allowedMethods, MethodLayout::fullMask());
  EXPECT_EQ(config.logging.file, Logger::CONSOLE_ONLY_OUTPUT);
  EXPECT_TRUE(config.stateFile.empty());
}

TEST(SiteConfigTest, LoadsShippedFile) {
  SiteConfig config = loadSiteConfig(getConfigPath());
  EXPECT_EQ(config.owner, "site-owner");
  EXPECT_EQ(config.stateFile, "wttp_state.yaml");
  EXPECT_EQ(config.logging.file, "wttp.log");
  EXPECT_EQ(config.logging.maxBackupFiles, 5);

  const MethodLayout &layout = config.methods;
  EXPECT_FALSE(layout.allows(config.defaultHeader.allowedMethods,
                             Method::POST));
  EXPECT_TRUE(layout.allows(config.defaultHeader.allowedMethods,
                            Method::DEFINE));
  EXPECT_TRUE(config.defaultHeader.cache.isPublic);
  EXPECT_EQ(config.defaultHeader.cache.maxAge, 3600u);
  EXPECT_TRUE(isZero(config.defaultHeader.resourceAdmin));

  ASSERT_TRUE(config.roles["SITE_ADMIN_ROLE"]);
  EXPECT_EQ(config.roles["SITE_ADMIN_ROLE"][0].as<std::string>(),
            "site-admin");
}

TEST(SiteConfigTest, MissingFileThrows) {
  EXPECT_THROW(loadSiteConfig("does_not_exist.yaml"), InvalidState);
}

TEST(SiteConfigTest, CustomMethodLayout) {
  YAML::Node node = YAML::Load(R"(
methods: {HEAD: 8, DEFINE: 0}
default_header:
  methods: [HEAD]
)");
  SiteConfig config = SiteConfig::fromYaml(node);
  EXPECT_EQ(config.methods.bit(Method::HEAD), 8);
  EXPECT_EQ(config.methods.bit(Method::DEFINE), 0);
  EXPECT_EQ(config.defaultHeader.allowedMethods, 1u << 8);
}

TEST(SiteConfigTest, InvalidValuesFallBackToDefaults) {
  YAML::Node node = YAML::Load(R"(
royalty:
  rate: lots
  publisher_share_percent: 150
methods: {HEAD: 1}
validation:
  strict: maybe
)");
  SiteConfig config = SiteConfig::fromYaml(node);
  EXPECT_EQ(config.royalty.rate, 1u);
  EXPECT_EQ(config.royalty.publisherSharePercent, 90u);
  // HEAD would collide with GET.
  EXPECT_EQ(config.methods.bit(Method::HEAD), 0);
  EXPECT_FALSE(config.strictValidation);
}

TEST(SiteConfigTest, OversizedMethodBitIsRejected) {
  // 259 would wrap to 3 if narrowed, a legal swap with PUT.
  YAML::Node node = YAML::Load(R"(
methods: {HEAD: 259, PUT: 0}
)");
  SiteConfig config = SiteConfig::fromYaml(node);
  EXPECT_EQ(config.methods.bit(Method::HEAD), 0);
  EXPECT_EQ(config.methods.bit(Method::PUT), 3);
}

TEST(SiteConfigTest, HeaderRoles) {
  YAML::Node node = YAML::Load(R"(
default_header:
  allowed_mask: 3
  resource_admin: public
  redirect: {code: 301, location: /moved}
)");
  SiteConfig config = SiteConfig::fromYaml(node);
  EXPECT_EQ(config.defaultHeader.allowedMethods, 3u);
  EXPECT_EQ(config.defaultHeader.resourceAdmin, AccessControl::PUBLIC_ROLE);
  EXPECT_EQ(config.defaultHeader.redirect.code, 301);
  EXPECT_EQ(config.defaultHeader.redirect.location, "/moved");

  YAML::Node named = YAML::Load("default_header: {resource_admin: EDITOR_ROLE}");
  EXPECT_EQ(SiteConfig::fromYaml(named).defaultHeader.resourceAdmin,
            AccessControl::roleId("EDITOR_ROLE"));
}

TEST(SiteConfigTest, DefaultConfigPathHonoursEnvironment) {
  unsetenv("WTTP_CONFIG");
  EXPECT_EQ(defaultConfigPath(), DEFAULT_CONFIG_FILE);
  setenv("WTTP_CONFIG", "/etc/wttp/site.yaml", 1);
  EXPECT_EQ(defaultConfigPath(), "/etc/wttp/site.yaml");
  unsetenv("WTTP_CONFIG");
}
