#include "test_support.hpp"
#include "utilities/logger.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

using namespace wttp;

namespace {

std::vector<std::string> readLines(const std::string &path) {
  std::ifstream ifs(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(ifs, line)) {
    if (!line.empty())
      lines.push_back(line);
  }
  return lines;
}

} // namespace

class LoggerTest : public ::testing::Test {
protected:
  std::vector<std::string> files_to_remove_;

  std::string logFile(const std::string &name) {
    std::string path = (test::varDir() / name).string();
    std::remove(path.c_str());
    files_to_remove_.push_back(path);
    for (int i = 1; i <= 5; ++i)
      files_to_remove_.push_back(path + "." + std::to_string(i));
    return path;
  }

  void TearDown() override {
    // Release handles on the test files before removing them.
    Logger::init(test::testLogPath(), LogLevel::DEBUG);
    for (const auto &file : files_to_remove_) {
      std::remove(file.c_str());
    }
    files_to_remove_.clear();
  }
};

TEST_F(LoggerTest, LogLevelFiltering) {
  std::string path = logFile("filtering.log");
  Logger::init(path, LogLevel::WARN);
  Logger::getInstance().log(LogLevel::DEBUG, "debug dropped");
  Logger::getInstance().log(LogLevel::INFO, "info dropped");
  Logger::getInstance().log(LogLevel::WARN, "warn kept");
  Logger::getInstance().log(LogLevel::ERROR, "error kept");

  auto lines = readLines(path);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(YAML::Load(lines[0])["message"].as<std::string>(), "warn kept");
  EXPECT_EQ(YAML::Load(lines[1])["level"].as<std::string>(), "ERROR");
}

TEST_F(LoggerTest, LinesAreJsonWithStructuredFields) {
  std::string path = logFile("fields.log");
  Logger::init(path, LogLevel::INFO);
  Logger::getInstance().log(LogLevel::INFO, "say \"hi\"",
                            {{"path", "/a.txt"}, {"code", "200"}});

  auto lines = readLines(path);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].front(), '{');
  EXPECT_EQ(lines[0].back(), '}');
  YAML::Node node = YAML::Load(lines[0]);
  EXPECT_EQ(node["message"].as<std::string>(), "say \"hi\"");
  EXPECT_EQ(node["path"].as<std::string>(), "/a.txt");
  EXPECT_EQ(node["code"].as<std::string>(), "200");
  EXPECT_TRUE(node["timestamp"]);
}

TEST_F(LoggerTest, SetLogLevelAtRuntime) {
  std::string path = logFile("runtime.log");
  Logger::init(path, LogLevel::ERROR);
  Logger::getInstance().log(LogLevel::INFO, "before");
  Logger::getInstance().setLogLevel(LogLevel::INFO);
  EXPECT_EQ(Logger::getInstance().logLevel(), LogLevel::INFO);
  Logger::getInstance().log(LogLevel::INFO, "after");

  auto lines = readLines(path);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(YAML::Load(lines[0])["message"].as<std::string>(), "after");
}

TEST_F(LoggerTest, RotatesBySize) {
  std::string path = logFile("rotate.log");
  Logger::init(path, LogLevel::INFO, 256, 2);
  for (int i = 0; i < 40; ++i) {
    Logger::getInstance().log(LogLevel::INFO,
                              "rotation message " + std::to_string(i));
  }
  namespace fs = std::filesystem;
  EXPECT_TRUE(fs::exists(path));
  EXPECT_TRUE(fs::exists(path + ".1"));
  EXPECT_TRUE(fs::exists(path + ".2"));
  EXPECT_FALSE(fs::exists(path + ".3"));

  auto lines = readLines(path);
  ASSERT_FALSE(lines.empty());
  EXPECT_EQ(YAML::Load(lines.back())["message"].as<std::string>(),
            "rotation message 39");
}

TEST_F(LoggerTest, SiteOpenAppliesLoggingConfig) {
  std::string path = logFile("site_open.log");
  std::string configPath = (test::varDir() / "site_open.yaml").string();
  files_to_remove_.push_back(configPath);
  {
    std::ofstream out(configPath);
    out << "owner: owner\n"
        << "logging:\n"
        << "  file: " << path << "\n"
        << "  level: debug\n";
  }

  auto site = Site::open(configPath);
  ASSERT_NE(site, nullptr);
  EXPECT_EQ(Logger::getInstance().logLevel(), LogLevel::DEBUG);
  site->engine().handleHead(test::head("/nothing"), "owner");

  bool loaded = false;
  bool ready = false;
  for (const auto &line : readLines(path)) {
    std::string message = YAML::Load(line)["message"].as<std::string>();
    loaded = loaded || message == "Configuration loaded";
    ready = ready || message == "Site ready";
  }
  EXPECT_TRUE(loaded);
  EXPECT_TRUE(ready);
}

TEST(LoggerLevels, ParseAndPrint) {
  EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::DEBUG);
  EXPECT_EQ(Logger::levelFromString("Warning"), LogLevel::WARN);
  EXPECT_EQ(Logger::levelFromString("FATAL"), LogLevel::FATAL);
  EXPECT_EQ(Logger::levelFromString("nonsense"), LogLevel::INFO);
  EXPECT_EQ(Logger::levelToString(LogLevel::TRACE), "TRACE");
  EXPECT_EQ(Logger::levelToString(LogLevel::ERROR), "ERROR");
}
