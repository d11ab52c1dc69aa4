#include "protocol/site_config.hpp"
#include "catalog/codec.hpp"
#include "utilities/errors.h"

#include <cstdlib>

namespace wttp {

namespace {

template <typename T>
void readField(const YAML::Node &parent, const char *key, T &target,
               const std::string &name) {
  const YAML::Node node = parent[key];
  if (!node) {
    return;
  }
  try {
    target = node.as<T>();
  } catch (const YAML::Exception &e) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Invalid config value, using default",
                              {{"key", name}, {"reason", e.what()}});
  }
}

MethodLayout readLayout(const YAML::Node &node) {
  std::array<uint8_t, METHOD_COUNT> bits{};
  for (size_t i = 0; i < METHOD_COUNT; ++i) {
    bits[i] = static_cast<uint8_t>(i);
  }
  try {
    for (const auto &kv : node) {
      auto method = stringToMethod(kv.first.as<std::string>());
      if (!method) {
        ThrowMalformedParameter("Unknown method " +
                                kv.first.as<std::string>());
      }
      unsigned bit = kv.second.as<unsigned>();
      if (bit >= METHOD_COUNT) {
        ThrowMalformedParameter("Method bit for " +
                                kv.first.as<std::string>() +
                                " out of range: " + std::to_string(bit));
      }
      bits[static_cast<size_t>(*method)] = static_cast<uint8_t>(bit);
    }
    return MethodLayout::fromBits(bits);
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Invalid method layout, using default",
                              {{"key", "methods"}, {"reason", e.what()}});
    return MethodLayout();
  }
}

} // namespace

Header SiteConfig::defaultSiteHeader() {
  Header header;
  header.allowedMethods = MethodLayout::fullMask();
  header.cache.maxAge = 3600;
  header.cache.isPublic = true;
  return header;
}

SiteConfig SiteConfig::fromYaml(const YAML::Node &node) {
  SiteConfig config;
  if (!node || !node.IsMap()) {
    return config;
  }
  readField(node, "protocol", config.protocol, "protocol");
  readField(node, "owner", config.owner, "owner");
  readField(node, "state_file", config.stateFile, "state_file");

  if (const YAML::Node royalty = node["royalty"]) {
    readField(royalty, "rate", config.royalty.rate, "royalty.rate");
    readField(royalty, "publisher_share_percent",
              config.royalty.publisherSharePercent,
              "royalty.publisher_share_percent");
    readField(royalty, "base_cost", config.royalty.baseCost,
              "royalty.base_cost");
    readField(royalty, "cost_per_word", config.royalty.costPerWord,
              "royalty.cost_per_word");
    if (config.royalty.publisherSharePercent > 100) {
      Logger::getInstance().log(
          LogLevel::WARN, "Invalid config value, using default",
          {{"key", "royalty.publisher_share_percent"},
           {"reason", "above 100"}});
      config.royalty.publisherSharePercent = RoyaltyPolicy{}.publisherSharePercent;
    }
  }

  if (const YAML::Node validation = node["validation"]) {
    readField(validation, "strict", config.strictValidation,
              "validation.strict");
  }

  if (const YAML::Node methods = node["methods"]) {
    config.methods = readLayout(methods);
  }

  if (const YAML::Node header = node["default_header"]) {
    try {
      config.defaultHeader = decodeHeader(header, config.methods);
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Invalid default header, using default",
                                {{"key", "default_header"},
                                 {"reason", e.what()}});
    }
  }

  if (const YAML::Node logging = node["logging"]) {
    readField(logging, "file", config.logging.file, "logging.file");
    std::string level;
    readField(logging, "level", level, "logging.level");
    if (!level.empty()) {
      config.logging.level = Logger::levelFromString(level);
    }
    readField(logging, "max_file_size", config.logging.maxFileSize,
              "logging.max_file_size");
    readField(logging, "max_backup_files", config.logging.maxBackupFiles,
              "logging.max_backup_files");
  }

  if (node["roles"]) {
    config.roles = node["roles"];
  }
  return config;
}

SiteConfig loadSiteConfig(const std::string &path) {
  YAML::Node node;
  try {
    node = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    ThrowInvalidState("Cannot load config " + path + ": " + e.what());
  }
  SiteConfig config = SiteConfig::fromYaml(node);
  if (const char *env = std::getenv("WTTP_LOG_LEVEL")) {
    config.logging.level = Logger::levelFromString(env);
  }
  return config;
}

std::string defaultConfigPath() {
  if (const char *env = std::getenv("WTTP_CONFIG")) {
    return env;
  }
  return DEFAULT_CONFIG_FILE;
}

} // namespace wttp
