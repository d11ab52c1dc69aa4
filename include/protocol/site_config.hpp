#ifndef WTTP_SITE_CONFIG_HPP
#define WTTP_SITE_CONFIG_HPP

#include <string>
#include <yaml-cpp/yaml.h>

#include "catalog/types.hpp"
#include "storage/chunk_registry.hpp"
#include "utilities/logger.h"

namespace wttp {

inline constexpr const char *DEFAULT_CONFIG_FILE = "wttp_config.yaml";

struct LoggingConfig {
  std::string file = Logger::CONSOLE_ONLY_OUTPUT;
  LogLevel level = LogLevel::INFO;
  long long maxFileSize = 10 * 1024 * 1024;
  int maxBackupFiles = 5;
};

/**
 * @brief Everything needed to bring up a Site.
 *
 * Invalid values are logged at WARN and replaced by their defaults.
 */
struct SiteConfig {
  std::string protocol = "WTTP/3.0";
  Identity owner = "owner";
  RoyaltyPolicy royalty;
  bool strictValidation = false;
  MethodLayout methods;
  Header defaultHeader = defaultSiteHeader();
  LoggingConfig logging;
  std::string stateFile; ///< empty disables persistence
  YAML::Node roles;      ///< initial role membership

  static Header defaultSiteHeader();
  static SiteConfig fromYaml(const YAML::Node &node);
};

/**
 * @brief Load a config file.
 * @throw InvalidState If the file cannot be read or parsed.
 */
SiteConfig loadSiteConfig(const std::string &path);

/// $WTTP_CONFIG, or DEFAULT_CONFIG_FILE.
std::string defaultConfigPath();

} // namespace wttp

#endif // WTTP_SITE_CONFIG_HPP
