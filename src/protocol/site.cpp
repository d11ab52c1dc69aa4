#include "protocol/site.h"
#include "utilities/errors.h"

#include <filesystem>

namespace wttp {

Site::Site(SiteConfig config, Clock clock) : config_(std::move(config)) {
  chunks_ = std::make_unique<ChunkStore>();
  registry_ = std::make_unique<ChunkRegistry>(*chunks_, config_.owner,
                                              config_.royalty);
  access_ = std::make_unique<AccessControl>(config_.owner);
  access_->applyPolicy(config_.roles);

  auto catalog = std::make_unique<ResourceCatalog>(
      *registry_, *access_, config_.defaultHeader, config_.methods,
      config_.strictValidation, std::move(clock));
  ResourceCatalog &catalogRef = *catalog;
  engine_ = std::make_unique<ProtocolEngine>(std::move(catalog), *access_,
                                             config_.protocol);
  gateway_ = std::make_unique<Gateway>(*engine_);
  state_ = std::make_unique<StateStore>(*chunks_, *registry_, *access_,
                                        catalogRef);

  if (!config_.stateFile.empty() &&
      std::filesystem::exists(config_.stateFile)) {
    loadState();
  }
  Logger::getInstance().log(LogLevel::INFO, "Site ready",
                            {{"protocol", config_.protocol},
                             {"owner", config_.owner},
                             {"strict", config_.strictValidation ? "true"
                                                                 : "false"}});
}

std::unique_ptr<Site> Site::open(const std::string &configPath) {
  std::string path = configPath.empty() ? defaultConfigPath() : configPath;
  SiteConfig config = loadSiteConfig(path);
  initLogging(config.logging);
  Logger::getInstance().log(LogLevel::INFO, "Configuration loaded",
                            {{"file", path}});
  return std::make_unique<Site>(std::move(config));
}

void Site::initLogging(const LoggingConfig &logging) {
  Logger::init(logging.file, logging.level, logging.maxFileSize,
               logging.maxBackupFiles);
}

std::string Site::statePath(const std::string &path) const {
  std::string resolved = path.empty() ? config_.stateFile : path;
  if (resolved.empty()) {
    ThrowInvalidState("No state file configured");
  }
  return resolved;
}

bool Site::saveState(const std::string &path) const {
  return state_->save(statePath(path));
}

bool Site::loadState(const std::string &path) {
  return state_->load(statePath(path));
}

} // namespace wttp
