#pragma once
#ifndef WTTP_SITE_H
#define WTTP_SITE_H

#include <memory>
#include <string>

#include "gateway/gateway.h"
#include "protocol/protocol_engine.h"
#include "protocol/site_config.hpp"
#include "storage/state_store.hpp"

namespace wttp {

/**
 * @brief One resource store wired from a SiteConfig.
 *
 * Owns the chunk store, royalty ledger, roles, engine (and through it the
 * catalog) and gateway. If the config names a state file that exists, it is
 * loaded on construction.
 */
class Site {
public:
  explicit Site(SiteConfig config, Clock clock = systemClock);

  Site(const Site &) = delete;
  Site &operator=(const Site &) = delete;

  /**
   * @brief Load a config file, route the process logger as it asks and
   *        build the site.
   *
   * @param configPath Empty means defaultConfigPath().
   * @throw InvalidState If the file cannot be read.
   */
  static std::unique_ptr<Site> open(const std::string &configPath = "");

  /// Route the process logger as the config asks.
  static void initLogging(const LoggingConfig &logging);

  ProtocolEngine &engine() { return *engine_; }
  Gateway &gateway() { return *gateway_; }
  ResourceCatalog &catalog() { return engine_->catalog(); }
  ChunkRegistry &registry() { return *registry_; }
  AccessControl &access() { return *access_; }
  const ChunkStore &chunks() const { return *chunks_; }
  const SiteConfig &config() const { return config_; }

  /// Empty @p path means the configured state file.
  bool saveState(const std::string &path = "") const;
  bool loadState(const std::string &path = "");

private:
  std::string statePath(const std::string &path) const;

  SiteConfig config_;
  std::unique_ptr<ChunkStore> chunks_;
  std::unique_ptr<ChunkRegistry> registry_;
  std::unique_ptr<AccessControl> access_;
  std::unique_ptr<ProtocolEngine> engine_;
  std::unique_ptr<Gateway> gateway_;
  std::unique_ptr<StateStore> state_;
};

} // namespace wttp

#endif // WTTP_SITE_H
