#ifndef WTTP_STATE_STORE_HPP
#define WTTP_STATE_STORE_HPP

#include <string>

#include "catalog/access_control.h"
#include "catalog/resource_catalog.h"
#include "storage/chunk_registry.hpp"
#include "storage/chunk_store.hpp"

namespace wttp {

/**
 * @brief Snapshots every persisted table into one YAML document.
 *
 * Tables: chunk bytes, royalty records and balances, role membership,
 * headers, metadata and chunk lists. Loading is meant for a freshly
 * constructed site; existing entries with the same keys are overwritten.
 */
class StateStore {
public:
  static constexpr const char *FORMAT = "wttp-state/1";

  StateStore(ChunkStore &chunks, ChunkRegistry &registry,
             AccessControl &access, ResourceCatalog &catalog);

  YAML::Node snapshot() const;
  void restore(const YAML::Node &node);

  /// Write via a temporary file then rename. @return False on I/O error.
  bool save(const std::string &path) const;
  /// @return False if the file is missing or unreadable.
  /// @throw InvalidState On a document whose content fails verification.
  bool load(const std::string &path);

private:
  ChunkStore &chunks_;
  ChunkRegistry &registry_;
  AccessControl &access_;
  ResourceCatalog &catalog_;
};

} // namespace wttp

#endif // WTTP_STATE_STORE_HPP
