#pragma once
#ifndef WTTP_RESOURCE_CATALOG_H
#define WTTP_RESOURCE_CATALOG_H

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

#include "catalog/access_control.h"
#include "catalog/types.hpp"
#include "storage/chunk_registry.hpp"
#include "storage/content_table.hpp"
#include "storage/transaction.hpp"

namespace wttp {

using Clock = std::function<Timestamp()>;

/// Seconds since the Unix epoch.
Timestamp systemClock();

/// Outcome of registering one chunk of a resource.
struct ChunkWrite {
  Registration registration;
  uint64_t index = 0;
  bool appended = false;
};

/**
 * @brief Owns headers, per-path metadata and per-path chunk lists.
 *
 * Every mutation takes the Transaction of the verb driving it. The caller
 * is expected to hold lockPath(path) for the lifetime of that transaction.
 * Mutations are staged per transaction and published on commit, so the
 * public reads only ever see committed state. Reads return zero values for
 * unknown keys.
 */
class ResourceCatalog {
public:
  ResourceCatalog(ChunkRegistry &registry, AccessControl &access,
                  Header defaultHeader, MethodLayout layout = {},
                  bool strictValidation = false, Clock clock = systemClock);

  ResourceCatalog(const ResourceCatalog &) = delete;
  ResourceCatalog &operator=(const ResourceCatalog &) = delete;

  /**
   * @brief Intern @p header, validating it first.
   *
   * Invalid headers are still stored unless strict validation is on.
   * @throw MalformedParameter In strict mode only.
   */
  Digest createHeader(const Header &header);

  /// @return Empty string if valid, otherwise the first problem found.
  std::string validateHeader(const Header &header) const;

  /// The zero digest resolves to the catalog default header.
  Header readHeader(const Digest &hash) const;
  bool headerExists(const Digest &hash) const;
  Header headerFor(const std::string &path) const;
  const Header &defaultHeader() const { return defaultHeader_; }

  ResourceMetadata readMetadata(const std::string &path) const;
  ChunkList readChunkList(const std::string &path) const;
  uint64_t chunkCount(const std::string &path) const;
  bool hasContent(const std::string &path) const;
  Digest etag(const std::string &path) const;

  bool isResourceAdmin(const std::string &path, const Identity &caller) const;

  /// Immutable header and at least one chunk.
  bool isImmutable(const std::string &path) const;

  /**
   * @brief Writer lock of one path, held for a whole verb transaction.
   *
   * Lock slots are reference counted and dropped once no writer holds or
   * waits on them.
   */
  class PathLock {
  public:
    ~PathLock();
    PathLock(const PathLock &) = delete;
    PathLock &operator=(const PathLock &) = delete;

  private:
    friend class ResourceCatalog;
    PathLock(ResourceCatalog &catalog, std::string path);

    ResourceCatalog &catalog_;
    std::string path_;
    std::unique_lock<std::mutex> lock_;
  };

  PathLock lockPath(const std::string &path);

  /// Paths with a writer holding or waiting on their lock.
  size_t activePathLocks() const;

  /**
   * @brief Register one chunk at @p reg.chunkIndex of @p path.
   *
   * @throw PermissionDenied If @p caller is not a resource admin.
   * @throw ResourceImmutable If the path is locked.
   * @throw OutOfBoundsChunk If the index would leave a gap.
   * @throw InsufficientPayment From the royalty ledger.
   */
  ChunkWrite putChunk(Transaction &tx, const std::string &path,
                      const DataRegistration &reg, const Identity &caller,
                      Amount payment);

  /**
   * @brief Replace the descriptive fields and header reference.
   *
   * size, version and lastModified are recomputed, never taken from
   * @p fields.
   */
  void updateMetadata(Transaction &tx, const std::string &path,
                      const ResourceMetadata &fields, const Identity &caller);

  /**
   * @brief Intern @p header and bind @p path to it.
   *
   * Once an immutable resource has content, the new header keeps the lock:
   * PUT, PATCH and DELETE are cleared and cache.immutable is forced.
   *
   * @return Hash of the header actually bound.
   */
  Digest defineHeader(Transaction &tx, const std::string &path,
                      const Header &header, const Identity &caller);

  /// Clear content and descriptive metadata. The header binding stays.
  void deleteResource(Transaction &tx, const std::string &path,
                      const Identity &caller);

  const MethodLayout &layout() const { return layout_; }
  bool strictValidation() const { return strict_; }
  ChunkRegistry &registry() { return registry_; }
  const ChunkRegistry &registry() const { return registry_; }
  AccessControl &access() { return access_; }
  Timestamp now() const { return clock_(); }

  YAML::Node exportState() const;
  void importState(const YAML::Node &node);

private:
  struct Entry {
    ResourceMetadata metadata;
    ChunkList chunks;
  };

  void requireResourceAdmin(const Transaction &tx, const std::string &path,
                            const Identity &caller,
                            const std::string &action) const;
  void requireMutable(const Transaction &tx, const std::string &path) const;
  void signalMalformed(const std::string &subject, const std::string &reason);

  Entry loadEntry(const std::string &path) const;
  // Staged entry of tx if any, otherwise the committed one.
  Entry workingEntry(const Transaction &tx, const std::string &path) const;
  bool workingImmutable(const Transaction &tx, const std::string &path) const;
  void storeEntry(Transaction &tx, const std::string &path, Entry entry);
  void publish(const Transaction *tx);
  // Bumps version at most once per path per transaction.
  void stamp(Transaction &tx, const std::string &path, Entry &entry) const;

  ChunkRegistry &registry_;
  AccessControl &access_;
  Header defaultHeader_;
  MethodLayout layout_;
  bool strict_;
  Clock clock_;

  ContentTable<Header> headers_;

  mutable std::mutex entriesMutex_;
  std::map<std::string, Entry> entries_;
  std::unordered_map<const Transaction *, std::map<std::string, Entry>>
      staged_;

  struct LockSlot {
    std::mutex mutex;
    size_t users = 0;
  };

  mutable std::mutex locksMutex_;
  std::unordered_map<std::string, std::unique_ptr<LockSlot>> pathLocks_;
};

} // namespace wttp

#endif // WTTP_RESOURCE_CATALOG_H
