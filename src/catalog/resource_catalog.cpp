#include "catalog/resource_catalog.h"
#include "catalog/codec.hpp"
#include "utilities/audit_log.hpp"
#include "utilities/cid_utils.hpp"
#include "utilities/errors.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <chrono>

namespace wttp {

Timestamp systemClock() {
  return static_cast<Timestamp>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

ResourceCatalog::ResourceCatalog(ChunkRegistry &registry,
                                 AccessControl &access, Header defaultHeader,
                                 MethodLayout layout, bool strictValidation,
                                 Clock clock)
    : registry_(registry), access_(access),
      defaultHeader_(std::move(defaultHeader)), layout_(layout),
      strict_(strictValidation), clock_(std::move(clock)),
      headers_(&hashHeader) {
  if (!clock_) {
    clock_ = systemClock;
  }
  std::string problem = validateHeader(defaultHeader_);
  if (!problem.empty()) {
    signalMalformed("default header", problem);
  }
  headers_.intern(defaultHeader_);
}

std::string ResourceCatalog::validateHeader(const Header &header) const {
  if (header.allowedMethods == 0) {
    return "allowed methods mask is empty";
  }
  if (header.allowedMethods > MethodLayout::fullMask()) {
    return "allowed methods mask " + std::to_string(header.allowedMethods) +
           " exceeds " + std::to_string(METHOD_COUNT) + " bits";
  }
  const Redirect &r = header.redirect;
  if (r.code != 0 && (r.code < 300 || r.code > 309)) {
    return "redirect code " + std::to_string(r.code) + " outside 300-309";
  }
  if (r.code != 0 && r.location.empty()) {
    return "redirect code " + std::to_string(r.code) + " without location";
  }
  if (r.code == 0 && !r.location.empty()) {
    return "redirect location without code";
  }
  return "";
}

void ResourceCatalog::signalMalformed(const std::string &subject,
                                      const std::string &reason) {
  if (strict_) {
    ThrowMalformedParameter(subject + ": " + reason);
  }
  Logger::getInstance().log(LogLevel::WARN, "Malformed parameter",
                            {{"subject", subject}, {"reason", reason}});
  MetricsRegistry::instance().incrementCounter(
      "wttp_malformed_parameters_total");
  AuditLog::getInstance().recordMalformed(subject, reason);
}

Digest ResourceCatalog::createHeader(const Header &header) {
  std::string problem = validateHeader(header);
  if (!problem.empty()) {
    signalMalformed("header", problem);
  }
  auto [hash, inserted] = headers_.intern(header);
  if (inserted) {
    Logger::getInstance().log(LogLevel::DEBUG, "Header created",
                              {{"header", digestToCid(hash)}});
  }
  return hash;
}

Header ResourceCatalog::readHeader(const Digest &hash) const {
  if (isZero(hash)) {
    return defaultHeader_;
  }
  const Header *found = headers_.find(hash);
  return found ? *found : Header{};
}

bool ResourceCatalog::headerExists(const Digest &hash) const {
  return isZero(hash) || headers_.contains(hash);
}

ResourceCatalog::Entry
ResourceCatalog::loadEntry(const std::string &path) const {
  std::lock_guard<std::mutex> lock(entriesMutex_);
  auto it = entries_.find(path);
  return it == entries_.end() ? Entry{} : it->second;
}

Header ResourceCatalog::headerFor(const std::string &path) const {
  return readHeader(loadEntry(path).metadata.headerRef);
}

ResourceMetadata ResourceCatalog::readMetadata(const std::string &path) const {
  return loadEntry(path).metadata;
}

ChunkList ResourceCatalog::readChunkList(const std::string &path) const {
  return loadEntry(path).chunks;
}

uint64_t ResourceCatalog::chunkCount(const std::string &path) const {
  std::lock_guard<std::mutex> lock(entriesMutex_);
  auto it = entries_.find(path);
  return it == entries_.end() ? 0 : it->second.chunks.size();
}

bool ResourceCatalog::hasContent(const std::string &path) const {
  return chunkCount(path) > 0;
}

Digest ResourceCatalog::etag(const std::string &path) const {
  Entry entry = loadEntry(path);
  return computeEtag(entry.metadata, entry.chunks);
}

bool ResourceCatalog::isResourceAdmin(const std::string &path,
                                      const Identity &caller) const {
  return access_.authorizes(headerFor(path).resourceAdmin, caller);
}

bool ResourceCatalog::isImmutable(const std::string &path) const {
  Entry entry = loadEntry(path);
  return !entry.chunks.empty() &&
         readHeader(entry.metadata.headerRef).cache.immutable;
}

ResourceCatalog::PathLock::PathLock(ResourceCatalog &catalog,
                                    std::string path)
    : catalog_(catalog), path_(std::move(path)) {
  LockSlot *slot;
  {
    std::lock_guard<std::mutex> guard(catalog_.locksMutex_);
    auto &entry = catalog_.pathLocks_[path_];
    if (!entry) {
      entry = std::make_unique<LockSlot>();
    }
    ++entry->users;
    slot = entry.get();
  }
  lock_ = std::unique_lock<std::mutex>(slot->mutex);
}

ResourceCatalog::PathLock::~PathLock() {
  lock_.unlock();
  std::lock_guard<std::mutex> guard(catalog_.locksMutex_);
  auto it = catalog_.pathLocks_.find(path_);
  if (it != catalog_.pathLocks_.end() && --it->second->users == 0) {
    catalog_.pathLocks_.erase(it);
  }
}

ResourceCatalog::PathLock ResourceCatalog::lockPath(const std::string &path) {
  return PathLock(*this, path);
}

size_t ResourceCatalog::activePathLocks() const {
  std::lock_guard<std::mutex> guard(locksMutex_);
  return pathLocks_.size();
}

ResourceCatalog::Entry
ResourceCatalog::workingEntry(const Transaction &tx,
                              const std::string &path) const {
  std::lock_guard<std::mutex> lock(entriesMutex_);
  auto pending = staged_.find(&tx);
  if (pending != staged_.end()) {
    auto it = pending->second.find(path);
    if (it != pending->second.end()) {
      return it->second;
    }
  }
  auto it = entries_.find(path);
  return it == entries_.end() ? Entry{} : it->second;
}

bool ResourceCatalog::workingImmutable(const Transaction &tx,
                                       const std::string &path) const {
  Entry entry = workingEntry(tx, path);
  return !entry.chunks.empty() &&
         readHeader(entry.metadata.headerRef).cache.immutable;
}

void ResourceCatalog::requireResourceAdmin(const Transaction &tx,
                                           const std::string &path,
                                           const Identity &caller,
                                           const std::string &action) const {
  Header header = readHeader(workingEntry(tx, path).metadata.headerRef);
  if (!access_.authorizes(header.resourceAdmin, caller)) {
    ThrowPermissionDenied(caller, action, path);
  }
}

void ResourceCatalog::requireMutable(const Transaction &tx,
                                     const std::string &path) const {
  // Content created earlier in the same transaction is still being written.
  if (tx.marked("fresh:" + path)) {
    return;
  }
  if (workingImmutable(tx, path)) {
    ThrowResourceImmutable(path);
  }
}

void ResourceCatalog::storeEntry(Transaction &tx, const std::string &path,
                                 Entry entry) {
  std::lock_guard<std::mutex> lock(entriesMutex_);
  auto &pending = staged_[&tx];
  if (pending.empty()) {
    const Transaction *key = &tx;
    tx.onCommit([this, key] { publish(key); });
    tx.onRollback([this, key] {
      std::lock_guard<std::mutex> guard(entriesMutex_);
      staged_.erase(key);
    });
  }
  pending[path] = std::move(entry);
}

void ResourceCatalog::publish(const Transaction *tx) {
  std::lock_guard<std::mutex> lock(entriesMutex_);
  auto pending = staged_.find(tx);
  if (pending == staged_.end()) {
    return;
  }
  for (auto &kv : pending->second) {
    entries_[kv.first] = std::move(kv.second);
  }
  staged_.erase(pending);
}

void ResourceCatalog::stamp(Transaction &tx, const std::string &path,
                            Entry &entry) const {
  if (tx.mark("version:" + path)) {
    entry.metadata.version += 1;
  }
  entry.metadata.lastModified = clock_();
}

ChunkWrite ResourceCatalog::putChunk(Transaction &tx, const std::string &path,
                                     const DataRegistration &reg,
                                     const Identity &caller, Amount payment) {
  requireResourceAdmin(tx, path, caller, "write chunk of");
  requireMutable(tx, path);

  Entry entry = workingEntry(tx, path);
  const uint64_t length = entry.chunks.size();
  if (reg.chunkIndex > length) {
    ThrowOutOfBoundsChunk(path, reg.chunkIndex, length);
  }

  ChunkWrite result;
  result.index = reg.chunkIndex;
  result.registration =
      registry_.registerChunk(tx, reg.data, reg.publisher, caller, payment);
  const uint64_t newSize = reg.data.size();

  if (reg.chunkIndex == length) {
    entry.chunks.push_back(result.registration.address);
    entry.metadata.size += newSize;
    result.appended = true;
  } else {
    const Digest &old = entry.chunks[reg.chunkIndex];
    entry.metadata.size -= registry_.store().size(old);
    entry.metadata.size += newSize;
    entry.chunks[reg.chunkIndex] = result.registration.address;
  }
  stamp(tx, path, entry);
  storeEntry(tx, path, std::move(entry));

  if (result.appended && reg.chunkIndex == 0) {
    tx.mark("fresh:" + path);
    tx.onCommit([path] { AuditLog::getInstance().recordCreate(path); });
  } else if (tx.mark("event:" + path)) {
    tx.onCommit([path] { AuditLog::getInstance().recordUpdate(path); });
  }
  Logger::getInstance().log(
      LogLevel::DEBUG, "Chunk registered",
      {{"path", path},
       {"index", std::to_string(reg.chunkIndex)},
       {"chunk", digestToCid(result.registration.address,
                             HashAlgorithm::BLAKE3)}});
  return result;
}

void ResourceCatalog::updateMetadata(Transaction &tx, const std::string &path,
                                     const ResourceMetadata &fields,
                                     const Identity &caller) {
  requireResourceAdmin(tx, path, caller, "update metadata of");
  requireMutable(tx, path);

  Entry entry = workingEntry(tx, path);
  entry.metadata.mimeType = fields.mimeType;
  entry.metadata.charset = fields.charset;
  entry.metadata.encoding = fields.encoding;
  entry.metadata.language = fields.language;
  entry.metadata.headerRef = fields.headerRef;
  stamp(tx, path, entry);
  storeEntry(tx, path, std::move(entry));

  if (tx.mark("event:" + path)) {
    tx.onCommit([path] {
      AuditLog::getInstance().recordUpdate(path, "metadata");
    });
  }
}

Digest ResourceCatalog::defineHeader(Transaction &tx, const std::string &path,
                                     const Header &header,
                                     const Identity &caller) {
  requireResourceAdmin(tx, path, caller, "define header of");

  Header effective = header;
  if (workingImmutable(tx, path)) {
    effective.allowedMethods &= static_cast<MethodMask>(~layout_.mask(
        {Method::PUT, Method::PATCH, Method::DELETE}));
    effective.cache.immutable = true;
    Logger::getInstance().log(LogLevel::INFO,
                              "Immutable resource keeps write lock",
                              {{"path", path}});
  }
  Digest hash = createHeader(effective);

  Entry entry = workingEntry(tx, path);
  entry.metadata.headerRef = hash;
  stamp(tx, path, entry);
  storeEntry(tx, path, std::move(entry));

  std::string cid = digestToCid(hash);
  tx.onCommit([path, cid] { AuditLog::getInstance().recordDefine(path, cid); });
  return hash;
}

void ResourceCatalog::deleteResource(Transaction &tx, const std::string &path,
                                     const Identity &caller) {
  requireResourceAdmin(tx, path, caller, "delete");
  requireMutable(tx, path);

  Entry previous = workingEntry(tx, path);
  Entry entry;
  entry.metadata.version = previous.metadata.version;
  entry.metadata.headerRef = previous.metadata.headerRef;
  stamp(tx, path, entry);
  storeEntry(tx, path, std::move(entry));

  tx.onCommit([path] { AuditLog::getInstance().recordDelete(path); });
  Logger::getInstance().log(LogLevel::INFO, "Resource deleted",
                            {{"path", path}});
}

YAML::Node ResourceCatalog::exportState() const {
  YAML::Node node;
  YAML::Node headers(YAML::NodeType::Sequence);
  headers_.forEach([&](const Digest &hash, const Header &header) {
    YAML::Node entry = encodeHeader(header, layout_);
    entry["hash"] = digestToCid(hash);
    headers.push_back(entry);
  });
  node["headers"] = headers;

  YAML::Node resources(YAML::NodeType::Map);
  std::lock_guard<std::mutex> lock(entriesMutex_);
  for (const auto &kv : entries_) {
    YAML::Node resource;
    resource["metadata"] = encodeMetadata(kv.second.metadata);
    YAML::Node chunks(YAML::NodeType::Sequence);
    for (const auto &address : kv.second.chunks) {
      chunks.push_back(digestToCid(address, HashAlgorithm::BLAKE3));
    }
    resource["chunks"] = chunks;
    resources[kv.first] = resource;
  }
  node["resources"] = resources;
  return node;
}

void ResourceCatalog::importState(const YAML::Node &node) {
  if (!node) {
    return;
  }
  if (node["headers"]) {
    for (const auto &entry : node["headers"]) {
      Digest hash = cidToDigest(entry["hash"].as<std::string>());
      Header header = decodeHeader(entry, layout_);
      if (hashHeader(header) != hash) {
        ThrowInvalidState("Header hash mismatch for " +
                          entry["hash"].as<std::string>());
      }
      headers_.insertAt(hash, header);
    }
  }
  if (node["resources"]) {
    std::lock_guard<std::mutex> lock(entriesMutex_);
    for (const auto &kv : node["resources"]) {
      Entry entry;
      entry.metadata = decodeMetadata(kv.second["metadata"]);
      for (const auto &cid : kv.second["chunks"]) {
        Digest address = cidToDigest(cid.as<std::string>());
        if (!registry_.store().exists(address)) {
          ThrowInvalidState("Resource " + kv.first.as<std::string>() +
                            " references unknown chunk " +
                            cid.as<std::string>());
        }
        entry.chunks.push_back(address);
      }
      entries_[kv.first.as<std::string>()] = std::move(entry);
    }
  }
}

} // namespace wttp
