#pragma once
#ifndef WTTP_PROTOCOL_ENGINE_H
#define WTTP_PROTOCOL_ENGINE_H

#include <memory>
#include <string>

#include "catalog/access_control.h"
#include "catalog/resource_catalog.h"
#include "protocol/messages.hpp"
#include "utilities/errors.h"

namespace wttp {

/**
 * @brief Derives response codes for the eight verbs.
 *
 * Read verbs are pure lookups. Each write verb takes the path's writer lock
 * and runs its catalog mutations in one Transaction, so it either fully
 * commits or leaves no trace. 404, 304, 405, 505 and redirects are ordinary
 * return values; permission, immutability, bounds and payment failures
 * propagate as exceptions.
 */
class ProtocolEngine {
public:
  ProtocolEngine(std::unique_ptr<ResourceCatalog> catalog,
                 AccessControl &access,
                 std::string protocol = DEFAULT_PROTOCOL);

  bool compatibleVersion(const std::string &protocol) const;
  const std::string &protocol() const { return protocol_; }

  OptionsResponse handleOptions(const RequestLine &line,
                                const Identity &caller) const;
  HeadResponse handleHead(const HeadRequest &request,
                          const Identity &caller) const;
  LocateResponse handleLocate(const LocateRequest &request,
                              const Identity &caller) const;

  /// Same checks as HEAD; returns chunk addresses, never bytes.
  LocateResponse handleGet(const GetRequest &request,
                           const Identity &caller) const;

  /**
   * @brief Replace the content and descriptive metadata of a path.
   * @param payment Value available for royalties; the unused part is
   *        reported as refund.
   */
  WriteResponse handlePut(const PutRequest &request, const Identity &caller,
                          Amount payment = 0);
  WriteResponse handlePatch(const PatchRequest &request,
                            const Identity &caller, Amount payment = 0);
  HeadResponse handleDelete(const HeadRequest &request,
                            const Identity &caller);
  DefineResponse handleDefine(const DefineRequest &request,
                              const Identity &caller);

  /// Bitmask check, with resource admins always allowed the write verbs.
  bool methodAllowed(const std::string &path, Method method,
                     const Identity &caller) const;

  ResourceCatalog &catalog() { return *catalog_; }
  const ResourceCatalog &catalog() const { return *catalog_; }
  const ChunkStore &chunks() const { return catalog_->registry().store(); }
  AccessControl &access() { return access_; }

private:
  // Steps 1-5 of the response pipeline; 200 when every check passes.
  HeadResponse evaluate(const HeadRequest &request, Method method,
                        const Identity &caller) const;
  // 505 / 405 precheck for write verbs; 0 when the request may proceed.
  uint16_t precheck(const RequestLine &line, Method method,
                    const Identity &caller) const;
  HeadResponse describe(const std::string &path, uint16_t code) const;
  void record(Method method, uint16_t code) const;
  void recordFailure(Method method, const WttpException &e) const;

  std::unique_ptr<ResourceCatalog> catalog_;
  AccessControl &access_;
  std::string protocol_;
};

} // namespace wttp

#endif // WTTP_PROTOCOL_ENGINE_H
