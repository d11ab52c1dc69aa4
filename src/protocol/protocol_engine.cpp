#include "protocol/protocol_engine.h"
#include "utilities/cid_utils.hpp"
#include "utilities/errors.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"

namespace wttp {

ProtocolEngine::ProtocolEngine(std::unique_ptr<ResourceCatalog> catalog,
                               AccessControl &access, std::string protocol)
    : catalog_(std::move(catalog)), access_(access),
      protocol_(std::move(protocol)) {
  if (!catalog_) {
    ThrowInvalidState("ProtocolEngine requires a catalog");
  }
}

bool ProtocolEngine::compatibleVersion(const std::string &protocol) const {
  return protocol == protocol_;
}

bool ProtocolEngine::methodAllowed(const std::string &path, Method method,
                                   const Identity &caller) const {
  if (access_.isSuperAdmin(caller)) {
    return true;
  }
  Header header = catalog_->headerFor(path);
  if (catalog_->layout().allows(header.allowedMethods, method)) {
    return true;
  }
  return isWriteMethod(method) && catalog_->isResourceAdmin(path, caller);
}

void ProtocolEngine::record(Method method, uint16_t code) const {
  MetricsRegistry::instance().incrementCounter(
      "wttp_requests_total", 1.0,
      {{"method", methodToString(method)}, {"code", std::to_string(code)}});
}

void ProtocolEngine::recordFailure(Method method,
                                   const WttpException &e) const {
  MetricsRegistry::instance().incrementCounter(
      "wttp_requests_total", 1.0,
      {{"method", methodToString(method)}, {"code", "failed"}});
  Logger::getInstance().log(LogLevel::WARN, "Request failed",
                            {{"method", methodToString(method)},
                             {"error", errorKindToString(e.kind())},
                             {"reason", e.what()}});
}

HeadResponse ProtocolEngine::describe(const std::string &path,
                                      uint16_t code) const {
  HeadResponse response;
  response.code = code;
  response.metadata = catalog_->readMetadata(path);
  response.header = catalog_->readHeader(response.metadata.headerRef);
  response.etag = catalog_->etag(path);
  return response;
}

HeadResponse ProtocolEngine::evaluate(const HeadRequest &request,
                                      Method method,
                                      const Identity &caller) const {
  const std::string &path = request.line.path;
  HeadResponse response;
  if (!compatibleVersion(request.line.protocol)) {
    response.code = Status::VERSION_NOT_SUPPORTED;
    return response;
  }
  if (!methodAllowed(path, method, caller)) {
    response.code = Status::METHOD_NOT_ALLOWED;
    return response;
  }
  if (!catalog_->hasContent(path)) {
    response.code = Status::NOT_FOUND;
    return response;
  }

  response = describe(path, Status::OK);
  bool etagMatch =
      !isZero(request.ifNoneMatch) && request.ifNoneMatch == response.etag;
  if (etagMatch ||
      request.ifModifiedSince > response.metadata.lastModified) {
    response.code = Status::NOT_MODIFIED;
  } else if (response.header.redirect.code != 0) {
    response.code = response.header.redirect.code;
  }
  return response;
}

uint16_t ProtocolEngine::precheck(const RequestLine &line, Method method,
                                  const Identity &caller) const {
  if (!compatibleVersion(line.protocol)) {
    return Status::VERSION_NOT_SUPPORTED;
  }
  if (!methodAllowed(line.path, method, caller)) {
    return Status::METHOD_NOT_ALLOWED;
  }
  return 0;
}

OptionsResponse ProtocolEngine::handleOptions(const RequestLine &line,
                                              const Identity &caller) const {
  OptionsResponse response;
  response.code = precheck(line, Method::OPTIONS, caller);
  if (response.code == 0) {
    response.code = Status::NO_CONTENT;
    response.allow = catalog_->headerFor(line.path).allowedMethods;
  }
  record(Method::OPTIONS, response.code);
  return response;
}

HeadResponse ProtocolEngine::handleHead(const HeadRequest &request,
                                        const Identity &caller) const {
  HeadResponse response = evaluate(request, Method::HEAD, caller);
  record(Method::HEAD, response.code);
  return response;
}

LocateResponse ProtocolEngine::handleLocate(const LocateRequest &request,
                                            const Identity &caller) const {
  LocateResponse response;
  response.head = evaluate(request.head, Method::LOCATE, caller);
  if (response.head.code == Status::OK) {
    response.chunks = catalog_->readChunkList(request.head.line.path);
  }
  record(Method::LOCATE, response.head.code);
  return response;
}

LocateResponse ProtocolEngine::handleGet(const GetRequest &request,
                                         const Identity &caller) const {
  LocateResponse response;
  response.head = evaluate(request.head, Method::GET, caller);
  if (response.head.code == Status::OK) {
    response.chunks = catalog_->readChunkList(request.head.line.path);
  }
  record(Method::GET, response.head.code);
  return response;
}

WriteResponse ProtocolEngine::handlePut(const PutRequest &request,
                                        const Identity &caller,
                                        Amount payment) {
  const std::string &path = request.head.line.path;
  auto lock = catalog_->lockPath(path);
  WriteResponse response;
  if (uint16_t code = precheck(request.head.line, Method::PUT, caller)) {
    response.head.code = code;
    record(Method::PUT, code);
    return response;
  }

  try {
    Transaction tx("PUT " + path);
    if (catalog_->hasContent(path)) {
      catalog_->deleteResource(tx, path, caller);
    }
    ResourceMetadata fields;
    fields.mimeType = request.mimeType;
    fields.charset = request.charset;
    fields.encoding = request.encoding;
    fields.language = request.language;
    fields.headerRef = catalog_->readMetadata(path).headerRef;
    catalog_->updateMetadata(tx, path, fields, caller);

    Amount remaining = payment;
    for (const auto &reg : request.chunks) {
      ChunkWrite write = catalog_->putChunk(tx, path, reg, caller, remaining);
      remaining -= write.registration.royaltyPaid;
      response.registered.push_back(write.registration);
    }
    tx.commit();
    response.royaltyPaid = payment - remaining;
    response.refund = remaining;
  } catch (const WttpException &e) {
    recordFailure(Method::PUT, e);
    throw;
  }

  response.head = describe(path, request.chunks.empty()
                                     ? Status::NO_CONTENT
                                     : Status::CREATED);
  Logger::getInstance().log(
      LogLevel::INFO, "PUT committed",
      {{"path", path},
       {"caller", caller},
       {"chunks", std::to_string(request.chunks.size())},
       {"size", std::to_string(response.head.metadata.size)}});
  record(Method::PUT, response.head.code);
  return response;
}

WriteResponse ProtocolEngine::handlePatch(const PatchRequest &request,
                                          const Identity &caller,
                                          Amount payment) {
  const std::string &path = request.head.line.path;
  auto lock = catalog_->lockPath(path);
  WriteResponse response;
  uint16_t code = precheck(request.head.line, Method::PATCH, caller);
  if (code == 0 && !catalog_->hasContent(path)) {
    code = Status::NOT_FOUND;
  }
  if (code != 0) {
    response.head.code = code;
    record(Method::PATCH, code);
    return response;
  }

  try {
    Transaction tx("PATCH " + path);
    Amount remaining = payment;
    for (const auto &reg : request.chunks) {
      ChunkWrite write = catalog_->putChunk(tx, path, reg, caller, remaining);
      remaining -= write.registration.royaltyPaid;
      response.registered.push_back(write.registration);
    }
    tx.commit();
    response.royaltyPaid = payment - remaining;
    response.refund = remaining;
  } catch (const WttpException &e) {
    recordFailure(Method::PATCH, e);
    throw;
  }

  response.head = describe(path, Status::OK);
  Logger::getInstance().log(
      LogLevel::INFO, "PATCH committed",
      {{"path", path},
       {"caller", caller},
       {"chunks", std::to_string(request.chunks.size())},
       {"version", std::to_string(response.head.metadata.version)}});
  record(Method::PATCH, Status::OK);
  return response;
}

HeadResponse ProtocolEngine::handleDelete(const HeadRequest &request,
                                          const Identity &caller) {
  const std::string &path = request.line.path;
  auto lock = catalog_->lockPath(path);
  uint16_t code = precheck(request.line, Method::DELETE, caller);
  if (code == 0 && !catalog_->hasContent(path)) {
    code = Status::NOT_FOUND;
  }
  if (code != 0) {
    HeadResponse response;
    response.code = code;
    record(Method::DELETE, code);
    return response;
  }

  try {
    Transaction tx("DELETE " + path);
    catalog_->deleteResource(tx, path, caller);
    tx.commit();
  } catch (const WttpException &e) {
    recordFailure(Method::DELETE, e);
    throw;
  }

  HeadResponse response = describe(path, Status::NO_CONTENT);
  record(Method::DELETE, response.code);
  return response;
}

DefineResponse ProtocolEngine::handleDefine(const DefineRequest &request,
                                            const Identity &caller) {
  const std::string &path = request.head.line.path;
  auto lock = catalog_->lockPath(path);
  DefineResponse response;
  if (uint16_t code = precheck(request.head.line, Method::DEFINE, caller)) {
    response.head.code = code;
    record(Method::DEFINE, code);
    return response;
  }

  try {
    Transaction tx("DEFINE " + path);
    response.headerHash = catalog_->defineHeader(tx, path, request.header,
                                                 caller);
    tx.commit();
  } catch (const WttpException &e) {
    recordFailure(Method::DEFINE, e);
    throw;
  }

  // A header alone does not make a resource exist.
  response.head = describe(path, catalog_->hasContent(path)
                                     ? Status::OK
                                     : Status::NOT_FOUND);
  Logger::getInstance().log(LogLevel::INFO, "DEFINE committed",
                            {{"path", path},
                             {"caller", caller},
                             {"header", digestToCid(response.headerHash)}});
  record(Method::DEFINE, response.head.code);
  return response;
}

} // namespace wttp
