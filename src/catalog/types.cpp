#include "catalog/types.hpp"
#include "utilities/errors.h"
#include "utilities/hasher.hpp"

namespace wttp {

std::string methodToString(Method method) {
  switch (method) {
  case Method::HEAD:
    return "HEAD";
  case Method::GET:
    return "GET";
  case Method::POST:
    return "POST";
  case Method::PUT:
    return "PUT";
  case Method::PATCH:
    return "PATCH";
  case Method::DELETE:
    return "DELETE";
  case Method::OPTIONS:
    return "OPTIONS";
  case Method::LOCATE:
    return "LOCATE";
  case Method::DEFINE:
    return "DEFINE";
  }
  return "INVALID";
}

std::optional<Method> stringToMethod(const std::string &name) {
  for (size_t i = 0; i < METHOD_COUNT; ++i) {
    Method m = static_cast<Method>(i);
    if (methodToString(m) == name)
      return m;
  }
  return std::nullopt;
}

bool isWriteMethod(Method method) {
  switch (method) {
  case Method::PUT:
  case Method::PATCH:
  case Method::DELETE:
  case Method::DEFINE:
    return true;
  default:
    return false;
  }
}

MethodLayout::MethodLayout() {
  for (size_t i = 0; i < METHOD_COUNT; ++i) {
    bits_[i] = static_cast<uint8_t>(i);
  }
}

MethodLayout
MethodLayout::fromBits(const std::array<uint8_t, METHOD_COUNT> &bits) {
  MethodMask seen = 0;
  for (size_t i = 0; i < METHOD_COUNT; ++i) {
    if (bits[i] >= METHOD_COUNT) {
      ThrowMalformedParameter("Method bit for " +
                              methodToString(static_cast<Method>(i)) +
                              " out of range: " + std::to_string(bits[i]));
    }
    if (seen & (1u << bits[i])) {
      ThrowMalformedParameter("Duplicate method bit " +
                              std::to_string(bits[i]));
    }
    seen |= static_cast<MethodMask>(1u << bits[i]);
  }
  MethodLayout layout;
  layout.bits_ = bits;
  return layout;
}

uint8_t MethodLayout::bit(Method method) const {
  return bits_[static_cast<size_t>(method)];
}

MethodMask MethodLayout::mask(Method method) const {
  return static_cast<MethodMask>(1u << bit(method));
}

MethodMask MethodLayout::mask(std::initializer_list<Method> methods) const {
  MethodMask m = 0;
  for (Method method : methods) {
    m |= mask(method);
  }
  return m;
}

bool MethodLayout::allows(MethodMask allowed, Method method) const {
  return (allowed & mask(method)) != 0;
}

Digest hashHeader(const Header &header) {
  Hasher h(HashAlgorithm::SHA256);
  h.ingestString("wttp.header.v1");
  h.ingestU64(header.allowedMethods);
  const CacheControl &c = header.cache;
  h.ingestU64(c.maxAge);
  h.ingestU64(c.sMaxage);
  h.ingestBool(c.noStore);
  h.ingestBool(c.noCache);
  h.ingestBool(c.immutable);
  h.ingestBool(c.isPublic);
  h.ingestBool(c.mustRevalidate);
  h.ingestBool(c.proxyRevalidate);
  h.ingestBool(c.mustUnderstand);
  h.ingestU64(c.staleWhileRevalidate);
  h.ingestU64(c.staleIfError);
  h.ingestU64(header.redirect.code);
  h.ingestString(header.redirect.location);
  h.ingestDigest(header.resourceAdmin);
  return h.finalize();
}

Digest computeEtag(const ResourceMetadata &metadata, const ChunkList &chunks) {
  Hasher h(HashAlgorithm::SHA256);
  h.ingestString(metadata.mimeType);
  h.ingestString(metadata.charset);
  h.ingestString(metadata.encoding);
  h.ingestString(metadata.language);
  h.ingestU64(metadata.size);
  h.ingestU64(metadata.version);
  h.ingestU64(metadata.lastModified);
  h.ingestDigest(metadata.headerRef);
  h.ingestU64(chunks.size());
  for (const auto &address : chunks) {
    h.ingestDigest(address);
  }
  return h.finalize();
}

} // namespace wttp
