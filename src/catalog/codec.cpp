#include "catalog/codec.hpp"
#include "catalog/access_control.h"
#include "utilities/cid_utils.hpp"
#include "utilities/errors.h"

namespace wttp {

namespace {

template <typename T>
T valueOr(const YAML::Node &node, const char *key, T fallback) {
  if (node[key]) {
    return node[key].as<T>();
  }
  return fallback;
}

} // namespace

std::string encodeRole(const Digest &role) {
  if (isZero(role))
    return "";
  if (role == AccessControl::PUBLIC_ROLE)
    return "public";
  return digestToCid(role);
}

Digest decodeRole(const std::string &text) {
  if (text.empty())
    return ZERO_DIGEST;
  if (text == "public")
    return AccessControl::PUBLIC_ROLE;
  try {
    return cidToDigest(text);
  } catch (const std::runtime_error &) {
    // not a CID, treat it as a role name
  }
  return AccessControl::roleId(text);
}

YAML::Node encodeHeader(const Header &header, const MethodLayout &layout) {
  YAML::Node node;
  YAML::Node methods(YAML::NodeType::Sequence);
  for (size_t i = 0; i < METHOD_COUNT; ++i) {
    Method m = static_cast<Method>(i);
    if (layout.allows(header.allowedMethods, m)) {
      methods.push_back(methodToString(m));
    }
  }
  node["methods"] = methods;
  node["allowed_mask"] = header.allowedMethods;

  const CacheControl &c = header.cache;
  YAML::Node cache;
  cache["max_age"] = c.maxAge;
  cache["s_maxage"] = c.sMaxage;
  cache["no_store"] = c.noStore;
  cache["no_cache"] = c.noCache;
  cache["immutable"] = c.immutable;
  cache["public"] = c.isPublic;
  cache["must_revalidate"] = c.mustRevalidate;
  cache["proxy_revalidate"] = c.proxyRevalidate;
  cache["must_understand"] = c.mustUnderstand;
  cache["stale_while_revalidate"] = c.staleWhileRevalidate;
  cache["stale_if_error"] = c.staleIfError;
  node["cache"] = cache;

  YAML::Node redirect;
  redirect["code"] = header.redirect.code;
  redirect["location"] = header.redirect.location;
  node["redirect"] = redirect;

  node["resource_admin"] = encodeRole(header.resourceAdmin);
  return node;
}

Header decodeHeader(const YAML::Node &node, const MethodLayout &layout) {
  Header header;
  if (!node || !node.IsMap()) {
    return header;
  }
  // An explicit mask wins over the verb list.
  if (node["allowed_mask"]) {
    header.allowedMethods = node["allowed_mask"].as<MethodMask>();
  } else if (node["methods"]) {
    for (const auto &entry : node["methods"]) {
      auto method = stringToMethod(entry.as<std::string>());
      if (!method) {
        ThrowMalformedParameter("Unknown method " + entry.as<std::string>());
      }
      header.allowedMethods |= layout.mask(*method);
    }
  }

  const YAML::Node cache = node["cache"];
  if (cache) {
    CacheControl &c = header.cache;
    c.maxAge = valueOr<uint32_t>(cache, "max_age", 0);
    c.sMaxage = valueOr<uint32_t>(cache, "s_maxage", 0);
    c.noStore = valueOr(cache, "no_store", false);
    c.noCache = valueOr(cache, "no_cache", false);
    c.immutable = valueOr(cache, "immutable", false);
    c.isPublic = valueOr(cache, "public", false);
    c.mustRevalidate = valueOr(cache, "must_revalidate", false);
    c.proxyRevalidate = valueOr(cache, "proxy_revalidate", false);
    c.mustUnderstand = valueOr(cache, "must_understand", false);
    c.staleWhileRevalidate = valueOr<uint32_t>(cache, "stale_while_revalidate", 0);
    c.staleIfError = valueOr<uint32_t>(cache, "stale_if_error", 0);
  }

  const YAML::Node redirect = node["redirect"];
  if (redirect) {
    header.redirect.code = valueOr<uint16_t>(redirect, "code", 0);
    header.redirect.location = valueOr<std::string>(redirect, "location", "");
  }
  header.resourceAdmin =
      decodeRole(valueOr<std::string>(node, "resource_admin", ""));
  return header;
}

YAML::Node encodeMetadata(const ResourceMetadata &metadata) {
  YAML::Node node;
  node["mime_type"] = metadata.mimeType;
  node["charset"] = metadata.charset;
  node["encoding"] = metadata.encoding;
  node["language"] = metadata.language;
  node["size"] = metadata.size;
  node["version"] = metadata.version;
  node["last_modified"] = metadata.lastModified;
  node["header"] =
      isZero(metadata.headerRef) ? std::string() : digestToCid(metadata.headerRef);
  return node;
}

ResourceMetadata decodeMetadata(const YAML::Node &node) {
  ResourceMetadata metadata;
  if (!node) {
    return metadata;
  }
  metadata.mimeType = valueOr<std::string>(node, "mime_type", "");
  metadata.charset = valueOr<std::string>(node, "charset", "");
  metadata.encoding = valueOr<std::string>(node, "encoding", "");
  metadata.language = valueOr<std::string>(node, "language", "");
  metadata.size = valueOr<uint64_t>(node, "size", 0);
  metadata.version = valueOr<uint64_t>(node, "version", 0);
  metadata.lastModified = valueOr<Timestamp>(node, "last_modified", 0);
  std::string header = valueOr<std::string>(node, "header", "");
  if (!header.empty()) {
    metadata.headerRef = cidToDigest(header);
  }
  return metadata;
}

} // namespace wttp
