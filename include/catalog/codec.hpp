#ifndef WTTP_CATALOG_CODEC_HPP
#define WTTP_CATALOG_CODEC_HPP

#include <yaml-cpp/yaml.h>

#include "catalog/types.hpp"

namespace wttp {

/**
 * YAML shapes for headers and metadata, shared by the site config and the
 * state snapshot.
 *
 * A header's `resource_admin` is written as a CID. On input it may also be
 * `public`, empty, or a role name (hashed into a role id).
 */
YAML::Node encodeHeader(const Header &header, const MethodLayout &layout);
Header decodeHeader(const YAML::Node &node, const MethodLayout &layout);

YAML::Node encodeMetadata(const ResourceMetadata &metadata);
ResourceMetadata decodeMetadata(const YAML::Node &node);

/// Role reference as accepted in config files.
Digest decodeRole(const std::string &text);
std::string encodeRole(const Digest &role);

} // namespace wttp

#endif // WTTP_CATALOG_CODEC_HPP
