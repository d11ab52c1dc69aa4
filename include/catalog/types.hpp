#ifndef WTTP_CATALOG_TYPES_HPP
#define WTTP_CATALOG_TYPES_HPP

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "storage/types.hpp"
#include "utilities/digest.hpp"

namespace wttp {

/// Protocol verbs. The enumerator order is the default bit layout.
enum class Method : uint8_t {
  HEAD,
  GET,
  POST, // reserved
  PUT,
  PATCH,
  DELETE,
  OPTIONS,
  LOCATE,
  DEFINE
};

inline constexpr size_t METHOD_COUNT = 9;

using MethodMask = uint16_t;

std::string methodToString(Method method);
std::optional<Method> stringToMethod(const std::string &name);

/// True for verbs that mutate a resource.
bool isWriteMethod(Method method);

/**
 * @brief Maps verbs to bit positions in a header's allowed-methods mask.
 *
 * Revisions of the protocol disagreed on the ordering, so it is policy
 * rather than a constant.
 */
class MethodLayout {
public:
  MethodLayout();

  /**
   * @brief Build a layout from explicit bit positions.
   * @throw MalformedParameter On duplicate or out-of-range positions.
   */
  static MethodLayout fromBits(const std::array<uint8_t, METHOD_COUNT> &bits);

  uint8_t bit(Method method) const;
  MethodMask mask(Method method) const;
  MethodMask mask(std::initializer_list<Method> methods) const;
  bool allows(MethodMask allowed, Method method) const;

  /// Mask with every legal bit set.
  static MethodMask fullMask() { return (1u << METHOD_COUNT) - 1; }

private:
  std::array<uint8_t, METHOD_COUNT> bits_;
};

struct CacheControl {
  uint32_t maxAge = 0;
  uint32_t sMaxage = 0;
  bool noStore = false;
  bool noCache = false;
  bool immutable = false;
  bool isPublic = false;
  bool mustRevalidate = false;
  bool proxyRevalidate = false;
  bool mustUnderstand = false;
  uint32_t staleWhileRevalidate = 0;
  uint32_t staleIfError = 0;

  bool operator==(const CacheControl &) const = default;
};

struct Redirect {
  uint16_t code = 0; ///< 0 or 300-309
  std::string location;

  bool operator==(const Redirect &) const = default;
};

/**
 * @brief Shared, content-addressed policy bundle for resources.
 */
struct Header {
  MethodMask allowedMethods = 0;
  CacheControl cache;
  Redirect redirect;
  Digest resourceAdmin{}; ///< Role allowed to mutate; all-ones is public

  bool operator==(const Header &) const = default;
};

/// Canonical SHA-256 identity of a header.
Digest hashHeader(const Header &header);

struct ResourceMetadata {
  std::string mimeType;
  std::string charset;
  std::string encoding;
  std::string language;
  uint64_t size = 0;         ///< derived
  uint64_t version = 0;      ///< derived
  Timestamp lastModified = 0; ///< derived
  Digest headerRef{};

  bool operator==(const ResourceMetadata &) const = default;
};

using ChunkList = std::vector<Digest>;

/// One chunk to register at a position of a resource.
struct DataRegistration {
  Bytes data;
  uint64_t chunkIndex = 0;
  Identity publisher;
};

/// hash(metadata || chunk addresses); recomputed on demand.
Digest computeEtag(const ResourceMetadata &metadata, const ChunkList &chunks);

} // namespace wttp

#endif // WTTP_CATALOG_TYPES_HPP
