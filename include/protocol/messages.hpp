#ifndef WTTP_MESSAGES_HPP
#define WTTP_MESSAGES_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "catalog/types.hpp"
#include "protocol/status.hpp"
#include "storage/chunk_registry.hpp"

namespace wttp {

inline constexpr const char *DEFAULT_PROTOCOL = "WTTP/3.0";

/// (start, end) with end exclusive; negatives count from the end, end 0
/// means "to the end".
struct Range {
  int64_t start = 0;
  int64_t end = 0;
};

struct RequestLine {
  std::string protocol = DEFAULT_PROTOCOL;
  std::string path;
  Method method = Method::HEAD;
};

struct HeadRequest {
  RequestLine line;
  Timestamp ifModifiedSince = 0;
  Digest ifNoneMatch{};
};

struct LocateRequest {
  HeadRequest head;
  Range rangeChunks;
};

struct GetRequest {
  HeadRequest head;
  Range rangeBytes;
};

struct PutRequest {
  HeadRequest head;
  std::string mimeType;
  std::string charset;
  std::string encoding;
  std::string language;
  std::vector<DataRegistration> chunks;
};

struct PatchRequest {
  HeadRequest head;
  std::vector<DataRegistration> chunks;
};

struct DefineRequest {
  HeadRequest head;
  Header header;
};

struct HeadResponse {
  uint16_t code = Status::INTERNAL_ERROR;
  ResourceMetadata metadata;
  Header header;
  Digest etag{};
};

struct OptionsResponse {
  uint16_t code = Status::INTERNAL_ERROR;
  MethodMask allow = 0;
};

struct LocateResponse {
  HeadResponse head;
  ChunkList chunks;
};

struct GetResponse {
  HeadResponse head;
  Bytes data;
};

struct WriteResponse {
  HeadResponse head;
  Amount royaltyPaid = 0;
  Amount refund = 0;
  std::vector<Registration> registered;
};

struct DefineResponse {
  HeadResponse head;
  Digest headerHash{};
};

} // namespace wttp

#endif // WTTP_MESSAGES_HPP
