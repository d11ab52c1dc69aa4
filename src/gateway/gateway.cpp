#include "gateway/gateway.h"
#include "utilities/logger.h"

namespace wttp {

Gateway::Gateway(const ProtocolEngine &engine) : engine_(engine) {}

OptionsResponse Gateway::handleOptions(const RequestLine &line,
                                       const Identity &caller) const {
  return engine_.handleOptions(line, caller);
}

HeadResponse Gateway::handleHead(const HeadRequest &request,
                                 const Identity &caller) const {
  return engine_.handleHead(request, caller);
}

LocateResponse Gateway::handleLocate(const LocateRequest &request,
                                     const Identity &caller) const {
  LocateResponse response = engine_.handleLocate(request, caller);
  if (response.head.code != Status::OK) {
    return response;
  }

  auto resolved = resolveRange(request.rangeChunks, response.chunks.size());
  if (!resolved) {
    Logger::getInstance().log(
        LogLevel::DEBUG, "Chunk range not satisfiable",
        {{"path", request.head.line.path},
         {"start", std::to_string(request.rangeChunks.start)},
         {"end", std::to_string(request.rangeChunks.end)},
         {"total", std::to_string(response.chunks.size())}});
    response.head.code = Status::RANGE_NOT_SATISFIABLE;
    response.chunks.clear();
    return response;
  }
  if (!resolved->full) {
    response.chunks = sliceChunks(response.chunks, *resolved);
    response.head.code = Status::PARTIAL_CONTENT;
  }
  return response;
}

GetResponse Gateway::handleGet(const GetRequest &request,
                               const Identity &caller) const {
  LocateResponse located = engine_.handleGet(request, caller);
  GetResponse response;
  response.head = located.head;
  if (located.head.code != Status::OK) {
    return response;
  }

  const ChunkStore &store = engine_.chunks();
  std::vector<uint64_t> sizes;
  sizes.reserve(located.chunks.size());
  uint64_t total = 0;
  for (const auto &address : located.chunks) {
    sizes.push_back(store.size(address));
    total += sizes.back();
  }

  auto resolved = resolveRange(request.rangeBytes, total);
  if (!resolved) {
    Logger::getInstance().log(
        LogLevel::DEBUG, "Byte range not satisfiable",
        {{"path", request.head.line.path},
         {"start", std::to_string(request.rangeBytes.start)},
         {"end", std::to_string(request.rangeBytes.end)},
         {"total", std::to_string(total)}});
    response.head.code = Status::RANGE_NOT_SATISFIABLE;
    return response;
  }

  response.data = assembleBytes(
      sizes, [&](size_t i) { return store.read(located.chunks[i]); },
      *resolved);
  if (!resolved->full) {
    response.head.code = Status::PARTIAL_CONTENT;
  }
  return response;
}

} // namespace wttp
