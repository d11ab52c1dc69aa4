#pragma once
#ifndef WTTP_GATEWAY_H
#define WTTP_GATEWAY_H

#include "gateway/range.hpp"
#include "protocol/protocol_engine.h"

namespace wttp {

/**
 * @brief Read-only facade adding byte and chunk ranges to the engine.
 *
 * Holds no state of its own. Anything but a 200 from the engine passes
 * through untouched.
 */
class Gateway {
public:
  explicit Gateway(const ProtocolEngine &engine);

  OptionsResponse handleOptions(const RequestLine &line,
                                const Identity &caller) const;
  HeadResponse handleHead(const HeadRequest &request,
                          const Identity &caller) const;

  /// 200 for the whole list, 206 for a slice, 416 if unsatisfiable.
  LocateResponse handleLocate(const LocateRequest &request,
                              const Identity &caller) const;

  /// Reassembles bytes; 200 full, 206 partial, 416 unsatisfiable.
  GetResponse handleGet(const GetRequest &request,
                        const Identity &caller) const;

private:
  const ProtocolEngine &engine_;
};

} // namespace wttp

#endif // WTTP_GATEWAY_H
