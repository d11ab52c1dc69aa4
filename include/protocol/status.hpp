#ifndef WTTP_STATUS_HPP
#define WTTP_STATUS_HPP

#include <cstdint>
#include <string>
#include <unordered_map>

namespace wttp {

namespace Status {
inline constexpr uint16_t OK = 200;
inline constexpr uint16_t CREATED = 201;
inline constexpr uint16_t NO_CONTENT = 204;
inline constexpr uint16_t PARTIAL_CONTENT = 206;
inline constexpr uint16_t NOT_MODIFIED = 304;
inline constexpr uint16_t NOT_FOUND = 404;
inline constexpr uint16_t METHOD_NOT_ALLOWED = 405;
inline constexpr uint16_t RANGE_NOT_SATISFIABLE = 416;
inline constexpr uint16_t INTERNAL_ERROR = 500;
inline constexpr uint16_t VERSION_NOT_SUPPORTED = 505;
} // namespace Status

const std::unordered_map<int, std::string> statusCode = {
    {200, "OK"},
    {201, "Created"},
    {204, "No Content"},
    {206, "Partial Content"},
    {300, "Multiple Choices"},
    {301, "Moved Permanently"},
    {302, "Found"},
    {303, "See Other"},
    {304, "Not Modified"},
    {305, "Use Proxy"},
    {306, "Switch Proxy"},
    {307, "Temporary Redirect"},
    {308, "Permanent Redirect"},
    {309, "Redirect"},
    {404, "Not Found"},
    {405, "Method Not Allowed"},
    {416, "Range Not Satisfiable"},
    {500, "Internal Server Error"},
    {505, "WTTP Version Not Supported"}};

inline std::string reasonPhrase(int code) {
  auto it = statusCode.find(code);
  return it == statusCode.end() ? "Unknown" : it->second;
}

inline bool isRedirect(int code) { return code >= 300 && code <= 309; }

} // namespace wttp

#endif // WTTP_STATUS_HPP
