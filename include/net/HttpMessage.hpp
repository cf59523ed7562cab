#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "util/Error.hpp"

namespace skynode::net {

struct HttpRequest {
  std::string method;
  std::string path;                           // without the query string
  std::map<std::string, std::string> query;   // decoded
  std::map<std::string, std::string> headers; // lower-case names
  std::string body;

  [[nodiscard]] std::string header(std::string_view name) const;
  [[nodiscard]] std::optional<std::string> query_param(std::string_view name) const;
};

struct HttpResponse {
  int status{200};
  std::string content_type{"application/json"};
  std::string body;
};

inline constexpr size_t kMaxHeaderBytes = 16 * 1024;
inline constexpr size_t kMaxBodyBytes = 1024 * 1024;

// Offset just past the blank line ending the header block, or nullopt when
// more bytes are needed.
[[nodiscard]] std::optional<size_t> header_end(std::string_view raw);

// Content-Length declared in a complete header block (0 when absent).
// BadRequest when it is malformed or above kMaxBodyBytes.
[[nodiscard]] util::Result<size_t> content_length(std::string_view headers);

// Parse a complete request (headers plus exactly Content-Length body bytes).
[[nodiscard]] util::Result<HttpRequest> parse_request(std::string_view raw);

[[nodiscard]] std::string url_decode(std::string_view s);

[[nodiscard]] const char* reason_phrase(int status);

// Status line and headers, terminated by the blank line. Body not included.
[[nodiscard]] std::string format_response_head(const HttpResponse& r);

} // namespace skynode::net
