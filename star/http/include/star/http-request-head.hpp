#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace star {

// Request line and the few header values the server needs. Views point into the parsed buffer.
struct RequestHead {
  std::string_view method;   // raw method token, not validated
  std::string_view target;   // raw request target (path and optional query)
  std::string_view version;  // "HTTP/1.0", "HTTP/1.1", ...
  std::size_t contentLength{0};
  std::size_t headSize{0};  // size of the head including the terminating empty line
};

enum class HeadParseStatus : std::uint8_t { Ok, NeedMore, Malformed };

// Parse the head of an HTTP/1.x request ("METHOD target HTTP/x.y" followed by header lines and an
// empty line, CRLF separated).
// Returns NeedMore if buffer does not contain the full head yet.
HeadParseStatus ParseRequestHead(std::string_view buffer, RequestHead& head);

}  // namespace star
