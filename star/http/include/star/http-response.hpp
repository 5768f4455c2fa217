#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "star/http-constants.hpp"
#include "star/http-status-code.hpp"

namespace star {

// A fully buffered text/html response. The status line is only produced by serialize(), after the
// body is known, so a failing handler can still change it.
class HttpResponse {
 public:
  explicit HttpResponse(http::StatusCode status = http::StatusCodeOK, std::string body = {}) noexcept
      : _body(std::move(body)), _status(status) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  [[nodiscard]] static constexpr std::string_view contentType() noexcept { return http::ContentTypeTextHtml; }

  HttpResponse& status(http::StatusCode status) noexcept {
    _status = status;
    return *this;
  }

  HttpResponse& body(std::string body) noexcept {
    _body = std::move(body);
    return *this;
  }

  // Serialize to HTTP/1.1 wire format with the current date.
  [[nodiscard]] std::string serialize() const;

  // Serialize to HTTP/1.1 wire format with the given Date header value (RFC 7231 format).
  [[nodiscard]] std::string serialize(std::string_view date) const;

 private:
  std::string _body;
  http::StatusCode _status;
};

// Current time in RFC 7231 format, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
std::string CurrentRFC7231Date();

}  // namespace star
