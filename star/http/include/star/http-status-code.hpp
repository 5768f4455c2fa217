#pragma once

#include <cstdint>
#include <string_view>

namespace star::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeRequestHeaderFieldsTooLarge = 431;
inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeNotImplemented = 501;

inline constexpr std::string_view ReasonOK = "OK";
inline constexpr std::string_view ReasonBadRequest = "Bad Request";
inline constexpr std::string_view ReasonNotFound = "Not Found";
inline constexpr std::string_view ReasonHeadersTooLarge = "Request Header Fields Too Large";
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";
inline constexpr std::string_view ReasonNotImplemented = "Not Implemented";

// Return the canonical reason phrase for the status codes produced by the server.
constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeRequestHeaderFieldsTooLarge:
      return ReasonHeadersTooLarge;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    case StatusCodeNotImplemented:
      return ReasonNotImplemented;
    default:
      return {};
  }
}

}  // namespace star::http
