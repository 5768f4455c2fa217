#pragma once

#include <string_view>

namespace star::http {

inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";
inline constexpr std::string_view HeaderSep = ": ";

// Header field names in canonical form. Parsing compares them case-insensitively.
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Date = "Date";
inline constexpr std::string_view Server = "Server";

inline constexpr std::string_view close = "close";

inline constexpr std::string_view ContentTypeTextHtml = "text/html";

inline constexpr std::string_view ServerName = "star";

}  // namespace star::http
