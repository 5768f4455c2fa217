#include "star/http-response.hpp"

#include <chrono>
#include <format>
#include <iterator>
#include <string>
#include <string_view>

#include "star/http-constants.hpp"
#include "star/http-status-code.hpp"

namespace star {

std::string CurrentRFC7231Date() {
  const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
  return std::format("{:%a, %d %b %Y %H:%M:%S} GMT", now);
}

std::string HttpResponse::serialize() const { return serialize(CurrentRFC7231Date()); }

std::string HttpResponse::serialize(std::string_view date) const {
  std::string out;
  out.reserve(160U + _body.size());

  auto outIt = std::back_inserter(out);
  std::format_to(outIt, "{} {} {}{}", http::HTTP11Sv, _status, http::ReasonPhraseFor(_status), http::CRLF);
  std::format_to(outIt, "{}{}{}{}", http::Server, http::HeaderSep, http::ServerName, http::CRLF);
  std::format_to(outIt, "{}{}{}{}", http::Date, http::HeaderSep, date, http::CRLF);
  std::format_to(outIt, "{}{}{}{}", http::ContentType, http::HeaderSep, contentType(), http::CRLF);
  std::format_to(outIt, "{}{}{}{}", http::ContentLength, http::HeaderSep, _body.size(), http::CRLF);
  std::format_to(outIt, "{}{}{}{}", http::Connection, http::HeaderSep, http::close, http::DoubleCRLF);
  out.append(_body);
  return out;
}

}  // namespace star
