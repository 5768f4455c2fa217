#include "star/http-request-head.hpp"

#include <charconv>
#include <cstddef>
#include <string_view>
#include <system_error>

#include "star/http-constants.hpp"
#include "star/string-equal-ignore-case.hpp"

namespace star {

namespace {

constexpr std::string_view TrimSpaces(std::string_view str) noexcept {
  while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) {
    str.remove_prefix(1);
  }
  while (!str.empty() && (str.back() == ' ' || str.back() == '\t')) {
    str.remove_suffix(1);
  }
  return str;
}

bool ParseRequestLine(std::string_view line, RequestHead& head) {
  const auto firstSp = line.find(' ');
  if (firstSp == std::string_view::npos || firstSp == 0) {
    return false;
  }
  const auto secondSp = line.find(' ', firstSp + 1);
  if (secondSp == std::string_view::npos || secondSp == firstSp + 1) {
    return false;
  }
  head.method = line.substr(0, firstSp);
  head.target = line.substr(firstSp + 1, secondSp - firstSp - 1);
  head.version = line.substr(secondSp + 1);
  return head.version.starts_with("HTTP/") && head.target.front() == '/';
}

bool ParseHeaderLine(std::string_view line, RequestHead& head) {
  const auto colonPos = line.find(':');
  if (colonPos == std::string_view::npos || colonPos == 0) {
    return false;
  }
  if (!CaseInsensitiveEqual(line.substr(0, colonPos), http::ContentLength)) {
    return true;
  }
  const std::string_view value = TrimSpaces(line.substr(colonPos + 1));
  const auto [ptr, errc] = std::from_chars(value.data(), value.data() + value.size(), head.contentLength);
  return !value.empty() && errc == std::errc() && ptr == value.data() + value.size();
}

}  // namespace

HeadParseStatus ParseRequestHead(std::string_view buffer, RequestHead& head) {
  const auto headEnd = buffer.find(http::DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    return HeadParseStatus::NeedMore;
  }
  head = RequestHead{};
  head.headSize = headEnd + http::DoubleCRLF.size();

  std::string_view remaining = buffer.substr(0, headEnd + http::CRLF.size());
  auto lineEnd = remaining.find(http::CRLF);
  if (!ParseRequestLine(remaining.substr(0, lineEnd), head)) {
    return HeadParseStatus::Malformed;
  }
  remaining.remove_prefix(lineEnd + http::CRLF.size());

  while (!remaining.empty()) {
    lineEnd = remaining.find(http::CRLF);
    if (!ParseHeaderLine(remaining.substr(0, lineEnd), head)) {
      return HeadParseStatus::Malformed;
    }
    remaining.remove_prefix(lineEnd + http::CRLF.size());
  }
  return HeadParseStatus::Ok;
}

}  // namespace star
