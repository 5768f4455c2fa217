#include "star/converter.hpp"

#include <charconv>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include "star/path-value.hpp"
#include "star/router-errors.hpp"

namespace star {

namespace {

constexpr bool IsDigit(char ch) noexcept { return ch >= '0' && ch <= '9'; }

constexpr bool AllDigits(std::string_view text) noexcept {
  if (text.empty()) {
    return false;
  }
  for (char ch : text) {
    if (!IsDigit(ch)) {
      return false;
    }
  }
  return true;
}

bool AcceptsInt(std::string_view text) noexcept { return AllDigits(text); }

bool AcceptsString(std::string_view text) noexcept { return !text.empty() && !text.contains('/'); }

// Digits '.' digits, no sign, no exponent.
bool AcceptsFloat(std::string_view text) noexcept {
  const auto dotPos = text.find('.');
  return dotPos != std::string_view::npos && AllDigits(text.substr(0, dotPos)) && AllDigits(text.substr(dotPos + 1));
}

PathValue ConvertInt(std::string_view text) {
  if (!AcceptsInt(text)) {
    throw ConversionError("'{}' is not an integer", text);
  }
  int64_t value;
  const auto [ptr, errc] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (errc == std::errc::result_out_of_range) {
    throw ConversionError("Integer '{}' does not fit in 64 bits", text);
  }
  if (errc != std::errc() || ptr != text.data() + text.size()) {
    throw ConversionError("'{}' is not an integer", text);
  }
  return value;
}

PathValue ConvertString(std::string_view text) {
  if (!AcceptsString(text)) {
    throw ConversionError("'{}' is not a path segment", text);
  }
  return std::string(text);
}

PathValue ConvertFloat(std::string_view text) {
  if (!AcceptsFloat(text)) {
    throw ConversionError("'{}' is not a decimal number", text);
  }
  double value;
  const auto [ptr, errc] = std::from_chars(text.data(), text.data() + text.size(), value, std::chars_format::fixed);
  if (errc != std::errc() || ptr != text.data() + text.size()) {
    throw ConversionError("'{}' is not a representable decimal number", text);
  }
  return value;
}

// Indexed by ConverterKind.
constexpr Converter kConverters[] = {
    {ConverterKind::Int, "int", R"(\d+)", AcceptsInt, ConvertInt},
    {ConverterKind::String, "string", R"([^/]+)", AcceptsString, ConvertString},
    {ConverterKind::Float, "float", R"(\d+\.\d+)", AcceptsFloat, ConvertFloat},
};

}  // namespace

const Converter& LookupConverter(std::string_view name) {
  for (const Converter& converter : kConverters) {
    if (converter.name == name) {
      return converter;
    }
  }
  throw UnknownConverterKind("Unknown converter '{}'", name);
}

const Converter& GetConverter(ConverterKind kind) noexcept { return kConverters[static_cast<std::uint8_t>(kind)]; }

std::span<const Converter> AllConverters() noexcept { return kConverters; }

}  // namespace star
