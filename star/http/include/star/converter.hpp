#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "star/path-value.hpp"

namespace star {

enum class ConverterKind : std::uint8_t { Int, String, Float };

// A named value parser usable in typed placeholders (<kind:name>).
// accepts() tells whether text is entirely matched by the regex fragment; convert() turns it into a PathValue.
// No fragment matches '/', so a captured value never spans two path segments.
struct Converter {
  using AcceptFn = bool (*)(std::string_view) noexcept;
  using ConvertFn = PathValue (*)(std::string_view);

  [[nodiscard]] bool accepts(std::string_view text) const noexcept { return acceptFn(text); }

  // Converts text already matched by regexFragment.
  // Throws ConversionError if text does not satisfy the converter contract.
  [[nodiscard]] PathValue convert(std::string_view text) const { return convertFn(text); }

  ConverterKind kind;
  std::string_view name;
  std::string_view regexFragment;
  AcceptFn acceptFn;
  ConvertFn convertFn;
};

// Returns the converter registered under name ("int", "string" or "float").
// Throws UnknownConverterKind for any other name.
const Converter& LookupConverter(std::string_view name);

const Converter& GetConverter(ConverterKind kind) noexcept;

// The fixed, process-wide converter registry.
std::span<const Converter> AllConverters() noexcept;

}  // namespace star
