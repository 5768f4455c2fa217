#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "star/converter.hpp"
#include "star/path-value.hpp"

namespace star {

// Result of compiling a normalized route pattern.
//
// Placeholder syntax:
//  - "<kind:name>" typed placeholder, kind in {int, string, float}
//  - "<name>" untyped placeholder, captured as a raw string
//
// Typed and untyped placeholders are mutually exclusive within one pattern: as soon as one typed
// placeholder is present the whole pattern is compiled as Typed, and any "<name>" token it also
// contains is matched as literal text (angle brackets included). For instance "/a/<int:id>/<slug>"
// only matches "/a/42/<slug>". Do not mix both styles in the same pattern.
//
// A compiled pattern is equivalent to the anchored regex in regexSource. Since no converter fragment
// matches '/', matching is done segment by segment without a regex engine, in time and stack space
// independent of the path length for segments holding at most one placeholder.
struct CompiledPattern {
  enum class Mode : std::uint8_t { Literal, Typed, Untyped };

  // Piece of a pattern segment: literal text or a placeholder capture.
  struct Part {
    enum class Type : std::uint8_t { Literal, Capture };

    Type type{Type::Literal};
    ConverterKind kind{ConverterKind::String};  // Capture only, String for untyped placeholders
    std::string literal;                        // Literal only
  };

  // Parts of the text between two '/' of the pattern.
  using Segment = std::vector<Part>;

  // Full-string match of path against the pattern.
  // On success returns the captures in placeholder order, converted for Typed patterns and raw for
  // Untyped ones. Always returns std::nullopt for Literal patterns.
  // Throws ConversionError if a captured value violates its converter contract.
  [[nodiscard]] std::optional<std::vector<PathValue>> match(std::string_view path) const;

  Mode mode{Mode::Literal};
  std::string regexSource;                    // equivalent ECMAScript regex, meta characters escaped
  std::vector<Segment> segments;              // pattern split on '/'
  std::vector<ConverterKind> converterKinds;  // one per placeholder, Typed only
  std::vector<std::string> paramNames;        // one per placeholder
};

// Compile a normalized pattern. The result only depends on the pattern text.
// Throws UnknownConverterKind if a typed placeholder names an unknown converter.
CompiledPattern CompilePattern(std::string_view pattern);

// Escape regex meta characters so that text matches itself literally.
std::string EscapeRegex(std::string_view text);

}  // namespace star
