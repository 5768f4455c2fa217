#include "star/path-pattern.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "star/converter.hpp"
#include "star/path-value.hpp"

namespace star {

namespace {

using Part = CompiledPattern::Part;
using Captures = std::vector<std::string_view>;

constexpr bool IsWordChar(char ch) noexcept {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_';
}

std::size_t WordLen(std::string_view text, std::size_t pos) noexcept {
  std::size_t len = 0;
  while (pos + len < text.size() && IsWordChar(text[pos + len])) {
    ++len;
  }
  return len;
}

struct Placeholder {
  std::string_view kind;  // empty for untyped placeholders
  std::string_view name;
  std::size_t size{};
};

// Parses "<kind:name>" (typed) or "<name>" (untyped) starting at text[pos] == '<'.
std::optional<Placeholder> ParsePlaceholder(std::string_view text, std::size_t pos, bool typed) {
  Placeholder placeholder;
  std::size_t cur = pos + 1;
  if (typed) {
    const std::size_t kindLen = WordLen(text, cur);
    if (kindLen == 0 || cur + kindLen >= text.size() || text[cur + kindLen] != ':') {
      return std::nullopt;
    }
    placeholder.kind = text.substr(cur, kindLen);
    cur += kindLen + 1;
  }
  const std::size_t nameLen = WordLen(text, cur);
  if (nameLen == 0 || cur + nameLen >= text.size() || text[cur + nameLen] != '>') {
    return std::nullopt;
  }
  placeholder.name = text.substr(cur, nameLen);
  placeholder.size = cur + nameLen + 1 - pos;
  return placeholder;
}

void AppendEscaped(std::string& out, std::string_view text) {
  static constexpr std::string_view kMetaChars = R"(\^$.|?*+()[]{})";
  for (char ch : text) {
    if (kMetaChars.find(ch) != std::string_view::npos) {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
}

void AddLiteral(CompiledPattern& compiled, std::string_view text) {
  AppendEscaped(compiled.regexSource, text);
  for (char ch : text) {
    if (ch == '/') {
      compiled.segments.emplace_back();
      continue;
    }
    CompiledPattern::Segment& segment = compiled.segments.back();
    if (segment.empty() || segment.back().type != Part::Type::Literal) {
      segment.emplace_back();
    }
    segment.back().literal.push_back(ch);
  }
}

void AddCapture(CompiledPattern& compiled, const Converter& converter) {
  compiled.regexSource.push_back('(');
  compiled.regexSource.append(converter.regexFragment);
  compiled.regexSource.push_back(')');
  compiled.segments.back().push_back(Part{Part::Type::Capture, converter.kind, {}});
}

// Compiles pattern considering only one placeholder style, other '<...>' tokens being literal text.
// Returns the number of placeholders found.
std::size_t CompileWith(std::string_view pattern, bool typed, CompiledPattern& compiled) {
  compiled.regexSource.clear();
  compiled.segments.assign(1, CompiledPattern::Segment{});
  compiled.converterKinds.clear();
  compiled.paramNames.clear();

  std::size_t nbPlaceholders = 0;
  std::size_t literalBeg = 0;
  for (std::size_t pos = pattern.find('<'); pos != std::string_view::npos; pos = pattern.find('<', pos)) {
    const std::optional<Placeholder> placeholder = ParsePlaceholder(pattern, pos, typed);
    if (!placeholder) {
      ++pos;
      continue;
    }
    AddLiteral(compiled, pattern.substr(literalBeg, pos - literalBeg));
    const Converter& converter = typed ? LookupConverter(placeholder->kind) : GetConverter(ConverterKind::String);
    AddCapture(compiled, converter);
    if (typed) {
      compiled.converterKinds.push_back(converter.kind);
    }
    compiled.paramNames.emplace_back(placeholder->name);
    pos += placeholder->size;
    literalBeg = pos;
    ++nbPlaceholders;
  }
  AddLiteral(compiled, pattern.substr(literalBeg));
  return nbPlaceholders;
}

// Total size of parts if they are all literal, npos otherwise.
std::size_t LiteralSize(std::span<const Part> parts) noexcept {
  std::size_t size = 0;
  for (const Part& part : parts) {
    if (part.type != Part::Type::Literal) {
      return std::string_view::npos;
    }
    size += part.literal.size();
  }
  return size;
}

// Full match of one path segment. Recursion depth is bounded by the number of parts.
bool MatchSegment(std::span<const Part> parts, std::string_view text, Captures& captures) {
  if (parts.empty()) {
    return text.empty();
  }
  const Part& part = parts.front();
  const auto rest = parts.subspan(1);
  if (part.type == Part::Type::Literal) {
    return text.starts_with(part.literal) && MatchSegment(rest, text.substr(part.literal.size()), captures);
  }

  const Converter& converter = GetConverter(part.kind);
  const std::size_t restLiteralSize = LiteralSize(rest);
  if (restLiteralSize != std::string_view::npos) {
    // Only literal text follows: the capture length is fixed.
    if (text.size() <= restLiteralSize) {
      return false;
    }
    const std::string_view value = text.substr(0, text.size() - restLiteralSize);
    if (!converter.accepts(value)) {
      return false;
    }
    captures.push_back(value);
    if (MatchSegment(rest, text.substr(value.size()), captures)) {
      return true;
    }
    captures.pop_back();
    return false;
  }

  // Another capture follows in the same segment: longest candidate first, like a greedy regex.
  for (std::size_t len = text.size(); len != 0; --len) {
    const std::string_view value = text.substr(0, len);
    if (!converter.accepts(value)) {
      continue;
    }
    captures.push_back(value);
    if (MatchSegment(rest, text.substr(len), captures)) {
      return true;
    }
    captures.pop_back();
  }
  return false;
}

}  // namespace

std::string EscapeRegex(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  AppendEscaped(out, text);
  return out;
}

CompiledPattern CompilePattern(std::string_view pattern) {
  CompiledPattern compiled;
  if (CompileWith(pattern, true, compiled) != 0) {
    compiled.mode = CompiledPattern::Mode::Typed;
  } else if (CompileWith(pattern, false, compiled) != 0) {
    compiled.mode = CompiledPattern::Mode::Untyped;
  }
  return compiled;
}

std::optional<std::vector<PathValue>> CompiledPattern::match(std::string_view path) const {
  if (mode == Mode::Literal) {
    return std::nullopt;
  }

  Captures captures;
  captures.reserve(paramNames.size());
  std::size_t segmentPos = 0;
  for (std::size_t segmentBeg = 0;; ++segmentPos) {
    const std::size_t slashPos = path.find('/', segmentBeg);
    const std::string_view segmentText = path.substr(segmentBeg, slashPos - segmentBeg);
    if (segmentPos == segments.size() || !MatchSegment(segments[segmentPos], segmentText, captures)) {
      return std::nullopt;
    }
    if (slashPos == std::string_view::npos) {
      break;
    }
    segmentBeg = slashPos + 1;
  }
  if (segmentPos + 1 != segments.size()) {
    return std::nullopt;
  }

  std::vector<PathValue> values;
  values.reserve(captures.size());
  for (std::size_t capturePos = 0; capturePos < captures.size(); ++capturePos) {
    if (mode == Mode::Typed) {
      values.push_back(GetConverter(converterKinds[capturePos]).convert(captures[capturePos]));
    } else {
      values.emplace_back(std::in_place_type<std::string>, captures[capturePos]);
    }
  }
  return values;
}

}  // namespace star
