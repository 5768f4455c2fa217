#pragma once

#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

namespace star {

struct TemplateArg {
  std::string_view name;
  std::string_view value;
};

// Replace every literal "{{ name }}" (exactly one space on each side) with its value, argument by
// argument in the given order. Placeholders without argument are left untouched. Values are inserted
// verbatim: callers must not pass untrusted HTML.
std::string RenderTemplate(std::string_view source, std::span<const TemplateArg> args);

inline std::string RenderTemplate(std::string_view source, std::initializer_list<TemplateArg> args) {
  return RenderTemplate(source, std::span<const TemplateArg>(args.begin(), args.size()));
}

}  // namespace star
