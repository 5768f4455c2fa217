#include "star/template-render.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace star {

namespace {

void ReplaceAll(std::string& content, std::string_view placeholder, std::string_view value) {
  std::size_t pos = 0;
  while ((pos = content.find(placeholder, pos)) != std::string::npos) {
    content.replace(pos, placeholder.size(), value);
    pos += value.size();
  }
}

}  // namespace

std::string RenderTemplate(std::string_view source, std::span<const TemplateArg> args) {
  std::string content(source);
  std::string placeholder;
  for (const TemplateArg& arg : args) {
    placeholder.assign("{{ ");
    placeholder.append(arg.name);
    placeholder.append(" }}");
    ReplaceAll(content, placeholder, arg.value);
  }
  return content;
}

}  // namespace star
