#include "star/error-page.hpp"

#include <string>
#include <string_view>

#include "star/file.hpp"
#include "star/log.hpp"
#include "star/template-constants.hpp"
#include "star/template-render.hpp"

namespace star {

ErrorPage::ErrorPage() : _templateSource(kDefaultErrorPageTemplate) {}

ErrorPage ErrorPage::FromFile(std::string_view path) {
  File file(path);
  ErrorPage page(file.loadAllContent());
  log::info("Loaded error page template '{}' ({} bytes)", path, page._templateSource.size());
  return page;
}

std::string ErrorPage::render(std::string_view title, std::string_view message) const {
  return RenderTemplate(_templateSource, {{"title", title}, {"message", message}});
}

}  // namespace star
