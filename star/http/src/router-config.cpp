#include "star/router-config.hpp"

#include <string_view>

namespace star {

RouterConfig& RouterConfig::withHandlerErrorStatus(HandlerErrorStatus status) {
  handlerErrorStatus = status;
  return *this;
}

RouterConfig& RouterConfig::withErrorPageTemplatePath(std::string_view path) {
  errorPageTemplatePath = path;
  return *this;
}

}  // namespace star
