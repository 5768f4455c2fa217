#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace star {

struct RouterConfig {
  enum class HandlerErrorStatus : std::int8_t { InternalServerError, AlwaysOk };

  // Status line sent when a matched handler fails (or its parameters cannot be converted).
  // The body is the rendered "500 Internal Server Error" page in both cases.
  //   InternalServerError: the response is buffered before the status line is written, so the
  //                        failure is reported as 500.
  //   AlwaysOk           : legacy behavior, the status is committed as 200 before the handler runs
  //                        and the failure only shows in the body.
  // Default: InternalServerError
  HandlerErrorStatus handlerErrorStatus{HandlerErrorStatus::InternalServerError};

  // Path of an HTML file used as error page template ({{ title }} and {{ message }} placeholders).
  // Empty (default): built-in template.
  std::string errorPageTemplatePath;

  RouterConfig& withHandlerErrorStatus(HandlerErrorStatus status);

  RouterConfig& withErrorPageTemplatePath(std::string_view path);
};

}  // namespace star
