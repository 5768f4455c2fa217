#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace star {

// HTML error page template with {{ title }} and {{ message }} placeholders.
class ErrorPage {
 public:
  // Uses the built-in template.
  ErrorPage();

  explicit ErrorPage(std::string templateSource) noexcept : _templateSource(std::move(templateSource)) {}

  // Load the template from a file.
  // Throws std::system_error if the file cannot be read.
  static ErrorPage FromFile(std::string_view path);

  [[nodiscard]] std::string render(std::string_view title, std::string_view message) const;

  [[nodiscard]] std::string_view templateSource() const noexcept { return _templateSource; }

 private:
  std::string _templateSource;
};

}  // namespace star
