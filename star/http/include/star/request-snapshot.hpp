#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "star/http-method.hpp"
#include "star/invalid-argument-exception.hpp"
#include "star/path-value.hpp"
#include "star/query-args.hpp"

namespace star {

// Per-request data computed during dispatch: normalized path, query arguments and positional path
// parameters. A new snapshot is built for every dispatch call and handed to the handler explicitly,
// so concurrent requests never observe each other's arguments.
class RequestSnapshot {
 public:
  RequestSnapshot() = default;

  RequestSnapshot(http::Method method, std::string path, QueryArgs queryArgs)
      : _path(std::move(path)), _queryArgs(std::move(queryArgs)), _method(method) {}

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // Path without query string and without its trailing slash.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  [[nodiscard]] const QueryArgs& queryArgs() const noexcept { return _queryArgs; }

  // Value of query argument key, or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> queryArg(std::string_view key) const;

  // Positional parameters, in placeholder order.
  [[nodiscard]] std::span<const PathValue> pathParams() const noexcept { return _pathParams; }

  // Typed access to the positional parameter at pos.
  // Throws star::invalid_argument if pos is out of range or if the parameter holds another type.
  template <typename T>
  [[nodiscard]] const T& pathParam(std::size_t pos) const {
    if (pos >= _pathParams.size()) {
      throw invalid_argument("Path parameter #{} requested but only {} captured", pos, _pathParams.size());
    }
    const T* pValue = std::get_if<T>(&_pathParams[pos]);
    if (pValue == nullptr) {
      throw invalid_argument("Path parameter #{} ('{}') has another type", pos, PathValueToString(_pathParams[pos]));
    }
    return *pValue;
  }

  void setPathParams(std::vector<PathValue> pathParams) noexcept { _pathParams = std::move(pathParams); }

 private:
  std::string _path;
  QueryArgs _queryArgs;
  std::vector<PathValue> _pathParams;
  http::Method _method{http::Method::GET};
};

}  // namespace star
