#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

#include "star/invalid-argument-exception.hpp"
#include "star/request-snapshot.hpp"

namespace star {

// A route handler receives the per-request snapshot (positional parameters and query arguments)
// and returns the HTML body. Throwing reports the failure as a 500 error page.
// Handlers have no timeout: a handler that never returns keeps its worker thread busy forever.
using RequestHandler = std::function<std::string(const RequestSnapshot&)>;

template <typename T>
inline constexpr bool kIsPathParamType =
    std::is_same_v<T, int64_t> || std::is_same_v<T, double> || std::is_same_v<T, std::string>;

// Adapt a function of positional parameters into a RequestHandler.
// Args lists the parameter types in placeholder order (int64_t for <int:..>, double for <float:..>,
// std::string for <string:..> and untyped placeholders).
// Example:
//   router.get("/user/<int:id>", PositionalHandler<int64_t>([](int64_t id) { return std::to_string(id); }));
// A mismatch between the captured parameters and Args throws star::invalid_argument at call time.
template <typename... Args, typename Func>
RequestHandler PositionalHandler(Func func) {
  static_assert((kIsPathParamType<Args> && ...), "Positional parameters must be int64_t, double or std::string");
  return [func = std::move(func)](const RequestSnapshot& snapshot) -> std::string {
    if (snapshot.pathParams().size() != sizeof...(Args)) {
      throw invalid_argument("Handler expects {} positional parameters, got {}", sizeof...(Args),
                             snapshot.pathParams().size());
    }
    return [&]<std::size_t... Is>(std::index_sequence<Is...>) {
      return std::string(std::invoke(func, snapshot.pathParam<Args>(Is)...));
    }(std::index_sequence_for<Args...>{});
  };
}

}  // namespace star
