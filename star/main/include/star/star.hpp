// star umbrella header
//
// Include this single header to pull in the public API:
//   - HttpServer and its configuration
//   - Router, RouterConfig, handler types and the PositionalHandler adaptor
//   - RequestSnapshot, path values and query arguments
//   - HTTP enums & helpers (methods, status codes)
//   - SignalHandler for graceful shutdown on SIGINT / SIGTERM
//
// Usage Example:
//    #include <star/star.hpp>
//    using namespace star;
//    int main() {
//      Router router;
//      router.get("/user/<int:id>", PositionalHandler<int64_t>([](int64_t id) { return std::to_string(id); }));
//      HttpServer server(HttpServerConfig{}.withPort(8000), std::move(router));
//      server.run();
//    }
#pragma once

// IWYU pragma: begin_exports
#include "star/http-method.hpp"
#include "star/http-response.hpp"
#include "star/http-server-config.hpp"
#include "star/http-server.hpp"
#include "star/http-status-code.hpp"
#include "star/path-handlers.hpp"
#include "star/path-value.hpp"
#include "star/query-args.hpp"
#include "star/request-snapshot.hpp"
#include "star/router-config.hpp"
#include "star/router-errors.hpp"
#include "star/router.hpp"
#include "star/signal-handler.hpp"
// IWYU pragma: end_exports
