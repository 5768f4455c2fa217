#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string_view>

#include "star/base-fd.hpp"
#include "star/http-response.hpp"
#include "star/http-server-config.hpp"
#include "star/http-status-code.hpp"
#include "star/internal/connection-queue.hpp"
#include "star/router.hpp"
#include "star/socket.hpp"

namespace star {

// HttpServer
//  - Blocking accept loop running in the calling thread (the one invoking run() / runUntil()).
//  - Accepted connections are handed to a fixed pool of worker threads, started by run() and joined
//    before it returns. Each connection serves exactly one request (Connection: close).
//  - The Router is owned by the server and never modified after construction, so workers dispatch
//    concurrently without locking.
//  - stop() may be called from any thread. SIGINT / SIGTERM also stop the loop when SignalHandler is enabled.
//
// Usage:
//   Router router;
//   router.get("/", [](const RequestSnapshot&) { return std::string("hello"); });
//   HttpServer server(HttpServerConfig{}.withPort(8000), std::move(router));
//   server.run();
class HttpServer {
 public:
  // Construct a server bound and listening immediately according to given configuration.
  //  - Validates the configuration (std::invalid_argument).
  //  - Performs ::socket, setsockopt (SO_REUSEADDR always, SO_REUSEPORT if enabled), ::bind and ::listen,
  //    and retrieves the chosen ephemeral port if config.port is 0 (std::system_error on failure).
  //  - After construction port() returns the actual bound port.
  HttpServer(HttpServerConfig config, Router router);

  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  ~HttpServer() = default;

  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

  [[nodiscard]] const Router& router() const noexcept { return _router; }

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_relaxed); }

  // Serve until stop() is called or a termination signal is received.
  // Throws std::logic_error if the server is already running.
  void run();

  // Serve until predicate returns true, stop() is called or a termination signal is received.
  // predicate is evaluated in the accept loop, at least every config().pollInterval.
  void runUntil(const std::function<bool()>& predicate);

  // Ask the accept loop to return. Workers finish the connections already accepted.
  // Safe to call from any thread, and several times.
  void stop() noexcept { _stopRequested.store(true, std::memory_order_relaxed); }

 private:
  void workerLoop(const std::stop_token& stopToken);

  void handleConnection(const BaseFd& cnx) const;

  [[nodiscard]] HttpResponse socketLevelError(http::StatusCode status, std::string_view message) const;

  HttpServerConfig _config;
  Router _router;
  Socket _listenSocket;
  internal::ConnectionQueue _pendingConnections;
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _running{false};
};

}  // namespace star
