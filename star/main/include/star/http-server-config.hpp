#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace star {

struct HttpServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // IPv4 address to bind, in dotted notation. Default: all interfaces.
  std::string bindAddress{"0.0.0.0"};

  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port. After construction
  // you can retrieve the effective port via HttpServer::port().
  uint16_t port{0};

  // If true, enables SO_REUSEPORT allowing several independent HttpServer instances to bind the same
  // (non-ephemeral) port. Disabled by default.
  bool reusePort{false};

  // ===========================================
  // Worker pool
  // ===========================================
  // Number of threads serving accepted connections. Each worker serves one connection at a time:
  // a handler that never returns keeps its worker busy forever. Default: 4.
  uint32_t nbWorkerThreads{4};

  // ============================
  // Request parsing & body limits
  // ============================
  // Maximum allowed size (in bytes) of the request head (request line + all headers + CRLFCRLF).
  // If exceeded, the server replies 431 and closes the connection. Default: 8 KiB.
  std::size_t maxHeaderBytes{8192};

  // Maximum allowed size (in bytes) of a request body. The body is read and discarded, bigger
  // bodies are rejected with a 400. Default: 1 MiB.
  std::size_t maxBodyBytes{1 << 20};

  // Maximum duration a worker waits for the next bytes of a request before dropping the connection.
  // Default: 5 s.
  std::chrono::milliseconds receiveTimeout{std::chrono::seconds{5}};

  // ===========================================
  // Accept loop responsiveness
  // ===========================================
  // Maximum duration the accept loop blocks waiting for a new connection before checking for
  // external stop conditions (stop() call, runUntil predicate or termination signal).
  // Lower values give faster shutdown at the cost of more idle wake-ups. Default: 100 ms.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{100}};

  // Validates config. Throws std::invalid_argument if it's not valid.
  void validate() const;

  HttpServerConfig& withBindAddress(std::string_view bindAddress);

  HttpServerConfig& withPort(uint16_t port);

  HttpServerConfig& withReusePort(bool on = true);

  HttpServerConfig& withNbWorkerThreads(uint32_t nbWorkerThreads);

  HttpServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  HttpServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  HttpServerConfig& withReceiveTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withPollInterval(std::chrono::milliseconds interval);

  bool operator==(const HttpServerConfig&) const noexcept = default;
};

}  // namespace star
