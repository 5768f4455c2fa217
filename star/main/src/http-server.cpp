#include "star/http-server.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <format>
#include <functional>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "star/base-fd.hpp"
#include "star/errno-throw.hpp"
#include "star/http-method-parse.hpp"
#include "star/http-method.hpp"
#include "star/http-request-head.hpp"
#include "star/http-response.hpp"
#include "star/http-server-config.hpp"
#include "star/http-status-code.hpp"
#include "star/log.hpp"
#include "star/router.hpp"
#include "star/signal-handler.hpp"
#include "star/socket-ops.hpp"
#include "star/socket.hpp"

namespace star {

namespace {

constexpr std::size_t kReadChunkSize = 4096;

// Bytes read from a closing connection before giving up on a clean close.
constexpr std::size_t kMaxLingerBytes = 1 << 16;
constexpr std::chrono::milliseconds kLingerTimeout{200};

HttpServerConfig ValidatedConfig(HttpServerConfig config) {
  config.validate();
  return config;
}

void LogReadFailure(int fd, int64_t nbRead, std::string_view step) {
  if (nbRead == 0) {
    log::debug("Connection fd # {} closed by peer while reading {}", fd, step);
  } else {
    log::warn("Connection fd # {} dropped while reading {}: {}", fd, step, std::strerror(errno));
  }
}

// Append up to maxBytes read from fd to buffer. Returns the SafeRecv result.
int64_t ReadInto(int fd, std::string& buffer, std::size_t maxBytes) {
  const std::size_t oldSize = buffer.size();
  int64_t nbRead = 0;
  buffer.resize_and_overwrite(oldSize + maxBytes, [fd, oldSize, maxBytes, &nbRead](char* data, std::size_t) {
    nbRead = SafeRecv(fd, data + oldSize, maxBytes);
    return nbRead > 0 ? oldSize + static_cast<std::size_t>(nbRead) : oldSize;
  });
  return nbRead;
}

// Read and discard the part of the body that did not come with the head.
bool DrainBody(int fd, std::size_t nbAlreadyRead, std::size_t contentLength) {
  std::size_t remaining = contentLength > nbAlreadyRead ? contentLength - nbAlreadyRead : 0;
  char scratch[kReadChunkSize];
  while (remaining != 0) {
    const int64_t nbRead = SafeRecv(fd, scratch, std::min(remaining, sizeof(scratch)));
    if (nbRead <= 0) {
      LogReadFailure(fd, nbRead, "request body");
      return false;
    }
    remaining -= static_cast<std::size_t>(nbRead);
  }
  return true;
}

// Half-close then consume what the client may still send, so that closing the socket does not
// reset the connection before the client has read the response.
void LingeringClose(int fd) {
  if (!ShutdownWrite(fd)) {
    log::debug("shutdown(SHUT_WR) failed on fd # {}: {}", fd, std::strerror(errno));
    return;
  }
  if (!SetReceiveTimeout(fd, kLingerTimeout)) {
    return;
  }
  char scratch[kReadChunkSize];
  for (std::size_t nbDiscarded = 0; nbDiscarded < kMaxLingerBytes;) {
    const int64_t nbRead = SafeRecv(fd, scratch, sizeof(scratch));
    if (nbRead <= 0) {
      break;
    }
    nbDiscarded += static_cast<std::size_t>(nbRead);
  }
}

// Clears the running state when run() exits, including by exception.
class RunningGuard {
 public:
  RunningGuard(std::atomic<bool>& running, std::atomic<bool>& stopRequested) noexcept
      : _running(running), _stopRequested(stopRequested) {}

  RunningGuard(const RunningGuard&) = delete;
  RunningGuard& operator=(const RunningGuard&) = delete;

  ~RunningGuard() {
    _stopRequested.store(false, std::memory_order_relaxed);
    _running.store(false, std::memory_order_relaxed);
  }

 private:
  std::atomic<bool>& _running;
  std::atomic<bool>& _stopRequested;
};

}  // namespace

HttpServer::HttpServer(HttpServerConfig config, Router router)
    : _config(ValidatedConfig(std::move(config))),
      _router(std::move(router)),
      _listenSocket(Socket::Type::StreamNonBlock) {
  _listenSocket.bindAndListen(_config.bindAddress, _config.reusePort, _config.port);
  log::debug("Listening on {}:{} (fd # {}) with {} route(s)", _config.bindAddress, _config.port, _listenSocket.fd(),
             _router.routes().size());
}

void HttpServer::run() {
  runUntil([] { return false; });
}

void HttpServer::runUntil(const std::function<bool()>& predicate) {
  if (_running.exchange(true, std::memory_order_relaxed)) {
    throw std::logic_error("Server is already running");
  }
  RunningGuard runningGuard(_running, _stopRequested);

  log::info("Server running at http://{}:{}", _config.bindAddress, _config.port);
  {
    std::vector<std::jthread> workers;
    workers.reserve(_config.nbWorkerThreads);
    for (uint32_t workerPos = 0; workerPos < _config.nbWorkerThreads; ++workerPos) {
      workers.emplace_back([this](const std::stop_token& stopToken) { workerLoop(stopToken); });
    }

    while (!_stopRequested.load(std::memory_order_relaxed) && !SignalHandler::IsStopRequested() && !predicate()) {
      const int ready = WaitReadable(_listenSocket.fd(), _config.pollInterval);
      if (ready == -1) {
        ThrowErrno("poll on listening socket fd # {} failed", _listenSocket.fd());
      }
      if (ready == 0) {
        continue;
      }
      BaseFd cnx = _listenSocket.accept();
      if (!cnx) {
        // Out of file descriptors or memory: the connection stays in the backlog, retry later
        // instead of spinning on a listening socket that remains readable.
        std::this_thread::sleep_for(_config.pollInterval);
        continue;
      }
      _pendingConnections.push(std::move(cnx));
    }
    log::debug("Joining {} worker thread(s)", workers.size());
  }

  const std::size_t nbDropped = _pendingConnections.clear();
  if (nbDropped != 0) {
    log::warn("{} pending connection(s) closed without being served", nbDropped);
  }
  log::info("Server stopped");
}

void HttpServer::workerLoop(const std::stop_token& stopToken) {
  for (BaseFd cnx = _pendingConnections.pop(stopToken); cnx; cnx = _pendingConnections.pop(stopToken)) {
    try {
      handleConnection(cnx);
    } catch (const std::exception& ex) {
      log::error("Unexpected error while serving connection fd # {}: {}", cnx.fd(), ex.what());
    }
  }
}

void HttpServer::handleConnection(const BaseFd& cnx) const {
  const int fd = cnx.fd();
  if (!SetReceiveTimeout(fd, _config.receiveTimeout)) {
    log::warn("Unable to set receive timeout on fd # {}: {}", fd, std::strerror(errno));
  }

  std::string buffer;
  RequestHead head;
  HeadParseStatus status = HeadParseStatus::NeedMore;
  while (status == HeadParseStatus::NeedMore && buffer.size() < _config.maxHeaderBytes) {
    const int64_t nbRead = ReadInto(fd, buffer, kReadChunkSize);
    if (nbRead <= 0) {
      LogReadFailure(fd, nbRead, "request head");
      return;
    }
    status = ParseRequestHead(buffer, head);
  }

  HttpResponse response;
  if (status == HeadParseStatus::NeedMore || head.headSize > _config.maxHeaderBytes) {
    response = socketLevelError(http::StatusCodeRequestHeaderFieldsTooLarge, "Request header fields too large");
  } else if (status == HeadParseStatus::Malformed) {
    response = socketLevelError(http::StatusCodeBadRequest, "Bad request syntax");
  } else {
    // Method tokens are case-sensitive on the wire.
    const std::optional<http::Method> method = http::MethodStrToOptEnum(head.method);
    if (!method || head.method != http::MethodToStr(*method)) {
      response = socketLevelError(http::StatusCodeNotImplemented, std::format("Unsupported method ('{}')", head.method));
    } else if (head.contentLength > _config.maxBodyBytes) {
      response = socketLevelError(http::StatusCodeBadRequest, "Request body too large");
    } else {
      if (!DrainBody(fd, buffer.size() - head.headSize, head.contentLength)) {
        return;
      }
      response = _router.dispatch(*method, head.target);
    }
  }

  log::debug("{} {} -> {}", head.method, head.target, response.status());
  if (!SendAll(fd, response.serialize())) {
    log::warn("Unable to send response on fd # {}: {}", fd, std::strerror(errno));
    return;
  }
  LingeringClose(fd);
}

HttpResponse HttpServer::socketLevelError(http::StatusCode status, std::string_view message) const {
  const std::string title = std::format("{} {}", status, http::ReasonPhraseFor(status));
  return HttpResponse(status, _router.errorPage().render(title, message));
}

}  // namespace star
