#include "star/http-server-config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace star {

HttpServerConfig& HttpServerConfig::withBindAddress(std::string_view bindAddress) {
  this->bindAddress = bindAddress;
  return *this;
}

HttpServerConfig& HttpServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReusePort(bool on) {
  this->reusePort = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withNbWorkerThreads(uint32_t nbWorkerThreads) {
  this->nbWorkerThreads = nbWorkerThreads;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReceiveTimeout(std::chrono::milliseconds timeout) {
  this->receiveTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  this->pollInterval = interval;
  return *this;
}

void HttpServerConfig::validate() const {
  if (bindAddress.empty()) {
    throw std::invalid_argument("bindAddress must not be empty");
  }
  if (nbWorkerThreads == 0) {
    throw std::invalid_argument("nbWorkerThreads must be > 0");
  }
  if (std::cmp_less(maxHeaderBytes, 128)) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (maxBodyBytes == 0) {
    throw std::invalid_argument("maxBodyBytes must be > 0");
  }
  if (receiveTimeout.count() <= 0) {
    throw std::invalid_argument("receiveTimeout must be > 0");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("Poll interval value is too large");
  }
}

}  // namespace star
