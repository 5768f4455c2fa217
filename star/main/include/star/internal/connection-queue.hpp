#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stop_token>

#include "star/base-fd.hpp"

namespace star::internal {

// Accepted connections waiting for a worker. The accept loop pushes, workers pop.
class ConnectionQueue {
 public:
  void push(BaseFd cnx);

  // Blocks until a connection is available or stop is requested on stopToken.
  // Returns a closed BaseFd in the latter case.
  [[nodiscard]] BaseFd pop(const std::stop_token& stopToken);

  [[nodiscard]] std::size_t size() const;

  // Close all pending connections. Returns how many were dropped.
  std::size_t clear();

 private:
  mutable std::mutex _mutex;
  std::condition_variable_any _cv;
  std::deque<BaseFd> _pending;
};

}  // namespace star::internal
