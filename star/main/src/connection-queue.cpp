#include "star/internal/connection-queue.hpp"

#include <cstddef>
#include <mutex>
#include <stop_token>
#include <utility>

#include "star/base-fd.hpp"

namespace star::internal {

void ConnectionQueue::push(BaseFd cnx) {
  {
    std::scoped_lock lock(_mutex);
    _pending.push_back(std::move(cnx));
  }
  _cv.notify_one();
}

BaseFd ConnectionQueue::pop(const std::stop_token& stopToken) {
  std::unique_lock lock(_mutex);
  if (!_cv.wait(lock, stopToken, [this] { return !_pending.empty(); })) {
    return BaseFd{};
  }
  BaseFd cnx = std::move(_pending.front());
  _pending.pop_front();
  return cnx;
}

std::size_t ConnectionQueue::size() const {
  std::scoped_lock lock(_mutex);
  return _pending.size();
}

std::size_t ConnectionQueue::clear() {
  std::scoped_lock lock(_mutex);
  const std::size_t nbDropped = _pending.size();
  _pending.clear();
  return nbDropped;
}

}  // namespace star::internal
