#include "star/internal/connection-queue.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>

#include <chrono>
#include <stop_token>
#include <thread>
#include <utility>

#include "star/base-fd.hpp"

namespace star::internal {

namespace {

BaseFd MakeFd() { return BaseFd(::socket(AF_INET, SOCK_STREAM, 0)); }

}  // namespace

TEST(ConnectionQueueTest, FifoOrder) {
  ConnectionQueue queue;
  BaseFd first = MakeFd();
  BaseFd second = MakeFd();
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  const int firstFd = first.fd();
  const int secondFd = second.fd();

  queue.push(std::move(first));
  queue.push(std::move(second));
  EXPECT_EQ(queue.size(), 2U);

  std::stop_source stopSource;
  EXPECT_EQ(queue.pop(stopSource.get_token()).fd(), firstFd);
  EXPECT_EQ(queue.pop(stopSource.get_token()).fd(), secondFd);
  EXPECT_EQ(queue.size(), 0U);
}

TEST(ConnectionQueueTest, PopReturnsClosedFdOnStop) {
  ConnectionQueue queue;
  BaseFd popped = MakeFd();
  ASSERT_TRUE(popped);
  {
    std::jthread consumer([&queue, &popped](const std::stop_token& stopToken) { popped = queue.pop(stopToken); });
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    consumer.request_stop();
  }
  EXPECT_FALSE(popped);
}

TEST(ConnectionQueueTest, PopWakesUpOnPush) {
  ConnectionQueue queue;
  BaseFd cnx = MakeFd();
  ASSERT_TRUE(cnx);
  const int fd = cnx.fd();
  int poppedFd = BaseFd::kClosedFd;
  {
    std::jthread consumer([&queue, &poppedFd](const std::stop_token& stopToken) {
      BaseFd popped = queue.pop(stopToken);
      poppedFd = popped.fd();
    });
    std::this_thread::sleep_for(std::chrono::milliseconds{10});
    queue.push(std::move(cnx));
  }
  EXPECT_EQ(poppedFd, fd);
}

TEST(ConnectionQueueTest, ClearDropsPendingConnections) {
  ConnectionQueue queue;
  queue.push(MakeFd());
  queue.push(MakeFd());
  EXPECT_EQ(queue.clear(), 2U);
  EXPECT_EQ(queue.size(), 0U);
}

}  // namespace star::internal
