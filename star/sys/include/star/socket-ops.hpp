#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace star {

// Thin wrappers centralising the system calls used on connected sockets, so that
// higher-level modules never include platform networking headers directly.

// Send data on a connected socket without raising SIGPIPE.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept;

// Receive up to len bytes, retrying on EINTR.
// Returns the number of bytes received, 0 when the peer closed the connection, or -1 on error (errno is set,
// EAGAIN / EWOULDBLOCK when the receive timeout elapsed).
int64_t SafeRecv(int fd, void* buf, std::size_t len) noexcept;

// Send the whole buffer, retrying on partial writes and EINTR.
// Returns true if every byte was handed to the kernel.
bool SendAll(int fd, std::string_view data) noexcept;

// Set SO_RCVTIMEO so that a blocking recv() gives up after timeout.
// Returns true on success.
bool SetReceiveTimeout(int fd, std::chrono::milliseconds timeout) noexcept;

// Wait until fd is readable or timeout elapses.
// Returns 1 if readable, 0 on timeout or interruption, -1 on error (errno is set).
int WaitReadable(int fd, std::chrono::milliseconds timeout) noexcept;

// Shutdown the write half of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownWrite(int fd) noexcept;

}  // namespace star
