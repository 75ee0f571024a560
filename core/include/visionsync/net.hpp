#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace visionsync::net {

// Owning POSIX socket descriptor.
class Socket {
public:
  Socket() = default;
  explicit Socket(int fd) : fd_(fd) {}
  Socket(Socket &&o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
  Socket &operator=(Socket &&o) noexcept {
    if (this != &o) {
      close();
      fd_ = o.fd_;
      o.fd_ = -1;
    }
    return *this;
  }
  Socket(const Socket &) = delete;
  Socket &operator=(const Socket &) = delete;
  ~Socket() { close(); }

  int fd() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void close();
  // Unblocks a reader on another thread without releasing the descriptor.
  void shutdown();

private:
  int fd_ = -1;
};

// Resolves host and connects with a deadline. Throws Error(TransportLost).
Socket tcp_connect(const std::string &host, int port,
                   std::chrono::milliseconds timeout);

bool write_all(int fd, const void *buf, size_t len);

// Waits for data until `deadline`. Returns bytes read, 0 on orderly close,
// -1 on error or timeout.
long read_some(int fd, char *buf, size_t len,
               std::chrono::steady_clock::time_point deadline);

std::string last_error_text();

} // namespace visionsync::net
