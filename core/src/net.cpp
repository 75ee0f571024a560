#include "visionsync/net.hpp"
#include "visionsync/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace visionsync::net {

std::string last_error_text() { return std::strerror(errno); }

void Socket::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void Socket::shutdown() {
  if (fd_ >= 0)
    ::shutdown(fd_, SHUT_RDWR);
}

static int remaining_ms(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return left.count() < 0 ? 0 : (int)left.count();
}

static bool set_nonblocking(int fd, bool on) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0)
    return false;
  flags = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return fcntl(fd, F_SETFL, flags) == 0;
}

Socket tcp_connect(const std::string &host, int port,
                   std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  std::string port_s = std::to_string(port);
  int rc = getaddrinfo(host.c_str(), port_s.c_str(), &hints, &res);
  if (rc != 0)
    throw Error(ErrorCode::TransportLost,
                "cannot resolve " + host + ": " + gai_strerror(rc));

  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string err = "no usable address";
  for (addrinfo *ai = res; ai; ai = ai->ai_next) {
    Socket s(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
    if (!s.valid()) {
      err = last_error_text();
      continue;
    }
    if (!set_nonblocking(s.fd(), true)) {
      err = last_error_text();
      continue;
    }
    if (::connect(s.fd(), ai->ai_addr, ai->ai_addrlen) != 0) {
      if (errno != EINPROGRESS) {
        err = last_error_text();
        continue;
      }
      pollfd pfd{s.fd(), POLLOUT, 0};
      int pr = ::poll(&pfd, 1, remaining_ms(deadline));
      if (pr <= 0) {
        err = pr == 0 ? "connect timed out" : last_error_text();
        continue;
      }
      int so_err = 0;
      socklen_t len = sizeof(so_err);
      getsockopt(s.fd(), SOL_SOCKET, SO_ERROR, &so_err, &len);
      if (so_err != 0) {
        err = std::strerror(so_err);
        continue;
      }
    }
    set_nonblocking(s.fd(), false);
    freeaddrinfo(res);
    return s;
  }
  freeaddrinfo(res);
  throw Error(ErrorCode::TransportLost,
              "connect to " + host + ":" + port_s + " failed: " + err);
}

bool write_all(int fd, const void *buf, size_t len) {
  const char *p = (const char *)buf;
  while (len > 0) {
    ssize_t r = ::send(fd, p, len, MSG_NOSIGNAL);
    if (r < 0 && errno == EINTR)
      continue;
    if (r <= 0)
      return false;
    p += r;
    len -= (size_t)r;
  }
  return true;
}

long read_some(int fd, char *buf, size_t len,
               std::chrono::steady_clock::time_point deadline) {
  while (true) {
    pollfd pfd{fd, POLLIN, 0};
    int pr = ::poll(&pfd, 1, remaining_ms(deadline));
    if (pr < 0 && errno == EINTR)
      continue;
    if (pr <= 0)
      return -1;
    ssize_t r = ::recv(fd, buf, len, 0);
    if (r < 0 && errno == EINTR)
      continue;
    return (long)r;
  }
}

} // namespace visionsync::net
