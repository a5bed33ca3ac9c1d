// ============================================================================
// tcp_stream.cpp: implementation for transport/tcp_stream.hpp
// ============================================================================

/**
 * @file tcp_stream.cpp
 */

#include "ledlink/transport/tcp_stream.hpp"
#include "ledlink/config.hpp"     // Options (host, port, timeout_ms)

#include <chrono>
#include <cerrno>
#include <cstring>        // strerror
#include <fcntl.h>        // fcntl O_NONBLOCK
#include <netdb.h>        // getaddrinfo
#include <netinet/in.h>
#include <netinet/tcp.h>  // TCP_NODELAY
#include <poll.h>         // poll(2) for every deadline
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>       // ::close

namespace ledlink::transport {

namespace {

using Clock = std::chrono::steady_clock;

std::string errno_string() {
  return std::string(std::strerror(errno));
}

// Milliseconds left until `deadline`, clamped at zero.
int remaining_ms(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  return left > 0 ? static_cast<int>(left) : 0;
}

bool set_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Wait for a non-blocking connect() to finish. Returns 0 on success, else an errno value.
int finish_connect(int fd, int timeout_ms) {
  pollfd pfd{fd, POLLOUT, 0};
  int pr = 0;
  do {
    pr = ::poll(&pfd, 1, timeout_ms);
  } while (pr < 0 && errno == EINTR);
  if (pr == 0) return ETIMEDOUT;
  if (pr < 0)  return errno;

  int so_error = 0;
  socklen_t len = sizeof(so_error);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) return errno;
  return so_error;
}

} // namespace

TcpStream::~TcpStream() {
  close_fd();
}

void TcpStream::close_fd() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool TcpStream::connect_to(const std::string& host, uint16_t port, int timeout_ms, Error& err) {
  close_fd();
  shut_ = false;

  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo* result = nullptr;
  const std::string port_str = std::to_string(port);
  const int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
  if (rc != 0) {
    err = connect_error("getaddrinfo failed for " + host + ": " + ::gai_strerror(rc));
    return false;
  }

  std::string last_error = "no usable address";
  for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) { last_error = errno_string(); continue; }

    if (!set_nonblocking(fd)) {
      last_error = errno_string();
      ::close(fd);
      continue;
    }

    int code = 0;
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
      code = (errno == EINPROGRESS) ? finish_connect(fd, timeout_ms) : errno;
    }
    if (code != 0) {
      last_error = std::strerror(code);
      ::close(fd);
      continue;
    }

    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));   // small frames, send now

    fd_ = fd;
    ::freeaddrinfo(result);
    return true;
  }

  ::freeaddrinfo(result);
  err = connect_error("unable to connect to " + host + ":" + port_str + ": " + last_error);
  return false;
}

void TcpStream::adopt(int fd) {
  close_fd();
  shut_ = false;
  fd_ = fd;
  if (fd_ >= 0) set_nonblocking(fd_);
}

// ---------------------------------------------------------------------------
// write_all()
// -----------
// Loop send() until every byte is out or the deadline passes. poll() guards
// each attempt so a full socket buffer waits instead of spinning.
// MSG_NOSIGNAL keeps a dead peer from raising SIGPIPE in the host process.
// ---------------------------------------------------------------------------
bool TcpStream::write_all(const uint8_t* data, std::size_t n, int timeout_ms, Error& err) {
  if (fd_ < 0 || shut_) { err = io_error(IoFault::Closed, "stream closed"); return false; }

  const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
  std::size_t sent = 0;

  while (sent < n) {
    if (shut_) { err = io_error(IoFault::Closed, "stream closed during write"); return false; }

    pollfd pfd{fd_, POLLOUT, 0};
    int pr = ::poll(&pfd, 1, remaining_ms(deadline));
    if (pr == 0) { err = io_error(IoFault::Timeout, "write timed out"); return false; }
    if (pr < 0) {
      if (errno == EINTR) continue;
      err = io_error(IoFault::Broken, "poll failed: " + errno_string());
      return false;
    }

    ssize_t w = ::send(fd_, data + sent, n - sent, MSG_NOSIGNAL);
    if (w < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
      if (shut_) { err = io_error(IoFault::Closed, "stream closed during write"); return false; }
      err = io_error(IoFault::Broken, "send failed: " + errno_string());
      return false;
    }
    sent += static_cast<std::size_t>(w);
  }
  return true;
}

// ---------------------------------------------------------------------------
// read_exact()
// ------------
// Accumulate exactly n bytes. One deadline covers the whole call, so a
// trickling peer cannot stretch a read past timeout_ms.
// ---------------------------------------------------------------------------
bool TcpStream::read_exact(uint8_t* out, std::size_t n, int timeout_ms, Error& err) {
  if (fd_ < 0 || shut_) { err = io_error(IoFault::Closed, "stream closed"); return false; }

  const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
  std::size_t got = 0;

  while (got < n) {
    if (shut_) { err = io_error(IoFault::Closed, "stream closed during read"); return false; }

    pollfd pfd{fd_, POLLIN, 0};
    int pr = ::poll(&pfd, 1, remaining_ms(deadline));
    if (pr == 0) { err = io_error(IoFault::Timeout, "read timed out"); return false; }
    if (pr < 0) {
      if (errno == EINTR) continue;
      err = io_error(IoFault::Broken, "poll failed: " + errno_string());
      return false;
    }

    ssize_t r = ::recv(fd_, out + got, n - got, 0);
    if (r == 0) { err = io_error(IoFault::Closed, "connection closed by peer"); return false; }
    if (r < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
      if (shut_) { err = io_error(IoFault::Closed, "stream closed during read"); return false; }
      err = io_error(IoFault::Broken, "recv failed: " + errno_string());
      return false;
    }
    got += static_cast<std::size_t>(r);
  }
  return true;
}

void TcpStream::shutdown() {
  if (shut_.exchange(true)) return;
  if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);   // wakes any poll() on this fd
}

StreamFactory tcp_stream_factory() {
  return [](const Options& opts, Error& err) -> std::shared_ptr<IStream> {
    auto s = std::make_shared<TcpStream>();
    if (!s->connect_to(opts.host, opts.port, opts.timeout_ms, err)) return nullptr;
    return s;
  };
}

} // namespace ledlink::transport
