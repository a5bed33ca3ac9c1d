#pragma once
/**
 * @file tcp_stream.hpp
 * @brief POSIX TCP implementation of IStream (poll-based deadlines).
 *
 * Depends on: sys/socket.h, netdb.h, poll.h. Linux and the BSDs.
 */

#include <atomic>
#include <string>

#include "ledlink/transport/stream_base.hpp"

namespace ledlink::transport {

class TcpStream : public IStream {
public:
  TcpStream() = default;
  ~TcpStream() override;

  TcpStream(const TcpStream&) = delete;
  TcpStream& operator=(const TcpStream&) = delete;

  /**
   * @brief Resolve host and connect within timeout_ms.
   *
   * Tries every address getaddrinfo returns, in order. Uses a non-blocking
   * connect so an unreachable controller fails after the deadline instead of
   * the kernel's multi-minute SYN retry.
   *
   * @return false with err.kind == Connect on resolve/connect failure.
   */
  bool connect_to(const std::string& host, uint16_t port, int timeout_ms, Error& err);

  /// Take ownership of an already-connected descriptor (socketpair in tests).
  void adopt(int fd);

  bool write_all(const uint8_t* data, std::size_t n, int timeout_ms, Error& err) override;
  bool read_exact(uint8_t* out, std::size_t n, int timeout_ms, Error& err) override;
  void shutdown() override;
  const char* name() const override { return "tcp"; }

  bool is_open() const { return fd_ >= 0; }

private:
  void close_fd();

  int fd_{-1};
  std::atomic<bool> shut_{false};
};

/// Default StreamFactory: TcpStream::connect_to(opts.host, opts.port, opts.timeout_ms).
StreamFactory tcp_stream_factory();

} // namespace ledlink::transport
