#pragma once
/**
 * @file stream_base.hpp
 * @brief Minimal byte-stream interface the Framer runs on.
 *
 * The Device never touches sockets directly. It asks a StreamFactory for an
 * IStream and hands that to the Framer. Production code gets a TcpStream;
 * tests get an in-memory device.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "ledlink/error.hpp"

namespace ledlink {
struct Options;
}

namespace ledlink::transport {

/**
 * @brief Blocking, deadline-bounded byte stream.
 *
 * Contract:
 *  - write_all() sends all n bytes or fails; a partial write is a failure.
 *  - read_exact() returns only once all n bytes are buffered; it never
 *    returns a short read as success.
 *  - Both fail with Io/Timeout once timeout_ms elapses, Io/Closed when the
 *    peer closed or shutdown() was called, Io/Broken otherwise.
 *  - shutdown() may be called from any thread while another thread is
 *    blocked in read_exact()/write_all(); that call then fails promptly.
 *    It is idempotent. The descriptor itself is released by the destructor.
 *  - At most one reader and one writer at a time (the Framer guarantees this).
 */
class IStream {
public:
  virtual ~IStream() = default;
  virtual bool write_all(const uint8_t* data, std::size_t n, int timeout_ms, Error& err) = 0;
  virtual bool read_exact(uint8_t* out, std::size_t n, int timeout_ms, Error& err) = 0;
  virtual void shutdown() = 0;
  virtual const char* name() const = 0;
};

/// Opens a connected stream for the given options, or fills err (kind Connect).
using StreamFactory =
    std::function<std::shared_ptr<IStream>(const Options& opts, Error& err)>;

} // namespace ledlink::transport
