/**
 * @page ll-framer ledlink Framer
 * @file framer.hpp
 * @brief Length-prefixed frame I/O over one shared byte stream.
 *
 * @details
 * PURPOSE
 * -------
 * The controller speaks a plain stream protocol: every unit on the wire is
 * `[u16 length][u16 command][body]`, length counting the whole frame. TCP
 * gives no boundaries, so one recv() may hold half a frame or three frames.
 * The Framer is the only place that turns the byte stream into frames:
 *
 *   - read_frame(): read exactly 2 bytes (length), validate, then read
 *     exactly `length - 2` more. It never returns a partial frame and never
 *     consumes a byte of the next one.
 *   - write_frame(): one complete, caller-built frame per call, written under
 *     a dedicated write mutex so the heartbeat thread and the caller's thread
 *     can never interleave bytes on the wire.
 *
 * CONCURRENCY
 * -----------
 * - Writes: any thread, serialized per frame by `write_mu_`.
 * - Reads: no lock. One reader at a time is the Device's job (it holds its
 *   operation mutex across every read-until-response loop).
 * - shutdown(): any thread; in-flight reads/writes fail with Io/Closed.
 *
 * HOW IT FITS TOGETHER
 * --------------------
 *   Device ── build frame (wire.hpp / fragments.hpp) ──► Framer::write_frame ──► IStream
 *   Device ◄── assemble_response (fragments.hpp) ◄── Framer::read_frame ◄── IStream
 *   HeartbeatKeeper ──────────────────────────────► Framer::write_frame
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "ledlink/error.hpp"
#include "ledlink/transport/stream_base.hpp"
#include "ledlink/wire.hpp"

namespace ledlink {

/// One complete frame as read from the wire.
struct Packet {
  CmdType command{};
  Bytes bytes;   ///< whole frame, header included, so wire offsets apply directly

  uint16_t length() const { return static_cast<uint16_t>(bytes.size()); }
};

/// Anything that yields complete frames one at a time.
class FrameSource {
public:
  virtual ~FrameSource() = default;
  virtual bool read_frame(Packet& out, Error& err) = 0;
};

class Framer : public FrameSource {
public:
  /**
   * @param stream      Connected stream; shared so close() can shut it down
   *                    from another thread while a read is blocked.
   * @param timeout_ms  Deadline applied to each blocking read and write.
   */
  Framer(std::shared_ptr<transport::IStream> stream, int timeout_ms);

  /**
   * @brief Write one complete frame atomically with respect to other writers.
   *
   * @param frame  Full frame bytes, header included (built by wire.hpp helpers
   *               or build_request()). Must be 4..65535 bytes long.
   * @return false with Protocol/InvalidLength for a malformed frame, or the
   *         stream's Io error.
   */
  bool write_frame(const Bytes& frame, Error& err);

  /**
   * @brief Read exactly one frame.
   *
   * @return false with Protocol/InvalidLength when the length field is below
   *         the 4-byte header, or the stream's Io error (Timeout, Closed, Broken).
   */
  bool read_frame(Packet& out, Error& err) override;

  /// Fail any blocked read/write and refuse further I/O.
  void shutdown();

  int timeout_ms() const { return timeout_ms_; }

private:
  std::shared_ptr<transport::IStream> stream_;
  int timeout_ms_;
  std::mutex write_mu_;
};

} // namespace ledlink
