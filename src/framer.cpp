// ============================================================================
// framer.cpp: implementation for framer.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ledlink/framer.hpp"

namespace ledlink {

Framer::Framer(std::shared_ptr<transport::IStream> stream, int timeout_ms)
: stream_(std::move(stream)), timeout_ms_(timeout_ms) {}

// ---------------------------------------------------------------------------
// write_frame()
// -------------
// The lock covers exactly one frame. Frames from different logical
// operations may alternate on the wire, bytes of two frames never do.
// ---------------------------------------------------------------------------
bool Framer::write_frame(const Bytes& frame, Error& err) {
  if (frame.size() < HEADER_LEN || frame.size() > MAX_PACKET_LEN) {
    err = protocol_error(ProtocolFault::InvalidLength,
                         "refusing to write frame of " + std::to_string(frame.size()) + " bytes");
    return false;
  }
  if (!stream_) {
    err = io_error(IoFault::Closed, "no stream");
    return false;
  }

  std::lock_guard<std::mutex> lock(write_mu_);
  return stream_->write_all(frame.data(), frame.size(), timeout_ms_, err);
}

// ---------------------------------------------------------------------------
// read_frame()
// ------------
// Two exact reads: the 2-byte length, then the rest. read_exact() blocks
// until the requested count is buffered, which handles frames split across
// segments; asking for no more than `length` handles frames sharing one.
// ---------------------------------------------------------------------------
bool Framer::read_frame(Packet& out, Error& err) {
  if (!stream_) {
    err = io_error(IoFault::Closed, "no stream");
    return false;
  }

  uint8_t len_buf[2];
  if (!stream_->read_exact(len_buf, sizeof(len_buf), timeout_ms_, err)) return false;

  const uint16_t length = get_u16(len_buf);
  if (length < HEADER_LEN) {
    err = protocol_error(ProtocolFault::InvalidLength,
                         "invalid frame length " + std::to_string(length));
    return false;
  }

  out.bytes.assign(length, 0);
  out.bytes[0] = len_buf[0];
  out.bytes[1] = len_buf[1];
  if (!stream_->read_exact(out.bytes.data() + 2, length - 2u, timeout_ms_, err)) return false;

  out.command = static_cast<CmdType>(get_u16(out.bytes.data() + 2));
  return true;
}

void Framer::shutdown() {
  if (stream_) stream_->shutdown();
}

} // namespace ledlink
