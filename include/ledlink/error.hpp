/**
 * @file error.hpp
 * @brief Error value reported by every ledlink operation.
 *
 * @details
 * ledlink never throws across its public API. Operations return `bool` and
 * fill an `Error&` out-parameter, the same shape the rest of the host tooling
 * uses (`read_frame(fd, out, timeout)` style). The caller can branch on
 * `kind` for policy (reconnect, retry, report) and print `describe()` for
 * humans and scripts.
 *
 * Taxonomy
 * --------
 * - **Connect**      TCP open failed or timed out. No state is kept.
 * - **Handshake**    Phase 1 or 2 failed; the socket has been torn down.
 * - **Protocol**     Malformed frame or fragment. Fatal to the current call only.
 * - **Device**       Error-answer frame (device_code set) or a wrapper that
 *                    turned a non-success result string into a failure.
 * - **FileTransfer** Upload refused at start or end, or rejected locally.
 * - **Io**           Timeout, peer closed, broken pipe. The link should be
 *                    treated as dead; reconnect before the next call.
 * - **NotConnected** The call was made on a closed Device.
 * - **Config**       A configuration file could not be read or has bad values.
 */
#pragma once

#include <string>

namespace ledlink {

enum class ErrorKind {
  None,
  NotConnected,
  Connect,
  Handshake,
  Protocol,
  Device,
  FileTransfer,
  Io,
  Config
};

/// Which step of a multi-step operation failed (Handshake and FileTransfer).
enum class Phase {
  None,
  Version,
  SdkVersion,
  DeviceInfo,
  Start,
  Content,
  End
};

enum class ProtocolFault {
  None,
  InvalidLength,      ///< length field below the generic 4-byte header
  Truncated,          ///< frame shorter than its command family requires
  OffsetOutOfRange,   ///< fragment offset + chunk length beyond declared total
  TotalMismatch,      ///< later fragment declares a different total than the first
  UnexpectedCommand,  ///< command type not valid at this point
  MalformedXml        ///< reassembled text is not an SDK envelope
};

enum class IoFault {
  None,
  Timeout,
  Closed,
  Broken
};

struct Error {
  ErrorKind kind = ErrorKind::None;
  Phase phase = Phase::None;
  ProtocolFault protocol = ProtocolFault::None;
  IoFault io = IoFault::None;
  int device_code = -1;   ///< -1 when the device reported no numeric code
  std::string message;

  bool ok() const { return kind == ErrorKind::None; }

  /// One line of key=value text: `kind=io io=timeout reason=...`.
  std::string describe() const;

  void clear() { *this = Error{}; }
};

const char* to_string(ErrorKind k);
const char* to_string(Phase p);
const char* to_string(ProtocolFault f);
const char* to_string(IoFault f);

// Constructors for the common shapes. Each returns the error by value so
// call sites read `err = io_error(IoFault::Timeout, "...")`.
Error not_connected_error();
Error connect_error(const std::string& message);
Error handshake_error(Phase phase, int device_code, const std::string& message);
Error protocol_error(ProtocolFault fault, const std::string& message);
Error device_error(int device_code, const std::string& message);
Error transfer_error(Phase phase, int device_code, const std::string& message);
Error io_error(IoFault fault, const std::string& message);
Error config_error(const std::string& message);

} // namespace ledlink
