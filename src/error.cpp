// ============================================================================
// error.cpp: implementation for error.hpp
// ============================================================================

#include "ledlink/error.hpp"

#include <sstream>

namespace ledlink {

const char* to_string(ErrorKind k) {
  switch (k) {
    case ErrorKind::None:         return "none";
    case ErrorKind::NotConnected: return "not_connected";
    case ErrorKind::Connect:      return "connect";
    case ErrorKind::Handshake:    return "handshake";
    case ErrorKind::Protocol:     return "protocol";
    case ErrorKind::Device:       return "device";
    case ErrorKind::FileTransfer: return "file_transfer";
    case ErrorKind::Io:           return "io";
    case ErrorKind::Config:       return "config";
  }
  return "unknown";
}

const char* to_string(Phase p) {
  switch (p) {
    case Phase::None:       return "none";
    case Phase::Version:    return "version";
    case Phase::SdkVersion: return "sdk_version";
    case Phase::DeviceInfo: return "device_info";
    case Phase::Start:      return "start";
    case Phase::Content:    return "content";
    case Phase::End:        return "end";
  }
  return "unknown";
}

const char* to_string(ProtocolFault f) {
  switch (f) {
    case ProtocolFault::None:              return "none";
    case ProtocolFault::InvalidLength:     return "invalid_length";
    case ProtocolFault::Truncated:         return "truncated";
    case ProtocolFault::OffsetOutOfRange:  return "offset_out_of_range";
    case ProtocolFault::TotalMismatch:     return "total_mismatch";
    case ProtocolFault::UnexpectedCommand: return "unexpected_command";
    case ProtocolFault::MalformedXml:      return "malformed_xml";
  }
  return "unknown";
}

const char* to_string(IoFault f) {
  switch (f) {
    case IoFault::None:    return "none";
    case IoFault::Timeout: return "timeout";
    case IoFault::Closed:  return "closed";
    case IoFault::Broken:  return "broken";
  }
  return "unknown";
}

std::string Error::describe() const {
  std::ostringstream os;
  os << "kind=" << to_string(kind);
  if (phase != Phase::None)             os << " phase=" << to_string(phase);
  if (protocol != ProtocolFault::None)  os << " fault=" << to_string(protocol);
  if (io != IoFault::None)              os << " io=" << to_string(io);
  if (device_code >= 0)                 os << " code=" << device_code;
  if (!message.empty())                 os << " reason=\"" << message << "\"";
  return os.str();
}

Error not_connected_error() {
  Error e;
  e.kind = ErrorKind::NotConnected;
  e.message = "device not connected, call connect() first";
  return e;
}

Error connect_error(const std::string& message) {
  Error e;
  e.kind = ErrorKind::Connect;
  e.message = message;
  return e;
}

Error handshake_error(Phase phase, int device_code, const std::string& message) {
  Error e;
  e.kind = ErrorKind::Handshake;
  e.phase = phase;
  e.device_code = device_code;
  e.message = message;
  return e;
}

Error protocol_error(ProtocolFault fault, const std::string& message) {
  Error e;
  e.kind = ErrorKind::Protocol;
  e.protocol = fault;
  e.message = message;
  return e;
}

Error device_error(int device_code, const std::string& message) {
  Error e;
  e.kind = ErrorKind::Device;
  e.device_code = device_code;
  e.message = message;
  return e;
}

Error transfer_error(Phase phase, int device_code, const std::string& message) {
  Error e;
  e.kind = ErrorKind::FileTransfer;
  e.phase = phase;
  e.device_code = device_code;
  e.message = message;
  return e;
}

Error io_error(IoFault fault, const std::string& message) {
  Error e;
  e.kind = ErrorKind::Io;
  e.io = fault;
  e.message = message;
  return e;
}

Error config_error(const std::string& message) {
  Error e;
  e.kind = ErrorKind::Config;
  e.message = message;
  return e;
}

} // namespace ledlink
