// ============================================================================
// wire.cpp: implementation for wire.hpp
// For layouts see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ledlink/wire.hpp"

#include <algorithm>
#include <cstring>

namespace ledlink {

// ---------------------------------------------------------------------------
// Start a packet of `len` zeroed bytes with the [len][cmd] envelope filled in.
// Callers write the body at [4:).
// ---------------------------------------------------------------------------
static inline Bytes header(CmdType cmd, size_t len) {
  Bytes b(len, 0);
  put_u16(b.data(), static_cast<uint16_t>(len));
  put_u16(b.data() + 2, static_cast<uint16_t>(cmd));
  return b;
}

const char* to_string(CmdType c) {
  switch (c) {
    case CmdType::HeartbeatAsk:       return "HeartbeatAsk";
    case CmdType::HeartbeatAnswer:    return "HeartbeatAnswer";
    case CmdType::SearchDeviceAsk:    return "SearchDeviceAsk";
    case CmdType::SearchDeviceAnswer: return "SearchDeviceAnswer";
    case CmdType::ErrorAnswer:        return "ErrorAnswer";
    case CmdType::ServiceAsk:         return "ServiceAsk";
    case CmdType::ServiceAnswer:      return "ServiceAnswer";
    case CmdType::SdkCmdAsk:          return "SdkCmdAsk";
    case CmdType::SdkCmdAnswer:       return "SdkCmdAnswer";
    case CmdType::GpsInfoAnswer:      return "GpsInfoAnswer";
    case CmdType::FileStartAsk:       return "FileStartAsk";
    case CmdType::FileStartAnswer:    return "FileStartAnswer";
    case CmdType::FileContentAsk:     return "FileContentAsk";
    case CmdType::FileContentAnswer:  return "FileContentAnswer";
    case CmdType::FileEndAsk:         return "FileEndAsk";
    case CmdType::FileEndAnswer:      return "FileEndAnswer";
    case CmdType::ReadFileAsk:        return "ReadFileAsk";
    case CmdType::ReadFileAnswer:     return "ReadFileAnswer";
  }
  return "Unknown";
}

std::string describe_device_code(int code) {
  switch (code) {
    case kSuccess:          return "success";
    case kWriteFinish:      return "file write finished";
    case kProcessError:     return "process flow error";
    case kVersionTooLow:    return "protocol version too low";
    case kDeviceOccupied:   return "device occupied by another client";
    case kFileOccupied:     return "file in use";
    case kReadFileExcessive:return "too many file read requests";
    case kInvalidPacketLen: return "invalid packet length";
    case kInvalidParam:     return "invalid parameter";
    case kNotSpaceToSave:   return "not enough storage space";
    case kCreateFileFailed: return "file create failed";
    case kWriteFileFailed:  return "file write failed";
    case kReadFileFailed:   return "file read failed";
    case kInvalidFileData:  return "invalid file data";
    case kFileContentError: return "file content error";
    case kOpenFileFailed:   return "file open failed";
    case kSeekFileFailed:   return "file seek failed";
    case kRenameFailed:     return "rename failed";
    case kFileNotFound:     return "file not found";
    case kFileNotFinish:    return "file transfer not finished";
    case kXmlCmdTooLong:    return "xml command too long";
    case kInvalidXmlIndex:  return "invalid xml index";
    case kParseXmlFailed:   return "xml parse failed";
    case kInvalidMethod:    return "invalid method";
    case kMemoryFailed:     return "memory error";
    case kSystemError:      return "system error";
    case kUnsupportVideo:   return "unsupported video";
    case kNotMediaFile:     return "not a media file";
    case kParseVideoFailed: return "video parse failed";
    case kUnsupportFps:     return "unsupported frame rate";
    case kUnsupportRes:     return "unsupported resolution";
    case kUnsupportFormat:  return "unsupported format";
    case kUnsupportDuration:return "unsupported duration";
    case kDownloadFailed:   return "download failed";
    case kScreenNodeNull:   return "screen node missing";
    case kNodeExist:        return "node already exists";
    case kNodeNotExist:     return "node does not exist";
    case kPluginNotExist:   return "plugin does not exist";
    case kCheckLicense:     return "license check failed";
    case kNotFoundWifi:     return "wifi module not found";
    case kTestWifiFailed:   return "wifi test failed";
    case kRunningError:     return "running error";
    case kUnsupportMethod:  return "unsupported method";
    case kInvalidGuid:      return "invalid guid";
    case kFirmwareFormat:   return "firmware format error";
    case kTagNotFound:      return "tag not found";
    case kAttrNotFound:     return "attribute not found";
    case kCreateTagFailed:  return "tag create failed";
    case kUnsupportDevice:  return "unsupported device model";
    case kPermissionDenied: return "permission denied";
    case kPasswdTooSimple:  return "password too simple";
    default: break;
  }
  return "unknown device error (" + std::to_string(code) + ")";
}

// ============================================================================
// Builders
// ============================================================================

Bytes make_version_ask() {
  auto b = header(CmdType::ServiceAsk, VERSION_PACKET_LEN);
  put_u32(b.data() + 4, TRANSPORT_VERSION);
  return b;
}

Bytes make_heartbeat_ask() {
  return header(CmdType::HeartbeatAsk, HEADER_LEN);
}

bool make_file_start_ask(const std::string& name, uint32_t size, FileType type,
                         const std::string& md5_hex, Bytes& out) {
  const size_t len = FILE_START_HEAD_LEN + name.size() + 1;   // name + NUL
  if (len > MAX_PACKET_LEN) return false;

  out = header(CmdType::FileStartAsk, len);
  // [4:36) md5 as ASCII hex; shorter input stays zero-padded
  std::memcpy(out.data() + 4, md5_hex.data(), std::min(md5_hex.size(), MD5_HEX_LEN));
  // [36] pad, [37:41) size, [41:45) pad
  put_u32(out.data() + 37, size);
  // [45:47) type
  put_u16(out.data() + 45, static_cast<uint16_t>(static_cast<int>(type)));
  // [47:) name, final byte already NUL
  std::memcpy(out.data() + FILE_START_HEAD_LEN, name.data(), name.size());
  return true;
}

Bytes make_file_content_ask(const uint8_t* data, size_t n) {
  auto b = header(CmdType::FileContentAsk, HEADER_LEN + n);
  if (n) std::memcpy(b.data() + HEADER_LEN, data, n);
  return b;
}

Bytes make_file_end_ask() {
  return header(CmdType::FileEndAsk, HEADER_LEN);
}

// ============================================================================
// Parsers
// ============================================================================

bool parse_header(const Bytes& pkt, uint16_t& length, CmdType& cmd) {
  if (pkt.size() < HEADER_LEN) return false;
  length = get_u16(pkt.data());
  cmd    = static_cast<CmdType>(get_u16(pkt.data() + 2));
  return true;
}

bool parse_version_answer(const Bytes& pkt, uint32_t& version) {
  if (pkt.size() < VERSION_PACKET_LEN) return false;
  version = get_u32(pkt.data() + 4);
  return true;
}

bool parse_error_answer(const Bytes& pkt, int& device_code) {
  if (pkt.size() < ERROR_PACKET_LEN) return false;
  device_code = get_u16(pkt.data() + 4);
  return true;
}

bool parse_sdk_header(const Bytes& pkt, uint32_t& total_len, uint32_t& offset) {
  if (pkt.size() < SDK_HEADER_LEN) return false;
  total_len = get_u32(pkt.data() + 4);
  offset    = get_u32(pkt.data() + 8);
  return true;
}

bool parse_file_start_answer(const Bytes& pkt, int& result, uint32_t& existing_bytes) {
  if (pkt.size() < FILE_START_ANSWER_LEN) return false;
  result         = get_u16(pkt.data() + 4);
  existing_bytes = get_u32(pkt.data() + 6);
  return true;
}

bool parse_file_end_answer(const Bytes& pkt, int& result) {
  if (pkt.size() < FILE_END_ANSWER_LEN) return false;
  result = get_u16(pkt.data() + 4);
  return true;
}

} // namespace ledlink
