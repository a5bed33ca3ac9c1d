/**
 * @page ll-wire ledlink Wire Codec
 * @file wire.hpp
 * @brief Command codes, device result codes, and byte-exact packet builders/parsers.
 *
 * @details
 * PURPOSE
 * -------
 * Every packet on the controller's TCP stream shares one envelope:
 *
 *     [0:2) total length incl. header (u16 LE)
 *     [2:4) command type               (u16 LE)
 *     [4:..) command-specific body
 *
 * This header names the command types and fixed sizes, and provides the
 * builders for the fixed-layout packets (version, heartbeat, file start /
 * content / end) and the parsers for their answers. SDK XML fragments are
 * built in fragments.hpp on top of the same helpers.
 *
 * LAYOUTS (all little-endian)
 * ---------------------------
 *   version ask/answer   8    hdr + u32 version
 *   heartbeat ask        4    hdr
 *   error answer         6    hdr + u16 device code
 *   sdk command        12+N   hdr + u32 total xml len + u32 offset + chunk
 *   file start ask    47+L+1  hdr + md5 hex[32] + pad + u32 size + pad[4]
 *                             + u16 file type + name + NUL
 *   file start answer  >=10   hdr + u16 result + u32 existing bytes
 *   file content ask   4+N    hdr + raw bytes
 *   file end ask/answer 4/>=6 hdr / hdr + u16 result
 *
 * Parsers take the whole packet (header included) and return false when it
 * is too short for its layout. They never read past `size()`.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ledlink {

using Bytes = std::vector<uint8_t>;

// ---- sizes and protocol constants ----
constexpr size_t   HEADER_LEN          = 4;        ///< generic [len][cmd]
constexpr size_t   VERSION_PACKET_LEN  = 8;
constexpr size_t   ERROR_PACKET_LEN    = 6;
constexpr size_t   SDK_HEADER_LEN      = 12;
constexpr size_t   FILE_START_HEAD_LEN = 47;
constexpr size_t   FILE_START_ANSWER_LEN = 10;
constexpr size_t   FILE_END_ANSWER_LEN = 6;
constexpr size_t   MAX_CONTENT_LEN     = 8000;     ///< max XML chunk / file chunk per packet
constexpr size_t   MAX_PACKET_LEN      = 0xFFFF;   ///< u16 length field
constexpr size_t   MD5_HEX_LEN         = 32;

constexpr uint32_t TRANSPORT_VERSION   = 0x1000005;
constexpr uint32_t SDK_VERSION         = 0x1000000;
constexpr uint16_t DEFAULT_PORT        = 10001;
constexpr int      DEFAULT_TIMEOUT_MS  = 10000;
constexpr int      DEFAULT_HEARTBEAT_MS = 30000;

enum class CmdType : uint16_t {
  HeartbeatAsk        = 0x005F,
  HeartbeatAnswer     = 0x0060,
  SearchDeviceAsk     = 0x1001,
  SearchDeviceAnswer  = 0x1002,
  ErrorAnswer         = 0x2000,
  ServiceAsk          = 0x2001,   ///< transport version ask
  ServiceAnswer       = 0x2002,   ///< transport version answer
  SdkCmdAsk           = 0x2003,
  SdkCmdAnswer        = 0x2004,
  GpsInfoAnswer       = 0x3007,
  FileStartAsk        = 0x8001,
  FileStartAnswer     = 0x8002,
  FileContentAsk      = 0x8003,
  FileContentAnswer   = 0x8004,
  FileEndAsk          = 0x8005,
  FileEndAnswer       = 0x8006,
  ReadFileAsk         = 0x8007,
  ReadFileAnswer      = 0x8008
};

/// Stable short name, e.g. "SdkCmdAnswer"; "Unknown" for codes not listed above.
const char* to_string(CmdType c);

/// Result codes carried by error answers and file start/end answers.
enum DeviceCode : int {
  kSuccess           = 0,
  kWriteFinish       = 1,
  kProcessError      = 2,
  kVersionTooLow     = 3,
  kDeviceOccupied    = 4,
  kFileOccupied      = 5,
  kReadFileExcessive = 6,
  kInvalidPacketLen  = 7,
  kInvalidParam      = 8,
  kNotSpaceToSave    = 9,
  kCreateFileFailed  = 10,
  kWriteFileFailed   = 11,
  kReadFileFailed    = 12,
  kInvalidFileData   = 13,
  kFileContentError  = 14,
  kOpenFileFailed    = 15,
  kSeekFileFailed    = 16,
  kRenameFailed      = 17,
  kFileNotFound      = 18,
  kFileNotFinish     = 19,
  kXmlCmdTooLong     = 20,
  kInvalidXmlIndex   = 21,
  kParseXmlFailed    = 22,
  kInvalidMethod     = 23,
  kMemoryFailed      = 24,
  kSystemError       = 25,
  kUnsupportVideo    = 26,
  kNotMediaFile      = 27,
  kParseVideoFailed  = 28,
  kUnsupportFps      = 29,
  kUnsupportRes      = 30,
  kUnsupportFormat   = 31,
  kUnsupportDuration = 32,
  kDownloadFailed    = 33,
  kScreenNodeNull    = 34,
  kNodeExist         = 35,
  kNodeNotExist      = 36,
  kPluginNotExist    = 37,
  kCheckLicense      = 38,
  kNotFoundWifi      = 39,
  kTestWifiFailed    = 40,
  kRunningError      = 41,
  kUnsupportMethod   = 42,
  kInvalidGuid       = 43,
  kFirmwareFormat    = 44,
  kTagNotFound       = 45,
  kAttrNotFound      = 46,
  kCreateTagFailed   = 47,
  kUnsupportDevice   = 48,
  kPermissionDenied  = 49,
  kPasswdTooSimple   = 50
};

/// Human-readable name for a device result code ("device occupied", ...).
std::string describe_device_code(int code);

/// File classification sent in the file-start packet.
enum class FileType : int {
  Auto          = -1,   ///< detect from the file extension
  Image         = 0,
  Video         = 1,
  Font          = 2,
  Firmware      = 3,
  FpgaConfig    = 4,
  SettingConfig = 5,
  ProgramXml    = 9,
  TempImage     = 128,
  TempVideo     = 129
};

// ---- little-endian helpers ----
inline void put_u16(uint8_t* p, uint16_t v) {
  p[0] = static_cast<uint8_t>(v & 0xFF);
  p[1] = static_cast<uint8_t>(v >> 8);
}

inline void put_u32(uint8_t* p, uint32_t v) {
  p[0] = static_cast<uint8_t>(v & 0xFF);
  p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
  p[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
  p[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

inline uint16_t get_u16(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t get_u32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0])
       | (static_cast<uint32_t>(p[1]) << 8)
       | (static_cast<uint32_t>(p[2]) << 16)
       | (static_cast<uint32_t>(p[3]) << 24);
}

// ---- builders ----

/// 8-byte ServiceAsk carrying TRANSPORT_VERSION. First packet after TCP connect.
Bytes make_version_ask();

/// 4-byte HeartbeatAsk.
Bytes make_heartbeat_ask();

/**
 * @brief Build a FileStartAsk.
 *
 * @param name     File name as stored on the device (UTF-8, no path).
 * @param size     Declared file size; must fit in u32.
 * @param type     Classification; must not be FileType::Auto.
 * @param md5_hex  32 lowercase hex characters.
 * @param out      Receives the packet.
 * @return false if the packet would not fit the u16 length field.
 */
bool make_file_start_ask(const std::string& name, uint32_t size, FileType type,
                         const std::string& md5_hex, Bytes& out);

/// FileContentAsk around `n` raw bytes (n <= MAX_CONTENT_LEN).
Bytes make_file_content_ask(const uint8_t* data, size_t n);

/// 4-byte FileEndAsk.
Bytes make_file_end_ask();

// ---- parsers (whole packet in, header included) ----

/// Read length and command from the first four bytes.
bool parse_header(const Bytes& pkt, uint16_t& length, CmdType& cmd);

bool parse_version_answer(const Bytes& pkt, uint32_t& version);

bool parse_error_answer(const Bytes& pkt, int& device_code);

/// Total XML length and this fragment's offset from an SDK command packet.
bool parse_sdk_header(const Bytes& pkt, uint32_t& total_len, uint32_t& offset);

bool parse_file_start_answer(const Bytes& pkt, int& result, uint32_t& existing_bytes);

bool parse_file_end_answer(const Bytes& pkt, int& result);

} // namespace ledlink
