// ============================================================================
// fragments.cpp: implementation for fragments.hpp
// ============================================================================

#include "ledlink/fragments.hpp"
#include "ledlink/sdk_xml.hpp"    // clean_xml()

#include <algorithm>
#include <cstring>

namespace ledlink {

std::vector<Bytes> build_request(const std::string& xml, size_t max_chunk) {
  std::vector<Bytes> frames;
  const size_t total = xml.size();
  if (total == 0) return frames;

  if (max_chunk == 0 || max_chunk > MAX_CONTENT_LEN) max_chunk = MAX_CONTENT_LEN;
  frames.reserve((total + max_chunk - 1) / max_chunk);

  for (size_t offset = 0; offset < total; ) {
    const size_t chunk = std::min(max_chunk, total - offset);
    const size_t len = SDK_HEADER_LEN + chunk;

    Bytes b(len, 0);
    put_u16(b.data(),     static_cast<uint16_t>(len));
    put_u16(b.data() + 2, static_cast<uint16_t>(CmdType::SdkCmdAsk));
    put_u32(b.data() + 4, static_cast<uint32_t>(total));
    put_u32(b.data() + 8, static_cast<uint32_t>(offset));
    std::memcpy(b.data() + SDK_HEADER_LEN, xml.data() + offset, chunk);

    frames.push_back(std::move(b));
    offset += chunk;
  }
  return frames;
}

// ---------------------------------------------------------------------------
// assemble_response()
// -------------------
// State lives on the stack for one call: the buffer exists from the first
// fragment until the document completes or any frame fails. Nothing carries
// over to the next call.
// ---------------------------------------------------------------------------
bool assemble_response(FrameSource& src, std::string& xml_out, Error& err, const Logger* log) {
  Bytes buf;
  bool started = false;
  uint32_t total = 0;
  uint64_t received = 0;

  while (true) {
    Packet pkt;
    if (!src.read_frame(pkt, err)) return false;

    switch (pkt.command) {
      case CmdType::SdkCmdAnswer: {
        uint32_t declared = 0, offset = 0;
        if (!parse_sdk_header(pkt.bytes, declared, offset)) {
          err = protocol_error(ProtocolFault::Truncated,
                               "sdk answer shorter than its 12-byte header");
          return false;
        }

        if (!started) {
          if (declared > MAX_RESPONSE_XML_LEN) {
            err = protocol_error(ProtocolFault::InvalidLength,
                                 "declared response length too large: " + std::to_string(declared));
            return false;
          }
          total = declared;
          buf.assign(total, 0);
          started = true;
        } else if (declared != total) {
          err = protocol_error(ProtocolFault::TotalMismatch,
                               "fragment declares total " + std::to_string(declared) +
                               ", first fragment declared " + std::to_string(total));
          return false;
        }

        const size_t chunk = pkt.bytes.size() - SDK_HEADER_LEN;
        if (static_cast<uint64_t>(offset) + chunk > total) {
          err = protocol_error(ProtocolFault::OffsetOutOfRange,
                               "fragment [" + std::to_string(offset) + ", +" + std::to_string(chunk) +
                               ") exceeds total " + std::to_string(total));
          return false;
        }

        if (chunk) std::memcpy(buf.data() + offset, pkt.bytes.data() + SDK_HEADER_LEN, chunk);
        received += chunk;

        if (received >= total) {
          xml_out = clean_xml(buf);
          return true;
        }
        break;
      }

      case CmdType::ErrorAnswer: {
        int code = -1;
        if (!parse_error_answer(pkt.bytes, code)) {
          err = protocol_error(ProtocolFault::Truncated, "error answer without a code");
          return false;
        }
        err = device_error(code, "device error answer: " + describe_device_code(code));
        return false;
      }

      case CmdType::HeartbeatAnswer:
        if (log) log->debug("heartbeat answer skipped while waiting for sdk answer");
        break;

      default:
        err = protocol_error(ProtocolFault::UnexpectedCommand,
                             std::string("unexpected frame while waiting for sdk answer: ") +
                             to_string(pkt.command));
        return false;
    }
  }
}

} // namespace ledlink
