/**
 * @file fragments.hpp
 * @brief Split SDK XML into command fragments; reassemble fragmented answers.
 *
 * @details
 * An SDK request or response is one XML document, but a frame holds at most
 * MAX_CONTENT_LEN (8000) bytes of it. Each fragment frame carries:
 *
 *     [0:2)   frame length (12 + chunk)
 *     [2:4)   SdkCmdAsk (requests) / SdkCmdAnswer (responses)
 *     [4:8)   total XML length, identical in every fragment of one document
 *     [8:12)  this chunk's byte offset in the document
 *     [12:)   chunk
 *
 * Example: a 20000-byte document goes out as three frames at offsets
 * 0, 8000 and 16000 carrying 8000, 8000 and 4000 bytes.
 *
 * Reassembly trusts nothing from the device: every chunk is bounds-checked
 * against the total declared by the first fragment before it is copied.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ledlink/error.hpp"
#include "ledlink/framer.hpp"
#include "ledlink/log.hpp"
#include "ledlink/wire.hpp"

namespace ledlink {

/// Upper bound on a declared response length; larger totals are refused before allocation.
constexpr uint32_t MAX_RESPONSE_XML_LEN = 64u * 1024u * 1024u;

/**
 * @brief Split @p xml into SdkCmdAsk fragment frames.
 *
 * @param xml        Complete request document.
 * @param max_chunk  Largest chunk per frame (1..MAX_CONTENT_LEN).
 * @return Frames in send order; empty for empty input. Offsets are
 *         contiguous and cover exactly [0, xml.size()).
 */
std::vector<Bytes> build_request(const std::string& xml, size_t max_chunk = MAX_CONTENT_LEN);

/**
 * @brief Read frames from @p src until one complete SDK answer is assembled.
 *
 * Per frame:
 *   - SdkCmdAnswer: the first one sizes the buffer from its declared total;
 *     each chunk is copied at its offset after checking
 *     `offset + chunk <= total` (else Protocol/OffsetOutOfRange) and that the
 *     total matches the first fragment's (else Protocol/TotalMismatch).
 *     Done when the received byte count reaches the total.
 *   - ErrorAnswer: fail with Device error carrying the 2-byte code.
 *   - HeartbeatAnswer: skipped; does not count toward completion.
 *   - anything else: Protocol/UnexpectedCommand.
 *
 * @param xml_out  Assembled document with any UTF-8 BOM removed and
 *                 surrounding whitespace trimmed.
 * @param log      Optional; skipped heartbeat answers are logged at debug.
 */
bool assemble_response(FrameSource& src, std::string& xml_out, Error& err,
                       const Logger* log = nullptr);

} // namespace ledlink
