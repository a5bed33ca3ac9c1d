/**
 * @file sdk_xml.hpp
 * @brief SDK XML envelope: request builders and response parsers (libxml2).
 *
 * @details
 * Request:
 * @code
 *   <?xml version="1.0" encoding="utf-8"?>
 *   <sdk guid="GUID">
 *     <in method="GetDeviceInfo">
 *       ...inner...
 *     </in>
 *   </sdk>
 * @endcode
 * Lines are CRLF separated, as the controller firmware emits them.
 *
 * Response:
 * @code
 *   <sdk guid="GUID"><out method="GetDeviceInfo" result="kSuccess">...</out></sdk>
 * @endcode
 *
 * A non-"kSuccess" result is data, not a parse failure. Callers that need a
 * failure (the wrappers in commands.hpp) check is_success() themselves.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ledlink/error.hpp"
#include "ledlink/wire.hpp"

namespace ledlink {

/// GUID sent before the controller has assigned one.
constexpr const char* GUID_PLACEHOLDER = "##GUID";
/// Result string of a successful SDK call.
constexpr const char* RESULT_SUCCESS = "kSuccess";

namespace method {
constexpr const char* GetIFVersion  = "GetIFVersion";
constexpr const char* GetDeviceInfo = "GetDeviceInfo";
constexpr const char* OpenScreen    = "OpenScreen";
constexpr const char* CloseScreen   = "CloseScreen";
constexpr const char* GetFiles      = "GetFiles";
constexpr const char* DeleteFiles   = "DeleteFiles";
} // namespace method

struct SdkResponse {
  std::string guid;
  std::string method;
  std::string result;
  std::string inner_xml;   ///< children of <out>, serialized and trimmed
  std::string raw_xml;     ///< whole document as received

  bool is_success() const { return result == RESULT_SUCCESS; }
};

struct DeviceInfo {
  std::string cpu;
  std::string model;
  std::string device_id;
  std::string device_name;
  std::string fpga_version;
  std::string app_version;
  std::string kernel_version;
  int screen_width{0};
  int screen_height{0};
  int screen_rotation{0};
};

/// One entry of a GetFiles listing.
struct RemoteFile {
  std::string name;
  uint64_t size{0};
  uint64_t exist_size{0};   ///< bytes already on the device; < size for a partial upload
  std::string md5;
  std::string type;
};

/// Escape & < > " ' for use in attribute values and text.
std::string xml_escape(const std::string& s);

/// Drop a leading UTF-8 BOM and surrounding whitespace.
std::string clean_xml(const std::string& s);
std::string clean_xml(const Bytes& b);

/// Full request document. @p inner is inserted verbatim; omitted when empty.
std::string build_sdk_xml(const std::string& guid, const std::string& method,
                          const std::string& inner = std::string());

/// GetIFVersion request under GUID_PLACEHOLDER carrying SDK_VERSION in hex.
std::string build_version_xml();

/// `<files><file name=".."/>...</files>` for DeleteFiles.
std::string build_delete_files_xml(const std::vector<std::string>& names);

/**
 * @brief Parse a reassembled response document.
 *
 * Takes guid from <sdk>, method and result from <out>, and serializes the
 * children of <out> into inner_xml.
 *
 * @return false with Protocol/MalformedXml when the text is not well-formed
 *         or carries neither a guid nor a method.
 */
bool parse_sdk_response(const std::string& raw, SdkResponse& out, Error& err);

/**
 * @brief Read <device>, <version> and <screen> attributes from GetDeviceInfo's
 *        inner XML. Missing elements leave fields at their defaults.
 * @return false with Protocol/MalformedXml on unparsable input.
 */
bool parse_device_info(const std::string& inner, DeviceInfo& out, Error& err);

/// Collect every <file> element of a GetFiles inner XML.
bool parse_file_list(const std::string& inner, std::vector<RemoteFile>& out, Error& err);

} // namespace ledlink
