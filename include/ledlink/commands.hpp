/**
 * @page ll-commands ledlink Device Commands
 * @file commands.hpp
 * @brief "Build XML, send, parse" wrappers over Device::send_command.
 *
 * @details
 * Each wrapper sends one SDK method and turns a result other than
 * "kSuccess" into a Device error whose message carries the result string,
 * e.g. `kind=device reason=GetFiles: kInvalidGuid`. Transport failures pass
 * through unchanged.
 *
 * The pretty printers render shell-friendly `key=value` lines for the CLI:
 * @code
 *   model=C16 id=C16-D00-A1B2 name=lobby screen=128x64 rotation=0 app=7.10.2.0 ...
 *   name=a.png size=20000 exist=20000 md5=... type=image
 * @endcode
 */
#pragma once

#include <string>
#include <vector>

#include "ledlink/device.hpp"
#include "ledlink/error.hpp"
#include "ledlink/sdk_xml.hpp"

namespace ledlink {

/// GetDeviceInfo; on success also refreshes dev.cached_info().
bool get_device_info(Device& dev, DeviceInfo& out, Error& err);

bool open_screen(Device& dev, Error& err);
bool close_screen(Device& dev, Error& err);

/// GetFiles: every file stored on the device.
bool get_files(Device& dev, std::vector<RemoteFile>& out, Error& err);

/// DeleteFiles by name. An empty list succeeds without contacting the device.
bool delete_files(Device& dev, const std::vector<std::string>& names, Error& err);

std::string describe(const DeviceInfo& info);
std::string describe(const RemoteFile& file);

} // namespace ledlink
