#include "ledlink/commands.hpp"

#include <sstream>

namespace ledlink {

// ---------------------------------------------------------------------------
// Send one method and require "kSuccess". Every wrapper below goes through
// here so the error shape is the same for all of them.
// ---------------------------------------------------------------------------
static bool call(Device& dev, const char* method, const std::string& inner,
                 SdkResponse& resp, Error& err) {
  if (!dev.send_command(method, inner, resp, err)) return false;
  if (!resp.is_success()) {
    err = device_error(-1, std::string(method) + ": " +
                           (resp.result.empty() ? std::string("no result") : resp.result));
    return false;
  }
  return true;
}

bool get_device_info(Device& dev, DeviceInfo& out, Error& err) {
  SdkResponse resp;
  if (!call(dev, method::GetDeviceInfo, std::string(), resp, err)) return false;
  if (!parse_device_info(resp.inner_xml, out, err)) return false;
  dev.set_cached_info(out);
  return true;
}

bool open_screen(Device& dev, Error& err) {
  SdkResponse resp;
  return call(dev, method::OpenScreen, std::string(), resp, err);
}

bool close_screen(Device& dev, Error& err) {
  SdkResponse resp;
  return call(dev, method::CloseScreen, std::string(), resp, err);
}

bool get_files(Device& dev, std::vector<RemoteFile>& out, Error& err) {
  SdkResponse resp;
  if (!call(dev, method::GetFiles, std::string(), resp, err)) return false;
  return parse_file_list(resp.inner_xml, out, err);
}

bool delete_files(Device& dev, const std::vector<std::string>& names, Error& err) {
  if (names.empty()) return true;
  SdkResponse resp;
  return call(dev, method::DeleteFiles, build_delete_files_xml(names), resp, err);
}

// Values are printed raw; device names may contain spaces.
std::string describe(const DeviceInfo& info) {
  std::ostringstream o;
  o << "model=" << info.model
    << " id=" << info.device_id
    << " name=" << info.device_name
    << " cpu=" << info.cpu
    << " screen=" << info.screen_width << "x" << info.screen_height
    << " rotation=" << info.screen_rotation
    << " app=" << info.app_version
    << " fpga=" << info.fpga_version
    << " kernel=" << info.kernel_version;
  return o.str();
}

std::string describe(const RemoteFile& file) {
  std::ostringstream o;
  o << "name=" << file.name
    << " size=" << file.size
    << " exist=" << file.exist_size
    << " md5=" << file.md5
    << " type=" << file.type;
  return o.str();
}

} // namespace ledlink
