// ============================================================================
// config.cpp: implementation for config.hpp
// ============================================================================

#include "ledlink/config.hpp"

#include <cstdlib>        // getenv
#include <filesystem>
#include <fstream>

#include "nlohmann/json.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ledlink {

Logger make_logger(const Options& opts) {
  return Logger(opts.verbose ? LogLevel::Debug : LogLevel::Warn,
                opts.log_sink ? opts.log_sink : stderr_sink());
}

std::string default_config_path() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg)
                                : fs::path(home ? home : ".") / ".config";
  return (base / "ledlink" / "config.json").string();
}

bool load_options(const std::string& path, Options& opts, Error& err, bool must_exist) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (!must_exist) return true;
    err = config_error("config file not found: " + path);
    return false;
  }

  std::ifstream in(path);
  if (!in) {
    err = config_error("cannot open config file: " + path);
    return false;
  }

  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    err = config_error(path + ": " + e.what());
    return false;
  }
  if (!j.is_object()) {
    err = config_error(path + ": top level must be an object");
    return false;
  }

  // Work on a copy so a bad value leaves the caller's options untouched.
  Options next = opts;
  try {
    if (j.contains("host"))    next.host    = j.at("host").get<std::string>();
    if (j.contains("verbose")) next.verbose = j.at("verbose").get<bool>();
    if (j.contains("port")) {
      const int port = j.at("port").get<int>();
      if (port <= 0 || port > 0xFFFF) {
        err = config_error(path + ": port out of range: " + std::to_string(port));
        return false;
      }
      next.port = static_cast<uint16_t>(port);
    }
    if (j.contains("timeout_ms")) {
      next.timeout_ms = j.at("timeout_ms").get<int>();
      if (next.timeout_ms <= 0) {
        err = config_error(path + ": timeout_ms must be positive");
        return false;
      }
    }
    if (j.contains("heartbeat_interval_ms")) {
      next.heartbeat_interval_ms = j.at("heartbeat_interval_ms").get<int>();
      if (next.heartbeat_interval_ms <= 0) {
        err = config_error(path + ": heartbeat_interval_ms must be positive");
        return false;
      }
    }
  } catch (const json::type_error& e) {
    err = config_error(path + ": " + e.what());
    return false;
  }

  opts = next;
  return true;
}

bool save_options(const std::string& path, const Options& opts, Error& err) {
  json j = {
    {"host", opts.host},
    {"port", opts.port},
    {"timeout_ms", opts.timeout_ms},
    {"heartbeat_interval_ms", opts.heartbeat_interval_ms},
    {"verbose", opts.verbose}
  };

  const fs::path p(path);
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
      err = config_error("config dir error: " + ec.message());
      return false;
    }
  }

  fs::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      err = config_error("cannot write " + tmp.string());
      return false;
    }
    out << j.dump(2) << "\n";
    if (!out.flush()) {
      err = config_error("write failed for " + tmp.string());
      return false;
    }
  }

  fs::rename(tmp, p, ec);
  if (ec) {
    err = config_error("rename failed: " + ec.message());
    return false;
  }
  return true;
}

} // namespace ledlink
