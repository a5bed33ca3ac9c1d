/**
 * @file main.cpp
 * @brief ledlink-cli: one-shot command runner for a networked LED controller.
 *
 * Responsibilities:
 *  - Merge options: built-in defaults, then the JSON config file, then flags.
 *  - Connect (handshake + heartbeat), run exactly one action, close.
 *  - Print shell-friendly `status=ok ...` / `status=error kind=... reason=...` lines.
 *
 * Exit codes:
 *   0 ok
 *   1 connect, handshake or link failure
 *   2 usage error, bad config, or the device refused the request
 *   3 timeout
 *
 * Examples:
 *   ledlink-cli --host 192.168.6.1 --info
 *   ledlink-cli --host 192.168.6.1 --upload a.png b.mp4 --progress
 *   ledlink-cli --host 192.168.6.1 --send GetFiles
 *   ledlink-cli --host 192.168.6.1 --rm a.png b.mp4
 */

#include <cstdint>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"

#include "ledlink/commands.hpp"
#include "ledlink/config.hpp"
#include "ledlink/device.hpp"
#include "ledlink/error.hpp"

using namespace ledlink;

static int exit_code_for(const Error& e) {
  switch (e.kind) {
    case ErrorKind::Io:
      return e.io == IoFault::Timeout ? 3 : 1;
    case ErrorKind::Connect:
    case ErrorKind::Handshake:
    case ErrorKind::NotConnected:
      return 1;
    default:
      return 2;
  }
}

static int fail(const Error& e) {
  std::cerr << "status=error " << e.describe() << "\n";
  return exit_code_for(e);
}

static bool valid_type(int t) {
  return t == -1 || (t >= 0 && t <= 5) || t == 9 || t == 128 || t == 129;
}

int main(int argc, char** argv) {
  CLI::App app{"ledlink CLI"};

  // ---- connection ----
  std::string host;
  int port = DEFAULT_PORT;
  int timeout_ms = DEFAULT_TIMEOUT_MS;
  int heartbeat_ms = DEFAULT_HEARTBEAT_MS;
  bool verbose = false;
  std::string config_path;

  CLI::Option* opt_host = app.add_option("--host", host, "Controller address (IP or hostname)");
  CLI::Option* opt_port = app.add_option("--port", port, "TCP port (default 10001)")
                              ->check(CLI::Range(1, 65535));
  CLI::Option* opt_timeout = app.add_option("--timeout", timeout_ms, "Per read/write deadline (ms)")
                                 ->check(CLI::PositiveNumber);
  CLI::Option* opt_hb = app.add_option("--heartbeat", heartbeat_ms, "Heartbeat interval (ms)")
                            ->check(CLI::PositiveNumber);
  CLI::Option* opt_verbose = app.add_flag("--verbose,-v", verbose, "Debug logging on stderr");
  CLI::Option* opt_config = app.add_option("--config", config_path,
                                           "JSON config file (default $XDG_CONFIG_HOME/ledlink/config.json)");

  // ---- actions ----
  bool info = false, ls = false, open_scr = false, close_scr = false, save_cfg = false, progress = false;
  std::string send_method, send_xml;
  std::vector<std::string> upload_paths, rm_names;
  int type = -1;

  app.add_flag("--info", info, "Query device info");
  app.add_option("--send", send_method, "Send a raw SDK method (e.g. GetFiles)");
  app.add_option("--xml", send_xml, "Inner XML for --send");
  app.add_option("--upload", upload_paths, "Upload one or more files")->expected(1, -1);
  app.add_option("--type", type, "File type for --upload: -1 auto, 0..5, 9, 128, 129");
  app.add_flag("--progress", progress, "With --upload: print progress lines on stderr");
  app.add_flag("--ls", ls, "List files stored on the device");
  app.add_option("--rm", rm_names, "Delete files on the device by name")->expected(1, -1);
  app.add_flag("--open-screen", open_scr, "Turn the screen on");
  app.add_flag("--close-screen", close_scr, "Turn the screen off");
  app.add_flag("--save-config", save_cfg, "Write the effective connection options to the config file");

  CLI11_PARSE(app, argc, argv);

  // -------- options: defaults < config file < flags --------
  Options opts;
  Error err;
  const bool config_explicit = opt_config->count() > 0;
  if (!config_explicit) config_path = default_config_path();
  if (!load_options(config_path, opts, err, config_explicit)) return fail(err);

  if (opt_host->count())    opts.host = host;
  if (opt_port->count())    opts.port = static_cast<uint16_t>(port);
  if (opt_timeout->count()) opts.timeout_ms = timeout_ms;
  if (opt_hb->count())      opts.heartbeat_interval_ms = heartbeat_ms;
  if (opt_verbose->count()) opts.verbose = verbose;

  if (save_cfg) {
    if (!save_options(config_path, opts, err)) return fail(err);
    std::cout << "status=ok saved=" << config_path << "\n";
    return 0;
  }

  // -------- exactly one action --------
  int actions = 0;
  actions += info ? 1 : 0;
  actions += (!send_method.empty()) ? 1 : 0;
  actions += (!upload_paths.empty()) ? 1 : 0;
  actions += ls ? 1 : 0;
  actions += (!rm_names.empty()) ? 1 : 0;
  actions += open_scr ? 1 : 0;
  actions += close_scr ? 1 : 0;

  if (actions != 1) {
    std::cerr << "status=error reason=need_exactly_one_command\n";
    return 2;
  }
  if (opts.host.empty()) {
    std::cerr << "status=error reason=no_host\n";
    return 2;
  }
  if (!valid_type(type)) {
    std::cerr << "status=error reason=invalid_type type=" << type << "\n";
    return 2;
  }

  // -------- connect --------
  Device dev(opts);
  if (!dev.connect(err)) return fail(err);

  int rc = 0;

  if (info) {
    DeviceInfo di;
    if (!get_device_info(dev, di, err)) rc = fail(err);
    else std::cout << "status=ok " << describe(di) << " guid=" << dev.guid() << "\n";

  } else if (!send_method.empty()) {
    SdkResponse resp;
    if (!dev.send_command(send_method, send_xml, resp, err)) {
      rc = fail(err);
    } else {
      std::cout << "status=" << (resp.is_success() ? "ok" : "error")
                << " method=" << resp.method << " result=" << resp.result << "\n";
      if (!resp.inner_xml.empty()) std::cout << resp.inner_xml << "\n";
      if (!resp.is_success()) rc = 2;
    }

  } else if (!upload_paths.empty()) {
    ProgressFn pfn;
    if (progress) {
      pfn = [](const UploadProgress& p) {
        std::cerr << "progress name=" << p.file_name
                  << " sent=" << p.sent_bytes << " total=" << p.total_bytes
                  << " percent=" << std::fixed << std::setprecision(1) << p.percent << "\n";
      };
    }

    auto print_result = [](const UploadResult& r) {
      std::cout << "status=ok name=" << r.name << " size=" << r.size
                << " type=" << static_cast<int>(r.type) << " md5=" << r.md5
                << " resume=" << r.resume_offset << " sent=" << r.bytes_sent
                << " end=" << r.end_code << "\n";
    };

    if (type == static_cast<int>(FileType::Auto)) {
      std::vector<UploadResult> results;
      const bool ok = dev.upload_files(upload_paths, pfn, results, err);
      // On failure the last entry is the file that failed.
      const size_t done = ok ? results.size() : (results.empty() ? 0 : results.size() - 1);
      for (size_t i = 0; i < done; ++i) print_result(results[i]);
      if (!ok) rc = fail(err);
    } else {
      for (const auto& path : upload_paths) {
        UploadResult r;
        if (!dev.upload_file(path, static_cast<FileType>(type), pfn, r, err)) {
          rc = fail(err);
          break;
        }
        print_result(r);
      }
    }

  } else if (ls) {
    std::vector<RemoteFile> files;
    if (!get_files(dev, files, err)) {
      rc = fail(err);
    } else {
      for (const auto& f : files) std::cout << describe(f) << "\n";
      std::cout << "status=ok count=" << files.size() << "\n";
    }

  } else if (!rm_names.empty()) {
    if (!delete_files(dev, rm_names, err)) rc = fail(err);
    else std::cout << "status=ok deleted=" << rm_names.size() << "\n";

  } else if (open_scr || close_scr) {
    const bool ok = open_scr ? open_screen(dev, err) : close_screen(dev, err);
    if (!ok) rc = fail(err);
    else std::cout << "status=ok screen=" << (open_scr ? "on" : "off") << "\n";
  }

  dev.close();
  return rc;
}
