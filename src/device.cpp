// ============================================================================
// device.cpp: implementation for device.hpp
// Connection lifecycle, handshake and the request/response exchange.
// ============================================================================

#include "ledlink/device.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <random>

#include "ledlink/fragments.hpp"
#include "ledlink/transport/tcp_stream.hpp"

namespace fs = std::filesystem;

namespace ledlink {

namespace {

std::string hex32(uint32_t v) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "0x%08x", v);
  return buf;
}

// Write every fragment of one request, then read until its answer is whole.
// An answer naming another method is left over from an earlier request
// (late reply, or the tail of a rejected one) and is refused.
bool exchange(Framer& f, const std::string& method, const std::string& xml,
              SdkResponse& out, Error& err, const Logger& log) {
  for (const Bytes& frame : build_request(xml)) {
    if (!f.write_frame(frame, err)) return false;
  }
  std::string answer;
  if (!assemble_response(f, answer, err, &log)) return false;

  SdkResponse resp;
  if (!parse_sdk_response(answer, resp, err)) return false;
  if (!resp.method.empty() && resp.method != method) {
    err = protocol_error(ProtocolFault::UnexpectedCommand,
                         "answer for " + resp.method + " while waiting for " + method);
    return false;
  }
  out = std::move(resp);
  return true;
}

// Map a failed SDK exchange during the handshake to its phase. Io errors
// keep their kind so callers can still tell a timeout from a refusal.
void to_handshake_error(Phase phase, Error& err) {
  if (err.kind == ErrorKind::Device || err.kind == ErrorKind::Protocol) {
    err = handshake_error(phase, err.kind == ErrorKind::Device ? err.device_code : -1, err.message);
  } else {
    err.phase = phase;
  }
}

} // namespace

std::string make_session_guid() {
  std::random_device rd;
  std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd() ^
                      static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
  std::uniform_int_distribution<int> byte(0, 255);

  uint8_t b[16];
  for (auto& x : b) x = static_cast<uint8_t>(byte(gen));
  b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);   // version 4
  b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);   // RFC 4122 variant

  char s[37];
  std::snprintf(s, sizeof(s),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
  return s;
}

Device::Device(Options opts)
: Device(std::move(opts), transport::tcp_stream_factory()) {}

Device::Device(Options opts, transport::StreamFactory factory)
: opts_(std::move(opts)), factory_(std::move(factory)), log_(make_logger(opts_)) {}

Device::~Device() {
  close();
}

// ---------------------------------------------------------------------------
// connect()
// ---------
// Holds the op mutex throughout, so no command can run against a half-built
// session. The stream is published to stream_ before the handshake starts so
// a concurrent close() can abort a slow handshake.
// ---------------------------------------------------------------------------
bool Device::connect(Error& err) {
  std::lock_guard<std::mutex> op(op_mutex_);

  heartbeat_.stop();
  teardown_locked();

  log_.info("connecting host=" + opts_.host + " port=" + std::to_string(opts_.port));

  Error open_err;
  std::shared_ptr<transport::IStream> stream = factory_ ? factory_(opts_, open_err) : nullptr;
  if (!stream) {
    err = open_err.ok() ? connect_error("no stream for " + opts_.host) : open_err;
    log_.warn("connect failed: " + err.describe());
    return false;
  }

  auto framer = std::make_shared<Framer>(stream, opts_.timeout_ms);
  {
    std::lock_guard<std::mutex> st(state_mutex_);
    stream_ = stream;
    framer_ = framer;
  }

  if (!handshake_locked(err)) {
    log_.warn("handshake failed: " + err.describe());
    teardown_locked();
    return false;
  }

  {
    std::lock_guard<std::mutex> st(state_mutex_);
    live_ = true;
  }

  heartbeat_.start(std::chrono::milliseconds(opts_.heartbeat_interval_ms),
                   [this] {
                     std::lock_guard<std::mutex> st(state_mutex_);
                     return live_;
                   },
                   [framer](Error& e) { return framer->write_frame(make_heartbeat_ask(), e); },
                   log_);

  log_.info("connected guid=" + guid());
  return true;
}

bool Device::handshake_locked(Error& err) {
  std::shared_ptr<Framer> f;
  {
    std::lock_guard<std::mutex> st(state_mutex_);
    f = framer_;
  }

  // ---- phase 1: transport version ----
  Packet pkt;
  if (!f->write_frame(make_version_ask(), err) || !f->read_frame(pkt, err)) {
    if (err.kind == ErrorKind::Protocol) err = handshake_error(Phase::Version, -1, err.message);
    else err.phase = Phase::Version;
    return false;
  }

  uint32_t version = 0;
  switch (pkt.command) {
    case CmdType::ServiceAnswer:
      if (!parse_version_answer(pkt.bytes, version)) {
        err = handshake_error(Phase::Version, -1, "short version answer");
        return false;
      }
      break;
    case CmdType::ErrorAnswer: {
      int code = -1;
      if (!parse_error_answer(pkt.bytes, code)) code = -1;
      err = handshake_error(Phase::Version, code, "version refused: " + describe_device_code(code));
      return false;
    }
    default:
      err = handshake_error(Phase::Version, -1,
                            std::string("unexpected answer to version ask: ") + to_string(pkt.command));
      return false;
  }
  log_.debug("transport version " + hex32(version));

  // ---- phase 2: sdk version, session guid ----
  SdkResponse resp;
  if (!exchange(*f, method::GetIFVersion, build_version_xml(), resp, err, log_)) {
    to_handshake_error(Phase::SdkVersion, err);
    return false;
  }

  std::string g = resp.guid;
  if (g.empty() || g == GUID_PLACEHOLDER) {
    g = make_session_guid();
    log_.debug("device kept placeholder guid, using generated " + g);
  }
  {
    std::lock_guard<std::mutex> st(state_mutex_);
    guid_ = g;
    version_ = version;
  }

  // ---- phase 3: device info (best effort) ----
  // A refusal or bad answer is only logged. An Io failure is not: the answer
  // may still arrive later and would be read as the reply to the next request.
  Error info_err;
  SdkResponse info_resp;
  DeviceInfo info;
  if (!exchange(*f, method::GetDeviceInfo, build_sdk_xml(g, method::GetDeviceInfo),
                info_resp, info_err, log_)) {
    if (info_err.kind == ErrorKind::Io) {
      err = info_err;
      err.phase = Phase::DeviceInfo;
      return false;
    }
    log_.warn("device info unavailable: " + info_err.describe());
  } else if (!info_resp.is_success()) {
    log_.warn("device info unavailable: result=" + info_resp.result);
  } else if (!parse_device_info(info_resp.inner_xml, info, info_err)) {
    log_.warn("device info unavailable: " + info_err.describe());
  } else {
    log_.info("device model=" + info.model + " id=" + info.device_id + " screen=" +
              std::to_string(info.screen_width) + "x" + std::to_string(info.screen_height));
    std::lock_guard<std::mutex> st(state_mutex_);
    info_ = info;
  }
  return true;
}

void Device::close() {
  std::shared_ptr<transport::IStream> stream;
  {
    std::lock_guard<std::mutex> st(state_mutex_);
    live_ = false;
    stream = stream_;
  }
  // Wake any operation blocked on the socket so the op mutex frees up.
  if (stream) stream->shutdown();

  std::lock_guard<std::mutex> op(op_mutex_);
  heartbeat_.stop();
  if (stream) log_.info("closed");
  teardown_locked();
}

void Device::teardown_locked() {
  std::shared_ptr<transport::IStream> stream;
  {
    std::lock_guard<std::mutex> st(state_mutex_);
    live_ = false;
    guid_.clear();
    version_ = 0;
    info_.reset();
    framer_.reset();
    stream.swap(stream_);
  }
  if (stream) stream->shutdown();
}

void Device::after_failure_locked(const Error& err) {
  if (err.kind != ErrorKind::Io) return;
  log_.warn("connection lost: " + err.describe());
  heartbeat_.stop();
  teardown_locked();
}

bool Device::is_connected() const {
  std::lock_guard<std::mutex> st(state_mutex_);
  return live_;
}

std::string Device::guid() const {
  std::lock_guard<std::mutex> st(state_mutex_);
  return guid_;
}

uint32_t Device::transport_version() const {
  std::lock_guard<std::mutex> st(state_mutex_);
  return version_;
}

std::optional<DeviceInfo> Device::cached_info() const {
  std::lock_guard<std::mutex> st(state_mutex_);
  return info_;
}

void Device::set_cached_info(const DeviceInfo& info) {
  std::lock_guard<std::mutex> st(state_mutex_);
  if (live_) info_ = info;
}

std::shared_ptr<Framer> Device::live_framer(Error& err) const {
  std::lock_guard<std::mutex> st(state_mutex_);
  if (!live_ || !framer_) {
    err = not_connected_error();
    return nullptr;
  }
  return framer_;
}

bool Device::send_command(const std::string& method, const std::string& inner,
                          SdkResponse& out, Error& err) {
  std::lock_guard<std::mutex> op(op_mutex_);
  std::shared_ptr<Framer> f = live_framer(err);
  if (!f) return false;

  log_.debug("command method=" + method);
  if (!exchange(*f, method, build_sdk_xml(guid(), method, inner), out, err, log_)) {
    after_failure_locked(err);
    return false;
  }
  if (!out.is_success()) log_.debug("command method=" + method + " result=" + out.result);
  return true;
}

bool Device::upload_locked(UploadSource& src, const std::string& name, FileType type,
                           const ProgressFn& progress, UploadResult& result, Error& err) {
  std::shared_ptr<Framer> f = live_framer(err);
  if (!f) return false;

  if (!run_upload(*f, src, name, type, progress, log_, result, err)) {
    log_.warn("upload failed name=" + name + " " + err.describe());
    after_failure_locked(err);
    return false;
  }
  return true;
}

bool Device::upload_bytes(const std::string& name, const Bytes& data, FileType type,
                          const ProgressFn& progress, UploadResult& result, Error& err) {
  std::lock_guard<std::mutex> op(op_mutex_);
  MemorySource src(data);
  return upload_locked(src, name, type, progress, result, err);
}

bool Device::upload_file(const std::string& path, FileType type,
                         const ProgressFn& progress, UploadResult& result, Error& err) {
  std::lock_guard<std::mutex> op(op_mutex_);
  if (!is_connected()) {
    err = not_connected_error();
    return false;
  }

  FileSource src;
  if (!src.open(path, err)) return false;
  return upload_locked(src, fs::path(path).filename().string(), type, progress, result, err);
}

bool Device::upload_files(const std::vector<std::string>& paths, const ProgressFn& progress,
                          std::vector<UploadResult>& results, Error& err) {
  results.clear();
  for (const auto& path : paths) {
    UploadResult r;
    const bool ok = upload_file(path, FileType::Auto, progress, r, err);
    results.push_back(r);
    if (!ok) {
      err.message = path + ": " + err.message;
      return false;
    }
  }
  return true;
}

bool Device::send_raw(const Bytes& frame, Error& err) {
  std::lock_guard<std::mutex> op(op_mutex_);
  std::shared_ptr<Framer> f = live_framer(err);
  if (!f) return false;

  if (!f->write_frame(frame, err)) {
    after_failure_locked(err);
    return false;
  }
  return true;
}

bool Device::read_packet(Packet& out, Error& err) {
  std::lock_guard<std::mutex> op(op_mutex_);
  std::shared_ptr<Framer> f = live_framer(err);
  if (!f) return false;

  if (!f->read_frame(out, err)) {
    after_failure_locked(err);
    return false;
  }
  return true;
}

} // namespace ledlink
