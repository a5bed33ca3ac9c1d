/**
 * @page ll-device ledlink Device
 * @file device.hpp
 * @brief One logical connection to an LED controller.
 *
 * @details
 * PURPOSE
 * -------
 * Device owns the socket, the session GUID, the heartbeat thread and the
 * cached device descriptor. Everything else in ledlink is a free function
 * over a Framer; Device adds the connection lifecycle and the locking.
 *
 * CONNECT SEQUENCE
 * ----------------
 *   1. open stream (StreamFactory)                         fail: Connect
 *   2. ServiceAsk(TRANSPORT_VERSION) ─► ServiceAnswer      fail: Handshake/Version
 *   3. GetIFVersion under "##GUID"   ─► guid               fail: Handshake/SdkVersion
 *      (empty or placeholder guid: a random v4 UUID is used instead)
 *   4. GetDeviceInfo                 ─► cached_info()      refusal only logged;
 *                                                          Io failure: Io/DeviceInfo
 *   5. heartbeat started, is_connected() == true
 *
 * Failure in steps 2-4 tears the stream down before connect() returns.
 * Calling connect() on a live Device closes the old connection first.
 *
 * LOCKING
 * -------
 * - op mutex: held across each whole operation (connect, send_command,
 *   upload_*, send_raw, read_packet). Only one request/response exchange
 *   reads the stream at a time, so concurrent callers queue instead of
 *   stealing each other's frames.
 * - state mutex: live flag, guid, version, cached info, stream handle.
 *   Held only for brief reads/writes, never across I/O.
 * - Framer write mutex: one frame at a time on the wire (heartbeat vs caller).
 *
 * close() may be called from any thread at any time, also while another
 * thread is blocked in an operation: it shuts the stream down (the blocked
 * call fails with Io/Closed), stops the heartbeat, and waits for the
 * operation to drain. It is idempotent.
 *
 * An Io failure during an operation closes the connection; later calls see
 * NotConnected until connect() succeeds again.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ledlink/config.hpp"
#include "ledlink/error.hpp"
#include "ledlink/file_transfer.hpp"
#include "ledlink/framer.hpp"
#include "ledlink/heartbeat.hpp"
#include "ledlink/log.hpp"
#include "ledlink/sdk_xml.hpp"
#include "ledlink/transport/stream_base.hpp"

namespace ledlink {

/// Random RFC 4122 version 4 identifier, lowercase, 36 characters.
std::string make_session_guid();

class Device {
public:
  explicit Device(Options opts);
  Device(Options opts, transport::StreamFactory factory);
  ~Device();

  Device(const Device&) = delete;
  Device& operator=(const Device&) = delete;

  /// Run the full connect sequence. See the file comment for failure kinds.
  bool connect(Error& err);

  /// Stop the heartbeat and drop the stream. Idempotent; any thread.
  void close();

  bool is_connected() const;

  /// Session GUID; empty while not connected.
  std::string guid() const;

  /// Version from the ServiceAnswer; 0 while not connected.
  uint32_t transport_version() const;

  /// Descriptor fetched during connect or by get_device_info().
  std::optional<DeviceInfo> cached_info() const;
  void set_cached_info(const DeviceInfo& info);

  /**
   * @brief Send `<in method=..>inner</in>` under the session GUID and wait
   *        for the complete answer.
   *
   * A result other than "kSuccess" is returned as a successful call;
   * inspect out.is_success(). An answer naming a different method fails
   * with Protocol/UnexpectedCommand and leaves the connection up.
   */
  bool send_command(const std::string& method, const std::string& inner,
                    SdkResponse& out, Error& err);

  /// Upload an in-memory buffer as @p name. FileType::Auto detects from the name.
  bool upload_bytes(const std::string& name, const Bytes& data, FileType type,
                    const ProgressFn& progress, UploadResult& result, Error& err);

  /// Upload a local file under its base name.
  bool upload_file(const std::string& path, FileType type,
                   const ProgressFn& progress, UploadResult& result, Error& err);

  /**
   * @brief Upload files in order, stopping at the first failure.
   * @param results  One entry per attempted file, the failed one included.
   */
  bool upload_files(const std::vector<std::string>& paths, const ProgressFn& progress,
                    std::vector<UploadResult>& results, Error& err);

  /// Write one caller-built frame.
  bool send_raw(const Bytes& frame, Error& err);

  /// Read one frame, whatever its type (heartbeat answers included).
  bool read_packet(Packet& out, Error& err);

  const Options& options() const { return opts_; }

  /// Heartbeats written since the last connect.
  uint64_t heartbeats_sent() const { return heartbeat_.beats_sent(); }

private:
  bool handshake_locked(Error& err);
  bool upload_locked(UploadSource& src, const std::string& name, FileType type,
                     const ProgressFn& progress, UploadResult& result, Error& err);
  std::shared_ptr<Framer> live_framer(Error& err) const;
  void after_failure_locked(const Error& err);
  void teardown_locked();

  Options opts_;
  transport::StreamFactory factory_;
  Logger log_;

  std::mutex op_mutex_;

  mutable std::mutex state_mutex_;
  bool live_{false};
  std::string guid_;
  uint32_t version_{0};
  std::optional<DeviceInfo> info_;
  std::shared_ptr<transport::IStream> stream_;
  std::shared_ptr<Framer> framer_;

  HeartbeatKeeper heartbeat_;
};

} // namespace ledlink
