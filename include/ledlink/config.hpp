/**
 * @file config.hpp
 * @brief Connection options and their JSON config file.
 *
 * @details
 * `Options` is everything a Device needs before connect(): where the
 * controller lives, how long any single socket read or write may block, and
 * how often to send keep-alives. Values come from three layers, later
 * winning: built-in defaults, a JSON file, then CLI flags.
 *
 * File format (all keys optional):
 * @code
 *   {
 *     "host": "192.168.6.1",
 *     "port": 10001,
 *     "timeout_ms": 10000,
 *     "heartbeat_interval_ms": 30000,
 *     "verbose": false
 *   }
 * @endcode
 *
 * Default location: `$XDG_CONFIG_HOME/ledlink/config.json`, falling back to
 * `$HOME/.config/ledlink/config.json`.
 */
#pragma once

#include <cstdint>
#include <string>

#include "ledlink/error.hpp"
#include "ledlink/log.hpp"
#include "ledlink/wire.hpp"

namespace ledlink {

struct Options {
  std::string host;
  uint16_t port{DEFAULT_PORT};
  int timeout_ms{DEFAULT_TIMEOUT_MS};               ///< per read/write deadline
  int heartbeat_interval_ms{DEFAULT_HEARTBEAT_MS};  ///< keep-alive period
  bool verbose{false};                              ///< log at debug level
  LogSink log_sink;                                 ///< empty: stderr_sink()
};

/// Logger for these options: Debug threshold when verbose, else Warn.
Logger make_logger(const Options& opts);

/// `$XDG_CONFIG_HOME/ledlink/config.json` or `$HOME/.config/ledlink/config.json`.
std::string default_config_path();

/**
 * @brief Overlay values from a JSON file onto @p opts.
 *
 * Keys absent from the file leave the current value alone. A missing file is
 * an error only when @p must_exist is true.
 *
 * @return false with err.kind == Config on unreadable JSON, a value of the
 *         wrong type, or an out-of-range number (port 0, timeout <= 0).
 */
bool load_options(const std::string& path, Options& opts, Error& err, bool must_exist = true);

/// Write host/port/timeouts/verbose to @p path (tmp file + rename).
bool save_options(const std::string& path, const Options& opts, Error& err);

} // namespace ledlink
