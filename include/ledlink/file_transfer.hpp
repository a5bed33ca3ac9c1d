/**
 * @page ll-upload ledlink File Transfer
 * @file file_transfer.hpp
 * @brief Start / content / end upload sequence with resume and progress.
 *
 * @details
 * SEQUENCE
 * --------
 *   1. Start    FileStartAsk {md5, size, type, name}  ──►
 *               ◄── FileStartAnswer {result, existing bytes K}
 *               result != kSuccess, or K > size, aborts with FileTransfer/Start.
 *   2. Content  FileContentAsk chunks (<= 8000 bytes) covering [K, size).
 *               Fire-and-forget: no per-chunk answer is awaited.
 *   3. End      FileEndAsk ──►  ◄── FileEndAnswer {result}
 *               kSuccess and kWriteFinish are success; anything else is
 *               FileTransfer/End.
 *
 * While waiting for an answer, HeartbeatAnswer frames are skipped and an
 * ErrorAnswer fails the current phase with the device's code.
 *
 * An I/O failure at any point aborts the upload. Nothing is rolled back:
 * the device keeps what it received and reports it as K on the next attempt.
 *
 * Success is taken from the end answer alone. The locally computed MD5 is
 * sent at start; whether the device verifies it is not observable here.
 */
#pragma once

#include <cstdint>
#include <fstream>
#include <functional>
#include <string>

#include "ledlink/error.hpp"
#include "ledlink/framer.hpp"
#include "ledlink/log.hpp"
#include "ledlink/wire.hpp"

namespace ledlink {

/// Classify by extension (case-insensitive); unknown extensions are Image.
FileType detect_file_type(const std::string& path);

/// Lowercase hex MD5 of a buffer.
std::string md5_hex(const uint8_t* data, size_t n);
inline std::string md5_hex(const Bytes& b) { return md5_hex(b.data(), b.size()); }

/// Lowercase hex MD5 of a file, read in MAX_CONTENT_LEN steps.
bool file_md5_hex(const std::string& path, std::string& out, Error& err);

struct UploadProgress {
  std::string file_name;
  uint64_t total_bytes{0};
  uint64_t sent_bytes{0};   ///< bytes the device now holds, resume offset included
  double percent{0.0};
};

using ProgressFn = std::function<void(const UploadProgress&)>;

struct UploadResult {
  std::string name;
  uint64_t size{0};
  std::string md5;
  FileType type{FileType::Image};
  uint32_t resume_offset{0};   ///< existing bytes reported at start
  uint64_t bytes_sent{0};      ///< content bytes written by this call
  int end_code{-1};            ///< kSuccess or kWriteFinish on success
};

/// Random-access byte source for one upload.
class UploadSource {
public:
  virtual ~UploadSource() = default;
  virtual uint64_t size() const = 0;
  virtual bool md5(std::string& out, Error& err) = 0;
  virtual bool seek(uint64_t pos, Error& err) = 0;
  /// Read up to n bytes at the current position; got == 0 only at end.
  virtual bool read(uint8_t* out, size_t n, size_t& got, Error& err) = 0;
};

/// Non-owning view over caller memory; the buffer must outlive the upload.
class MemorySource : public UploadSource {
public:
  MemorySource(const uint8_t* data, size_t n) : data_(data), size_(n) {}
  explicit MemorySource(const Bytes& b) : MemorySource(b.data(), b.size()) {}

  uint64_t size() const override { return size_; }
  bool md5(std::string& out, Error& err) override;
  bool seek(uint64_t pos, Error& err) override;
  bool read(uint8_t* out, size_t n, size_t& got, Error& err) override;

private:
  const uint8_t* data_;
  size_t size_;
  size_t pos_{0};
};

class FileSource : public UploadSource {
public:
  /// Open @p path for reading; false with FileTransfer/Start if it cannot be opened.
  bool open(const std::string& path, Error& err);

  uint64_t size() const override { return size_; }
  bool md5(std::string& out, Error& err) override;
  bool seek(uint64_t pos, Error& err) override;
  bool read(uint8_t* out, size_t n, size_t& got, Error& err) override;

private:
  std::string path_;
  std::ifstream in_;
  uint64_t size_{0};
};

/**
 * @brief Run one upload over an already-connected framer.
 *
 * @param name      Name stored on the device (no directory part).
 * @param type      FileType::Auto selects detect_file_type(name).
 * @param progress  Called after every content chunk; may be empty.
 * @param result    Filled as phases complete, so a failed upload still
 *                  reports the resume offset and bytes sent.
 * @return false with:
 *   - FileTransfer/Start: empty name, size above 0xFFFFFFFF, start refused,
 *     or resume offset beyond size (nothing sent in the first two cases);
 *   - FileTransfer/End: end answer other than kSuccess/kWriteFinish;
 *   - Protocol (phase set): an unexpected frame type or short answer;
 *   - FileTransfer/Content: the local source failed or ended early;
 *   - Io: stream failure.
 */
bool run_upload(Framer& link, UploadSource& source, const std::string& name, FileType type,
                const ProgressFn& progress, const Logger& log,
                UploadResult& result, Error& err);

} // namespace ledlink
