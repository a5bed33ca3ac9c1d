// ============================================================================
// file_transfer.cpp: implementation for file_transfer.hpp
// ============================================================================

#include "ledlink/file_transfer.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <initializer_list>
#include <memory>

#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace ledlink {

namespace {

// Incremental MD5 over OpenSSL's EVP interface.
class Md5 {
public:
  Md5() : ctx_(EVP_MD_CTX_new()) {
    ok_ = ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) == 1;
  }

  void update(const uint8_t* data, size_t n) {
    if (ok_ && n) ok_ = EVP_DigestUpdate(ctx_.get(), data, n) == 1;
  }

  /// Empty string when any OpenSSL call failed.
  std::string hex() {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!ok_ || EVP_DigestFinal_ex(ctx_.get(), md, &len) != 1) return std::string();

    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
      out += digits[md[i] >> 4];
      out += digits[md[i] & 0x0F];
    }
    return out;
  }

private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
  };
  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
  bool ok_{false};
};

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool one_of(const std::string& ext, std::initializer_list<const char*> list) {
  for (const char* e : list) {
    if (ext == e) return true;
  }
  return false;
}

// Read frames until `expected` arrives. Heartbeat answers are skipped; an
// error answer fails the phase with the device's code.
bool read_answer(Framer& link, CmdType expected, Phase phase, Packet& pkt, Error& err) {
  while (true) {
    if (!link.read_frame(pkt, err)) return false;

    if (pkt.command == CmdType::HeartbeatAnswer) continue;

    if (pkt.command == CmdType::ErrorAnswer) {
      int code = -1;
      if (!parse_error_answer(pkt.bytes, code)) code = -1;
      err = transfer_error(phase, code, "device error answer: " + describe_device_code(code));
      return false;
    }

    if (pkt.command != expected) {
      err = protocol_error(ProtocolFault::UnexpectedCommand,
                           std::string("expected ") + to_string(expected) +
                           ", got " + to_string(pkt.command));
      err.phase = phase;
      return false;
    }
    return true;
  }
}

void report(const ProgressFn& progress, const std::string& name, uint64_t total, uint64_t held) {
  if (!progress) return;
  UploadProgress p;
  p.file_name = name;
  p.total_bytes = total;
  p.sent_bytes = held;
  p.percent = total ? static_cast<double>(held) * 100.0 / static_cast<double>(total) : 100.0;
  progress(p);
}

} // namespace

FileType detect_file_type(const std::string& path) {
  const fs::path p(path);
  const std::string ext  = lower(p.extension().string());
  const std::string name = lower(p.filename().string());

  if (one_of(ext, {".bmp", ".jpg", ".jpeg", ".png", ".ico", ".gif", ".tif", ".tiff"}))
    return FileType::Image;
  if (one_of(ext, {".mp4", ".avi", ".mkv", ".flv", ".mov", ".wmv", ".mp3", ".swf",
                   ".f4v", ".trp", ".asf", ".mpeg", ".webm", ".asx", ".rm", ".rmvb",
                   ".3gp", ".m4v", ".dat", ".vob", ".ts"}))
    return FileType::Video;
  if (one_of(ext, {".ttf", ".ttc", ".bdf"}))
    return FileType::Font;
  if (ext == ".bin")
    return FileType::Firmware;
  if (ext == ".xml") {
    if (name == "fpga.xml")   return FileType::FpgaConfig;
    if (name == "config.xml") return FileType::SettingConfig;
    return FileType::ProgramXml;
  }
  return FileType::Image;
}

std::string md5_hex(const uint8_t* data, size_t n) {
  Md5 h;
  h.update(data, n);
  return h.hex();
}

bool file_md5_hex(const std::string& path, std::string& out, Error& err) {
  FileSource src;
  if (!src.open(path, err)) return false;
  return src.md5(out, err);
}

// ---- MemorySource ----

bool MemorySource::md5(std::string& out, Error& err) {
  out = md5_hex(data_, size_);
  if (out.empty()) {
    err = transfer_error(Phase::Start, -1, "md5 computation failed");
    return false;
  }
  return true;
}

bool MemorySource::seek(uint64_t pos, Error& err) {
  if (pos > size_) {
    err = transfer_error(Phase::Content, -1, "seek past end of buffer");
    return false;
  }
  pos_ = static_cast<size_t>(pos);
  return true;
}

bool MemorySource::read(uint8_t* out, size_t n, size_t& got, Error&) {
  got = std::min(n, size_ - pos_);
  if (got) std::copy(data_ + pos_, data_ + pos_ + got, out);
  pos_ += got;
  return true;
}

// ---- FileSource ----

bool FileSource::open(const std::string& path, Error& err) {
  std::error_code ec;
  const auto sz = fs::file_size(path, ec);
  if (ec) {
    err = transfer_error(Phase::Start, -1, "cannot stat " + path + ": " + ec.message());
    return false;
  }
  in_.open(path, std::ios::binary);
  if (!in_) {
    err = transfer_error(Phase::Start, -1, "cannot open " + path);
    return false;
  }
  path_ = path;
  size_ = static_cast<uint64_t>(sz);
  return true;
}

bool FileSource::md5(std::string& out, Error& err) {
  if (!seek(0, err)) return false;

  Md5 h;
  uint8_t buf[MAX_CONTENT_LEN];
  while (true) {
    size_t got = 0;
    if (!read(buf, sizeof(buf), got, err)) return false;
    if (got == 0) break;
    h.update(buf, got);
  }

  out = h.hex();
  if (out.empty()) {
    err = transfer_error(Phase::Start, -1, "md5 computation failed for " + path_);
    return false;
  }
  return seek(0, err);
}

bool FileSource::seek(uint64_t pos, Error& err) {
  in_.clear();
  in_.seekg(static_cast<std::streamoff>(pos), std::ios::beg);
  if (!in_) {
    err = transfer_error(Phase::Content, -1, "seek failed in " + path_);
    return false;
  }
  return true;
}

bool FileSource::read(uint8_t* out, size_t n, size_t& got, Error& err) {
  in_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(n));
  got = static_cast<size_t>(in_.gcount());
  if (in_.bad()) {
    err = transfer_error(Phase::Content, -1, "read failed in " + path_);
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// run_upload()
// ------------
// `result` is filled as each phase completes so callers can log how far a
// failed upload got.
// ---------------------------------------------------------------------------
bool run_upload(Framer& link, UploadSource& source, const std::string& name, FileType type,
                const ProgressFn& progress, const Logger& log,
                UploadResult& result, Error& err) {
  result = UploadResult{};
  result.name = name;
  result.size = source.size();

  if (name.empty()) {
    err = transfer_error(Phase::Start, -1, "empty file name");
    return false;
  }
  if (result.size > 0xFFFFFFFFull) {
    err = transfer_error(Phase::Start, -1,
                         "file too large for the protocol: " + std::to_string(result.size) + " bytes");
    return false;
  }

  result.type = (type == FileType::Auto) ? detect_file_type(name) : type;
  if (!source.md5(result.md5, err)) return false;

  // ---- start ----
  Bytes start;
  if (!make_file_start_ask(name, static_cast<uint32_t>(result.size), result.type, result.md5, start)) {
    err = transfer_error(Phase::Start, -1, "file name too long: " + name);
    return false;
  }

  log.info("upload start name=" + name + " size=" + std::to_string(result.size) +
           " type=" + std::to_string(static_cast<int>(result.type)) + " md5=" + result.md5);

  if (!link.write_frame(start, err)) return false;

  Packet pkt;
  if (!read_answer(link, CmdType::FileStartAnswer, Phase::Start, pkt, err)) return false;

  int code = -1;
  uint32_t existing = 0;
  if (!parse_file_start_answer(pkt.bytes, code, existing)) {
    err = protocol_error(ProtocolFault::Truncated, "short file start answer");
    err.phase = Phase::Start;
    return false;
  }
  if (code != kSuccess) {
    err = transfer_error(Phase::Start, code, "start refused: " + describe_device_code(code));
    return false;
  }
  if (existing > result.size) {
    err = transfer_error(Phase::Start, -1,
                         "device reports " + std::to_string(existing) +
                         " existing bytes for a " + std::to_string(result.size) + "-byte file");
    return false;
  }
  result.resume_offset = existing;
  if (existing > 0) log.info("upload resume name=" + name + " offset=" + std::to_string(existing));

  // ---- content ----
  if (!source.seek(existing, err)) return false;

  uint64_t pos = existing;
  Bytes chunk(MAX_CONTENT_LEN);
  while (pos < result.size) {
    const size_t want = static_cast<size_t>(std::min<uint64_t>(MAX_CONTENT_LEN, result.size - pos));
    size_t got = 0;
    if (!source.read(chunk.data(), want, got, err)) return false;
    if (got == 0) {
      err = transfer_error(Phase::Content, -1, "source ended at " + std::to_string(pos) +
                                      " of " + std::to_string(result.size) + " bytes");
      return false;
    }

    if (!link.write_frame(make_file_content_ask(chunk.data(), got), err)) return false;
    pos += got;
    result.bytes_sent += got;
    report(progress, name, result.size, pos);
  }

  // ---- end ----
  if (!link.write_frame(make_file_end_ask(), err)) return false;
  if (!read_answer(link, CmdType::FileEndAnswer, Phase::End, pkt, err)) return false;

  if (!parse_file_end_answer(pkt.bytes, code)) {
    err = protocol_error(ProtocolFault::Truncated, "short file end answer");
    err.phase = Phase::End;
    return false;
  }
  result.end_code = code;
  if (code != kSuccess && code != kWriteFinish) {
    err = transfer_error(Phase::End, code, "end refused: " + describe_device_code(code));
    return false;
  }

  log.info("upload done name=" + name + " sent=" + std::to_string(result.bytes_sent));
  return true;
}

} // namespace ledlink
