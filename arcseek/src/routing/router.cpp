// src/routing/router.cpp
#include "routing/router.hpp"
#include "log.h"
#include <filesystem>
#include <fstream>
#include <array>
#include <algorithm>
#include <cstring>

namespace fs = std::filesystem;

namespace arsk {

static const std::array<std::array<uint8_t, 4>, 3> kZipMagic = {{
  {0x50, 0x4B, 0x03, 0x04},   // local file header
  {0x50, 0x4B, 0x05, 0x06},   // end of central directory (empty archive)
  {0x50, 0x4B, 0x07, 0x08},   // spanned archive marker
}};
static const std::array<uint8_t, 6> kSevenZipMagic = {0x37, 0x7A, 0xBC, 0xAF, 0x27, 0x1C};
static const uint8_t kEocd[4] = {0x50, 0x4B, 0x05, 0x06};

// EOCD record is 22 bytes plus a comment of at most 64 KiB.
static const size_t kSfxTailWindow = 65535 + 22;

static bool startsWith(const uint8_t* data, size_t len, const uint8_t* sig, size_t n) {
  return len >= n && std::memcmp(data, sig, n) == 0;
}

static bool tailHasEocd(const uint8_t* tail, size_t len) {
  if (len < sizeof(kEocd)) return false;
  return std::search(tail, tail + len, kEocd, kEocd + sizeof(kEocd)) != tail + len;
}

static DetectResult classifyHead(const uint8_t* head, size_t headLen,
                                 const uint8_t* tail, size_t tailLen) {
  DetectResult dr{};
  for (auto& sig : kZipMagic) {
    if (startsWith(head, headLen, sig.data(), sig.size())) {
      dr.format = ArchiveFormat::Zip; dr.reason = "magic";
      return dr;
    }
  }
  if (startsWith(head, headLen, kSevenZipMagic.data(), kSevenZipMagic.size())) {
    dr.format = ArchiveFormat::SevenZip; dr.reason = "magic";
    return dr;
  }
  // self-extracting zip: PE stub followed by a regular zip
  if (headLen >= 2 && head[0] == 'M' && head[1] == 'Z' && tailHasEocd(tail, tailLen)) {
    dr.format = ArchiveFormat::Zip; dr.reason = "sfx";
    return dr;
  }
  return dr;
}

static bool hintLooksArchive(const std::string& hint) {
  return hint == "application/zip" || hint == "application/x-7z-compressed" ||
         hint == "application/x-zip-compressed";
}

static void checkHint(const DetectResult& dr, const std::string& hint) {
  if (hint.empty()) return;
  if (dr.format == ArchiveFormat::Unknown && hintLooksArchive(hint)) {
    LOGW("media type '" + hint + "' looks like an archive but no signature matched");
  } else if (dr.format == ArchiveFormat::Zip && hint == "application/x-7z-compressed") {
    LOGW("media type '" + hint + "' disagrees with zip signature");
  } else if (dr.format == ArchiveFormat::SevenZip && hint != "application/x-7z-compressed" &&
             hintLooksArchive(hint)) {
    LOGW("media type '" + hint + "' disagrees with 7z signature");
  }
}

DetectResult detectFormat(const uint8_t* data, size_t len, const std::string& mediaTypeHint) {
  if (!data) len = 0;
  size_t tailLen = std::min(len, kSfxTailWindow);
  DetectResult dr = classifyHead(data, len, data + (len - tailLen), tailLen);
  checkHint(dr, mediaTypeHint);
  return dr;
}

DetectResult detectFormat(const Bytes& data, const std::string& mediaTypeHint) {
  return detectFormat(data.data(), data.size(), mediaTypeHint);
}

DetectResult detectFormat(const fs::path& path, const std::string& mediaTypeHint) {
  DetectResult dr{};
  std::ifstream f(path, std::ios::binary);
  if (!f) return dr;

  std::array<uint8_t, 8> head{};
  f.read(reinterpret_cast<char*>(head.data()), head.size());
  size_t headLen = static_cast<size_t>(f.gcount());

  Bytes tail;
  if (headLen >= 2 && head[0] == 'M' && head[1] == 'Z') {
    std::error_code ec;
    uint64_t total = fs::file_size(path, ec);
    if (!ec) {
      size_t n = static_cast<size_t>(std::min<uint64_t>(total, kSfxTailWindow));
      tail.resize(n);
      f.clear();
      f.seekg(static_cast<std::streamoff>(total - n), std::ios::beg);
      f.read(reinterpret_cast<char*>(tail.data()), static_cast<std::streamsize>(n));
      tail.resize(static_cast<size_t>(f.gcount()));
    }
  }

  dr = classifyHead(head.data(), headLen, tail.data(), tail.size());
  checkHint(dr, mediaTypeHint);
  return dr;
}

} // namespace arsk
