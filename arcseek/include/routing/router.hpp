#pragma once
#include "core/types.hpp"
#include <string>
#include <filesystem>

namespace arsk {

struct DetectResult {
  ArchiveFormat format = ArchiveFormat::Unknown;
  std::string   reason;  // "magic" / "sfx" / empty when unknown
};

// Classify by leading signature only. The media type hint is advisory: it is
// logged when it disagrees with the bytes, never used to pick a format.
DetectResult detectFormat(const uint8_t* data, size_t len, const std::string& mediaTypeHint = "");
DetectResult detectFormat(const Bytes& data, const std::string& mediaTypeHint = "");
DetectResult detectFormat(const std::filesystem::path& path, const std::string& mediaTypeHint = "");

} // namespace arsk
