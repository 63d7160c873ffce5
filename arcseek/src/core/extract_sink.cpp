// src/core/extract_sink.cpp
#include "core/extract_sink.hpp"
#include <fstream>

namespace fs = std::filesystem;

namespace arsk {

std::string memberBaseName(const std::string& memberName) {
  std::string base = memberName;
  while (!base.empty() && (base.back() == '/' || base.back() == '\\')) base.pop_back();
  auto pos = base.find_last_of("/\\");
  if (pos != std::string::npos) base.erase(0, pos + 1);
  if (base.empty() || base == "." || base == "..") base = "unnamed";
  return base;
}

fs::path uniqueTarget(const fs::path& dir, const std::string& fileName) {
  fs::path p = dir / fileName;
  std::error_code ec;
  if (!fs::exists(p, ec)) return p;
  const std::string stem = p.stem().string();
  const std::string ext  = p.extension().string();
  for (uint64_t i = 1; ; ++i) {
    fs::path q = dir / (stem + "_" + std::to_string(i) + ext);
    if (!fs::exists(q, ec)) return q;
  }
}

bool extractMatch(const fs::path& dir,
                  const std::string& memberName,
                  const Bytes& bytes,
                  fs::path& written,
                  std::string& err)
{
  std::error_code ec;
  if (fs::exists(dir, ec) && !fs::is_directory(dir, ec)) {
    err = "not a directory (" + dir.string() + ")";
    return false;
  }
  fs::create_directories(dir, ec);
  if (ec) { err = "create_directories failed: " + ec.message() + " (" + dir.string() + ")"; return false; }

  fs::path target = uniqueTarget(dir, memberBaseName(memberName));
  std::ofstream fo(target, std::ios::binary | std::ios::trunc);
  if (!fo) { err = "open for write failed (" + target.string() + ")"; return false; }
  fo.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  fo.close();
  if (!fo) { err = "write failed (" + target.string() + ")"; return false; }

  written = target;
  return true;
}

} // namespace arsk
