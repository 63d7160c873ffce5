#pragma once
#include "core/types.hpp"
#include <filesystem>
#include <string>

namespace arsk {

// Last path component of a member name; never empty, "." or "..".
std::string memberBaseName(const std::string& memberName);

// dir/name if free, otherwise dir/stem_1.ext, dir/stem_2.ext, ...
std::filesystem::path uniqueTarget(const std::filesystem::path& dir, const std::string& fileName);

// Writes bytes to dir/basename(memberName) under a collision-free name.
// Creates dir if needed. 'written' receives the final path.
bool extractMatch(const std::filesystem::path& dir,
                  const std::string& memberName,
                  const Bytes& bytes,
                  std::filesystem::path& written,
                  std::string& err);

} // namespace arsk
