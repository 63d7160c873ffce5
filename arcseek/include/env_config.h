#pragma once
#include "core/config.hpp"
#include <string>

namespace arsk {

// Unsigned decimal depth; rejects signs, trailing text and values above uint32.
bool parseDepth(const std::string& text, uint32_t& out, std::string& err);

// ARCSEEK_CONFIG, empty if unset
std::string configPathFromEnv();

// ARCSEEK_LOG_LEVEL, ARCSEEK_EXTRACT_DIR, ARCSEEK_MAX_DEPTH.
// Returns false (with err) on a malformed value; cfg keeps earlier values.
bool applyEnvOverrides(AppConfig& cfg, std::string& err);

} // namespace arsk
