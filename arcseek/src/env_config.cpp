#include "env_config.h"
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace arsk {

static std::string env(const char* key, const char* def = "") {
  const char* v = std::getenv(key);
  return v ? std::string(v) : std::string(def);
}

bool parseDepth(const std::string& text, uint32_t& out, std::string& err) {
  // stoul accepts a leading '-' and wraps it
  if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
    err = "expected an unsigned number, got '" + text + "'";
    return false;
  }
  try {
    size_t used = 0;
    unsigned long v = std::stoul(text, &used);
    if (used != text.size()) throw std::invalid_argument("trailing characters");
    if (v > std::numeric_limits<uint32_t>::max()) throw std::out_of_range("depth too large");
    out = static_cast<uint32_t>(v);
  } catch (const std::exception& ex) {
    err = std::string(ex.what()) + " ('" + text + "')";
    return false;
  }
  return true;
}

std::string configPathFromEnv() { return env("ARCSEEK_CONFIG"); }

bool applyEnvOverrides(AppConfig& cfg, std::string& err) {
  std::string lvl = env("ARCSEEK_LOG_LEVEL");
  if (!lvl.empty() && !parseLogLevel(lvl, cfg.log.level)) {
    err = "ARCSEEK_LOG_LEVEL: unknown level '" + lvl + "'";
    return false;
  }

  std::string dir = env("ARCSEEK_EXTRACT_DIR");
  if (!dir.empty()) cfg.search.extractTo = dir;

  std::string depth = env("ARCSEEK_MAX_DEPTH");
  if (!depth.empty()) {
    std::string perr;
    if (!parseDepth(depth, cfg.limits.maxDepth, perr)) {
      err = "ARCSEEK_MAX_DEPTH: " + perr;
      return false;
    }
  }
  return true;
}

} // namespace arsk
