#include "core/config.hpp"
#include <yaml-cpp/yaml.h>

namespace arsk {

bool loadConfigYaml(const std::string& path, AppConfig& outCfg, std::string& err) {
  try {
    YAML::Node root = YAML::LoadFile(path);
    auto s = root["search"];
    if (s) {
      outCfg.search.caseSensitive = s["case_sensitive"].as<bool>(outCfg.search.caseSensitive);
      outCfg.search.firstOnly     = s["first_only"].as<bool>(outCfg.search.firstOnly);
      outCfg.search.includeEmpty  = s["include_empty"].as<bool>(outCfg.search.includeEmpty);
      outCfg.search.recursive     = s["recursive"].as<bool>(outCfg.search.recursive);
      outCfg.search.extractTo     = s["extract_to"].as<std::string>(outCfg.search.extractTo);
    }
    auto lim = root["limits"];
    if (lim) {
      if (auto r=lim["recursion"]) {
        outCfg.limits.maxDepth     = r["max_depth"].as<uint32_t>(outCfg.limits.maxDepth);
        outCfg.limits.detectCycles = r["detect_cycles"].as<bool>(outCfg.limits.detectCycles);
      }
      if (auto sz=lim["size"]) {
        outCfg.limits.maxEntryBytes = sz["max_entry_bytes"].as<uint64_t>(outCfg.limits.maxEntryBytes);
      }
    }
    auto lg = root["logging"];
    if (lg && lg["level"]) {
      std::string lvl = lg["level"].as<std::string>();
      if (!parseLogLevel(lvl, outCfg.log.level)) {
        err = "unknown log level '" + lvl + "'";
        return false;
      }
    }
    return true;
  } catch (const std::exception& ex) {
    err = ex.what();
    return false;
  }
}

void applyDefaults(const AppConfig& cfg, SearchQuery& q) {
  q.caseSensitive = cfg.search.caseSensitive;
  q.firstOnly     = cfg.search.firstOnly;
  q.includeEmpty  = cfg.search.includeEmpty;
  q.recursive     = cfg.search.recursive;
  q.extractTo     = cfg.search.extractTo;
  q.limits        = cfg.limits;
}

} // namespace arsk
