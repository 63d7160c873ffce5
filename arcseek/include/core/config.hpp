#pragma once
#include "types.hpp"
#include "log.h"
#include <string>

namespace arsk {

struct SearchDefaults {
  bool caseSensitive = true;
  bool firstOnly = false;
  bool includeEmpty = false;
  bool recursive = false;
  std::string extractTo;
};

struct LogConfig {
  LogLevel level = LogLevel::Info;
};

struct AppConfig {
  SearchDefaults search;
  Limits limits;
  LogConfig log;
};

bool loadConfigYaml(const std::string& path, AppConfig& outCfg, std::string& err);

// Copies the defaults and limits into a query; names/predicates untouched.
void applyDefaults(const AppConfig& cfg, SearchQuery& q);

} // namespace arsk
