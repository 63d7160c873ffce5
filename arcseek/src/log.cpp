// src/log.cpp
#include "log.h"
#include <atomic>
#include <sstream>

namespace arsk {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

LogLevel logLevel() { return static_cast<LogLevel>(g_level.load()); }

void setLogLevel(LogLevel lvl) { g_level.store(static_cast<int>(lvl)); }

bool parseLogLevel(const std::string& s, LogLevel& out) {
  if (s == "debug") { out = LogLevel::Debug; return true; }
  if (s == "info")  { out = LogLevel::Info;  return true; }
  if (s == "warn" || s == "warning") { out = LogLevel::Warn; return true; }
  if (s == "error") { out = LogLevel::Error; return true; }
  if (s == "off")   { out = LogLevel::Off;   return true; }
  return false;
}

void logEvent(const std::string& scanId,
              const std::string& eventType,
              const std::map<std::string, std::string>& kv)
{
  if (LogLevel::Info < logLevel()) return;
  std::ostringstream os;
  os << "[EVT][" << eventType << "] id=" << scanId;
  for (auto& [k, v] : kv) os << " " << k << "=" << v;
  _log_emit(LogLevel::Info, "INFO ", os.str());
}

} // namespace arsk
