#pragma once
#include <string>
#include <map>
#include <ctime>
#include <cstdio>

namespace arsk {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

LogLevel logLevel();
void setLogLevel(LogLevel lvl);
bool parseLogLevel(const std::string& s, LogLevel& out);

// Structured event line: [EVT][type] id=<scanId> k=v ...
void logEvent(const std::string& scanId,
              const std::string& eventType,
              const std::map<std::string, std::string>& kv);

} // namespace arsk

inline void _log_emit(arsk::LogLevel lvl, const char* tag, const std::string& msg) {
  if (lvl < arsk::logLevel()) return;
  std::time_t t = std::time(nullptr);
  std::tm tmv{};
  localtime_r(&t, &tmv);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tmv);
  std::fprintf(stderr, "[%s] %s | %s\n", tag, ts, msg.c_str());
}

#define LOGD(m) _log_emit(arsk::LogLevel::Debug, "DEBUG", (m))
#define LOGI(m) _log_emit(arsk::LogLevel::Info,  "INFO ", (m))
#define LOGW(m) _log_emit(arsk::LogLevel::Warn,  "WARN ", (m))
#define LOGE(m) _log_emit(arsk::LogLevel::Error, "ERROR", (m))
