#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace tonsentry::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);

// Accepts debug|info|warn|warning|error in any case.
bool ParseLogLevel(std::string_view value, LogLevel* out);

// Escapes every byte below 0x20 and 0x7F as "\xNN" so a message built from
// untrusted input always stays a single log record.
std::string EscapeLogMessage(std::string_view message);

// Process-wide levelled logger with an optional file sink and an optional
// stderr sink. With neither attached, Log() returns after one check.
class Logger {
 public:
  // Appends to |path|. Throws std::runtime_error if it cannot be opened.
  void OpenFile(const std::string& path);
  void SetStderr(bool enabled);
  void SetThreshold(LogLevel threshold);
  void Close();

  void Log(LogLevel level, std::string_view message);

  bool Enabled(LogLevel level) const;

 private:
  bool EnabledLocked(LogLevel level) const;

  mutable std::mutex mutex_;
  std::ofstream file_;
  bool to_stderr_{false};
  LogLevel threshold_{LogLevel::kInfo};
};

Logger& GetLogger();

void LogDebug(std::string_view message);
void LogInfo(std::string_view message);
void LogWarn(std::string_view message);
void LogError(std::string_view message);

}  // namespace tonsentry::util
