#include "util/logging.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <stdexcept>

namespace tonsentry::util {

namespace {

std::string Timestamp() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
  gmtime_r(&now, &utc);
  char buffer[32];
  const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buffer, written);
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != static_cast<unsigned char>(b[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

bool ParseLogLevel(std::string_view value, LogLevel* out) {
  if (!out) {
    return false;
  }
  if (EqualsIgnoreCase(value, "debug")) {
    *out = LogLevel::kDebug;
  } else if (EqualsIgnoreCase(value, "info")) {
    *out = LogLevel::kInfo;
  } else if (EqualsIgnoreCase(value, "warn") || EqualsIgnoreCase(value, "warning")) {
    *out = LogLevel::kWarn;
  } else if (EqualsIgnoreCase(value, "error")) {
    *out = LogLevel::kError;
  } else {
    return false;
  }
  return true;
}

std::string EscapeLogMessage(std::string_view message) {
  std::string out;
  out.reserve(message.size());
  for (unsigned char c : message) {
    if (c < 0x20 || c == 0x7F) {
      char escaped[5];
      std::snprintf(escaped, sizeof(escaped), "\\x%02x", static_cast<unsigned>(c));
      out.append(escaped);
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
  return out;
}

void Logger::OpenFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.close();
  }
  file_.open(path, std::ios::app);
  if (!file_) {
    throw std::runtime_error("failed to open log file: " + path);
  }
}

void Logger::SetStderr(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  to_stderr_ = enabled;
}

void Logger::SetThreshold(LogLevel threshold) {
  std::lock_guard<std::mutex> lock(mutex_);
  threshold_ = threshold;
}

void Logger::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.close();
  }
  to_stderr_ = false;
}

void Logger::Log(LogLevel level, std::string_view message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!EnabledLocked(level)) {
    return;
  }
  const std::string record =
      Timestamp() + " " + LogLevelName(level) + " " + EscapeLogMessage(message) + "\n";
  if (to_stderr_) {
    std::cerr << record;
  }
  if (file_.is_open()) {
    file_ << record;
    file_.flush();
  }
}

bool Logger::Enabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return EnabledLocked(level);
}

bool Logger::EnabledLocked(LogLevel level) const {
  if (!file_.is_open() && !to_stderr_) {
    return false;
  }
  return static_cast<int>(level) >= static_cast<int>(threshold_);
}

Logger& GetLogger() {
  static Logger logger;
  return logger;
}

void LogDebug(std::string_view message) { GetLogger().Log(LogLevel::kDebug, message); }
void LogInfo(std::string_view message) { GetLogger().Log(LogLevel::kInfo, message); }
void LogWarn(std::string_view message) { GetLogger().Log(LogLevel::kWarn, message); }
void LogError(std::string_view message) { GetLogger().Log(LogLevel::kError, message); }

}  // namespace tonsentry::util
