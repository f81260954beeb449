/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "StaticI18n/core/logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace StaticI18n::core {

namespace {

const char* levelColor(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "\033[90m";
  case LogLevel::Debug:
    return "\033[36m";
  case LogLevel::Info:
    return "\033[32m";
  case LogLevel::Warning:
    return "\033[33m";
  case LogLevel::Error:
    return "\033[31m";
  case LogLevel::Fatal:
    return "\033[1;31m";
  case LogLevel::Off:
    break;
  }
  return "";
}

constexpr const char* kColorReset = "\033[0m";

} // namespace

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger() : m_level(LogLevel::Info) {
#if defined(_WIN32)
  m_useColors = _isatty(2) != 0;
#else
  m_useColors = isatty(2) != 0;
#endif
}

Logger::~Logger() {
  closeOutputFile();
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_level = level;
}

LogLevel Logger::getLevel() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_level;
}

void Logger::setOutputFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.close();
  }
  m_fileStream.open(path, std::ios::out | std::ios::app);
  if (!m_fileStream.is_open()) {
    std::cerr << "[Logger] Failed to open log file: " << path << "\n";
  }
}

void Logger::closeOutputFile() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.flush();
    m_fileStream.close();
  }
}

void Logger::setConsoleEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_consoleEnabled = enabled;
}

void Logger::addLogCallback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.push_back(std::move(callback));
}

void Logger::clearLogCallbacks() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.clear();
}

void Logger::log(LogLevel level, std::string_view message) {
  std::vector<LogCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level == LogLevel::Off || level < m_level) {
      return;
    }

    std::string line =
        "[" + getCurrentTimestamp() + "] [" + levelToString(level) + "] " + std::string(message);

    if (m_consoleEnabled) {
      std::ostream& out = level >= LogLevel::Warning ? std::cerr : std::cout;
      if (m_useColors) {
        out << levelColor(level) << line << kColorReset << "\n";
      } else {
        out << line << "\n";
      }
    }

    if (m_fileStream.is_open()) {
      m_fileStream << line << "\n";
      if (level >= LogLevel::Error) {
        m_fileStream.flush();
      }
    }

    callbacks = m_callbacks;
  }

  // Callbacks run outside the lock so they may log themselves
  const std::string text(message);
  for (const auto& callback : callbacks) {
    callback(level, text);
  }
}

void Logger::trace(std::string_view message) {
  log(LogLevel::Trace, message);
}

void Logger::debug(std::string_view message) {
  log(LogLevel::Debug, message);
}

void Logger::info(std::string_view message) {
  log(LogLevel::Info, message);
}

void Logger::warning(std::string_view message) {
  log(LogLevel::Warning, message);
}

void Logger::error(std::string_view message) {
  log(LogLevel::Error, message);
}

void Logger::fatal(std::string_view message) {
  log(LogLevel::Fatal, message);
}

const char* Logger::levelToString(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE";
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Fatal:
    return "FATAL";
  case LogLevel::Off:
    return "OFF";
  }
  return "UNKNOWN";
}

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &time);
#else
  localtime_r(&time, &tm);
#endif

  std::ostringstream ss;
  ss << std::put_time(&tm, "%H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

} // namespace StaticI18n::core
