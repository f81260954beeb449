#pragma once

/**
 * @file logger.hpp
 * @brief Process-wide logger used by the resolver, config loader and CLI
 */

#include <cstdio>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace StaticI18n::core {

enum class LogLevel { Trace, Debug, Info, Warning, Error, Fatal, Off };

class Logger {
public:
  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel level);
  [[nodiscard]] LogLevel getLevel() const;

  void setOutputFile(const std::string& path);
  void closeOutputFile();

  /// Suppresses stdout/stderr output; file output and callbacks still fire.
  void setConsoleEnabled(bool enabled);

  using LogCallback = std::function<void(LogLevel, const std::string&)>;
  void addLogCallback(LogCallback callback);
  void clearLogCallbacks();

  void log(LogLevel level, std::string_view message);

  void trace(std::string_view message);
  void debug(std::string_view message);
  void info(std::string_view message);
  void warning(std::string_view message);
  void error(std::string_view message);
  void fatal(std::string_view message);

  [[nodiscard]] static const char* levelToString(LogLevel level);

private:
  Logger();
  ~Logger();

  [[nodiscard]] std::string getCurrentTimestamp() const;

  LogLevel m_level;
  std::ofstream m_fileStream;
  mutable std::mutex m_mutex;
  bool m_useColors;
  bool m_consoleEnabled = true;
  std::vector<LogCallback> m_callbacks;
};

} // namespace StaticI18n::core

#define STATICI18N_LOG_TRACE(...) ::StaticI18n::core::Logger::instance().trace(__VA_ARGS__)
#define STATICI18N_LOG_DEBUG(...) ::StaticI18n::core::Logger::instance().debug(__VA_ARGS__)
#define STATICI18N_LOG_INFO(...) ::StaticI18n::core::Logger::instance().info(__VA_ARGS__)
#define STATICI18N_LOG_WARN(...) ::StaticI18n::core::Logger::instance().warning(__VA_ARGS__)
#define STATICI18N_LOG_ERROR(...) ::StaticI18n::core::Logger::instance().error(__VA_ARGS__)
#define STATICI18N_LOG_FATAL(...) ::StaticI18n::core::Logger::instance().fatal(__VA_ARGS__)
