#pragma once
#ifndef HASHTREE_LOGGER_H
#define HASHTREE_LOGGER_H
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex> // For std::mutex and std::lock_guard
#include <stdexcept>
#include <string>

namespace hashtree {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Parse a level name such as "debug" or "WARN".
 * @throws std::runtime_error for an unknown name.
 */
LogLevel parseLogLevel(const std::string &name);

class Logger {
public:
  // Deleting copy constructor and assignment operator
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);

  /**
   * @brief Access the process-wide logger.
   *
   * If init() was never called a console-only logger at WARN level that
   * writes to stderr is created so library code can always log.
   */
  static Logger &getInstance();

  /// Destroy the logger. The next getInstance() falls back to the default.
  static void shutdown();

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  bool isEnabled(LogLevel level) const;
  void log(LogLevel level, const std::string &message);
  void logToConsole(LogLevel level, const std::string &message);

  /**
   * @brief Convenience wrapper for TRACE level logging.
   *
   * Formats the provided printf-style string and logs it at TRACE level.
   *
   * @param format printf-style format string.
   * @param ...    Format arguments.
   */
  static void trace(const char *format, ...);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string formatLine(LogLevel level, const std::string &message) const;
  void rotateIfNeeded();
  static std::string getTimestamp();
  static std::string levelToString(LogLevel level);

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;
  std::ostream *consoleStream = &std::cout;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

} // namespace hashtree

#endif // HASHTREE_LOGGER_H
