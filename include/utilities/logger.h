#pragma once
#ifndef WTTP_LOGGER_H
#define WTTP_LOGGER_H
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex> // For std::mutex and std::lock_guard
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace wttp {

enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/// Extra key/value pairs attached to a structured log line.
using LogFields = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Process-wide JSON-lines logger with size based rotation.
 *
 * Each line is a single JSON object holding `timestamp`, `level`,
 * `message` and any structured fields supplied by the caller.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel logLevel() const;
  void log(LogLevel level, const std::string &message);
  void log(LogLevel level, const std::string &message, const LogFields &fields);

  static std::string levelToString(LogLevel level);
  /// Parses "trace".."fatal" (case-insensitive); unknown names yield INFO.
  static LogLevel levelFromString(const std::string &name);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  // Caller must hold s_mutex.
  static void resetInstanceLocked(const std::string &logFile, LogLevel level,
                                  long long maxFileSizeVal,
                                  int maxBackupFilesVal);

  std::string getTimestamp();
  std::string formatLine(LogLevel level, const std::string &message,
                         const LogFields &fields);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

} // namespace wttp

#endif // WTTP_LOGGER_H
