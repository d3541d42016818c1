#pragma once
#ifndef RANDSTREAM_LOGGER_H_
#define RANDSTREAM_LOGGER_H_
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>     // For std::mutex and std::lock_guard
#include <stdexcept> // Required for std::runtime_error
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide JSON-lines logger.
 *
 * Every record is written as one object with "timestamp", "level" and
 * "message" keys. File output rotates once the file grows past
 * maxFileSize, keeping maxBackupFiles numbered backups. In console mode
 * records go to stderr, leaving stdout free for stream data.
 */
class Logger {
public:
  // Deleting copy constructor and assignment operator
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string
      CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  /**
   * @brief Parse a level name ("trace", "DEBUG", "warn", ...).
   * @throw std::invalid_argument If the name is unknown.
   */
  static LogLevel levelFromString(const std::string &name);

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  void log(LogLevel level, const std::string &message);
  /// True when records go to stderr rather than a file.
  bool isConsoleOnly() const { return logFilePath == CONSOLE_ONLY_OUTPUT; }

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal); // Private Constructor
public:                          // Public Destructor
  ~Logger();

private:
  std::string getTimestamp();
  std::string levelToString(LogLevel level);
  std::string formatRecord(LogLevel level, const std::string &message);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  // Static members for init and getInstance
  static Logger *s_instance;
  static std::mutex s_mutex; // Mutex for thread safety
};

#endif
