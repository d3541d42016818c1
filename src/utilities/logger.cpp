#include "utilities/logger.h"
#include <algorithm> // For std::transform
#include <cctype>    // For std::toupper
#include <cstdio>    // For std::rename, std::remove and std::snprintf
#include <new>       // For std::bad_alloc
#include <string>

// Initialize static members
Logger *Logger::s_instance = nullptr;
std::mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

namespace {

// Escape a string for use as a JSON string value.
std::string jsonEscape(const std::string &in) {
  std::string out;
  out.reserve(in.size() + 2);
  for (unsigned char c : in) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    default:
      if (c < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
        out += buf;
      } else {
        out += static_cast<char>(c);
      }
    }
  }
  return out;
}

} // namespace

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::mutex> lock(s_mutex);

  delete s_instance;    // Safe to delete nullptr
  s_instance = nullptr; // Explicitly nullify before attempting new allocation.

  try {
    s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
  } catch (const std::bad_alloc &bae) {
    // s_instance remains nullptr; getInstance() reports it.
    std::cerr
        << "[Logger::init] CRITICAL: new Logger FAILED due to std::bad_alloc: "
        << bae.what() << ". s_instance REMAINS nullptr." << std::endl;
  }
}

Logger &Logger::getInstance() {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_instance) {
    // Library users that never called init() still get warnings and errors
    // on the console.
    s_instance =
        new Logger(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN, 0, 0);
  }
  return *s_instance;
}

LogLevel Logger::levelFromString(const std::string &name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "TRACE")
    return TRACE;
  if (upper == "DEBUG")
    return DEBUG;
  if (upper == "INFO")
    return INFO;
  if (upper == "WARN" || upper == "WARNING")
    return WARN;
  if (upper == "ERROR")
    return ERROR;
  if (upper == "FATAL")
    return FATAL;
  throw std::invalid_argument("unknown log level: " + name);
}

Logger::Logger(const std::string &logFile, LogLevel level,
               long long maxFileSizeVal, int maxBackupFilesVal)
    : currentLogLevel(level), logFilePath(logFile), maxFileSize(maxFileSizeVal),
      maxBackupFiles(maxBackupFilesVal) {
  if (logFile != CONSOLE_ONLY_OUTPUT) {
    logFileStream.open(logFilePath, std::ios::app);
    if (!logFileStream.is_open()) {
      // Using std::cerr here as the logger cannot report on itself yet.
      std::cerr << "Error: Could not open log file: " << logFilePath
                << std::endl;
    }
  }
}

// Public Destructor
Logger::~Logger() {
  if (logFileStream.is_open()) {
    logFileStream.close();
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  currentLogLevel = level;
}

LogLevel Logger::getLogLevel() const {
  std::lock_guard<std::mutex> lock(s_mutex);
  return currentLogLevel;
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case TRACE:
    return "TRACE";
  case DEBUG:
    return "DEBUG";
  case INFO:
    return "INFO";
  case WARN:
    return "WARN";
  case ERROR:
    return "ERROR";
  case FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::formatRecord(LogLevel level, const std::string &message) {
  return "{\"timestamp\": \"" + jsonEscape(getTimestamp()) +
         "\", \"level\": \"" + levelToString(level) +
         "\", \"message\": \"" + jsonEscape(message) + "\"}";
}

void Logger::rotateIfNeeded() {
  if (!logFileStream.is_open() || maxFileSize <= 0) {
    return;
  }
  logFileStream.clear(); // Clear any error flags
  logFileStream.flush(); // Flush before tellp
  if (logFileStream.tellp() < maxFileSize) {
    return;
  }
  logFileStream.close(); // Close before rename/remove

  if (maxBackupFiles == 0) {
    std::remove(logFilePath.c_str());
  } else {
    std::string tooOldPath =
        logFilePath + "." + std::to_string(maxBackupFiles + 1);
    std::remove(tooOldPath.c_str());

    for (int i = maxBackupFiles; i >= 1; --i) {
      std::string oldPath = logFilePath + "." + std::to_string(i);
      std::string newPath = logFilePath + "." + std::to_string(i + 1);
      std::ifstream oldFileTest(oldPath.c_str());
      if (oldFileTest.good()) {
        oldFileTest.close();
        std::remove(newPath.c_str()); // Ensure target of rename does not exist
        std::rename(oldPath.c_str(), newPath.c_str());
      }
    }
    std::rename(logFilePath.c_str(), (logFilePath + ".1").c_str());
    // Only maxBackupFiles backups are kept.
    std::remove(tooOldPath.c_str());
  }
  // Reopen the primary log file path
  logFileStream.open(logFilePath, std::ios::app);
  if (!logFileStream.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath << std::endl;
  }
}

void Logger::log(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (level < currentLogLevel) { // Check level after acquiring lock
    return;
  }

  const std::string jsonLine = formatRecord(level, message);

  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cerr << jsonLine << std::endl;
    return;
  }

  rotateIfNeeded();
  if (logFileStream.is_open()) {
    logFileStream << jsonLine << std::endl;
  } else {
    // Never lose a record silently: fall back to the console.
    std::cerr << jsonLine << std::endl;
  }
}

std::string Logger::getTimestamp() {
  std::time_t currentTime = std::time(nullptr);
  std::tm localTime{};
  localtime_r(&currentTime, &localTime);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &localTime);
  return std::string(timestamp);
}
