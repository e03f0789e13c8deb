#pragma once
#ifndef APPENDFS_LOGGER_H
#define APPENDFS_LOGGER_H
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide JSON-lines logger with size based rotation.
 *
 * Every record is written as one JSON object holding `timestamp`, `level`
 * and `message`. When the log file grows past the configured size it is
 * rotated to `<file>.1`, `<file>.2`, ... keeping at most `maxBackupFiles`
 * backups.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Log to stdout, no file

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  /**
   * @brief Parse a level name such as "debug" or "WARN".
   * @throws std::invalid_argument for unknown names.
   */
  static LogLevel levelFromString(const std::string &name);

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  void log(LogLevel level, const std::string &message);
  void logToConsole(LogLevel level, const std::string &message);

  /**
   * @brief printf-style TRACE logging.
   */
  static void trace(const char *format, ...);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string formatRecord(LogLevel level, const std::string &message) const;
  void rotateIfNeeded();
  static std::string getTimestamp();
  static std::string levelToString(LogLevel level);

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

#endif // APPENDFS_LOGGER_H
