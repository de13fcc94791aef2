#ifndef VEIL_LOGGER_H_
#define VEIL_LOGGER_H_

#include <string>
#include <sstream>
#include <iostream>
#include <chrono>
#include <iomanip>

namespace VeilLogger {

enum Level {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

/**
 * Process-wide logger. Lines go to stderr as
 * "[HH:MM:SS.mmm] [LEVEL] [component] message" and, once a log file is
 * set, are appended to that file too.
 */
class Logger {
public:
  // Level back to the build default, file sink off
  static void Init();
  static void Init(const std::string& log_file_path);

  static void SetLevel(Level level);
  static Level GetLevel();

  static void Log(Level level, const std::string& component, const std::string& message);
  static void Debug(const std::string& component, const std::string& message);
  static void Info(const std::string& component, const std::string& message);
  static void Warn(const std::string& component, const std::string& message);
  static void Error(const std::string& component, const std::string& message);

  // "debug", "info", "warn"/"warning", "error" (case-insensitive).
  // Returns false and leaves |level| untouched for anything else.
  static bool ParseLevel(const std::string& name, Level* level);

  // Lower-case name accepted by ParseLevel()
  static const char* LevelName(Level level);

private:
  static Level current_level_;
  static std::string GetTimestamp();
  static std::string LevelToString(Level level);
};

} // namespace VeilLogger

#ifdef VEIL_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) VeilLogger::Logger::Debug(component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)
#endif

#define LOG_INFO(component, msg) VeilLogger::Logger::Info(component, msg)
#define LOG_WARN(component, msg) VeilLogger::Logger::Warn(component, msg)
#define LOG_ERROR(component, msg) VeilLogger::Logger::Error(component, msg)

#endif  // VEIL_LOGGER_H_
