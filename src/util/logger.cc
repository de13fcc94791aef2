#include "logger.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <mutex>
#include <fcntl.h>
#include <unistd.h>

namespace VeilLogger {

namespace {

#ifdef VEIL_DEBUG_BUILD
const Level kDefaultLevel = DEBUG;
#else
const Level kDefaultLevel = INFO;
#endif

const int kFileFlags = O_WRONLY | O_CREAT | O_APPEND;
const mode_t kFileMode = 0644;

std::mutex sink_mutex;
std::string sink_path;
bool sink_failed = false;

// Caller holds sink_mutex. A file shared by several veil processes stays
// line-ordered because each line is one O_APPEND write.
void AppendToSink(const std::string& line) {
  if (sink_path.empty()) {
    return;
  }

  int fd = open(sink_path.c_str(), kFileFlags, kFileMode);
  ssize_t written = -1;
  if (fd >= 0) {
    written = write(fd, line.data(), line.size());
    close(fd);
  }

  if (written != static_cast<ssize_t>(line.size()) && !sink_failed) {
    sink_failed = true;
    std::cerr << "[Logger] WARN: could not append to " << sink_path << std::endl;
  }
}

}  // namespace

Level Logger::current_level_ = kDefaultLevel;

void Logger::Init() {
  current_level_ = kDefaultLevel;
  std::lock_guard<std::mutex> lock(sink_mutex);
  sink_path.clear();
  sink_failed = false;
}

void Logger::Init(const std::string& log_file_path) {
  Init();

  int fd = open(log_file_path.c_str(), kFileFlags, kFileMode);
  if (fd < 0) {
    std::cerr << "[Logger] ERROR: Failed to open log file: " << log_file_path << std::endl;
    return;
  }
  close(fd);

  std::lock_guard<std::mutex> lock(sink_mutex);
  sink_path = log_file_path;
}

void Logger::SetLevel(Level level) {
  current_level_ = level;
}

Level Logger::GetLevel() {
  return current_level_;
}

bool Logger::ParseLevel(const std::string& name, Level* level) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "warning") {
    *level = WARN;
    return true;
  }
  for (Level candidate : {DEBUG, INFO, WARN, ERROR}) {
    if (lower == LevelName(candidate)) {
      *level = candidate;
      return true;
    }
  }
  return false;
}

const char* Logger::LevelName(Level level) {
  switch (level) {
    case DEBUG: return "debug";
    case INFO:  return "info";
    case WARN:  return "warn";
    case ERROR: return "error";
  }
  return "info";
}

std::string Logger::GetTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()).count() % 1000;
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm local{};
  localtime_r(&seconds, &local);

  std::ostringstream oss;
  oss << std::put_time(&local, "%H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << millis;
  return oss.str();
}

// Padded to five columns so messages line up
std::string Logger::LevelToString(Level level) {
  switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO ";
    case WARN:  return "WARN ";
    case ERROR: return "ERROR";
  }
  return "?????";
}

void Logger::Log(Level level, const std::string& component, const std::string& message) {
  if (level < current_level_) {
    return;
  }

  std::ostringstream line;
  line << '[' << GetTimestamp() << "] [" << LevelToString(level) << "] ["
       << component << "] " << message << '\n';
  const std::string text = line.str();

  std::lock_guard<std::mutex> lock(sink_mutex);
  std::cerr << text;
  AppendToSink(text);
}

void Logger::Debug(const std::string& component, const std::string& message) {
  Log(DEBUG, component, message);
}

void Logger::Info(const std::string& component, const std::string& message) {
  Log(INFO, component, message);
}

void Logger::Warn(const std::string& component, const std::string& message) {
  Log(WARN, component, message);
}

void Logger::Error(const std::string& component, const std::string& message) {
  Log(ERROR, component, message);
}

} // namespace VeilLogger
