#pragma once

#include <cerrno>
#include <cstring>
#include <ostream>
#include <sstream>
#include <string>

// Leveled logger for the command-line tools. Messages go to stderr so that
// they never mix with the markup written to stdout.
class Logger {
 public:
  enum LogLevel { DEBUG, INFO, ERROR };

  // Temporary RAII stream object behind LOG(level): the message is built in
  // stream() and emitted by the destructor.
  Logger(LogLevel level, const char* file, int line);
  ~Logger();

  std::ostringstream& stream();

  static void setLevel(LogLevel level);
  static LogLevel level();
  static bool enabled(LogLevel level);
  // Redirect output (tests); NULL restores stderr.
  static void setOutput(std::ostream* out);
  static void log(LogLevel level, const std::string& message);
  static std::string levelToString(LogLevel level);

 private:
  Logger(const Logger&);
  Logger& operator=(const Logger&);

  LogLevel msgLevel_;
  const char* file_;
  int line_;
  std::ostringstream stream_;

  static LogLevel level_;
  static std::ostream* out_;

  static std::string getCurrentTime();
};

#define LOG(level) Logger(Logger::level, __FILE__, __LINE__).stream()

// Log an errno-related error with strerror(errno).
#define LOG_PERROR(level, msg) \
  LOG(level) << msg << ": " << std::strerror(errno)
