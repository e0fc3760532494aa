#include "Logger.hpp"

#include <ctime>
#include <iostream>

Logger::LogLevel Logger::level_ = Logger::INFO;
std::ostream* Logger::out_ = NULL;

Logger::Logger(LogLevel level, const char* file, int line)
    : msgLevel_(level), file_(file), line_(line) {}

Logger::~Logger() {
  if (!enabled(msgLevel_)) {
    return;
  }
  std::ostringstream oss;
  if (level_ == DEBUG) {
    oss << "(" << file_ << ":" << line_ << ")\t";
  }
  oss << stream_.str();
  Logger::log(msgLevel_, oss.str());
}

std::ostringstream& Logger::stream() {
  return stream_;
}

void Logger::setLevel(LogLevel level) {
  level_ = level;
}

Logger::LogLevel Logger::level() {
  return level_;
}

bool Logger::enabled(LogLevel level) {
  return level >= level_;
}

void Logger::setOutput(std::ostream* out) {
  out_ = out;
}

std::string Logger::getCurrentTime() {
  static const size_t kTimeBufferSize = 32;
  time_t now = time(0);
  struct tm timeinfo;
  localtime_r(&now, &timeinfo);
  char buffer[kTimeBufferSize];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &timeinfo);
  return std::string(buffer);
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
    case DEBUG:
      return "DEBUG";
    case INFO:
      return "INFO";
    case ERROR:
      return "ERROR";
    default:
      return "UNKNOWN";
  }
}

void Logger::log(LogLevel level, const std::string& message) {
  if (!enabled(level)) {
    return;
  }
  std::ostream& out = out_ ? *out_ : std::cerr;
  out << "[" << getCurrentTime() << "] [" << levelToString(level) << "]\t"
      << message << '\n';
}
