#pragma once

#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>

namespace scb {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogField {
  std::string_view key;
  std::string_view value;
};

const char *toString(LogLevel level);

// Accepts debug|info|warn|warning|error, case-insensitive
bool parseLogLevel(std::string_view text, LogLevel &level, std::string *outError = nullptr);

// Line-oriented key=value logger
// Each event is written as: level=WARN msg="..." key="value" ...
class Logger {
public:
  explicit Logger(LogLevel minLevel, std::ostream &out);

  void setMinLevel(LogLevel level) { minLevel_ = level; }
  LogLevel minLevel() const { return minLevel_; }

  bool shouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(minLevel_);
  }

  void log(LogLevel level, std::string_view message, std::initializer_list<LogField> fields = {});

  void debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(LogLevel::kDebug, message, fields);
  }
  void info(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(LogLevel::kInfo, message, fields);
  }
  void warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(LogLevel::kWarn, message, fields);
  }
  void error(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(LogLevel::kError, message, fields);
  }

private:
  static std::string quote(std::string_view value);

  LogLevel minLevel_;
  std::ostream *out_;
};

// Process-wide logger on std::clog at kInfo, used when no logger is supplied
Logger &defaultLogger();

// Resolve an optional logger pointer
inline Logger &loggerOrDefault(Logger *logger) {
  return logger ? *logger : defaultLogger();
}

} // namespace scb
