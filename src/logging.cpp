#include <algorithm>
#include <cctype>
#include <iostream>

#include <fmt/format.h>

#include <scb/logging.hpp>

namespace scb {

const char *toString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }
  return "INFO";
}

bool parseLogLevel(std::string_view text, LogLevel &level, std::string *outError) {
  std::string normalized(text);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
  } else if (normalized == "info") {
    level = LogLevel::kInfo;
  } else if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
  } else if (normalized == "error") {
    level = LogLevel::kError;
  } else {
    if (outError) {
      *outError = fmt::format("Invalid log level '{}' (expected debug|info|warn|error)", text);
    }
    return false;
  }
  return true;
}

Logger::Logger(LogLevel minLevel, std::ostream &out) : minLevel_(minLevel), out_(&out) {}

void Logger::log(LogLevel level, std::string_view message,
                 std::initializer_list<LogField> fields) {
  if (!shouldLog(level)) {
    return;
  }

  std::string line = fmt::format("level={} msg={}", toString(level), quote(message));
  for (const auto &field : fields) {
    line += fmt::format(" {}={}", field.key, quote(field.value));
  }
  line += '\n';

  (*out_) << line;
  out_->flush();
}

std::string Logger::quote(std::string_view value) {
  std::string result;
  result.reserve(value.size() + 2);
  result += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') {
      result += '\\';
    }
    result += c;
  }
  result += '"';
  return result;
}

Logger &defaultLogger() {
  static Logger logger(LogLevel::kInfo, std::clog);
  return logger;
}

} // namespace scb
