#include "core/util/logging.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <utility>

#include "core/util/canonical.hpp"

namespace sentinel {
namespace {

struct LoggingState {
  LogLevel level = LogLevel::Info;
  bool json = true;
  std::unique_ptr<std::ofstream> file_stream;
  std::mutex mutex;
};

LoggingState& state() {
  static LoggingState instance;
  return instance;
}

std::string_view level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
  }
  return "INFO";
}

void append_json_string(std::ostringstream& out, std::string_view value) {
  out << '"';
  for (char c : value) {
    switch (c) {
      case '"':
        out << "\\\"";
        break;
      case '\\':
        out << "\\\\";
        break;
      case '\n':
        out << "\\n";
        break;
      case '\t':
        out << "\\t";
        break;
      case '\r':
        out << "\\r";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20U) {
          constexpr std::string_view kHex = "0123456789abcdef";
          const auto byte = static_cast<unsigned char>(c);
          out << "\\u00" << kHex[byte >> 4U] << kHex[byte & 0x0FU];
        } else {
          out << c;
        }
        break;
    }
  }
  out << '"';
}

}  // namespace

Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::log(LogLevel level, std::string_view message, const LogFields& extra) const {
  auto& log_state = state();
  std::lock_guard<std::mutex> guard(log_state.mutex);
  if (static_cast<int>(level) < static_cast<int>(log_state.level)) {
    return;
  }

  std::ostringstream line;
  if (log_state.json) {
    line << "{\"level\":\"" << level_name(level) << "\",\"name\":";
    append_json_string(line, name_);
    line << ",\"message\":";
    append_json_string(line, message);
    for (const auto& [key, value] : extra) {
      line << ',';
      append_json_string(line, key);
      line << ':';
      append_json_string(line, value);
    }
    line << '}';
  } else {
    line << level_name(level) << ' ' << name_ << ' ' << message;
    if (!extra.empty()) {
      line << " |";
      for (const auto& [key, value] : extra) {
        line << ' ' << key << '=' << value;
      }
    }
  }

  std::ostream& output = log_state.file_stream ? static_cast<std::ostream&>(*log_state.file_stream)
                                               : std::clog;
  output << line.str() << '\n';
  output.flush();
}

void Logger::debug(std::string_view message, const LogFields& extra) const {
  log(LogLevel::Debug, message, extra);
}

void Logger::info(std::string_view message, const LogFields& extra) const {
  log(LogLevel::Info, message, extra);
}

void Logger::warn(std::string_view message, const LogFields& extra) const {
  log(LogLevel::Warn, message, extra);
}

void Logger::error(std::string_view message, const LogFields& extra) const {
  log(LogLevel::Error, message, extra);
}

std::optional<LogLevel> parse_log_level(std::string_view level) {
  const std::string normalized = util::lowercase_copy(util::trim_copy(level));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

Result configure_logging(const LoggingConfig& config) {
  auto& log_state = state();
  std::lock_guard<std::mutex> guard(log_state.mutex);
  log_state.level = parse_log_level(config.level).value_or(LogLevel::Info);
  log_state.json = config.json;
  log_state.file_stream.reset();

  if (config.log_file.has_value()) {
    auto stream = std::make_unique<std::ofstream>(*config.log_file, std::ios::app);
    if (!stream->is_open()) {
      // Output stays on std::clog.
      return Result::failure(ErrorCode::ConfigError, "Unable to open log file `" + *config.log_file + "`.");
    }
    log_state.file_stream = std::move(stream);
  }
  return Result::success();
}

Logger get_logger(std::string name) {
  return Logger(std::move(name));
}

}  // namespace sentinel
