#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace sentinel {

enum class LogLevel {
  Debug,
  Info,
  Warn,
  Error,
};

struct LoggingConfig {
  std::string level = "INFO";
  bool json = true;
  std::optional<std::string> log_file = std::nullopt;
};

using LogFields = std::map<std::string, std::string>;

class Logger {
public:
  explicit Logger(std::string name);

  void log(LogLevel level, std::string_view message, const LogFields& extra = {}) const;

  void debug(std::string_view message, const LogFields& extra = {}) const;
  void info(std::string_view message, const LogFields& extra = {}) const;
  void warn(std::string_view message, const LogFields& extra = {}) const;
  void error(std::string_view message, const LogFields& extra = {}) const;

  [[nodiscard]] const std::string& name() const { return name_; }

private:
  std::string name_;
};

std::optional<LogLevel> parse_log_level(std::string_view level);
Result configure_logging(const LoggingConfig& config);
Logger get_logger(std::string name);

}  // namespace sentinel
