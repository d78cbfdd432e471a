#include "core/config/config.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <optional>
#include <string>
#include <utility>

#include "core/util/canonical.hpp"

namespace sentinel {
namespace {

Result config_error(std::string message) {
  return Result::failure(ErrorCode::ConfigError, std::move(message));
}

Result parse_positive_size(const std::string& key, const std::string& value, std::size_t& out) {
  const auto parsed = util::parse_int64(value);
  if (!parsed.has_value() || *parsed < 1) {
    return config_error("`" + key + "` must be a positive integer, got `" + value + "`.");
  }
  out = static_cast<std::size_t>(*parsed);
  return Result::success();
}

Result parse_bool(const std::string& key, const std::string& value, bool& out) {
  const std::string normalized = util::lowercase_copy(value);
  if (normalized == "true" || normalized == "1" || normalized == "yes") {
    out = true;
    return Result::success();
  }
  if (normalized == "false" || normalized == "0" || normalized == "no") {
    out = false;
    return Result::success();
  }
  return config_error("`" + key + "` must be a boolean, got `" + value + "`.");
}

std::string strip_comments(std::string_view text) {
  std::string kept;
  std::istringstream in{std::string{text}};
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    kept.append(trimmed);
    kept.push_back('\n');
  }
  return kept;
}

}  // namespace

Result parse_config_text(std::string_view text, SentinelConfig& out) {
  SentinelConfig config;
  for (const auto& [raw_key, raw_value] : util::parse_canonical_map(strip_comments(text))) {
    const std::string key = util::lowercase_copy(util::trim_copy(raw_key));
    const std::string value = util::trim_copy(raw_value);

    Result field = Result::success();
    if (key == "owner") {
      config.owner = Principal{value};
    } else if (key == "reporters") {
      config.reporters = util::split_csv(value);
    } else if (key == "verifiers") {
      config.verifiers = util::split_csv(value);
    } else if (key == "senders") {
      config.senders = util::split_csv(value);
    } else if (key == "emergency_threshold") {
      const auto parsed = util::parse_int64(value);
      if (!parsed.has_value() || *parsed < kMinSeverity || *parsed > kMaxSeverity) {
        field = config_error("`emergency_threshold` must be between 1 and 5, got `" + value + "`.");
      } else {
        config.emergency_threshold = static_cast<int>(*parsed);
      }
    } else if (key == "recent_window") {
      field = parse_positive_size(key, value, config.limits.recent_window_capacity);
    } else if (key == "max_page_size") {
      field = parse_positive_size(key, value, config.limits.max_page_size);
    } else if (key == "max_message_length") {
      field = parse_positive_size(key, value, config.limits.max_message_length);
    } else if (key == "max_recipients") {
      field = parse_positive_size(key, value, config.limits.max_recipients);
    } else if (key == "log_level") {
      if (!parse_log_level(value).has_value()) {
        field = config_error("`log_level` must be DEBUG, INFO, WARN or ERROR, got `" + value + "`.");
      } else {
        config.logging.level = value;
      }
    } else if (key == "log_json") {
      field = parse_bool(key, value, config.logging.json);
    } else if (key == "log_file") {
      if (value.empty() || util::lowercase_copy(value) == "none") {
        config.logging.log_file = std::nullopt;
      } else {
        config.logging.log_file = value;
      }
    }

    if (!field.ok) {
      return field;
    }
  }

  if (config.owner.empty()) {
    return config_error("`owner` is required.");
  }

  out = std::move(config);
  return Result::success("Configuration parsed.");
}

Result load_config_file(std::string_view path, SentinelConfig& out) {
  const std::filesystem::path file_path{std::string{path}};
  std::ifstream in(file_path);
  if (!in) {
    return config_error("Unable to open config file: " + file_path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parse_config_text(buffer.str(), out);
}

}  // namespace sentinel
