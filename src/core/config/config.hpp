#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/util/logging.hpp"

namespace sentinel {

struct SentinelConfig {
  Principal owner;
  std::vector<std::string> reporters;
  std::vector<std::string> verifiers;
  std::vector<std::string> senders;
  int emergency_threshold = 4;
  RegistryLimits limits{};
  LoggingConfig logging{};
};

// Parses `key=value` lines; `#` starts a comment line. Unknown keys are ignored.
Result parse_config_text(std::string_view text, SentinelConfig& out);
Result load_config_file(std::string_view path, SentinelConfig& out);

}  // namespace sentinel
