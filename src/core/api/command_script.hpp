#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/model/types.hpp"

namespace sentinel {

// Splits one `command|field|...` line into trimmed fields. Always yields at least one field.
std::vector<std::string> split_command_fields(std::string_view line);

// Runs one parsed command against the core. Malformed arguments fail with InvalidInput;
// numbers that do not fit the target field fail with that field's error code.
Result run_command(SentinelCore& core, const std::vector<std::string>& fields);

// Executes every non-blank, non-`#` line of `script` and prints
// `<line> <command> ok [data]` or `<line> <command> error <Code>: message` to `out`.
// Returns the number of commands executed.
std::size_t run_command_script(SentinelCore& core, std::istream& script, std::ostream& out);

}  // namespace sentinel
