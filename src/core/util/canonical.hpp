#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sentinel::util {

std::int64_t unix_timestamp_now();

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

std::vector<std::string> split_csv(std::string_view csv);
std::string join_csv(const std::vector<std::string>& values);

std::optional<std::int64_t> parse_int64(std::string_view text);

// Number of UTF-8 code points; continuation bytes are not counted.
std::size_t utf8_length(std::string_view text);

}  // namespace sentinel::util
