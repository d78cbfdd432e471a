#pragma once

#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace sentinel::util {

Result ensure_crypto_ready();

std::string sha256_hex(std::string_view payload);

// SHA-256 of the supporting evidence bytes, used as a threat's data_hash.
DataHash evidence_fingerprint(std::string_view evidence);

bool parse_data_hash(std::string_view hex, DataHash& out);
std::string data_hash_hex(const DataHash& hash);
bool is_zero_hash(const DataHash& hash);

inline constexpr std::string_view kZeroHashHex =
    "0000000000000000000000000000000000000000000000000000000000000000";

}  // namespace sentinel::util
