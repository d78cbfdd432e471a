#include "core/util/hash.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <tuple>

#include <sodium.h>

namespace sentinel::util {
namespace {

std::string to_hex(const unsigned char* bytes, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2U);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(bytes[i] >> 4U) & 0x0FU]);
    out.push_back(kHex[bytes[i] & 0x0FU]);
  }
  return out;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

}  // namespace

Result ensure_crypto_ready() {
  static const int init_status = sodium_init();
  if (init_status < 0) {
    return Result::failure(ErrorCode::ConfigError, "libsodium initialization failed.");
  }
  return Result::success();
}

std::string sha256_hex(std::string_view payload) {
  std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
  crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()));
  return to_hex(digest.data(), digest.size());
}

DataHash evidence_fingerprint(std::string_view evidence) {
  static_assert(crypto_hash_sha256_BYTES == std::tuple_size_v<DataHash>);
  DataHash digest{};
  crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char*>(evidence.data()),
                     static_cast<unsigned long long>(evidence.size()));
  return digest;
}

bool parse_data_hash(std::string_view hex, DataHash& out) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if (hex.size() != out.size() * 2U) {
    return false;
  }
  DataHash parsed{};
  for (std::size_t i = 0; i < parsed.size(); ++i) {
    const int hi = hex_value(hex[i * 2U]);
    const int lo = hex_value(hex[(i * 2U) + 1U]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    parsed[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  out = parsed;
  return true;
}

std::string data_hash_hex(const DataHash& hash) {
  return to_hex(hash.data(), hash.size());
}

bool is_zero_hash(const DataHash& hash) {
  return std::ranges::all_of(hash, [](std::uint8_t byte) { return byte == 0U; });
}

}  // namespace sentinel::util
