#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace sentinel {

enum class ErrorCode {
  None,
  Unauthorized,
  NotFound,
  InvalidInput,
  InvalidSeverity,
  InvalidConfidence,
  EmptyDescription,
  EmptyDataHash,
  InvalidLocation,
  NoOpRejected,
  AlreadyVerified,
  ConfigError,
  NotInitialized,
};

struct Result {
  bool ok = false;
  ErrorCode code = ErrorCode::None;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, ErrorCode::None, std::move(msg), std::move(payload)};
  }

  static Result failure(ErrorCode code, std::string msg) {
    return {false, code, std::move(msg), {}};
  }
};

// The register_threat field errors are refinements of InvalidInput.
inline bool is_invalid_input(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidInput:
    case ErrorCode::InvalidSeverity:
    case ErrorCode::InvalidConfidence:
    case ErrorCode::EmptyDescription:
    case ErrorCode::EmptyDataHash:
    case ErrorCode::InvalidLocation:
      return true;
    default:
      return false;
  }
}

struct Principal {
  std::string value;

  [[nodiscard]] bool empty() const { return value.empty(); }

  friend bool operator==(const Principal&, const Principal&) = default;
};

using ThreatId = std::uint64_t;
using AlertId = std::uint64_t;
using DataHash = std::array<std::uint8_t, 32>;
using UnixClock = std::function<std::int64_t()>;

enum class ThreatType : std::uint8_t {
  Storm,
  Pollution,
  Erosion,
  AlgalBloom,
  IllegalDumping,
  Anomaly,
};
inline constexpr std::size_t kThreatTypeCount = 6;

enum class ThreatStatus : std::uint8_t {
  Active,
  Investigating,
  Resolved,
  FalsePositive,
};
inline constexpr std::size_t kThreatStatusCount = 4;

enum class AlertStatus : std::uint8_t {
  Pending,
  Sent,
  Delivered,
  Failed,
};
inline constexpr std::size_t kAlertStatusCount = 4;

enum class AlertChannel : std::uint8_t {
  Web,
  Email,
  Sms,
  Push,
};
inline constexpr std::size_t kAlertChannelCount = 4;

inline constexpr int kMinSeverity = 1;
inline constexpr int kMaxSeverity = 5;
inline constexpr std::size_t kSeverityLevels = 5;
inline constexpr int kMaxConfidence = 100;
inline constexpr int kCriticalSeverity = 4;
inline constexpr std::int64_t kCoordinateScale = 1'000'000;
inline constexpr std::int64_t kMaxLatitudeE6 = 90 * kCoordinateScale;
inline constexpr std::int64_t kMaxLongitudeE6 = 180 * kCoordinateScale;

enum class Role : std::uint8_t {
  Reporter,
  Verifier,
  Sender,
};

struct GeoPoint {
  std::int64_t latitude_e6 = 0;
  std::int64_t longitude_e6 = 0;
};

struct ThreatDraft {
  ThreatType threat_type = ThreatType::Storm;
  int severity = 0;
  int confidence = 0;
  GeoPoint location{};
  std::string description;
  DataHash data_hash{};
  std::uint64_t affected_population = 0;
};

struct Threat {
  ThreatId id = 0;
  ThreatType threat_type = ThreatType::Storm;
  int severity = 0;
  int confidence = 0;
  GeoPoint location{};
  std::string description;
  Principal reporter;
  std::int64_t created_unix = 0;
  ThreatStatus status = ThreatStatus::Active;
  DataHash data_hash{};
  std::uint64_t affected_population = 0;
  bool verified = false;
  Principal verifier;
  std::int64_t verified_unix = 0;
};

struct AlertDraft {
  ThreatId threat_id = 0;
  std::string message;
  int severity = 0;
  std::vector<AlertChannel> channels;
  std::vector<std::string> recipients;
};

struct Alert {
  AlertId id = 0;
  ThreatId threat_id = 0;
  std::string message;
  int severity = 0;
  std::vector<AlertChannel> channels;
  std::vector<std::string> recipients;
  Principal sender;
  std::int64_t created_unix = 0;
  AlertStatus status = AlertStatus::Pending;
  std::int64_t delivered_unix = 0;
  std::string failure_reason;
  bool is_emergency = false;
};

struct ThreatStats {
  std::size_t total = 0;
  std::size_t active = 0;
  std::size_t resolved = 0;
  std::size_t verified = 0;
};

struct ThreatBreakdown {
  std::array<std::size_t, kThreatTypeCount> by_type{};
  std::array<std::size_t, kThreatStatusCount> by_status{};
  std::array<std::size_t, kSeverityLevels> by_severity{};
  std::size_t critical = 0;
  std::size_t verified = 0;
  double average_severity = 0.0;
};

struct AlertStats {
  std::size_t total = 0;
  std::size_t successful = 0;
  std::size_t failed = 0;
  std::size_t emergency_count = 0;
  std::int64_t avg_delivery_seconds = 0;
};

struct AlertBreakdown {
  std::array<std::size_t, kAlertStatusCount> by_status{};
  std::array<std::size_t, kAlertChannelCount> by_channel{};
  std::array<std::size_t, kSeverityLevels> by_severity{};
  double success_rate_percent = 0.0;
  std::size_t recipients_reached = 0;
};

struct RegistryLimits {
  std::size_t recent_window_capacity = 1000;
  std::size_t max_page_size = 100;
  std::size_t max_message_length = 1000;
  std::size_t max_recipients = 1000;
};

enum class EventKind {
  ThreatRegistered,
  ThreatStatusUpdated,
  ThreatVerified,
  AlertCreated,
  AlertStatusUpdated,
  AlertDelivered,
  EmergencyAlert,
  EmergencyThresholdUpdated,
  RoleGranted,
  RoleRevoked,
  OwnershipTransferred,
};

enum class RecordFamily {
  Threat,
  Alert,
  Access,
};

struct LedgerEvent {
  std::uint64_t sequence = 0;
  EventKind kind = EventKind::ThreatRegistered;
  std::uint64_t record_id = 0;
  std::uint64_t related_id = 0;
  std::int64_t unix_ts = 0;
  std::string actor;
  std::string payload;
  std::string prev_hash;
  std::string event_hash;
};

}  // namespace sentinel
