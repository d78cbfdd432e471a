#include "core/model/names.hpp"

#include <array>
#include <cstddef>
#include <string>

#include "core/util/canonical.hpp"

namespace sentinel {
namespace {

constexpr std::array<std::string_view, kThreatTypeCount> kThreatTypeNames = {
    "storm", "pollution", "erosion", "algal_bloom", "illegal_dumping", "anomaly",
};

constexpr std::array<std::string_view, kThreatStatusCount> kThreatStatusNames = {
    "active", "investigating", "resolved", "false_positive",
};

constexpr std::array<std::string_view, kAlertStatusCount> kAlertStatusNames = {
    "pending", "sent", "delivered", "failed",
};

constexpr std::array<std::string_view, kAlertChannelCount> kAlertChannelNames = {
    "web", "email", "sms", "push",
};

constexpr std::array<std::string_view, 3> kRoleNames = {
    "reporter", "verifier", "sender",
};

template <typename Enum, std::size_t N>
std::optional<Enum> parse_from(const std::array<std::string_view, N>& names, std::string_view text) {
  const std::string needle = util::lowercase_copy(util::trim_copy(text));
  for (std::size_t i = 0; i < N; ++i) {
    if (names[i] == needle) {
      return static_cast<Enum>(i);
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
std::string_view name_from(const std::array<std::string_view, N>& names, Enum value) {
  const auto index = static_cast<std::size_t>(value);
  if (index >= N) {
    return "unknown";
  }
  return names[index];
}

}  // namespace

std::string_view error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return "None";
    case ErrorCode::Unauthorized:
      return "Unauthorized";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::InvalidInput:
      return "InvalidInput";
    case ErrorCode::InvalidSeverity:
      return "InvalidSeverity";
    case ErrorCode::InvalidConfidence:
      return "InvalidConfidence";
    case ErrorCode::EmptyDescription:
      return "EmptyDescription";
    case ErrorCode::EmptyDataHash:
      return "EmptyDataHash";
    case ErrorCode::InvalidLocation:
      return "InvalidLocation";
    case ErrorCode::NoOpRejected:
      return "NoOpRejected";
    case ErrorCode::AlreadyVerified:
      return "AlreadyVerified";
    case ErrorCode::ConfigError:
      return "ConfigError";
    case ErrorCode::NotInitialized:
      return "NotInitialized";
  }
  return "Unknown";
}

std::string_view event_kind_name(EventKind kind) {
  switch (kind) {
    case EventKind::ThreatRegistered:
      return "ThreatRegistered";
    case EventKind::ThreatStatusUpdated:
      return "ThreatStatusUpdated";
    case EventKind::ThreatVerified:
      return "ThreatVerified";
    case EventKind::AlertCreated:
      return "AlertCreated";
    case EventKind::AlertStatusUpdated:
      return "AlertStatusUpdated";
    case EventKind::AlertDelivered:
      return "AlertDelivered";
    case EventKind::EmergencyAlert:
      return "EmergencyAlert";
    case EventKind::EmergencyThresholdUpdated:
      return "EmergencyThresholdUpdated";
    case EventKind::RoleGranted:
      return "RoleGranted";
    case EventKind::RoleRevoked:
      return "RoleRevoked";
    case EventKind::OwnershipTransferred:
      return "OwnershipTransferred";
  }
  return "Unknown";
}

RecordFamily record_family(EventKind kind) {
  switch (kind) {
    case EventKind::ThreatRegistered:
    case EventKind::ThreatStatusUpdated:
    case EventKind::ThreatVerified:
      return RecordFamily::Threat;
    case EventKind::AlertCreated:
    case EventKind::AlertStatusUpdated:
    case EventKind::AlertDelivered:
    case EventKind::EmergencyAlert:
      return RecordFamily::Alert;
    case EventKind::EmergencyThresholdUpdated:
    case EventKind::RoleGranted:
    case EventKind::RoleRevoked:
    case EventKind::OwnershipTransferred:
      return RecordFamily::Access;
  }
  return RecordFamily::Access;
}

std::string_view threat_type_name(ThreatType type) {
  return name_from(kThreatTypeNames, type);
}

std::string_view threat_status_name(ThreatStatus status) {
  return name_from(kThreatStatusNames, status);
}

std::string_view alert_status_name(AlertStatus status) {
  return name_from(kAlertStatusNames, status);
}

std::string_view alert_channel_name(AlertChannel channel) {
  return name_from(kAlertChannelNames, channel);
}

std::string_view role_name(Role role) {
  return name_from(kRoleNames, role);
}

std::optional<ThreatType> parse_threat_type(std::string_view text) {
  return parse_from<ThreatType>(kThreatTypeNames, text);
}

std::optional<ThreatStatus> parse_threat_status(std::string_view text) {
  return parse_from<ThreatStatus>(kThreatStatusNames, text);
}

std::optional<AlertStatus> parse_alert_status(std::string_view text) {
  return parse_from<AlertStatus>(kAlertStatusNames, text);
}

std::optional<AlertChannel> parse_alert_channel(std::string_view text) {
  return parse_from<AlertChannel>(kAlertChannelNames, text);
}

std::optional<Role> parse_role(std::string_view text) {
  return parse_from<Role>(kRoleNames, text);
}

bool valid_threat_type(ThreatType type) {
  return static_cast<std::size_t>(type) < kThreatTypeCount;
}

bool valid_threat_status(ThreatStatus status) {
  return static_cast<std::size_t>(status) < kThreatStatusCount;
}

bool valid_alert_status(AlertStatus status) {
  return static_cast<std::size_t>(status) < kAlertStatusCount;
}

bool valid_alert_channel(AlertChannel channel) {
  return static_cast<std::size_t>(channel) < kAlertChannelCount;
}

}  // namespace sentinel
