#pragma once

#include <optional>
#include <string_view>

#include "core/model/types.hpp"

namespace sentinel {

std::string_view error_code_name(ErrorCode code);
std::string_view event_kind_name(EventKind kind);
RecordFamily record_family(EventKind kind);

std::string_view threat_type_name(ThreatType type);
std::string_view threat_status_name(ThreatStatus status);
std::string_view alert_status_name(AlertStatus status);
std::string_view alert_channel_name(AlertChannel channel);
std::string_view role_name(Role role);

std::optional<ThreatType> parse_threat_type(std::string_view text);
std::optional<ThreatStatus> parse_threat_status(std::string_view text);
std::optional<AlertStatus> parse_alert_status(std::string_view text);
std::optional<AlertChannel> parse_alert_channel(std::string_view text);
std::optional<Role> parse_role(std::string_view text);

// Range checks for enum values that may have been cast from untrusted integers.
bool valid_threat_type(ThreatType type);
bool valid_threat_status(ThreatStatus status);
bool valid_alert_status(AlertStatus status);
bool valid_alert_channel(AlertChannel channel);

}  // namespace sentinel
