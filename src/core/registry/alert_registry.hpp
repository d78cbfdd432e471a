#pragma once

#include <array>
#include <cstddef>
#include <deque>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/access/access_control.hpp"
#include "core/model/types.hpp"
#include "core/storage/event_journal.hpp"
#include "core/util/logging.hpp"

namespace sentinel {

inline constexpr int kDefaultEmergencyThreshold = 4;

// Alert delivery records keyed by the threat they were raised for. The registry trusts the
// caller for threat_id validity. Mutations are atomic in the same sense as ThreatRegistry.
class AlertRegistry {
public:
  AlertRegistry(Principal owner, EventJournal& journal, RegistryLimits limits = {}, UnixClock clock = {});

  Result create_alert(const Principal& caller, const AlertDraft& draft, AlertId& out_id);
  Result update_status(const Principal& caller, AlertId id, AlertStatus new_status,
                       std::string_view failure_reason = {});
  Result set_emergency_threshold(const Principal& caller, int threshold);

  Result grant_role(const Principal& caller, Role role, const Principal& principal);
  Result revoke_role(const Principal& caller, Role role, const Principal& principal);
  Result transfer_ownership(const Principal& caller, const Principal& new_owner);

  Result get(AlertId id, Alert& out) const;
  [[nodiscard]] std::vector<AlertId> alerts_for_threat(ThreatId threat_id) const;
  Result list_recent(std::size_t offset, std::size_t limit, std::vector<AlertId>& out_ids) const;
  Result list_emergency(std::size_t offset, std::size_t limit, std::vector<AlertId>& out_ids) const;
  Result list_by_status(AlertStatus status, std::size_t offset, std::size_t limit,
                        std::vector<AlertId>& out_ids) const;

  [[nodiscard]] AlertStats stats() const;
  [[nodiscard]] AlertBreakdown breakdown() const;
  [[nodiscard]] std::size_t total() const;
  [[nodiscard]] std::size_t status_count(AlertStatus status) const;
  [[nodiscard]] std::size_t recent_size() const;
  [[nodiscard]] int emergency_threshold() const;

  [[nodiscard]] Principal owner() const;
  [[nodiscard]] bool has_role(const Principal& principal, Role role) const;
  [[nodiscard]] std::vector<std::string> role_members(Role role) const;

  [[nodiscard]] Result check_invariants() const;

private:
  Result validate_draft(const AlertDraft& draft) const;
  Result find_locked(AlertId id, std::size_t& out_index) const;
  Result reject(std::string_view operation, const Principal& caller, Result failure) const;
  std::int64_t now() const;

  EventJournal& journal_;
  RegistryLimits limits_;
  UnixClock clock_;
  Logger log_;

  mutable std::shared_mutex mutex_;
  AccessControl access_;
  int emergency_threshold_ = kDefaultEmergencyThreshold;
  std::vector<Alert> alerts_;
  std::deque<AlertId> recent_ids_;
  std::vector<AlertId> emergency_ids_;
  std::unordered_map<ThreatId, std::vector<AlertId>> alerts_by_threat_;
  std::array<std::size_t, kAlertStatusCount> status_counts_{};
  std::array<std::size_t, kAlertChannelCount> channel_counts_{};
  std::array<std::size_t, kSeverityLevels> severity_counts_{};
};

}  // namespace sentinel
