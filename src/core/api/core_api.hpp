#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "core/config/config.hpp"
#include "core/model/types.hpp"
#include "core/registry/alert_registry.hpp"
#include "core/registry/threat_registry.hpp"
#include "core/storage/event_journal.hpp"
#include "core/util/logging.hpp"

namespace sentinel {

struct HealthReport {
  bool healthy = false;
  std::string details;
  ThreatStats threats;
  AlertStats alerts;
  bool threat_invariants_ok = false;
  bool alert_invariants_ok = false;
  std::size_t journal_events = 0;
  std::string journal_head;
  bool journal_chain_valid = false;
  int emergency_threshold = 0;
  std::string threat_owner;
  std::string alert_owner;
};

// Wires one event journal to a threat registry and an alert registry built from a
// SentinelConfig, and routes role changes to the registry that uses the role.
class SentinelCore {
public:
  explicit SentinelCore(UnixClock clock = {});

  Result init(const SentinelConfig& config);
  [[nodiscard]] bool initialized() const { return threats_ != nullptr; }

  Result register_threat(const Principal& caller, const ThreatDraft& draft, ThreatId& out_id);
  Result update_threat_status(const Principal& caller, ThreatId id, ThreatStatus status);
  Result verify_threat(const Principal& caller, ThreatId id, bool is_legitimate);

  Result create_alert(const Principal& caller, const AlertDraft& draft, AlertId& out_id);
  Result update_alert_status(const Principal& caller, AlertId id, AlertStatus status,
                             std::string_view failure_reason = {});
  Result set_emergency_threshold(const Principal& caller, int threshold);

  Result grant_role(const Principal& caller, Role role, const Principal& principal);
  Result revoke_role(const Principal& caller, Role role, const Principal& principal);
  Result transfer_ownership(const Principal& caller, const Principal& new_owner);

  Result threat(ThreatId id, Threat& out) const;
  Result alert(AlertId id, Alert& out) const;
  Result list_active_threats(std::size_t offset, std::size_t limit, std::vector<ThreatId>& out_ids) const;
  Result list_threats_by_type(ThreatType type, std::size_t offset, std::size_t limit,
                              std::vector<ThreatId>& out_ids) const;
  Result list_threats_by_severity(int min_severity, std::size_t offset, std::size_t limit,
                                  std::vector<ThreatId>& out_ids) const;
  Result list_recent_alerts(std::size_t offset, std::size_t limit, std::vector<AlertId>& out_ids) const;
  Result list_emergency_alerts(std::size_t offset, std::size_t limit, std::vector<AlertId>& out_ids) const;
  Result list_alerts_by_status(AlertStatus status, std::size_t offset, std::size_t limit,
                               std::vector<AlertId>& out_ids) const;
  [[nodiscard]] std::vector<AlertId> alerts_for_threat(ThreatId threat_id) const;
  [[nodiscard]] std::vector<LedgerEvent> audit_trail(RecordFamily family, std::uint64_t record_id) const;

  void subscribe(std::shared_ptr<IEventSink> sink);
  [[nodiscard]] HealthReport health() const;

  [[nodiscard]] const ThreatRegistry* threats() const { return threats_.get(); }
  [[nodiscard]] const AlertRegistry* alerts() const { return alerts_.get(); }
  [[nodiscard]] const EventJournal& journal() const { return journal_; }

private:
  Result ensure_initialized(std::string_view operation) const;
  static Result validate_config(const SentinelConfig& config);
  Result grant_initial_roles(const Principal& owner, Role role, const std::vector<std::string>& principals);

  UnixClock clock_;
  Logger log_;
  EventJournal journal_;
  std::unique_ptr<ThreatRegistry> threats_;
  std::unique_ptr<AlertRegistry> alerts_;
  std::mutex admin_mutex_;
};

}  // namespace sentinel
