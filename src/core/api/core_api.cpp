#include "core/api/core_api.hpp"

#include <algorithm>
#include <utility>

#include "core/model/names.hpp"
#include "core/util/hash.hpp"

namespace sentinel {

SentinelCore::SentinelCore(UnixClock clock) : clock_(std::move(clock)), log_(get_logger("sentinel_core")) {}

Result SentinelCore::init(const SentinelConfig& config) {
  std::lock_guard<std::mutex> guard(admin_mutex_);
  if (initialized()) {
    return Result::failure(ErrorCode::ConfigError, "Sentinel core is already initialized.");
  }
  // Nothing is journaled until the whole config has been accepted.
  if (const Result valid = validate_config(config); !valid.ok) {
    return valid;
  }
  if (const Result crypto = util::ensure_crypto_ready(); !crypto.ok) {
    return crypto;
  }
  if (const Result logging = configure_logging(config.logging); !logging.ok) {
    return logging;
  }

  threats_ = std::make_unique<ThreatRegistry>(config.owner, journal_, config.limits, clock_);
  alerts_ = std::make_unique<AlertRegistry>(config.owner, journal_, config.limits, clock_);

  Result roles = grant_initial_roles(config.owner, Role::Reporter, config.reporters);
  if (roles.ok) {
    roles = grant_initial_roles(config.owner, Role::Verifier, config.verifiers);
  }
  if (roles.ok) {
    roles = grant_initial_roles(config.owner, Role::Sender, config.senders);
  }
  if (roles.ok && config.emergency_threshold != alerts_->emergency_threshold()) {
    roles = alerts_->set_emergency_threshold(config.owner, config.emergency_threshold);
  }
  if (!roles.ok) {
    threats_.reset();
    alerts_.reset();
    return roles;
  }

  log_.info("Sentinel core initialized.", {{"owner", config.owner.value},
                                           {"emergency_threshold", std::to_string(config.emergency_threshold)},
                                           {"recent_window", std::to_string(config.limits.recent_window_capacity)}});
  return Result::success("Sentinel core initialized.");
}

Result SentinelCore::validate_config(const SentinelConfig& config) {
  if (config.owner.empty()) {
    return Result::failure(ErrorCode::ConfigError, "An owner principal is required.");
  }
  if (config.emergency_threshold < kMinSeverity || config.emergency_threshold > kMaxSeverity) {
    return Result::failure(ErrorCode::ConfigError, "`emergency_threshold` must be between 1 and 5, got " +
                                                       std::to_string(config.emergency_threshold) + ".");
  }
  if (config.limits.recent_window_capacity == 0U || config.limits.max_page_size == 0U) {
    return Result::failure(ErrorCode::ConfigError, "Registry limits must be positive.");
  }
  const auto has_empty = [](const std::vector<std::string>& principals) {
    return std::ranges::any_of(principals, [](const std::string& value) { return value.empty(); });
  };
  if (has_empty(config.reporters) || has_empty(config.verifiers) || has_empty(config.senders)) {
    return Result::failure(ErrorCode::ConfigError, "Role lists must not contain empty principals.");
  }
  return Result::success();
}

Result SentinelCore::grant_initial_roles(const Principal& owner, Role role,
                                         const std::vector<std::string>& principals) {
  for (const auto& value : principals) {
    const Principal principal{value};
    const bool held = role == Role::Sender ? alerts_->has_role(principal, role) : threats_->has_role(principal, role);
    if (held) {
      continue;
    }
    const Result granted = grant_role(owner, role, principal);
    if (!granted.ok) {
      return granted;
    }
  }
  return Result::success();
}

Result SentinelCore::ensure_initialized(std::string_view operation) const {
  if (!initialized()) {
    return Result::failure(ErrorCode::NotInitialized,
                           "Sentinel core must be initialized before `" + std::string{operation} + "`.");
  }
  return Result::success();
}

Result SentinelCore::register_threat(const Principal& caller, const ThreatDraft& draft, ThreatId& out_id) {
  if (const Result ready = ensure_initialized("register_threat"); !ready.ok) {
    return ready;
  }
  return threats_->register_threat(caller, draft, out_id);
}

Result SentinelCore::update_threat_status(const Principal& caller, ThreatId id, ThreatStatus status) {
  if (const Result ready = ensure_initialized("update_threat_status"); !ready.ok) {
    return ready;
  }
  return threats_->update_status(caller, id, status);
}

Result SentinelCore::verify_threat(const Principal& caller, ThreatId id, bool is_legitimate) {
  if (const Result ready = ensure_initialized("verify_threat"); !ready.ok) {
    return ready;
  }
  return threats_->verify_threat(caller, id, is_legitimate);
}

Result SentinelCore::create_alert(const Principal& caller, const AlertDraft& draft, AlertId& out_id) {
  if (const Result ready = ensure_initialized("create_alert"); !ready.ok) {
    return ready;
  }
  return alerts_->create_alert(caller, draft, out_id);
}

Result SentinelCore::update_alert_status(const Principal& caller, AlertId id, AlertStatus status,
                                         std::string_view failure_reason) {
  if (const Result ready = ensure_initialized("update_alert_status"); !ready.ok) {
    return ready;
  }
  return alerts_->update_status(caller, id, status, failure_reason);
}

Result SentinelCore::set_emergency_threshold(const Principal& caller, int threshold) {
  if (const Result ready = ensure_initialized("set_emergency_threshold"); !ready.ok) {
    return ready;
  }
  return alerts_->set_emergency_threshold(caller, threshold);
}

Result SentinelCore::grant_role(const Principal& caller, Role role, const Principal& principal) {
  if (const Result ready = ensure_initialized("grant_role"); !ready.ok) {
    return ready;
  }
  if (role == Role::Sender) {
    return alerts_->grant_role(caller, role, principal);
  }
  return threats_->grant_role(caller, role, principal);
}

Result SentinelCore::revoke_role(const Principal& caller, Role role, const Principal& principal) {
  if (const Result ready = ensure_initialized("revoke_role"); !ready.ok) {
    return ready;
  }
  if (role == Role::Sender) {
    return alerts_->revoke_role(caller, role, principal);
  }
  return threats_->revoke_role(caller, role, principal);
}

Result SentinelCore::transfer_ownership(const Principal& caller, const Principal& new_owner) {
  if (const Result ready = ensure_initialized("transfer_ownership"); !ready.ok) {
    return ready;
  }
  std::lock_guard<std::mutex> guard(admin_mutex_);
  // Both registries must accept before either changes hands.
  if (threats_->owner() != caller || alerts_->owner() != caller) {
    return Result::failure(ErrorCode::Unauthorized, "`transfer_ownership` is restricted to the registry owner.");
  }
  if (new_owner.empty() || new_owner == caller) {
    return Result::failure(ErrorCode::InvalidInput, "New owner must differ from the current owner and be non-empty.");
  }
  if (const Result moved = threats_->transfer_ownership(caller, new_owner); !moved.ok) {
    return moved;
  }
  if (const Result moved = alerts_->transfer_ownership(caller, new_owner); !moved.ok) {
    log_.error("Alert registry refused ownership transfer after threat registry accepted it.",
               {{"new_owner", new_owner.value}, {"error", std::string{error_code_name(moved.code)}}});
    return moved;
  }
  return Result::success("Ownership transferred.");
}

Result SentinelCore::threat(ThreatId id, Threat& out) const {
  if (const Result ready = ensure_initialized("threat"); !ready.ok) {
    return ready;
  }
  return threats_->get(id, out);
}

Result SentinelCore::alert(AlertId id, Alert& out) const {
  if (const Result ready = ensure_initialized("alert"); !ready.ok) {
    return ready;
  }
  return alerts_->get(id, out);
}

Result SentinelCore::list_active_threats(std::size_t offset, std::size_t limit,
                                         std::vector<ThreatId>& out_ids) const {
  if (const Result ready = ensure_initialized("list_active_threats"); !ready.ok) {
    return ready;
  }
  return threats_->list_active(offset, limit, out_ids);
}

Result SentinelCore::list_threats_by_type(ThreatType type, std::size_t offset, std::size_t limit,
                                          std::vector<ThreatId>& out_ids) const {
  if (const Result ready = ensure_initialized("list_threats_by_type"); !ready.ok) {
    return ready;
  }
  return threats_->list_by_type(type, offset, limit, out_ids);
}

Result SentinelCore::list_threats_by_severity(int min_severity, std::size_t offset, std::size_t limit,
                                              std::vector<ThreatId>& out_ids) const {
  if (const Result ready = ensure_initialized("list_threats_by_severity"); !ready.ok) {
    return ready;
  }
  return threats_->list_by_severity(min_severity, offset, limit, out_ids);
}

Result SentinelCore::list_recent_alerts(std::size_t offset, std::size_t limit,
                                        std::vector<AlertId>& out_ids) const {
  if (const Result ready = ensure_initialized("list_recent_alerts"); !ready.ok) {
    return ready;
  }
  return alerts_->list_recent(offset, limit, out_ids);
}

Result SentinelCore::list_emergency_alerts(std::size_t offset, std::size_t limit,
                                           std::vector<AlertId>& out_ids) const {
  if (const Result ready = ensure_initialized("list_emergency_alerts"); !ready.ok) {
    return ready;
  }
  return alerts_->list_emergency(offset, limit, out_ids);
}

Result SentinelCore::list_alerts_by_status(AlertStatus status, std::size_t offset, std::size_t limit,
                                           std::vector<AlertId>& out_ids) const {
  if (const Result ready = ensure_initialized("list_alerts_by_status"); !ready.ok) {
    return ready;
  }
  return alerts_->list_by_status(status, offset, limit, out_ids);
}

std::vector<AlertId> SentinelCore::alerts_for_threat(ThreatId threat_id) const {
  if (!initialized()) {
    return {};
  }
  return alerts_->alerts_for_threat(threat_id);
}

std::vector<LedgerEvent> SentinelCore::audit_trail(RecordFamily family, std::uint64_t record_id) const {
  return journal_.events_for_record(family, record_id);
}

void SentinelCore::subscribe(std::shared_ptr<IEventSink> sink) {
  journal_.subscribe(std::move(sink));
}

HealthReport SentinelCore::health() const {
  HealthReport report;
  report.journal_events = journal_.size();
  report.journal_head = journal_.head_hash();
  report.journal_chain_valid = journal_.verify_chain();
  if (!initialized()) {
    report.details = "Sentinel core is not initialized.";
    return report;
  }

  report.threats = threats_->stats();
  report.alerts = alerts_->stats();
  report.emergency_threshold = alerts_->emergency_threshold();
  report.threat_owner = threats_->owner().value;
  report.alert_owner = alerts_->owner().value;

  const Result threat_check = threats_->check_invariants();
  const Result alert_check = alerts_->check_invariants();
  report.threat_invariants_ok = threat_check.ok;
  report.alert_invariants_ok = alert_check.ok;
  report.healthy = threat_check.ok && alert_check.ok && report.journal_chain_valid;
  if (report.healthy) {
    report.details = "All registry invariants hold and the journal chain verifies.";
  } else if (!threat_check.ok) {
    report.details = threat_check.message;
  } else if (!alert_check.ok) {
    report.details = alert_check.message;
  } else {
    report.details = "Journal hash chain failed verification.";
  }
  return report;
}

}  // namespace sentinel
