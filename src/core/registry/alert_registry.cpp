#include "core/registry/alert_registry.hpp"

#include <algorithm>
#include <mutex>
#include <ranges>
#include <string>
#include <unordered_set>
#include <utility>

#include "core/model/names.hpp"
#include "core/registry/paging.hpp"
#include "core/util/canonical.hpp"

namespace sentinel {
namespace {

std::size_t index_of(AlertStatus status) {
  return static_cast<std::size_t>(status);
}

std::size_t index_of(AlertChannel channel) {
  return static_cast<std::size_t>(channel);
}

std::size_t severity_slot(int severity) {
  return static_cast<std::size_t>(severity - kMinSeverity);
}

std::string channels_csv(const std::vector<AlertChannel>& channels) {
  std::vector<std::string> names;
  names.reserve(channels.size());
  for (const AlertChannel channel : channels) {
    names.emplace_back(alert_channel_name(channel));
  }
  return util::join_csv(names);
}

}  // namespace

AlertRegistry::AlertRegistry(Principal owner, EventJournal& journal, RegistryLimits limits, UnixClock clock)
    : journal_(journal),
      limits_(limits),
      clock_(clock ? std::move(clock) : UnixClock{util::unix_timestamp_now}),
      log_(get_logger("alert_registry")),
      access_(std::move(owner), {Role::Sender}) {}

std::int64_t AlertRegistry::now() const {
  return clock_();
}

Result AlertRegistry::reject(std::string_view operation, const Principal& caller, Result failure) const {
  log_.warn("Mutation rejected.", {{"operation", std::string{operation}},
                                   {"caller", caller.value},
                                   {"error", std::string{error_code_name(failure.code)}},
                                   {"reason", failure.message}});
  return failure;
}

Result AlertRegistry::validate_draft(const AlertDraft& draft) const {
  if (draft.message.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "Alert message is required.");
  }
  if (util::utf8_length(draft.message) > limits_.max_message_length) {
    return Result::failure(ErrorCode::InvalidInput, "Alert message exceeds " +
                                                        std::to_string(limits_.max_message_length) +
                                                        " characters.");
  }
  if (draft.severity < kMinSeverity || draft.severity > kMaxSeverity) {
    return Result::failure(ErrorCode::InvalidSeverity, "Severity must be between 1 and 5.");
  }
  if (draft.channels.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "At least one delivery channel is required.");
  }
  if (!std::ranges::all_of(draft.channels, valid_alert_channel)) {
    return Result::failure(ErrorCode::InvalidInput, "Unknown delivery channel.");
  }
  if (draft.recipients.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "At least one recipient is required.");
  }
  if (draft.recipients.size() > limits_.max_recipients) {
    return Result::failure(ErrorCode::InvalidInput,
                           "Recipient list exceeds " + std::to_string(limits_.max_recipients) + " entries.");
  }
  return Result::success();
}

Result AlertRegistry::find_locked(AlertId id, std::size_t& out_index) const {
  if (id == 0U || id > alerts_.size()) {
    return Result::failure(ErrorCode::NotFound, "Alert " + std::to_string(id) + " does not exist.");
  }
  out_index = static_cast<std::size_t>(id - 1U);
  return Result::success();
}

Result AlertRegistry::create_alert(const Principal& caller, const AlertDraft& draft, AlertId& out_id) {
  std::unique_lock lock(mutex_);
  if (Result auth = access_.authorize(caller, Role::Sender, "create_alert"); !auth.ok) {
    return reject("create_alert", caller, std::move(auth));
  }
  if (Result valid = validate_draft(draft); !valid.ok) {
    return reject("create_alert", caller, std::move(valid));
  }

  Alert alert;
  alert.id = static_cast<AlertId>(alerts_.size()) + 1U;
  alert.threat_id = draft.threat_id;
  alert.message = draft.message;
  alert.severity = draft.severity;
  alert.channels = draft.channels;
  std::ranges::sort(alert.channels);
  const auto duplicates = std::ranges::unique(alert.channels);
  alert.channels.erase(duplicates.begin(), duplicates.end());
  alert.recipients = draft.recipients;
  alert.sender = caller;
  alert.created_unix = now();
  alert.status = AlertStatus::Pending;
  alert.is_emergency = alert.severity >= emergency_threshold_;
  alerts_.push_back(std::move(alert));

  const Alert& stored = alerts_.back();
  alerts_by_threat_[stored.threat_id].push_back(stored.id);
  recent_ids_.push_back(stored.id);
  while (recent_ids_.size() > limits_.recent_window_capacity) {
    recent_ids_.pop_front();
  }
  if (stored.is_emergency) {
    emergency_ids_.push_back(stored.id);
  }
  ++status_counts_[index_of(AlertStatus::Pending)];
  ++severity_counts_[severity_slot(stored.severity)];
  for (const AlertChannel channel : stored.channels) {
    ++channel_counts_[index_of(channel)];
  }

  journal_.append(EventKind::AlertCreated, stored.id, stored.threat_id, stored.created_unix, caller.value,
                  {{"severity", std::to_string(stored.severity)},
                   {"channels", channels_csv(stored.channels)},
                   {"recipient_count", std::to_string(stored.recipients.size())},
                   {"emergency", stored.is_emergency ? "1" : "0"}});
  if (stored.is_emergency) {
    journal_.append(EventKind::EmergencyAlert, stored.id, stored.threat_id, stored.created_unix, caller.value,
                    {{"severity", std::to_string(stored.severity)}, {"message", stored.message}});
  }
  log_.debug("Alert created.", {{"alert_id", std::to_string(stored.id)},
                                {"threat_id", std::to_string(stored.threat_id)},
                                {"emergency", stored.is_emergency ? "true" : "false"}});

  out_id = stored.id;
  return Result::success("Alert created.", std::to_string(stored.id));
}

Result AlertRegistry::update_status(const Principal& caller, AlertId id, AlertStatus new_status,
                                    std::string_view failure_reason) {
  std::unique_lock lock(mutex_);
  if (Result auth = access_.authorize(caller, Role::Sender, "update_alert_status"); !auth.ok) {
    return reject("update_alert_status", caller, std::move(auth));
  }
  std::size_t index = 0;
  if (Result found = find_locked(id, index); !found.ok) {
    return reject("update_alert_status", caller, std::move(found));
  }
  if (!valid_alert_status(new_status)) {
    return reject("update_alert_status", caller,
                  Result::failure(ErrorCode::InvalidInput, "Unknown alert status."));
  }

  Alert& alert = alerts_[index];
  if (alert.status == new_status) {
    return reject("update_alert_status", caller,
                  Result::failure(ErrorCode::NoOpRejected,
                                  "Alert " + std::to_string(id) + " is already " +
                                      std::string{alert_status_name(new_status)} + "."));
  }

  const AlertStatus old_status = alert.status;
  const std::int64_t changed_unix = now();
  --status_counts_[index_of(old_status)];
  ++status_counts_[index_of(new_status)];
  alert.status = new_status;
  if (new_status == AlertStatus::Failed) {
    alert.failure_reason = std::string{failure_reason};
  }
  if (new_status == AlertStatus::Delivered) {
    alert.delivered_unix = changed_unix;
  }

  journal_.append(EventKind::AlertStatusUpdated, alert.id, alert.threat_id, changed_unix, caller.value,
                  {{"old_status", std::string{alert_status_name(old_status)}},
                   {"new_status", std::string{alert_status_name(new_status)}},
                   {"failure_reason", new_status == AlertStatus::Failed ? alert.failure_reason : std::string{}}});
  if (new_status == AlertStatus::Delivered) {
    journal_.append(EventKind::AlertDelivered, alert.id, alert.threat_id, changed_unix, caller.value,
                    {{"latency_seconds", std::to_string(alert.delivered_unix - alert.created_unix)}});
  }
  log_.debug("Alert status updated.", {{"alert_id", std::to_string(alert.id)},
                                       {"old_status", std::string{alert_status_name(old_status)}},
                                       {"new_status", std::string{alert_status_name(new_status)}}});
  return Result::success("Alert status updated.");
}

Result AlertRegistry::set_emergency_threshold(const Principal& caller, int threshold) {
  std::unique_lock lock(mutex_);
  if (Result auth = access_.authorize_owner(caller, "set_emergency_threshold"); !auth.ok) {
    return reject("set_emergency_threshold", caller, std::move(auth));
  }
  if (threshold < kMinSeverity || threshold > kMaxSeverity) {
    return reject("set_emergency_threshold", caller,
                  Result::failure(ErrorCode::InvalidSeverity, "Emergency threshold must be between 1 and 5."));
  }
  if (threshold == emergency_threshold_) {
    return reject("set_emergency_threshold", caller,
                  Result::failure(ErrorCode::NoOpRejected,
                                  "Emergency threshold is already " + std::to_string(threshold) + "."));
  }

  const int previous = emergency_threshold_;
  emergency_threshold_ = threshold;
  journal_.append(EventKind::EmergencyThresholdUpdated, 0, 0, now(), caller.value,
                  {{"previous", std::to_string(previous)}, {"threshold", std::to_string(threshold)}});
  log_.info("Emergency threshold updated.",
            {{"previous", std::to_string(previous)}, {"threshold", std::to_string(threshold)}});
  return Result::success("Emergency threshold updated.");
}

Result AlertRegistry::grant_role(const Principal& caller, Role role, const Principal& principal) {
  std::unique_lock lock(mutex_);
  if (Result granted = access_.grant(caller, role, principal); !granted.ok) {
    return reject("grant_role", caller, std::move(granted));
  }
  journal_.append(EventKind::RoleGranted, 0, 0, now(), caller.value,
                  {{"registry", "alerts"}, {"role", std::string{role_name(role)}}, {"principal", principal.value}});
  log_.info("Role granted.", {{"role", std::string{role_name(role)}}, {"principal", principal.value}});
  return Result::success("Role granted.");
}

Result AlertRegistry::revoke_role(const Principal& caller, Role role, const Principal& principal) {
  std::unique_lock lock(mutex_);
  if (Result revoked = access_.revoke(caller, role, principal); !revoked.ok) {
    return reject("revoke_role", caller, std::move(revoked));
  }
  journal_.append(EventKind::RoleRevoked, 0, 0, now(), caller.value,
                  {{"registry", "alerts"}, {"role", std::string{role_name(role)}}, {"principal", principal.value}});
  log_.info("Role revoked.", {{"role", std::string{role_name(role)}}, {"principal", principal.value}});
  return Result::success("Role revoked.");
}

Result AlertRegistry::transfer_ownership(const Principal& caller, const Principal& new_owner) {
  std::unique_lock lock(mutex_);
  const Principal previous = access_.owner();
  if (Result transferred = access_.transfer_ownership(caller, new_owner); !transferred.ok) {
    return reject("transfer_ownership", caller, std::move(transferred));
  }
  journal_.append(EventKind::OwnershipTransferred, 0, 0, now(), caller.value,
                  {{"registry", "alerts"}, {"previous_owner", previous.value}, {"new_owner", new_owner.value}});
  log_.info("Ownership transferred.", {{"previous_owner", previous.value}, {"new_owner", new_owner.value}});
  return Result::success("Ownership transferred.");
}

Result AlertRegistry::get(AlertId id, Alert& out) const {
  std::shared_lock lock(mutex_);
  std::size_t index = 0;
  if (Result found = find_locked(id, index); !found.ok) {
    return found;
  }
  out = alerts_[index];
  return Result::success();
}

std::vector<AlertId> AlertRegistry::alerts_for_threat(ThreatId threat_id) const {
  std::shared_lock lock(mutex_);
  const auto it = alerts_by_threat_.find(threat_id);
  if (it == alerts_by_threat_.end()) {
    return {};
  }
  return it->second;
}

Result AlertRegistry::list_recent(std::size_t offset, std::size_t limit, std::vector<AlertId>& out_ids) const {
  if (Result valid = validate_page_limit(limit, limits_.max_page_size); !valid.ok) {
    return valid;
  }
  std::shared_lock lock(mutex_);
  out_ids = page_reverse(recent_ids_, offset, limit);
  return Result::success();
}

Result AlertRegistry::list_emergency(std::size_t offset, std::size_t limit, std::vector<AlertId>& out_ids) const {
  if (Result valid = validate_page_limit(limit, limits_.max_page_size); !valid.ok) {
    return valid;
  }
  std::shared_lock lock(mutex_);
  out_ids = page_reverse(emergency_ids_, offset, limit);
  return Result::success();
}

Result AlertRegistry::list_by_status(AlertStatus status, std::size_t offset, std::size_t limit,
                                     std::vector<AlertId>& out_ids) const {
  if (Result valid = validate_page_limit(limit, limits_.max_page_size); !valid.ok) {
    return valid;
  }
  if (!valid_alert_status(status)) {
    return Result::failure(ErrorCode::InvalidInput, "Unknown alert status.");
  }
  std::shared_lock lock(mutex_);
  out_ids = page_matching(alerts_ | std::views::reverse, offset, limit,
                          [status](const Alert& alert) { return alert.status == status; });
  return Result::success();
}

AlertStats AlertRegistry::stats() const {
  std::shared_lock lock(mutex_);
  AlertStats out;
  out.total = alerts_.size();
  out.successful = status_counts_[index_of(AlertStatus::Delivered)];
  out.failed = status_counts_[index_of(AlertStatus::Failed)];
  out.emergency_count = emergency_ids_.size();

  std::int64_t latency_sum = 0;
  std::int64_t delivered = 0;
  for (const Alert& alert : alerts_) {
    if (alert.status == AlertStatus::Delivered) {
      latency_sum += alert.delivered_unix - alert.created_unix;
      ++delivered;
    }
  }
  if (delivered > 0) {
    out.avg_delivery_seconds = latency_sum / delivered;
  }
  return out;
}

AlertBreakdown AlertRegistry::breakdown() const {
  std::shared_lock lock(mutex_);
  AlertBreakdown out;
  out.by_status = status_counts_;
  out.by_channel = channel_counts_;
  out.by_severity = severity_counts_;
  if (!alerts_.empty()) {
    out.success_rate_percent = 100.0 * static_cast<double>(status_counts_[index_of(AlertStatus::Delivered)]) /
                               static_cast<double>(alerts_.size());
  }

  std::unordered_set<std::string> reached;
  for (const Alert& alert : alerts_) {
    if (alert.status != AlertStatus::Delivered) {
      continue;
    }
    reached.insert(alert.recipients.begin(), alert.recipients.end());
  }
  out.recipients_reached = reached.size();
  return out;
}

std::size_t AlertRegistry::total() const {
  std::shared_lock lock(mutex_);
  return alerts_.size();
}

std::size_t AlertRegistry::status_count(AlertStatus status) const {
  if (!valid_alert_status(status)) {
    return 0;
  }
  std::shared_lock lock(mutex_);
  return status_counts_[index_of(status)];
}

std::size_t AlertRegistry::recent_size() const {
  std::shared_lock lock(mutex_);
  return recent_ids_.size();
}

int AlertRegistry::emergency_threshold() const {
  std::shared_lock lock(mutex_);
  return emergency_threshold_;
}

Principal AlertRegistry::owner() const {
  std::shared_lock lock(mutex_);
  return access_.owner();
}

bool AlertRegistry::has_role(const Principal& principal, Role role) const {
  std::shared_lock lock(mutex_);
  return access_.has_role(principal, role);
}

std::vector<std::string> AlertRegistry::role_members(Role role) const {
  std::shared_lock lock(mutex_);
  return access_.members(role);
}

Result AlertRegistry::check_invariants() const {
  std::shared_lock lock(mutex_);

  std::array<std::size_t, kAlertStatusCount> statuses{};
  std::vector<AlertId> expected_emergency;
  for (std::size_t i = 0; i < alerts_.size(); ++i) {
    const Alert& alert = alerts_[i];
    if (alert.id != static_cast<AlertId>(i) + 1U) {
      return Result::failure(ErrorCode::InvalidInput, "Alert ids are not dense at slot " + std::to_string(i) + ".");
    }
    ++statuses[index_of(alert.status)];
    if (alert.is_emergency) {
      expected_emergency.push_back(alert.id);
    }
  }

  std::size_t status_sum = 0;
  for (const std::size_t count : status_counts_) {
    status_sum += count;
  }
  if (status_sum != alerts_.size() || statuses != status_counts_) {
    return Result::failure(ErrorCode::InvalidInput, "Alert status counters drifted from the records.");
  }
  if (expected_emergency != emergency_ids_) {
    return Result::failure(ErrorCode::InvalidInput, "Emergency index disagrees with the records.");
  }

  if (recent_ids_.size() > limits_.recent_window_capacity) {
    return Result::failure(ErrorCode::InvalidInput, "Recent window exceeds its capacity.");
  }
  const std::size_t expected_recent = std::min(alerts_.size(), limits_.recent_window_capacity);
  if (recent_ids_.size() != expected_recent) {
    return Result::failure(ErrorCode::InvalidInput, "Recent window lost entries.");
  }
  AlertId expected_id = static_cast<AlertId>(alerts_.size() - expected_recent) + 1U;
  for (const AlertId id : recent_ids_) {
    if (id != expected_id) {
      return Result::failure(ErrorCode::InvalidInput, "Recent window is out of order at alert " +
                                                          std::to_string(id) + ".");
    }
    ++expected_id;
  }

  std::size_t adjacency_total = 0;
  for (const auto& [threat_id, ids] : alerts_by_threat_) {
    for (const AlertId id : ids) {
      if (id == 0U || id > alerts_.size() || alerts_[id - 1U].threat_id != threat_id) {
        return Result::failure(ErrorCode::InvalidInput, "Threat adjacency references a stale alert.");
      }
    }
    adjacency_total += ids.size();
  }
  if (adjacency_total != alerts_.size()) {
    return Result::failure(ErrorCode::InvalidInput, "Threat adjacency does not cover every alert.");
  }
  return Result::success("Alert registry invariants hold.");
}

}  // namespace sentinel
