#include "core/registry/threat_registry.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <utility>

#include "core/model/names.hpp"
#include "core/registry/paging.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace sentinel {
namespace {

std::size_t index_of(ThreatStatus status) {
  return static_cast<std::size_t>(status);
}

std::size_t index_of(ThreatType type) {
  return static_cast<std::size_t>(type);
}

std::size_t severity_slot(int severity) {
  return static_cast<std::size_t>(severity - kMinSeverity);
}

}  // namespace

ThreatRegistry::ThreatRegistry(Principal owner, EventJournal& journal, RegistryLimits limits, UnixClock clock)
    : journal_(journal),
      limits_(limits),
      clock_(clock ? std::move(clock) : UnixClock{util::unix_timestamp_now}),
      log_(get_logger("threat_registry")),
      access_(std::move(owner), {Role::Reporter, Role::Verifier}) {}

std::int64_t ThreatRegistry::now() const {
  return clock_();
}

Result ThreatRegistry::reject(std::string_view operation, const Principal& caller, Result failure) const {
  log_.warn("Mutation rejected.", {{"operation", std::string{operation}},
                                   {"caller", caller.value},
                                   {"error", std::string{error_code_name(failure.code)}},
                                   {"reason", failure.message}});
  return failure;
}

Result ThreatRegistry::validate_draft(const ThreatDraft& draft) const {
  if (!valid_threat_type(draft.threat_type)) {
    return Result::failure(ErrorCode::InvalidInput, "Unknown threat type.");
  }
  if (draft.severity < kMinSeverity || draft.severity > kMaxSeverity) {
    return Result::failure(ErrorCode::InvalidSeverity, "Severity must be between 1 and 5.");
  }
  if (draft.confidence < 0 || draft.confidence > kMaxConfidence) {
    return Result::failure(ErrorCode::InvalidConfidence, "Confidence must be between 0 and 100.");
  }
  if (draft.description.empty()) {
    return Result::failure(ErrorCode::EmptyDescription, "Threat description is required.");
  }
  if (util::is_zero_hash(draft.data_hash)) {
    return Result::failure(ErrorCode::EmptyDataHash, "Threat evidence hash must be non-zero.");
  }
  if (draft.location.latitude_e6 < -kMaxLatitudeE6 || draft.location.latitude_e6 > kMaxLatitudeE6 ||
      draft.location.longitude_e6 < -kMaxLongitudeE6 || draft.location.longitude_e6 > kMaxLongitudeE6) {
    return Result::failure(ErrorCode::InvalidLocation, "Threat location is outside valid coordinates.");
  }
  return Result::success();
}

Result ThreatRegistry::find_locked(ThreatId id, std::size_t& out_index) const {
  if (id == 0U || id > threats_.size()) {
    return Result::failure(ErrorCode::NotFound, "Threat " + std::to_string(id) + " does not exist.");
  }
  out_index = static_cast<std::size_t>(id - 1U);
  return Result::success();
}

Result ThreatRegistry::register_threat(const Principal& caller, const ThreatDraft& draft, ThreatId& out_id) {
  std::unique_lock lock(mutex_);
  if (Result auth = access_.authorize(caller, Role::Reporter, "register_threat"); !auth.ok) {
    return reject("register_threat", caller, std::move(auth));
  }
  if (Result valid = validate_draft(draft); !valid.ok) {
    return reject("register_threat", caller, std::move(valid));
  }

  Threat threat;
  threat.id = static_cast<ThreatId>(threats_.size()) + 1U;
  threat.threat_type = draft.threat_type;
  threat.severity = draft.severity;
  threat.confidence = draft.confidence;
  threat.location = draft.location;
  threat.description = draft.description;
  threat.reporter = caller;
  threat.created_unix = now();
  threat.status = ThreatStatus::Active;
  threat.data_hash = draft.data_hash;
  threat.affected_population = draft.affected_population;
  threats_.push_back(std::move(threat));

  const Threat& stored = threats_.back();
  active_positions_.emplace(stored.id, active_ids_.size());
  active_ids_.push_back(stored.id);
  ++status_counts_[index_of(ThreatStatus::Active)];
  ++type_counts_[index_of(stored.threat_type)];
  ++severity_counts_[severity_slot(stored.severity)];
  const std::string hash_hex = util::data_hash_hex(stored.data_hash);
  first_by_data_hash_.try_emplace(hash_hex, stored.id);

  journal_.append(EventKind::ThreatRegistered, stored.id, 0, stored.created_unix, caller.value,
                  {{"threat_type", std::string{threat_type_name(stored.threat_type)}},
                   {"severity", std::to_string(stored.severity)},
                   {"confidence", std::to_string(stored.confidence)},
                   {"latitude_e6", std::to_string(stored.location.latitude_e6)},
                   {"longitude_e6", std::to_string(stored.location.longitude_e6)},
                   {"data_hash", hash_hex},
                   {"affected_population", std::to_string(stored.affected_population)}});
  log_.debug("Threat registered.", {{"threat_id", std::to_string(stored.id)},
                                    {"threat_type", std::string{threat_type_name(stored.threat_type)}},
                                    {"reporter", caller.value}});

  out_id = stored.id;
  return Result::success("Threat registered.", std::to_string(stored.id));
}

void ThreatRegistry::apply_status_locked(Threat& threat, ThreatStatus new_status) {
  const ThreatStatus old_status = threat.status;
  --status_counts_[index_of(old_status)];
  ++status_counts_[index_of(new_status)];

  if (old_status == ThreatStatus::Active) {
    // Swap with the last entry and truncate; active-set order is not significant.
    const auto it = active_positions_.find(threat.id);
    if (it != active_positions_.end()) {
      const std::size_t position = it->second;
      const ThreatId moved = active_ids_.back();
      active_ids_[position] = moved;
      active_positions_[moved] = position;
      active_ids_.pop_back();
      active_positions_.erase(threat.id);
    }
  }
  if (new_status == ThreatStatus::Active) {
    active_positions_.emplace(threat.id, active_ids_.size());
    active_ids_.push_back(threat.id);
  }

  threat.status = new_status;
}

void ThreatRegistry::journal_status_change(const Threat& threat, ThreatStatus old_status,
                                           const Principal& caller) {
  journal_.append(EventKind::ThreatStatusUpdated, threat.id, 0, now(), caller.value,
                  {{"old_status", std::string{threat_status_name(old_status)}},
                   {"new_status", std::string{threat_status_name(threat.status)}}});
  log_.debug("Threat status updated.", {{"threat_id", std::to_string(threat.id)},
                                        {"old_status", std::string{threat_status_name(old_status)}},
                                        {"new_status", std::string{threat_status_name(threat.status)}}});
}

Result ThreatRegistry::update_status(const Principal& caller, ThreatId id, ThreatStatus new_status) {
  std::unique_lock lock(mutex_);
  if (Result auth = access_.authorize(caller, Role::Reporter, "update_threat_status"); !auth.ok) {
    return reject("update_threat_status", caller, std::move(auth));
  }
  std::size_t index = 0;
  if (Result found = find_locked(id, index); !found.ok) {
    return reject("update_threat_status", caller, std::move(found));
  }
  if (!valid_threat_status(new_status)) {
    return reject("update_threat_status", caller,
                  Result::failure(ErrorCode::InvalidInput, "Unknown threat status."));
  }

  Threat& threat = threats_[index];
  if (threat.status == new_status) {
    return reject("update_threat_status", caller,
                  Result::failure(ErrorCode::NoOpRejected,
                                  "Threat " + std::to_string(id) + " is already " +
                                      std::string{threat_status_name(new_status)} + "."));
  }

  const ThreatStatus old_status = threat.status;
  apply_status_locked(threat, new_status);
  journal_status_change(threat, old_status, caller);
  return Result::success("Threat status updated.");
}

Result ThreatRegistry::verify_threat(const Principal& caller, ThreatId id, bool is_legitimate) {
  std::unique_lock lock(mutex_);
  if (Result auth = access_.authorize(caller, Role::Verifier, "verify_threat"); !auth.ok) {
    return reject("verify_threat", caller, std::move(auth));
  }
  std::size_t index = 0;
  if (Result found = find_locked(id, index); !found.ok) {
    return reject("verify_threat", caller, std::move(found));
  }

  Threat& threat = threats_[index];
  if (threat.verified) {
    return reject("verify_threat", caller,
                  Result::failure(ErrorCode::AlreadyVerified,
                                  "Threat " + std::to_string(id) + " was already verified."));
  }

  threat.verified = true;
  threat.verifier = caller;
  threat.verified_unix = now();
  ++verified_count_;

  // Only an Active threat is demoted; a threat under investigation keeps its status.
  if (!is_legitimate && threat.status == ThreatStatus::Active) {
    apply_status_locked(threat, ThreatStatus::FalsePositive);
    journal_status_change(threat, ThreatStatus::Active, caller);
  }

  journal_.append(EventKind::ThreatVerified, threat.id, 0, threat.verified_unix, caller.value,
                  {{"legitimate", is_legitimate ? "1" : "0"}, {"verifier", caller.value}});
  log_.debug("Threat verified.", {{"threat_id", std::to_string(threat.id)},
                                  {"legitimate", is_legitimate ? "true" : "false"},
                                  {"verifier", caller.value}});
  return Result::success("Threat verified.");
}

Result ThreatRegistry::grant_role(const Principal& caller, Role role, const Principal& principal) {
  std::unique_lock lock(mutex_);
  if (Result granted = access_.grant(caller, role, principal); !granted.ok) {
    return reject("grant_role", caller, std::move(granted));
  }
  journal_.append(EventKind::RoleGranted, 0, 0, now(), caller.value,
                  {{"registry", "threats"}, {"role", std::string{role_name(role)}}, {"principal", principal.value}});
  log_.info("Role granted.", {{"role", std::string{role_name(role)}}, {"principal", principal.value}});
  return Result::success("Role granted.");
}

Result ThreatRegistry::revoke_role(const Principal& caller, Role role, const Principal& principal) {
  std::unique_lock lock(mutex_);
  if (Result revoked = access_.revoke(caller, role, principal); !revoked.ok) {
    return reject("revoke_role", caller, std::move(revoked));
  }
  journal_.append(EventKind::RoleRevoked, 0, 0, now(), caller.value,
                  {{"registry", "threats"}, {"role", std::string{role_name(role)}}, {"principal", principal.value}});
  log_.info("Role revoked.", {{"role", std::string{role_name(role)}}, {"principal", principal.value}});
  return Result::success("Role revoked.");
}

Result ThreatRegistry::transfer_ownership(const Principal& caller, const Principal& new_owner) {
  std::unique_lock lock(mutex_);
  const Principal previous = access_.owner();
  if (Result transferred = access_.transfer_ownership(caller, new_owner); !transferred.ok) {
    return reject("transfer_ownership", caller, std::move(transferred));
  }
  journal_.append(EventKind::OwnershipTransferred, 0, 0, now(), caller.value,
                  {{"registry", "threats"}, {"previous_owner", previous.value}, {"new_owner", new_owner.value}});
  log_.info("Ownership transferred.", {{"previous_owner", previous.value}, {"new_owner", new_owner.value}});
  return Result::success("Ownership transferred.");
}

Result ThreatRegistry::get(ThreatId id, Threat& out) const {
  std::shared_lock lock(mutex_);
  std::size_t index = 0;
  if (Result found = find_locked(id, index); !found.ok) {
    return found;
  }
  out = threats_[index];
  return Result::success();
}

Result ThreatRegistry::list_active(std::size_t offset, std::size_t limit, std::vector<ThreatId>& out_ids) const {
  if (Result valid = validate_page_limit(limit, limits_.max_page_size); !valid.ok) {
    return valid;
  }
  std::shared_lock lock(mutex_);
  out_ids = page_forward(active_ids_, offset, limit);
  return Result::success();
}

Result ThreatRegistry::list_by_type(ThreatType type, std::size_t offset, std::size_t limit,
                                    std::vector<ThreatId>& out_ids) const {
  if (Result valid = validate_page_limit(limit, limits_.max_page_size); !valid.ok) {
    return valid;
  }
  if (!valid_threat_type(type)) {
    return Result::failure(ErrorCode::InvalidInput, "Unknown threat type.");
  }
  std::shared_lock lock(mutex_);
  out_ids = page_matching(threats_, offset, limit,
                          [type](const Threat& threat) { return threat.threat_type == type; });
  return Result::success();
}

Result ThreatRegistry::list_by_severity(int min_severity, std::size_t offset, std::size_t limit,
                                        std::vector<ThreatId>& out_ids) const {
  if (Result valid = validate_page_limit(limit, limits_.max_page_size); !valid.ok) {
    return valid;
  }
  if (min_severity < kMinSeverity || min_severity > kMaxSeverity) {
    return Result::failure(ErrorCode::InvalidSeverity, "Minimum severity must be between 1 and 5.");
  }
  std::shared_lock lock(mutex_);
  out_ids = page_matching(threats_, offset, limit,
                          [min_severity](const Threat& threat) { return threat.severity >= min_severity; });
  return Result::success();
}

std::optional<ThreatId> ThreatRegistry::find_by_data_hash(const DataHash& hash) const {
  std::shared_lock lock(mutex_);
  const auto it = first_by_data_hash_.find(util::data_hash_hex(hash));
  if (it == first_by_data_hash_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ThreatStats ThreatRegistry::stats() const {
  std::shared_lock lock(mutex_);
  return {
      .total = threats_.size(),
      .active = status_counts_[index_of(ThreatStatus::Active)],
      .resolved = status_counts_[index_of(ThreatStatus::Resolved)],
      .verified = verified_count_,
  };
}

ThreatBreakdown ThreatRegistry::breakdown() const {
  std::shared_lock lock(mutex_);
  ThreatBreakdown out;
  out.by_type = type_counts_;
  out.by_status = status_counts_;
  out.by_severity = severity_counts_;
  out.critical = severity_counts_[severity_slot(4)] + severity_counts_[severity_slot(5)];
  out.verified = verified_count_;

  std::size_t severity_sum = 0;
  for (std::size_t slot = 0; slot < kSeverityLevels; ++slot) {
    severity_sum += severity_counts_[slot] * (slot + 1U);
  }
  if (!threats_.empty()) {
    out.average_severity = static_cast<double>(severity_sum) / static_cast<double>(threats_.size());
  }
  return out;
}

std::size_t ThreatRegistry::total() const {
  std::shared_lock lock(mutex_);
  return threats_.size();
}

std::size_t ThreatRegistry::status_count(ThreatStatus status) const {
  if (!valid_threat_status(status)) {
    return 0;
  }
  std::shared_lock lock(mutex_);
  return status_counts_[index_of(status)];
}

std::size_t ThreatRegistry::type_count(ThreatType type) const {
  if (!valid_threat_type(type)) {
    return 0;
  }
  std::shared_lock lock(mutex_);
  return type_counts_[index_of(type)];
}

std::vector<ThreatId> ThreatRegistry::active_ids() const {
  std::shared_lock lock(mutex_);
  return active_ids_;
}

Principal ThreatRegistry::owner() const {
  std::shared_lock lock(mutex_);
  return access_.owner();
}

bool ThreatRegistry::has_role(const Principal& principal, Role role) const {
  std::shared_lock lock(mutex_);
  return access_.has_role(principal, role);
}

std::vector<std::string> ThreatRegistry::role_members(Role role) const {
  std::shared_lock lock(mutex_);
  return access_.members(role);
}

Result ThreatRegistry::check_invariants() const {
  std::shared_lock lock(mutex_);

  std::array<std::size_t, kThreatStatusCount> statuses{};
  std::array<std::size_t, kThreatTypeCount> types{};
  std::array<std::size_t, kSeverityLevels> severities{};
  std::size_t verified = 0;
  std::size_t expected_active = 0;

  for (std::size_t i = 0; i < threats_.size(); ++i) {
    const Threat& threat = threats_[i];
    if (threat.id != static_cast<ThreatId>(i) + 1U) {
      return Result::failure(ErrorCode::InvalidInput, "Threat ids are not dense at slot " + std::to_string(i) + ".");
    }
    ++statuses[index_of(threat.status)];
    ++types[index_of(threat.threat_type)];
    ++severities[severity_slot(threat.severity)];
    if (threat.verified) {
      ++verified;
    }
    const bool indexed = active_positions_.contains(threat.id);
    if ((threat.status == ThreatStatus::Active) != indexed) {
      return Result::failure(ErrorCode::InvalidInput,
                             "Active index disagrees with status of threat " + std::to_string(threat.id) + ".");
    }
    if (threat.status == ThreatStatus::Active) {
      ++expected_active;
    }
  }

  std::size_t status_sum = 0;
  for (const std::size_t count : status_counts_) {
    status_sum += count;
  }
  if (status_sum != threats_.size()) {
    return Result::failure(ErrorCode::InvalidInput, "Threat status counters do not sum to the total.");
  }
  if (statuses != status_counts_ || types != type_counts_ || severities != severity_counts_) {
    return Result::failure(ErrorCode::InvalidInput, "Threat counters drifted from the records.");
  }
  if (verified != verified_count_) {
    return Result::failure(ErrorCode::InvalidInput, "Verified counter drifted from the records.");
  }
  if (active_ids_.size() != expected_active || active_positions_.size() != expected_active) {
    return Result::failure(ErrorCode::InvalidInput, "Active index size does not match Active threats.");
  }
  for (std::size_t position = 0; position < active_ids_.size(); ++position) {
    const ThreatId id = active_ids_[position];
    const auto it = active_positions_.find(id);
    if (id == 0U || id > threats_.size() || it == active_positions_.end() || it->second != position) {
      return Result::failure(ErrorCode::InvalidInput, "Active index entry " + std::to_string(id) + " is stale.");
    }
  }
  for (const auto& [hash, id] : first_by_data_hash_) {
    if (id == 0U || id > threats_.size()) {
      return Result::failure(ErrorCode::InvalidInput, "Evidence index references a missing threat.");
    }
  }
  return Result::success("Threat registry invariants hold.");
}

}  // namespace sentinel
