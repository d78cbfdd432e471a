#pragma once

#include <array>
#include <cstddef>
#include <optional>
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

// Ledger of threat reports plus the indices derived from it. Every public mutation is
// atomic: it either commits the record, all counters and all index lists together and then
// journals the event, or it returns an error having changed nothing.
class ThreatRegistry {
public:
  ThreatRegistry(Principal owner, EventJournal& journal, RegistryLimits limits = {},
                 UnixClock clock = {});

  Result register_threat(const Principal& caller, const ThreatDraft& draft, ThreatId& out_id);
  Result update_status(const Principal& caller, ThreatId id, ThreatStatus new_status);
  Result verify_threat(const Principal& caller, ThreatId id, bool is_legitimate);

  Result grant_role(const Principal& caller, Role role, const Principal& principal);
  Result revoke_role(const Principal& caller, Role role, const Principal& principal);
  Result transfer_ownership(const Principal& caller, const Principal& new_owner);

  Result get(ThreatId id, Threat& out) const;
  Result list_active(std::size_t offset, std::size_t limit, std::vector<ThreatId>& out_ids) const;
  Result list_by_type(ThreatType type, std::size_t offset, std::size_t limit,
                      std::vector<ThreatId>& out_ids) const;
  Result list_by_severity(int min_severity, std::size_t offset, std::size_t limit,
                          std::vector<ThreatId>& out_ids) const;
  [[nodiscard]] std::optional<ThreatId> find_by_data_hash(const DataHash& hash) const;

  [[nodiscard]] ThreatStats stats() const;
  [[nodiscard]] ThreatBreakdown breakdown() const;
  [[nodiscard]] std::size_t total() const;
  [[nodiscard]] std::size_t status_count(ThreatStatus status) const;
  [[nodiscard]] std::size_t type_count(ThreatType type) const;
  [[nodiscard]] std::vector<ThreatId> active_ids() const;

  [[nodiscard]] Principal owner() const;
  [[nodiscard]] bool has_role(const Principal& principal, Role role) const;
  [[nodiscard]] std::vector<std::string> role_members(Role role) const;

  // Recomputes every counter and index from the records. Fails with a description of the
  // first mismatch.
  [[nodiscard]] Result check_invariants() const;

private:
  Result validate_draft(const ThreatDraft& draft) const;
  Result find_locked(ThreatId id, std::size_t& out_index) const;
  void apply_status_locked(Threat& threat, ThreatStatus new_status);
  void journal_status_change(const Threat& threat, ThreatStatus old_status, const Principal& caller);
  Result reject(std::string_view operation, const Principal& caller, Result failure) const;
  std::int64_t now() const;

  EventJournal& journal_;
  RegistryLimits limits_;
  UnixClock clock_;
  Logger log_;

  mutable std::shared_mutex mutex_;
  AccessControl access_;
  std::vector<Threat> threats_;
  std::vector<ThreatId> active_ids_;
  std::unordered_map<ThreatId, std::size_t> active_positions_;
  std::unordered_map<std::string, ThreatId> first_by_data_hash_;
  std::array<std::size_t, kThreatStatusCount> status_counts_{};
  std::array<std::size_t, kThreatTypeCount> type_counts_{};
  std::array<std::size_t, kSeverityLevels> severity_counts_{};
  std::size_t verified_count_ = 0;
};

}  // namespace sentinel
