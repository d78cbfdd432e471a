#include <algorithm>
#include <array>
#include <atomic>
#include <cassert>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "core/access/access_control.hpp"
#include "core/api/command_script.hpp"
#include "core/api/core_api.hpp"
#include "core/config/config.hpp"
#include "core/registry/alert_registry.hpp"
#include "core/registry/threat_registry.hpp"
#include "core/storage/event_journal.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"
#include "core/util/logging.hpp"

namespace {

using sentinel::AlertChannel;
using sentinel::AlertId;
using sentinel::AlertStatus;
using sentinel::ErrorCode;
using sentinel::EventKind;
using sentinel::Principal;
using sentinel::Result;
using sentinel::Role;
using sentinel::ThreatId;
using sentinel::ThreatStatus;
using sentinel::ThreatType;

const Principal kOwner{"coast-guard-hq"};
const Principal kReporter{"buoy-station-7"};
const Principal kVerifier{"analyst-ana"};
const Principal kSender{"dispatch-1"};
const Principal kStranger{"stranger"};

constexpr std::int64_t kStartUnix = 1'700'000'000;

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "ocean-sentinel-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

void require_ok(const Result& result) {
  if (!result.ok) {
    std::cerr << "unexpected failure: " << result.message << '\n';
  }
  assert(result.ok);
}

void require_error(const Result& result, ErrorCode code) {
  assert(!result.ok);
  assert(result.code == code);
}

struct ManualClock {
  std::shared_ptr<std::int64_t> now = std::make_shared<std::int64_t>(kStartUnix);

  [[nodiscard]] sentinel::UnixClock fn() const {
    auto shared = now;
    return [shared] { return *shared; };
  }

  void advance(std::int64_t seconds) const { *now += seconds; }
};

// Two registries sharing a journal and a manual clock, with one principal per role.
struct Registries {
  explicit Registries(sentinel::RegistryLimits limits = {})
      : threats(kOwner, journal, limits, clock.fn()), alerts(kOwner, journal, limits, clock.fn()) {
    require_ok(threats.grant_role(kOwner, Role::Reporter, kReporter));
    require_ok(threats.grant_role(kOwner, Role::Verifier, kVerifier));
    require_ok(alerts.grant_role(kOwner, Role::Sender, kSender));
  }

  ManualClock clock;
  sentinel::EventJournal journal;
  sentinel::ThreatRegistry threats;
  sentinel::AlertRegistry alerts;
};

struct StateDigest {
  std::size_t threats = 0;
  std::size_t alerts = 0;
  std::size_t journal_events = 0;
  std::array<std::size_t, sentinel::kThreatStatusCount> threat_status{};
  std::array<std::size_t, sentinel::kAlertStatusCount> alert_status{};
  std::vector<ThreatId> active;
  std::size_t emergency = 0;
  std::size_t recent = 0;
  std::size_t verified = 0;
  int emergency_threshold = 0;
  std::string head;

  friend bool operator==(const StateDigest&, const StateDigest&) = default;
};

StateDigest digest(const Registries& reg) {
  return {
      .threats = reg.threats.total(),
      .alerts = reg.alerts.total(),
      .journal_events = reg.journal.size(),
      .threat_status = reg.threats.breakdown().by_status,
      .alert_status = reg.alerts.breakdown().by_status,
      .active = reg.threats.active_ids(),
      .emergency = reg.alerts.stats().emergency_count,
      .recent = reg.alerts.recent_size(),
      .verified = reg.threats.stats().verified,
      .emergency_threshold = reg.alerts.emergency_threshold(),
      .head = reg.journal.head_hash(),
  };
}

void require_invariants(const Registries& reg) {
  require_ok(reg.threats.check_invariants());
  require_ok(reg.alerts.check_invariants());
  assert(reg.journal.verify_chain());
}

sentinel::ThreatDraft hurricane_draft() {
  sentinel::ThreatDraft draft{
      .threat_type = ThreatType::Storm,
      .severity = 5,
      .confidence = 90,
      .location = {.latitude_e6 = 25'760'000, .longitude_e6 = -80'190'000},
      .description = "hurricane",
      .data_hash = {},
      .affected_population = 2'500'000,
  };
  draft.data_hash.fill(0xAB);
  return draft;
}

sentinel::ThreatDraft threat_draft(ThreatType type, int severity, const std::string& evidence) {
  return {
      .threat_type = type,
      .severity = severity,
      .confidence = 70,
      .location = {.latitude_e6 = 36'600'000, .longitude_e6 = -121'900'000},
      .description = "sensor report " + evidence,
      .data_hash = sentinel::util::evidence_fingerprint(evidence),
      .affected_population = 1'000,
  };
}

sentinel::AlertDraft alert_draft(ThreatId threat_id, int severity) {
  return {
      .threat_id = threat_id,
      .message = "evacuate",
      .severity = severity,
      .channels = {AlertChannel::Web, AlertChannel::Sms},
      .recipients = {"a@x.com"},
  };
}

std::vector<ThreatId> sorted(std::vector<ThreatId> ids) {
  std::ranges::sort(ids);
  return ids;
}

template <typename ListPage>
std::vector<std::uint64_t> collect_pages(ListPage list_page, std::size_t limit) {
  std::vector<std::uint64_t> all;
  std::size_t offset = 0;
  while (true) {
    std::vector<std::uint64_t> page;
    require_ok(list_page(offset, limit, page));
    if (page.empty()) {
      break;
    }
    assert(page.size() <= limit);
    all.insert(all.end(), page.begin(), page.end());
    offset += limit;
  }
  return all;
}

void test_end_to_end_hurricane_scenario() {
  Registries reg;
  auto sink = std::make_shared<sentinel::RecordingSink>();
  reg.journal.subscribe(sink);

  ThreatId threat_id = 0;
  require_ok(reg.threats.register_threat(kReporter, hurricane_draft(), threat_id));
  assert(threat_id == 1);

  sentinel::Threat threat;
  require_ok(reg.threats.get(threat_id, threat));
  assert(threat.status == ThreatStatus::Active);
  assert(threat.reporter == kReporter);
  assert(threat.created_unix == kStartUnix);
  assert(threat.affected_population == 2'500'000U);
  assert(!threat.verified);
  const auto threat_stats = reg.threats.stats();
  assert(threat_stats.total == 1);
  assert(threat_stats.active == 1);

  AlertId alert_id = 0;
  require_ok(reg.alerts.create_alert(kSender, alert_draft(threat_id, 5), alert_id));
  assert(alert_id == 1);
  sentinel::Alert alert;
  require_ok(reg.alerts.get(alert_id, alert));
  assert(alert.is_emergency);
  assert(alert.status == AlertStatus::Pending);
  assert((alert.channels == std::vector<AlertChannel>{AlertChannel::Web, AlertChannel::Sms}));

  std::vector<AlertId> emergency;
  require_ok(reg.alerts.list_emergency(0, 10, emergency));
  assert(emergency == std::vector<AlertId>{1});

  reg.clock.advance(42);
  require_ok(reg.alerts.update_status(kSender, alert_id, AlertStatus::Delivered));
  require_ok(reg.alerts.get(alert_id, alert));
  assert(alert.delivered_unix == kStartUnix + 42);
  const auto alert_stats = reg.alerts.stats();
  assert(alert_stats.successful == 1);
  assert(alert_stats.avg_delivery_seconds == 42);

  require_ok(reg.threats.update_status(kReporter, threat_id, ThreatStatus::FalsePositive));
  assert(reg.threats.active_ids().empty());
  assert(reg.threats.status_count(ThreatStatus::Active) == 0);
  assert(reg.threats.status_count(ThreatStatus::FalsePositive) == 1);
  assert(reg.alerts.alerts_for_threat(threat_id) == std::vector<AlertId>{1});

  const auto events = sink->events();
  const std::vector<EventKind> expected = {
      EventKind::ThreatRegistered,   EventKind::AlertCreated,   EventKind::EmergencyAlert,
      EventKind::AlertStatusUpdated, EventKind::AlertDelivered, EventKind::ThreatStatusUpdated,
  };
  assert(events.size() == expected.size());
  for (std::size_t i = 0; i < expected.size(); ++i) {
    assert(events[i].kind == expected[i]);
  }
  assert(events[1].record_id == 1);
  assert(events[1].related_id == threat_id);
  assert(sentinel::util::parse_canonical_map(events[4].payload).at("latency_seconds") == "42");

  require_invariants(reg);
}

void test_register_rejections_leave_state_unchanged() {
  Registries reg;
  ThreatId seeded = 0;
  require_ok(reg.threats.register_threat(kReporter, hurricane_draft(), seeded));
  const StateDigest before = digest(reg);

  struct Case {
    sentinel::ThreatDraft draft;
    ErrorCode expected;
  };
  std::vector<Case> cases;
  auto with = [](auto mutate) {
    sentinel::ThreatDraft draft = hurricane_draft();
    mutate(draft);
    return draft;
  };
  cases.push_back({with([](auto& d) { d.severity = 0; }), ErrorCode::InvalidSeverity});
  cases.push_back({with([](auto& d) { d.severity = 6; }), ErrorCode::InvalidSeverity});
  cases.push_back({with([](auto& d) { d.confidence = -1; }), ErrorCode::InvalidConfidence});
  cases.push_back({with([](auto& d) { d.confidence = 101; }), ErrorCode::InvalidConfidence});
  cases.push_back({with([](auto& d) { d.description.clear(); }), ErrorCode::EmptyDescription});
  cases.push_back({with([](auto& d) { d.data_hash = {}; }), ErrorCode::EmptyDataHash});
  cases.push_back({with([](auto& d) { d.location.latitude_e6 = 90'000'001; }), ErrorCode::InvalidLocation});
  cases.push_back({with([](auto& d) { d.location.longitude_e6 = -180'000'001; }), ErrorCode::InvalidLocation});
  cases.push_back({with([](auto& d) { d.threat_type = static_cast<ThreatType>(17); }), ErrorCode::InvalidInput});
  // Severity is checked before confidence.
  cases.push_back({with([](auto& d) {
                     d.severity = 9;
                     d.confidence = 500;
                   }),
                   ErrorCode::InvalidSeverity});

  for (const auto& item : cases) {
    ThreatId out_id = 77;
    const Result result = reg.threats.register_threat(kReporter, item.draft, out_id);
    require_error(result, item.expected);
    assert(sentinel::is_invalid_input(result.code));
    assert(out_id == 77);
    assert(digest(reg) == before);
  }

  ThreatId out_id = 77;
  require_error(reg.threats.register_threat(kSender, hurricane_draft(), out_id), ErrorCode::Unauthorized);
  require_error(reg.threats.register_threat(kStranger, hurricane_draft(), out_id), ErrorCode::Unauthorized);
  require_error(reg.threats.register_threat(Principal{}, hurricane_draft(), out_id), ErrorCode::Unauthorized);
  assert(!sentinel::is_invalid_input(ErrorCode::Unauthorized));
  assert(out_id == 77);
  assert(digest(reg) == before);

  sentinel::ThreatDraft edge = hurricane_draft();
  edge.severity = 1;
  edge.confidence = 0;
  edge.location = {.latitude_e6 = -90'000'000, .longitude_e6 = 180'000'000};
  require_ok(reg.threats.register_threat(kOwner, edge, out_id));
  assert(out_id == 2);
  require_invariants(reg);
}

void test_status_updates_and_noop_rejection() {
  Registries reg;
  for (int i = 0; i < 3; ++i) {
    ThreatId id = 0;
    require_ok(reg.threats.register_threat(kReporter, threat_draft(ThreatType::Erosion, 3, "cliff-" + std::to_string(i)), id));
  }
  assert(sorted(reg.threats.active_ids()) == (std::vector<ThreatId>{1, 2, 3}));

  require_ok(reg.threats.update_status(kReporter, 2, ThreatStatus::Investigating));
  assert(sorted(reg.threats.active_ids()) == (std::vector<ThreatId>{1, 3}));
  require_invariants(reg);

  const StateDigest before = digest(reg);
  require_error(reg.threats.update_status(kReporter, 2, ThreatStatus::Investigating), ErrorCode::NoOpRejected);
  require_error(reg.threats.update_status(kReporter, 1, ThreatStatus::Active), ErrorCode::NoOpRejected);
  require_error(reg.threats.update_status(kReporter, 0, ThreatStatus::Resolved), ErrorCode::NotFound);
  require_error(reg.threats.update_status(kReporter, 4, ThreatStatus::Resolved), ErrorCode::NotFound);
  require_error(reg.threats.update_status(kVerifier, 1, ThreatStatus::Resolved), ErrorCode::Unauthorized);
  require_error(reg.threats.update_status(kReporter, 1, static_cast<ThreatStatus>(9)), ErrorCode::InvalidInput);
  assert(digest(reg) == before);

  // Any status may move to any other, including back to Active.
  require_ok(reg.threats.update_status(kReporter, 2, ThreatStatus::Resolved));
  require_invariants(reg);
  require_ok(reg.threats.update_status(kOwner, 2, ThreatStatus::Active));
  assert(sorted(reg.threats.active_ids()) == (std::vector<ThreatId>{1, 2, 3}));
  require_ok(reg.threats.update_status(kReporter, 1, ThreatStatus::Resolved));
  require_ok(reg.threats.update_status(kReporter, 3, ThreatStatus::FalsePositive));
  assert(reg.threats.active_ids() == std::vector<ThreatId>{2});

  const auto stats = reg.threats.stats();
  assert(stats.total == 3);
  assert(stats.active == 1);
  assert(stats.resolved == 1);
  assert(reg.threats.status_count(ThreatStatus::FalsePositive) == 1);
  assert(reg.threats.status_count(ThreatStatus::Investigating) == 0);
  require_invariants(reg);
}

void test_single_verification() {
  Registries reg;
  auto sink = std::make_shared<sentinel::RecordingSink>();
  reg.journal.subscribe(sink);
  for (int i = 0; i < 3; ++i) {
    ThreatId id = 0;
    require_ok(reg.threats.register_threat(kReporter, threat_draft(ThreatType::AlgalBloom, 4, "bloom-" + std::to_string(i)), id));
  }

  reg.clock.advance(10);
  require_ok(reg.threats.verify_threat(kVerifier, 1, true));
  sentinel::Threat first;
  require_ok(reg.threats.get(1, first));
  assert(first.verified);
  assert(first.verifier == kVerifier);
  assert(first.verified_unix == kStartUnix + 10);
  assert(first.status == ThreatStatus::Active);

  const Principal second_verifier{"analyst-bo"};
  require_ok(reg.threats.grant_role(kOwner, Role::Verifier, second_verifier));
  reg.clock.advance(5);
  const StateDigest before = digest(reg);
  require_error(reg.threats.verify_threat(second_verifier, 1, false), ErrorCode::AlreadyVerified);
  assert(digest(reg) == before);
  sentinel::Threat again;
  require_ok(reg.threats.get(1, again));
  assert(again.verifier == kVerifier);
  assert(again.verified_unix == kStartUnix + 10);
  assert(again.status == ThreatStatus::Active);

  require_error(reg.threats.verify_threat(kReporter, 2, true), ErrorCode::Unauthorized);
  require_error(reg.threats.verify_threat(kVerifier, 99, true), ErrorCode::NotFound);

  // An illegitimate Active threat is demoted before the verification is recorded.
  require_ok(reg.threats.verify_threat(kVerifier, 2, false));
  sentinel::Threat demoted;
  require_ok(reg.threats.get(2, demoted));
  assert(demoted.status == ThreatStatus::FalsePositive);
  assert(demoted.verified);
  const auto events = sink->events();
  assert(events.size() >= 2);
  assert(events[events.size() - 2].kind == EventKind::ThreatStatusUpdated);
  assert(events[events.size() - 2].record_id == 2);
  assert(events.back().kind == EventKind::ThreatVerified);
  assert(events.back().record_id == 2);

  // Under investigation, an illegitimate verdict leaves the status alone.
  require_ok(reg.threats.update_status(kReporter, 3, ThreatStatus::Investigating));
  const std::size_t status_events = sink->count(EventKind::ThreatStatusUpdated);
  require_ok(reg.threats.verify_threat(kVerifier, 3, false));
  sentinel::Threat investigating;
  require_ok(reg.threats.get(3, investigating));
  assert(investigating.status == ThreatStatus::Investigating);
  assert(investigating.verified);
  assert(sink->count(EventKind::ThreatStatusUpdated) == status_events);

  assert(reg.threats.stats().verified == 3);
  assert(reg.threats.active_ids() == std::vector<ThreatId>{1});
  require_invariants(reg);
}

void test_emergency_classification() {
  Registries reg;
  auto sink = std::make_shared<sentinel::RecordingSink>();
  reg.journal.subscribe(sink);
  assert(reg.alerts.emergency_threshold() == sentinel::kDefaultEmergencyThreshold);

  AlertId critical = 0;
  AlertId moderate = 0;
  require_ok(reg.alerts.create_alert(kSender, alert_draft(1, 4), critical));
  require_ok(reg.alerts.create_alert(kSender, alert_draft(1, 3), moderate));
  sentinel::Alert alert;
  require_ok(reg.alerts.get(critical, alert));
  assert(alert.is_emergency);
  require_ok(reg.alerts.get(moderate, alert));
  assert(!alert.is_emergency);
  assert(sink->count(EventKind::EmergencyAlert) == 1);

  require_ok(reg.alerts.set_emergency_threshold(kOwner, 5));
  assert(reg.alerts.emergency_threshold() == 5);
  require_ok(reg.alerts.get(critical, alert));
  assert(alert.is_emergency);

  AlertId after_raise = 0;
  AlertId top = 0;
  require_ok(reg.alerts.create_alert(kSender, alert_draft(2, 4), after_raise));
  require_ok(reg.alerts.create_alert(kSender, alert_draft(2, 5), top));
  require_ok(reg.alerts.get(after_raise, alert));
  assert(!alert.is_emergency);

  std::vector<AlertId> emergency;
  require_ok(reg.alerts.list_emergency(0, 10, emergency));
  assert((emergency == std::vector<AlertId>{top, critical}));
  assert(reg.alerts.stats().emergency_count == 2);

  const StateDigest before = digest(reg);
  require_error(reg.alerts.set_emergency_threshold(kOwner, 5), ErrorCode::NoOpRejected);
  require_error(reg.alerts.set_emergency_threshold(kOwner, 0), ErrorCode::InvalidSeverity);
  require_error(reg.alerts.set_emergency_threshold(kOwner, 6), ErrorCode::InvalidSeverity);
  require_error(reg.alerts.set_emergency_threshold(kSender, 3), ErrorCode::Unauthorized);
  assert(digest(reg) == before);
  assert(sink->count(EventKind::EmergencyThresholdUpdated) == 1);
  require_invariants(reg);
}

void test_recent_window_is_bounded() {
  Registries reg;
  for (int i = 0; i < 1050; ++i) {
    AlertId id = 0;
    require_ok(reg.alerts.create_alert(kSender, alert_draft(static_cast<ThreatId>((i % 7) + 1), 2), id));
  }
  assert(reg.alerts.total() == 1050);
  assert(reg.alerts.recent_size() == 1000);

  const auto recent = collect_pages(
      [&reg](std::size_t offset, std::size_t limit, std::vector<AlertId>& out) {
        return reg.alerts.list_recent(offset, limit, out);
      },
      100);
  assert(recent.size() == 1000);
  assert(recent.front() == 1050);
  assert(recent.back() == 51);
  assert(std::ranges::all_of(recent, [](AlertId id) { return id > 50; }));
  assert(std::ranges::is_sorted(recent, std::ranges::greater{}));

  std::vector<AlertId> page{99};
  require_ok(reg.alerts.list_recent(1000, 10, page));
  assert(page.empty());
  require_error(reg.alerts.list_recent(0, 0, page), ErrorCode::InvalidInput);
  require_error(reg.alerts.list_recent(0, 101, page), ErrorCode::InvalidInput);
  require_invariants(reg);

  Registries small({.recent_window_capacity = 5});
  for (int i = 0; i < 12; ++i) {
    AlertId id = 0;
    require_ok(small.alerts.create_alert(kSender, alert_draft(1, 1), id));
    require_invariants(small);
  }
  require_ok(small.alerts.list_recent(0, 10, page));
  assert((page == std::vector<AlertId>{12, 11, 10, 9, 8}));
}

void test_pagination_reconstructs_sequences() {
  Registries reg;
  for (int i = 0; i < 23; ++i) {
    ThreatId id = 0;
    require_ok(reg.threats.register_threat(
        kReporter, threat_draft(static_cast<ThreatType>(i % 6), (i % 5) + 1, "page-" + std::to_string(i)), id));
  }
  for (const ThreatId id : {4U, 9U, 10U, 17U}) {
    require_ok(reg.threats.update_status(kReporter, id, ThreatStatus::Resolved));
  }

  std::vector<ThreatId> expected_storm;
  std::vector<ThreatId> expected_severe;
  for (ThreatId id = 1; id <= 23; ++id) {
    sentinel::Threat threat;
    require_ok(reg.threats.get(id, threat));
    if (threat.threat_type == ThreatType::Storm) {
      expected_storm.push_back(id);
    }
    if (threat.severity >= 3) {
      expected_severe.push_back(id);
    }
  }
  assert((expected_storm == std::vector<ThreatId>{1, 7, 13, 19}));
  const auto expected_active = reg.threats.active_ids();
  assert(expected_active.size() == 19);

  for (std::size_t limit = 1; limit <= 7; ++limit) {
    const auto storm = collect_pages(
        [&reg](std::size_t offset, std::size_t page_limit, std::vector<ThreatId>& out) {
          return reg.threats.list_by_type(ThreatType::Storm, offset, page_limit, out);
        },
        limit);
    assert(storm == expected_storm);

    const auto severe = collect_pages(
        [&reg](std::size_t offset, std::size_t page_limit, std::vector<ThreatId>& out) {
          return reg.threats.list_by_severity(3, offset, page_limit, out);
        },
        limit);
    assert(severe == expected_severe);

    const auto active = collect_pages(
        [&reg](std::size_t offset, std::size_t page_limit, std::vector<ThreatId>& out) {
          return reg.threats.list_active(offset, page_limit, out);
        },
        limit);
    assert(active == expected_active);
  }

  std::vector<ThreatId> page;
  require_ok(reg.threats.list_by_type(ThreatType::Storm, 100, 5, page));
  assert(page.empty());
  require_error(reg.threats.list_by_severity(0, 0, 5, page), ErrorCode::InvalidSeverity);
  require_error(reg.threats.list_by_severity(6, 0, 5, page), ErrorCode::InvalidSeverity);
  require_error(reg.threats.list_active(0, 0, page), ErrorCode::InvalidInput);

  for (int i = 0; i < 9; ++i) {
    AlertId id = 0;
    require_ok(reg.alerts.create_alert(kSender, alert_draft(1, (i % 2) == 0 ? 5 : 2), id));
  }
  for (const AlertId id : {2U, 5U, 8U}) {
    require_ok(reg.alerts.update_status(kSender, id, AlertStatus::Delivered));
  }
  for (std::size_t limit = 1; limit <= 4; ++limit) {
    const auto delivered = collect_pages(
        [&reg](std::size_t offset, std::size_t page_limit, std::vector<AlertId>& out) {
          return reg.alerts.list_by_status(AlertStatus::Delivered, offset, page_limit, out);
        },
        limit);
    assert((delivered == std::vector<AlertId>{8, 5, 2}));

    const auto pending = collect_pages(
        [&reg](std::size_t offset, std::size_t page_limit, std::vector<AlertId>& out) {
          return reg.alerts.list_by_status(AlertStatus::Pending, offset, page_limit, out);
        },
        limit);
    assert((pending == std::vector<AlertId>{9, 7, 6, 4, 3, 1}));

    const auto emergency = collect_pages(
        [&reg](std::size_t offset, std::size_t page_limit, std::vector<AlertId>& out) {
          return reg.alerts.list_emergency(offset, page_limit, out);
        },
        limit);
    assert((emergency == std::vector<AlertId>{9, 7, 5, 3, 1}));
  }
  require_invariants(reg);
}

void test_access_control_rules() {
  sentinel::AccessControl access(kOwner, {Role::Reporter, Role::Verifier});
  assert(access.is_owner(kOwner));
  assert(access.has_role(kOwner, Role::Reporter));
  assert(access.manages(Role::Verifier));
  assert(!access.manages(Role::Sender));
  assert(access.members(Role::Reporter) == std::vector<std::string>{kOwner.value});
  assert(!access.has_role(Principal{}, Role::Reporter));

  require_ok(access.grant(kOwner, Role::Reporter, kReporter));
  require_error(access.grant(kOwner, Role::Reporter, kReporter), ErrorCode::NoOpRejected);
  require_error(access.grant(kReporter, Role::Reporter, kStranger), ErrorCode::Unauthorized);
  require_error(access.grant(kOwner, Role::Sender, kStranger), ErrorCode::InvalidInput);
  require_error(access.grant(kOwner, Role::Reporter, Principal{}), ErrorCode::InvalidInput);
  require_ok(access.authorize(kReporter, Role::Reporter, "register_threat"));
  require_error(access.authorize(kReporter, Role::Verifier, "verify_threat"), ErrorCode::Unauthorized);

  require_error(access.revoke(kOwner, Role::Reporter, kOwner), ErrorCode::InvalidInput);
  require_ok(access.revoke(kOwner, Role::Reporter, kReporter));
  require_error(access.revoke(kOwner, Role::Reporter, kReporter), ErrorCode::NoOpRejected);
  assert(!access.has_role(kReporter, Role::Reporter));

  const Principal harbor{"harbor-master"};
  require_error(access.transfer_ownership(kReporter, harbor), ErrorCode::Unauthorized);
  require_error(access.transfer_ownership(kOwner, kOwner), ErrorCode::InvalidInput);
  require_error(access.transfer_ownership(kOwner, Principal{}), ErrorCode::InvalidInput);
  require_ok(access.transfer_ownership(kOwner, harbor));
  assert(access.is_owner(harbor));
  assert(!access.is_owner(kOwner));
  assert(access.has_role(kOwner, Role::Verifier));
  require_error(access.authorize_owner(kOwner, "grant_role"), ErrorCode::Unauthorized);
  assert((access.members(Role::Verifier) == std::vector<std::string>{kOwner.value, harbor.value}));

  Registries reg;
  const StateDigest before = digest(reg);
  require_error(reg.alerts.grant_role(kOwner, Role::Sender, kSender), ErrorCode::NoOpRejected);
  require_error(reg.threats.grant_role(kOwner, Role::Sender, kSender), ErrorCode::InvalidInput);
  require_error(reg.alerts.grant_role(kSender, Role::Sender, kStranger), ErrorCode::Unauthorized);
  assert(digest(reg) == before);

  require_ok(reg.alerts.transfer_ownership(kOwner, harbor));
  assert(reg.alerts.owner() == harbor);
  assert(reg.threats.owner() == kOwner);
  require_error(reg.alerts.set_emergency_threshold(kOwner, 3), ErrorCode::Unauthorized);
  require_ok(reg.alerts.set_emergency_threshold(harbor, 3));
  assert(reg.alerts.has_role(kOwner, Role::Sender));
  require_ok(reg.alerts.revoke_role(harbor, Role::Sender, kOwner));
  assert(!reg.alerts.has_role(kOwner, Role::Sender));

  const auto access_events = reg.journal.events_for_record(sentinel::RecordFamily::Access, 0);
  const auto transfers = std::ranges::count_if(
      access_events, [](const sentinel::LedgerEvent& event) { return event.kind == EventKind::OwnershipTransferred; });
  assert(transfers == 1);
  const auto last = sentinel::util::parse_canonical_map(access_events.back().payload);
  assert(last.at("registry") == "alerts");
  assert(last.at("principal") == kOwner.value);
  require_invariants(reg);
}

void test_event_journal_chain() {
  sentinel::EventJournal journal;
  auto sink = std::make_shared<sentinel::RecordingSink>();
  journal.subscribe(sink);
  journal.subscribe(nullptr);
  assert(journal.head_hash() == sentinel::util::kZeroHashHex);
  assert(journal.verify_chain());

  journal.append(EventKind::ThreatRegistered, 1, 0, 100, "buoy", {{"severity", "5"}});
  journal.append(EventKind::AlertCreated, 1, 1, 101, "dispatch", {{"channels", "web,sms"}});
  journal.append(EventKind::ThreatStatusUpdated, 1, 0, 102, "buoy",
                 {{"old_status", "active"}, {"new_status", "resolved"}});
  const sentinel::LedgerEvent last = journal.append(EventKind::AlertCreated, 2, 1, 103, "dispatch", {});

  const auto events = journal.events();
  assert(events.size() == 4);
  assert(events.front().prev_hash == sentinel::util::kZeroHashHex);
  for (std::size_t i = 0; i < events.size(); ++i) {
    assert(events[i].sequence == i + 1);
    assert(events[i].event_hash == sentinel::compute_event_hash(events[i]));
    if (i > 0) {
      assert(events[i].prev_hash == events[i - 1].event_hash);
    }
  }
  assert(last.event_hash == journal.head_hash());
  assert(events[2].payload == "new_status=resolved\nold_status=active\n");
  assert(journal.verify_chain());

  assert(journal.events_for_record(sentinel::RecordFamily::Threat, 1).size() == 2);
  assert(journal.events_for_record(sentinel::RecordFamily::Alert, 1).size() == 1);
  assert(journal.events_for_record(sentinel::RecordFamily::Alert, 3).empty());
  assert(sink->events().size() == 4);
  assert(sink->count(EventKind::AlertCreated) == 2);

  auto tampered = events;
  tampered[1].payload = "channels=web\n";
  assert(!sentinel::verify_event_chain(tampered));

  auto rehashed = events;
  rehashed[1].actor = "impostor";
  rehashed[1].event_hash = sentinel::compute_event_hash(rehashed[1]);
  assert(!sentinel::verify_event_chain(rehashed));

  auto reordered = events;
  std::swap(reordered[1], reordered[2]);
  assert(!sentinel::verify_event_chain(reordered));

  auto truncated = events;
  truncated.erase(truncated.begin());
  assert(!sentinel::verify_event_chain(truncated));

  sink->clear();
  assert(sink->events().empty());
}

void test_evidence_fingerprints_and_lookup() {
  assert(sentinel::util::sha256_hex("abc") ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  const sentinel::DataHash frame = sentinel::util::evidence_fingerprint("satellite-frame-0042");
  const std::string frame_hex = sentinel::util::data_hash_hex(frame);
  assert(frame_hex == sentinel::util::sha256_hex("satellite-frame-0042"));
  assert(!sentinel::util::is_zero_hash(frame));
  assert(sentinel::util::is_zero_hash(sentinel::DataHash{}));

  sentinel::DataHash parsed{};
  assert(sentinel::util::parse_data_hash("0x" + frame_hex, parsed));
  assert(parsed == frame);
  std::string upper = frame_hex;
  std::ranges::transform(upper, upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  parsed = {};
  assert(sentinel::util::parse_data_hash(upper, parsed));
  assert(parsed == frame);

  sentinel::DataHash untouched{};
  assert(!sentinel::util::parse_data_hash("abc", untouched));
  assert(!sentinel::util::parse_data_hash(frame_hex.substr(0, 63) + "g", untouched));
  assert(sentinel::util::is_zero_hash(untouched));

  Registries reg;
  sentinel::ThreatDraft draft = threat_draft(ThreatType::IllegalDumping, 3, "satellite-frame-0042");
  ThreatId first = 0;
  ThreatId second = 0;
  require_ok(reg.threats.register_threat(kReporter, draft, first));
  require_ok(reg.threats.register_threat(kReporter, draft, second));
  assert(reg.threats.find_by_data_hash(frame) == std::optional<ThreatId>{first});
  assert(!reg.threats.find_by_data_hash(sentinel::util::evidence_fingerprint("other")).has_value());

  const auto trail = reg.journal.events_for_record(sentinel::RecordFamily::Threat, second);
  assert(trail.size() == 1);
  assert(sentinel::util::parse_canonical_map(trail.front().payload).at("data_hash") == frame_hex);
  require_invariants(reg);
}

void test_breakdowns() {
  Registries empty;
  assert(empty.threats.breakdown().average_severity == 0.0);
  assert(empty.alerts.breakdown().success_rate_percent == 0.0);

  Registries reg;
  ThreatId id = 0;
  require_ok(reg.threats.register_threat(kReporter, threat_draft(ThreatType::Storm, 1, "b-1"), id));
  require_ok(reg.threats.register_threat(kReporter, threat_draft(ThreatType::Pollution, 4, "b-2"), id));
  require_ok(reg.threats.register_threat(kReporter, threat_draft(ThreatType::Pollution, 5, "b-3"), id));
  require_ok(reg.threats.verify_threat(kVerifier, 2, true));

  const auto threats = reg.threats.breakdown();
  assert(threats.by_type[static_cast<std::size_t>(ThreatType::Storm)] == 1);
  assert(threats.by_type[static_cast<std::size_t>(ThreatType::Pollution)] == 2);
  assert(threats.by_type[static_cast<std::size_t>(ThreatType::Anomaly)] == 0);
  assert((threats.by_severity == std::array<std::size_t, sentinel::kSeverityLevels>{1, 0, 0, 1, 1}));
  assert(threats.by_status[static_cast<std::size_t>(ThreatStatus::Active)] == 3);
  assert(threats.critical == 2);
  assert(threats.verified == 1);
  assert(threats.average_severity == 10.0 / 3.0);
  assert(reg.threats.type_count(ThreatType::Pollution) == 2);

  AlertId alert_id = 0;
  require_ok(reg.alerts.create_alert(kSender,
                                     {.threat_id = 1,
                                      .message = "storm surge",
                                      .severity = 3,
                                      .channels = {AlertChannel::Web, AlertChannel::Sms, AlertChannel::Web},
                                      .recipients = {"a@x.com", "b@x.com"}},
                                     alert_id));
  require_ok(reg.alerts.create_alert(
      kSender, {.threat_id = 2, .message = "oil slick", .severity = 4, .channels = {AlertChannel::Push}, .recipients = {"b@x.com", "c@x.com"}},
      alert_id));
  require_ok(reg.alerts.create_alert(
      kSender, {.threat_id = 3, .message = "closure", .severity = 5, .channels = {AlertChannel::Email}, .recipients = {"d@x.com"}},
      alert_id));
  require_ok(reg.alerts.create_alert(
      kSender, {.threat_id = 3, .message = "update", .severity = 1, .channels = {AlertChannel::Email}, .recipients = {"e@x.com"}},
      alert_id));
  require_ok(reg.alerts.update_status(kSender, 1, AlertStatus::Delivered));
  require_ok(reg.alerts.update_status(kSender, 2, AlertStatus::Delivered));
  require_ok(reg.alerts.update_status(kSender, 3, AlertStatus::Failed, "bounced"));

  sentinel::Alert alert;
  require_ok(reg.alerts.get(1, alert));
  assert((alert.channels == std::vector<AlertChannel>{AlertChannel::Web, AlertChannel::Sms}));
  require_ok(reg.alerts.get(3, alert));
  assert(alert.failure_reason == "bounced");

  const auto alerts = reg.alerts.breakdown();
  assert((alerts.by_channel == std::array<std::size_t, sentinel::kAlertChannelCount>{1, 2, 1, 1}));
  assert((alerts.by_status == std::array<std::size_t, sentinel::kAlertStatusCount>{1, 0, 2, 1}));
  assert((alerts.by_severity == std::array<std::size_t, sentinel::kSeverityLevels>{1, 0, 1, 1, 1}));
  assert(alerts.success_rate_percent == 50.0);
  assert(alerts.recipients_reached == 3);

  const auto stats = reg.alerts.stats();
  assert(stats.total == 4);
  assert(stats.successful == 2);
  assert(stats.failed == 1);
  assert(stats.emergency_count == 2);
  require_invariants(reg);
}

void test_alert_validation_and_lifecycle() {
  Registries reg({.max_message_length = 10, .max_recipients = 2});
  const StateDigest before = digest(reg);

  auto draft_with = [](auto mutate) {
    sentinel::AlertDraft draft = alert_draft(1, 3);
    mutate(draft);
    return draft;
  };
  AlertId out_id = 55;
  require_error(reg.alerts.create_alert(kSender, draft_with([](auto& d) { d.message.clear(); }), out_id),
                ErrorCode::InvalidInput);
  require_error(reg.alerts.create_alert(kSender, draft_with([](auto& d) { d.message = "12345678901"; }), out_id),
                ErrorCode::InvalidInput);
  require_error(reg.alerts.create_alert(kSender, draft_with([](auto& d) { d.severity = 0; }), out_id),
                ErrorCode::InvalidSeverity);
  require_error(reg.alerts.create_alert(kSender, draft_with([](auto& d) { d.channels.clear(); }), out_id),
                ErrorCode::InvalidInput);
  require_error(reg.alerts.create_alert(
                    kSender, draft_with([](auto& d) { d.channels = {static_cast<AlertChannel>(9)}; }), out_id),
                ErrorCode::InvalidInput);
  require_error(reg.alerts.create_alert(kSender, draft_with([](auto& d) { d.recipients.clear(); }), out_id),
                ErrorCode::InvalidInput);
  require_error(reg.alerts.create_alert(
                    kSender, draft_with([](auto& d) { d.recipients = {"a@x.com", "b@x.com", "c@x.com"}; }), out_id),
                ErrorCode::InvalidInput);
  require_error(reg.alerts.create_alert(kReporter, alert_draft(1, 3), out_id), ErrorCode::Unauthorized);
  assert(out_id == 55);
  assert(digest(reg) == before);

  // Threat ids are not checked against the threat registry.
  require_ok(reg.alerts.create_alert(kSender, draft_with([](auto& d) {
                                       d.threat_id = 999;
                                       d.message = "1234567890";
                                     }),
                                     out_id));
  assert(out_id == 1);
  assert(reg.alerts.alerts_for_threat(999) == std::vector<AlertId>{1});
  assert(reg.alerts.alerts_for_threat(1).empty());

  require_ok(reg.alerts.update_status(kSender, 1, AlertStatus::Sent));
  const StateDigest sent = digest(reg);
  require_error(reg.alerts.update_status(kSender, 1, AlertStatus::Sent), ErrorCode::NoOpRejected);
  require_error(reg.alerts.update_status(kSender, 0, AlertStatus::Delivered), ErrorCode::NotFound);
  require_error(reg.alerts.update_status(kSender, 2, AlertStatus::Delivered), ErrorCode::NotFound);
  require_error(reg.alerts.update_status(kReporter, 1, AlertStatus::Delivered), ErrorCode::Unauthorized);
  require_error(reg.alerts.update_status(kSender, 1, static_cast<AlertStatus>(7)), ErrorCode::InvalidInput);
  assert(digest(reg) == sent);

  require_ok(reg.alerts.update_status(kSender, 1, AlertStatus::Failed, "carrier timeout"));
  sentinel::Alert alert;
  require_ok(reg.alerts.get(1, alert));
  assert(alert.failure_reason == "carrier timeout");
  assert(alert.delivered_unix == 0);
  reg.clock.advance(7);
  require_ok(reg.alerts.update_status(kSender, 1, AlertStatus::Delivered));
  require_ok(reg.alerts.get(1, alert));
  assert(alert.delivered_unix == kStartUnix + 7);
  require_invariants(reg);

  Registries timing;
  AlertId first = 0;
  AlertId second = 0;
  require_ok(timing.alerts.create_alert(kSender, alert_draft(1, 2), first));
  timing.clock.advance(10);
  require_ok(timing.alerts.update_status(kSender, first, AlertStatus::Delivered));
  require_ok(timing.alerts.create_alert(kSender, alert_draft(1, 2), second));
  timing.clock.advance(15);
  require_ok(timing.alerts.update_status(kSender, second, AlertStatus::Delivered));
  assert(timing.alerts.stats().avg_delivery_seconds == 12);

  // The message bound counts code points, not bytes.
  Registries accented({.max_message_length = 3});
  AlertId accented_id = 0;
  require_ok(accented.alerts.create_alert(kSender, draft_with([](auto& d) { d.message = "\u00e9\u00e9\u20ac"; }),
                                          accented_id));
  require_error(accented.alerts.create_alert(kSender, draft_with([](auto& d) { d.message = "\u00e9\u00e9\u20aca"; }),
                                             accented_id),
                ErrorCode::InvalidInput);
  assert(accented_id == 1);
  assert(sentinel::util::utf8_length("\u00e9\u00e9\u20ac") == 3);
}

void test_config_parsing() {
  const std::string text =
      "# ocean sentinel registry\n"
      "owner = coast-guard-hq\n"
      "reporters = buoy-station-7, buoy-station-9,\n"
      "verifiers=analyst-ana\n"
      "\n"
      "senders=dispatch-1\n"
      "emergency_threshold=5\n"
      "recent_window=250\n"
      "max_page_size=50\n"
      "log_level=warn\n"
      "log_json=false\n"
      "log_file=none\n"
      "unknown_key=ignored\n";

  sentinel::SentinelConfig config;
  require_ok(sentinel::parse_config_text(text, config));
  assert(config.owner == kOwner);
  assert((config.reporters == std::vector<std::string>{"buoy-station-7", "buoy-station-9"}));
  assert(config.verifiers == std::vector<std::string>{"analyst-ana"});
  assert(config.senders == std::vector<std::string>{"dispatch-1"});
  assert(config.emergency_threshold == 5);
  assert(config.limits.recent_window_capacity == 250);
  assert(config.limits.max_page_size == 50);
  assert(config.limits.max_message_length == 1000);
  assert(config.logging.level == "warn");
  assert(!config.logging.json);
  assert(!config.logging.log_file.has_value());

  const std::vector<std::string> broken = {
      "reporters=a\n",
      "owner=x\nemergency_threshold=9\n",
      "owner=x\nrecent_window=0\n",
      "owner=x\nmax_recipients=lots\n",
      "owner=x\nlog_level=loud\n",
      "owner=x\nlog_json=maybe\n",
  };
  for (const auto& input : broken) {
    sentinel::SentinelConfig kept;
    kept.owner = Principal{"keep"};
    require_error(sentinel::parse_config_text(input, kept), ErrorCode::ConfigError);
    assert(kept.owner.value == "keep");
  }

  const auto dir = temp_dir("config");
  const auto path = dir / "sentinel.conf";
  {
    std::ofstream out(path);
    out << text;
  }
  sentinel::SentinelConfig loaded;
  require_ok(sentinel::load_config_file(path.string(), loaded));
  assert(loaded.owner == kOwner);
  require_error(sentinel::load_config_file((dir / "missing.conf").string(), loaded), ErrorCode::ConfigError);
}

void test_sentinel_core_facade() {
  ManualClock clock;
  sentinel::SentinelCore core(clock.fn());

  ThreatId threat_id = 0;
  require_error(core.register_threat(kReporter, hurricane_draft(), threat_id), ErrorCode::NotInitialized);
  std::vector<ThreatId> ids;
  require_error(core.list_active_threats(0, 10, ids), ErrorCode::NotInitialized);
  assert(!core.health().healthy);

  sentinel::SentinelConfig config;
  require_ok(sentinel::parse_config_text("owner=coast-guard-hq\n"
                                         "reporters=coast-guard-hq,buoy-station-7\n"
                                         "verifiers=analyst-ana\n"
                                         "senders=dispatch-1\n"
                                         "emergency_threshold=5\n"
                                         "log_level=error\n"
                                         "log_json=false\n",
                                         config));
  require_ok(core.init(config));
  assert(core.initialized());
  require_error(core.init(config), ErrorCode::ConfigError);
  assert(core.alerts()->emergency_threshold() == 5);
  assert(core.threats()->has_role(kReporter, Role::Reporter));
  assert(core.threats()->has_role(kVerifier, Role::Verifier));
  assert(core.alerts()->has_role(kSender, Role::Sender));

  require_ok(core.register_threat(kReporter, hurricane_draft(), threat_id));
  AlertId emergency = 0;
  AlertId routine = 0;
  require_ok(core.create_alert(kSender, alert_draft(threat_id, 5), emergency));
  require_ok(core.create_alert(kSender, alert_draft(threat_id, 4), routine));
  sentinel::Alert alert;
  require_ok(core.alert(emergency, alert));
  assert(alert.is_emergency);
  require_ok(core.alert(routine, alert));
  assert(!alert.is_emergency);
  assert((core.alerts_for_threat(threat_id) == std::vector<AlertId>{emergency, routine}));

  const Principal second_sender{"dispatch-2"};
  const Principal second_verifier{"analyst-bo"};
  require_ok(core.grant_role(kOwner, Role::Sender, second_sender));
  require_ok(core.grant_role(kOwner, Role::Verifier, second_verifier));
  assert(core.alerts()->has_role(second_sender, Role::Sender));
  assert(!core.threats()->has_role(second_sender, Role::Sender));
  assert(core.threats()->has_role(second_verifier, Role::Verifier));
  require_ok(core.revoke_role(kOwner, Role::Sender, second_sender));
  require_ok(core.verify_threat(second_verifier, threat_id, true));
  require_ok(core.update_threat_status(kReporter, threat_id, ThreatStatus::Investigating));

  const Principal harbor{"harbor-master"};
  require_error(core.transfer_ownership(kReporter, harbor), ErrorCode::Unauthorized);
  require_error(core.transfer_ownership(kOwner, kOwner), ErrorCode::InvalidInput);
  require_ok(core.transfer_ownership(kOwner, harbor));
  assert(core.threats()->owner() == harbor);
  assert(core.alerts()->owner() == harbor);
  require_error(core.set_emergency_threshold(kOwner, 3), ErrorCode::Unauthorized);
  require_ok(core.set_emergency_threshold(harbor, 3));

  const auto threat_trail = core.audit_trail(sentinel::RecordFamily::Threat, threat_id);
  assert(threat_trail.size() == 3);
  assert(threat_trail[0].kind == EventKind::ThreatRegistered);
  assert(threat_trail[1].kind == EventKind::ThreatVerified);
  assert(threat_trail[2].kind == EventKind::ThreatStatusUpdated);
  const auto alert_trail = core.audit_trail(sentinel::RecordFamily::Alert, emergency);
  assert(alert_trail.size() == 2);
  assert(alert_trail[1].kind == EventKind::EmergencyAlert);

  auto sink = std::make_shared<sentinel::RecordingSink>();
  core.subscribe(sink);
  clock.advance(30);
  require_ok(core.update_alert_status(kSender, emergency, AlertStatus::Delivered));
  assert(sink->count(EventKind::AlertDelivered) == 1);

  require_ok(core.list_recent_alerts(0, 10, ids));
  assert((ids == std::vector<AlertId>{routine, emergency}));
  require_ok(core.list_emergency_alerts(0, 10, ids));
  assert(ids == std::vector<AlertId>{emergency});
  require_ok(core.list_alerts_by_status(AlertStatus::Pending, 0, 10, ids));
  assert(ids == std::vector<AlertId>{routine});
  require_ok(core.list_threats_by_type(ThreatType::Storm, 0, 10, ids));
  assert(ids == std::vector<ThreatId>{threat_id});
  require_ok(core.list_threats_by_severity(5, 0, 10, ids));
  assert(ids == std::vector<ThreatId>{threat_id});
  require_ok(core.list_active_threats(0, 10, ids));
  assert(ids.empty());

  const sentinel::HealthReport report = core.health();
  assert(report.healthy);
  assert(report.threat_invariants_ok);
  assert(report.alert_invariants_ok);
  assert(report.journal_chain_valid);
  assert(report.journal_events == core.journal().size());
  assert(report.journal_head == core.journal().head_hash());
  assert(report.threats.total == 1);
  assert(report.threats.verified == 1);
  assert(report.alerts.total == 2);
  assert(report.alerts.successful == 1);
  assert(report.alerts.avg_delivery_seconds == 30);
  assert(report.emergency_threshold == 3);
  assert(report.threat_owner == harbor.value);
  assert(report.alert_owner == harbor.value);
}

sentinel::SentinelConfig quiet_config() {
  sentinel::SentinelConfig config;
  config.owner = kOwner;
  config.reporters = {kReporter.value};
  config.senders = {kSender.value};
  config.logging = {.level = "ERROR", .json = false};
  return config;
}

void test_rejected_init_journals_nothing() {
  const auto dir = temp_dir("init");
  std::vector<sentinel::SentinelConfig> rejected(4, quiet_config());
  rejected[0].emergency_threshold = 9;
  rejected[1].verifiers = {kVerifier.value, ""};
  rejected[2].limits.recent_window_capacity = 0;
  rejected[3].logging.log_file = (dir / "missing" / "sentinel.log").string();

  sentinel::SentinelCore core;
  for (const auto& config : rejected) {
    require_error(core.init(config), ErrorCode::ConfigError);
    assert(!core.initialized());
    assert(core.journal().size() == 0);
    assert(core.threats() == nullptr);
  }

  auto config = quiet_config();
  config.emergency_threshold = 3;
  require_ok(core.init(config));
  const auto events = core.journal().events();
  assert(events.size() == 3);
  assert(events.front().sequence == 1);
  assert(events.front().kind == EventKind::RoleGranted);
  assert(events.back().kind == EventKind::EmergencyThresholdUpdated);
  assert(core.alerts()->emergency_threshold() == 3);
}

void test_json_log_lines_escape_control_bytes() {
  const auto dir = temp_dir("logging");
  const auto path = dir / "sentinel.log";
  require_ok(sentinel::configure_logging({.level = "INFO", .json = true, .log_file = path.string()}));
  sentinel::get_logger("escape").info("line\rbreak", {{"caller", std::string{"a\001b"}}, {"tab", "x\ty"}});
  require_error(sentinel::configure_logging({.level = "INFO", .json = true,
                                             .log_file = (dir / "absent" / "x.log").string()}),
                ErrorCode::ConfigError);
  require_ok(sentinel::configure_logging({.level = "ERROR", .json = false}));

  std::ifstream in(path);
  std::string line;
  assert(std::getline(in, line));
  assert(line.find('\r') == std::string::npos);
  assert(line.find('\x01') == std::string::npos);
  assert(line.find(R"("message":"line\rbreak")") != std::string::npos);
  assert(line.find(R"("caller":"a\u0001b")") != std::string::npos);
  assert(line.find(R"("tab":"x\ty")") != std::string::npos);
  assert(!std::getline(in, line));
}

std::vector<std::string> script_lines(sentinel::SentinelCore& core, const std::string& script) {
  std::istringstream in(script);
  std::ostringstream out;
  sentinel::run_command_script(core, in, out);
  std::vector<std::string> lines;
  std::istringstream printed(out.str());
  for (std::string line; std::getline(printed, line);) {
    lines.push_back(line);
  }
  return lines;
}

void test_command_script_rejects_out_of_range_numbers() {
  sentinel::SentinelCore core;
  require_ok(core.init(quiet_config()));

  const std::string script =
      "# wide integers must not wrap into valid fields\n"
      "register|buoy-station-7|storm|4294967299|80|25760000|-80190000|surge|buoy raw|1000\n"
      "register|buoy-station-7|storm|3|4294967396|25760000|-80190000|surge|buoy raw|1000\n"
      "threshold|coast-guard-hq|4294967301\n"
      "\n"
      "register|buoy-station-7|storm|3|80|25760000|-80190000|surge|buoy raw|-5\n"
      "register|buoy-station-7|storm|3|80|25760000|-80190000|surge|buoy raw|1000\n"
      "alert|dispatch-1|1|4294967301|web|a@x.com|evacuate\n"
      "alert|dispatch-1|-1|4|web|a@x.com|evacuate\n"
      "alert|dispatch-1|1|4|web,sms|a@x.com,b@x.com|evacuate\n"
      "threat-status|buoy-station-7|-1|resolved\n"
      "list-emergency|-1|10\n"
      "list-emergency|0|10\n"
      "threshold|coast-guard-hq|5\n"
      "launch|now\n";
  const auto lines = script_lines(core, script);
  assert(lines.size() == 13);
  assert(lines[0].starts_with("2 register error InvalidSeverity"));
  assert(lines[1].starts_with("3 register error InvalidConfidence"));
  assert(lines[2].starts_with("4 threshold error InvalidSeverity"));
  assert(lines[3].starts_with("6 register error InvalidInput: usage: register|"));
  assert(lines[4] == "7 register ok threat_id=1");
  assert(lines[5].starts_with("8 alert error InvalidSeverity"));
  assert(lines[6].starts_with("9 alert error InvalidInput: usage: alert|"));
  assert(lines[7] == "10 alert ok alert_id=1 emergency=true");
  assert(lines[8].starts_with("11 threat-status error InvalidInput"));
  assert(lines[9].starts_with("12 list-emergency error InvalidInput"));
  assert(lines[10] == "13 list-emergency ok ids=1");
  assert(lines[11] == "14 threshold ok");
  assert(lines[12] == "15 launch error InvalidInput: Unknown command `launch`.");

  const sentinel::HealthReport report = core.health();
  assert(report.healthy);
  assert(report.threats.total == 1);
  assert(report.alerts.total == 1);
  assert(report.emergency_threshold == 5);
  sentinel::Threat threat;
  require_ok(core.threat(1, threat));
  assert(threat.severity == 3);
  assert(threat.confidence == 80);

  assert((sentinel::split_command_fields(" stats ") == std::vector<std::string>{"stats"}));
  assert((sentinel::split_command_fields("a| b |") == std::vector<std::string>{"a", "b", ""}));
}

void test_concurrent_readers_and_writers() {
  Registries reg;
  constexpr int kWriters = 4;
  constexpr int kPerWriter = 100;
  std::atomic<bool> writing{true};
  std::atomic<std::size_t> reads{0};

  std::vector<std::thread> readers;
  for (int r = 0; r < 2; ++r) {
    readers.emplace_back([&reg, &writing, &reads] {
      do {
        const auto stats = reg.threats.stats();
        assert(stats.active + stats.resolved <= stats.total);
        assert(reg.threats.check_invariants().ok);
        assert(reg.alerts.check_invariants().ok);
        std::vector<ThreatId> page;
        assert(reg.threats.list_active(0, 50, page).ok);
        assert(page.size() <= 50);
        reads.fetch_add(1);
      } while (writing.load());
    });
  }

  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&reg, w] {
      for (int i = 0; i < kPerWriter; ++i) {
        ThreatId id = 0;
        const std::string evidence = "writer-" + std::to_string(w) + "-" + std::to_string(i);
        const Result registered =
            reg.threats.register_threat(kReporter, threat_draft(static_cast<ThreatType>(i % 6), (i % 5) + 1, evidence), id);
        assert(registered.ok);
        if (i % 3 == 0) {
          const Result resolved = reg.threats.update_status(kReporter, id, ThreatStatus::Resolved);
          assert(resolved.ok);
        }
        AlertId alert_id = 0;
        const Result created = reg.alerts.create_alert(kSender, alert_draft(id, (i % 5) + 1), alert_id);
        assert(created.ok);
      }
    });
  }

  for (auto& writer : writers) {
    writer.join();
  }
  writing.store(false);
  for (auto& reader : readers) {
    reader.join();
  }

  const auto stats = reg.threats.stats();
  assert(stats.total == kWriters * kPerWriter);
  assert(stats.resolved == kWriters * 34);
  assert(stats.active == stats.total - stats.resolved);
  assert(reg.alerts.total() == kWriters * kPerWriter);
  assert(reads.load() > 0);
  require_invariants(reg);
}

}  // namespace

int main() {
  require_ok(sentinel::configure_logging({.level = "ERROR", .json = false}));
  require_ok(sentinel::util::ensure_crypto_ready());

  test_end_to_end_hurricane_scenario();
  test_register_rejections_leave_state_unchanged();
  test_status_updates_and_noop_rejection();
  test_single_verification();
  test_emergency_classification();
  test_recent_window_is_bounded();
  test_pagination_reconstructs_sequences();
  test_access_control_rules();
  test_event_journal_chain();
  test_evidence_fingerprints_and_lookup();
  test_breakdowns();
  test_alert_validation_and_lifecycle();
  test_config_parsing();
  test_sentinel_core_facade();
  test_rejected_init_journals_nothing();
  test_json_log_lines_escape_control_bytes();
  test_command_script_rejects_out_of_range_numbers();
  test_concurrent_readers_and_writers();

  std::cout << "ocean_sentinel_tests passed\n";
  return 0;
}
