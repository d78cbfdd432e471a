#include "core/storage/event_journal.hpp"

#include <algorithm>
#include <string>

#include "core/model/names.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace sentinel {

void RecordingSink::on_event(const LedgerEvent& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  events_.push_back(event);
}

std::vector<LedgerEvent> RecordingSink::events() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return events_;
}

std::size_t RecordingSink::count(EventKind kind) const {
  std::lock_guard<std::mutex> guard(mutex_);
  return static_cast<std::size_t>(
      std::ranges::count_if(events_, [kind](const LedgerEvent& event) { return event.kind == kind; }));
}

void RecordingSink::clear() {
  std::lock_guard<std::mutex> guard(mutex_);
  events_.clear();
}

std::string compute_event_hash(const LedgerEvent& event) {
  const std::string body = util::canonical_join({
      {"sequence", std::to_string(event.sequence)},
      {"kind", std::string{event_kind_name(event.kind)}},
      {"record_id", std::to_string(event.record_id)},
      {"related_id", std::to_string(event.related_id)},
      {"unix_ts", std::to_string(event.unix_ts)},
      {"actor", event.actor},
      {"payload", event.payload},
  });
  return util::sha256_hex(event.prev_hash + "\n" + body);
}

bool verify_event_chain(const std::vector<LedgerEvent>& events) {
  std::string expected_prev{util::kZeroHashHex};
  std::uint64_t expected_sequence = 1;
  for (const auto& event : events) {
    if (event.sequence != expected_sequence || event.prev_hash != expected_prev) {
      return false;
    }
    if (compute_event_hash(event) != event.event_hash) {
      return false;
    }
    expected_prev = event.event_hash;
    ++expected_sequence;
  }
  return true;
}

LedgerEvent EventJournal::append(EventKind kind, std::uint64_t record_id, std::uint64_t related_id,
                                 std::int64_t unix_ts, std::string_view actor,
                                 std::vector<std::pair<std::string, std::string>> payload_fields) {
  std::lock_guard<std::mutex> guard(mutex_);

  LedgerEvent event;
  event.sequence = static_cast<std::uint64_t>(events_.size()) + 1U;
  event.kind = kind;
  event.record_id = record_id;
  event.related_id = related_id;
  event.unix_ts = unix_ts;
  event.actor = std::string{actor};
  event.payload = util::canonical_join(std::move(payload_fields));
  event.prev_hash = events_.empty() ? std::string{util::kZeroHashHex} : events_.back().event_hash;
  event.event_hash = compute_event_hash(event);
  events_.push_back(event);

  for (const auto& sink : sinks_) {
    sink->on_event(event);
  }
  return event;
}

void EventJournal::subscribe(std::shared_ptr<IEventSink> sink) {
  if (!sink) {
    return;
  }
  std::lock_guard<std::mutex> guard(mutex_);
  sinks_.push_back(std::move(sink));
}

std::vector<LedgerEvent> EventJournal::events() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return events_;
}

std::vector<LedgerEvent> EventJournal::events_for_record(RecordFamily family, std::uint64_t record_id) const {
  std::lock_guard<std::mutex> guard(mutex_);
  std::vector<LedgerEvent> trail;
  for (const auto& event : events_) {
    if (record_family(event.kind) == family && event.record_id == record_id) {
      trail.push_back(event);
    }
  }
  return trail;
}

std::size_t EventJournal::size() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return events_.size();
}

std::string EventJournal::head_hash() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return events_.empty() ? std::string{util::kZeroHashHex} : events_.back().event_hash;
}

bool EventJournal::verify_chain() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return verify_event_chain(events_);
}

}  // namespace sentinel
