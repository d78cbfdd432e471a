#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/model/types.hpp"

namespace sentinel {

// Receives every committed event, in journal order. Sinks run under the journal lock and
// must not call back into the registries or the journal.
class IEventSink {
public:
  virtual ~IEventSink() = default;

  virtual void on_event(const LedgerEvent& event) = 0;
};

class RecordingSink final : public IEventSink {
public:
  void on_event(const LedgerEvent& event) override;

  [[nodiscard]] std::vector<LedgerEvent> events() const;
  [[nodiscard]] std::size_t count(EventKind kind) const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::vector<LedgerEvent> events_;
};

// Append-only, hash-chained record of committed mutations. One journal may be shared by
// several registries, which gives them a single global order.
class EventJournal {
public:
  LedgerEvent append(EventKind kind, std::uint64_t record_id, std::uint64_t related_id,
                     std::int64_t unix_ts, std::string_view actor,
                     std::vector<std::pair<std::string, std::string>> payload_fields);

  void subscribe(std::shared_ptr<IEventSink> sink);

  [[nodiscard]] std::vector<LedgerEvent> events() const;
  [[nodiscard]] std::vector<LedgerEvent> events_for_record(RecordFamily family,
                                                           std::uint64_t record_id) const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::string head_hash() const;
  [[nodiscard]] bool verify_chain() const;

private:
  mutable std::mutex mutex_;
  std::vector<LedgerEvent> events_;
  std::vector<std::shared_ptr<IEventSink>> sinks_;
};

std::string compute_event_hash(const LedgerEvent& event);
bool verify_event_chain(const std::vector<LedgerEvent>& events);

}  // namespace sentinel
