#pragma once

// ecp/violation.hpp - Permanent record of rule breaches and their escalation.
//
// DESIGN INVARIANTS:
//   1. PERMANENT: a recorded violation is never edited or deleted.
//   2. PERSIST FIRST: the record is written before any escalation or
//      notification. A failed write keeps the violation in memory (queryable
//      for the lifetime of the tracker), increments persist_failure_count()
//      and emits violation_persist_failed. It is never dropped.
//   3. BLOCKING ESCALATES: a blocking violation always yields exactly one
//      Escalation in state awaiting_human_review, stored under
//      escalations/esc_<violation_id>, and one enqueued notification.
//   4. INDEXED: queries are served from in-memory indexes rebuilt from the
//      store at construction, never from directory scans.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "ecp/notify.hpp"
#include "ecp/record_store.hpp"
#include "ecp/types.hpp"

namespace ecp {

struct ViolationReport {
  uint64_t timestamp_unix_ms{0};
  uint64_t total{0};
  std::map<std::string, uint64_t> by_severity;  // all three severities always present
  std::map<std::string, uint64_t> by_type;
  std::map<std::string, uint64_t> by_agent;
  uint64_t recent_24h{0};
  uint64_t recent_7d{0};
  uint64_t escalations_pending{0};
  uint64_t persist_failures{0};

  std::string to_json() const;
};

class ViolationTracker {
 public:
  ViolationTracker(IRecordStore& store,
                   std::shared_ptr<IEscalationNotifier> notifier = nullptr,
                   Clock clock = {},
                   std::size_t notify_queue_capacity = 256);

  ViolationTracker(const ViolationTracker&) = delete;
  ViolationTracker& operator=(const ViolationTracker&) = delete;

  // Returns the new violation id. Never fails to return an id.
  std::string record_violation(const std::string& violation_type,
                               Severity severity,
                               const std::string& message,
                               const std::string& agent_id = "",
                               const std::string& function_name = "",
                               const std::map<std::string, std::string>& context = {});

  std::optional<Violation> find(const std::string& violation_id) const;
  std::vector<Violation> all() const;
  std::vector<Violation> by_agent(const std::string& agent_id) const;
  std::vector<Violation> by_severity(Severity severity) const;
  std::vector<Violation> by_type(const std::string& violation_type) const;
  std::vector<Violation> blocking() const { return by_severity(Severity::blocking); }
  std::vector<Violation> recent(std::chrono::milliseconds window) const;

  std::optional<Escalation> escalation_for(const std::string& violation_id) const;
  std::vector<Escalation> escalations() const;

  ViolationReport report() const;

  uint64_t persist_failure_count() const { return persist_failures_.load(std::memory_order_relaxed); }

  // Block until queued notifications have been attempted.
  void flush_notifications() { dispatcher_.flush(); }
  const NotificationDispatcher& dispatcher() const { return dispatcher_; }

 private:
  void load_existing();
  void index_locked(const Violation& v);
  std::vector<Violation> collect_locked(const std::set<std::string>& ids) const;
  std::string next_id_locked(uint64_t now_ms);

  IRecordStore& store_;
  Clock clock_;
  mutable std::mutex mu_;
  std::map<std::string, Violation> violations_;
  std::map<std::string, Escalation> escalations_;  // keyed by violation id
  std::map<Severity, std::set<std::string>> severity_index_;
  std::map<std::string, std::set<std::string>> agent_index_;
  std::map<std::string, std::set<std::string>> type_index_;
  uint64_t seq_{0};
  std::atomic<uint64_t> persist_failures_{0};
  NotificationDispatcher dispatcher_;  // last: its worker stops first on destruction
};

}  // namespace ecp
