#pragma once

// ecp/observability.hpp - Structured governance event stream and counters.
//
// DESIGN:
//   GovernanceEvent is the canonical observable unit. Every ingress decision,
//   classification write, consensus computation, violation, escalation and
//   notification attempt emits one event, which is:
//     - recorded in the process-wide GovernanceStats counters (always),
//     - handed to a registered hook if one is set, otherwise
//     - appended as one JSON line to the event log (ECP_EVENT_LOG or the
//       path set via set_event_log_path()).
//
// Invariant: event emission never fails the operation that emitted it. A log
// file that cannot be opened is skipped silently.
//
// EXTENSION_POINT: OpenTelemetry_exporter
//   Register a hook that forwards events as span events to a collector.

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace ecp {

enum class GovernanceEventKind {
  decision_accepted,
  decision_rejected,
  replay_rejected,
  self_classified,
  self_classification_fallback,
  classification_recorded,
  classification_rejected,
  consensus_scored,
  review_required,
  violation_recorded,
  violation_persist_failed,
  escalation_created,
  escalation_resolved,
  notification_sent,
  notification_failed,
  notification_dropped,
  ruling_created,
  integrity_check,
  consistency_check,
};

std::string to_string(GovernanceEventKind kind);

struct GovernanceEvent {
  GovernanceEventKind kind{GovernanceEventKind::decision_accepted};
  std::string subject_id;   // event id, violation id or escalation id
  std::string agent_id;
  bool ok{true};
  std::string error_code;
  std::string detail;
  uint64_t timestamp_unix_ms{0};  // stamped at emission when zero
};

std::string governance_event_to_json(const GovernanceEvent& ev);

// ---------------------------------------------------------------------------
// GovernanceStats - process-wide aggregated counters
// ---------------------------------------------------------------------------
// Thread-safe. All counters are atomic; the recent-event ring uses a mutex.
// Counters are cumulative across every service instance in the process.
class GovernanceStats {
 public:
  void record(const GovernanceEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> decisions_accepted{0};
  alignas(64) std::atomic<uint64_t> decisions_rejected{0};
  alignas(64) std::atomic<uint64_t> replays_rejected{0};
  alignas(64) std::atomic<uint64_t> self_classifications{0};
  alignas(64) std::atomic<uint64_t> fallback_classifications{0};
  alignas(64) std::atomic<uint64_t> classifications_recorded{0};
  alignas(64) std::atomic<uint64_t> classifications_rejected{0};
  alignas(64) std::atomic<uint64_t> consensus_computations{0};
  alignas(64) std::atomic<uint64_t> reviews_required{0};
  alignas(64) std::atomic<uint64_t> violations_recorded{0};
  alignas(64) std::atomic<uint64_t> violation_persist_failures{0};
  alignas(64) std::atomic<uint64_t> escalations_created{0};
  alignas(64) std::atomic<uint64_t> escalations_resolved{0};
  alignas(64) std::atomic<uint64_t> notifications_sent{0};
  alignas(64) std::atomic<uint64_t> notifications_failed{0};
  alignas(64) std::atomic<uint64_t> notifications_dropped{0};
  alignas(64) std::atomic<uint64_t> rulings_created{0};
  alignas(64) std::atomic<uint64_t> integrity_checks{0};
  alignas(64) std::atomic<uint64_t> integrity_failures{0};
  alignas(64) std::atomic<uint64_t> consistency_checks{0};

  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<GovernanceEvent> recent_events_snapshot() const;

 private:
  mutable std::mutex ring_mu_;
  std::vector<GovernanceEvent> ring_buffer_;
  size_t ring_head_{0};  // next slot to overwrite once the ring is full
};

// Singleton accessor
GovernanceStats& global_governance_stats();

// Emit a governance event (fire-and-forget).
void emit_governance_event(GovernanceEvent ev);

// Optional hook. When set, events go to the hook instead of the JSONL file.
using GovernanceEventHook = void (*)(const GovernanceEvent&);
void set_governance_event_hook(GovernanceEventHook hook);

// Explicit event log path. Empty falls back to the ECP_EVENT_LOG variable.
void set_event_log_path(const std::string& path);

}  // namespace ecp
