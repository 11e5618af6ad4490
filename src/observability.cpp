#include "ecp/observability.hpp"

#include <cstdio>
#include <cstdlib>

#include "ecp/jsonlite.hpp"
#include "ecp/types.hpp"
#include "ecp/version.hpp"

namespace ecp {

std::string to_string(GovernanceEventKind kind) {
  switch (kind) {
    case GovernanceEventKind::decision_accepted: return "decision_accepted";
    case GovernanceEventKind::decision_rejected: return "decision_rejected";
    case GovernanceEventKind::replay_rejected: return "replay_rejected";
    case GovernanceEventKind::self_classified: return "self_classified";
    case GovernanceEventKind::self_classification_fallback: return "self_classification_fallback";
    case GovernanceEventKind::classification_recorded: return "classification_recorded";
    case GovernanceEventKind::classification_rejected: return "classification_rejected";
    case GovernanceEventKind::consensus_scored: return "consensus_scored";
    case GovernanceEventKind::review_required: return "review_required";
    case GovernanceEventKind::violation_recorded: return "violation_recorded";
    case GovernanceEventKind::violation_persist_failed: return "violation_persist_failed";
    case GovernanceEventKind::escalation_created: return "escalation_created";
    case GovernanceEventKind::escalation_resolved: return "escalation_resolved";
    case GovernanceEventKind::notification_sent: return "notification_sent";
    case GovernanceEventKind::notification_failed: return "notification_failed";
    case GovernanceEventKind::notification_dropped: return "notification_dropped";
    case GovernanceEventKind::ruling_created: return "ruling_created";
    case GovernanceEventKind::integrity_check: return "integrity_check";
    case GovernanceEventKind::consistency_check: return "consistency_check";
  }
  return "unknown";
}

std::string governance_event_to_json(const GovernanceEvent& ev) {
  jsonlite::Object o;
  o["v"] = jsonlite::Value{static_cast<std::uint64_t>(version::EVENT_LOG_VERSION)};
  o["kind"] = jsonlite::Value{to_string(ev.kind)};
  o["subject_id"] = jsonlite::Value{ev.subject_id};
  o["agent_id"] = jsonlite::Value{ev.agent_id};
  o["ok"] = jsonlite::Value{ev.ok};
  o["error_code"] = jsonlite::Value{ev.error_code};
  o["detail"] = jsonlite::Value{ev.detail};
  o["timestamp_unix_ms"] = jsonlite::Value{ev.timestamp_unix_ms};
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// GovernanceStats
// ---------------------------------------------------------------------------

void GovernanceStats::record(const GovernanceEvent& ev) {
  auto bump = [](std::atomic<uint64_t>& c) { c.fetch_add(1, std::memory_order_relaxed); };
  switch (ev.kind) {
    case GovernanceEventKind::decision_accepted: bump(decisions_accepted); break;
    case GovernanceEventKind::decision_rejected: bump(decisions_rejected); break;
    case GovernanceEventKind::replay_rejected: bump(replays_rejected); break;
    case GovernanceEventKind::self_classified: bump(self_classifications); break;
    case GovernanceEventKind::self_classification_fallback: bump(fallback_classifications); break;
    case GovernanceEventKind::classification_recorded: bump(classifications_recorded); break;
    case GovernanceEventKind::classification_rejected: bump(classifications_rejected); break;
    case GovernanceEventKind::consensus_scored: bump(consensus_computations); break;
    case GovernanceEventKind::review_required: bump(reviews_required); break;
    case GovernanceEventKind::violation_recorded: bump(violations_recorded); break;
    case GovernanceEventKind::violation_persist_failed: bump(violation_persist_failures); break;
    case GovernanceEventKind::escalation_created: bump(escalations_created); break;
    case GovernanceEventKind::escalation_resolved: bump(escalations_resolved); break;
    case GovernanceEventKind::notification_sent: bump(notifications_sent); break;
    case GovernanceEventKind::notification_failed: bump(notifications_failed); break;
    case GovernanceEventKind::notification_dropped: bump(notifications_dropped); break;
    case GovernanceEventKind::ruling_created: bump(rulings_created); break;
    case GovernanceEventKind::integrity_check:
      bump(integrity_checks);
      if (!ev.ok) bump(integrity_failures);
      break;
    case GovernanceEventKind::consistency_check: bump(consistency_checks); break;
  }

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::vector<GovernanceEvent> GovernanceStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  // Oldest first.
  std::vector<GovernanceEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % kMaxRecentEvents]);
  }
  return out;
}

std::string GovernanceStats::to_json() const {
  auto load = [](const std::atomic<uint64_t>& c) {
    return jsonlite::Value{static_cast<std::uint64_t>(c.load(std::memory_order_relaxed))};
  };
  jsonlite::Object ingress;
  ingress["accepted"] = load(decisions_accepted);
  ingress["rejected"] = load(decisions_rejected);
  ingress["replays_rejected"] = load(replays_rejected);

  jsonlite::Object classification;
  classification["self"] = load(self_classifications);
  classification["fallback"] = load(fallback_classifications);
  classification["recorded"] = load(classifications_recorded);
  classification["rejected"] = load(classifications_rejected);

  jsonlite::Object consensus;
  consensus["computations"] = load(consensus_computations);
  consensus["reviews_required"] = load(reviews_required);

  jsonlite::Object violations;
  violations["recorded"] = load(violations_recorded);
  violations["persist_failures"] = load(violation_persist_failures);
  violations["escalations_created"] = load(escalations_created);
  violations["escalations_resolved"] = load(escalations_resolved);

  jsonlite::Object notifications;
  notifications["sent"] = load(notifications_sent);
  notifications["failed"] = load(notifications_failed);
  notifications["dropped"] = load(notifications_dropped);

  jsonlite::Object audit;
  audit["integrity_checks"] = load(integrity_checks);
  audit["integrity_failures"] = load(integrity_failures);
  audit["consistency_checks"] = load(consistency_checks);
  audit["rulings_created"] = load(rulings_created);

  jsonlite::Object o;
  o["ingress"] = jsonlite::Value{std::move(ingress)};
  o["classification"] = jsonlite::Value{std::move(classification)};
  o["consensus"] = jsonlite::Value{std::move(consensus)};
  o["violations"] = jsonlite::Value{std::move(violations)};
  o["notifications"] = jsonlite::Value{std::move(notifications)};
  o["audit"] = jsonlite::Value{std::move(audit)};
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

GovernanceStats& global_governance_stats() {
  static GovernanceStats inst;
  return inst;
}

namespace {
std::atomic<GovernanceEventHook> g_event_hook{nullptr};
std::mutex g_log_mu;
std::string g_log_path;  // guarded by g_log_mu
}  // namespace

void set_governance_event_hook(GovernanceEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_log_path = path;
}

void emit_governance_event(GovernanceEvent ev) {
  if (ev.timestamp_unix_ms == 0) ev.timestamp_unix_ms = now_unix_ms();

  // 1. Record in global stats (always).
  global_governance_stats().record(ev);

  // 2. Optional custom hook.
  GovernanceEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // 3. JSONL to the event log file if configured.
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::string path = g_log_path;
  if (path.empty()) {
    const char* env = std::getenv("ECP_EVENT_LOG");
    if (!env || !env[0]) return;
    path = env;
  }
  const std::string line = governance_event_to_json(ev) + "\n";
  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace ecp
