#include "ecp/violation.hpp"

#include <algorithm>
#include <cstdio>

#include "ecp/observability.hpp"

namespace ecp {

// ---------------------------------------------------------------------------
// ViolationReport
// ---------------------------------------------------------------------------

std::string ViolationReport::to_json() const {
  auto counts = [](const std::map<std::string, uint64_t>& m) {
    jsonlite::Object o;
    for (const auto& [k, v] : m) o[k] = jsonlite::Value{static_cast<std::uint64_t>(v)};
    return jsonlite::Value{std::move(o)};
  };
  jsonlite::Object o;
  o["timestamp_unix_ms"] = jsonlite::Value{timestamp_unix_ms};
  o["total_violations"] = jsonlite::Value{total};
  o["by_severity"] = counts(by_severity);
  o["by_type"] = counts(by_type);
  o["by_agent"] = counts(by_agent);
  o["recent_24h"] = jsonlite::Value{recent_24h};
  o["recent_7d"] = jsonlite::Value{recent_7d};
  o["escalations_pending"] = jsonlite::Value{escalations_pending};
  o["persist_failures"] = jsonlite::Value{persist_failures};
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// ViolationTracker
// ---------------------------------------------------------------------------

ViolationTracker::ViolationTracker(IRecordStore& store,
                                   std::shared_ptr<IEscalationNotifier> notifier,
                                   Clock clock,
                                   std::size_t notify_queue_capacity)
    : store_(store),
      clock_(std::move(clock)),
      dispatcher_(std::move(notifier), notify_queue_capacity) {
  load_existing();
}

void ViolationTracker::load_existing() {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& key : store_.list_keys(collections::kViolations)) {
    auto text = store_.get(collections::kViolations, key);
    if (!text) continue;
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(*text, &err);
    if (err) continue;
    auto v = violation_from_object(obj);
    if (!v) continue;
    index_locked(*v);
  }
  for (const auto& key : store_.list_keys(collections::kEscalations)) {
    auto text = store_.get(collections::kEscalations, key);
    if (!text) continue;
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(*text, &err);
    if (err) continue;
    auto e = escalation_from_object(obj);
    if (e && e->source == EscalationSource::violation) escalations_[e->subject_id] = *e;
  }
  seq_ = violations_.size();
}

void ViolationTracker::index_locked(const Violation& v) {
  violations_[v.violation_id] = v;
  severity_index_[v.severity].insert(v.violation_id);
  if (!v.agent_id.empty()) agent_index_[v.agent_id].insert(v.violation_id);
  type_index_[v.violation_type].insert(v.violation_id);
}

std::string ViolationTracker::next_id_locked(uint64_t now_ms) {
  char buf[64];
  std::string id;
  do {
    std::snprintf(buf, sizeof(buf), "vio_%llu_%06llu", static_cast<unsigned long long>(now_ms),
                  static_cast<unsigned long long>(++seq_));
    id = buf;
  } while (violations_.contains(id));
  return id;
}

std::string ViolationTracker::record_violation(const std::string& violation_type,
                                               Severity severity,
                                               const std::string& message,
                                               const std::string& agent_id,
                                               const std::string& function_name,
                                               const std::map<std::string, std::string>& context) {
  const uint64_t now = clock_now(clock_);
  Violation v;
  std::optional<Escalation> escalation;
  bool persisted = false;
  bool escalation_persisted = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    v.violation_id = next_id_locked(now);
    v.violation_type = violation_type;
    v.severity = severity;
    v.message = message;
    v.timestamp_unix_ms = now;
    v.agent_id = agent_id;
    v.function_name = function_name;
    v.context = context;

    persisted = store_.put(collections::kViolations, v.violation_id,
                           jsonlite::to_json(to_object(v)));
    if (!persisted) persist_failures_.fetch_add(1, std::memory_order_relaxed);
    index_locked(v);

    if (severity == Severity::blocking) {
      Escalation e;
      e.escalation_id = escalation_key(v.violation_id);
      e.source = EscalationSource::violation;
      e.subject_id = v.violation_id;
      e.reason = violation_type + ": " + message;
      e.status = EscalationStatus::awaiting_human_review;
      e.created_at_unix_ms = now;
      escalation_persisted = store_.put(collections::kEscalations, e.escalation_id,
                                        jsonlite::to_json(to_object(e)));
      if (!escalation_persisted) persist_failures_.fetch_add(1, std::memory_order_relaxed);
      escalations_[v.violation_id] = e;
      escalation = e;
    }
  }

  GovernanceEvent ev;
  ev.kind = GovernanceEventKind::violation_recorded;
  ev.subject_id = v.violation_id;
  ev.agent_id = agent_id;
  ev.detail = violation_type + " (" + to_string(severity) + ")";
  ev.timestamp_unix_ms = now;
  emit_governance_event(ev);
  if (!persisted) {
    ev.kind = GovernanceEventKind::violation_persist_failed;
    ev.ok = false;
    ev.error_code = to_string(ErrorCode::store_write_failed);
    emit_governance_event(std::move(ev));
  }

  if (escalation) {
    GovernanceEvent esc_ev;
    esc_ev.kind = GovernanceEventKind::escalation_created;
    esc_ev.subject_id = escalation->escalation_id;
    esc_ev.agent_id = agent_id;
    esc_ev.ok = escalation_persisted;
    if (!escalation_persisted) esc_ev.error_code = to_string(ErrorCode::store_write_failed);
    esc_ev.detail = "violation " + v.violation_id;
    esc_ev.timestamp_unix_ms = now;
    emit_governance_event(std::move(esc_ev));
    dispatcher_.enqueue(*escalation, v);
  }
  return v.violation_id;
}

std::optional<Violation> ViolationTracker::find(const std::string& violation_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = violations_.find(violation_id);
  if (it == violations_.end()) return std::nullopt;
  return it->second;
}

std::vector<Violation> ViolationTracker::collect_locked(const std::set<std::string>& ids) const {
  std::vector<Violation> out;
  out.reserve(ids.size());
  for (const auto& id : ids) {
    auto it = violations_.find(id);
    if (it != violations_.end()) out.push_back(it->second);
  }
  // Oldest first; ids tie-break equal timestamps.
  std::sort(out.begin(), out.end(), [](const Violation& a, const Violation& b) {
    if (a.timestamp_unix_ms != b.timestamp_unix_ms) return a.timestamp_unix_ms < b.timestamp_unix_ms;
    return a.violation_id < b.violation_id;
  });
  return out;
}

std::vector<Violation> ViolationTracker::all() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::set<std::string> ids;
  for (const auto& [id, _] : violations_) ids.insert(id);
  return collect_locked(ids);
}

std::vector<Violation> ViolationTracker::by_agent(const std::string& agent_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = agent_index_.find(agent_id);
  if (it == agent_index_.end()) return {};
  return collect_locked(it->second);
}

std::vector<Violation> ViolationTracker::by_severity(Severity severity) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = severity_index_.find(severity);
  if (it == severity_index_.end()) return {};
  return collect_locked(it->second);
}

std::vector<Violation> ViolationTracker::by_type(const std::string& violation_type) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = type_index_.find(violation_type);
  if (it == type_index_.end()) return {};
  return collect_locked(it->second);
}

std::vector<Violation> ViolationTracker::recent(std::chrono::milliseconds window) const {
  const uint64_t now = clock_now(clock_);
  const uint64_t span = static_cast<uint64_t>(window.count());
  const uint64_t cutoff = now > span ? now - span : 0;
  std::lock_guard<std::mutex> lk(mu_);
  std::set<std::string> ids;
  for (const auto& [id, v] : violations_) {
    if (v.timestamp_unix_ms >= cutoff) ids.insert(id);
  }
  return collect_locked(ids);
}

std::optional<Escalation> ViolationTracker::escalation_for(const std::string& violation_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = escalations_.find(violation_id);
  if (it == escalations_.end()) return std::nullopt;
  return it->second;
}

std::vector<Escalation> ViolationTracker::escalations() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<Escalation> out;
  out.reserve(escalations_.size());
  for (const auto& [_, e] : escalations_) out.push_back(e);
  return out;
}

ViolationReport ViolationTracker::report() const {
  ViolationReport r;
  r.timestamp_unix_ms = clock_now(clock_);
  const uint64_t day_cutoff = r.timestamp_unix_ms > kMillisPerDay ? r.timestamp_unix_ms - kMillisPerDay : 0;
  const uint64_t week_cutoff =
      r.timestamp_unix_ms > 7 * kMillisPerDay ? r.timestamp_unix_ms - 7 * kMillisPerDay : 0;

  std::lock_guard<std::mutex> lk(mu_);
  r.by_severity[to_string(Severity::blocking)] = 0;
  r.by_severity[to_string(Severity::warning)] = 0;
  r.by_severity[to_string(Severity::audit)] = 0;
  for (const auto& [_, v] : violations_) {
    ++r.total;
    ++r.by_severity[to_string(v.severity)];
    ++r.by_type[v.violation_type];
    ++r.by_agent[v.agent_id.empty() ? "unknown" : v.agent_id];
    if (v.timestamp_unix_ms >= day_cutoff) ++r.recent_24h;
    if (v.timestamp_unix_ms >= week_cutoff) ++r.recent_7d;
  }
  for (const auto& [_, e] : escalations_) {
    if (e.status == EscalationStatus::awaiting_human_review) ++r.escalations_pending;
  }
  r.persist_failures = persist_failures_.load(std::memory_order_relaxed);
  return r;
}

}  // namespace ecp
