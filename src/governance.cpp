#include "ecp/governance.hpp"

#include <set>

#include "ecp/observability.hpp"

namespace ecp {

using jsonlite::Object;
using jsonlite::Value;

namespace {

std::unique_ptr<IRecordStore> make_store(const GovernanceConfig& config) {
  if (config.in_memory) return std::make_unique<MemoryRecordStore>();
  std::set<std::string> compressed;
  if (config.compress_archive) compressed.insert(collections::kClassificationArchive);
  return std::make_unique<FsRecordStore>(config.data_root, std::move(compressed));
}

std::shared_ptr<IEscalationNotifier> make_notifier(const GovernanceConfig& config) {
  if (config.notify_command.empty()) return std::make_shared<NullNotifier>();
  return std::make_shared<CommandNotifier>(config.notify_command, config.notify_args,
                                           static_cast<uint64_t>(config.notify_timeout_ms));
}

void emit_escalation_event(GovernanceEventKind kind, const Escalation& e, const std::string& detail) {
  GovernanceEvent ev;
  ev.kind = kind;
  ev.subject_id = e.escalation_id;
  ev.detail = detail;
  emit_governance_event(std::move(ev));
}

}  // namespace

std::string ClassifyResult::to_json() const {
  Object o;
  o["ok"] = Value{ok};
  o["error"] = Value{to_string(error)};
  o["revision"] = Value{revision};
  o["detail"] = Value{detail};
  return jsonlite::to_json(o);
}

std::string ScoreResult::to_json() const {
  Object o;
  o["scored"] = Value{record.has_value()};
  o["error"] = Value{to_string(error)};
  o["consensus"] = record ? Value{to_object(*record)} : Value{nullptr};
  o["escalation"] = escalation ? Value{to_object(*escalation)} : Value{nullptr};
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// GovernanceService
// ---------------------------------------------------------------------------

GovernanceService::GovernanceService(GovernanceConfig config, GovernanceDeps deps)
    : config_(std::move(config)), clock_(std::move(deps.clock)) {
  if (!config_.event_log_path.empty()) set_event_log_path(config_.event_log_path);

  store_ = deps.store ? std::move(deps.store) : make_store(config_);
  ledger_ = std::make_unique<Ledger>(config_.ledger_path(), clock_);
  tracker_ = std::make_unique<ViolationTracker>(
      *store_, deps.notifier ? std::move(deps.notifier) : make_notifier(config_), clock_,
      config_.notify_queue_capacity);
  guard_ = std::make_unique<ImmutabilityGuard>(*ledger_, *store_, clock_);
  gate_ = std::make_unique<EventGate>(*ledger_, *guard_, tracker_.get(), std::move(deps.self_classifier));
  scorer_ = std::make_unique<ConsensusScorer>(*guard_, *store_, config_.consensus);
  rulings_ = std::make_unique<RulingRegistry>(*store_, *ledger_, clock_);
  checker_ = std::make_unique<ConsistencyChecker>(*ledger_, *store_, clock_);
}

GateResult GovernanceService::enforce_decision(const Decision& decision) {
  return gate_->enforce_decision(decision);
}

ClassifyResult GovernanceService::classify_event(const std::string& event_id,
                                                 const std::string& classifier_id,
                                                 EthicalStatus ethical_status,
                                                 double confidence,
                                                 RiskEstimate risk_estimate,
                                                 const std::string& reasoning) {
  Classification c;
  c.event_id = event_id;
  c.classifier_id = classifier_id;
  c.ethical_status = ethical_status;
  c.confidence = confidence;
  c.risk_estimate = risk_estimate;
  c.reasoning = reasoning;

  ClassifyResult r;
  r.error = guard_->store_classification(c, &r.detail);
  r.ok = r.error == ErrorCode::none;
  r.revision = r.ok ? c.revision : 0;
  if (r.error == ErrorCode::unknown_event) {
    tracker_->record_violation("unknown_event_reference", Severity::warning,
                               "Classification references unknown event " + event_id, classifier_id,
                               "classify_event", {{"event_id", event_id}});
  }
  return r;
}

ScoreResult GovernanceService::score_event(const std::string& event_id) {
  ScoreResult r;
  r.record = scorer_->score_event(event_id, &r.error);
  if (r.record && r.record->requires_human_review) {
    r.escalation = escalate_consensus(*r.record);
  }
  return r;
}

std::optional<Escalation> GovernanceService::escalate_consensus(const ConsensusRecord& record) {
  const std::string key = escalation_key(record.event_id);
  std::lock_guard<std::mutex> lk(escalation_mu_);

  if (auto text = store_->get(collections::kEscalations, key)) {
    std::optional<jsonlite::JsonError> err;
    auto existing = escalation_from_object(jsonlite::parse(*text, &err));
    if (!err && existing) return existing;
  }

  const uint64_t now = clock_now(clock_);
  Escalation e;
  e.escalation_id = key;
  e.source = EscalationSource::consensus;
  e.subject_id = record.event_id;
  e.reason = "consensus review required: " + record.trigger_reason;
  e.status = EscalationStatus::awaiting_human_review;
  e.created_at_unix_ms = now;

  std::string action_type;
  if (auto entry = ledger_->find(record.event_id)) {
    action_type = jsonlite::get_string(entry->payload, "action_type");
  }
  if (auto ruling = rulings_->find(record.event_id)) {
    e.status = EscalationStatus::resolved;
    e.resolved_by = "ruling:" + ruling->event_id;
    e.resolved_at_unix_ms = now;
  } else if (auto precedent = rulings_->find_precedent(action_type, now)) {
    e.status = EscalationStatus::resolved_by_precedent;
    e.resolved_by = "precedent:" + precedent->event_id;
    e.resolved_at_unix_ms = now;
  }

  if (!store_->put(collections::kEscalations, key, jsonlite::to_json(to_object(e)))) {
    GovernanceEvent ev;
    ev.kind = GovernanceEventKind::escalation_created;
    ev.subject_id = key;
    ev.ok = false;
    ev.error_code = to_string(ErrorCode::store_write_failed);
    ev.detail = "consensus escalation for " + record.event_id;
    emit_governance_event(std::move(ev));
    return e;
  }

  emit_escalation_event(GovernanceEventKind::escalation_created, e, "consensus " + record.event_id);
  if (e.status != EscalationStatus::awaiting_human_review) {
    emit_escalation_event(GovernanceEventKind::escalation_resolved, e, e.resolved_by);
  }
  return e;
}

ErrorCode GovernanceService::create_ruling(HumanRuling& ruling, std::string* detail) {
  ErrorCode err = rulings_->create_ruling(ruling, detail);
  if (err != ErrorCode::none) return err;

  const std::string key = escalation_key(ruling.event_id);
  std::lock_guard<std::mutex> lk(escalation_mu_);
  auto text = store_->get(collections::kEscalations, key);
  if (!text) return ErrorCode::none;
  std::optional<jsonlite::JsonError> perr;
  auto e = escalation_from_object(jsonlite::parse(*text, &perr));
  if (perr || !e || e->status != EscalationStatus::awaiting_human_review) return ErrorCode::none;

  e->status = EscalationStatus::resolved;
  e->resolved_by = "ruling:" + ruling.event_id;
  e->resolved_at_unix_ms = ruling.issued_at_unix_ms;
  if (!store_->put(collections::kEscalations, key, jsonlite::to_json(to_object(*e)))) {
    if (detail) *detail = "ruling stored but escalation " + key + " could not be resolved";
    return ErrorCode::store_write_failed;
  }
  emit_escalation_event(GovernanceEventKind::escalation_resolved, *e, e->resolved_by);
  return ErrorCode::none;
}

std::string GovernanceService::record_violation(const std::string& violation_type,
                                                Severity severity,
                                                const std::string& message,
                                                const std::string& agent_id,
                                                const std::string& function_name,
                                                const std::map<std::string, std::string>& context) {
  return tracker_->record_violation(violation_type, severity, message, agent_id, function_name, context);
}

IntegrityReport GovernanceService::verify_integrity() const {
  IntegrityReport report = ledger_->verify_integrity();
  GovernanceEvent ev;
  ev.kind = GovernanceEventKind::integrity_check;
  ev.ok = report.ok;
  if (!report.ok) {
    ev.error_code = to_string(ErrorCode::integrity_violation);
    ev.subject_id = report.entry_id;
    ev.detail = to_string(report.failure) + ": " + report.detail;
  }
  emit_governance_event(std::move(ev));
  return report;
}

ConsistencyReport GovernanceService::run_check() {
  return checker_->run_check();
}

std::optional<Escalation> GovernanceService::escalation_for_event(const std::string& event_id) const {
  auto text = store_->get(collections::kEscalations, escalation_key(event_id));
  if (!text) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(*text, &err);
  if (err) return std::nullopt;
  return escalation_from_object(obj);
}

}  // namespace ecp
