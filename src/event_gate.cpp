#include "ecp/event_gate.hpp"

#include <stdexcept>

#include "ecp/hash.hpp"
#include "ecp/observability.hpp"
#include "ecp/violation.hpp"

namespace ecp {

using jsonlite::Object;
using jsonlite::Value;

std::string compute_event_id(const std::string& action_type,
                             const std::string& description,
                             const Object& payload) {
  const jsonlite::Array fields{Value{action_type}, Value{description}, Value{payload}};
  const std::string material = jsonlite::to_json(Value{fields});
  return "evt_" + event_id_hash(material).substr(0, 16);
}

SelfAssessment DefaultSelfClassifier::assess(const std::string&, const Decision&, const DecisionContext&) {
  SelfAssessment a;
  a.ok = true;
  a.ethical_status = EthicalStatus::permissible;
  a.confidence = 0.9;
  a.risk_estimate = RiskEstimate::low;
  a.reasoning = "Automated classification by event gate.";
  return a;
}

std::string GateResult::to_json() const {
  Object o;
  o["ok"] = Value{ok};
  o["event_id"] = Value{event_id};
  o["error"] = Value{to_string(error)};
  o["missing_fields"] = Value{jsonlite::to_array(missing_fields)};
  o["self_classified"] = Value{self_classified};
  o["self_classification_fallback"] = Value{self_classification_fallback};
  o["detail"] = Value{detail};
  return jsonlite::to_json(o);
}

EventGate::EventGate(Ledger& ledger,
                     ImmutabilityGuard& guard,
                     ViolationTracker* tracker,
                     std::shared_ptr<ISelfClassifier> self_classifier)
    : ledger_(ledger),
      guard_(guard),
      tracker_(tracker),
      self_classifier_(self_classifier ? std::move(self_classifier)
                                       : std::make_shared<DefaultSelfClassifier>()) {}

std::vector<std::string> EventGate::validate(const Decision& decision) {
  std::vector<std::string> problems;
  if (decision.action_type.empty()) problems.push_back("action_type");
  if (decision.agent_id.empty()) {
    problems.push_back("agent_id");
  } else if (!is_valid_identifier(decision.agent_id)) {
    problems.push_back("agent_id (invalid identifier)");
  }
  auto ctx = validate_context(decision.context);
  problems.insert(problems.end(), ctx.problems.begin(), ctx.problems.end());
  return problems;
}

GateResult EventGate::enforce_decision(const Decision& decision) {
  GateResult result;

  // 1. Validation. Nothing is written for a rejected decision.
  const auto ctx = validate_context(decision.context);
  result.missing_fields = validate(decision);
  if (!result.missing_fields.empty()) {
    result.error = ErrorCode::ingress_rejected;
    std::string joined;
    for (const auto& f : result.missing_fields) {
      if (!joined.empty()) joined += ", ";
      joined += f;
    }
    result.detail = "missing or invalid fields: " + joined;
    if (tracker_) {
      tracker_->record_violation("missing_context", Severity::warning,
                                 "Decision rejected at ingress: " + joined,
                                 decision.agent_id, "enforce_decision",
                                 {{"action_type", decision.action_type}, {"fields", joined}});
    }
    GovernanceEvent ev;
    ev.kind = GovernanceEventKind::decision_rejected;
    ev.agent_id = decision.agent_id;
    ev.ok = false;
    ev.error_code = to_string(result.error);
    ev.detail = result.detail;
    emit_governance_event(std::move(ev));
    return result;
  }

  // 2. Content-addressed id.
  result.event_id = compute_event_id(decision.action_type, decision.description, decision.payload);

  // 3. Ledger append; the duplicate check is atomic with the append.
  Object payload;
  payload["event_id"] = Value{result.event_id};
  payload["event_type"] = Value{"decision_" + decision.action_type};
  payload["action_type"] = Value{decision.action_type};
  payload["description"] = Value{decision.description};
  payload["payload"] = Value{decision.payload};
  payload["agent_id"] = Value{decision.agent_id};
  payload["context"] = Value{context_to_object(ctx.context)};
  payload["source"] = Value{"event_gate"};

  ErrorCode err = ErrorCode::none;
  auto entry = ledger_.append(entry_types::kDecisionEvent, payload, result.event_id, &err);
  if (!entry) {
    result.error = err;
    GovernanceEvent ev;
    ev.subject_id = result.event_id;
    ev.agent_id = decision.agent_id;
    ev.ok = false;
    ev.error_code = to_string(err);
    if (err == ErrorCode::replay_rejected) {
      result.detail = "duplicate decision event";
      ev.kind = GovernanceEventKind::replay_rejected;
      if (tracker_) {
        tracker_->record_violation("replay_attempt", Severity::warning,
                                   "Duplicate decision event " + result.event_id,
                                   decision.agent_id, "enforce_decision",
                                   {{"event_id", result.event_id},
                                    {"action_type", decision.action_type}});
      }
    } else {
      result.detail = "ledger append failed";
      ev.kind = GovernanceEventKind::decision_rejected;
    }
    ev.detail = result.detail;
    emit_governance_event(std::move(ev));
    return result;
  }

  result.ok = true;
  {
    GovernanceEvent ev;
    ev.kind = GovernanceEventKind::decision_accepted;
    ev.subject_id = result.event_id;
    ev.agent_id = decision.agent_id;
    ev.detail = decision.action_type;
    emit_governance_event(std::move(ev));
  }

  // 4. Self-classification when the acting agent had agency.
  if (ctx.context.agency_present) {
    self_classify(result.event_id, decision, ctx.context, result);
  }
  return result;
}

void EventGate::self_classify(const std::string& event_id, const Decision& decision,
                              const DecisionContext& context, GateResult& result) {
  std::string failure;
  try {
    SelfAssessment a = self_classifier_->assess(event_id, decision, context);
    if (!a.ok) {
      failure = a.error.empty() ? "self-classifier reported failure" : a.error;
    } else {
      Classification c;
      c.event_id = event_id;
      c.classifier_id = decision.agent_id;
      c.ethical_status = a.ethical_status;
      c.confidence = a.confidence;
      c.risk_estimate = a.risk_estimate;
      c.reasoning = a.reasoning;
      c.constraints = a.constraints;
      std::string detail;
      ErrorCode err = guard_.store_classification(c, &detail);
      if (err != ErrorCode::none) {
        failure = "storing self-classification failed: " + to_string(err) +
                  (detail.empty() ? "" : " (" + detail + ")");
      }
    }
  } catch (const std::exception& e) {
    failure = std::string("self-classifier threw: ") + e.what();
  }

  if (failure.empty()) {
    result.self_classified = true;
    GovernanceEvent ev;
    ev.kind = GovernanceEventKind::self_classified;
    ev.subject_id = event_id;
    ev.agent_id = decision.agent_id;
    emit_governance_event(std::move(ev));
    return;
  }

  Classification fb;
  fb.event_id = event_id;
  fb.classifier_id = decision.agent_id;
  fb.ethical_status = kFallbackStatus;
  fb.confidence = kFallbackConfidence;
  fb.risk_estimate = kFallbackRisk;
  fb.reasoning = "Fallback classification: " + failure;
  fb.constraints = {kRequiresExternalReview};
  std::string detail;
  ErrorCode err = guard_.store_classification(fb, &detail);

  result.self_classified = err == ErrorCode::none;
  result.self_classification_fallback = err == ErrorCode::none;
  result.detail = failure;
  if (err != ErrorCode::none) {
    result.detail += "; fallback classification failed: " + to_string(err);
  }

  if (tracker_) {
    tracker_->record_violation("self_classification_failed", Severity::audit, failure,
                               decision.agent_id, "enforce_decision",
                               {{"event_id", event_id}, {"action_type", decision.action_type}});
    if (err != ErrorCode::none) {
      tracker_->record_violation("unclassified_event", Severity::blocking,
                                 "Event left without any classification: " + result.detail,
                                 decision.agent_id, "enforce_decision",
                                 {{"event_id", event_id}});
    }
  }

  GovernanceEvent ev;
  ev.kind = GovernanceEventKind::self_classification_fallback;
  ev.subject_id = event_id;
  ev.agent_id = decision.agent_id;
  ev.ok = err == ErrorCode::none;
  ev.error_code = to_string(err == ErrorCode::none ? ErrorCode::classification_failure : err);
  ev.detail = result.detail;
  emit_governance_event(std::move(ev));
}

}  // namespace ecp
