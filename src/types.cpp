#include "ecp/types.hpp"

#include <algorithm>
#include <chrono>
#include <limits>

namespace ecp {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::ingress_rejected: return "ingress_rejected";
    case ErrorCode::replay_rejected: return "replay_rejected";
    case ErrorCode::integrity_violation: return "integrity_violation";
    case ErrorCode::classification_failure: return "classification_failure";
    case ErrorCode::compliance_violation: return "compliance_violation";
    case ErrorCode::unknown_event: return "unknown_event";
    case ErrorCode::classification_invalid: return "classification_invalid";
    case ErrorCode::ruling_exists: return "ruling_exists";
    case ErrorCode::ruling_invalid: return "ruling_invalid";
    case ErrorCode::ledger_write_failed: return "ledger_write_failed";
    case ErrorCode::store_write_failed: return "store_write_failed";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::notify_failed: return "notify_failed";
  }
  return "";
}

uint64_t now_unix_ms() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::system_clock::now().time_since_epoch())
                                   .count());
}

uint64_t clock_now(const Clock& clock) {
  return clock ? clock() : now_unix_ms();
}

// ---------------------------------------------------------------------------
// Enum names
// ---------------------------------------------------------------------------

std::string to_string(Causation c) {
  switch (c) {
    case Causation::natural: return "natural";
    case Causation::human: return "human";
    case Causation::ai_decision: return "ai_decision";
    case Causation::ai_assisted: return "ai_assisted";
  }
  return "";
}

std::string to_string(EthicalStatus s) {
  switch (s) {
    case EthicalStatus::ethical: return "ethical";
    case EthicalStatus::permissible: return "permissible";
    case EthicalStatus::questionable: return "questionable";
    case EthicalStatus::unethical: return "unethical";
  }
  return "";
}

std::string to_string(RiskEstimate r) {
  switch (r) {
    case RiskEstimate::low: return "low";
    case RiskEstimate::medium: return "medium";
    case RiskEstimate::high: return "high";
  }
  return "";
}

std::string to_string(Severity s) {
  switch (s) {
    case Severity::blocking: return "blocking";
    case Severity::warning: return "warning";
    case Severity::audit: return "audit";
  }
  return "";
}

std::string to_string(EscalationStatus s) {
  switch (s) {
    case EscalationStatus::awaiting_human_review: return "awaiting_human_review";
    case EscalationStatus::resolved_by_precedent: return "resolved_by_precedent";
    case EscalationStatus::resolved: return "resolved";
  }
  return "";
}

std::string to_string(EscalationSource s) {
  switch (s) {
    case EscalationSource::violation: return "violation";
    case EscalationSource::consensus: return "consensus";
  }
  return "";
}

std::optional<Causation> causation_from_string(const std::string& s) {
  if (s == "natural") return Causation::natural;
  if (s == "human") return Causation::human;
  if (s == "ai_decision") return Causation::ai_decision;
  if (s == "ai_assisted") return Causation::ai_assisted;
  return std::nullopt;
}

std::optional<EthicalStatus> ethical_status_from_string(const std::string& s) {
  if (s == "ethical") return EthicalStatus::ethical;
  if (s == "permissible") return EthicalStatus::permissible;
  if (s == "questionable") return EthicalStatus::questionable;
  if (s == "unethical") return EthicalStatus::unethical;
  return std::nullopt;
}

std::optional<RiskEstimate> risk_estimate_from_string(const std::string& s) {
  if (s == "low") return RiskEstimate::low;
  if (s == "medium") return RiskEstimate::medium;
  if (s == "high") return RiskEstimate::high;
  return std::nullopt;
}

std::optional<Severity> severity_from_string(const std::string& s) {
  if (s == "blocking") return Severity::blocking;
  if (s == "warning") return Severity::warning;
  if (s == "audit") return Severity::audit;
  return std::nullopt;
}

std::optional<EscalationStatus> escalation_status_from_string(const std::string& s) {
  if (s == "awaiting_human_review") return EscalationStatus::awaiting_human_review;
  if (s == "resolved_by_precedent") return EscalationStatus::resolved_by_precedent;
  if (s == "resolved") return EscalationStatus::resolved;
  return std::nullopt;
}

std::optional<EscalationSource> escalation_source_from_string(const std::string& s) {
  if (s == "violation") return EscalationSource::violation;
  if (s == "consensus") return EscalationSource::consensus;
  return std::nullopt;
}

bool is_valid_identifier(const std::string& id) {
  if (id.empty() || id.size() > 128 || id[0] == '.') return false;
  for (char c : id) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
              c == '_' || c == '-' || c == '.';
    if (!ok) return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Decision context
// ---------------------------------------------------------------------------

Object make_context(Causation causation, bool agency_present, const std::string& duty_of_care,
                    const std::string& knowledge_level, const std::string& control_level) {
  Object o;
  o["causation"] = Value{to_string(causation)};
  o["agency_present"] = Value{agency_present};
  o["duty_of_care"] = Value{duty_of_care};
  o["knowledge_level"] = Value{knowledge_level};
  o["control_level"] = Value{control_level};
  return o;
}

Object context_to_object(const DecisionContext& ctx) {
  return make_context(ctx.causation, ctx.agency_present, ctx.duty_of_care, ctx.knowledge_level,
                      ctx.control_level);
}

ContextValidation validate_context(const Object& context) {
  ContextValidation out;

  auto it = context.find("causation");
  if (it == context.end()) {
    out.problems.push_back("causation");
  } else {
    std::optional<Causation> c;
    if (it->second.is_string()) c = causation_from_string(std::get<std::string>(it->second.v));
    if (c) out.context.causation = *c;
    else out.problems.push_back("causation (invalid value)");
  }

  it = context.find("agency_present");
  if (it == context.end()) {
    out.problems.push_back("agency_present");
  } else if (!it->second.is_bool()) {
    out.problems.push_back("agency_present (not boolean)");
  } else {
    out.context.agency_present = std::get<bool>(it->second.v);
  }

  auto text_field = [&](const char* name, std::string& dest) {
    auto f = context.find(name);
    if (f == context.end()) {
      out.problems.push_back(name);
    } else if (!f->second.is_string()) {
      out.problems.push_back(std::string(name) + " (not string)");
    } else if (std::get<std::string>(f->second.v).empty()) {
      out.problems.push_back(std::string(name) + " (empty)");
    } else {
      dest = std::get<std::string>(f->second.v);
    }
  };
  text_field("duty_of_care", out.context.duty_of_care);
  text_field("knowledge_level", out.context.knowledge_level);
  text_field("control_level", out.context.control_level);

  out.ok = out.problems.empty();
  return out;
}

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

Object to_object(const Classification& c) {
  Object o;
  o["event_id"] = Value{c.event_id};
  o["classifier_id"] = Value{c.classifier_id};
  o["ethical_status"] = Value{to_string(c.ethical_status)};
  o["confidence"] = Value{c.confidence};
  o["risk_estimate"] = Value{to_string(c.risk_estimate)};
  o["reasoning"] = Value{c.reasoning};
  o["timestamp_unix_ms"] = Value{c.timestamp_unix_ms};
  o["constraints"] = Value{jsonlite::to_array(c.constraints)};
  o["revision"] = Value{c.revision};
  return o;
}

std::optional<Classification> classification_from_object(const Object& o) {
  Classification c;
  c.event_id = jsonlite::get_string(o, "event_id");
  c.classifier_id = jsonlite::get_string(o, "classifier_id");
  auto status = ethical_status_from_string(jsonlite::get_string(o, "ethical_status"));
  auto risk = risk_estimate_from_string(jsonlite::get_string(o, "risk_estimate"));
  if (c.event_id.empty() || c.classifier_id.empty() || !status || !risk) return std::nullopt;
  c.ethical_status = *status;
  c.risk_estimate = *risk;
  c.confidence = jsonlite::get_double(o, "confidence", -1.0);
  c.reasoning = jsonlite::get_string(o, "reasoning");
  c.timestamp_unix_ms = jsonlite::get_u64(o, "timestamp_unix_ms");
  c.constraints = jsonlite::get_string_array(o, "constraints");
  c.revision = jsonlite::get_u64(o, "revision");
  return c;
}

std::string classification_key(const std::string& event_id, const std::string& classifier_id) {
  return event_id + "__" + classifier_id;
}

// ---------------------------------------------------------------------------
// Consensus
// ---------------------------------------------------------------------------

Object to_object(const ConsensusRecord& r) {
  Object o;
  o["event_id"] = Value{r.event_id};
  o["computed_at_unix_ms"] = Value{r.computed_at_unix_ms};
  Array pairs;
  for (const auto& p : r.pairs) {
    Object po;
    po["classifier_a"] = Value{p.classifier_a};
    po["classifier_b"] = Value{p.classifier_b};
    po["score"] = Value{p.score};
    pairs.emplace_back(std::move(po));
  }
  o["pairs"] = Value{std::move(pairs)};
  o["divergence_score"] = Value{r.divergence_score};
  o["max_pairwise_divergence"] = Value{r.max_pairwise_divergence};
  o["aggregate_divergence"] = Value{r.aggregate_divergence};
  o["aggregation"] = Value{r.aggregation};
  o["threshold"] = Value{r.threshold};
  o["requires_human_review"] = Value{r.requires_human_review};
  o["trigger_reason"] = Value{r.trigger_reason};
  Array breakdown;
  for (const auto& b : r.breakdown) {
    Object bo;
    bo["classifier_id"] = Value{b.classifier_id};
    bo["ethical_status"] = Value{to_string(b.ethical_status)};
    bo["confidence"] = Value{b.confidence};
    bo["risk_estimate"] = Value{to_string(b.risk_estimate)};
    bo["mean_divergence"] = Value{b.mean_divergence};
    breakdown.emplace_back(std::move(bo));
  }
  o["breakdown"] = Value{std::move(breakdown)};
  o["classification_set_digest"] = Value{r.classification_set_digest};
  return o;
}

std::optional<ConsensusRecord> consensus_from_object(const Object& o) {
  ConsensusRecord r;
  r.event_id = jsonlite::get_string(o, "event_id");
  if (r.event_id.empty()) return std::nullopt;
  r.computed_at_unix_ms = jsonlite::get_u64(o, "computed_at_unix_ms");
  auto pit = o.find("pairs");
  if (pit != o.end() && pit->second.is_array()) {
    for (const auto& pv : std::get<Array>(pit->second.v)) {
      if (!pv.is_object()) continue;
      const auto& po = std::get<Object>(pv.v);
      r.pairs.push_back(PairDivergence{jsonlite::get_string(po, "classifier_a"),
                                       jsonlite::get_string(po, "classifier_b"),
                                       jsonlite::get_double(po, "score")});
    }
  }
  r.divergence_score = jsonlite::get_double(o, "divergence_score");
  r.max_pairwise_divergence = jsonlite::get_double(o, "max_pairwise_divergence");
  r.aggregate_divergence = jsonlite::get_double(o, "aggregate_divergence");
  r.aggregation = jsonlite::get_string(o, "aggregation");
  r.threshold = jsonlite::get_double(o, "threshold");
  r.requires_human_review = jsonlite::get_bool(o, "requires_human_review");
  r.trigger_reason = jsonlite::get_string(o, "trigger_reason");
  auto bit = o.find("breakdown");
  if (bit != o.end() && bit->second.is_array()) {
    for (const auto& bv : std::get<Array>(bit->second.v)) {
      if (!bv.is_object()) continue;
      const auto& bo = std::get<Object>(bv.v);
      ClassifierBreakdown b;
      b.classifier_id = jsonlite::get_string(bo, "classifier_id");
      b.ethical_status = ethical_status_from_string(jsonlite::get_string(bo, "ethical_status"))
                             .value_or(EthicalStatus::questionable);
      b.confidence = jsonlite::get_double(bo, "confidence");
      b.risk_estimate = risk_estimate_from_string(jsonlite::get_string(bo, "risk_estimate"))
                            .value_or(RiskEstimate::medium);
      b.mean_divergence = jsonlite::get_double(bo, "mean_divergence");
      r.breakdown.push_back(std::move(b));
    }
  }
  r.classification_set_digest = jsonlite::get_string(o, "classification_set_digest");
  return r;
}

// ---------------------------------------------------------------------------
// Violations and escalations
// ---------------------------------------------------------------------------

Object to_object(const Violation& v) {
  Object o;
  o["violation_id"] = Value{v.violation_id};
  o["violation_type"] = Value{v.violation_type};
  o["severity"] = Value{to_string(v.severity)};
  o["message"] = Value{v.message};
  o["timestamp_unix_ms"] = Value{v.timestamp_unix_ms};
  o["agent_id"] = Value{v.agent_id};
  o["function_name"] = Value{v.function_name};
  o["context"] = Value{jsonlite::to_object(v.context)};
  return o;
}

std::optional<Violation> violation_from_object(const Object& o) {
  Violation v;
  v.violation_id = jsonlite::get_string(o, "violation_id");
  auto sev = severity_from_string(jsonlite::get_string(o, "severity"));
  if (v.violation_id.empty() || !sev) return std::nullopt;
  v.severity = *sev;
  v.violation_type = jsonlite::get_string(o, "violation_type");
  v.message = jsonlite::get_string(o, "message");
  v.timestamp_unix_ms = jsonlite::get_u64(o, "timestamp_unix_ms");
  v.agent_id = jsonlite::get_string(o, "agent_id");
  v.function_name = jsonlite::get_string(o, "function_name");
  v.context = jsonlite::get_string_map(o, "context");
  return v;
}

Object to_object(const Escalation& e) {
  Object o;
  o["escalation_id"] = Value{e.escalation_id};
  o["source"] = Value{to_string(e.source)};
  o["subject_id"] = Value{e.subject_id};
  o["reason"] = Value{e.reason};
  o["status"] = Value{to_string(e.status)};
  o["created_at_unix_ms"] = Value{e.created_at_unix_ms};
  o["resolved_at_unix_ms"] = Value{e.resolved_at_unix_ms};
  o["resolved_by"] = Value{e.resolved_by};
  return o;
}

std::optional<Escalation> escalation_from_object(const Object& o) {
  Escalation e;
  e.escalation_id = jsonlite::get_string(o, "escalation_id");
  auto source = escalation_source_from_string(jsonlite::get_string(o, "source"));
  auto status = escalation_status_from_string(jsonlite::get_string(o, "status"));
  if (e.escalation_id.empty() || !source || !status) return std::nullopt;
  e.source = *source;
  e.status = *status;
  e.subject_id = jsonlite::get_string(o, "subject_id");
  e.reason = jsonlite::get_string(o, "reason");
  e.created_at_unix_ms = jsonlite::get_u64(o, "created_at_unix_ms");
  e.resolved_at_unix_ms = jsonlite::get_u64(o, "resolved_at_unix_ms");
  e.resolved_by = jsonlite::get_string(o, "resolved_by");
  return e;
}

std::string escalation_key(const std::string& subject_id) {
  return "esc_" + subject_id;
}

// ---------------------------------------------------------------------------
// Human rulings
// ---------------------------------------------------------------------------

bool HumanRuling::covers(const std::string& type) const {
  if (!precedent_created) return false;
  for (const auto& t : applicable_event_types) {
    if (t == type || t == "decision_" + type) return true;
  }
  return false;
}

bool HumanRuling::expired_at(uint64_t now_ms) const {
  // A window reaching past the largest representable timestamp never ends.
  const uint64_t headroom = std::numeric_limits<uint64_t>::max() - issued_at_unix_ms;
  if (validity_days > headroom / kMillisPerDay) return false;
  return now_ms >= issued_at_unix_ms + validity_days * kMillisPerDay;
}

Object to_object(const HumanRuling& r) {
  Object o;
  o["event_id"] = Value{r.event_id};
  o["action_type"] = Value{r.action_type};
  o["issued_by"] = Value{r.issued_by};
  o["final_assessment"] = Value{to_string(r.final_assessment)};
  o["reasoning"] = Value{r.reasoning};
  o["issued_at_unix_ms"] = Value{r.issued_at_unix_ms};
  o["precedent_created"] = Value{r.precedent_created};
  o["applicable_event_types"] = Value{jsonlite::to_array(r.applicable_event_types)};
  o["validity_days"] = Value{r.validity_days};
  return o;
}

std::optional<HumanRuling> ruling_from_object(const Object& o) {
  HumanRuling r;
  r.event_id = jsonlite::get_string(o, "event_id");
  auto status = ethical_status_from_string(jsonlite::get_string(o, "final_assessment"));
  if (r.event_id.empty() || !status) return std::nullopt;
  r.final_assessment = *status;
  r.action_type = jsonlite::get_string(o, "action_type");
  r.issued_by = jsonlite::get_string(o, "issued_by");
  r.reasoning = jsonlite::get_string(o, "reasoning");
  r.issued_at_unix_ms = jsonlite::get_u64(o, "issued_at_unix_ms");
  r.precedent_created = jsonlite::get_bool(o, "precedent_created");
  r.applicable_event_types = jsonlite::get_string_array(o, "applicable_event_types");
  r.validity_days = jsonlite::get_u64(o, "validity_days");
  return r;
}

}  // namespace ecp
