#include "ecp/consistency.hpp"

#include <algorithm>
#include <functional>

#include "ecp/event_gate.hpp"
#include "ecp/hash.hpp"
#include "ecp/observability.hpp"

namespace ecp {

using jsonlite::Object;
using jsonlite::Value;

namespace {

std::optional<Classification> load_classification(const IRecordStore& store,
                                                  const std::string& collection,
                                                  const std::string& key) {
  auto text = store.get(collection, key);
  if (!text) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(*text, &err);
  if (err) return std::nullopt;
  return classification_from_object(obj);
}

std::string archive_key(const std::string& live_key, uint64_t revision) {
  return live_key + "__r" + std::to_string(revision);
}

}  // namespace

// ---------------------------------------------------------------------------
// ImmutabilityGuard
// ---------------------------------------------------------------------------

ImmutabilityGuard::ImmutabilityGuard(Ledger& ledger, IRecordStore& store, Clock clock)
    : ledger_(ledger), store_(store), clock_(std::move(clock)) {
  load_index();
}

void ImmutabilityGuard::load_index() {
  std::lock_guard<std::mutex> lk(index_mu_);
  for (const auto& key : store_.list_keys(collections::kClassifications)) {
    auto c = load_classification(store_, collections::kClassifications, key);
    if (c) by_event_[c->event_id].insert(c->classifier_id);
  }
}

std::mutex& ImmutabilityGuard::stripe_for(const std::string& key) {
  return stripes_[std::hash<std::string>{}(key) % kStripes];
}

bool ImmutabilityGuard::is_decision_event(const std::string& event_id) const {
  auto e = ledger_.find(event_id);
  return e && e->entry_type == entry_types::kDecisionEvent;
}

ErrorCode ImmutabilityGuard::store_classification(Classification& c, std::string* detail) {
  auto fail = [&](ErrorCode code, const std::string& why) {
    if (detail) *detail = why;
    GovernanceEvent ev;
    ev.kind = GovernanceEventKind::classification_rejected;
    ev.subject_id = c.event_id;
    ev.agent_id = c.classifier_id;
    ev.ok = false;
    ev.error_code = to_string(code);
    ev.detail = why;
    emit_governance_event(std::move(ev));
    return code;
  };

  if (!is_decision_event(c.event_id)) {
    return fail(ErrorCode::unknown_event, "no decision_event " + c.event_id + " in ledger");
  }
  if (!is_valid_identifier(c.classifier_id)) {
    return fail(ErrorCode::classification_invalid, "invalid classifier id");
  }
  if (!(c.confidence >= 0.0 && c.confidence <= 1.0)) {
    return fail(ErrorCode::classification_invalid, "confidence outside [0,1]");
  }

  const std::string key = classification_key(c.event_id, c.classifier_id);
  std::string record;
  {
    std::lock_guard<std::mutex> lk(stripe_for(key));

    auto previous_text = store_.get(collections::kClassifications, key);
    uint64_t previous_revision = 0;
    if (previous_text) {
      std::optional<jsonlite::JsonError> err;
      auto prev = classification_from_object(jsonlite::parse(*previous_text, &err));
      previous_revision = (!err && prev) ? prev->revision : 0;
      // Archive the exact bytes of the superseded revision before replacing it.
      if (!store_.put(collections::kClassificationArchive,
                      archive_key(key, std::max<uint64_t>(previous_revision, 1)), *previous_text)) {
        return fail(ErrorCode::store_write_failed, "archiving previous revision failed");
      }
    }

    c.revision = previous_revision + 1;
    if (c.timestamp_unix_ms == 0) c.timestamp_unix_ms = clock_now(clock_);
    record = jsonlite::to_json(to_object(c));
    if (!store_.put(collections::kClassifications, key, record)) {
      return fail(ErrorCode::store_write_failed, "writing classification failed");
    }

    Object anchor;
    anchor["event_id"] = Value{c.event_id};
    anchor["classifier_id"] = Value{c.classifier_id};
    anchor["revision"] = Value{c.revision};
    anchor["record_digest"] = Value{record_digest(record)};
    ErrorCode err = ErrorCode::none;
    if (!ledger_.append(entry_types::kClassificationRecorded, anchor, "", &err)) {
      // An unanchored revision must not stay live.
      const bool restored = previous_text
                                ? store_.put(collections::kClassifications, key, *previous_text)
                                : store_.remove(collections::kClassifications, key);
      c.revision = previous_revision;
      return fail(ErrorCode::ledger_write_failed,
                  restored ? "anchoring classification in ledger failed; previous state restored"
                           : "anchoring classification in ledger failed; restoring previous state failed");
    }
  }

  {
    std::lock_guard<std::mutex> lk(index_mu_);
    by_event_[c.event_id].insert(c.classifier_id);
  }

  GovernanceEvent ev;
  ev.kind = GovernanceEventKind::classification_recorded;
  ev.subject_id = c.event_id;
  ev.agent_id = c.classifier_id;
  ev.detail = to_string(c.ethical_status) + " r" + std::to_string(c.revision);
  emit_governance_event(std::move(ev));
  return ErrorCode::none;
}

std::optional<Classification> ImmutabilityGuard::get_classification(
    const std::string& event_id, const std::string& classifier_id) const {
  return load_classification(store_, collections::kClassifications,
                             classification_key(event_id, classifier_id));
}

std::vector<Classification> ImmutabilityGuard::classifications_for(const std::string& event_id) const {
  std::set<std::string> classifiers;
  {
    std::lock_guard<std::mutex> lk(index_mu_);
    auto it = by_event_.find(event_id);
    if (it == by_event_.end()) return {};
    classifiers = it->second;
  }
  std::vector<Classification> out;
  for (const auto& id : classifiers) {  // std::set keeps classifier-id order
    auto c = get_classification(event_id, id);
    if (c) out.push_back(std::move(*c));
  }
  return out;
}

std::vector<Classification> ImmutabilityGuard::revision_history(const std::string& event_id,
                                                                const std::string& classifier_id) const {
  const std::string key = classification_key(event_id, classifier_id);
  std::vector<Classification> out;
  auto live = get_classification(event_id, classifier_id);
  if (!live) return out;
  for (uint64_t r = 1; r < live->revision; ++r) {
    auto c = load_classification(store_, collections::kClassificationArchive, archive_key(key, r));
    if (c) out.push_back(std::move(*c));
  }
  out.push_back(std::move(*live));
  return out;
}

std::vector<std::string> ImmutabilityGuard::classified_events() const {
  std::lock_guard<std::mutex> lk(index_mu_);
  std::vector<std::string> out;
  out.reserve(by_event_.size());
  for (const auto& [id, _] : by_event_) out.push_back(id);
  return out;
}

// ---------------------------------------------------------------------------
// ConsistencyReport
// ---------------------------------------------------------------------------

namespace {

Value issue_to_value(const ConsistencyIssue& i) {
  Object o;
  o["check"] = Value{i.check};
  o["severity"] = Value{i.severity};
  o["subject"] = Value{i.subject};
  o["message"] = Value{i.message};
  return Value{std::move(o)};
}

}  // namespace

std::string ConsistencyReport::to_json() const {
  Object o;
  o["timestamp_unix_ms"] = Value{timestamp_unix_ms};
  o["status"] = Value{status};
  o["checks_run"] = Value{static_cast<std::uint64_t>(checks_run)};
  o["checks_failed"] = Value{static_cast<std::uint64_t>(checks_failed)};
  o["total_errors"] = Value{static_cast<std::uint64_t>(total_errors)};
  jsonlite::Array critical;
  for (const auto& i : critical_errors) critical.push_back(issue_to_value(i));
  o["critical_errors"] = Value{std::move(critical)};
  jsonlite::Array checks_arr;
  for (const auto& c : checks) {
    Object co;
    co["name"] = Value{c.name};
    co["description"] = Value{c.description};
    co["severity"] = Value{c.severity};
    co["passed"] = Value{c.passed};
    jsonlite::Array errs;
    for (const auto& i : c.errors) errs.push_back(issue_to_value(i));
    co["errors"] = Value{std::move(errs)};
    co["notes"] = Value{jsonlite::to_array(c.notes)};
    checks_arr.emplace_back(std::move(co));
  }
  o["checks"] = Value{std::move(checks_arr)};
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// ConsistencyChecker
// ---------------------------------------------------------------------------

ConsistencyChecker::ConsistencyChecker(const Ledger& ledger, const IRecordStore& store, Clock clock)
    : ledger_(ledger), store_(store), clock_(std::move(clock)) {}

std::set<std::string> ConsistencyChecker::decision_event_ids() const {
  std::set<std::string> ids;
  for (const auto& e : ledger_.entries()) {
    if (e.entry_type == entry_types::kDecisionEvent) ids.insert(e.id);
  }
  return ids;
}

CheckResult ConsistencyChecker::check_chain_integrity() const {
  CheckResult r;
  r.name = "chain_integrity";
  r.description = "Every ledger entry hashes correctly and links to its predecessor";
  r.severity = "critical";
  for (const auto& p : ledger_.audit_chain()) {
    r.errors.push_back({r.name, r.severity, p.entry_id.empty() ? "#" + std::to_string(p.index) : p.entry_id,
                        to_string(p.failure) + " at index " + std::to_string(p.index) + ": " + p.detail});
  }
  r.passed = r.errors.empty();
  return r;
}

CheckResult ConsistencyChecker::check_event_references() const {
  CheckResult r;
  r.name = "event_references";
  r.description = "Decision events carry a complete context and a matching content-derived id";
  r.severity = "high";
  for (const auto& e : ledger_.entries()) {
    if (e.entry_type != entry_types::kDecisionEvent) continue;
    auto ctx = validate_context(jsonlite::get_object(e.payload, "context"));
    if (!ctx.ok) {
      std::string joined;
      for (const auto& p : ctx.problems) joined += (joined.empty() ? "" : ", ") + p;
      r.errors.push_back({r.name, r.severity, e.id, "context incomplete: " + joined});
    }
    if (jsonlite::get_string(e.payload, "event_id") != e.id) {
      r.errors.push_back({r.name, r.severity, e.id, "payload event_id differs from entry id"});
    }
    const std::string expected = compute_event_id(jsonlite::get_string(e.payload, "action_type"),
                                                  jsonlite::get_string(e.payload, "description"),
                                                  jsonlite::get_object(e.payload, "payload"));
    if (expected != e.id) {
      r.errors.push_back({r.name, r.severity, e.id, "entry id does not match recomputed event id " + expected});
    }
  }
  r.passed = r.errors.empty();
  return r;
}

CheckResult ConsistencyChecker::check_classification_links() const {
  CheckResult r;
  r.name = "classification_links";
  r.description = "Classifications reference existing events and match their ledger anchors";
  r.severity = "high";

  const auto events = decision_event_ids();
  std::map<std::string, std::string> anchors;  // key -> latest record digest
  for (const auto& e : ledger_.entries()) {
    if (e.entry_type != entry_types::kClassificationRecorded) continue;
    anchors[classification_key(jsonlite::get_string(e.payload, "event_id"),
                               jsonlite::get_string(e.payload, "classifier_id"))] =
        jsonlite::get_string(e.payload, "record_digest");
  }

  for (const auto& key : store_.list_keys(collections::kClassifications)) {
    auto text = store_.get(collections::kClassifications, key);
    if (!text) continue;
    std::optional<jsonlite::JsonError> err;
    auto c = classification_from_object(jsonlite::parse(*text, &err));
    if (err || !c) {
      r.errors.push_back({r.name, r.severity, key, "classification record cannot be decoded"});
      continue;
    }
    if (!events.contains(c->event_id)) {
      r.errors.push_back({r.name, r.severity, key, "references missing event " + c->event_id});
    }
    auto a = anchors.find(key);
    if (a == anchors.end()) {
      r.errors.push_back({r.name, r.severity, key, "no ledger anchor"});
    } else if (a->second != record_digest(*text)) {
      r.errors.push_back({r.name, r.severity, key, "record digest differs from latest ledger anchor"});
    }
  }

  for (const auto& key : store_.list_keys(collections::kClassificationArchive)) {
    auto c = load_classification(store_, collections::kClassificationArchive, key);
    if (!c) {
      r.errors.push_back({r.name, r.severity, key, "archived classification cannot be decoded"});
    } else if (!events.contains(c->event_id)) {
      r.errors.push_back({r.name, r.severity, key, "archived revision references missing event " + c->event_id});
    }
  }
  r.passed = r.errors.empty();
  return r;
}

CheckResult ConsistencyChecker::check_case_consistency() const {
  CheckResult r;
  r.name = "case_consistency";
  r.description = "Escalations, rulings and consensus records reference existing subjects";
  r.severity = "medium";
  const auto events = decision_event_ids();

  auto parse_record = [&](const char* collection, const std::string& key) -> std::optional<Object> {
    auto text = store_.get(collection, key);
    if (!text) return std::nullopt;
    std::optional<jsonlite::JsonError> err;
    auto o = jsonlite::parse(*text, &err);
    if (err) return std::nullopt;
    return o;
  };

  for (const auto& key : store_.list_keys(collections::kEscalations)) {
    auto o = parse_record(collections::kEscalations, key);
    auto e = o ? escalation_from_object(*o) : std::nullopt;
    if (!e) {
      r.errors.push_back({r.name, r.severity, key, "escalation record cannot be decoded"});
      continue;
    }
    if (e->source == EscalationSource::violation && !store_.contains(collections::kViolations, e->subject_id)) {
      r.errors.push_back({r.name, r.severity, key, "references missing violation " + e->subject_id});
    }
    if (e->source == EscalationSource::consensus && !events.contains(e->subject_id)) {
      r.errors.push_back({r.name, r.severity, key, "references missing event " + e->subject_id});
    }
  }

  for (const auto& key : store_.list_keys(collections::kRulings)) {
    auto o = parse_record(collections::kRulings, key);
    auto ruling = o ? ruling_from_object(*o) : std::nullopt;
    if (!ruling) {
      r.errors.push_back({r.name, r.severity, key, "ruling record cannot be decoded"});
    } else if (!events.contains(ruling->event_id)) {
      r.errors.push_back({r.name, r.severity, key, "ruling references missing event " + ruling->event_id});
    }
  }

  for (const auto& key : store_.list_keys(collections::kConsensus)) {
    auto o = parse_record(collections::kConsensus, key);
    auto rec = o ? consensus_from_object(*o) : std::nullopt;
    if (!rec) {
      r.errors.push_back({r.name, r.severity, key, "consensus record cannot be decoded"});
    } else if (!events.contains(rec->event_id)) {
      r.errors.push_back({r.name, r.severity, key, "consensus references missing event " + rec->event_id});
    }
  }
  r.passed = r.errors.empty();
  return r;
}

CheckResult ConsistencyChecker::check_precedent_validity() const {
  CheckResult r;
  r.name = "precedent_validity";
  r.description = "Precedents declare applicable event types and a positive validity window";
  r.severity = "medium";
  const uint64_t now = clock_now(clock_);

  for (const auto& key : store_.list_keys(collections::kRulings)) {
    auto text = store_.get(collections::kRulings, key);
    if (!text) continue;
    std::optional<jsonlite::JsonError> err;
    auto ruling = ruling_from_object(jsonlite::parse(*text, &err));
    if (err || !ruling || !ruling->precedent_created) continue;
    if (ruling->applicable_event_types.empty()) {
      r.errors.push_back({r.name, r.severity, key, "precedent has no applicable event types"});
    }
    if (ruling->validity_days == 0) {
      r.errors.push_back({r.name, r.severity, key, "precedent has no validity window"});
    } else if (ruling->expired_at(now)) {
      r.notes.push_back("expired precedent: " + ruling->event_id);
    }
  }
  r.passed = r.errors.empty();
  return r;
}

ConsistencyReport ConsistencyChecker::run_check() {
  ConsistencyReport report;
  report.timestamp_unix_ms = clock_now(clock_);
  report.checks.push_back(check_chain_integrity());
  report.checks.push_back(check_event_references());
  report.checks.push_back(check_classification_links());
  report.checks.push_back(check_case_consistency());
  report.checks.push_back(check_precedent_validity());

  report.checks_run = report.checks.size();
  for (const auto& c : report.checks) {
    if (!c.passed) ++report.checks_failed;
    report.total_errors += c.errors.size();
    for (const auto& i : c.errors) {
      if (i.severity == "critical") report.critical_errors.push_back(i);
    }
  }
  report.status = report.total_errors == 0 ? "healthy" : "degraded";

  GovernanceEvent ev;
  ev.kind = GovernanceEventKind::consistency_check;
  ev.ok = report.healthy();
  ev.detail = report.status + " errors=" + std::to_string(report.total_errors);
  ev.timestamp_unix_ms = report.timestamp_unix_ms;
  emit_governance_event(std::move(ev));

  std::lock_guard<std::mutex> lk(mu_);
  last_report_ = report;
  return report;
}

std::optional<ConsistencyReport> ConsistencyChecker::last_report() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_report_;
}

}  // namespace ecp
