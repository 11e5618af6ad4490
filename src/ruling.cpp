#include "ecp/ruling.hpp"

#include "ecp/consistency.hpp"
#include "ecp/observability.hpp"

namespace ecp {

RulingRegistry::RulingRegistry(IRecordStore& store, const Ledger& ledger, Clock clock)
    : store_(store), ledger_(ledger), clock_(std::move(clock)) {
  load_existing();
}

void RulingRegistry::load_existing() {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& key : store_.list_keys(collections::kRulings)) {
    auto text = store_.get(collections::kRulings, key);
    if (!text) continue;
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(*text, &err);
    if (err) continue;
    auto r = ruling_from_object(obj);
    if (r) rulings_[r->event_id] = std::move(*r);
  }
}

ErrorCode RulingRegistry::create_ruling(HumanRuling& ruling, std::string* detail) {
  auto reject = [&](ErrorCode code, const std::string& why) {
    if (detail) *detail = why;
    return code;
  };

  auto entry = ledger_.find(ruling.event_id);
  if (!entry || entry->entry_type != entry_types::kDecisionEvent) {
    return reject(ErrorCode::unknown_event, "no decision_event " + ruling.event_id + " in ledger");
  }
  if (ruling.issued_by.empty()) {
    return reject(ErrorCode::ruling_invalid, "issued_by is required");
  }
  if (ruling.precedent_created && ruling.validity_days == 0) {
    return reject(ErrorCode::ruling_invalid, "a precedent needs a positive validity_days");
  }
  if (ruling.precedent_created && ruling.applicable_event_types.empty()) {
    ruling.applicable_event_types.push_back(jsonlite::get_string(entry->payload, "action_type"));
  }

  ruling.action_type = jsonlite::get_string(entry->payload, "action_type");
  if (ruling.issued_at_unix_ms == 0) ruling.issued_at_unix_ms = clock_now(clock_);

  {
    std::lock_guard<std::mutex> lk(mu_);
    if (rulings_.contains(ruling.event_id) || store_.contains(collections::kRulings, ruling.event_id)) {
      return reject(ErrorCode::ruling_exists, "event " + ruling.event_id + " already has a ruling");
    }
    if (!store_.put(collections::kRulings, ruling.event_id, jsonlite::to_json(to_object(ruling)))) {
      return reject(ErrorCode::store_write_failed, "writing ruling failed");
    }
    rulings_[ruling.event_id] = ruling;
  }

  GovernanceEvent ev;
  ev.kind = GovernanceEventKind::ruling_created;
  ev.subject_id = ruling.event_id;
  ev.agent_id = ruling.issued_by;
  ev.detail = to_string(ruling.final_assessment) + (ruling.precedent_created ? " precedent" : "");
  emit_governance_event(std::move(ev));
  return ErrorCode::none;
}

std::optional<HumanRuling> RulingRegistry::find(const std::string& event_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = rulings_.find(event_id);
  if (it == rulings_.end()) return std::nullopt;
  return it->second;
}

std::optional<HumanRuling> RulingRegistry::find_precedent(const std::string& action_type,
                                                          uint64_t now_ms) const {
  std::lock_guard<std::mutex> lk(mu_);
  const HumanRuling* best = nullptr;
  for (const auto& [_, r] : rulings_) {
    if (!r.covers(action_type) || r.expired_at(now_ms)) continue;
    if (!best || r.issued_at_unix_ms > best->issued_at_unix_ms) best = &r;
  }
  if (!best) return std::nullopt;
  return *best;
}

std::vector<HumanRuling> RulingRegistry::precedents() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<HumanRuling> out;
  for (const auto& [_, r] : rulings_) {
    if (r.precedent_created) out.push_back(r);
  }
  return out;
}

std::size_t RulingRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return rulings_.size();
}

}  // namespace ecp
