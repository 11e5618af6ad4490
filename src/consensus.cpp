#include "ecp/consensus.hpp"

#include <algorithm>
#include <cmath>

#include "ecp/hash.hpp"
#include "ecp/observability.hpp"

namespace ecp {

std::string to_string(Aggregation a) {
  switch (a) {
    case Aggregation::max:
      return "max";
    case Aggregation::mean:
      return "mean";
  }
  return "max";
}

std::optional<Aggregation> aggregation_from_string(const std::string& s) {
  if (s == "max") return Aggregation::max;
  if (s == "mean") return Aggregation::mean;
  return std::nullopt;
}

std::size_t status_ordinal(EthicalStatus s) {
  switch (s) {
    case EthicalStatus::ethical:
      return 0;
    case EthicalStatus::permissible:
      return 1;
    case EthicalStatus::questionable:
      return 2;
    case EthicalStatus::unethical:
      return 3;
  }
  return 2;
}

std::size_t risk_ordinal(RiskEstimate r) {
  switch (r) {
    case RiskEstimate::low:
      return 0;
    case RiskEstimate::medium:
      return 1;
    case RiskEstimate::high:
      return 2;
  }
  return 1;
}

double divergence(const Classification& a, const Classification& b, const ConsensusPolicy& policy) {
  const double d_status =
      std::fabs(policy.status_scale[status_ordinal(a.ethical_status)] -
                policy.status_scale[status_ordinal(b.ethical_status)]);
  const double d_confidence = std::fabs(a.confidence - b.confidence);
  const double d_risk = std::fabs(policy.risk_scale[risk_ordinal(a.risk_estimate)] -
                                  policy.risk_scale[risk_ordinal(b.risk_estimate)]);
  return policy.weights.status * d_status + policy.weights.confidence * d_confidence +
         policy.weights.risk * d_risk;
}

std::optional<ConsensusRecord> compute_consensus(const std::string& event_id,
                                                 std::vector<Classification> classifications,
                                                 const ConsensusPolicy& policy) {
  if (classifications.size() < 2) return std::nullopt;
  std::sort(classifications.begin(), classifications.end(),
            [](const Classification& a, const Classification& b) { return a.classifier_id < b.classifier_id; });

  ConsensusRecord r;
  r.event_id = event_id;
  r.aggregation = to_string(policy.aggregation);
  r.threshold = policy.review_threshold;

  const std::size_t n = classifications.size();
  std::vector<double> per_classifier(n, 0.0);
  double sum = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      const double d = divergence(classifications[i], classifications[j], policy);
      r.pairs.push_back({classifications[i].classifier_id, classifications[j].classifier_id, d});
      r.max_pairwise_divergence = std::max(r.max_pairwise_divergence, d);
      sum += d;
      per_classifier[i] += d;
      per_classifier[j] += d;
    }
  }
  r.divergence_score = sum / static_cast<double>(r.pairs.size());
  r.aggregate_divergence =
      policy.aggregation == Aggregation::max ? r.max_pairwise_divergence : r.divergence_score;

  bool any_unethical = false;
  jsonlite::Array digest_input;
  for (std::size_t i = 0; i < n; ++i) {
    const auto& c = classifications[i];
    any_unethical = any_unethical || c.ethical_status == EthicalStatus::unethical;
    r.computed_at_unix_ms = std::max(r.computed_at_unix_ms, c.timestamp_unix_ms);
    r.breakdown.push_back({c.classifier_id, c.ethical_status, c.confidence, c.risk_estimate,
                           per_classifier[i] / static_cast<double>(n - 1)});
    digest_input.emplace_back(to_object(c));
  }
  r.classification_set_digest = record_digest(jsonlite::to_json(jsonlite::Value{std::move(digest_input)}));

  const bool over_threshold = r.aggregate_divergence >= policy.review_threshold;
  r.requires_human_review = any_unethical || over_threshold;
  if (any_unethical) r.trigger_reason = "unethical_classification";
  if (over_threshold) {
    if (!r.trigger_reason.empty()) r.trigger_reason += "+";
    r.trigger_reason += "divergence_threshold";
  }
  return r;
}

// ---------------------------------------------------------------------------
// ConsensusScorer
// ---------------------------------------------------------------------------

ConsensusScorer::ConsensusScorer(const ImmutabilityGuard& guard, IRecordStore& store, ConsensusPolicy policy)
    : guard_(guard), store_(store), policy_(policy) {}

std::optional<ConsensusRecord> ConsensusScorer::score_event(const std::string& event_id, ErrorCode* error) {
  if (error) *error = ErrorCode::none;
  auto record = compute_consensus(event_id, guard_.classifications_for(event_id), policy_);
  if (!record) return std::nullopt;

  const bool stored = store_.put(collections::kConsensus, event_id, jsonlite::to_json(to_object(*record)));
  if (!stored && error) *error = ErrorCode::store_write_failed;

  GovernanceEvent ev;
  ev.kind = GovernanceEventKind::consensus_scored;
  ev.subject_id = event_id;
  ev.ok = stored;
  if (!stored) ev.error_code = to_string(ErrorCode::store_write_failed);
  ev.detail = "aggregate=" + jsonlite::format_double(record->aggregate_divergence) +
              " pairs=" + std::to_string(record->pairs.size());
  emit_governance_event(ev);
  if (record->requires_human_review) {
    ev.kind = GovernanceEventKind::review_required;
    ev.detail = record->trigger_reason;
    emit_governance_event(std::move(ev));
  }
  return record;
}

std::optional<ConsensusRecord> ConsensusScorer::stored_record(const std::string& event_id) const {
  auto text = store_.get(collections::kConsensus, event_id);
  if (!text) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(*text, &err);
  if (err) return std::nullopt;
  return consensus_from_object(obj);
}

}  // namespace ecp
