#pragma once

// ecp/consensus.hpp - Pairwise divergence between classifications of one event.
//
// DESIGN INVARIANTS:
//   1. SYMMETRY: divergence(a, b) == divergence(b, a) for every policy. Each
//      term is an absolute difference, so operand order cannot matter.
//   2. PURITY: compute_consensus() depends only on the classification set and
//      the policy. computed_at_unix_ms is the newest classification timestamp,
//      so rescoring an unchanged set produces byte-identical output.
//   3. NO SINGLE-OPINION CONSENSUS: fewer than two classifications yield
//      std::nullopt, never a divergence of zero.
//   4. UNETHICAL OVERRIDE: any unethical classification forces human review
//      regardless of the numeric divergence.
//
// EXTENSION_POINT: confidence_weighted_aggregation
//   Current: aggregate = max (default) or mean of pairwise scores.
//   Upgrade path: weight each pair by the product of confidences so a low-
//   confidence dissenter counts for less. Must keep INVARIANT 4.

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "ecp/consistency.hpp"
#include "ecp/record_store.hpp"
#include "ecp/types.hpp"

namespace ecp {

enum class Aggregation { max, mean };

std::string to_string(Aggregation a);
std::optional<Aggregation> aggregation_from_string(const std::string& s);

struct ConsensusWeights {
  double status{0.5};
  double confidence{0.2};
  double risk{0.3};
};

struct ConsensusPolicy {
  // Indexed by ordinal: ethical, permissible, questionable, unethical.
  std::array<double, 4> status_scale{0.0, 1.0 / 3.0, 2.0 / 3.0, 1.0};
  // Indexed by ordinal: low, medium, high.
  std::array<double, 3> risk_scale{0.0, 0.5, 1.0};
  ConsensusWeights weights;
  double review_threshold{0.3};
  Aggregation aggregation{Aggregation::max};
};

std::size_t status_ordinal(EthicalStatus s);
std::size_t risk_ordinal(RiskEstimate r);

double divergence(const Classification& a, const Classification& b, const ConsensusPolicy& policy);

// Pure scoring of a classification set for one event.
std::optional<ConsensusRecord> compute_consensus(const std::string& event_id,
                                                 std::vector<Classification> classifications,
                                                 const ConsensusPolicy& policy);

class ConsensusScorer {
 public:
  ConsensusScorer(const ImmutabilityGuard& guard, IRecordStore& store, ConsensusPolicy policy = {});

  // Scores the current classification set and overwrites consensus/<event_id>.
  // Returns std::nullopt with fewer than two classifications; nothing is
  // written in that case. *error is set to store_write_failed when the record
  // could not be persisted (the computed record is still returned).
  std::optional<ConsensusRecord> score_event(const std::string& event_id, ErrorCode* error = nullptr);

  std::optional<ConsensusRecord> stored_record(const std::string& event_id) const;
  const ConsensusPolicy& policy() const { return policy_; }

 private:
  const ImmutabilityGuard& guard_;
  IRecordStore& store_;
  ConsensusPolicy policy_;
};

}  // namespace ecp
