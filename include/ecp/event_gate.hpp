#pragma once

// ecp/event_gate.hpp - Mandatory ingress for every decision.
//
// DESIGN INVARIANTS:
//   1. NOTHING UNVALIDATED IS WRITTEN: a decision missing any of the five
//      context fields (or carrying an invalid one) is rejected before the
//      ledger is touched, and the rejection names every offending field.
//   2. CONTENT-ADDRESSED IDS: event_id is derived from (action_type,
//      description, canonical payload), so an identical resubmission maps to
//      the same id and is rejected as a replay instead of double-appended.
//   3. NO UNCLASSIFIED AGENCY: when agency is present the acting agent's
//      self-classification is stored; if that fails in any way the fallback
//      classification is stored instead.
//
// EXTENSION_POINT: self_classifier
//   Current: DefaultSelfClassifier returns a fixed permissible assessment.
//   Upgrade path: an ISelfClassifier that asks the acting agent for its own
//   assessment. It may fail or throw; the gate handles both.

#include <memory>
#include <string>
#include <vector>

#include "ecp/consistency.hpp"
#include "ecp/ledger.hpp"
#include "ecp/types.hpp"

namespace ecp {

class ViolationTracker;

// "evt_" + first 16 hex of H("evt:" || canonical([action_type, description, payload])).
// The JSON array keeps field boundaries unambiguous when fields contain ':'.
std::string compute_event_id(const std::string& action_type,
                             const std::string& description,
                             const jsonlite::Object& payload);

// Values stored when self-classification fails.
constexpr EthicalStatus kFallbackStatus = EthicalStatus::questionable;
constexpr double kFallbackConfidence = 0.5;
constexpr RiskEstimate kFallbackRisk = RiskEstimate::medium;
inline constexpr const char* kRequiresExternalReview = "requires_external_review";

struct SelfAssessment {
  bool ok{true};
  EthicalStatus ethical_status{EthicalStatus::permissible};
  double confidence{0.0};
  RiskEstimate risk_estimate{RiskEstimate::low};
  std::string reasoning;
  std::vector<std::string> constraints;
  std::string error;  // set when !ok
};

class ISelfClassifier {
 public:
  virtual ~ISelfClassifier() = default;
  virtual SelfAssessment assess(const std::string& event_id,
                                const Decision& decision,
                                const DecisionContext& context) = 0;
};

class DefaultSelfClassifier : public ISelfClassifier {
 public:
  SelfAssessment assess(const std::string& event_id,
                        const Decision& decision,
                        const DecisionContext& context) override;
};

struct GateResult {
  bool ok{false};
  std::string event_id;
  ErrorCode error{ErrorCode::none};
  std::vector<std::string> missing_fields;
  bool self_classified{false};
  bool self_classification_fallback{false};
  std::string detail;

  std::string to_json() const;
};

class EventGate {
 public:
  // tracker may be null (no violation recording).
  EventGate(Ledger& ledger,
            ImmutabilityGuard& guard,
            ViolationTracker* tracker = nullptr,
            std::shared_ptr<ISelfClassifier> self_classifier = nullptr);

  GateResult enforce_decision(const Decision& decision);

  // Field-level validation only; writes nothing.
  static std::vector<std::string> validate(const Decision& decision);

 private:
  void self_classify(const std::string& event_id, const Decision& decision,
                     const DecisionContext& context, GateResult& result);

  Ledger& ledger_;
  ImmutabilityGuard& guard_;
  ViolationTracker* tracker_;
  std::shared_ptr<ISelfClassifier> self_classifier_;
};

}  // namespace ecp
