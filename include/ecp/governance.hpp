#pragma once

// ecp/governance.hpp - The enforcement authority: one explicitly constructed
// service owning storage, ledger and every governance component.
//
// DESIGN INVARIANTS:
//   1. ONE AUTHORITY PER DATA ROOT: there is no global instance. Callers
//      construct a GovernanceService and pass it by reference. Running two
//      services over the same data root is a deployment error (the ledger
//      would fork).
//   2. FAIL-CLOSED INGRESS: every decision passes EventGate before anything
//      else sees it.
//   3. ONE CONSENSUS ESCALATION PER EVENT: escalations/esc_<event_id> is
//      created at most once. Rescoring never duplicates it, and a resolved
//      escalation is never reopened.
//
// Component wiring (construction order = member order):
//   store -> ledger -> tracker -> guard -> gate -> scorer -> rulings -> checker
//
// EXTENSION_POINT: multi_process_writers
//   Current: a single process owns the data root.
//   Upgrade path: funnel appends through one committer process and let other
//   processes submit over IPC. Ledger::append stays the only writer.

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "ecp/config.hpp"
#include "ecp/consensus.hpp"
#include "ecp/consistency.hpp"
#include "ecp/event_gate.hpp"
#include "ecp/ledger.hpp"
#include "ecp/notify.hpp"
#include "ecp/record_store.hpp"
#include "ecp/ruling.hpp"
#include "ecp/types.hpp"
#include "ecp/violation.hpp"

namespace ecp {

struct ClassifyResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  uint64_t revision{0};
  std::string detail;

  std::string to_json() const;
};

struct ScoreResult {
  std::optional<ConsensusRecord> record;  // empty with fewer than two classifications
  std::optional<Escalation> escalation;   // set when review is required
  ErrorCode error{ErrorCode::none};

  std::string to_json() const;
};

// Dependencies a caller may inject. Null members fall back to what the
// config describes.
struct GovernanceDeps {
  std::unique_ptr<IRecordStore> store;
  std::shared_ptr<IEscalationNotifier> notifier;
  std::shared_ptr<ISelfClassifier> self_classifier;
  Clock clock;
};

class GovernanceService {
 public:
  explicit GovernanceService(GovernanceConfig config, GovernanceDeps deps = {});

  GovernanceService(const GovernanceService&) = delete;
  GovernanceService& operator=(const GovernanceService&) = delete;

  GateResult enforce_decision(const Decision& decision);

  ClassifyResult classify_event(const std::string& event_id,
                                const std::string& classifier_id,
                                EthicalStatus ethical_status,
                                double confidence,
                                RiskEstimate risk_estimate,
                                const std::string& reasoning);

  // Scores the event, then escalates when review is required: a matching
  // unexpired precedent resolves the escalation immediately, otherwise it
  // waits for a human ruling.
  ScoreResult score_event(const std::string& event_id);

  // Stores the ruling and resolves a pending consensus escalation for the event.
  ErrorCode create_ruling(HumanRuling& ruling, std::string* detail = nullptr);

  std::string record_violation(const std::string& violation_type,
                               Severity severity,
                               const std::string& message,
                               const std::string& agent_id = "",
                               const std::string& function_name = "",
                               const std::map<std::string, std::string>& context = {});

  IntegrityReport verify_integrity() const;
  ConsistencyReport run_check();
  ViolationReport violation_report() const { return tracker_->report(); }
  std::optional<Escalation> escalation_for_event(const std::string& event_id) const;

  const GovernanceConfig& config() const { return config_; }
  IRecordStore& store() { return *store_; }
  Ledger& ledger() { return *ledger_; }
  ImmutabilityGuard& guard() { return *guard_; }
  ViolationTracker& violations() { return *tracker_; }
  ConsensusScorer& scorer() { return *scorer_; }
  RulingRegistry& rulings() { return *rulings_; }
  const ConsistencyChecker& checker() const { return *checker_; }

 private:
  std::optional<Escalation> escalate_consensus(const ConsensusRecord& record);

  GovernanceConfig config_;
  Clock clock_;
  std::unique_ptr<IRecordStore> store_;
  std::unique_ptr<Ledger> ledger_;
  std::unique_ptr<ViolationTracker> tracker_;
  std::unique_ptr<ImmutabilityGuard> guard_;
  std::unique_ptr<EventGate> gate_;
  std::unique_ptr<ConsensusScorer> scorer_;
  std::unique_ptr<RulingRegistry> rulings_;
  std::unique_ptr<ConsistencyChecker> checker_;
  std::mutex escalation_mu_;
};

}  // namespace ecp
