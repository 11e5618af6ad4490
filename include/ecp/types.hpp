#pragma once

// ecp/types.hpp - Core data structures for the ethical classification core.
//
// DESIGN INVARIANTS:
//   - Ethical status, risk, causation, severity and escalation state are closed
//     enums. Strings only appear at the serialization boundary, and every
//     *_from_string() returns std::nullopt for anything outside the closed set.
//   - All records are value types with value-owned strings. No borrowed
//     references, no raw pointer members.
//   - Serialization goes through jsonlite::Object so every persisted record is
//     canonical (sorted-key) JSON and its digest is reproducible.
//
// CONCURRENCY NOTES:
//   - Records are copied across component boundaries. Shared mutable state
//     lives only inside Ledger, ImmutabilityGuard and ViolationTracker.

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ecp/jsonlite.hpp"

namespace ecp {

enum class ErrorCode {
  none,
  ingress_rejected,
  replay_rejected,
  integrity_violation,
  classification_failure,
  compliance_violation,
  unknown_event,
  classification_invalid,
  ruling_exists,
  ruling_invalid,
  ledger_write_failed,
  store_write_failed,
  config_invalid,
  json_parse_error,
  json_duplicate_key,
  notify_failed,
};

std::string to_string(ErrorCode code);

// Injected time source. Empty means the system clock.
using Clock = std::function<uint64_t()>;
uint64_t now_unix_ms();
uint64_t clock_now(const Clock& clock);

constexpr uint64_t kMillisPerDay = 24ull * 60 * 60 * 1000;

// ---------------------------------------------------------------------------
// Closed enumerations
// ---------------------------------------------------------------------------

enum class Causation : uint8_t { natural, human, ai_decision, ai_assisted };
enum class EthicalStatus : uint8_t { ethical, permissible, questionable, unethical };
enum class RiskEstimate : uint8_t { low, medium, high };
enum class Severity : uint8_t { blocking, warning, audit };
enum class EscalationStatus : uint8_t { awaiting_human_review, resolved_by_precedent, resolved };
enum class EscalationSource : uint8_t { violation, consensus };

std::string to_string(Causation c);
std::string to_string(EthicalStatus s);
std::string to_string(RiskEstimate r);
std::string to_string(Severity s);
std::string to_string(EscalationStatus s);
std::string to_string(EscalationSource s);

std::optional<Causation> causation_from_string(const std::string& s);
std::optional<EthicalStatus> ethical_status_from_string(const std::string& s);
std::optional<RiskEstimate> risk_estimate_from_string(const std::string& s);
std::optional<Severity> severity_from_string(const std::string& s);
std::optional<EscalationStatus> escalation_status_from_string(const std::string& s);
std::optional<EscalationSource> escalation_source_from_string(const std::string& s);

// Identifiers used as record keys: [A-Za-z0-9._-], 1..128 chars, no leading '.'.
bool is_valid_identifier(const std::string& id);

// ---------------------------------------------------------------------------
// Decision ingress
// ---------------------------------------------------------------------------

// The five context fields every decision must carry.
inline const std::vector<std::string>& required_context_fields() {
  static const std::vector<std::string> kFields = {
      "causation", "agency_present", "duty_of_care", "knowledge_level", "control_level"};
  return kFields;
}

// A decision as submitted by a caller. The context stays a raw JSON object so
// that missing and mistyped fields can be reported individually.
struct Decision {
  std::string action_type;
  std::string description;
  jsonlite::Object payload;
  std::string agent_id;
  jsonlite::Object context;
};

// A context that passed validation.
struct DecisionContext {
  Causation causation{Causation::natural};
  bool agency_present{false};
  std::string duty_of_care;
  std::string knowledge_level;
  std::string control_level;
};

jsonlite::Object make_context(Causation causation, bool agency_present,
                              const std::string& duty_of_care,
                              const std::string& knowledge_level,
                              const std::string& control_level);
jsonlite::Object context_to_object(const DecisionContext& ctx);

struct ContextValidation {
  bool ok{false};
  DecisionContext context;
  std::vector<std::string> problems;  // field names, with a "(reason)" suffix for invalid values
};

ContextValidation validate_context(const jsonlite::Object& context);

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

struct Classification {
  std::string event_id;
  std::string classifier_id;
  EthicalStatus ethical_status{EthicalStatus::questionable};
  double confidence{0.0};
  RiskEstimate risk_estimate{RiskEstimate::medium};
  std::string reasoning;
  uint64_t timestamp_unix_ms{0};
  std::vector<std::string> constraints;
  uint64_t revision{0};  // assigned by ImmutabilityGuard, 1-based
};

jsonlite::Object to_object(const Classification& c);
std::optional<Classification> classification_from_object(const jsonlite::Object& o);
std::string classification_key(const std::string& event_id, const std::string& classifier_id);

// ---------------------------------------------------------------------------
// Consensus
// ---------------------------------------------------------------------------

struct PairDivergence {
  std::string classifier_a;
  std::string classifier_b;
  double score{0.0};
};

struct ClassifierBreakdown {
  std::string classifier_id;
  EthicalStatus ethical_status{EthicalStatus::questionable};
  double confidence{0.0};
  RiskEstimate risk_estimate{RiskEstimate::medium};
  double mean_divergence{0.0};
};

struct ConsensusRecord {
  std::string event_id;
  uint64_t computed_at_unix_ms{0};
  std::vector<PairDivergence> pairs;
  double divergence_score{0.0};         // mean of pairs
  double max_pairwise_divergence{0.0};
  double aggregate_divergence{0.0};     // per configured aggregation
  std::string aggregation;              // "max" | "mean"
  double threshold{0.0};
  bool requires_human_review{false};
  std::string trigger_reason;           // "", "unethical_classification", "divergence_threshold", or both joined with '+'
  std::vector<ClassifierBreakdown> breakdown;
  std::string classification_set_digest;
};

jsonlite::Object to_object(const ConsensusRecord& r);
std::optional<ConsensusRecord> consensus_from_object(const jsonlite::Object& o);

// ---------------------------------------------------------------------------
// Violations and escalations
// ---------------------------------------------------------------------------

struct Violation {
  std::string violation_id;
  std::string violation_type;
  Severity severity{Severity::audit};
  std::string message;
  uint64_t timestamp_unix_ms{0};
  std::string agent_id;
  std::string function_name;
  std::map<std::string, std::string> context;
};

jsonlite::Object to_object(const Violation& v);
std::optional<Violation> violation_from_object(const jsonlite::Object& o);

struct Escalation {
  std::string escalation_id;
  EscalationSource source{EscalationSource::violation};
  std::string subject_id;   // violation id or event id
  std::string reason;
  EscalationStatus status{EscalationStatus::awaiting_human_review};
  uint64_t created_at_unix_ms{0};
  uint64_t resolved_at_unix_ms{0};
  std::string resolved_by;  // ruling or precedent reference
};

jsonlite::Object to_object(const Escalation& e);
std::optional<Escalation> escalation_from_object(const jsonlite::Object& o);
// Violation ids and event ids carry distinct prefixes, so one key space suffices.
std::string escalation_key(const std::string& subject_id);

// ---------------------------------------------------------------------------
// Human rulings
// ---------------------------------------------------------------------------

struct HumanRuling {
  std::string event_id;
  std::string action_type;  // filled from the ledger when the ruling is stored
  std::string issued_by;
  EthicalStatus final_assessment{EthicalStatus::questionable};
  std::string reasoning;
  uint64_t issued_at_unix_ms{0};
  bool precedent_created{false};
  std::vector<std::string> applicable_event_types;
  uint64_t validity_days{0};

  bool covers(const std::string& action_type) const;
  bool expired_at(uint64_t now_ms) const;
};

jsonlite::Object to_object(const HumanRuling& r);
std::optional<HumanRuling> ruling_from_object(const jsonlite::Object& o);

}  // namespace ecp
