#pragma once

// ecp/consistency.hpp - Write-side guard and read-side audit battery for the
// ledger and the record store.
//
// ImmutabilityGuard is the only writer of classification records:
//   - a classification must reference a decision_event already in the ledger,
//   - an update never overwrites silently: the prior revision is archived to
//     classification_archive/<event>__<classifier>__r<revision> first,
//   - every stored revision is anchored in the ledger by a
//     classification_recorded entry carrying its record digest.
// Archive-then-write runs under a per-key lock, so two classifiers of the
// same event proceed concurrently while two writes for one key serialize.
//
// ConsistencyChecker runs every check and aggregates every failure. It never
// repairs anything.
//
// EXTENSION_POINT: scheduled_consistency_checks
//   Current: run on demand (CLI `ecp check`, GovernanceService::run_check()).
//   Upgrade path: a background timer that runs the battery and emits
//   consistency_check events with the status.

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "ecp/ledger.hpp"
#include "ecp/record_store.hpp"
#include "ecp/types.hpp"

namespace ecp {

// Ledger entry types written by this library.
namespace entry_types {
constexpr const char* kDecisionEvent = "decision_event";
constexpr const char* kClassificationRecorded = "classification_recorded";
}  // namespace entry_types

// ---------------------------------------------------------------------------
// ImmutabilityGuard
// ---------------------------------------------------------------------------
class ImmutabilityGuard {
 public:
  ImmutabilityGuard(Ledger& ledger, IRecordStore& store, Clock clock = {});

  // Validate and store a classification. Assigns c.revision, and stamps
  // c.timestamp_unix_ms when it is zero. Errors:
  //   unknown_event           event is not a decision_event in the ledger
  //   classification_invalid  bad classifier id or confidence outside [0,1]
  //   store_write_failed      archive or live write failed
  //   ledger_write_failed     record stored but its anchor could not be appended
  ErrorCode store_classification(Classification& c, std::string* detail = nullptr);

  std::optional<Classification> get_classification(const std::string& event_id,
                                                   const std::string& classifier_id) const;
  // Live classifications of an event, ordered by classifier id.
  std::vector<Classification> classifications_for(const std::string& event_id) const;
  // Every revision of one key, oldest first (archived revisions then the live one).
  std::vector<Classification> revision_history(const std::string& event_id,
                                               const std::string& classifier_id) const;

  bool is_decision_event(const std::string& event_id) const;
  std::vector<std::string> classified_events() const;

 private:
  static constexpr std::size_t kStripes = 64;
  std::mutex& stripe_for(const std::string& key);
  void load_index();

  Ledger& ledger_;
  IRecordStore& store_;
  Clock clock_;
  std::array<std::mutex, kStripes> stripes_;
  mutable std::mutex index_mu_;
  std::map<std::string, std::set<std::string>> by_event_;  // event id -> classifier ids
};

// ---------------------------------------------------------------------------
// ConsistencyChecker
// ---------------------------------------------------------------------------
struct ConsistencyIssue {
  std::string check;
  std::string severity;   // "critical" | "high" | "medium"
  std::string subject;    // entry id, record key, ...
  std::string message;
};

struct CheckResult {
  std::string name;
  std::string description;
  std::string severity;
  bool passed{true};
  std::vector<ConsistencyIssue> errors;
  std::vector<std::string> notes;  // informational (e.g. expired precedents)
};

struct ConsistencyReport {
  uint64_t timestamp_unix_ms{0};
  std::vector<CheckResult> checks;
  std::size_t checks_run{0};
  std::size_t checks_failed{0};
  std::size_t total_errors{0};
  std::string status;  // "healthy" | "degraded"
  std::vector<ConsistencyIssue> critical_errors;

  bool healthy() const { return status == "healthy"; }
  std::string to_json() const;
};

class ConsistencyChecker {
 public:
  ConsistencyChecker(const Ledger& ledger, const IRecordStore& store, Clock clock = {});

  ConsistencyReport run_check();
  std::optional<ConsistencyReport> last_report() const;

  CheckResult check_chain_integrity() const;
  CheckResult check_event_references() const;
  CheckResult check_classification_links() const;
  CheckResult check_case_consistency() const;
  CheckResult check_precedent_validity() const;

 private:
  std::set<std::string> decision_event_ids() const;

  const Ledger& ledger_;
  const IRecordStore& store_;
  Clock clock_;
  mutable std::mutex mu_;
  std::optional<ConsistencyReport> last_report_;
};

}  // namespace ecp
