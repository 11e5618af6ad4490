#pragma once

// ecp/ledger.hpp - Append-only, hash-chained event ledger.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: entries are never modified or deleted, in memory or on disk.
//   2. SEQUENTIAL: entry[i].sequence == i.
//   3. CHAINED: entry[0].previous_hash == kGenesisHash and
//      entry[i].previous_hash == entry[i-1].hash for i > 0.
//   4. SELF-HASHED: entry.hash == H("led:" || canonical{entry_type, payload,
//      previous_hash, timestamp_unix_ms}). Canonical JSON sorts keys, so the
//      hash does not depend on the order in which payload fields were built.
//   5. STRUCTURED: on disk every entry is a single-line JSON object (NDJSON).
//   6. NO REPAIR: loading never rewrites the file and never refuses to open a
//      damaged one. Problems surface only through verify_integrity() and
//      audit_chain().
//
// EXTENSION_POINT: ledger_checkpoints
//   Current: verify_integrity() walks the whole chain.
//   Upgrade path: persist signed checkpoints (sequence, hash) every N entries
//   and verify incrementally from the latest trusted checkpoint.
//   Invariant: LEDGER_FORMAT_VERSION must be bumped before any change to the
//   hashed field set.

#include <cstdint>
#include <cstdio>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ecp/jsonlite.hpp"
#include "ecp/types.hpp"

namespace ecp {

// Link value of the first entry: 64 '0' characters.
inline const std::string kGenesisHash(64, '0');

// ---------------------------------------------------------------------------
// LedgerEntry
// ---------------------------------------------------------------------------
struct LedgerEntry {
  std::string id;
  uint64_t sequence{0};
  uint64_t timestamp_unix_ms{0};
  std::string entry_type;         // "decision_event", "classification_recorded", ...
  jsonlite::Object payload;
  std::string previous_hash;
  std::string hash;
};

// Recompute the content hash of an entry from its hashed fields.
std::string compute_entry_hash(const LedgerEntry& e);

// Serialize to compact single-line canonical JSON (suitable for NDJSON append).
std::string ledger_entry_to_json(const LedgerEntry& e);
std::optional<LedgerEntry> ledger_entry_from_json(const std::string& line);

// ---------------------------------------------------------------------------
// Integrity reporting
// ---------------------------------------------------------------------------
enum class IntegrityFailure {
  none,
  chain_link_break,  // sequence or previous_hash does not match the predecessor
  hash_mismatch,     // stored hash differs from the recomputed content hash
  malformed_entry,   // stored line could not be decoded
};

std::string to_string(IntegrityFailure f);

struct IntegrityReport {
  bool ok{true};
  IntegrityFailure failure{IntegrityFailure::none};
  uint64_t index{0};        // position in the chain of the offending entry
  std::string entry_id;
  std::string detail;
  uint64_t entries_checked{0};

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// Ledger
// ---------------------------------------------------------------------------
// Thread-safe: one mutex serializes appends. Readers receive copies.
// Each write is followed by fflush() to minimize data loss on crash.
class Ledger {
 public:
  // path: filesystem path of the NDJSON file. Created if absent; existing
  // entries are loaded. Empty path keeps the ledger in memory only.
  explicit Ledger(std::string path = "", Clock clock = {});
  ~Ledger();

  Ledger(const Ledger&) = delete;
  Ledger& operator=(const Ledger&) = delete;

  // Append a new entry. If id is non-empty and already present, nothing is
  // written and *error is set to replay_rejected. The check and the append
  // happen under one lock. Write failures set ledger_write_failed and leave
  // the in-memory chain unchanged.
  std::optional<LedgerEntry> append(const std::string& entry_type,
                                    const jsonlite::Object& payload,
                                    const std::string& id = "",
                                    ErrorCode* error = nullptr);

  std::optional<LedgerEntry> get_last_entry() const;
  std::optional<LedgerEntry> find(const std::string& id) const;
  bool contains(const std::string& id) const;
  std::vector<LedgerEntry> entries() const;
  std::size_t size() const;

  // First problem in the chain, or ok.
  IntegrityReport verify_integrity() const;
  // Every problem in the chain (empty when intact).
  std::vector<IntegrityReport> audit_chain() const;

  uint64_t failure_count() const;
  uint64_t malformed_count() const;
  const std::string& path() const { return path_; }

 private:
  struct Slot {
    LedgerEntry entry;
    bool malformed{false};
    std::string raw;
  };

  void load_existing();
  void drop_partial_line(long pre_write_pos);
  static std::vector<IntegrityReport> check_chain(const std::vector<Slot>& slots,
                                                  bool stop_at_first);

  std::string path_;
  Clock clock_;
  mutable std::mutex mu_;
  FILE* file_{nullptr};
  std::vector<Slot> slots_;
  std::map<std::string, std::size_t> index_;
  uint64_t failure_count_{0};
  uint64_t malformed_count_{0};
};

}  // namespace ecp
