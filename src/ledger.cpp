#include "ecp/ledger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "ecp/hash.hpp"

namespace fs = std::filesystem;

namespace ecp {

using jsonlite::Object;
using jsonlite::Value;

// ---------------------------------------------------------------------------
// LedgerEntry <-> JSON
// ---------------------------------------------------------------------------

std::string compute_entry_hash(const LedgerEntry& e) {
  Object hashed;
  hashed["entry_type"] = Value{e.entry_type};
  hashed["payload"] = Value{e.payload};
  hashed["previous_hash"] = Value{e.previous_hash};
  hashed["timestamp_unix_ms"] = Value{e.timestamp_unix_ms};
  return ledger_entry_hash(jsonlite::to_json(hashed));
}

std::string ledger_entry_to_json(const LedgerEntry& e) {
  Object o;
  o["id"] = Value{e.id};
  o["sequence"] = Value{e.sequence};
  o["timestamp_unix_ms"] = Value{e.timestamp_unix_ms};
  o["entry_type"] = Value{e.entry_type};
  o["payload"] = Value{e.payload};
  o["previous_hash"] = Value{e.previous_hash};
  o["hash"] = Value{e.hash};
  return jsonlite::to_json(o);
}

std::optional<LedgerEntry> ledger_entry_from_json(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  auto o = jsonlite::parse(line, &err);
  if (err) return std::nullopt;

  auto str = [&](const char* k) -> const std::string* {
    auto it = o.find(k);
    if (it == o.end() || !it->second.is_string()) return nullptr;
    return &std::get<std::string>(it->second.v);
  };
  auto u64 = [&](const char* k) -> std::optional<uint64_t> {
    auto it = o.find(k);
    if (it == o.end() || !it->second.is_u64()) return std::nullopt;
    return std::get<std::uint64_t>(it->second.v);
  };

  const auto* id = str("id");
  const auto* type = str("entry_type");
  const auto* prev = str("previous_hash");
  const auto* hash = str("hash");
  auto seq = u64("sequence");
  auto ts = u64("timestamp_unix_ms");
  auto pit = o.find("payload");
  if (!id || !type || !prev || !hash || !seq || !ts || pit == o.end() || !pit->second.is_object()) {
    return std::nullopt;
  }

  LedgerEntry e;
  e.id = *id;
  e.entry_type = *type;
  e.previous_hash = *prev;
  e.hash = *hash;
  e.sequence = *seq;
  e.timestamp_unix_ms = *ts;
  e.payload = std::get<Object>(pit->second.v);
  return e;
}

// ---------------------------------------------------------------------------
// IntegrityReport
// ---------------------------------------------------------------------------

std::string to_string(IntegrityFailure f) {
  switch (f) {
    case IntegrityFailure::none: return "none";
    case IntegrityFailure::chain_link_break: return "chain_link_break";
    case IntegrityFailure::hash_mismatch: return "hash_mismatch";
    case IntegrityFailure::malformed_entry: return "malformed_entry";
  }
  return "none";
}

std::string IntegrityReport::to_json() const {
  Object o;
  o["ok"] = Value{ok};
  o["failure"] = Value{to_string(failure)};
  o["index"] = Value{index};
  o["entry_id"] = Value{entry_id};
  o["detail"] = Value{detail};
  o["entries_checked"] = Value{entries_checked};
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// Ledger
// ---------------------------------------------------------------------------

Ledger::Ledger(std::string path, Clock clock) : path_(std::move(path)), clock_(std::move(clock)) {
  if (path_.empty()) return;

  const fs::path p(path_);
  if (p.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
  }
  load_existing();
  file_ = std::fopen(path_.c_str(), "a");
}

Ledger::~Ledger() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

void Ledger::load_existing() {
  std::ifstream ifs(path_);
  if (!ifs) return;
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    Slot slot;
    auto e = ledger_entry_from_json(line);
    if (e) {
      slot.entry = std::move(*e);
      if (!index_.contains(slot.entry.id)) index_[slot.entry.id] = slots_.size();
    } else {
      // Kept as a placeholder so verification reports the exact position.
      slot.malformed = true;
      slot.raw = line;
      slot.entry.sequence = slots_.size();
      ++malformed_count_;
    }
    slots_.push_back(std::move(slot));
  }
}

std::optional<LedgerEntry> Ledger::append(const std::string& entry_type,
                                          const Object& payload,
                                          const std::string& id,
                                          ErrorCode* error) {
  std::lock_guard<std::mutex> lk(mu_);
  if (error) *error = ErrorCode::none;

  if (!id.empty() && index_.contains(id)) {
    if (error) *error = ErrorCode::replay_rejected;
    return std::nullopt;
  }

  LedgerEntry e;
  e.sequence = slots_.size();
  e.timestamp_unix_ms = clock_now(clock_);
  e.entry_type = entry_type;
  e.payload = payload;
  e.previous_hash = slots_.empty() ? kGenesisHash : slots_.back().entry.hash;
  e.hash = compute_entry_hash(e);
  e.id = id.empty() ? "led_" + e.hash.substr(0, 16) : id;

  if (!path_.empty()) {
    if (!file_) {
      ++failure_count_;
      if (error) *error = ErrorCode::ledger_write_failed;
      return std::nullopt;
    }
    // Seek to end before writing to guarantee append-only, even if the file
    // position was changed externally.
    std::fseek(file_, 0, SEEK_END);
    const long pre_write_pos = std::ftell(file_);
    const std::string line = ledger_entry_to_json(e) + "\n";
    const bool written = std::fwrite(line.data(), 1, line.size(), file_) == line.size();
    const bool flushed = std::fflush(file_) == 0;
    const long post_write_pos = std::ftell(file_);
    if (!written || !flushed || pre_write_pos < 0 ||
        (post_write_pos >= 0 && post_write_pos < pre_write_pos + static_cast<long>(line.size()))) {
      drop_partial_line(pre_write_pos);
      ++failure_count_;
      if (error) *error = ErrorCode::ledger_write_failed;
      return std::nullopt;
    }
  }

  index_[e.id] = slots_.size();
  Slot slot;
  slot.entry = e;
  slots_.push_back(std::move(slot));
  return e;
}

// Called with mu_ held after a failed or short write. The stream is closed
// before truncating so no buffered bytes land after the cut. If the file
// cannot be cut back to its last complete line, the ledger stays closed and
// every later append fails with ledger_write_failed.
void Ledger::drop_partial_line(long pre_write_pos) {
  std::fclose(file_);
  file_ = nullptr;
  if (pre_write_pos < 0) return;
  std::error_code ec;
  fs::resize_file(path_, static_cast<std::uintmax_t>(pre_write_pos), ec);
  if (ec) return;
  file_ = std::fopen(path_.c_str(), "a");
}

std::optional<LedgerEntry> Ledger::get_last_entry() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (slots_.empty()) return std::nullopt;
  return slots_.back().entry;
}

std::optional<LedgerEntry> Ledger::find(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = index_.find(id);
  if (it == index_.end()) return std::nullopt;
  return slots_[it->second].entry;
}

bool Ledger::contains(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return index_.contains(id);
}

std::vector<LedgerEntry> Ledger::entries() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<LedgerEntry> out;
  out.reserve(slots_.size());
  for (const auto& s : slots_) {
    if (!s.malformed) out.push_back(s.entry);
  }
  return out;
}

std::size_t Ledger::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return slots_.size();
}

uint64_t Ledger::failure_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return failure_count_;
}

uint64_t Ledger::malformed_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return malformed_count_;
}

std::vector<IntegrityReport> Ledger::check_chain(const std::vector<Slot>& slots, bool stop_at_first) {
  std::vector<IntegrityReport> problems;
  const uint64_t n = slots.size();

  auto report = [&](IntegrityFailure f, uint64_t i, const std::string& detail) {
    IntegrityReport r;
    r.ok = false;
    r.failure = f;
    r.index = i;
    r.entry_id = slots[i].entry.id;
    r.detail = detail;
    r.entries_checked = n;
    problems.push_back(std::move(r));
  };

  for (uint64_t i = 0; i < n; ++i) {
    const Slot& s = slots[i];
    if (s.malformed) {
      report(IntegrityFailure::malformed_entry, i, "entry could not be decoded");
      if (stop_at_first) return problems;
      continue;
    }
    const LedgerEntry& e = s.entry;

    // Links are checked before content so that a deleted or reordered entry
    // is reported as a chain break rather than as tampering.
    bool link_ok = true;
    if (e.sequence != i) {
      link_ok = false;
      report(IntegrityFailure::chain_link_break, i,
             "sequence " + std::to_string(e.sequence) + " at position " + std::to_string(i));
    } else if (i == 0 && e.previous_hash != kGenesisHash) {
      link_ok = false;
      report(IntegrityFailure::chain_link_break, i, "first entry does not link to genesis");
    } else if (i > 0 && !slots[i - 1].malformed && e.previous_hash != slots[i - 1].entry.hash) {
      link_ok = false;
      report(IntegrityFailure::chain_link_break, i, "previous_hash does not match predecessor");
    }
    if (!link_ok && stop_at_first) return problems;

    if (compute_entry_hash(e) != e.hash) {
      report(IntegrityFailure::hash_mismatch, i, "stored hash differs from recomputed hash");
      if (stop_at_first) return problems;
    }
  }
  return problems;
}

IntegrityReport Ledger::verify_integrity() const {
  std::vector<Slot> snapshot;
  {
    std::lock_guard<std::mutex> lk(mu_);
    snapshot = slots_;
  }
  auto problems = check_chain(snapshot, true);
  if (!problems.empty()) return problems.front();
  IntegrityReport ok;
  ok.entries_checked = snapshot.size();
  return ok;
}

std::vector<IntegrityReport> Ledger::audit_chain() const {
  std::vector<Slot> snapshot;
  {
    std::lock_guard<std::mutex> lk(mu_);
    snapshot = slots_;
  }
  return check_chain(snapshot, false);
}

}  // namespace ecp
