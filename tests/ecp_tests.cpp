#include <sys/resource.h>

#include <atomic>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ecp/config.hpp"
#include "ecp/consensus.hpp"
#include "ecp/consistency.hpp"
#include "ecp/event_gate.hpp"
#include "ecp/governance.hpp"
#include "ecp/hash.hpp"
#include "ecp/jsonlite.hpp"
#include "ecp/ledger.hpp"
#include "ecp/notify.hpp"
#include "ecp/observability.hpp"
#include "ecp/record_store.hpp"
#include "ecp/ruling.hpp"
#include "ecp/version.hpp"
#include "ecp/violation.hpp"

namespace fs = std::filesystem;
using ecp::jsonlite::Object;
using ecp::jsonlite::Value;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ---------------------------------------------------------------------------
// Fixtures
// ---------------------------------------------------------------------------

constexpr uint64_t kEpochMs = 1700000000000ull;
std::atomic<uint64_t> g_now{kEpochMs};

ecp::Clock test_clock() {
  return [] { return g_now.load(); };
}

std::mutex g_events_mu;
std::vector<ecp::GovernanceEvent> g_events;

void capture_event(const ecp::GovernanceEvent& ev) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  g_events.push_back(ev);
}

size_t count_events(ecp::GovernanceEventKind kind) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  size_t n = 0;
  for (const auto& e : g_events)
    if (e.kind == kind) ++n;
  return n;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / "ecp_tests" / name;
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir, ec);
  return dir;
}

std::vector<std::string> read_lines(const fs::path& p) {
  std::ifstream ifs(p);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(ifs, line))
    if (!line.empty()) lines.push_back(line);
  return lines;
}

void write_lines(const fs::path& p, const std::vector<std::string>& lines) {
  std::ofstream ofs(p, std::ios::trunc);
  for (const auto& l : lines) ofs << l << "\n";
}

// Caps the size of any file this process writes (RLIMIT_FSIZE) for the
// lifetime of the object. SIGXFSZ is ignored meanwhile, so an oversized
// write fails with EFBIG after writing what fits.
class FileSizeCap {
 public:
  explicit FileSizeCap(std::uintmax_t bytes) {
    ::getrlimit(RLIMIT_FSIZE, &saved_);
    previous_handler_ = std::signal(SIGXFSZ, SIG_IGN);
    rlimit cap = saved_;
    cap.rlim_cur = static_cast<rlim_t>(bytes);
    expect(::setrlimit(RLIMIT_FSIZE, &cap) == 0, "file size cap installed");
  }
  ~FileSizeCap() {
    ::setrlimit(RLIMIT_FSIZE, &saved_);
    std::signal(SIGXFSZ, previous_handler_);
  }
  FileSizeCap(const FileSizeCap&) = delete;
  FileSizeCap& operator=(const FileSizeCap&) = delete;

 private:
  rlimit saved_{};
  void (*previous_handler_)(int) = SIG_DFL;
};

std::unique_ptr<ecp::GovernanceService> make_service(ecp::GovernanceDeps deps = {}) {
  ecp::GovernanceConfig cfg;
  cfg.in_memory = true;
  if (!deps.clock) deps.clock = test_clock();
  return std::make_unique<ecp::GovernanceService>(cfg, std::move(deps));
}

ecp::Decision make_decision(const std::string& action, const std::string& description,
                            bool agency = true, const std::string& agent = "agent-1") {
  ecp::Decision d;
  d.action_type = action;
  d.description = description;
  d.payload["amount"] = Value{static_cast<std::uint64_t>(1000)};
  d.payload["currency"] = Value{"EUR"};
  d.agent_id = agent;
  d.context = ecp::make_context(ecp::Causation::ai_decision, agency, "low", "full", "direct");
  return d;
}

ecp::Classification make_classification(const std::string& classifier, ecp::EthicalStatus s,
                                         double confidence, ecp::RiskEstimate r,
                                         uint64_t ts = kEpochMs) {
  ecp::Classification c;
  c.event_id = "evt_test";
  c.classifier_id = classifier;
  c.ethical_status = s;
  c.confidence = confidence;
  c.risk_estimate = r;
  c.timestamp_unix_ms = ts;
  return c;
}

class ThrowingClassifier : public ecp::ISelfClassifier {
 public:
  ecp::SelfAssessment assess(const std::string&, const ecp::Decision&,
                             const ecp::DecisionContext&) override {
    throw std::runtime_error("model backend unreachable");
  }
};

class RefusingClassifier : public ecp::ISelfClassifier {
 public:
  ecp::SelfAssessment assess(const std::string&, const ecp::Decision&,
                             const ecp::DecisionContext&) override {
    ecp::SelfAssessment a;
    a.ok = false;
    a.error = "agent declined to self-assess";
    return a;
  }
};

class ThrowingNotifier : public ecp::IEscalationNotifier {
 public:
  ecp::NotifyResult notify(const ecp::Escalation&, const ecp::Violation&) override {
    throw std::runtime_error("notifier crashed");
  }
  std::string notifier_id() const override { return "throwing"; }
};

class CountingNotifier : public ecp::IEscalationNotifier {
 public:
  ecp::NotifyResult notify(const ecp::Escalation& e, const ecp::Violation&) override {
    std::lock_guard<std::mutex> lk(mu);
    seen.push_back(e.escalation_id);
    return {true, "ok"};
  }
  std::string notifier_id() const override { return "counting"; }
  std::mutex mu;
  std::vector<std::string> seen;
};

// ============================================================================
// Phase 1: Hashing & Canonical JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(ecp::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(ecp::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string material = "{\"a\":1}";
  expect(ecp::ledger_entry_hash(material) != ecp::event_id_hash(material),
         "ledger and event domains must differ");
  expect(ecp::event_id_hash(material) != ecp::record_digest(material),
         "event and record domains must differ");
  expect(ecp::is_hex_digest(ecp::record_digest(material)), "record digest is 64 hex chars");
}

void test_json_canonical_and_strict() {
  Object o;
  o["zeta"] = Value{static_cast<std::uint64_t>(1)};
  o["alpha"] = Value{"x"};
  expect(ecp::jsonlite::to_json(o) == "{\"alpha\":\"x\",\"zeta\":1}", "keys serialize sorted");

  std::optional<ecp::jsonlite::JsonError> err;
  ecp::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err.has_value() && err->code == "json_duplicate_key", "duplicate keys rejected");

  err.reset();
  ecp::jsonlite::parse("{\"a\":1} trailing", &err);
  expect(err.has_value(), "trailing data rejected");

  expect(ecp::jsonlite::format_double(0.5) == "0.5", "format_double trims zeros");
  expect(ecp::jsonlite::format_double(-0.0) == "0.0", "negative zero normalized");
}

void test_canonical_doubles_are_exact() {
  auto canonical = [](double d) {
    Object o;
    o["amount"] = Value{d};
    return ecp::jsonlite::to_json(o);
  };
  expect(canonical(1e-7) != canonical(0.0), "tiny value keeps its magnitude");
  expect(canonical(1e100) != canonical(2e100), "huge values stay distinct");
  expect(canonical(0.1234561) != canonical(0.1234564), "digits past the sixth survive");
  expect(ecp::jsonlite::format_double(1.0) == "1.0", "integral double keeps a fraction");
  expect(ecp::jsonlite::format_double(0.1) == "0.1", "shortest form");

  const double samples[] = {1e-7, 0.1 + 0.2, 0.1234561, 1e100, -2.5e-300, 1e300, 123456789.125};
  for (const double d : samples) {
    const auto back = ecp::jsonlite::parse(canonical(d));
    const auto it = back.find("amount");
    expect(it != back.end() && std::holds_alternative<double>(it->second.v), "reparses as a double");
    expect(std::get<double>(it->second.v) == d, "reparses to the identical double");
  }

  std::optional<ecp::jsonlite::JsonError> err;
  expect(ecp::jsonlite::canonicalize_json("{\"amount\":1e300}", &err) == canonical(1e300) && !err,
         "large input canonicalizes without loss");
}

void test_unicode_escapes_decode_to_utf8() {
  std::optional<ecp::jsonlite::JsonError> err;
  const std::string escaped = ecp::jsonlite::canonicalize_json("{\"s\":\"\\uD83D\\uDE00\"}", &err);
  expect(!err, "surrogate pair accepted");
  const std::string raw = ecp::jsonlite::canonicalize_json("{\"s\":\"\xF0\x9F\x98\x80\"}", &err);
  expect(escaped == raw, "escaped and raw emoji canonicalize identically");
  expect(ecp::jsonlite::get_string(ecp::jsonlite::parse(escaped), "s") == "\xF0\x9F\x98\x80",
         "pair decodes to one 4-byte sequence");
  expect(ecp::jsonlite::canonicalize_json("{\"s\":\"\\u00e9\"}") ==
             ecp::jsonlite::canonicalize_json("{\"s\":\"\xC3\xA9\"}"),
         "two-byte escape matches raw text");

  const char* broken[] = {"{\"s\":\"\\uD83D\"}", "{\"s\":\"\\uDE00\"}",
                          "{\"s\":\"\\uD83Dx\"}", "{\"s\":\"\\uD83D\\u0041\"}"};
  for (const char* text : broken) {
    err.reset();
    ecp::jsonlite::parse(text, &err);
    expect(err.has_value() && err->code == "json_parse_error", std::string("lone surrogate rejected: ") + text);
  }
}

void test_version_manifest() {
  const auto m = ecp::version::current_manifest();
  expect(m.ledger_format == ecp::version::LEDGER_FORMAT_VERSION, "manifest ledger format");
  const std::string json = ecp::version::manifest_to_json(m);
  expect(json.find("\"ledger_format\"") != std::string::npos, "manifest JSON names ledger_format");
  expect(json.find("\"hash_algorithm\"") != std::string::npos, "manifest JSON names hash_algorithm");
}

// ============================================================================
// Phase 2: Ledger
// ============================================================================

void append_notes(ecp::Ledger& ledger, int n) {
  for (int i = 0; i < n; ++i) {
    Object p;
    p["n"] = Value{static_cast<std::uint64_t>(i)};
    auto e = ledger.append("note", p);
    expect(e.has_value(), "append must succeed");
  }
}

void test_ledger_chain_links() {
  ecp::Ledger ledger("", test_clock());
  expect(!ledger.get_last_entry().has_value(), "empty ledger has no last entry");
  append_notes(ledger, 6);

  const auto entries = ledger.entries();
  expect(entries.size() == 6, "six entries");
  expect(entries[0].previous_hash == ecp::kGenesisHash, "first entry links to genesis");
  for (size_t i = 0; i < entries.size(); ++i) {
    expect(entries[i].sequence == i, "sequence is position");
    expect(ecp::compute_entry_hash(entries[i]) == entries[i].hash, "recomputed hash equals stored");
    if (i > 0) expect(entries[i].previous_hash == entries[i - 1].hash, "previous_hash links");
  }
  expect(ledger.get_last_entry()->hash == entries.back().hash, "last entry is newest");
  expect(ledger.verify_integrity().ok, "intact chain verifies");
}

void test_ledger_explicit_id_replay() {
  ecp::Ledger ledger("", test_clock());
  Object p;
  p["k"] = Value{"v"};
  ecp::ErrorCode err = ecp::ErrorCode::none;
  expect(ledger.append("decision_event", p, "evt_fixed", &err).has_value(), "first append");
  expect(!ledger.append("decision_event", p, "evt_fixed", &err).has_value(), "second append refused");
  expect(err == ecp::ErrorCode::replay_rejected, "replay_rejected reported");
  expect(ledger.size() == 1, "nothing double-appended");
}

void test_ledger_persist_and_reload() {
  const auto dir = fresh_dir("ledger_reload");
  const auto path = (dir / "ledger.ndjson").string();
  std::string last_hash;
  {
    ecp::Ledger ledger(path, test_clock());
    append_notes(ledger, 4);
    last_hash = ledger.get_last_entry()->hash;
  }
  ecp::Ledger reopened(path, test_clock());
  expect(reopened.size() == 4, "entries reloaded");
  expect(reopened.get_last_entry()->hash == last_hash, "tail preserved");
  append_notes(reopened, 1);
  expect(reopened.entries()[4].previous_hash == last_hash, "new entry chains onto reloaded tail");
  expect(reopened.verify_integrity().ok, "reloaded chain verifies");
}

void test_ledger_tamper_payload_is_hash_mismatch() {
  const auto dir = fresh_dir("ledger_tamper");
  const auto path = dir / "ledger.ndjson";
  {
    ecp::Ledger ledger(path.string(), test_clock());
    append_notes(ledger, 5);
  }
  auto lines = read_lines(path);
  auto e = ecp::ledger_entry_from_json(lines[2]);
  expect(e.has_value(), "line decodes");
  e->payload["n"] = Value{static_cast<std::uint64_t>(999)};
  lines[2] = ecp::ledger_entry_to_json(*e);
  write_lines(path, lines);

  ecp::Ledger reopened(path.string(), test_clock());
  const auto r = reopened.verify_integrity();
  expect(!r.ok, "tampered chain fails");
  expect(r.failure == ecp::IntegrityFailure::hash_mismatch, "content change is hash_mismatch");
  expect(r.index == 2, "offending index reported");
}

void test_ledger_deletion_is_chain_break() {
  const auto dir = fresh_dir("ledger_delete");
  const auto path = dir / "ledger.ndjson";
  {
    ecp::Ledger ledger(path.string(), test_clock());
    append_notes(ledger, 5);
  }
  auto lines = read_lines(path);
  lines.erase(lines.begin() + 2);
  write_lines(path, lines);

  ecp::Ledger reopened(path.string(), test_clock());
  const auto r = reopened.verify_integrity();
  expect(!r.ok, "chain with a deleted entry fails");
  expect(r.failure == ecp::IntegrityFailure::chain_link_break, "deletion is chain_link_break");
  expect(r.index == 2, "break reported where the gap is");
}

void test_ledger_genesis_alteration() {
  const auto dir = fresh_dir("ledger_genesis");
  const auto path = dir / "ledger.ndjson";
  {
    ecp::Ledger ledger(path.string(), test_clock());
    append_notes(ledger, 3);
  }
  auto lines = read_lines(path);
  auto e = ecp::ledger_entry_from_json(lines[0]);
  e->previous_hash = std::string(64, 'f');
  lines[0] = ecp::ledger_entry_to_json(*e);
  write_lines(path, lines);

  ecp::Ledger reopened(path.string(), test_clock());
  const auto r = reopened.verify_integrity();
  expect(!r.ok, "altered genesis link fails verification");
  expect(r.index == 0, "genesis problem is at index 0");
  expect(r.failure == ecp::IntegrityFailure::chain_link_break, "genesis link break");
}

void test_ledger_malformed_and_audit_all() {
  const auto dir = fresh_dir("ledger_audit");
  const auto path = dir / "ledger.ndjson";
  {
    ecp::Ledger ledger(path.string(), test_clock());
    append_notes(ledger, 6);
  }
  auto lines = read_lines(path);
  lines[1] = "{not json";
  auto e = ecp::ledger_entry_from_json(lines[4]);
  e->payload["n"] = Value{static_cast<std::uint64_t>(42)};
  lines[4] = ecp::ledger_entry_to_json(*e);
  write_lines(path, lines);

  ecp::Ledger reopened(path.string(), test_clock());
  expect(reopened.malformed_count() == 1, "malformed line kept as placeholder");
  expect(reopened.size() == 6, "placeholder keeps positions");
  const auto first = reopened.verify_integrity();
  expect(first.failure == ecp::IntegrityFailure::malformed_entry && first.index == 1,
         "fail-fast stops at the malformed line");
  const auto all = reopened.audit_chain();
  expect(all.size() == 2, "audit collects every problem");
  expect(all[1].failure == ecp::IntegrityFailure::hash_mismatch && all[1].index == 4,
         "audit also reports the later tampering");
}

void test_ledger_write_failure() {
  const auto dir = fresh_dir("ledger_unwritable");
  // A directory cannot be opened for appending.
  ecp::Ledger ledger(dir.string(), test_clock());
  ecp::ErrorCode err = ecp::ErrorCode::none;
  Object p;
  expect(!ledger.append("note", p, "", &err).has_value(), "append to unwritable path fails");
  expect(err == ecp::ErrorCode::ledger_write_failed, "ledger_write_failed reported");
  expect(ledger.size() == 0, "nothing added in memory");
  expect(ledger.failure_count() == 1, "failure counted");
}

void test_ledger_short_write_leaves_no_torn_line() {
  const auto dir = fresh_dir("ledger_short_write");
  const auto path = dir / "ledger.ndjson";
  {
    ecp::Ledger ledger(path.string(), test_clock());
    append_notes(ledger, 2);
    const auto size_before = fs::file_size(path);
    {
      FileSizeCap cap(size_before + 16);
      ecp::ErrorCode err = ecp::ErrorCode::none;
      Object p;
      p["n"] = Value{"does not fit"};
      expect(!ledger.append("note", p, "", &err).has_value(), "append past the cap fails");
      expect(err == ecp::ErrorCode::ledger_write_failed, "ledger_write_failed reported");
    }
    expect(fs::file_size(path) == size_before, "partial line cut off");
    append_notes(ledger, 1);
    expect(ledger.size() == 3, "ledger keeps appending after the failure");
  }
  ecp::Ledger reopened(path.string(), test_clock());
  expect(reopened.size() == 3 && reopened.malformed_count() == 0, "every line decodes after reload");
  expect(reopened.verify_integrity().ok, "reloaded chain verifies");
}

// ============================================================================
// Phase 3: Record store
// ============================================================================

void test_fs_record_store() {
  const auto dir = fresh_dir("store");
  ecp::FsRecordStore store(dir.string());
  expect(store.put(ecp::collections::kViolations, "vio_2", "{\"b\":1}"), "put vio_2");
  expect(store.put(ecp::collections::kViolations, "vio_1", "{\"a\":1}"), "put vio_1");
  expect(store.get(ecp::collections::kViolations, "vio_1").value_or("") == "{\"a\":1}", "get round trip");
  expect(store.put(ecp::collections::kViolations, "vio_1", "{\"a\":2}"), "overwrite");
  expect(store.get(ecp::collections::kViolations, "vio_1").value_or("") == "{\"a\":2}", "overwrite visible");
  const auto keys = store.list_keys(ecp::collections::kViolations);
  expect(keys.size() == 2 && keys[0] == "vio_1" && keys[1] == "vio_2", "keys listed sorted");
  expect(!store.put(ecp::collections::kViolations, "../escape", "{}"), "path escape rejected");
  expect(!store.contains(ecp::collections::kRulings, "missing"), "absent record");
  expect(store.size(ecp::collections::kViolations) == 2, "collection size");
}

void test_fs_record_store_compressed_collection() {
  const auto dir = fresh_dir("store_zstd");
  ecp::FsRecordStore store(dir.string(), {ecp::collections::kClassificationArchive});
  const std::string doc = "{\"event_id\":\"evt_1\",\"reasoning\":\"" + std::string(512, 'r') + "\"}";
  expect(store.put(ecp::collections::kClassificationArchive, "evt_1__clf__r1", doc), "compressed put");
  expect(store.get(ecp::collections::kClassificationArchive, "evt_1__clf__r1").value_or("") == doc,
         "get returns the uncompressed text");
  const fs::path on_disk = store.record_path(ecp::collections::kClassificationArchive, "evt_1__clf__r1");
  expect(on_disk.extension() == ".zst", "compressed records use .zst");
  expect(fs::file_size(on_disk) < doc.size(), "record is stored compressed");
  const auto keys = store.list_keys(ecp::collections::kClassificationArchive);
  expect(keys.size() == 1 && keys[0] == "evt_1__clf__r1", "compressed keys listed without extension");

  { std::ofstream(on_disk, std::ios::binary | std::ios::trunc) << "not a zstd frame"; }
  expect(!store.get(ecp::collections::kClassificationArchive, "evt_1__clf__r1").has_value(),
         "corrupt compressed record reads as absent");
}

void test_memory_store_fail_hook() {
  ecp::MemoryRecordStore store;
  store.set_fail_writes(true);
  expect(!store.put("c", "k", "{}"), "put fails while hook set");
  store.set_fail_writes(false);
  expect(store.put("c", "k", "{}"), "put succeeds after hook cleared");
  expect(store.backend_id() == "memory", "backend id");
}

// ============================================================================
// Phase 4: Event gate
// ============================================================================

void test_context_subsets_reject_exact_fields() {
  auto svc = make_service();
  const auto& fields = ecp::required_context_fields();
  const size_t ledger_before = svc->ledger().size();

  for (unsigned mask = 1; mask < 32; ++mask) {
    ecp::Decision d = make_decision("loan_approval", "subset " + std::to_string(mask));
    std::vector<std::string> removed;
    for (size_t i = 0; i < fields.size(); ++i) {
      if (mask & (1u << i)) {
        d.context.erase(fields[i]);
        removed.push_back(fields[i]);
      }
    }
    const auto r = svc->enforce_decision(d);
    expect(!r.ok, "incomplete context rejected");
    expect(r.error == ecp::ErrorCode::ingress_rejected, "ingress_rejected");
    expect(r.missing_fields == removed, "rejection names exactly the missing fields (mask " +
                                            std::to_string(mask) + ")");
  }
  expect(svc->ledger().size() == ledger_before, "rejected decisions write nothing to the ledger");
  expect(svc->violations().by_type("missing_context").size() == 31, "each rejection recorded");
}

void test_invalid_context_values() {
  auto svc = make_service();
  ecp::Decision d = make_decision("loan_approval", "bad values");
  d.context["causation"] = Value{"aliens"};
  d.context["agency_present"] = Value{"yes"};
  d.context["control_level"] = Value{""};
  const auto r = svc->enforce_decision(d);
  expect(!r.ok, "invalid values rejected");
  const std::vector<std::string> want = {"causation (invalid value)", "agency_present (not boolean)",
                                         "control_level (empty)"};
  expect(r.missing_fields == want, "invalid values named with reasons");

  ecp::Decision no_agent = make_decision("loan_approval", "no agent", true, "");
  const auto r2 = svc->enforce_decision(no_agent);
  expect(!r2.ok && r2.missing_fields == std::vector<std::string>{"agent_id"}, "agent_id required");
}

void test_event_id_deterministic() {
  Object a;
  a["x"] = Value{static_cast<std::uint64_t>(1)};
  a["y"] = Value{"z"};
  Object b;
  b["y"] = Value{"z"};
  b["x"] = Value{static_cast<std::uint64_t>(1)};
  const auto id_a = ecp::compute_event_id("act", "desc", a);
  expect(id_a == ecp::compute_event_id("act", "desc", b), "insertion order does not matter");
  expect(id_a.rfind("evt_", 0) == 0 && id_a.size() == 20, "evt_ + 16 hex");
  expect(id_a != ecp::compute_event_id("act", "other", a), "description is part of the id");
}

void test_event_id_separates_fields_and_values() {
  expect(ecp::compute_event_id("a:b", "c", {}) != ecp::compute_event_id("a", "b:c", {}),
         "field boundaries are part of the id");

  auto with_amount = [](double d) {
    Object p;
    p["amount"] = Value{d};
    return ecp::compute_event_id("transfer", "wire", p);
  };
  expect(with_amount(1e-7) != with_amount(0.0), "tiny amount is not zero");
  expect(with_amount(1e100) != with_amount(2e100), "huge amounts differ");

  const Object escaped = ecp::jsonlite::parse("{\"memo\":\"\\uD83D\\uDE00\"}");
  const Object raw = ecp::jsonlite::parse("{\"memo\":\"\xF0\x9F\x98\x80\"}");
  expect(ecp::compute_event_id("transfer", "wire", escaped) == ecp::compute_event_id("transfer", "wire", raw),
         "escaped and raw text give the same id");

  auto svc = make_service();
  ecp::Decision big = make_decision("transfer", "wire");
  big.payload["amount"] = Value{1e100};
  ecp::Decision bigger = big;
  bigger.payload["amount"] = Value{2e100};
  expect(svc->enforce_decision(big).ok, "first large transfer accepted");
  const auto second = svc->enforce_decision(bigger);
  expect(second.ok, "different large transfer is not a replay");
  expect(svc->violations().by_type("replay_attempt").empty(), "no replay violation");
}

void test_replay_rejected_not_double_appended() {
  auto svc = make_service();
  const auto d = make_decision("loan_approval", "approve loan 17");
  const auto first = svc->enforce_decision(d);
  expect(first.ok, "first submission accepted");
  const size_t after_first = svc->ledger().size();

  const auto second = svc->enforce_decision(d);
  expect(!second.ok, "second submission rejected");
  expect(second.error == ecp::ErrorCode::replay_rejected, "replay_rejected");
  expect(second.event_id == first.event_id, "same event id returned");
  expect(svc->ledger().size() == after_first, "never double-appended");
  expect(svc->violations().by_type("replay_attempt").size() == 1, "replay recorded as violation");
}

void test_self_classification_on_agency() {
  auto svc = make_service();
  const auto r = svc->enforce_decision(make_decision("loan_approval", "agency on"));
  expect(r.ok && r.self_classified && !r.self_classification_fallback, "self-classified");
  auto c = svc->guard().get_classification(r.event_id, "agent-1");
  expect(c.has_value(), "self-classification stored");
  expect(c->ethical_status == ecp::EthicalStatus::permissible && c->confidence == 0.9 &&
             c->risk_estimate == ecp::RiskEstimate::low,
         "default self-assessment values");
  expect(c->revision == 1, "first revision");

  const auto r2 = svc->enforce_decision(make_decision("loan_approval", "agency off", false));
  expect(r2.ok && !r2.self_classified, "no agency means no self-classification");
  expect(svc->guard().classifications_for(r2.event_id).empty(), "nothing stored without agency");
}

void test_fallback_when_self_classifier_throws() {
  ecp::GovernanceDeps deps;
  deps.self_classifier = std::make_shared<ThrowingClassifier>();
  auto svc = make_service(std::move(deps));
  const auto r = svc->enforce_decision(make_decision("loan_approval", "throwing classifier"));
  expect(r.ok, "decision still accepted");
  expect(r.self_classification_fallback, "fallback flagged");
  auto c = svc->guard().get_classification(r.event_id, "agent-1");
  expect(c.has_value(), "event is not left unclassified");
  expect(c->ethical_status == ecp::kFallbackStatus, "fallback status");
  expect(c->confidence == ecp::kFallbackConfidence, "fallback confidence");
  expect(c->risk_estimate == ecp::kFallbackRisk, "fallback risk");
  expect(c->constraints.size() == 1 && c->constraints[0] == ecp::kRequiresExternalReview,
         "fallback flagged for external review");
  expect(c->reasoning.find("model backend unreachable") != std::string::npos, "reasoning names failure");
  expect(svc->violations().by_type("self_classification_failed").size() == 1, "failure audited");
}

void test_fallback_when_self_classifier_refuses() {
  ecp::GovernanceDeps deps;
  deps.self_classifier = std::make_shared<RefusingClassifier>();
  auto svc = make_service(std::move(deps));
  const auto r = svc->enforce_decision(make_decision("loan_approval", "refusing classifier"));
  expect(r.ok && r.self_classification_fallback, "refusal falls back");
  expect(svc->guard().get_classification(r.event_id, "agent-1").has_value(), "fallback stored");
}

void test_unclassified_event_escalates_when_fallback_fails() {
  auto store = std::make_unique<ecp::MemoryRecordStore>();
  ecp::MemoryRecordStore* raw = store.get();
  ecp::GovernanceDeps deps;
  deps.store = std::move(store);
  deps.self_classifier = std::make_shared<ThrowingClassifier>();
  auto svc = make_service(std::move(deps));
  raw->set_fail_writes(true);

  const auto r = svc->enforce_decision(make_decision("loan_approval", "store down"));
  expect(r.ok, "event itself is in the ledger");
  expect(!r.self_classification_fallback, "fallback could not be stored");
  const auto blocking = svc->violations().by_type("unclassified_event");
  expect(blocking.size() == 1 && blocking[0].severity == ecp::Severity::blocking,
         "unclassified event recorded as blocking");
  expect(svc->violations().escalation_for(blocking[0].violation_id).has_value(), "and escalated");
  expect(svc->violations().persist_failure_count() > 0, "persist failures counted");
}

// ============================================================================
// Phase 5: Classifications & immutability guard
// ============================================================================

void test_guard_rejects_unknown_event_and_bad_values() {
  auto svc = make_service();
  auto unknown = svc->classify_event("evt_doesnotexist00", "clf-2", ecp::EthicalStatus::ethical, 0.8,
                                     ecp::RiskEstimate::low, "");
  expect(!unknown.ok && unknown.error == ecp::ErrorCode::unknown_event, "unknown event rejected");
  expect(svc->violations().by_type("unknown_event_reference").size() == 1, "unknown reference recorded");

  const auto r = svc->enforce_decision(make_decision("loan_approval", "guard values", false));
  auto bad_conf = svc->classify_event(r.event_id, "clf-2", ecp::EthicalStatus::ethical, 1.5,
                                      ecp::RiskEstimate::low, "");
  expect(bad_conf.error == ecp::ErrorCode::classification_invalid, "confidence > 1 rejected");
  auto nan_conf = svc->classify_event(r.event_id, "clf-2", ecp::EthicalStatus::ethical, std::nan(""),
                                      ecp::RiskEstimate::low, "");
  expect(nan_conf.error == ecp::ErrorCode::classification_invalid, "NaN confidence rejected");
  auto bad_id = svc->classify_event(r.event_id, "", ecp::EthicalStatus::ethical, 0.5,
                                    ecp::RiskEstimate::low, "");
  expect(bad_id.error == ecp::ErrorCode::classification_invalid, "empty classifier rejected");
  expect(svc->guard().classifications_for(r.event_id).empty(), "nothing stored");
}

void test_guard_archives_prior_revision() {
  auto svc = make_service();
  const auto r = svc->enforce_decision(make_decision("loan_approval", "revisions", false));
  auto v1 = svc->classify_event(r.event_id, "clf-2", ecp::EthicalStatus::ethical, 0.7,
                                ecp::RiskEstimate::low, "first look");
  auto v2 = svc->classify_event(r.event_id, "clf-2", ecp::EthicalStatus::questionable, 0.6,
                                ecp::RiskEstimate::medium, "second look");
  expect(v1.ok && v1.revision == 1, "first revision");
  expect(v2.ok && v2.revision == 2, "second revision");

  const auto live = svc->guard().get_classification(r.event_id, "clf-2");
  expect(live->reasoning == "second look", "live record is the newest");
  const auto history = svc->guard().revision_history(r.event_id, "clf-2");
  expect(history.size() == 2, "history keeps both revisions");
  expect(history[0].reasoning == "first look" && history[0].revision == 1, "archived revision intact");
  expect(svc->store().size(ecp::collections::kClassificationArchive) == 1, "one archived record");

  size_t anchors = 0;
  for (const auto& e : svc->ledger().entries())
    if (e.entry_type == ecp::entry_types::kClassificationRecorded) ++anchors;
  expect(anchors == 2, "every revision anchored in the ledger");
}

void test_guard_restores_when_anchor_fails() {
  const auto dir = fresh_dir("guard_anchor_failure");
  ecp::GovernanceConfig cfg;
  cfg.data_root = dir.string();
  ecp::GovernanceDeps deps;
  deps.clock = test_clock();
  deps.store = std::make_unique<ecp::MemoryRecordStore>();
  ecp::GovernanceService svc(cfg, std::move(deps));

  const auto r = svc.enforce_decision(make_decision("loan_approval", "anchor failure", false));
  expect(r.ok, "event recorded");
  expect(svc.classify_event(r.event_id, "clf-a", ecp::EthicalStatus::ethical, 0.7, ecp::RiskEstimate::low,
                            "anchored")
             .ok,
         "first revision stored");
  const size_t ledger_size = svc.ledger().size();
  {
    // Nothing more fits in the ledger file.
    FileSizeCap cap(fs::file_size(cfg.ledger_path()));
    auto update = svc.classify_event(r.event_id, "clf-a", ecp::EthicalStatus::unethical, 0.9,
                                     ecp::RiskEstimate::high, "unanchored");
    expect(!update.ok && update.error == ecp::ErrorCode::ledger_write_failed, "update reports the failure");
    auto first = svc.classify_event(r.event_id, "clf-b", ecp::EthicalStatus::questionable, 0.5,
                                    ecp::RiskEstimate::medium, "unanchored");
    expect(!first.ok && first.error == ecp::ErrorCode::ledger_write_failed, "new record reports the failure");
  }
  const auto live = svc.guard().get_classification(r.event_id, "clf-a");
  expect(live && live->revision == 1 && live->reasoning == "anchored", "previous revision is live again");
  expect(!svc.guard().get_classification(r.event_id, "clf-b").has_value(), "unanchored record removed");
  expect(svc.ledger().size() == ledger_size, "no anchor written");
  expect(svc.run_check().healthy(), "store and ledger still agree");
}

void test_concurrent_classifiers() {
  auto svc = make_service();
  const auto r = svc->enforce_decision(make_decision("loan_approval", "concurrent", false));
  constexpr int kThreads = 8;
  constexpr int kRevisions = 10;
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      const std::string clf = "clf-" + std::to_string(t);
      for (int i = 0; i < kRevisions; ++i) {
        auto res = svc->classify_event(r.event_id, clf, ecp::EthicalStatus::permissible,
                                       0.1 * (i % 10), ecp::RiskEstimate::low,
                                       "rev " + std::to_string(i));
        if (!res.ok) failures.fetch_add(1);
      }
    });
  }
  for (auto& th : threads) th.join();

  expect(failures.load() == 0, "all concurrent writes succeed");
  const auto all = svc->guard().classifications_for(r.event_id);
  expect(all.size() == kThreads, "one live record per classifier");
  for (const auto& c : all) {
    expect(c.revision == kRevisions, "revisions serialized per key");
    expect(svc->guard().revision_history(r.event_id, c.classifier_id).size() == kRevisions,
           "history complete per key");
  }
  expect(svc->store().size(ecp::collections::kClassificationArchive) == kThreads * (kRevisions - 1),
         "every superseded revision archived");
  expect(svc->ledger().verify_integrity().ok, "ledger intact under concurrency");
  expect(svc->run_check().healthy(), "consistency battery passes after concurrent writes");
}

void test_concurrent_decisions() {
  auto svc = make_service();
  constexpr int kThreads = 6;
  constexpr int kPerThread = 15;
  std::vector<std::thread> threads;
  std::atomic<int> accepted{0};
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        auto d = make_decision("transfer", "t" + std::to_string(t) + "-" + std::to_string(i));
        if (svc->enforce_decision(d).ok) accepted.fetch_add(1);
      }
    });
  }
  for (auto& th : threads) th.join();
  expect(accepted.load() == kThreads * kPerThread, "all distinct decisions accepted");
  // Each accepted decision appends the event and one classification anchor.
  expect(svc->ledger().size() == static_cast<size_t>(2 * kThreads * kPerThread), "no lost appends");
  expect(svc->ledger().verify_integrity().ok, "chain intact under concurrent appends");
}

// ============================================================================
// Phase 6: Consensus
// ============================================================================

void test_divergence_symmetric() {
  const ecp::ConsensusPolicy policy;
  const ecp::EthicalStatus statuses[] = {ecp::EthicalStatus::ethical, ecp::EthicalStatus::permissible,
                                         ecp::EthicalStatus::questionable, ecp::EthicalStatus::unethical};
  const ecp::RiskEstimate risks[] = {ecp::RiskEstimate::low, ecp::RiskEstimate::medium,
                                     ecp::RiskEstimate::high};
  const double confidences[] = {0.0, 0.35, 0.9, 1.0};
  for (auto sa : statuses)
    for (auto sb : statuses)
      for (auto ra : risks)
        for (auto rb : risks)
          for (double ca : confidences) {
            auto a = make_classification("a", sa, ca, ra);
            auto b = make_classification("b", sb, 0.5, rb);
            expect(ecp::divergence(a, b, policy) == ecp::divergence(b, a, policy), "divergence symmetric");
          }
  auto same = make_classification("a", ecp::EthicalStatus::ethical, 0.4, ecp::RiskEstimate::high);
  expect(ecp::divergence(same, same, policy) == 0.0, "identical classifications do not diverge");
}

void test_single_classification_yields_empty() {
  std::vector<ecp::Classification> one = {
      make_classification("a", ecp::EthicalStatus::ethical, 0.9, ecp::RiskEstimate::low)};
  expect(!ecp::compute_consensus("evt_test", one, {}).has_value(), "one opinion is not a consensus");

  auto svc = make_service();
  const auto r = svc->enforce_decision(make_decision("loan_approval", "single opinion"));
  const auto s = svc->score_event(r.event_id);
  expect(!s.record.has_value(), "score_event returns empty");
  expect(svc->store().size(ecp::collections::kConsensus) == 0, "no consensus record written");
  expect(!s.escalation.has_value(), "no escalation");
}

void test_unethical_forces_review() {
  ecp::ConsensusPolicy zero_weights;
  zero_weights.weights = {0.0, 0.0, 0.0};
  std::vector<ecp::Classification> set = {
      make_classification("a", ecp::EthicalStatus::permissible, 0.9, ecp::RiskEstimate::low),
      make_classification("b", ecp::EthicalStatus::unethical, 0.5, ecp::RiskEstimate::low)};
  const auto rec = ecp::compute_consensus("evt_test", set, zero_weights);
  expect(rec.has_value(), "two classifications scored");
  expect(rec->max_pairwise_divergence == 0.0, "numeric divergence is zero here");
  expect(rec->requires_human_review, "unethical verdict forces review");
  expect(rec->trigger_reason == "unethical_classification", "trigger names the override");

  const auto with_defaults = ecp::compute_consensus("evt_test", set, {});
  expect(with_defaults->requires_human_review, "forced under default policy as well");
  expect(with_defaults->trigger_reason == "unethical_classification+divergence_threshold",
         "both triggers joined");
}

void test_max_versus_mean_aggregation() {
  std::vector<ecp::Classification> set = {
      make_classification("a", ecp::EthicalStatus::ethical, 0.9, ecp::RiskEstimate::low),
      make_classification("b", ecp::EthicalStatus::ethical, 0.9, ecp::RiskEstimate::low),
      make_classification("c", ecp::EthicalStatus::questionable, 0.9, ecp::RiskEstimate::high)};
  ecp::ConsensusPolicy max_policy;
  ecp::ConsensusPolicy mean_policy;
  mean_policy.aggregation = ecp::Aggregation::mean;
  max_policy.review_threshold = mean_policy.review_threshold = 0.5;

  const auto by_max = ecp::compute_consensus("evt_test", set, max_policy);
  const auto by_mean = ecp::compute_consensus("evt_test", set, mean_policy);
  // a-c and b-c diverge by 0.5*(2/3) + 0.3*1.0 = 0.6333; a-b by 0.
  expect(std::fabs(by_max->max_pairwise_divergence - (0.5 * (2.0 / 3.0) + 0.3)) < 1e-9, "max pair");
  expect(by_max->pairs.size() == 3, "all pairs computed");
  expect(by_max->requires_human_review, "one dissenter is not diluted under max");
  expect(!by_mean->requires_human_review, "majority dilutes the dissenter under mean");
  expect(by_mean->aggregation == "mean" && by_max->aggregation == "max", "aggregation recorded");
}

void test_scenario_e1_divergence() {
  auto svc = make_service();
  ecp::Decision d = make_decision("loan_approval", "approve application E1");
  const auto e1 = svc->enforce_decision(d);
  expect(e1.ok && e1.self_classified, "E1 accepted and self-classified");

  auto second = svc->classify_event(e1.event_id, "independent-reviewer", ecp::EthicalStatus::questionable,
                                    0.6, ecp::RiskEstimate::medium, "borderline");
  expect(second.ok, "second classifier accepted");

  const auto s = svc->score_event(e1.event_id);
  expect(s.record.has_value(), "two classifications scored");
  const ecp::ConsensusPolicy p = svc->config().consensus;
  const double expected = p.weights.status * std::fabs(p.status_scale[2] - p.status_scale[1]) +
                          p.weights.confidence * std::fabs(0.9 - 0.6) +
                          p.weights.risk * std::fabs(p.risk_scale[1] - p.risk_scale[0]);
  expect(std::fabs(s.record->max_pairwise_divergence - expected) < 1e-9, "divergence matches the formula");
  expect(std::fabs(expected - 0.376667) < 1e-5, "default tables give about 0.3767");
  expect(s.record->requires_human_review == (expected >= p.review_threshold), "threshold compared exactly");
  expect(s.record->trigger_reason == "divergence_threshold", "numeric trigger");
  expect(s.record->breakdown.size() == 2, "per-classifier breakdown");
  expect(s.escalation.has_value() &&
             s.escalation->status == ecp::EscalationStatus::awaiting_human_review,
         "consensus escalated for human review");
}

void test_score_event_idempotent() {
  auto svc = make_service();
  const auto r = svc->enforce_decision(make_decision("loan_approval", "idempotent scoring"));
  svc->classify_event(r.event_id, "clf-2", ecp::EthicalStatus::ethical, 0.8, ecp::RiskEstimate::low, "");
  g_now += 5000;
  const auto a = svc->score_event(r.event_id);
  g_now += 5000;
  const auto b = svc->score_event(r.event_id);
  expect(a.record && b.record, "both scored");
  const std::string ja = ecp::jsonlite::to_json(ecp::to_object(*a.record));
  const std::string jb = ecp::jsonlite::to_json(ecp::to_object(*b.record));
  expect(ja == jb, "rescoring an unchanged set is identical");
  expect(svc->scorer().stored_record(r.event_id).has_value(), "record persisted");

  svc->classify_event(r.event_id, "clf-3", ecp::EthicalStatus::questionable, 0.4, ecp::RiskEstimate::high, "");
  const auto c = svc->score_event(r.event_id);
  expect(c.record->pairs.size() == 3, "record recomputed from the new set");
  expect(c.record->classification_set_digest != a.record->classification_set_digest, "set digest changes");
  expect(svc->store().size(ecp::collections::kConsensus) == 1, "overwritten, not accumulated");
}

// ============================================================================
// Phase 7: Violations & escalation
// ============================================================================

void test_blocking_violation_with_failing_notifier() {
  ecp::GovernanceDeps deps;
  deps.notifier = std::make_shared<ecp::CommandNotifier>("false", std::vector<std::string>{}, 2000);
  auto svc = make_service(std::move(deps));
  const std::string id = svc->record_violation("unauthorized_transfer", ecp::Severity::blocking,
                                               "transfer without approval", "agent-7", "execute_transfer");
  svc->violations().flush_notifications();

  expect(svc->violations().dispatcher().failed() == 1, "notification failure counted");
  auto v = svc->violations().find(id);
  expect(v.has_value() && v->violation_type == "unauthorized_transfer", "violation still queryable");
  expect(svc->store().contains(ecp::collections::kViolations, id), "violation persisted");
  auto esc = svc->violations().escalation_for(id);
  expect(esc.has_value() && esc->status == ecp::EscalationStatus::awaiting_human_review,
         "escalation awaiting human review");
  expect(svc->store().contains(ecp::collections::kEscalations, esc->escalation_id), "escalation persisted");
}

void test_throwing_notifier_is_contained() {
  ecp::MemoryRecordStore store;
  ecp::ViolationTracker tracker(store, std::make_shared<ThrowingNotifier>(), test_clock());
  const std::string id = tracker.record_violation("data_exfiltration", ecp::Severity::blocking, "bulk export");
  tracker.flush_notifications();
  expect(tracker.dispatcher().failed() == 1, "thrown notifier counted as failure");
  expect(tracker.find(id).has_value(), "violation survives a crashing notifier");
}

void test_notifier_receives_blocking_only() {
  ecp::MemoryRecordStore store;
  auto notifier = std::make_shared<CountingNotifier>();
  ecp::ViolationTracker tracker(store, notifier, test_clock());
  tracker.record_violation("minor", ecp::Severity::warning, "w");
  tracker.record_violation("trace", ecp::Severity::audit, "a");
  const std::string id = tracker.record_violation("major", ecp::Severity::blocking, "b");
  tracker.flush_notifications();
  std::lock_guard<std::mutex> lk(notifier->mu);
  expect(notifier->seen.size() == 1 && notifier->seen[0] == ecp::escalation_key(id),
         "only blocking violations notify");
  expect(tracker.dispatcher().sent() == 1, "sent counted");
}

void test_violation_persist_failure_keeps_record() {
  ecp::MemoryRecordStore store;
  store.set_fail_writes(true);
  ecp::ViolationTracker tracker(store, nullptr, test_clock());
  const std::string id = tracker.record_violation("policy_breach", ecp::Severity::warning, "m", "agent-2");
  expect(tracker.find(id).has_value(), "violation never dropped");
  expect(tracker.persist_failure_count() == 1, "persist failure counted");
  expect(tracker.by_agent("agent-2").size() == 1, "indexed despite the failure");
}

void test_violation_queries_and_report() {
  g_now = kEpochMs;
  ecp::MemoryRecordStore store;
  ecp::ViolationTracker tracker(store, nullptr, test_clock());
  tracker.record_violation("old_breach", ecp::Severity::audit, "old", "agent-a");
  g_now += 3 * ecp::kMillisPerDay;
  tracker.record_violation("new_breach", ecp::Severity::warning, "new", "agent-b");
  tracker.record_violation("new_breach", ecp::Severity::blocking, "new blocking");

  expect(tracker.by_type("new_breach").size() == 2, "by_type");
  expect(tracker.by_severity(ecp::Severity::audit).size() == 1, "by_severity");
  expect(tracker.blocking().size() == 1, "blocking");
  expect(tracker.by_agent("agent-a").size() == 1, "by_agent");
  expect(tracker.recent(std::chrono::hours(24)).size() == 2, "recent window");

  const auto report = tracker.report();
  expect(report.total == 3, "total");
  expect(report.by_severity.size() == 3 && report.by_severity.at("blocking") == 1, "per severity");
  expect(report.by_agent.at("unknown") == 1, "missing agent reported as unknown");
  expect(report.recent_24h == 2 && report.recent_7d == 3, "recency counts");
  expect(report.escalations_pending == 1, "pending escalations");

  ecp::ViolationTracker reloaded(store, nullptr, test_clock());
  expect(reloaded.all().size() == 3, "indexes rebuilt from the store");
  expect(reloaded.blocking().size() == 1 && reloaded.escalations().size() == 1, "escalations reloaded");
  g_now = kEpochMs;
}

void test_notifier_formatting() {
  ecp::Violation v;
  v.violation_id = "vio_1_000001";
  v.violation_type = "unauthorized_transfer";
  v.severity = ecp::Severity::blocking;
  v.message = "transfer without approval";
  ecp::Escalation e;
  e.escalation_id = ecp::escalation_key(v.violation_id);
  expect(ecp::CommandNotifier::format_title(v) == "ECP Violation: unauthorized_transfer", "title");
  const auto body = ecp::CommandNotifier::format_body(e, v);
  expect(body.find("vio_1_000001") != std::string::npos, "body names the violation");
  expect(body.find("Agent: unknown") != std::string::npos, "missing agent shown as unknown");
}

// ============================================================================
// Phase 8: Rulings & precedents
// ============================================================================

std::string divergent_event(ecp::GovernanceService& svc, const std::string& description) {
  const auto r = svc.enforce_decision(make_decision("loan_approval", description));
  svc.classify_event(r.event_id, "independent-reviewer", ecp::EthicalStatus::questionable, 0.6,
                     ecp::RiskEstimate::medium, "");
  return r.event_id;
}

void test_ruling_resolves_escalation_and_precedent() {
  g_now = kEpochMs;
  auto svc = make_service();
  const std::string e1 = divergent_event(*svc, "precedent source");
  auto s1 = svc->score_event(e1);
  expect(s1.escalation && s1.escalation->status == ecp::EscalationStatus::awaiting_human_review,
         "first divergent event awaits review");
  auto again = svc->score_event(e1);
  expect(again.escalation->created_at_unix_ms == s1.escalation->created_at_unix_ms, "single escalation per event");

  ecp::HumanRuling ruling;
  ruling.event_id = e1;
  ruling.issued_by = "ethics-board";
  ruling.final_assessment = ecp::EthicalStatus::permissible;
  ruling.reasoning = "standard loan terms";
  ruling.precedent_created = true;
  ruling.applicable_event_types = {"loan_approval"};
  ruling.validity_days = 30;
  std::string detail;
  expect(svc->create_ruling(ruling, &detail) == ecp::ErrorCode::none, "ruling stored: " + detail);
  expect(ruling.action_type == "loan_approval", "action type filled from the ledger");
  auto resolved = svc->escalation_for_event(e1);
  expect(resolved && resolved->status == ecp::EscalationStatus::resolved, "escalation resolved by ruling");

  const std::string e2 = divergent_event(*svc, "covered by precedent");
  auto s2 = svc->score_event(e2);
  expect(s2.escalation && s2.escalation->status == ecp::EscalationStatus::resolved_by_precedent,
         "matching precedent short-circuits review");
  expect(s2.escalation->resolved_by == "precedent:" + e1, "precedent referenced");

  g_now += 31 * ecp::kMillisPerDay;
  const std::string e3 = divergent_event(*svc, "after expiry");
  auto s3 = svc->score_event(e3);
  expect(s3.escalation && s3.escalation->status == ecp::EscalationStatus::awaiting_human_review,
         "expired precedent no longer applies");
  g_now = kEpochMs;
}

void test_ruling_validation() {
  auto svc = make_service();
  const auto r = svc->enforce_decision(make_decision("loan_approval", "ruling validation", false));

  ecp::HumanRuling unknown;
  unknown.event_id = "evt_0000000000000000";
  unknown.issued_by = "board";
  expect(svc->create_ruling(unknown) == ecp::ErrorCode::unknown_event, "unknown event");

  ecp::HumanRuling anonymous;
  anonymous.event_id = r.event_id;
  expect(svc->create_ruling(anonymous) == ecp::ErrorCode::ruling_invalid, "issued_by required");

  ecp::HumanRuling no_window;
  no_window.event_id = r.event_id;
  no_window.issued_by = "board";
  no_window.precedent_created = true;
  expect(svc->create_ruling(no_window) == ecp::ErrorCode::ruling_invalid, "precedent needs validity");

  ecp::HumanRuling ok;
  ok.event_id = r.event_id;
  ok.issued_by = "board";
  expect(svc->create_ruling(ok) == ecp::ErrorCode::none, "plain ruling stored");
  ecp::HumanRuling dup = ok;
  expect(svc->create_ruling(dup) == ecp::ErrorCode::ruling_exists, "one ruling per event");
  expect(!svc->rulings().find_precedent("loan_approval", g_now.load()).has_value(),
         "non-precedent ruling never matches");
}

void test_long_precedent_window_never_wraps() {
  ecp::HumanRuling r;
  r.issued_at_unix_ms = kEpochMs;
  r.validity_days = 213503982335ull;  // issued + days * 86400000 exceeds uint64
  expect(!r.expired_at(kEpochMs + ecp::kMillisPerDay), "not expired after a day");
  expect(!r.expired_at(kEpochMs + 30 * ecp::kMillisPerDay), "not expired after a month");
  expect(!r.expired_at(std::numeric_limits<uint64_t>::max()), "never expires");
  r.validity_days = std::numeric_limits<uint64_t>::max();
  expect(!r.expired_at(kEpochMs + ecp::kMillisPerDay), "maximal window never expires");

  r.validity_days = 30;
  expect(!r.expired_at(kEpochMs + 29 * ecp::kMillisPerDay), "inside a normal window");
  expect(r.expired_at(kEpochMs + 30 * ecp::kMillisPerDay), "normal window ends on time");
}

// ============================================================================
// Phase 9: Consistency battery
// ============================================================================

void test_consistency_healthy_flow() {
  auto svc = make_service();
  const std::string e = divergent_event(*svc, "healthy flow");
  svc->score_event(e);
  svc->record_violation("note", ecp::Severity::blocking, "blocking note");
  const auto report = svc->run_check();
  expect(report.healthy(), "normal operation is healthy: " + report.to_json());
  expect(report.checks_run == 5, "five checks run");
  expect(svc->checker().last_report().has_value(), "last report kept");
}

void test_consistency_detects_record_tampering() {
  auto svc = make_service();
  const std::string e = divergent_event(*svc, "tampered classification");
  const std::string key = ecp::classification_key(e, "independent-reviewer");
  auto text = svc->store().get(ecp::collections::kClassifications, key);
  std::optional<ecp::jsonlite::JsonError> err;
  Object obj = ecp::jsonlite::parse(*text, &err);
  obj["reasoning"] = Value{"rewritten after the fact"};
  svc->store().put(ecp::collections::kClassifications, key, ecp::jsonlite::to_json(obj));

  ecp::Classification orphan = make_classification("ghost", ecp::EthicalStatus::ethical, 0.5,
                                                   ecp::RiskEstimate::low);
  orphan.event_id = "evt_ffffffffffffffff";
  orphan.revision = 1;
  svc->store().put(ecp::collections::kClassificationArchive, "evt_ffffffffffffffff__ghost__r1",
                   ecp::jsonlite::to_json(ecp::to_object(orphan)));

  ecp::ConsensusRecord stray;
  stray.event_id = "evt_eeeeeeeeeeeeeeee";
  svc->store().put(ecp::collections::kConsensus, stray.event_id,
                   ecp::jsonlite::to_json(ecp::to_object(stray)));

  const auto report = svc->run_check();
  expect(!report.healthy() && report.status == "degraded", "tampering degrades status");
  expect(report.total_errors == 3, "all failures aggregated: " + report.to_json());
  expect(report.checks_failed == 2, "classification_links and case_consistency fail");
  expect(report.critical_errors.empty(), "no critical failure without ledger damage");
}

void test_consistency_event_references() {
  auto svc = make_service();
  Object payload;
  payload["event_id"] = Value{"evt_bogus"};
  payload["action_type"] = Value{"loan_approval"};
  payload["description"] = Value{"forged"};
  payload["payload"] = Value{Object{}};
  Object ctx;
  ctx["causation"] = Value{"human"};
  payload["context"] = Value{ctx};
  expect(svc->ledger().append(ecp::entry_types::kDecisionEvent, payload, "evt_bogus").has_value(),
         "forged entry appended directly");

  const auto check = svc->run_check();
  const auto& refs = check.checks[1];
  expect(refs.name == "event_references" && !refs.passed, "event_references fails");
  expect(refs.errors.size() == 2, "incomplete context and id mismatch both reported");
  expect(check.checks[0].passed, "chain itself is intact");
}

void test_consistency_ledger_damage_is_critical() {
  const auto dir = fresh_dir("consistency_critical");
  ecp::GovernanceConfig cfg;
  cfg.data_root = dir.string();
  {
    ecp::GovernanceDeps deps;
    deps.clock = test_clock();
    ecp::GovernanceService svc(cfg, std::move(deps));
    svc.enforce_decision(make_decision("loan_approval", "critical one"));
    svc.enforce_decision(make_decision("loan_approval", "critical two"));
    expect(svc.verify_integrity().ok, "fresh ledger verifies");
  }
  const auto path = dir / "ledger.ndjson";
  auto lines = read_lines(path);
  auto e = ecp::ledger_entry_from_json(lines[0]);
  e->payload["description"] = Value{"rewritten"};
  lines[0] = ecp::ledger_entry_to_json(*e);
  write_lines(path, lines);

  ecp::GovernanceDeps deps;
  deps.clock = test_clock();
  ecp::GovernanceService reopened(cfg, std::move(deps));
  expect(!reopened.verify_integrity().ok, "verify_integrity detects the edit");
  const auto report = reopened.run_check();
  expect(!report.healthy(), "degraded");
  expect(!report.critical_errors.empty(), "chain damage is critical");
  expect(!report.checks[1].passed, "rewritten description no longer matches its event id");
}

void test_consistency_precedent_validity() {
  g_now = kEpochMs;
  auto svc = make_service();
  const auto r = svc->enforce_decision(make_decision("loan_approval", "short precedent", false));
  ecp::HumanRuling ruling;
  ruling.event_id = r.event_id;
  ruling.issued_by = "board";
  ruling.precedent_created = true;
  ruling.applicable_event_types = {"loan_approval"};
  ruling.validity_days = 1;
  expect(svc->create_ruling(ruling) == ecp::ErrorCode::none, "precedent stored");

  g_now += 2 * ecp::kMillisPerDay;
  auto report = svc->run_check();
  expect(report.healthy(), "expiry is informational");
  expect(report.checks[4].notes.size() == 1, "expired precedent listed");

  ecp::HumanRuling broken = ruling;
  broken.event_id = "evt_dddddddddddddddd";
  broken.applicable_event_types.clear();
  broken.validity_days = 0;
  svc->store().put(ecp::collections::kRulings, broken.event_id,
                   ecp::jsonlite::to_json(ecp::to_object(broken)));
  report = svc->run_check();
  expect(report.checks[4].errors.size() == 2, "missing types and window reported");
  expect(!report.checks[3].passed, "ruling for a missing event reported");
  g_now = kEpochMs;
}

// ============================================================================
// Phase 10: Configuration & persistence
// ============================================================================

void test_config_validation() {
  ecp::GovernanceConfig c;
  expect(c.validate().ok, "defaults are valid");
  c.consensus.weights.risk = -0.1;
  c.consensus.review_threshold = 1.5;
  c.consensus.status_scale = {0.0, 0.8, 0.4, 1.0};
  const auto v = c.validate();
  expect(!v.ok && v.errors.size() == 3, "each problem reported");
}

void test_config_file_and_env() {
  const auto dir = fresh_dir("config");
  const auto good = dir / "good.json";
  {
    std::ofstream ofs(good);
    ofs << R"({"data_root":"/tmp/ecp-data","consensus":{"aggregation":"mean","review_threshold":0.45,)"
        << R"("weights":{"status":0.6,"confidence":0.1,"risk":0.3}},"notify":{"command":"gh","timeout_ms":5000}})";
  }
  ecp::GovernanceConfig c;
  ecp::ErrorCode err = ecp::ErrorCode::none;
  std::string detail;
  expect(ecp::load_config_file(good.string(), c, &err, &detail), "valid config loads: " + detail);
  expect(c.data_root == "/tmp/ecp-data", "data_root read");
  expect(c.consensus.aggregation == ecp::Aggregation::mean, "aggregation read");
  expect(c.consensus.review_threshold == 0.45, "threshold read");
  expect(c.consensus.weights.status == 0.6, "weights read");
  expect(c.notify_command == "gh" && c.notify_timeout_ms == 5000, "notify settings read");

  const auto dup = dir / "dup.json";
  { std::ofstream(dup) << R"({"data_root":"a","data_root":"b"})"; }
  ecp::GovernanceConfig d;
  expect(!ecp::load_config_file(dup.string(), d, &err), "duplicate key rejected");
  expect(err == ecp::ErrorCode::json_duplicate_key, "json_duplicate_key");

  const auto bad = dir / "bad.json";
  { std::ofstream(bad) << R"({"consensus":{"aggregation":"median"}})"; }
  expect(!ecp::load_config_file(bad.string(), d, &err), "unknown aggregation rejected");
  expect(err == ecp::ErrorCode::config_invalid, "config_invalid");
  expect(d.consensus.aggregation == ecp::Aggregation::max, "failed load leaves config untouched");

  setenv("ECP_REVIEW_THRESHOLD", "0.25", 1);
  setenv("ECP_AGGREGATION", "bogus", 1);
  std::vector<std::string> env_errors;
  ecp::GovernanceConfig e;
  e.apply_env(&env_errors);
  unsetenv("ECP_REVIEW_THRESHOLD");
  unsetenv("ECP_AGGREGATION");
  expect(e.consensus.review_threshold == 0.25, "threshold from env");
  expect(env_errors.size() == 1 && e.consensus.aggregation == ecp::Aggregation::max,
         "bad aggregation reported and ignored");
}

void test_config_file_timeout_bounds() {
  const auto dir = fresh_dir("config_timeout");
  auto load = [&](const std::string& name, const std::string& body, ecp::GovernanceConfig& c) {
    const auto path = dir / name;
    { std::ofstream(path) << body; }
    ecp::ErrorCode err = ecp::ErrorCode::none;
    const bool ok = ecp::load_config_file(path.string(), c, &err);
    expect(ok || err == ecp::ErrorCode::config_invalid, "timeout problems are config_invalid");
    return ok;
  };
  ecp::GovernanceConfig c;
  const int before = c.notify_timeout_ms;
  expect(!load("wrap.json", R"({"notify":{"timeout_ms":4294967297}})", c), "value past int range rejected");
  expect(!load("day.json", R"({"notify":{"timeout_ms":86400001}})", c), "value past 24h rejected");
  expect(!load("neg.json", R"({"notify":{"timeout_ms":-5}})", c), "negative value rejected");
  expect(!load("text.json", R"({"notify":{"timeout_ms":"fast"}})", c), "non-numeric value rejected");
  expect(c.notify_timeout_ms == before, "rejected loads leave the timeout untouched");
  expect(load("ok.json", R"({"notify":{"timeout_ms":2500}})", c) && c.notify_timeout_ms == 2500,
         "in-range value accepted");
}

void test_service_persistence_across_restart() {
  const auto dir = fresh_dir("service_restart");
  ecp::GovernanceConfig cfg;
  cfg.data_root = dir.string();
  std::string e1;
  std::string vid;
  {
    ecp::GovernanceDeps deps;
    deps.clock = test_clock();
    ecp::GovernanceService svc(cfg, std::move(deps));
    e1 = divergent_event(svc, "persisted across restart");
    svc.score_event(e1);
    vid = svc.record_violation("late_filing", ecp::Severity::warning, "late", "agent-1");
  }
  ecp::GovernanceDeps deps;
  deps.clock = test_clock();
  ecp::GovernanceService svc(cfg, std::move(deps));
  expect(svc.ledger().find(e1).has_value(), "event reloaded");
  expect(svc.guard().classifications_for(e1).size() == 2, "classification index rebuilt");
  expect(svc.violations().find(vid).has_value(), "violation reloaded");
  expect(svc.escalation_for_event(e1).has_value(), "consensus escalation reloaded");
  const auto replay = svc.enforce_decision(make_decision("loan_approval", "persisted across restart"));
  expect(replay.error == ecp::ErrorCode::replay_rejected, "replay protection survives restart");
  expect(svc.run_check().healthy(), "restarted store is consistent");
}

void test_governance_events_emitted() {
  {
    std::lock_guard<std::mutex> lk(g_events_mu);
    g_events.clear();
  }
  auto svc = make_service();
  ecp::Decision bad = make_decision("loan_approval", "event hook");
  bad.context.erase("causation");
  svc->enforce_decision(bad);
  const std::string e = divergent_event(*svc, "event hook ok");
  svc->score_event(e);
  svc->verify_integrity();

  expect(count_events(ecp::GovernanceEventKind::decision_rejected) == 1, "rejection emitted");
  expect(count_events(ecp::GovernanceEventKind::decision_accepted) == 1, "acceptance emitted");
  expect(count_events(ecp::GovernanceEventKind::classification_recorded) == 2, "classifications emitted");
  expect(count_events(ecp::GovernanceEventKind::review_required) == 1, "review emitted");
  expect(count_events(ecp::GovernanceEventKind::integrity_check) == 1, "integrity check emitted");
  expect(ecp::global_governance_stats().decisions_accepted.load() > 0, "stats updated");
  std::lock_guard<std::mutex> lk(g_events_mu);
  const std::string line = ecp::governance_event_to_json(g_events.front());
  expect(line.find("\"kind\"") != std::string::npos, "events serialize as JSON");
}

}  // namespace

int main() {
  ecp::set_governance_event_hook(capture_event);
  std::cout << "=== ECP Governance Core Test Suite ===\n";

  std::cout << "\n[Phase 1] Hashing & Canonical JSON\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("canonical and strict JSON", test_json_canonical_and_strict);
  run_test("canonical doubles are exact", test_canonical_doubles_are_exact);
  run_test("unicode escapes decode to UTF-8", test_unicode_escapes_decode_to_utf8);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Phase 2] Ledger\n";
  run_test("chain links and genesis", test_ledger_chain_links);
  run_test("explicit id replay", test_ledger_explicit_id_replay);
  run_test("persist and reload", test_ledger_persist_and_reload);
  run_test("payload tamper is hash_mismatch", test_ledger_tamper_payload_is_hash_mismatch);
  run_test("deletion is chain_link_break", test_ledger_deletion_is_chain_break);
  run_test("genesis alteration", test_ledger_genesis_alteration);
  run_test("malformed line and full audit", test_ledger_malformed_and_audit_all);
  run_test("write failure", test_ledger_write_failure);
  run_test("short write leaves no torn line", test_ledger_short_write_leaves_no_torn_line);

  std::cout << "\n[Phase 3] Record Store\n";
  run_test("filesystem store", test_fs_record_store);
  run_test("compressed archive collection", test_fs_record_store_compressed_collection);
  run_test("memory store fail hook", test_memory_store_fail_hook);

  std::cout << "\n[Phase 4] Event Gate\n";
  run_test("k missing fields named exactly (all 31 subsets)", test_context_subsets_reject_exact_fields);
  run_test("invalid context values", test_invalid_context_values);
  run_test("deterministic event id", test_event_id_deterministic);
  run_test("event id separates fields and values", test_event_id_separates_fields_and_values);
  run_test("replay rejected", test_replay_rejected_not_double_appended);
  run_test("self-classification on agency", test_self_classification_on_agency);
  run_test("fallback on throwing classifier", test_fallback_when_self_classifier_throws);
  run_test("fallback on refusing classifier", test_fallback_when_self_classifier_refuses);
  run_test("unclassified event escalates", test_unclassified_event_escalates_when_fallback_fails);

  std::cout << "\n[Phase 5] Classifications\n";
  run_test("guard rejects bad input", test_guard_rejects_unknown_event_and_bad_values);
  run_test("guard archives prior revision", test_guard_archives_prior_revision);
  run_test("guard restores when anchor fails", test_guard_restores_when_anchor_fails);
  run_test("concurrent classifiers (8 threads)", test_concurrent_classifiers);
  run_test("concurrent decisions (6 threads)", test_concurrent_decisions);

  std::cout << "\n[Phase 6] Consensus\n";
  run_test("divergence symmetric", test_divergence_symmetric);
  run_test("single classification yields empty", test_single_classification_yields_empty);
  run_test("unethical forces review", test_unethical_forces_review);
  run_test("max versus mean aggregation", test_max_versus_mean_aggregation);
  run_test("scenario E1 divergence", test_scenario_e1_divergence);
  run_test("score_event idempotent", test_score_event_idempotent);

  std::cout << "\n[Phase 7] Violations & Escalation\n";
  run_test("blocking violation with failing notifier", test_blocking_violation_with_failing_notifier);
  run_test("throwing notifier contained", test_throwing_notifier_is_contained);
  run_test("only blocking violations notify", test_notifier_receives_blocking_only);
  run_test("persist failure keeps record", test_violation_persist_failure_keeps_record);
  run_test("queries and report", test_violation_queries_and_report);
  run_test("notifier formatting", test_notifier_formatting);

  std::cout << "\n[Phase 8] Rulings & Precedents\n";
  run_test("ruling resolves escalation, precedent applies", test_ruling_resolves_escalation_and_precedent);
  run_test("ruling validation", test_ruling_validation);
  run_test("long precedent window never wraps", test_long_precedent_window_never_wraps);

  std::cout << "\n[Phase 9] Consistency Battery\n";
  run_test("healthy flow", test_consistency_healthy_flow);
  run_test("record tampering detected", test_consistency_detects_record_tampering);
  run_test("event references", test_consistency_event_references);
  run_test("ledger damage is critical", test_consistency_ledger_damage_is_critical);
  run_test("precedent validity", test_consistency_precedent_validity);

  std::cout << "\n[Phase 10] Configuration & Persistence\n";
  run_test("config validation", test_config_validation);
  run_test("config file and environment", test_config_file_and_env);
  run_test("config file timeout bounds", test_config_file_timeout_bounds);
  run_test("persistence across restart", test_service_persistence_across_restart);
  run_test("governance events emitted", test_governance_events_emitted);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
