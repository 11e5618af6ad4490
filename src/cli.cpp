#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "ecp/config.hpp"
#include "ecp/governance.hpp"
#include "ecp/hash.hpp"
#include "ecp/jsonlite.hpp"
#include "ecp/observability.hpp"
#include "ecp/version.hpp"

namespace {

using ecp::jsonlite::Object;
using ecp::jsonlite::Value;

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitRejected = 2;
constexpr int kExitConfig = 3;

std::string read_file(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

// Fatal errors go to stderr as one JSON line.
int fail(int exit_code, const std::string &code, const std::string &detail) {
  Object o;
  o["error"] = Value{code};
  o["detail"] = Value{detail};
  std::cerr << ecp::jsonlite::to_json(o) << "\n";
  return exit_code;
}

std::string flag(int argc, char **argv, const std::string &name,
                 const std::string &def = "") {
  for (int i = 1; i + 1 < argc; ++i)
    if (name == argv[i])
      return argv[i + 1];
  return def;
}

bool has_flag(int argc, char **argv, const std::string &name) {
  for (int i = 1; i < argc; ++i)
    if (name == argv[i])
      return true;
  return false;
}

bool parse_number(const std::string &text, double &out) {
  if (text.empty())
    return false;
  char *end = nullptr;
  errno = 0;
  out = std::strtod(text.c_str(), &end);
  return errno == 0 && end && *end == '\0' && std::isfinite(out);
}

// Whole non-negative count; rejects signs, fractions and values past uint64.
bool parse_count(const std::string &text, uint64_t &out) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
    return false;
  char *end = nullptr;
  errno = 0;
  const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
  if (errno == ERANGE || !end || *end != '\0')
    return false;
  out = static_cast<uint64_t>(v);
  return true;
}

std::vector<std::string> split_csv(const std::string &s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ','))
    if (!item.empty())
      out.push_back(item);
  return out;
}

// Known BLAKE3 test vectors
bool verify_hash_vectors() {
  if (ecp::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262")
    return false;
  if (ecp::blake3_hex("hello") !=
      "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f")
    return false;
  return true;
}

// A decision comes from --request FILE (a JSON object with action_type,
// description, payload, agent_id, context) or from individual flags.
bool build_decision(int argc, char **argv, ecp::Decision &d,
                    std::string &error) {
  const std::string request_file = flag(argc, argv, "--request");
  if (!request_file.empty()) {
    std::optional<ecp::jsonlite::JsonError> err;
    auto obj = ecp::jsonlite::parse(read_file(request_file), &err);
    if (err) {
      error = err->code + ": " + err->message;
      return false;
    }
    d.action_type = ecp::jsonlite::get_string(obj, "action_type");
    d.description = ecp::jsonlite::get_string(obj, "description");
    d.payload = ecp::jsonlite::get_object(obj, "payload");
    d.agent_id = ecp::jsonlite::get_string(obj, "agent_id");
    d.context = ecp::jsonlite::get_object(obj, "context");
    return true;
  }

  d.action_type = flag(argc, argv, "--action");
  d.description = flag(argc, argv, "--description");
  d.agent_id = flag(argc, argv, "--agent");
  const std::string payload = flag(argc, argv, "--payload", "{}");
  std::optional<ecp::jsonlite::JsonError> err;
  d.payload = ecp::jsonlite::parse(payload, &err);
  if (err) {
    error = "--payload: " + err->message;
    return false;
  }
  const std::pair<const char *, const char *> string_fields[] = {
      {"--causation", "causation"},
      {"--duty-of-care", "duty_of_care"},
      {"--knowledge-level", "knowledge_level"},
      {"--control-level", "control_level"}};
  for (const auto &[opt, field] : string_fields)
    if (has_flag(argc, argv, opt))
      d.context[field] = Value{flag(argc, argv, opt)};
  if (has_flag(argc, argv, "--agency")) {
    const std::string agency = flag(argc, argv, "--agency");
    if (agency == "true" || agency == "false")
      d.context["agency_present"] = Value{agency == "true"};
    else
      d.context["agency_present"] = Value{agency};
  }
  return true;
}

void print_usage() {
  std::cerr
      << "usage: ecp [--root DIR | --in-memory] [--config FILE] <command> "
         "[options]\n"
         "  version | health | verify | check | stats | config\n"
         "  decide --action A --description D --agent X [--payload JSON]\n"
         "         --causation C --agency true|false --duty-of-care S\n"
         "         --knowledge-level S --control-level S | --request FILE\n"
         "  classify --event E --classifier C --status S --confidence X "
         "--risk R [--reasoning T]\n"
         "  score --event E\n"
         "  rule --event E --issued-by U --assessment S [--reasoning T]\n"
         "       [--precedent --types a,b --validity-days N]\n"
         "  violation record --type T --severity S --message M [--agent A]\n"
         "                   [--function F]\n"
         "  violation report\n";
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return kExitUsage;
  }

  // The command is the first positional argument; flags take one value
  // except the boolean ones listed here.
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a.rfind("--", 0) == 0) {
      if (a != "--precedent" && a != "--in-memory")
        ++i;
      continue;
    }
    positional.push_back(a);
  }
  if (positional.empty()) {
    print_usage();
    return kExitUsage;
  }
  const std::string cmd = positional[0];
  const std::string sub = positional.size() > 1 ? positional[1] : "";

  if (cmd == "version") {
    std::cout << ecp::version::manifest_to_json(
                     ecp::version::current_manifest())
              << "\n";
    return kExitOk;
  }

  // Configuration: defaults, then --config FILE, then environment, then flags.
  ecp::GovernanceConfig config;
  const std::string config_file = flag(argc, argv, "--config");
  if (!config_file.empty()) {
    ecp::ErrorCode code = ecp::ErrorCode::none;
    std::string detail;
    if (!ecp::load_config_file(config_file, config, &code, &detail))
      return fail(kExitConfig, ecp::to_string(code), detail);
  }
  std::vector<std::string> env_errors;
  config.apply_env(&env_errors);
  if (has_flag(argc, argv, "--root"))
    config.data_root = flag(argc, argv, "--root");
  if (has_flag(argc, argv, "--in-memory"))
    config.in_memory = true;
  auto validation = config.validate();
  validation.errors.insert(validation.errors.begin(), env_errors.begin(),
                           env_errors.end());
  if (!validation.errors.empty()) {
    std::string joined;
    for (const auto &e : validation.errors)
      joined += (joined.empty() ? "" : "; ") + e;
    return fail(kExitConfig, ecp::to_string(ecp::ErrorCode::config_invalid),
                joined);
  }

  ecp::GovernanceService svc(config);

  if (cmd == "health") {
    const auto h = ecp::hash_runtime_info();
    const auto integrity = svc.verify_integrity();
    Object o;
    o["hash_primitive"] = Value{h.primitive};
    o["hash_backend"] = Value{h.backend};
    o["hash_version"] = Value{h.version};
    o["hash_available"] = Value{h.blake3_available};
    o["hash_vectors_ok"] = Value{verify_hash_vectors()};
    o["ledger_entries"] = Value{static_cast<std::uint64_t>(svc.ledger().size())};
    o["ledger_ok"] = Value{integrity.ok};
    o["data_root"] = Value{config.in_memory ? std::string(":memory:")
                                            : config.data_root};
    o["store_backend"] = Value{svc.store().backend_id()};
    std::cout << ecp::jsonlite::to_json(o) << "\n";
    return integrity.ok ? kExitOk : kExitRejected;
  }

  if (cmd == "decide") {
    ecp::Decision d;
    std::string error;
    if (!build_decision(argc, argv, d, error))
      return fail(kExitUsage,
                  ecp::to_string(ecp::ErrorCode::json_parse_error), error);
    const auto r = svc.enforce_decision(d);
    svc.violations().flush_notifications();
    std::cout << r.to_json() << "\n";
    return r.ok ? kExitOk : kExitRejected;
  }

  if (cmd == "classify") {
    const auto status =
        ecp::ethical_status_from_string(flag(argc, argv, "--status"));
    const auto risk =
        ecp::risk_estimate_from_string(flag(argc, argv, "--risk"));
    double confidence = 0.0;
    if (!status || !risk ||
        !parse_number(flag(argc, argv, "--confidence"), confidence))
      return fail(kExitUsage,
                  ecp::to_string(ecp::ErrorCode::classification_invalid),
                  "--status, --risk and a numeric --confidence are required");
    const auto r = svc.classify_event(
        flag(argc, argv, "--event"), flag(argc, argv, "--classifier"),
        *status, confidence, *risk, flag(argc, argv, "--reasoning"));
    svc.violations().flush_notifications();
    std::cout << r.to_json() << "\n";
    return r.ok ? kExitOk : kExitRejected;
  }

  if (cmd == "score") {
    const auto r = svc.score_event(flag(argc, argv, "--event"));
    std::cout << r.to_json() << "\n";
    return r.error == ecp::ErrorCode::none ? kExitOk : kExitRejected;
  }

  if (cmd == "rule") {
    ecp::HumanRuling ruling;
    ruling.event_id = flag(argc, argv, "--event");
    ruling.issued_by = flag(argc, argv, "--issued-by");
    const auto assessment =
        ecp::ethical_status_from_string(flag(argc, argv, "--assessment"));
    if (!assessment)
      return fail(kExitUsage, ecp::to_string(ecp::ErrorCode::ruling_invalid),
                  "--assessment must be an ethical status");
    ruling.final_assessment = *assessment;
    ruling.reasoning = flag(argc, argv, "--reasoning");
    ruling.precedent_created = has_flag(argc, argv, "--precedent");
    ruling.applicable_event_types = split_csv(flag(argc, argv, "--types"));
    uint64_t days = 0;
    if (has_flag(argc, argv, "--validity-days") &&
        !parse_count(flag(argc, argv, "--validity-days"), days))
      return fail(kExitUsage, ecp::to_string(ecp::ErrorCode::ruling_invalid),
                  "--validity-days must be a whole number of days");
    ruling.validity_days = days;

    std::string detail;
    const auto code = svc.create_ruling(ruling, &detail);
    Object o;
    o["ok"] = Value{code == ecp::ErrorCode::none};
    o["error"] = Value{ecp::to_string(code)};
    o["detail"] = Value{detail};
    if (code == ecp::ErrorCode::none)
      o["ruling"] = Value{ecp::to_object(ruling)};
    std::cout << ecp::jsonlite::to_json(o) << "\n";
    return code == ecp::ErrorCode::none ? kExitOk : kExitRejected;
  }

  if (cmd == "violation" && sub == "record") {
    const auto severity =
        ecp::severity_from_string(flag(argc, argv, "--severity"));
    if (!severity)
      return fail(kExitUsage,
                  ecp::to_string(ecp::ErrorCode::compliance_violation),
                  "--severity must be blocking, warning or audit");
    const std::string id = svc.record_violation(
        flag(argc, argv, "--type"), *severity, flag(argc, argv, "--message"),
        flag(argc, argv, "--agent"), flag(argc, argv, "--function"));
    svc.violations().flush_notifications();
    Object o;
    o["violation_id"] = Value{id};
    auto esc = svc.violations().escalation_for(id);
    o["escalation"] = esc ? Value{ecp::to_object(*esc)} : Value{nullptr};
    o["notifications_failed"] =
        Value{svc.violations().dispatcher().failed()};
    std::cout << ecp::jsonlite::to_json(o) << "\n";
    return kExitOk;
  }

  if (cmd == "violation" && sub == "report") {
    std::cout << svc.violation_report().to_json() << "\n";
    return kExitOk;
  }

  if (cmd == "verify") {
    const auto r = svc.verify_integrity();
    std::cout << r.to_json() << "\n";
    return r.ok ? kExitOk : kExitRejected;
  }

  if (cmd == "check") {
    const auto r = svc.run_check();
    std::cout << r.to_json() << "\n";
    return r.healthy() ? kExitOk : kExitRejected;
  }

  if (cmd == "stats") {
    std::cout << ecp::global_governance_stats().to_json() << "\n";
    return kExitOk;
  }

  if (cmd == "config") {
    std::cout << config.to_json() << "\n";
    return kExitOk;
  }

  print_usage();
  return kExitUsage;
}
