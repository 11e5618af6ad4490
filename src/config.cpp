#include "ecp/config.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace ecp {

using jsonlite::Object;
using jsonlite::Value;

namespace {

bool parse_double(const char* text, double& out) {
  if (!text || !text[0]) return false;
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(text, &end);
  if (errno != 0 || end == text || *end != '\0' || !std::isfinite(v)) return false;
  out = v;
  return true;
}

constexpr long kMaxNotifyTimeoutMs = 24L * 60 * 60 * 1000;

bool parse_int(const char* text, int& out) {
  if (!text || !text[0]) return false;
  char* end = nullptr;
  errno = 0;
  const long v = std::strtol(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0' || v < 0 || v > kMaxNotifyTimeoutMs) return false;
  out = static_cast<int>(v);
  return true;
}

constexpr const char* kStatusNames[4] = {"ethical", "permissible", "questionable", "unethical"};
constexpr const char* kRiskNames[3] = {"low", "medium", "high"};

}  // namespace

std::string GovernanceConfig::ledger_path() const {
  if (in_memory) return "";
  return (fs::path(data_root) / "ledger.ndjson").string();
}

void GovernanceConfig::apply_env(std::vector<std::string>* errors) {
  auto note = [&](const std::string& e) {
    if (errors) errors->push_back(e);
  };
  if (const char* e = std::getenv("ECP_DATA_ROOT"); e && e[0]) data_root = e;
  if (const char* e = std::getenv("ECP_EVENT_LOG"); e && e[0]) event_log_path = e;
  if (const char* e = std::getenv("ECP_NOTIFY_COMMAND"); e && e[0]) notify_command = e;
  if (const char* e = std::getenv("ECP_NOTIFY_TIMEOUT_MS"); e && e[0]) {
    if (!parse_int(e, notify_timeout_ms)) note("ECP_NOTIFY_TIMEOUT_MS is not a valid millisecond count");
  }
  if (const char* e = std::getenv("ECP_REVIEW_THRESHOLD"); e && e[0]) {
    if (!parse_double(e, consensus.review_threshold)) note("ECP_REVIEW_THRESHOLD is not a number");
  }
  if (const char* e = std::getenv("ECP_AGGREGATION"); e && e[0]) {
    auto a = aggregation_from_string(e);
    if (a) {
      consensus.aggregation = *a;
    } else {
      note(std::string("ECP_AGGREGATION must be max or mean, got ") + e);
    }
  }
}

GovernanceConfig GovernanceConfig::from_env() {
  GovernanceConfig c;
  c.apply_env();
  return c;
}

ConfigValidationResult GovernanceConfig::validate() const {
  ConfigValidationResult r;
  auto fail = [&](const std::string& e) {
    r.ok = false;
    r.errors.push_back(e);
  };
  if (!in_memory && data_root.empty()) fail("data_root is empty");

  const auto& w = consensus.weights;
  if (!(w.status >= 0.0) || !(w.confidence >= 0.0) || !(w.risk >= 0.0)) {
    fail("consensus weights must be non-negative");
  }
  if (!(consensus.review_threshold >= 0.0 && consensus.review_threshold <= 1.0)) {
    fail("review_threshold must be within [0,1]");
  }
  for (std::size_t i = 1; i < consensus.status_scale.size(); ++i) {
    if (!(consensus.status_scale[i] >= consensus.status_scale[i - 1])) {
      fail(std::string("status_scale must be non-decreasing at ") + kStatusNames[i]);
    }
  }
  for (std::size_t i = 1; i < consensus.risk_scale.size(); ++i) {
    if (!(consensus.risk_scale[i] >= consensus.risk_scale[i - 1])) {
      fail(std::string("risk_scale must be non-decreasing at ") + kRiskNames[i]);
    }
  }
  if (notify_timeout_ms <= 0) fail("notify timeout_ms must be positive");
  if (notify_queue_capacity == 0) fail("notify queue_capacity must be positive");
  return r;
}

std::string GovernanceConfig::to_json() const {
  Object weights;
  weights["status"] = Value{consensus.weights.status};
  weights["confidence"] = Value{consensus.weights.confidence};
  weights["risk"] = Value{consensus.weights.risk};
  Object status_scale;
  for (std::size_t i = 0; i < consensus.status_scale.size(); ++i) {
    status_scale[kStatusNames[i]] = Value{consensus.status_scale[i]};
  }
  Object risk_scale;
  for (std::size_t i = 0; i < consensus.risk_scale.size(); ++i) {
    risk_scale[kRiskNames[i]] = Value{consensus.risk_scale[i]};
  }
  Object cons;
  cons["aggregation"] = Value{to_string(consensus.aggregation)};
  cons["review_threshold"] = Value{consensus.review_threshold};
  cons["weights"] = Value{std::move(weights)};
  cons["status_scale"] = Value{std::move(status_scale)};
  cons["risk_scale"] = Value{std::move(risk_scale)};

  Object notify;
  notify["command"] = Value{notify_command};
  notify["args"] = Value{jsonlite::to_array(notify_args)};
  notify["timeout_ms"] = Value{static_cast<std::uint64_t>(notify_timeout_ms)};
  notify["queue_capacity"] = Value{static_cast<std::uint64_t>(notify_queue_capacity)};

  Object o;
  o["data_root"] = Value{data_root};
  o["in_memory"] = Value{in_memory};
  o["compress_archive"] = Value{compress_archive};
  o["event_log"] = Value{event_log_path};
  o["consensus"] = Value{std::move(cons)};
  o["notify"] = Value{std::move(notify)};
  return jsonlite::to_json(o);
}

bool load_config_file(const std::string& path, GovernanceConfig& config, ErrorCode* error,
                      std::string* detail) {
  auto fail = [&](ErrorCode code, const std::string& why) {
    if (error) *error = code;
    if (detail) *detail = why;
    return false;
  };

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return fail(ErrorCode::config_invalid, "cannot open config file: " + path);
  std::stringstream ss;
  ss << ifs.rdbuf();

  std::optional<jsonlite::JsonError> err;
  const Object root = jsonlite::parse(ss.str(), &err);
  if (err) {
    return fail(err->code == "json_duplicate_key" ? ErrorCode::json_duplicate_key : ErrorCode::json_parse_error,
                err->message);
  }

  GovernanceConfig c = config;
  c.data_root = jsonlite::get_string(root, "data_root", c.data_root);
  c.event_log_path = jsonlite::get_string(root, "event_log", c.event_log_path);
  c.in_memory = jsonlite::get_bool(root, "in_memory", c.in_memory);
  c.compress_archive = jsonlite::get_bool(root, "compress_archive", c.compress_archive);

  const Object cons = jsonlite::get_object(root, "consensus");
  if (cons.contains("aggregation")) {
    auto a = aggregation_from_string(jsonlite::get_string(cons, "aggregation"));
    if (!a) return fail(ErrorCode::config_invalid, "consensus.aggregation must be max or mean");
    c.consensus.aggregation = *a;
  }
  c.consensus.review_threshold = jsonlite::get_double(cons, "review_threshold", c.consensus.review_threshold);
  const Object weights = jsonlite::get_object(cons, "weights");
  c.consensus.weights.status = jsonlite::get_double(weights, "status", c.consensus.weights.status);
  c.consensus.weights.confidence = jsonlite::get_double(weights, "confidence", c.consensus.weights.confidence);
  c.consensus.weights.risk = jsonlite::get_double(weights, "risk", c.consensus.weights.risk);
  const Object status_scale = jsonlite::get_object(cons, "status_scale");
  for (std::size_t i = 0; i < c.consensus.status_scale.size(); ++i) {
    c.consensus.status_scale[i] = jsonlite::get_double(status_scale, kStatusNames[i], c.consensus.status_scale[i]);
  }
  const Object risk_scale = jsonlite::get_object(cons, "risk_scale");
  for (std::size_t i = 0; i < c.consensus.risk_scale.size(); ++i) {
    c.consensus.risk_scale[i] = jsonlite::get_double(risk_scale, kRiskNames[i], c.consensus.risk_scale[i]);
  }

  const Object notify = jsonlite::get_object(root, "notify");
  c.notify_command = jsonlite::get_string(notify, "command", c.notify_command);
  if (notify.contains("args")) c.notify_args = jsonlite::get_string_array(notify, "args");
  if (const auto it = notify.find("timeout_ms"); it != notify.end()) {
    if (!it->second.is_u64() ||
        std::get<std::uint64_t>(it->second.v) > static_cast<std::uint64_t>(kMaxNotifyTimeoutMs)) {
      return fail(ErrorCode::config_invalid, "notify.timeout_ms must be a whole number of ms up to 24h");
    }
    c.notify_timeout_ms = static_cast<int>(std::get<std::uint64_t>(it->second.v));
  }
  c.notify_queue_capacity = static_cast<std::size_t>(
      jsonlite::get_u64(notify, "queue_capacity", static_cast<std::uint64_t>(c.notify_queue_capacity)));

  auto v = c.validate();
  if (!v.ok) {
    std::string joined;
    for (const auto& e : v.errors) joined += (joined.empty() ? "" : "; ") + e;
    return fail(ErrorCode::config_invalid, joined);
  }
  config = std::move(c);
  return true;
}

}  // namespace ecp
