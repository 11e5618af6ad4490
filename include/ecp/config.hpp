#pragma once

// ecp/config.hpp - Governance service configuration.
//
// Sources, lowest precedence first:
//   1. built-in defaults (GovernanceConfig{})
//   2. a JSON config file (load_config_file), optional
//   3. environment (apply_env / from_env):
//        ECP_DATA_ROOT          data directory (default ".ecp")
//        ECP_EVENT_LOG          JSONL governance event log path
//        ECP_NOTIFY_COMMAND     escalation notifier command (empty = none)
//        ECP_NOTIFY_TIMEOUT_MS  notifier timeout
//        ECP_REVIEW_THRESHOLD   consensus review threshold in [0,1]
//        ECP_AGGREGATION        "max" | "mean"
//
// Config file shape (every key optional):
//   {"data_root":".ecp","event_log":"...","in_memory":false,
//    "compress_archive":true,
//    "consensus":{"aggregation":"max","review_threshold":0.3,
//                 "weights":{"status":0.5,"confidence":0.2,"risk":0.3},
//                 "status_scale":{"ethical":0,"permissible":0.333333,...},
//                 "risk_scale":{"low":0,"medium":0.5,"high":1}},
//    "notify":{"command":"gh","args":["issue","create"],"timeout_ms":10000,
//              "queue_capacity":256}}

#include <string>
#include <vector>

#include "ecp/consensus.hpp"
#include "ecp/types.hpp"

namespace ecp {

struct ConfigValidationResult {
  bool ok{true};
  std::vector<std::string> errors;
};

struct GovernanceConfig {
  std::string data_root{".ecp"};
  bool in_memory{false};  // MemoryRecordStore + memory-only ledger
  bool compress_archive{true};  // zstd for superseded classification revisions
  std::string event_log_path;
  ConsensusPolicy consensus;
  std::string notify_command;
  std::vector<std::string> notify_args{"issue", "create"};
  int notify_timeout_ms{10000};
  std::size_t notify_queue_capacity{256};

  std::string ledger_path() const;

  // Overlays ECP_* environment variables onto *this. Unparseable numbers
  // are reported into errors and leave the field unchanged.
  void apply_env(std::vector<std::string>* errors = nullptr);
  static GovernanceConfig from_env();

  ConfigValidationResult validate() const;
  std::string to_json() const;
};

// Reads a JSON config file on top of base. Returns false and sets *error
// (json_parse_error, json_duplicate_key or config_invalid) with *detail.
bool load_config_file(const std::string& path, GovernanceConfig& config,
                      ErrorCode* error = nullptr, std::string* detail = nullptr);

}  // namespace ecp
