#pragma once

#include <string>
#include <string_view>

namespace ecp {

struct HashRuntimeInfo {
  std::string primitive;
  std::string backend;
  std::string version;
  bool blake3_available{false};
};

// Core BLAKE3 hashing
std::string blake3_hex(std::string_view payload);
std::string deterministic_digest(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing for different contexts.
// "led:" ledger entries, "evt:" decision event ids, "rec:" stored records.
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string ledger_entry_hash(std::string_view canonical_json);
std::string event_id_hash(std::string_view id_material);
std::string record_digest(std::string_view canonical_json);

// True if d is a 64-char lowercase hex string.
bool is_hex_digest(std::string_view d);

}  // namespace ecp
