#include "ecp/hash.hpp"

// Hash authority for the ledger and the record store.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive. No fallbacks, no alternatives.
//   2. Domain separation: "led:", "evt:", "rec:" prefixes prevent a ledger
//      entry digest from ever colliding with an event id or a record digest
//      computed over the same bytes. These prefixes are part of the ledger
//      format contract (version::LEDGER_FORMAT_VERSION).
//
// EXTENSION_POINT: hash_algorithm_upgrade
//   Increment version::HASH_ALGORITHM_VERSION, add a dual-verify window in
//   Ledger::verify_integrity(), then drop version 1 once ledgers are migrated.

#include <array>
#include <cstdint>
#include <initializer_list>

extern "C" {
#include <blake3.h>
}

namespace ecp {
namespace {

// Hashes the concatenation of parts and returns lowercase hex.
std::string digest_hex(std::initializer_list<std::string_view> parts) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  for (const auto part : parts) blake3_hasher_update(&hasher, part.data(), part.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> raw{};
  blake3_hasher_finalize(&hasher, raw.data(), raw.size());

  static constexpr char kHex[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(raw.size() * 2);
  for (const unsigned char b : raw) {
    hex.push_back(kHex[b >> 4]);
    hex.push_back(kHex[b & 0x0f]);
  }
  return hex;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.version = blake3_version();
  info.primitive = "blake3";
  info.backend = "system";
  info.blake3_available = true;
  return info;
}

std::string blake3_hex(std::string_view payload) { return digest_hex({payload}); }

std::string hash_domain(std::string_view domain, std::string_view payload) {
  return digest_hex({domain, payload});
}

std::string deterministic_digest(std::string_view payload) { return blake3_hex(payload); }

std::string ledger_entry_hash(std::string_view canonical_json) { return hash_domain("led:", canonical_json); }
std::string event_id_hash(std::string_view id_material) { return hash_domain("evt:", id_material); }
std::string record_digest(std::string_view canonical_json) { return hash_domain("rec:", canonical_json); }

bool is_hex_digest(std::string_view d) {
  return d.size() == 64 &&
         d.find_first_not_of("0123456789abcdef") == std::string_view::npos;
}

}  // namespace ecp
