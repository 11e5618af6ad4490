#pragma once

// ecp/version.hpp - Explicit version manifest for every persisted format.
//
// PURPOSE:
//   Prevent silent format drift across the ledger, the record store and the
//   structured event log. Every component that reads or writes a versioned
//   format must check its corresponding constant here before processing data.
//
// INVARIANT:
//   All version constants are compile-time. Changing any of the formats below
//   without bumping the constant makes previously written ledgers unverifiable.
//
// EXTENSION_POINT: format_migration
//   Current: hard-fail on mismatch.
//   Upgrade path: add a reader for the previous LEDGER_FORMAT_VERSION that
//   re-derives hashes with the old scheme during a verification window.

#include <cstdint>
#include <string>

namespace ecp {
namespace version {

// ---------------------------------------------------------------------------
// LEDGER_FORMAT_VERSION
// Tracks the NDJSON line layout of ledger.ndjson and the hashed field set.
// Version 1 = {entry_type, payload, previous_hash, timestamp_unix_ms} hashed
// under the "led:" domain, genesis link = 64 '0' characters.
// ---------------------------------------------------------------------------
constexpr uint32_t LEDGER_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3 (32 bytes, hex-encoded to 64 chars) with domain prefixes.
// ALL digest comparisons must first verify HASH_ALGORITHM_VERSION matches.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// RECORD_LAYOUT_VERSION
// Tracks the on-disk layout of keyed records:
//   <root>/<collection>/<key>.json, canonical (sorted-key) JSON, or
//   <key>.json.zst (zstd frame) for compressed collections.
// ---------------------------------------------------------------------------
constexpr uint32_t RECORD_LAYOUT_VERSION = 1;

// ---------------------------------------------------------------------------
// EVENT_LOG_VERSION
// Tracks the JSONL schema written to ECP_EVENT_LOG.
// ---------------------------------------------------------------------------
constexpr uint32_t EVENT_LOG_VERSION = 1;

struct VersionManifest {
  uint32_t ledger_format{LEDGER_FORMAT_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t record_layout{RECORD_LAYOUT_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  std::string engine_semver;    // from the CMake project version
  std::string hash_primitive;   // "blake3"
  std::string build_timestamp;  // from __DATE__/__TIME__
};

// Returns the current version manifest populated at compile time.
VersionManifest current_manifest(const std::string& engine_semver = "");

// Serialize to compact JSON.
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace ecp
