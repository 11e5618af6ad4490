#include "ecp/version.hpp"

#include "ecp/jsonlite.hpp"

#ifndef ECP_VERSION_STRING
#define ECP_VERSION_STRING "0.1.0"
#endif

namespace ecp {
namespace version {

VersionManifest current_manifest(const std::string& engine_semver) {
  VersionManifest m;
  m.engine_semver = engine_semver.empty() ? std::string(ECP_VERSION_STRING) : engine_semver;
  m.hash_primitive = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + __TIME__;
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["ledger_format"] = Value{static_cast<std::uint64_t>(m.ledger_format)};
  o["hash_algorithm"] = Value{static_cast<std::uint64_t>(m.hash_algorithm)};
  o["record_layout"] = Value{static_cast<std::uint64_t>(m.record_layout)};
  o["event_log"] = Value{static_cast<std::uint64_t>(m.event_log)};
  o["engine_semver"] = Value{m.engine_semver};
  o["hash_primitive"] = Value{m.hash_primitive};
  o["build_timestamp"] = Value{m.build_timestamp};
  return jsonlite::to_json(o);
}

}  // namespace version
}  // namespace ecp
