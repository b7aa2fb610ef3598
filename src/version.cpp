#include "arbiter/version.hpp"

#include <sstream>

#include "arbiter/hash.hpp"

namespace arbiter {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver          = kSemver;
  m.hash_primitive  = hash_runtime_info().primitive;
  // Deterministic within a single build.
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"hash_algorithm\":" << m.hash_algorithm
    << ",\"cas_format\":" << m.cas_format
    << ",\"audit_log\":" << m.audit_log
    << ",\"snapshot_format\":" << m.snapshot_format
    << ",\"report_format\":" << m.report_format
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace arbiter
