#pragma once

// arbiter/version.hpp — Explicit version manifest for every persisted format.
//
// PURPOSE:
//   Prevent silent format drift in the artifacts downstream review tooling
//   depends on: snapshot metadata, evaluation reports, the command audit
//   stream and the dataset cache. Every reader checks its constant before
//   trusting data.
//
// INVARIANT:
//   All version constants are compile-time. Readers reject documents whose
//   format_version is newer than the one compiled in.

#include <cstdint>
#include <string>

namespace arbiter {
namespace version {

constexpr const char* kSemver = "0.4.0";

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3 (32 bytes, hex-encoded to 64 chars) with "cas:",
// "audit:" and "ws:" domain prefixes.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// CAS_FORMAT_VERSION
// Version 2 = AB/CD/<64-char-digest> sharding with JSON .meta sidecars.
// ---------------------------------------------------------------------------
constexpr uint32_t CAS_FORMAT_VERSION = 2;

// ---------------------------------------------------------------------------
// AUDIT_LOG_VERSION
// Version 1 = NDJSON CommandLog entries chained by previous_digest.
// ---------------------------------------------------------------------------
constexpr uint32_t AUDIT_LOG_VERSION = 1;

// ---------------------------------------------------------------------------
// SNAPSHOT_FORMAT_VERSION
// Version 1 = <dir>/metadata.json + <dir>/filesystem.tar.
// ---------------------------------------------------------------------------
constexpr uint32_t SNAPSHOT_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// REPORT_FORMAT_VERSION
// Version 1 = evaluation_report.json as produced by report_to_json().
// ---------------------------------------------------------------------------
constexpr uint32_t REPORT_FORMAT_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t cas_format{CAS_FORMAT_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  uint32_t snapshot_format{SNAPSHOT_FORMAT_VERSION};
  uint32_t report_format{REPORT_FORMAT_VERSION};
  std::string semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest();

// Serialize to compact JSON.
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace arbiter
