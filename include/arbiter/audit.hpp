#pragma once

// arbiter/audit.hpp — Hash-chained, append-only command audit log.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: entries are never modified or deleted once appended.
//   2. SEQUENTIAL: sequence_no starts at 1 and increases by one per entry.
//   3. CHAINED: every entry carries previous_digest (the digest of the entry
//      before it, 64 zeros for the first) and its own digest, computed as
//      audit_entry_hash(command_log_canonical(entry)). Editing, removing or
//      reordering any entry breaks verification of every later one.
//   4. STRUCTURED: when a stream path is configured, every entry is written
//      as one NDJSON line and flushed before append() returns.
//   5. FAIL-SAFE: a stream write failure never loses the in-memory entry;
//      it is counted and reported, and metadata.json remains authoritative.

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "arbiter/types.hpp"

namespace arbiter {

constexpr const char* kAuditGenesisDigest =
    "0000000000000000000000000000000000000000000000000000000000000000";

class CommandAuditLog {
 public:
  // stream_path: NDJSON file receiving each entry as it is appended.
  // Empty = in-memory only. The parent directory must exist.
  explicit CommandAuditLog(const std::string& stream_path = "");
  ~CommandAuditLog();

  CommandAuditLog(const CommandAuditLog&) = delete;
  CommandAuditLog& operator=(const CommandAuditLog&) = delete;

  // Assigns sequence_no, previous_digest and digest in-place, then appends.
  // Returns false only if the stream write failed (the entry is still kept).
  bool append(CommandLog& entry);

  std::vector<CommandLog> entries() const;
  std::string head_digest() const;
  uint64_t entry_count() const;
  uint64_t stream_failure_count() const;
  const std::string& stream_path() const { return stream_path_; }

 private:
  struct Impl;
  std::string stream_path_;
  std::unique_ptr<Impl> impl_;
};

struct AuditVerification {
  bool ok{true};
  uint64_t entries{0};
  uint64_t first_bad_sequence{0};   // 0 when ok
  std::string reason;
  std::string head_digest;
};

// Recompute the chain over an entry list (e.g. loaded from metadata.json).
AuditVerification verify_audit_chain(const std::vector<CommandLog>& entries);

// Load and verify an NDJSON audit stream.
AuditVerification verify_audit_stream(const std::string& path);

}  // namespace arbiter
