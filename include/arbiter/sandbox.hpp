#pragma once

// arbiter/sandbox.hpp — One throwaway, resource-bounded, audited workspace.
//
// LIFECYCLE:
//   create() ──▶ active ──snapshot_filesystem()──▶ snapshotted ──cleanup()──▶ destroyed
//                  └──────────────────────────cleanup()────────────────────────┘
//
//   - Every command runs sequentially (one mutex per sandbox) and is appended
//     to a hash-chained CommandAuditLog before execute_command() returns.
//   - File operations resolve paths with normalize_under(): weakly_canonical,
//     then a prefix check against the canonical workspace root. A path that
//     resolves outside throws PathEscapeError before anything is touched.
//   - Metrics accumulate while active and are frozen by cleanup().
//   - cleanup() is idempotent and never throws; the destructor calls it.
//
// SNAPSHOT LAYOUT (SNAPSHOT_FORMAT_VERSION):
//   <output_dir>/<label>/metadata.json
//   <output_dir>/<label>/filesystem.tar
//   <output_dir>/<label>/audit.ndjson

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "arbiter/audit.hpp"
#include "arbiter/container.hpp"
#include "arbiter/observability.hpp"
#include "arbiter/types.hpp"

namespace arbiter {

enum class SandboxState { active, snapshotted, destroyed };

std::string to_string(SandboxState state);

struct SandboxOptions {
  std::string name;                          // unique container identity
  std::string task_id;
  std::string snapshot_label;                // "" = sanitized task_id
  std::string base_image{"python:3.11-slim"};
  std::string workspace_dir;                 // host directory; created if absent
  std::string state_dir;                     // "" = <workspace_dir>.state
  double cpu_limit{2.0};
  std::uint64_t memory_limit_bytes{4ull << 30};
  bool network_enabled{false};
  std::uint64_t default_command_timeout_ms{30000};
  std::uint64_t max_command_timeout_ms{3600000};
  std::size_t max_output_bytes{65536};
  std::size_t max_read_bytes{1 << 20};
  bool keep_workspace{false};
  std::map<std::string, std::string> labels;
};

struct FileEntry {
  std::string path;                          // relative to the workspace root
  bool is_directory{false};
  std::uint64_t size_bytes{0};
};

struct SnapshotArchive {
  std::string path;
  std::string digest;                        // BLAKE3 of the tar bytes
  std::uint64_t size_bytes{0};
};

class Sandbox {
 public:
  // Throws ProvisioningError (engine) or InvalidArgument (options).
  static std::unique_ptr<Sandbox> create(std::shared_ptr<ContainerEngine> engine,
                                         SandboxOptions options, RunContext& run);

  ~Sandbox();

  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;

  // timeout_seconds: 0 = configured default, < 0 throws InvalidArgument.
  // A timeout is a value: exit_code 124, timed_out, error_code "command_timeout".
  CommandLog execute_command(const std::string& command, double timeout_seconds = 0.0,
                             const std::string& working_directory = "");

  std::string read_file(const std::string& path);
  void write_file(const std::string& path, const std::string& content);
  std::vector<FileEntry> list_files(const std::string& path = "");
  // Recursive listing, capped at max_entries.
  std::vector<FileEntry> read_directory(const std::string& path = "",
                                        std::size_t max_entries = 1000);

  SnapshotArchive snapshot_filesystem();
  std::string save_metadata(const std::string& output_dir);
  void cleanup(bool keep_snapshot = true) noexcept;

  void mark_result(bool success, const std::string& error_message = "");

  // Absolute host path inside the workspace. Throws PathEscapeError.
  std::string resolve_path(const std::string& path) const;

  SandboxMetrics metrics() const;
  std::vector<CommandLog> command_logs() const { return audit_.entries(); }
  std::string audit_head_digest() const { return audit_.head_digest(); }
  SandboxState state() const;
  const std::string& name() const { return options_.name; }
  const std::string& task_id() const { return options_.task_id; }
  const std::string& workspace() const { return workspace_; }
  double default_command_timeout_seconds() const {
    return static_cast<double>(options_.default_command_timeout_ms) / 1000.0;
  }
  const ContainerHandle& handle() const { return handle_; }
  std::string saved_dir() const;
  std::vector<std::string> cleanup_errors() const;

 private:
  Sandbox(std::shared_ptr<ContainerEngine> engine, SandboxOptions options, RunContext& run,
          std::string workspace, std::string state_dir);

  void require_live(const char* op) const;
  // fold: add the current container counters to the carry before a reset.
  void refresh_resource_metrics(bool fold);
  void finalize_file_metrics();
  void refresh_duration();
  jsonlite::Object metadata_object() const;
  void write_metadata(const std::string& dir) const;

  std::shared_ptr<ContainerEngine> engine_;
  SandboxOptions options_;
  RunContext& run_;
  std::string workspace_;                    // canonical host path
  std::string state_dir_;
  ContainerHandle handle_;
  CommandAuditLog audit_;

  mutable std::mutex mu_;
  SandboxState state_{SandboxState::active};
  SandboxMetrics metrics_;
  bool files_finalized_{false};
  bool frozen_{false};
  std::map<std::string, std::string> baseline_manifest_;
  std::optional<SnapshotArchive> snapshot_;
  std::string saved_dir_;
  std::string created_at_;
  std::chrono::steady_clock::time_point started_;
  // Docker cgroup counters restart with the container; resets fold them in here.
  ContainerStats stats_carry_;
  bool container_stats_seen_{false};
  // Per-exec wait4 usage, used when the engine reports no container stats.
  ContainerStats rusage_;
  std::vector<std::string> cleanup_errors_;
};

// Path confinement. Returns "" when p resolves outside workspace.
// "/workspace" and "/workspace/..." are the in-container spelling of the root.
std::string normalize_under(const std::string& workspace, const std::string& p);

// Relative path -> BLAKE3 digest of every regular file (symlinks by target).
std::map<std::string, std::string> workspace_manifest(const std::string& root);

// Keep [A-Za-z0-9._-], replace everything else with '_'.
std::string sanitize_name(const std::string& id);

// Throws CommandTimeoutError for a timed-out command and Error(spawn_failed)
// when the command never started. Non-zero exits are left to the caller.
void require_success(const CommandLog& log);

}  // namespace arbiter
