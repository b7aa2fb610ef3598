#pragma once

// arbiter/types.hpp — Core data structures and the error taxonomy.
//
// MEMORY OWNERSHIP:
//   - All records are value types with value-owned strings. No borrowed
//     references, no raw pointer members.
//   - A TaskResult is produced by exactly one worker and moved into the
//     evaluator's aggregation slot. Nothing else holds a reference to it.
//
// ERROR MODEL:
//   - Normal unsuccessful outcomes (a command exiting non-zero, a command
//     timing out) are values: CommandLog carries exit_code/error_code.
//   - Conditions a component cannot continue past are thrown as
//     arbiter::Error subclasses. Each carries a stable ErrorCode whose
//     to_string() form appears verbatim in reports and events.

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "arbiter/jsonlite.hpp"

namespace arbiter {

enum class ErrorCode {
  none,
  json_parse_error,
  invalid_argument,
  config_invalid,
  spawn_failed,
  provisioning_failed,
  engine_unavailable,
  path_escape,
  sandbox_terminated,
  command_timeout,
  grading_timeout,
  dataset_unavailable,
  model_unavailable,
  model_error,
  iteration_budget_exceeded,
  agent_timeout,
  solution_missing,
  tests_failed,
  cas_integrity_failed,
  io_error,
  internal_error,
};

std::string to_string(ErrorCode code);

// ---------------------------------------------------------------------------
// Error taxonomy
// ---------------------------------------------------------------------------
class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}
  ErrorCode code() const noexcept { return code_; }
  // "<code>: <message>", the form recorded in TaskResult.error.
  std::string describe() const { return to_string(code_) + ": " + what(); }

 private:
  ErrorCode code_;
};

// Sandbox could not be created. Task-scoped; systemic when the engine is down.
class ProvisioningError : public Error {
 public:
  explicit ProvisioningError(const std::string& m) : Error(ErrorCode::provisioning_failed, m) {}
};

// A path resolved outside the workspace root. Always fatal to the task.
class PathEscapeError : public Error {
 public:
  explicit PathEscapeError(const std::string& m) : Error(ErrorCode::path_escape, m) {}
};

// Operation attempted on a destroyed sandbox.
class SandboxTerminatedError : public Error {
 public:
  explicit SandboxTerminatedError(const std::string& m) : Error(ErrorCode::sandbox_terminated, m) {}
};

class CommandTimeoutError : public Error {
 public:
  explicit CommandTimeoutError(const std::string& m) : Error(ErrorCode::command_timeout, m) {}
};

class GradingTimeoutError : public Error {
 public:
  explicit GradingTimeoutError(const std::string& m) : Error(ErrorCode::grading_timeout, m) {}
};

// Fatal to the whole run.
class DatasetUnavailableError : public Error {
 public:
  explicit DatasetUnavailableError(const std::string& m) : Error(ErrorCode::dataset_unavailable, m) {}
};

// Retryable: transport failure, timeout, 429/5xx, malformed response.
class ModelUnavailableError : public Error {
 public:
  explicit ModelUnavailableError(const std::string& m) : Error(ErrorCode::model_unavailable, m) {}
};

// Non-retryable model endpoint rejection (4xx).
class ModelError : public Error {
 public:
  explicit ModelError(const std::string& m) : Error(ErrorCode::model_error, m) {}
};

// Container engine unreachable. Fatal to the whole run.
class EngineUnavailableError : public Error {
 public:
  explicit EngineUnavailableError(const std::string& m) : Error(ErrorCode::engine_unavailable, m) {}
};

class ConfigError : public Error {
 public:
  explicit ConfigError(const std::string& m) : Error(ErrorCode::config_invalid, m) {}
};

class InvalidArgument : public Error {
 public:
  explicit InvalidArgument(const std::string& m) : Error(ErrorCode::invalid_argument, m) {}
};

// ---------------------------------------------------------------------------
// Task — one benchmark problem. Immutable once loaded.
// ---------------------------------------------------------------------------
struct Task {
  std::string id;
  std::string prompt;
  std::string entry_point;
  std::string test_code;
  std::optional<std::string> canonical_solution;
  std::map<std::string, std::string> metadata;
};

// ---------------------------------------------------------------------------
// CommandLog — one executed command. Never mutated after append.
// ---------------------------------------------------------------------------
struct CommandLog {
  uint64_t sequence_no{0};          // 1-based, gap-free, execution order
  std::string command;
  std::string working_directory;
  uint64_t started_at_unix_ms{0};
  double duration_seconds{0.0};
  int exit_code{0};                 // 124 on timeout
  bool timed_out{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_code;           // "" | command_timeout | spawn_failed
  std::string previous_digest;      // audit chain link
  std::string digest;               // audit_entry_hash(canonical entry)
};

// ---------------------------------------------------------------------------
// SandboxMetrics — accumulated during the sandbox's life, frozen at cleanup.
// ---------------------------------------------------------------------------
struct SandboxMetrics {
  uint64_t commands_executed{0};
  uint64_t files_created{0};
  uint64_t files_modified{0};
  double cpu_time_seconds{0.0};
  uint64_t memory_peak_bytes{0};
  uint64_t disk_io_bytes{0};
  double duration_seconds{0.0};
  bool success{false};
  std::string error_message;
};

// One sandboxed attempt at a task.
struct AttemptResult {
  uint32_t sample_index{0};
  bool success{false};
  bool passed_tests{false};
  double execution_time_seconds{0.0};
  uint32_t agent_iterations{0};
  std::string agent_state;
  uint64_t tokens_used{0};
  std::string sandbox_name;
  SandboxMetrics sandbox_metrics;
  std::string agent_transcript_ref;
  std::string snapshot_dir;
  std::string error_code;
  std::string error;
};

// ---------------------------------------------------------------------------
// TaskResult — produced once per task per run.
// Top-level fields mirror the representative attempt: the first passing
// attempt, otherwise attempt 0.
// ---------------------------------------------------------------------------
struct TaskResult {
  std::string task_id;
  bool success{false};
  bool passed_tests{false};
  double execution_time_seconds{0.0};
  uint32_t agent_iterations{0};
  SandboxMetrics sandbox_metrics;
  std::string agent_transcript_ref;
  std::optional<std::string> error;

  uint32_t num_samples{0};
  uint32_t num_correct{0};
  uint64_t tokens_used{0};
  std::vector<AttemptResult> attempts;
};

struct BaselineComparison {
  std::string baseline_name;
  double baseline_pass_rate{0.0};
  double this_run_pass_rate{0.0};
  double delta{0.0};
};

struct EvaluationReport {
  uint32_t format_version{0};
  std::string run_id;
  std::string dataset_name;
  std::string dataset_version;
  std::string model_name;
  uint64_t total_tasks{0};
  uint32_t samples_per_task{1};
  uint64_t passed_tasks{0};
  uint64_t failed_tasks{0};
  uint64_t errored_tasks{0};
  std::map<uint32_t, double> pass_at_k;
  double efficiency_score{0.0};
  double average_execution_time{0.0};
  double average_iterations{0.0};
  double average_commands{0.0};
  double average_tokens{0.0};
  std::vector<TaskResult> task_results;
  std::vector<BaselineComparison> baseline_comparisons;
  std::string generated_at;          // ISO-8601 UTC
  jsonlite::Object efficiency_weights;
  jsonlite::Object stats;
};

// ---------------------------------------------------------------------------
// JSON views. All serialization goes through jsonlite so output is canonical.
// ---------------------------------------------------------------------------
jsonlite::Value task_to_value(const Task& task);
jsonlite::Value command_log_to_value(const CommandLog& log);
// Canonical form hashed into the audit chain (excludes the digest itself).
std::string command_log_canonical(const CommandLog& log);
jsonlite::Value sandbox_metrics_to_value(const SandboxMetrics& m);
jsonlite::Value attempt_result_to_value(const AttemptResult& r);
jsonlite::Value task_result_to_value(const TaskResult& r);
jsonlite::Value report_to_value(const EvaluationReport& report);
std::string report_to_json(const EvaluationReport& report);

CommandLog command_log_from_object(const jsonlite::Object& obj);
SandboxMetrics sandbox_metrics_from_object(const jsonlite::Object& obj);

// Current UTC time formatted as 2026-01-31T12:00:00Z.
std::string utc_timestamp_iso8601();
uint64_t unix_time_ms();

}  // namespace arbiter
