#include "arbiter/types.hpp"

#include <chrono>
#include <ctime>

namespace arbiter {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::invalid_argument: return "invalid_argument";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::provisioning_failed: return "provisioning_failed";
    case ErrorCode::engine_unavailable: return "engine_unavailable";
    case ErrorCode::path_escape: return "path_escape";
    case ErrorCode::sandbox_terminated: return "sandbox_terminated";
    case ErrorCode::command_timeout: return "command_timeout";
    case ErrorCode::grading_timeout: return "grading_timeout";
    case ErrorCode::dataset_unavailable: return "dataset_unavailable";
    case ErrorCode::model_unavailable: return "model_unavailable";
    case ErrorCode::model_error: return "model_error";
    case ErrorCode::iteration_budget_exceeded: return "iteration_budget_exceeded";
    case ErrorCode::agent_timeout: return "agent_timeout";
    case ErrorCode::solution_missing: return "solution_missing";
    case ErrorCode::tests_failed: return "tests_failed";
    case ErrorCode::cas_integrity_failed: return "cas_integrity_failed";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::internal_error: return "internal_error";
  }
  return "";
}

namespace {

Value u64(uint64_t v) { return Value{static_cast<std::uint64_t>(v)}; }

// Exit codes are non-negative for every path run_process produces; a
// negative code can only come from a corrupted metadata file.
Value exit_code_value(int code) {
  if (code < 0) return Value{static_cast<double>(code)};
  return u64(static_cast<uint64_t>(code));
}

Object command_log_fields(const CommandLog& log) {
  Object o;
  o["sequence_no"] = u64(log.sequence_no);
  o["command"] = Value{log.command};
  o["working_directory"] = Value{log.working_directory};
  o["started_at_unix_ms"] = u64(log.started_at_unix_ms);
  o["duration_seconds"] = Value{log.duration_seconds};
  o["exit_code"] = exit_code_value(log.exit_code);
  o["timed_out"] = Value{log.timed_out};
  o["stdout"] = Value{log.stdout_text};
  o["stderr"] = Value{log.stderr_text};
  o["error_code"] = Value{log.error_code};
  o["previous_digest"] = Value{log.previous_digest};
  return o;
}

}  // namespace

Value task_to_value(const Task& task) {
  Object o;
  o["id"] = Value{task.id};
  o["prompt"] = Value{task.prompt};
  o["entry_point"] = Value{task.entry_point};
  o["test_code"] = Value{task.test_code};
  o["canonical_solution"] = task.canonical_solution ? Value{*task.canonical_solution} : Value{nullptr};
  Object meta;
  for (const auto& [k, v] : task.metadata) meta[k] = Value{v};
  o["metadata"] = Value{std::move(meta)};
  return Value{std::move(o)};
}

std::string command_log_canonical(const CommandLog& log) {
  return jsonlite::to_json(Value{command_log_fields(log)});
}

Value command_log_to_value(const CommandLog& log) {
  Object o = command_log_fields(log);
  o["digest"] = Value{log.digest};
  return Value{std::move(o)};
}

Value sandbox_metrics_to_value(const SandboxMetrics& m) {
  Object o;
  o["commands_executed"] = u64(m.commands_executed);
  o["files_created"] = u64(m.files_created);
  o["files_modified"] = u64(m.files_modified);
  o["cpu_time_seconds"] = Value{m.cpu_time_seconds};
  o["memory_peak_bytes"] = u64(m.memory_peak_bytes);
  o["disk_io_bytes"] = u64(m.disk_io_bytes);
  o["duration_seconds"] = Value{m.duration_seconds};
  o["success"] = Value{m.success};
  o["error_message"] = Value{m.error_message};
  return Value{std::move(o)};
}

Value attempt_result_to_value(const AttemptResult& r) {
  Object o;
  o["sample_index"] = u64(r.sample_index);
  o["success"] = Value{r.success};
  o["passed_tests"] = Value{r.passed_tests};
  o["execution_time_seconds"] = Value{r.execution_time_seconds};
  o["agent_iterations"] = u64(r.agent_iterations);
  o["agent_state"] = Value{r.agent_state};
  o["tokens_used"] = u64(r.tokens_used);
  o["sandbox_name"] = Value{r.sandbox_name};
  o["sandbox_metrics"] = sandbox_metrics_to_value(r.sandbox_metrics);
  o["agent_transcript_ref"] = Value{r.agent_transcript_ref};
  o["snapshot_dir"] = Value{r.snapshot_dir};
  o["error_code"] = Value{r.error_code};
  o["error"] = r.error.empty() ? Value{nullptr} : Value{r.error};
  return Value{std::move(o)};
}

Value task_result_to_value(const TaskResult& r) {
  Object o;
  o["task_id"] = Value{r.task_id};
  o["success"] = Value{r.success};
  o["passed_tests"] = Value{r.passed_tests};
  o["execution_time_seconds"] = Value{r.execution_time_seconds};
  o["agent_iterations"] = u64(r.agent_iterations);
  o["sandbox_metrics"] = sandbox_metrics_to_value(r.sandbox_metrics);
  o["agent_transcript_ref"] = Value{r.agent_transcript_ref};
  o["error"] = r.error ? Value{*r.error} : Value{nullptr};
  o["num_samples"] = u64(r.num_samples);
  o["num_correct"] = u64(r.num_correct);
  o["tokens_used"] = u64(r.tokens_used);
  Array attempts;
  for (const auto& a : r.attempts) attempts.push_back(attempt_result_to_value(a));
  o["attempts"] = Value{std::move(attempts)};
  return Value{std::move(o)};
}

Value report_to_value(const EvaluationReport& report) {
  Object o;
  o["format_version"] = u64(report.format_version);
  o["run_id"] = Value{report.run_id};
  o["dataset_name"] = Value{report.dataset_name};
  o["dataset_version"] = Value{report.dataset_version};
  o["model_name"] = Value{report.model_name};
  o["total_tasks"] = u64(report.total_tasks);
  o["samples_per_task"] = u64(report.samples_per_task);
  o["passed_tasks"] = u64(report.passed_tasks);
  o["failed_tasks"] = u64(report.failed_tasks);
  o["errored_tasks"] = u64(report.errored_tasks);
  Object pass_at_k;
  for (const auto& [k, v] : report.pass_at_k) pass_at_k[std::to_string(k)] = Value{v};
  o["pass_at_k"] = Value{std::move(pass_at_k)};
  o["efficiency_score"] = Value{report.efficiency_score};
  o["efficiency_weights"] = Value{report.efficiency_weights};
  o["average_execution_time"] = Value{report.average_execution_time};
  o["average_iterations"] = Value{report.average_iterations};
  o["average_commands"] = Value{report.average_commands};
  o["average_tokens"] = Value{report.average_tokens};
  Array results;
  for (const auto& r : report.task_results) results.push_back(task_result_to_value(r));
  o["task_results"] = Value{std::move(results)};
  Array baselines;
  for (const auto& b : report.baseline_comparisons) {
    Object bo;
    bo["baseline_name"] = Value{b.baseline_name};
    bo["baseline_pass_rate"] = Value{b.baseline_pass_rate};
    bo["this_run_pass_rate"] = Value{b.this_run_pass_rate};
    bo["delta"] = Value{b.delta};
    baselines.push_back(Value{std::move(bo)});
  }
  o["baseline_comparisons"] = Value{std::move(baselines)};
  o["generated_at"] = Value{report.generated_at};
  o["stats"] = Value{report.stats};
  return Value{std::move(o)};
}

std::string report_to_json(const EvaluationReport& report) {
  return jsonlite::to_json_pretty(report_to_value(report));
}

CommandLog command_log_from_object(const Object& obj) {
  CommandLog log;
  log.sequence_no = jsonlite::get_u64(obj, "sequence_no", 0);
  log.command = jsonlite::get_string(obj, "command");
  log.working_directory = jsonlite::get_string(obj, "working_directory");
  log.started_at_unix_ms = jsonlite::get_u64(obj, "started_at_unix_ms", 0);
  log.duration_seconds = jsonlite::get_double(obj, "duration_seconds", 0.0);
  log.exit_code = static_cast<int>(jsonlite::get_double(obj, "exit_code", 0.0));
  log.timed_out = jsonlite::get_bool(obj, "timed_out", false);
  log.stdout_text = jsonlite::get_string(obj, "stdout");
  log.stderr_text = jsonlite::get_string(obj, "stderr");
  log.error_code = jsonlite::get_string(obj, "error_code");
  log.previous_digest = jsonlite::get_string(obj, "previous_digest");
  log.digest = jsonlite::get_string(obj, "digest");
  return log;
}

SandboxMetrics sandbox_metrics_from_object(const Object& obj) {
  SandboxMetrics m;
  m.commands_executed = jsonlite::get_u64(obj, "commands_executed", 0);
  m.files_created = jsonlite::get_u64(obj, "files_created", 0);
  m.files_modified = jsonlite::get_u64(obj, "files_modified", 0);
  m.cpu_time_seconds = jsonlite::get_double(obj, "cpu_time_seconds", 0.0);
  m.memory_peak_bytes = jsonlite::get_u64(obj, "memory_peak_bytes", 0);
  m.disk_io_bytes = jsonlite::get_u64(obj, "disk_io_bytes", 0);
  m.duration_seconds = jsonlite::get_double(obj, "duration_seconds", 0.0);
  m.success = jsonlite::get_bool(obj, "success", false);
  m.error_message = jsonlite::get_string(obj, "error_message");
  return m;
}

std::string utc_timestamp_iso8601() {
  const std::time_t now = std::time(nullptr);
  std::tm tm_utc{};
  gmtime_r(&now, &tm_utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
  return buf;
}

uint64_t unix_time_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());
}

}  // namespace arbiter
