#pragma once

// arbiter/config.hpp — Evaluator configuration.
//
// PRECEDENCE (lowest to highest):
//   built-in defaults < JSON file (--config) < ARBITER_* environment < CLI flags
//
// The JSON file mirrors EvaluatorConfig: flat keys for the run, plus nested
// "model", "agent" and "efficiency" objects. Unknown keys are reported as
// warnings, never silently accepted and never fatal.
//
// validate_config() is the only gate: BenchmarkEvaluator refuses a config
// with errors (ConfigError, run-scoped).

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "arbiter/jsonlite.hpp"
#include "arbiter/scoring.hpp"

namespace arbiter {

struct ModelConfig {
  std::string protocol{"http"};              // http | subprocess
  std::string url{"http://localhost:8000"};
  std::string name{"Qwen/Qwen3-30B-A3B-Thinking-2507"};
  std::string api_key_env{"ARBITER_LLM_API_KEY"};
  double temperature{0.7};
  std::uint32_t max_tokens{2048};
  double timeout_s{120.0};
  std::vector<std::string> runner_argv;      // subprocess protocol only
};

struct AgentConfig {
  std::uint32_t max_iterations{20};
  std::uint32_t model_retries{3};
  std::uint64_t retry_backoff_ms{500};
};

struct EvaluatorConfig {
  std::string dataset{"humaneval"};
  std::string dataset_version;
  std::string dataset_path;                  // local file in the dataset's format
  std::string cache_dir{"/tmp/arbiter/cache"};
  std::uint64_t max_tasks{0};
  std::uint32_t samples_per_task{1};
  std::vector<std::uint32_t> pass_k{1, 5, 10, 100};

  double command_timeout_s{30.0};
  double task_timeout_s{300.0};
  double grading_timeout_s{30.0};
  double cpu_limit{2.0};
  std::uint64_t memory_limit_bytes{4ull << 30};
  std::uint32_t concurrency{2};
  bool network_enabled{false};

  std::string output_dir{"/tmp/arbiter/results"};
  std::string workspace_root{"/tmp/arbiter/workspaces"};
  std::string engine{"docker"};              // docker | process
  std::string base_image{"python:3.11-slim"};

  ModelConfig model;
  AgentConfig agent;
  EfficiencyWeights efficiency;

  std::string baselines_path;
  std::string event_log;
  bool verbose{false};
  bool keep_workspaces{false};
  std::string grade_command{"python3 {file}"};
  std::uint64_t max_output_bytes{65536};
};

struct ConfigValidationResult {
  bool ok{true};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Returns the value of an environment variable, or nullptr.
using EnvLookup = std::function<const char*(const char*)>;

// "4g", "512m", "2GiB", "1048576" -> bytes. nullopt on garbage or overflow.
std::optional<std::uint64_t> parse_memory_size(const std::string& text);

// Overlays a JSON document onto cfg. Throws ConfigError on unreadable files
// and mistyped values.
void apply_config_json(EvaluatorConfig& cfg, const jsonlite::Object& doc,
                       std::vector<std::string>* warnings);
void load_config_file(const std::string& path, EvaluatorConfig& cfg,
                      std::vector<std::string>* warnings);

// Overlays ARBITER_* variables. Throws ConfigError on unparseable values.
void apply_env(EvaluatorConfig& cfg, const EnvLookup& env);

// Overlays recognised flags. Returns positional arguments. Throws ConfigError
// for unknown flags and flags missing their value.
std::vector<std::string> apply_cli_flags(EvaluatorConfig& cfg, const std::vector<std::string>& args);

// Defaults, then --config FILE (if present in args), then env, then flags.
EvaluatorConfig resolve_config(const std::vector<std::string>& args, const EnvLookup& env,
                               std::vector<std::string>* warnings,
                               std::vector<std::string>* positional = nullptr);

ConfigValidationResult validate_config(const EvaluatorConfig& cfg);

jsonlite::Object config_to_object(const EvaluatorConfig& cfg);

EnvLookup process_env();

}  // namespace arbiter
