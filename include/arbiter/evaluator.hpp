#pragma once

// arbiter/evaluator.hpp — Benchmark orchestration.
//
// ATTEMPT LIFECYCLE (one per task x sample, never shared):
//   Sandbox::create ─▶ CodingAgent::send_coding_task ─▶ solution extraction
//     ─▶ grading inside the same sandbox ─▶ save_metadata + transcript.json
//     ─▶ cleanup(keep_snapshot=true)
//
// CONCURRENCY:
//   `concurrency` std::threads pull attempt indices from one atomic cursor.
//   Each AttemptResult is moved into its pre-sized slot by the worker that
//   produced it; slots are read only after every worker has joined. The last
//   attempt of a task to finish assembles that task's TaskResult and writes
//   <output_dir>/<task>_result.json.
//
// FAILURE SCOPE:
//   Task-scoped  provisioning, agent, solution, grading and unexpected errors
//                end up in AttemptResult.error as "<code>: <message>".
//   Run-scoped   ConfigError (constructor), EngineUnavailableError and
//                DatasetUnavailableError propagate out of evaluate().

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "arbiter/agent.hpp"
#include "arbiter/config.hpp"
#include "arbiter/container.hpp"
#include "arbiter/dataset.hpp"
#include "arbiter/model_client.hpp"
#include "arbiter/observability.hpp"
#include "arbiter/scoring.hpp"
#include "arbiter/types.hpp"

namespace arbiter {

class BenchmarkEvaluator {
 public:
  // Throws ConfigError when validate_config() reports errors.
  BenchmarkEvaluator(EvaluatorConfig config, std::shared_ptr<ContainerEngine> engine,
                     std::shared_ptr<ModelClient> model, RunContext& run);

  // Loads the configured dataset (dataset_path when set) and evaluates it.
  EvaluationReport evaluate(DatasetLoader& loader);

  // Evaluates an already-loaded task list in order.
  EvaluationReport evaluate_tasks(const std::vector<Task>& tasks, const std::string& dataset_name,
                                  const std::string& dataset_version);

  // One sandboxed attempt. Never throws for task-scoped failures.
  AttemptResult evaluate_attempt(const Task& task, std::uint32_t sample);

  std::string report_path() const;
  std::string sandbox_name(const Task& task, std::uint32_t sample) const;
  const EvaluatorConfig& config() const { return config_; }

  // Test hook: replaces the agent's backoff sleep.
  void set_agent_sleep(CodingAgent::SleepFn sleep) { agent_sleep_ = std::move(sleep); }

 private:
  void require_engine();
  TaskResult assemble_task_result(const Task& task, std::vector<AttemptResult> attempts) const;
  void write_task_result(const TaskResult& result);

  EvaluatorConfig config_;
  std::shared_ptr<ContainerEngine> engine_;
  std::shared_ptr<ModelClient> model_;
  RunContext& run_;
  BaselineTable baselines_;
  CodingAgent::SleepFn agent_sleep_;
};

// "Task: ..." prompt handed to the agent.
std::string build_task_prompt(const Task& task);

// Body of the last fenced code block in text, if any.
std::optional<std::string> extract_code_block(const std::string& text);

// solution + tests (+ "check(<entry_point>)" when the tests define check).
std::string build_test_program(const std::string& solution, const Task& task);

// Replaces every "{file}" in the grade command.
std::string grade_command_for(const std::string& grade_command, const std::string& file);

std::shared_ptr<ModelClient> make_model_client(const ModelConfig& config);

}  // namespace arbiter
