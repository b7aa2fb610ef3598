#pragma once

// arbiter/agent.hpp — Tool-calling coding agent bound to one Sandbox.
//
// STATE MACHINE:
//   idle ─▶ awaiting_model ─▶ tool_dispatch ─▶ awaiting_model ─▶ ... ─▶ done | failed
//
//   A round is one model call followed by the dispatch of every tool call it
//   returned. The run ends:
//     done    the model answers without tool calls, or says "TASK COMPLETE"
//     failed  iteration_budget_exceeded  a new round would exceed max_iterations
//             agent_timeout              the wall-clock budget ran out
//             model_unavailable          retries exhausted
//             model_error                non-retryable model rejection
//             path_escape                a tool call tried to leave the workspace
//
// The agent owns nothing but its transcript. The Sandbox is borrowed from the
// caller, which must keep it alive for the duration of send_coding_task().

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "arbiter/jsonlite.hpp"
#include "arbiter/model_client.hpp"
#include "arbiter/observability.hpp"
#include "arbiter/types.hpp"

namespace arbiter {

class Sandbox;

enum class AgentState { idle, awaiting_model, tool_dispatch, done, failed };

std::string to_string(AgentState state);

struct AgentLimits {
  uint32_t max_iterations{20};
  uint64_t max_duration_ms{600000};
  uint32_t model_retries{3};
  uint64_t retry_backoff_ms{500};
  uint64_t model_timeout_ms{120000};
  double temperature{0.7};
  uint32_t max_tokens{2048};
};

struct TaskContext {
  std::map<std::string, std::string> files;  // path -> content shown in the system prompt
  std::string requirements;
  std::string instructions;
};

struct AgentRunResult {
  AgentState state{AgentState::idle};
  uint32_t iterations{0};
  std::string final_text;
  uint64_t tokens_used{0};
  uint32_t tool_calls{0};
  std::string error_code;                    // "" when done
  std::string error;                         // "<code>: <message>"
  double duration_seconds{0.0};
  jsonlite::Array transcript;
};

class CodingAgent {
 public:
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  CodingAgent(std::shared_ptr<ModelClient> model, AgentLimits limits, RunContext& run);

  void set_workspace(Sandbox& sandbox);

  // Throws InvalidArgument when no workspace is bound. Every other failure
  // is reported in the result.
  AgentRunResult send_coding_task(const std::string& description, const TaskContext& context = {});

  AgentState state() const { return state_; }
  // OpenAI-format messages, system message first.
  jsonlite::Array transcript() const;
  void reset_conversation();

  // Backoff sleeps go through this hook; tests replace it to observe delays.
  void set_sleep(SleepFn sleep) { sleep_ = std::move(sleep); }

 private:
  using Clock = std::chrono::steady_clock;

  ModelResponse call_model(const ModelRequest& request, Clock::time_point deadline);

  std::shared_ptr<ModelClient> model_;
  AgentLimits limits_;
  RunContext& run_;
  Sandbox* sandbox_{nullptr};
  AgentState state_{AgentState::idle};
  std::string system_;
  jsonlite::Array messages_;
  SleepFn sleep_;
};

std::string build_system_message(const TaskContext& context);

}  // namespace arbiter
