#include "arbiter/agent.hpp"

#include <algorithm>
#include <thread>

#include "arbiter/sandbox.hpp"
#include "arbiter/tools.hpp"

namespace arbiter {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

namespace {

Value str(const std::string& s) { return Value{s}; }

constexpr const char* kCompletionMarker = "TASK COMPLETE";

uint64_t remaining_ms(std::chrono::steady_clock::time_point deadline) {
  const auto now = std::chrono::steady_clock::now();
  if (now >= deadline) return 0;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());
}

Value assistant_message(const ModelResponse& response) {
  Object msg;
  msg["role"] = str("assistant");
  msg["content"] = str(response.final_text);
  if (!response.tool_calls.empty()) {
    Array calls;
    for (const auto& tc : response.tool_calls) {
      Object fn{{"name", str(tc.name)}, {"arguments", str(tc.arguments)}};
      calls.push_back(Value{Object{{"id", str(tc.id)},
                                   {"type", str("function")},
                                   {"function", Value{std::move(fn)}}}});
    }
    msg["tool_calls"] = Value{std::move(calls)};
  }
  return Value{std::move(msg)};
}

}  // namespace

std::string to_string(AgentState state) {
  switch (state) {
    case AgentState::idle: return "idle";
    case AgentState::awaiting_model: return "awaiting_model";
    case AgentState::tool_dispatch: return "tool_dispatch";
    case AgentState::done: return "done";
    case AgentState::failed: return "failed";
  }
  return "unknown";
}

std::string build_system_message(const TaskContext& context) {
  std::string out = "You are a helpful coding assistant. Write clean, well-documented code.";
  if (!context.files.empty()) {
    out += "\n\nRelevant files:";
    for (const auto& [path, content] : context.files) {
      out += "\n\n" + path + ":\n```\n" + content + "\n```";
    }
  }
  if (!context.requirements.empty()) out += "\n\nRequirements: " + context.requirements;
  if (!context.instructions.empty()) out += "\n\nInstructions: " + context.instructions;
  return out;
}

CodingAgent::CodingAgent(std::shared_ptr<ModelClient> model, AgentLimits limits, RunContext& run)
    : model_(std::move(model)),
      limits_(limits),
      run_(run),
      sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
  if (!model_) throw InvalidArgument("coding agent requires a model client");
}

void CodingAgent::set_workspace(Sandbox& sandbox) {
  sandbox_ = &sandbox;
}

void CodingAgent::reset_conversation() {
  messages_.clear();
  state_ = AgentState::idle;
}

Array CodingAgent::transcript() const {
  Array out;
  out.push_back(Value{Object{{"role", str("system")}, {"content", str(system_)}}});
  out.insert(out.end(), messages_.begin(), messages_.end());
  return out;
}

ModelResponse CodingAgent::call_model(const ModelRequest& request, Clock::time_point deadline) {
  for (uint32_t attempt = 0;; ++attempt) {
    const uint64_t budget = remaining_ms(deadline);
    if (budget == 0) throw ModelUnavailableError("no time left for a model call");

    uint64_t elapsed_ns = 0;
    try {
      run_.stats.model_calls.fetch_add(1, std::memory_order_relaxed);
      ModelResponse response;
      {
        ScopeTimer timer(elapsed_ns);
        response = model_->complete(request, std::min(limits_.model_timeout_ms, budget));
      }
      run_.stats.model_latency.record(elapsed_ns);
      return response;
    } catch (const ModelUnavailableError& e) {
      run_.stats.model_failures.fetch_add(1, std::memory_order_relaxed);
      if (attempt >= limits_.model_retries) throw;
      const uint64_t backoff = limits_.retry_backoff_ms << std::min<uint32_t>(attempt, 20);
      // Retrying is pointless if the backoff alone exhausts the budget.
      if (backoff >= remaining_ms(deadline)) throw;
      run_.stats.model_retries.fetch_add(1, std::memory_order_relaxed);
      run_.events.emit("model_retry", {{"sandbox", str(sandbox_ ? sandbox_->name() : "")},
                                       {"attempt", Value{static_cast<std::uint64_t>(attempt + 1)}},
                                       {"backoff_ms", Value{static_cast<std::uint64_t>(backoff)}},
                                       {"error", str(e.what())}});
      sleep_(std::chrono::milliseconds(backoff));
    }
  }
}

AgentRunResult CodingAgent::send_coding_task(const std::string& description,
                                             const TaskContext& context) {
  if (!sandbox_) throw InvalidArgument("send_coding_task called before set_workspace");

  const auto started = Clock::now();
  const auto deadline = started + std::chrono::milliseconds(limits_.max_duration_ms);

  AgentRunResult result;
  auto finish = [&](AgentState state, ErrorCode code, const std::string& message) {
    state_ = state;
    result.state = state;
    if (code != ErrorCode::none) {
      result.error_code = to_string(code);
      result.error = to_string(code) + ": " + message;
      run_.stats.record_failure(code);
    }
    result.duration_seconds = std::chrono::duration<double>(Clock::now() - started).count();
    result.transcript = transcript();
    return result;
  };

  system_ = build_system_message(context);
  messages_.push_back(Value{Object{{"role", str("user")}, {"content", str(description)}}});

  ModelRequest request;
  request.system = system_;
  request.task_description = description;
  request.tools = tool_definitions();
  request.temperature = limits_.temperature;
  request.max_tokens = limits_.max_tokens;

  while (true) {
    if (result.iterations >= limits_.max_iterations) {
      return finish(AgentState::failed, ErrorCode::iteration_budget_exceeded,
                    "no answer after " + std::to_string(limits_.max_iterations) + " rounds");
    }
    if (remaining_ms(deadline) == 0) {
      return finish(AgentState::failed, ErrorCode::agent_timeout,
                    "exceeded " + std::to_string(limits_.max_duration_ms) + " ms");
    }

    ++result.iterations;
    state_ = AgentState::awaiting_model;
    request.messages = messages_;

    ModelResponse response;
    try {
      response = call_model(request, deadline);
    } catch (const ModelUnavailableError& e) {
      if (remaining_ms(deadline) == 0) {
        return finish(AgentState::failed, ErrorCode::agent_timeout, e.what());
      }
      return finish(AgentState::failed, ErrorCode::model_unavailable, e.what());
    } catch (const ModelError& e) {
      return finish(AgentState::failed, ErrorCode::model_error, e.what());
    }

    result.tokens_used += response.tokens_used;
    run_.stats.tokens_used.fetch_add(response.tokens_used, std::memory_order_relaxed);
    result.final_text = response.final_text;
    messages_.push_back(assistant_message(response));

    if (response.tool_calls.empty()) {
      return finish(AgentState::done, ErrorCode::none, "");
    }

    state_ = AgentState::tool_dispatch;
    for (const auto& tc : response.tool_calls) {
      const ToolCall call = parse_tool_call(tc.name, tc.arguments);
      const uint64_t left_ms = remaining_ms(deadline);
      if (left_ms == 0) {
        return finish(AgentState::failed, ErrorCode::agent_timeout,
                      "exceeded " + std::to_string(limits_.max_duration_ms) + " ms");
      }
      const ToolOutcome outcome =
          dispatch_tool(*sandbox_, call, static_cast<double>(left_ms) / 1000.0);
      ++result.tool_calls;
      run_.stats.tool_calls.fetch_add(1, std::memory_order_relaxed);
      if (std::holds_alternative<UnknownTool>(call)) {
        run_.stats.unknown_tools.fetch_add(1, std::memory_order_relaxed);
      }
      run_.events.emit("tool_dispatched", {{"sandbox", str(sandbox_->name())},
                                           {"task_id", str(sandbox_->task_id())},
                                           {"tool", str(tc.name)},
                                           {"is_error", Value{outcome.is_error}}});
      messages_.push_back(Value{Object{{"role", str("tool")},
                                       {"tool_call_id", str(tc.id)},
                                       {"name", str(tc.name)},
                                       {"content", str(outcome.content)}}});
      if (outcome.fatal != ErrorCode::none) {
        return finish(AgentState::failed, outcome.fatal, "tool " + tc.name + " aborted the run");
      }
    }

    if (response.final_text.find(kCompletionMarker) != std::string::npos) {
      return finish(AgentState::done, ErrorCode::none, "");
    }
  }
}

}  // namespace arbiter
