#pragma once

// arbiter/model_client.hpp — Tool-calling LLM endpoints.
//
// DESIGN:
//   ModelClient is stateless: the conversation lives in the ModelRequest the
//   agent builds each round, so one client instance is shared by every
//   worker in a run. Each complete() call is bounded by timeout_ms and the
//   transport process is killed at the deadline.
//
// ERROR CONTRACT:
//   ModelUnavailableError  transport failure, timeout, HTTP 429/5xx,
//                          malformed response. The agent retries these.
//   ModelError             non-retryable rejection (HTTP 4xx, runner error).
//
// EXTENSION_POINT: streaming
//   Responses are read whole. A streaming client would parse SSE chunks from
//   curl's stdout incrementally; the ModelResponse shape stays the same.

#include <cstdint>
#include <string>
#include <vector>

#include "arbiter/jsonlite.hpp"

namespace arbiter {

struct ToolCallRequest {
  std::string id;
  std::string name;
  std::string arguments;                     // JSON object text
};

struct ModelRequest {
  std::string system;
  std::string task_description;
  jsonlite::Array messages;                  // OpenAI chat format, without the system message
  jsonlite::Array tools;
  double temperature{0.7};
  uint32_t max_tokens{2048};
};

struct ModelResponse {
  std::string final_text;
  std::vector<ToolCallRequest> tool_calls;
  uint64_t tokens_used{0};
};

class ModelClient {
 public:
  virtual ~ModelClient() = default;
  virtual std::string model_name() const = 0;
  virtual ModelResponse complete(const ModelRequest& request, uint64_t timeout_ms) = 0;
};

struct HttpModelOptions {
  std::string url{"http://localhost:8000"};
  std::string model{"Qwen/Qwen3-30B-A3B-Thinking-2507"};
  std::string api_key_env{"ARBITER_LLM_API_KEY"};
  std::string curl_binary{"curl"};
  std::size_t max_response_bytes{8u << 20};
};

// POST <url>/v1/chat/completions through the curl CLI.
class HttpModelClient : public ModelClient {
 public:
  explicit HttpModelClient(HttpModelOptions options);
  std::string model_name() const override { return options_.model; }
  ModelResponse complete(const ModelRequest& request, uint64_t timeout_ms) override;

 private:
  HttpModelOptions options_;
};

// Runs argv[0] with argv[1..] per call. stdin receives
// {task_description, conversation_history, tool_definitions, system} and
// stdout must carry {final_text} or {tool_calls:[{name, arguments}]}.
class SubprocessModelClient : public ModelClient {
 public:
  SubprocessModelClient(std::vector<std::string> argv, std::string model_name);
  std::string model_name() const override { return model_name_; }
  ModelResponse complete(const ModelRequest& request, uint64_t timeout_ms) override;

 private:
  std::vector<std::string> argv_;
  std::string model_name_;
};

// Request body for the chat completions endpoint.
std::string build_chat_request(const ModelRequest& request, const std::string& model);

// Parse a chat completions response body. Throws ModelUnavailableError when
// the document is not a usable completion.
ModelResponse parse_chat_completion(const std::string& body);

// Parse the subprocess runner's stdout document. Throws ModelUnavailableError
// for malformed output and ModelError for {"error": ...}.
ModelResponse parse_runner_output(const std::string& text);

// Drop a leading <think>...</think> block emitted by reasoning models.
std::string strip_reasoning(const std::string& text);

}  // namespace arbiter
