#pragma once

// arbiter/tools.hpp — The closed set of tools an agent may call.
//
// A model tool call is parsed once into a typed ToolCall variant and then
// dispatched against a Sandbox with std::visit. Nothing else in the agent
// touches the sandbox, so this is the single point where agent-requested
// side effects happen.
//
// ERROR CONTRACT:
//   - PathEscapeError is fatal: the outcome carries fatal = path_escape and
//     the agent stops the attempt.
//   - Every other failure (missing file, bad arguments, unknown tool, command
//     timeout) becomes an error tool result the model can react to.

#include <string>
#include <variant>

#include "arbiter/jsonlite.hpp"
#include "arbiter/types.hpp"

namespace arbiter {

class Sandbox;

struct ReadFileArgs {
  std::string path;
};

struct WriteFileArgs {
  std::string path;
  std::string content;
};

struct ListFilesArgs {
  std::string path;
};

struct ReadDirectoryArgs {
  std::string path;
};

struct ExecuteCommandArgs {
  std::string command;
  double timeout_seconds{0.0};               // 0 = sandbox default
};

struct UnknownTool {
  std::string name;
};

// Known tool, arguments missing or not a JSON object.
struct MalformedToolCall {
  std::string name;
  std::string reason;
};

using ToolCall = std::variant<ReadFileArgs, WriteFileArgs, ListFilesArgs, ReadDirectoryArgs,
                              ExecuteCommandArgs, UnknownTool, MalformedToolCall>;

struct ToolOutcome {
  std::string content;                       // JSON text handed back to the model
  bool is_error{false};
  ErrorCode fatal{ErrorCode::none};
};

// OpenAI-style function schemas for the five tools.
jsonlite::Array tool_definitions();

ToolCall parse_tool_call(const std::string& name, const std::string& arguments_json);

std::string tool_name(const ToolCall& call);

// max_command_seconds > 0 caps execute_command (the caller's remaining budget).
ToolOutcome dispatch_tool(Sandbox& sandbox, const ToolCall& call, double max_command_seconds = 0.0);

}  // namespace arbiter
