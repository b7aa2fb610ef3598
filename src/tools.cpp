#include "arbiter/tools.hpp"

#include <algorithm>

#include "arbiter/sandbox.hpp"

namespace arbiter {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

namespace {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

Value str(const std::string& s) { return Value{s}; }

Object param(const std::string& type, const std::string& description) {
  return {{"type", str(type)}, {"description", str(description)}};
}

Value function_schema(const std::string& name, const std::string& description, Object properties,
                      const std::vector<std::string>& required) {
  Array req;
  for (const auto& r : required) req.push_back(str(r));
  Object parameters;
  parameters["type"] = str("object");
  parameters["properties"] = Value{std::move(properties)};
  parameters["required"] = Value{std::move(req)};

  Object fn;
  fn["name"] = str(name);
  fn["description"] = str(description);
  fn["parameters"] = Value{std::move(parameters)};

  Object tool;
  tool["type"] = str("function");
  tool["function"] = Value{std::move(fn)};
  return Value{std::move(tool)};
}

std::string error_json(const std::string& message) {
  return jsonlite::to_json(Value{Object{{"error", str(message)}}});
}

Array entries_array(const std::vector<FileEntry>& entries) {
  Array out;
  for (const auto& e : entries) {
    Object o;
    o["path"] = str(e.path);
    o["type"] = str(e.is_directory ? "directory" : "file");
    o["size"] = Value{static_cast<std::uint64_t>(e.size_bytes)};
    out.push_back(Value{std::move(o)});
  }
  return out;
}

}  // namespace

Array tool_definitions() {
  Array tools;
  tools.push_back(function_schema("read_file", "Read the contents of a file in the workspace.",
                                  {{"path", Value{param("string", "Path relative to the workspace")}}},
                                  {"path"}));
  tools.push_back(function_schema(
      "write_file", "Write content to a file in the workspace, creating parent directories.",
      {{"path", Value{param("string", "Path relative to the workspace")}},
       {"content", Value{param("string", "Full file content")}}},
      {"path", "content"}));
  tools.push_back(function_schema("list_files", "List the entries of a workspace directory.",
                                  {{"path", Value{param("string", "Directory, default workspace root")}}},
                                  {}));
  tools.push_back(function_schema(
      "read_directory", "Recursively list a workspace directory with file kinds and sizes.",
      {{"path", Value{param("string", "Directory, default workspace root")}}}, {}));
  tools.push_back(function_schema(
      "execute_command", "Run a shell command in the workspace and return its output.",
      {{"command", Value{param("string", "Shell command")}},
       {"timeout", Value{param("number", "Timeout in seconds (optional)")}}},
      {"command"}));
  return tools;
}

ToolCall parse_tool_call(const std::string& name, const std::string& arguments_json) {
  const bool known = name == "read_file" || name == "write_file" || name == "list_files" ||
                     name == "read_directory" || name == "execute_command";
  if (!known) return UnknownTool{name};

  Object args;
  if (!arguments_json.empty()) {
    std::optional<jsonlite::JsonError> err;
    args = jsonlite::parse(arguments_json, &err);
    if (err) return MalformedToolCall{name, "arguments are not a JSON object: " + err->message};
  }

  auto has_string = [&](const std::string& key) {
    auto it = args.find(key);
    return it != args.end() && jsonlite::is_string(it->second);
  };

  if (name == "read_file") {
    if (!has_string("path")) return MalformedToolCall{name, "missing string argument 'path'"};
    return ReadFileArgs{jsonlite::get_string(args, "path")};
  }
  if (name == "write_file") {
    if (!has_string("path")) return MalformedToolCall{name, "missing string argument 'path'"};
    if (!has_string("content")) return MalformedToolCall{name, "missing string argument 'content'"};
    return WriteFileArgs{jsonlite::get_string(args, "path"), jsonlite::get_string(args, "content")};
  }
  if (name == "list_files") return ListFilesArgs{jsonlite::get_string(args, "path")};
  if (name == "read_directory") return ReadDirectoryArgs{jsonlite::get_string(args, "path")};

  if (!has_string("command")) return MalformedToolCall{name, "missing string argument 'command'"};
  ExecuteCommandArgs exec;
  exec.command = jsonlite::get_string(args, "command");
  exec.timeout_seconds = jsonlite::get_double(args, "timeout", 0.0);
  return exec;
}

std::string tool_name(const ToolCall& call) {
  return std::visit(overloaded{
                        [](const ReadFileArgs&) { return std::string("read_file"); },
                        [](const WriteFileArgs&) { return std::string("write_file"); },
                        [](const ListFilesArgs&) { return std::string("list_files"); },
                        [](const ReadDirectoryArgs&) { return std::string("read_directory"); },
                        [](const ExecuteCommandArgs&) { return std::string("execute_command"); },
                        [](const UnknownTool& t) { return t.name; },
                        [](const MalformedToolCall& t) { return t.name; },
                    },
                    call);
}

ToolOutcome dispatch_tool(Sandbox& sandbox, const ToolCall& call, double max_command_seconds) {
  try {
    return std::visit(
        overloaded{
            [&](const ReadFileArgs& a) {
              return ToolOutcome{sandbox.read_file(a.path)};
            },
            [&](const WriteFileArgs& a) {
              sandbox.write_file(a.path, a.content);
              Object o{{"success", Value{true}},
                       {"path", str(a.path)},
                       {"bytes", Value{static_cast<std::uint64_t>(a.content.size())}}};
              return ToolOutcome{jsonlite::to_json(Value{std::move(o)})};
            },
            [&](const ListFilesArgs& a) {
              Object o{{"files", Value{entries_array(sandbox.list_files(a.path))}}};
              return ToolOutcome{jsonlite::to_json(Value{std::move(o)})};
            },
            [&](const ReadDirectoryArgs& a) {
              Object o{{"entries", Value{entries_array(sandbox.read_directory(a.path))}}};
              return ToolOutcome{jsonlite::to_json(Value{std::move(o)})};
            },
            [&](const ExecuteCommandArgs& a) {
              double timeout = a.timeout_seconds;
              if (max_command_seconds > 0.0) {
                if (timeout == 0.0) timeout = sandbox.default_command_timeout_seconds();
                timeout = std::min(timeout, max_command_seconds);
              }
              const CommandLog log = sandbox.execute_command(a.command, timeout);
              Object o;
              o["exit_code"] = Value{static_cast<std::uint64_t>(log.exit_code < 0 ? 0 : log.exit_code)};
              o["stdout"] = str(log.stdout_text);
              o["stderr"] = str(log.stderr_text);
              o["timed_out"] = Value{log.timed_out};
              bool is_error = false;
              try {
                require_success(log);
              } catch (const Error& e) {
                o["error"] = str(e.describe());
                is_error = true;
              }
              return ToolOutcome{jsonlite::to_json(Value{std::move(o)}), is_error};
            },
            [&](const UnknownTool& t) {
              return ToolOutcome{error_json("unknown tool: " + t.name), true};
            },
            [&](const MalformedToolCall& t) {
              return ToolOutcome{error_json(t.name + ": " + t.reason), true};
            },
        },
        call);
  } catch (const PathEscapeError& e) {
    return ToolOutcome{error_json(e.describe()), true, ErrorCode::path_escape};
  } catch (const Error& e) {
    return ToolOutcome{error_json(e.describe()), true};
  }
}

}  // namespace arbiter
