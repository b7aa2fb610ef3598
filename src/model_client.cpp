#include "arbiter/model_client.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <vector>

#include <unistd.h>

#include "arbiter/process.hpp"
#include "arbiter/types.hpp"

namespace arbiter {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

namespace {

Value str(const std::string& s) { return Value{s}; }

// mkstemp file (mode 0600) removed on scope exit.
class TempFile {
 public:
  explicit TempFile(const std::string& prefix) {
    std::string tmpl = "/tmp/" + prefix + "XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    fd_ = ::mkstemp(buf.data());
    if (fd_ >= 0) path_ = buf.data();
  }
  ~TempFile() {
    if (fd_ >= 0) ::close(fd_);
    if (!path_.empty()) ::unlink(path_.c_str());
  }
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  bool write_all(const std::string& data) {
    if (fd_ < 0) return false;
    size_t off = 0;
    while (off < data.size()) {
      const ssize_t n = ::write(fd_, data.data() + off, data.size() - off);
      if (n <= 0) return false;
      off += static_cast<size_t>(n);
    }
    return true;
  }
  const std::string& path() const { return path_; }

 private:
  int fd_{-1};
  std::string path_;
};

std::string arguments_text(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return "{}";
  if (jsonlite::is_string(it->second)) return std::get<std::string>(it->second.v);
  if (jsonlite::is_object(it->second)) return jsonlite::to_json(it->second);
  return "{}";
}

std::string with_call_id(const std::string& id, size_t index) {
  return id.empty() ? "call_" + std::to_string(index) : id;
}

}  // namespace

std::string strip_reasoning(const std::string& text) {
  const std::string open = "<think>";
  const std::string close = "</think>";
  size_t start = text.find_first_not_of(" \t\r\n");
  if (start == std::string::npos || text.compare(start, open.size(), open) != 0) return text;
  const size_t end = text.find(close, start);
  if (end == std::string::npos) return text;
  const size_t rest = text.find_first_not_of(" \t\r\n", end + close.size());
  return rest == std::string::npos ? std::string() : text.substr(rest);
}

std::string build_chat_request(const ModelRequest& request, const std::string& model) {
  Array messages;
  messages.push_back(Value{Object{{"role", str("system")}, {"content", str(request.system)}}});
  for (const auto& m : request.messages) messages.push_back(m);

  Object body;
  body["model"] = str(model);
  body["messages"] = Value{std::move(messages)};
  if (!request.tools.empty()) {
    body["tools"] = Value{request.tools};
    body["tool_choice"] = str("auto");
  }
  body["temperature"] = Value{request.temperature};
  body["max_tokens"] = Value{static_cast<std::uint64_t>(request.max_tokens)};
  return jsonlite::to_json(Value{std::move(body)});
}

ModelResponse parse_chat_completion(const std::string& body) {
  std::optional<jsonlite::JsonError> err;
  const Object doc = jsonlite::parse(body, &err);
  if (err) throw ModelUnavailableError("malformed completion: " + err->message);

  const Array choices = jsonlite::get_array(doc, "choices");
  if (choices.empty() || !jsonlite::is_object(choices.front())) {
    throw ModelUnavailableError("completion has no choices");
  }
  const Object& choice = std::get<Object>(choices.front().v);
  const Object message = jsonlite::get_object(choice, "message");
  if (message.empty()) throw ModelUnavailableError("completion choice has no message");

  ModelResponse response;
  response.final_text = strip_reasoning(jsonlite::get_string(message, "content"));
  const Array calls = jsonlite::get_array(message, "tool_calls");
  for (size_t i = 0; i < calls.size(); ++i) {
    if (!jsonlite::is_object(calls[i])) continue;
    const Object& call = std::get<Object>(calls[i].v);
    const Object fn = jsonlite::get_object(call, "function");
    ToolCallRequest tc;
    tc.id = with_call_id(jsonlite::get_string(call, "id"), i);
    tc.name = jsonlite::get_string(fn, "name");
    tc.arguments = arguments_text(fn, "arguments");
    if (tc.name.empty()) throw ModelUnavailableError("tool call without a function name");
    response.tool_calls.push_back(std::move(tc));
  }
  const Object usage = jsonlite::get_object(doc, "usage");
  response.tokens_used = jsonlite::get_u64(usage, "total_tokens",
                                           jsonlite::get_u64(usage, "prompt_tokens") +
                                               jsonlite::get_u64(usage, "completion_tokens"));
  return response;
}

ModelResponse parse_runner_output(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  const Object doc = jsonlite::parse(text, &err);
  if (err) throw ModelUnavailableError("malformed runner output: " + err->message);

  const std::string error = jsonlite::get_string(doc, "error");
  if (!error.empty()) throw ModelError("runner: " + error);

  ModelResponse response;
  response.final_text = strip_reasoning(jsonlite::get_string(doc, "final_text"));
  response.tokens_used = jsonlite::get_u64(doc, "tokens_used");
  const Array calls = jsonlite::get_array(doc, "tool_calls");
  for (size_t i = 0; i < calls.size(); ++i) {
    if (!jsonlite::is_object(calls[i])) throw ModelUnavailableError("tool call is not an object");
    const Object& call = std::get<Object>(calls[i].v);
    ToolCallRequest tc;
    tc.id = with_call_id(jsonlite::get_string(call, "id"), i);
    tc.name = jsonlite::get_string(call, "name");
    tc.arguments = arguments_text(call, "arguments");
    if (tc.name.empty()) throw ModelUnavailableError("tool call without a name");
    response.tool_calls.push_back(std::move(tc));
  }
  if (response.tool_calls.empty() && doc.find("final_text") == doc.end()) {
    throw ModelUnavailableError("runner output has neither final_text nor tool_calls");
  }
  return response;
}

// ---------------------------------------------------------------------------
// HttpModelClient
// ---------------------------------------------------------------------------

HttpModelClient::HttpModelClient(HttpModelOptions options) : options_(std::move(options)) {
  while (!options_.url.empty() && options_.url.back() == '/') options_.url.pop_back();
}

ModelResponse HttpModelClient::complete(const ModelRequest& request, uint64_t timeout_ms) {
  // The API key goes in a 0600 header file so it never appears in argv.
  TempFile headers("arbiter_hdr_");
  std::string header_text = "Content-Type: application/json\n";
  if (!options_.api_key_env.empty()) {
    if (const char* key = std::getenv(options_.api_key_env.c_str()); key && *key) {
      header_text += "Authorization: Bearer " + std::string(key) + "\n";
    }
  }
  if (headers.path().empty() || !headers.write_all(header_text)) {
    throw ModelUnavailableError("cannot stage request headers");
  }

  const uint64_t max_time_s = std::max<uint64_t>(1, (timeout_ms + 999) / 1000);
  ProcessSpec spec;
  spec.command = options_.curl_binary;
  spec.argv = {"-sS", "-X", "POST",
               "--max-time", std::to_string(max_time_s),
               "-H", "@" + headers.path(),
               "--data-binary", "@-",
               "-w", "\n%{http_code}",
               options_.url + "/v1/chat/completions"};
  spec.inherit_env = true;
  spec.stdin_text = build_chat_request(request, options_.model);
  spec.timeout_ms = timeout_ms + 2000;
  spec.max_output_bytes = options_.max_response_bytes;
  spec.limit_cpu_time = false;

  const ProcessResult r = run_process(spec);
  if (!r.spawned()) throw ModelUnavailableError("curl: " + r.error_message);
  if (r.timed_out || r.exit_code == 28) {
    throw ModelUnavailableError("model request timed out after " + std::to_string(max_time_s) + "s");
  }
  if (r.exit_code != 0) {
    throw ModelUnavailableError("curl exited " + std::to_string(r.exit_code) + ": " + r.stderr_text);
  }
  if (r.stdout_truncated) throw ModelUnavailableError("model response exceeded size limit");

  const size_t nl = r.stdout_text.rfind('\n');
  if (nl == std::string::npos) throw ModelUnavailableError("response without status line");
  const std::string body = r.stdout_text.substr(0, nl);
  const int status = std::atoi(r.stdout_text.c_str() + nl + 1);

  if (status == 429 || status >= 500 || status == 0) {
    throw ModelUnavailableError("HTTP " + std::to_string(status) + ": " + body.substr(0, 512));
  }
  if (status >= 400) {
    throw ModelError("HTTP " + std::to_string(status) + ": " + body.substr(0, 512));
  }
  return parse_chat_completion(body);
}

// ---------------------------------------------------------------------------
// SubprocessModelClient
// ---------------------------------------------------------------------------

SubprocessModelClient::SubprocessModelClient(std::vector<std::string> argv, std::string model_name)
    : argv_(std::move(argv)), model_name_(std::move(model_name)) {
  if (argv_.empty()) throw ConfigError("model runner argv is empty");
}

ModelResponse SubprocessModelClient::complete(const ModelRequest& request, uint64_t timeout_ms) {
  Object payload;
  payload["task_description"] = str(request.task_description);
  payload["system"] = str(request.system);
  payload["conversation_history"] = Value{request.messages};
  payload["tool_definitions"] = Value{request.tools};

  ProcessSpec spec;
  spec.command = argv_.front();
  spec.argv.assign(argv_.begin() + 1, argv_.end());
  spec.inherit_env = true;
  spec.stdin_text = jsonlite::to_json(Value{std::move(payload)});
  spec.timeout_ms = timeout_ms;
  spec.max_output_bytes = 8u << 20;
  spec.limit_cpu_time = false;

  const ProcessResult r = run_process(spec);
  if (!r.spawned()) throw ModelUnavailableError("runner: " + r.error_message);
  if (r.timed_out) throw ModelUnavailableError("runner timed out");
  if (r.exit_code != 0) {
    throw ModelUnavailableError("runner exited " + std::to_string(r.exit_code) + ": " + r.stderr_text);
  }
  return parse_runner_output(r.stdout_text);
}

}  // namespace arbiter
