#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "arbiter/agent.hpp"
#include "arbiter/audit.hpp"
#include "arbiter/cas.hpp"
#include "arbiter/config.hpp"
#include "arbiter/container.hpp"
#include "arbiter/dataset.hpp"
#include "arbiter/evaluator.hpp"
#include "arbiter/fsutil.hpp"
#include "arbiter/hash.hpp"
#include "arbiter/jsonlite.hpp"
#include "arbiter/model_client.hpp"
#include "arbiter/observability.hpp"
#include "arbiter/process.hpp"
#include "arbiter/sandbox.hpp"
#include "arbiter/scoring.hpp"
#include "arbiter/tools.hpp"
#include "arbiter/types.hpp"
#include "arbiter/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) < eps; }

fs::path fresh_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / ("arbiter_test_" + name);
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

std::unique_ptr<arbiter::Sandbox> make_sandbox(arbiter::RunContext& run, const fs::path& root,
                                               const std::string& name,
                                               std::shared_ptr<arbiter::ContainerEngine> engine = nullptr) {
  arbiter::SandboxOptions opts;
  opts.name = name;
  opts.task_id = "task_" + name;
  opts.workspace_dir = (root / name).string();
  opts.default_command_timeout_ms = 10000;
  if (!engine) engine = std::make_shared<arbiter::ProcessEngine>();
  return arbiter::Sandbox::create(engine, opts, run);
}

// ---------------------------------------------------------------------------
// Fakes
// ---------------------------------------------------------------------------

class ScriptedModel : public arbiter::ModelClient {
 public:
  using Script = std::function<arbiter::ModelResponse(const arbiter::ModelRequest&)>;
  explicit ScriptedModel(Script script) : script_(std::move(script)) {}
  std::string model_name() const override { return "scripted"; }
  arbiter::ModelResponse complete(const arbiter::ModelRequest& request, uint64_t) override {
    calls_.fetch_add(1);
    return script_(request);
  }
  int calls() const { return calls_.load(); }

 private:
  Script script_;
  std::atomic<int> calls_{0};
};

arbiter::ModelResponse tool_response(const std::string& name, const std::string& args) {
  arbiter::ModelResponse r;
  r.tool_calls.push_back(arbiter::ToolCallRequest{"call_0", name, args});
  r.tokens_used = 10;
  return r;
}

arbiter::ModelResponse final_response(const std::string& text) {
  arbiter::ModelResponse r;
  r.final_text = text;
  r.tokens_used = 5;
  return r;
}

bool has_tool_result(const arbiter::ModelRequest& request) {
  for (const auto& m : request.messages) {
    if (arbiter::jsonlite::is_object(m) &&
        arbiter::jsonlite::get_string(std::get<arbiter::jsonlite::Object>(m.v), "role") == "tool") {
      return true;
    }
  }
  return false;
}

// ProcessEngine that refuses to provision one task.
class FlakyEngine : public arbiter::ProcessEngine {
 public:
  explicit FlakyEngine(std::string failing_task) : failing_task_(std::move(failing_task)) {}
  arbiter::ContainerHandle create(const arbiter::ContainerSpec& spec) override {
    auto it = spec.labels.find("arbiter.task");
    if (it != spec.labels.end() && it->second == failing_task_) {
      throw arbiter::ProvisioningError("image pull failed for " + spec.name);
    }
    return arbiter::ProcessEngine::create(spec);
  }

 private:
  std::string failing_task_;
};

class DownEngine : public arbiter::ProcessEngine {
 public:
  bool ping(std::string* error) override {
    if (error) *error = "daemon socket refused connection";
    return false;
  }
};

class CountingFetcher : public arbiter::ArtifactFetcher {
 public:
  explicit CountingFetcher(std::string payload) : payload_(std::move(payload)) {}
  std::string fetch(const std::string&, bool) override {
    ++fetches;
    if (offline) throw arbiter::DatasetUnavailableError("network unreachable");
    return payload_;
  }
  int fetches{0};
  bool offline{false};

 private:
  std::string payload_;
};

const char* kHumanEvalJsonl =
    "{\"task_id\":\"HumanEval/0\",\"prompt\":\"def add(a, b):\\n\",\"canonical_solution\":\"    return a + b\\n\","
    "\"test\":\"def check(candidate):\\n    assert candidate(1, 2) == 3\\n\",\"entry_point\":\"add\"}\n"
    "this line is not json\n"
    "{\"task_id\":\"HumanEval/1\",\"prompt\":\"def neg(a):\\n\",\"canonical_solution\":\"    return -a\\n\","
    "\"test\":\"def check(candidate):\\n    assert candidate(1) == -1\\n\",\"entry_point\":\"neg\"}\n";

bool process_alive(long pid) {
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  if (!stat) return false;
  std::string line;
  std::getline(stat, line);
  const size_t close = line.rfind(')');
  if (close == std::string::npos || close + 2 >= line.size()) return false;
  return line[close + 2] != 'Z';
}

// ============================================================================
// Hashing, JSON, storage
// ============================================================================

void test_blake3_known_vectors() {
  expect(arbiter::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(arbiter::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
  expect(arbiter::cas_content_hash("x") != arbiter::audit_entry_hash("x"), "domains are separated");
}

void test_json_canonical_and_strict() {
  std::optional<arbiter::jsonlite::JsonError> err;
  const std::string canon = arbiter::jsonlite::canonicalize_json("{\"b\":1,\"a\":[true,null]}", &err);
  expect(!err, "canonicalize valid doc");
  expect(canon == "{\"a\":[true,null],\"b\":1}", "keys sorted: " + canon);
  expect(arbiter::jsonlite::validate_strict("{\"a\":1,\"a\":2}").has_value(), "duplicate keys rejected");
  expect(arbiter::jsonlite::validate_strict("{\"a\":1} x").has_value(), "trailing data rejected");
}

void test_cas_zstd_round_trip() {
  const fs::path tmp = fresh_dir("cas_zstd");
  arbiter::CasStore cas(tmp.string());
  const std::string data(20000, 'q');
  const std::string d1 = cas.put(data, "zstd");
  expect(!d1.empty(), "CAS put returns digest");
  expect(cas.put(data, "zstd") == d1, "CAS key is content-derived");
  const auto info = cas.info(d1);
  expect(info && info->encoding == "zstd", "stored with zstd");
  expect(info->stored_size < data.size(), "zstd shrinks repetitive data");
  const auto back = cas.get(d1);
  expect(back && *back == data, "CAS round-trip matches");
  fs::remove_all(tmp);
}

void test_cas_corruption_detection() {
  const fs::path tmp = fresh_dir("cas_corrupt");
  arbiter::CasStore cas(tmp.string());
  const std::string digest = cas.put("test data for corruption check", "zstd");
  expect(!digest.empty(), "CAS put returns digest");
  {
    std::fstream file(cas.object_path(digest), std::ios::in | std::ios::out | std::ios::binary);
    expect(file.good(), "can open object file");
    char byte;
    file.read(&byte, 1);
    byte ^= 0xFF;
    file.seekp(0);
    file.write(&byte, 1);
  }
  std::string why;
  expect(!cas.get(digest, &why).has_value(), "CAS detects corruption");
  expect(why == "stored blob hash mismatch", "corruption reason: " + why);
  expect(!cas.get("abc").has_value(), "invalid digest rejected");
  fs::remove_all(tmp);
}

// ============================================================================
// Process runner and sandbox
// ============================================================================

void test_process_timeout() {
  arbiter::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "sleep 5"};
  spec.env["PATH"] = "/usr/bin:/bin";
  spec.timeout_ms = 200;
  const auto t0 = std::chrono::steady_clock::now();
  const auto r = arbiter::run_process(spec);
  const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
  expect(r.timed_out, "sleep must time out");
  expect(r.exit_code == 124, "timeout exit code is 124");
  expect(elapsed < 2.0, "returns shortly after the deadline");
}

void test_command_timeout_kills_process_group() {
  const fs::path root = fresh_dir("cmd_timeout");
  arbiter::RunContext run("rtimeout");
  auto sb = make_sandbox(run, root, "timeout");

  const auto t0 = std::chrono::steady_clock::now();
  const auto log = sb->execute_command("sleep 30 & echo $! > bg.pid; wait", 0.5);
  const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
  expect(log.timed_out, "command timed out");
  expect(log.exit_code == 124, "exit code 124");
  expect(log.error_code == "command_timeout", "error_code recorded");
  expect(elapsed < 3.0, "returned within timeout + epsilon");

  const std::string pid_text = sb->read_file("bg.pid");
  const long pid = std::strtol(pid_text.c_str(), nullptr, 10);
  expect(pid > 0, "background pid recorded");
  bool alive = true;
  for (int i = 0; i < 40 && alive; ++i) {
    alive = process_alive(pid);
    if (alive) std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  expect(!alive, "no process from the timed-out command survives");

  bool threw = false;
  try {
    arbiter::require_success(log);
  } catch (const arbiter::CommandTimeoutError&) {
    threw = true;
  }
  expect(threw, "require_success raises CommandTimeoutError");

  const auto next = sb->execute_command("echo still-here");
  expect(next.exit_code == 0 && next.stdout_text == "still-here\n", "sandbox usable after reset");
  expect(run.stats.command_timeouts.load() == 1, "timeout counted");
  sb->cleanup(false);
  fs::remove_all(root);
}

void test_negative_timeout_rejected() {
  const fs::path root = fresh_dir("neg_timeout");
  arbiter::RunContext run("rneg");
  auto sb = make_sandbox(run, root, "neg");
  bool threw = false;
  try {
    sb->execute_command("true", -1.0);
  } catch (const arbiter::InvalidArgument&) {
    threw = true;
  }
  expect(threw, "negative timeout rejected");
  expect(sb->command_logs().empty(), "rejected command is not logged");
  sb->cleanup(false);
  fs::remove_all(root);
}

void test_workspace_isolation() {
  const fs::path root = fresh_dir("isolation");
  arbiter::RunContext run("riso");
  std::unique_ptr<arbiter::Sandbox> a;
  std::unique_ptr<arbiter::Sandbox> b;
  std::thread ta([&] { a = make_sandbox(run, root, "iso-a"); });
  std::thread tb([&] { b = make_sandbox(run, root, "iso-b"); });
  ta.join();
  tb.join();
  expect(a && b, "both sandboxes created");
  expect(a->workspace() != b->workspace(), "distinct workspaces");

  a->write_file("secret.txt", "only for a");
  a->execute_command("echo made-by-command > cmd.txt");
  bool hidden = true;
  for (const auto& e : b->list_files()) {
    if (e.path == "secret.txt" || e.path == "cmd.txt") hidden = false;
  }
  expect(hidden, "files of A are not listed in B");
  bool threw = false;
  try {
    b->read_file("secret.txt");
  } catch (const arbiter::Error& e) {
    threw = e.code() == arbiter::ErrorCode::io_error;
  }
  expect(threw, "B cannot read A's file");
  expect(b->execute_command("cat secret.txt").exit_code != 0, "B's commands do not see A's file");
  expect(run.stats.sandboxes_created.load() == 2, "two sandboxes counted");
  a->cleanup(false);
  b->cleanup(false);
  fs::remove_all(root);
}

void test_path_escape_blocked() {
  const fs::path root = fresh_dir("escape");
  arbiter::RunContext run("resc");
  auto sb = make_sandbox(run, root, "esc");
  const fs::path outside = root / "escape.txt";

  bool threw = false;
  try {
    sb->write_file("../escape.txt", "nope");
  } catch (const arbiter::PathEscapeError&) {
    threw = true;
  }
  expect(threw, "../escape.txt throws PathEscapeError");
  expect(!fs::exists(outside), "nothing written outside the workspace");

  threw = false;
  try {
    sb->read_file("/etc/passwd");
  } catch (const arbiter::PathEscapeError&) {
    threw = true;
  }
  expect(threw, "absolute host path rejected");

  fs::create_symlink(root, fs::path(sb->workspace()) / "link");
  threw = false;
  try {
    sb->write_file("link/escape.txt", "nope");
  } catch (const arbiter::PathEscapeError&) {
    threw = true;
  }
  expect(threw, "symlink escape rejected");
  expect(!fs::exists(outside), "symlink escape wrote nothing");

  sb->write_file("/workspace/sub/ok.txt", "fine");
  expect(sb->read_file("sub/ok.txt") == "fine", "/workspace paths map to the root");
  expect(run.stats.path_escapes.load() == 3, "escapes counted");
  sb->cleanup(false);
  fs::remove_all(root);
}

void test_planted_symlink_rejected() {
  const fs::path root = fresh_dir("planted_link");
  arbiter::RunContext run("rlink");
  auto sb = make_sandbox(run, root, "plant");
  const fs::path outside = root / "outside.txt";

  // Dangling link: weakly_canonical cannot see through it.
  expect(sb->execute_command("ln -s '" + outside.string() + "' link.txt").exit_code == 0,
         "link planted by a command");
  bool threw = false;
  try {
    sb->write_file("link.txt", "pwned\n");
  } catch (const arbiter::PathEscapeError&) {
    threw = true;
  }
  expect(threw, "write through a dangling link rejected");
  expect(!fs::exists(outside), "nothing written through the link");

  expect(arbiter::atomic_write(outside.string(), "host secret"), "write outside file");
  threw = false;
  try {
    sb->read_file("link.txt");
  } catch (const arbiter::PathEscapeError&) {
    threw = true;
  }
  expect(threw, "read through a link rejected");

  expect(sb->execute_command("ln -s '" + root.string() + "' dirlink").exit_code == 0, "dir link planted");
  threw = false;
  try {
    sb->list_files("dirlink");
  } catch (const arbiter::PathEscapeError&) {
    threw = true;
  }
  expect(threw, "listing through a link rejected");

  bool followed = false;
  bool link_listed = false;
  for (const auto& e : sb->read_directory()) {
    if (e.path == "dirlink") link_listed = !e.is_directory;
    if (e.path.rfind("dirlink/", 0) == 0) followed = true;
  }
  expect(link_listed && !followed, "recursive listing does not follow links");
  expect(run.stats.path_escapes.load() == 3, "each rejection counted");
  sb->cleanup(false);
  fs::remove_all(root);
}

void test_oversized_timeout_clamped() {
  const fs::path root = fresh_dir("huge_timeout");
  arbiter::RunContext run("rhuge");
  auto sb = make_sandbox(run, root, "huge");
  const auto log = sb->execute_command("sleep 1; echo done", 1e30);
  expect(!log.timed_out && log.exit_code == 0, "1e30 s runs like a long timeout");
  expect(log.stdout_text == "done\n", "command ran to completion");

  const auto via_tool = arbiter::dispatch_tool(
      *sb, arbiter::parse_tool_call("execute_command", "{\"command\":\"echo ok\",\"timeout\":1e30}"));
  expect(!via_tool.is_error, "model-supplied 1e30 timeout accepted");
  sb->cleanup(false);
  fs::remove_all(root);
}

void test_metadata_and_cleanup_idempotent() {
  const fs::path root = fresh_dir("metadata");
  const fs::path out = root / "out";
  arbiter::RunContext run("rmeta");
  auto sb = make_sandbox(run, root, "meta");
  sb->write_file("main.py", "print('hi')\n");
  sb->execute_command("echo one");
  sb->execute_command("echo two > two.txt");

  const std::string dir = sb->save_metadata(out.string());
  expect(fs::exists(fs::path(dir) / "metadata.json"), "metadata.json written");
  expect(fs::exists(fs::path(dir) / "filesystem.tar"), "filesystem.tar written");
  expect(sb->save_metadata(out.string()) == dir, "second save returns the same dir");

  sb->cleanup(true);
  expect(sb->state() == arbiter::SandboxState::destroyed, "destroyed after cleanup");
  const auto first = arbiter::read_file_bytes((fs::path(dir) / "metadata.json").string());
  expect(first.has_value(), "metadata survives cleanup(true)");
  const auto frozen = sb->metrics();

  sb->cleanup(true);
  const auto second = arbiter::read_file_bytes((fs::path(dir) / "metadata.json").string());
  expect(second && *second == *first, "second cleanup does not rewrite metadata");
  expect(sb->metrics().duration_seconds == frozen.duration_seconds, "metrics frozen");
  expect(frozen.commands_executed == 2, "commands counted");
  expect(frozen.files_created == 2, "main.py and two.txt created");
  expect(!fs::exists(sb->workspace()), "workspace removed");

  std::optional<arbiter::jsonlite::JsonError> err;
  const auto meta = arbiter::jsonlite::parse(*second, &err);
  expect(!err, "metadata parses");
  expect(arbiter::jsonlite::get_string(meta, "state") == "destroyed", "terminal state persisted");
  expect(arbiter::jsonlite::get_array(meta, "command_log").size() == 2, "command log persisted");

  bool threw = false;
  try {
    sb->execute_command("true");
  } catch (const arbiter::SandboxTerminatedError&) {
    threw = true;
  }
  expect(threw, "destroyed sandbox rejects commands");
  fs::remove_all(root);
}

void test_audit_chain_tamper_detection() {
  const fs::path root = fresh_dir("audit");
  arbiter::RunContext run("raudit");
  auto sb = make_sandbox(run, root, "aud");
  sb->execute_command("echo a");
  sb->execute_command("echo b");
  sb->execute_command("exit 3");

  auto entries = sb->command_logs();
  expect(entries.size() == 3, "three entries");
  expect(entries[0].sequence_no == 1 && entries[2].sequence_no == 3, "gap-free sequence");
  expect(entries[2].exit_code == 3, "exit code recorded");
  const auto ok = arbiter::verify_audit_chain(entries);
  expect(ok.ok, "chain verifies");
  expect(ok.head_digest == sb->audit_head_digest(), "head digest matches");

  auto tampered = entries;
  tampered[1].stdout_text = "forged\n";
  const auto bad = arbiter::verify_audit_chain(tampered);
  expect(!bad.ok && bad.first_bad_sequence == 2, "tampering detected at entry 2");

  const std::string dir = sb->save_metadata((root / "out").string());
  const std::string stream = (fs::path(dir) / "audit.ndjson").string();
  expect(arbiter::verify_audit_stream(stream).ok, "streamed audit verifies");
  auto text = arbiter::read_file_bytes(stream);
  expect(text && text->find("echo b") != std::string::npos, "stream holds commands");
  text->replace(text->find("echo b"), 6, "echo c");
  expect(arbiter::atomic_write(stream, *text), "rewrite stream");
  expect(!arbiter::verify_audit_stream(stream).ok, "streamed tampering detected");
  sb->cleanup(false);
  fs::remove_all(root);
}

// ============================================================================
// Tools and model protocol
// ============================================================================

void test_tool_dispatch() {
  const fs::path root = fresh_dir("tools");
  arbiter::RunContext run("rtools");
  auto sb = make_sandbox(run, root, "tools");

  const auto unknown = arbiter::dispatch_tool(*sb, arbiter::parse_tool_call("frobnicate", "{}"));
  expect(unknown.is_error, "unknown tool is an error result");
  expect(unknown.fatal == arbiter::ErrorCode::none, "unknown tool is not fatal");
  expect(unknown.content.find("unknown tool: frobnicate") != std::string::npos, "unknown tool message");

  const auto malformed = arbiter::parse_tool_call("write_file", "{\"path\":1}");
  expect(std::holds_alternative<arbiter::MalformedToolCall>(malformed), "bad arguments detected");

  const auto wrote = arbiter::dispatch_tool(
      *sb, arbiter::parse_tool_call("write_file", "{\"path\":\"a/b.txt\",\"content\":\"xyz\"}"));
  expect(!wrote.is_error, "write_file ok");
  expect(sb->read_file("a/b.txt") == "xyz", "write_file creates parents");

  const auto exec = arbiter::dispatch_tool(
      *sb, arbiter::parse_tool_call("execute_command", "{\"command\":\"cat a/b.txt\"}"));
  std::optional<arbiter::jsonlite::JsonError> err;
  const auto obj = arbiter::jsonlite::parse(exec.content, &err);
  expect(!err && arbiter::jsonlite::get_string(obj, "stdout") == "xyz", "execute_command stdout");

  const auto escape = arbiter::dispatch_tool(
      *sb, arbiter::parse_tool_call("read_file", "{\"path\":\"../../etc/passwd\"}"));
  expect(escape.is_error && escape.fatal == arbiter::ErrorCode::path_escape, "escape is fatal");

  expect(arbiter::tool_definitions().size() == 5, "five tool schemas");
  sb->cleanup(false);
  fs::remove_all(root);
}

void test_model_response_parsing() {
  const std::string body =
      "{\"choices\":[{\"message\":{\"content\":\"<think>plan</think>\\nwriting it\","
      "\"tool_calls\":[{\"id\":\"c1\",\"type\":\"function\",\"function\":{\"name\":\"write_file\","
      "\"arguments\":\"{\\\"path\\\":\\\"solution.py\\\",\\\"content\\\":\\\"x\\\"}\"}}]}}],"
      "\"usage\":{\"total_tokens\":42}}";
  const auto r = arbiter::parse_chat_completion(body);
  expect(r.final_text == "writing it", "reasoning block stripped");
  expect(r.tool_calls.size() == 1 && r.tool_calls[0].name == "write_file", "tool call parsed");
  expect(r.tokens_used == 42, "usage parsed");

  bool unavailable = false;
  try {
    arbiter::parse_chat_completion("{\"choices\":[]}");
  } catch (const arbiter::ModelUnavailableError&) {
    unavailable = true;
  }
  expect(unavailable, "empty choices is retryable");

  bool rejected = false;
  try {
    arbiter::parse_runner_output("{\"error\":\"bad request\"}");
  } catch (const arbiter::ModelError&) {
    rejected = true;
  }
  expect(rejected, "runner error document is a ModelError");
  expect(arbiter::parse_runner_output("{\"final_text\":\"done\"}").final_text == "done", "runner final text");
}

// ============================================================================
// Coding agent
// ============================================================================

void test_agent_iteration_budget() {
  const fs::path root = fresh_dir("agent_budget");
  arbiter::RunContext run("rbudget");
  auto sb = make_sandbox(run, root, "budget");
  auto model = std::make_shared<ScriptedModel>([](const arbiter::ModelRequest&) {
    return tool_response("list_files", "{}");
  });
  arbiter::AgentLimits limits;
  limits.max_iterations = 3;
  arbiter::CodingAgent agent(model, limits, run);
  agent.set_workspace(*sb);
  const auto r = agent.send_coding_task("loop forever");
  expect(r.iterations == 3, "iterations == max_iterations");
  expect(r.state == arbiter::AgentState::failed, "agent failed");
  expect(r.error_code == "iteration_budget_exceeded", "budget error code");
  expect(model->calls() == 3, "no model call past the budget");
  expect(r.tool_calls == 3, "one tool call per round");
  const auto transcript = agent.transcript();
  expect(!transcript.empty() &&
             arbiter::jsonlite::get_string(std::get<arbiter::jsonlite::Object>(transcript[0].v), "role") ==
                 "system",
         "transcript starts with the system message");
  sb->cleanup(false);
  fs::remove_all(root);
}

void test_agent_completion_and_system_prompt() {
  const fs::path root = fresh_dir("agent_done");
  arbiter::RunContext run("rdone");
  auto sb = make_sandbox(run, root, "done");
  std::string seen_system;
  auto model = std::make_shared<ScriptedModel>([&](const arbiter::ModelRequest& req) {
    seen_system = req.system;
    if (!has_tool_result(req)) {
      return tool_response("write_file", "{\"path\":\"solution.py\",\"content\":\"ok\"}");
    }
    return final_response("All written.");
  });
  arbiter::CodingAgent agent(model, arbiter::AgentLimits{}, run);
  agent.set_workspace(*sb);
  arbiter::TaskContext ctx;
  ctx.requirements = "use python";
  const auto r = agent.send_coding_task("write it", ctx);
  expect(r.state == arbiter::AgentState::done, "agent done");
  expect(r.iterations == 2, "two rounds");
  expect(r.tokens_used == 15, "tokens summed");
  expect(sb->read_file("solution.py") == "ok", "tool side effect applied");
  expect(seen_system.rfind("You are a helpful coding assistant. Write clean, well-documented code.", 0) == 0,
         "system prompt prefix");
  expect(seen_system.find("Requirements: use python") != std::string::npos, "requirements included");

  arbiter::CodingAgent unbound(model, arbiter::AgentLimits{}, run);
  bool threw = false;
  try {
    unbound.send_coding_task("x");
  } catch (const arbiter::InvalidArgument&) {
    threw = true;
  }
  expect(threw, "agent without workspace rejects tasks");
  sb->cleanup(false);
  fs::remove_all(root);
}

void test_agent_path_escape_is_fatal() {
  const fs::path root = fresh_dir("agent_escape");
  arbiter::RunContext run("rescape");
  auto sb = make_sandbox(run, root, "aesc");
  auto model = std::make_shared<ScriptedModel>([](const arbiter::ModelRequest&) {
    return tool_response("write_file", "{\"path\":\"../../pwn.txt\",\"content\":\"x\"}");
  });
  arbiter::CodingAgent agent(model, arbiter::AgentLimits{}, run);
  agent.set_workspace(*sb);
  const auto r = agent.send_coding_task("escape");
  expect(r.state == arbiter::AgentState::failed && r.error_code == "path_escape", "path escape fails the run");
  expect(r.iterations == 1, "stops immediately");
  sb->cleanup(false);
  fs::remove_all(root);
}

void test_agent_deadline_bounds_tool_commands() {
  const fs::path root = fresh_dir("agent_deadline");
  arbiter::RunContext run("rdeadline");
  auto sb = make_sandbox(run, root, "deadline");
  auto model = std::make_shared<ScriptedModel>([](const arbiter::ModelRequest&) {
    return tool_response("execute_command", "{\"command\":\"sleep 4\",\"timeout\":60}");
  });
  arbiter::AgentLimits limits;
  limits.max_duration_ms = 500;
  arbiter::CodingAgent agent(model, limits, run);
  agent.set_workspace(*sb);
  const auto start = std::chrono::steady_clock::now();
  const auto r = agent.send_coding_task("sleep past the budget");
  const double elapsed =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  expect(elapsed < 2.5, "tool command cut at the agent deadline");
  expect(r.state == arbiter::AgentState::failed && r.error_code == "agent_timeout", "agent_timeout");
  const auto logs = sb->command_logs();
  expect(logs.size() == 1 && logs[0].timed_out, "the clamped command timed out");
  sb->cleanup(false);
  fs::remove_all(root);
}

void test_agent_retry_backoff_bound() {
  const fs::path root = fresh_dir("agent_retry");
  arbiter::RunContext run("rretry");
  auto sb = make_sandbox(run, root, "retry");
  auto model = std::make_shared<ScriptedModel>([](const arbiter::ModelRequest&) -> arbiter::ModelResponse {
    throw arbiter::ModelUnavailableError("503 from upstream");
  });

  arbiter::AgentLimits limits;
  limits.model_retries = 3;
  limits.retry_backoff_ms = 10;
  arbiter::CodingAgent agent(model, limits, run);
  std::vector<long long> sleeps;
  agent.set_sleep([&](std::chrono::milliseconds d) { sleeps.push_back(d.count()); });
  agent.set_workspace(*sb);
  const auto r = agent.send_coding_task("anything");
  expect(model->calls() == 4, "one call plus three retries");
  expect(sleeps == std::vector<long long>({10, 20, 40}), "exponential backoff");
  expect(r.state == arbiter::AgentState::failed && r.error_code == "model_unavailable", "model_unavailable");
  expect(run.stats.model_retries.load() == 3, "retries counted");

  // Backoff longer than the remaining budget: no retry at all.
  auto model2 = std::make_shared<ScriptedModel>([](const arbiter::ModelRequest&) -> arbiter::ModelResponse {
    throw arbiter::ModelUnavailableError("connection reset");
  });
  arbiter::AgentLimits tight;
  tight.max_duration_ms = 200;
  tight.retry_backoff_ms = 5000;
  arbiter::CodingAgent agent2(model2, tight, run);
  std::vector<long long> sleeps2;
  agent2.set_sleep([&](std::chrono::milliseconds d) { sleeps2.push_back(d.count()); });
  agent2.set_workspace(*sb);
  const auto r2 = agent2.send_coding_task("anything");
  expect(model2->calls() == 1 && sleeps2.empty(), "no retry past the deadline");
  expect(r2.state == arbiter::AgentState::failed, "failed without retrying");
  sb->cleanup(false);
  fs::remove_all(root);
}

// ============================================================================
// Datasets
// ============================================================================

void test_dataset_parsers() {
  std::vector<std::string> warnings;
  const auto tasks = arbiter::parse_humaneval(kHumanEvalJsonl, &warnings);
  expect(tasks.size() == 2, "two valid HumanEval records");
  expect(warnings.size() == 1, "malformed line reported");
  expect(tasks[0].id == "humaneval_HumanEval_0", "id mapping: " + tasks[0].id);
  expect(tasks[0].entry_point == "add", "entry point");
  expect(tasks[0].metadata.at("source_id") == "HumanEval/0", "source id kept");
  expect(tasks[0].canonical_solution && *tasks[0].canonical_solution == "    return a + b\n", "solution kept");

  const std::string mbpp =
      "[{\"task_id\":11,\"text\":\"Remove first and last occurrence of a char.\","
      "\"code\":\"def remove_Occ(s,ch): return s\",\"test_setup_code\":\"\","
      "\"test_list\":[\"assert remove_Occ(\\\"hello\\\",\\\"l\\\") == \\\"heo\\\"\","
      "\"assert remove_Occ(\\\"abcda\\\",\\\"a\\\") == \\\"bcd\\\"\"]}]";
  warnings.clear();
  const auto m = arbiter::parse_mbpp(mbpp, &warnings);
  expect(m.size() == 1 && warnings.empty(), "one MBPP record");
  expect(m[0].id == "mbpp_11", "mbpp id");
  expect(m[0].entry_point == "remove_Occ", "mbpp entry point");
  expect(m[0].prompt.find("Your code should pass these tests:") != std::string::npos, "tests in prompt");
  expect(m[0].test_code.find('\n') != std::string::npos, "tests joined by newline");
  expect(arbiter::mbpp_entry_point("assert set(similar(a, b)) == set(c)") == "similar", "builtins skipped");
  expect(arbiter::mbpp_entry_point("assert math.isclose(area(2), 12.5)") == "area", "attribute calls skipped");
}

void test_dataset_cache_bit_identical() {
  const fs::path cache = fresh_dir("dataset_cache");
  auto fetcher = std::make_shared<CountingFetcher>(kHumanEvalJsonl);
  arbiter::RunContext run("rds");

  arbiter::DatasetLoader first(cache.string(), fetcher, run);
  const auto a = first.load("humaneval", "v1");
  expect(!a.from_cache && fetcher->fetches == 1, "first load fetches");
  expect(a.tasks.size() == 2, "tasks parsed");

  fetcher->offline = true;
  arbiter::DatasetLoader second(cache.string(), fetcher, run);
  const auto b = second.load("humaneval", "v1");
  expect(b.from_cache && fetcher->fetches == 1, "second load served from cache");
  expect(b.digest == a.digest, "same digest");
  expect(b.tasks.size() == a.tasks.size(), "same task count");
  for (size_t i = 0; i < a.tasks.size(); ++i) {
    expect(arbiter::jsonlite::to_json(arbiter::task_to_value(a.tasks[i])) ==
               arbiter::jsonlite::to_json(arbiter::task_to_value(b.tasks[i])),
           "task " + std::to_string(i) + " bit-identical");
  }
  expect(run.stats.cas_hits.load() == 1, "cache hit counted");

  const auto limited = second.load("humaneval", "v1", 1);
  expect(limited.tasks.size() == 1, "max_tasks truncates");

  bool threw = false;
  try {
    second.load("humaneval", "v2");
  } catch (const arbiter::DatasetUnavailableError&) {
    threw = true;
  }
  expect(threw, "uncached version without network is unavailable");

  // A corrupted cache entry is refetched rather than trusted.
  fetcher->offline = false;
  arbiter::CasStore cas((cache / "cas").string());
  expect(arbiter::atomic_write(cas.object_path(a.digest), "garbage"), "corrupt cached object");
  const auto c = second.load("humaneval", "v1");
  expect(!c.from_cache && fetcher->fetches == 3, "corrupted entry refetched");
  expect(!c.warnings.empty(), "refetch reported");
  fs::remove_all(cache);
}

// ============================================================================
// Scoring
// ============================================================================

void test_pass_at_k() {
  expect(near(arbiter::pass_at_k(5, 2, 1), 0.4), "pass@1 n=5 c=2");
  expect(near(arbiter::pass_at_k(5, 2, 5), 1.0), "pass@5 n=5 c=2");
  expect(near(arbiter::pass_at_k(10, 0, 5), 0.0), "no correct samples");
  expect(near(arbiter::pass_at_k(10, 10, 1), 1.0), "all correct");
  for (std::uint32_t n = 1; n <= 12; ++n) {
    for (std::uint32_t c = 0; c <= n; ++c) {
      double prev = 0.0;
      for (std::uint32_t k = 1; k <= n; ++k) {
        const double v = arbiter::pass_at_k(n, c, k);
        expect(v + 1e-12 >= prev, "pass@k non-decreasing in k");
        expect(v >= 0.0 && v <= 1.0, "pass@k in [0,1]");
        prev = v;
      }
    }
  }
  std::vector<arbiter::TaskResult> results(2);
  results[0].num_samples = 5;
  results[0].num_correct = 2;
  results[1].num_samples = 5;
  results[1].num_correct = 0;
  const auto agg = arbiter::aggregate_pass_at_k(results, {1, 5, 10}, 5);
  expect(agg.size() == 2 && agg.count(10) == 0, "k above n omitted");
  expect(near(agg.at(1), 0.2), "mean pass@1");
}

void test_efficiency_ordering() {
  arbiter::EfficiencyWeights w;
  arbiter::AttemptResult cheap;
  cheap.passed_tests = true;
  cheap.execution_time_seconds = 5;
  cheap.sandbox_metrics.commands_executed = 2;
  cheap.tokens_used = 500;
  arbiter::AttemptResult expensive = cheap;
  expensive.execution_time_seconds = 250;
  expensive.sandbox_metrics.commands_executed = 40;
  expensive.tokens_used = 30000;
  arbiter::AttemptResult wrong = cheap;
  wrong.passed_tests = false;

  const double s_cheap = arbiter::attempt_efficiency(cheap, w);
  const double s_exp = arbiter::attempt_efficiency(expensive, w);
  const double s_wrong = arbiter::attempt_efficiency(wrong, w);
  expect(s_cheap > s_exp, "correct-cheap > correct-expensive");
  expect(s_exp > s_wrong, "correct-expensive > incorrect");
  expect(s_exp >= w.correctness_weight && s_cheap <= 1.0, "score bounds");

  arbiter::EfficiencyWeights bad;
  bad.correctness_weight = 1.0;
  expect(!arbiter::validate_weights(bad).empty(), "correctness_weight 1.0 rejected");
}

void test_baseline_comparison() {
  const auto cmp = arbiter::compare_baselines(arbiter::builtin_baselines(), "humaneval", 0.5);
  expect(cmp.size() == 4, "four humaneval baselines");
  for (const auto& c : cmp) {
    expect(near(c.delta, 0.5 - c.baseline_pass_rate), "delta = ours - baseline");
  }
  expect(arbiter::compare_baselines(arbiter::builtin_baselines(), "unknown", 0.5).empty(), "unknown dataset");

  const fs::path tmp = fresh_dir("baselines");
  const std::string path = (tmp / "b.json").string();
  expect(arbiter::atomic_write(path, "{\"humaneval\":{\"Local-7B\":0.31}}"), "write baselines");
  const auto table = arbiter::load_baselines(path);
  const auto custom = arbiter::compare_baselines(table, "humaneval", 0.31);
  expect(custom.size() == 1 && custom[0].baseline_name == "Local-7B" && near(custom[0].delta, 0.0),
         "override table used");

  // Five samples, one correct: pass@1 is 0.2 even though the task "passed".
  arbiter::TaskResult sampled;
  sampled.task_id = "HumanEval/0";
  sampled.passed_tests = true;
  sampled.num_samples = 5;
  sampled.num_correct = 1;
  const double rate = arbiter::run_pass_rate({sampled});
  expect(near(rate, 0.2), "multi-sample rate is mean pass@1");
  const auto multi = arbiter::compare_baselines(table, "humaneval", rate);
  expect(multi.size() == 1 && near(multi[0].delta, 0.2 - 0.31), "delta uses pass@1");

  arbiter::TaskResult single;
  single.passed_tests = true;
  single.num_samples = 1;
  single.num_correct = 1;
  expect(near(arbiter::run_pass_rate({sampled, single}), 0.6), "rate averaged over tasks");
  fs::remove_all(tmp);
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_precedence() {
  const fs::path tmp = fresh_dir("config");
  const std::string path = (tmp / "cfg.json").string();
  expect(arbiter::atomic_write(path,
                               "{\"concurrency\":4,\"memory_limit\":\"2g\",\"model\":{\"temperature\":0.2},"
                               "\"mystery\":true}"),
         "write config");
  std::map<std::string, std::string> env_vars{{"ARBITER_CONCURRENCY", "6"}, {"ARBITER_SAMPLES", "3"}};
  arbiter::EnvLookup env = [&](const char* name) -> const char* {
    auto it = env_vars.find(name);
    return it == env_vars.end() ? nullptr : it->second.c_str();
  };

  std::vector<std::string> warnings;
  auto cfg = arbiter::resolve_config({"--config", path}, env, &warnings);
  expect(cfg.concurrency == 6, "env beats file");
  expect(cfg.samples_per_task == 3, "env applied");
  expect(cfg.memory_limit_bytes == (2ull << 30), "file applied");
  expect(near(cfg.model.temperature, 0.2), "nested file key applied");
  expect(warnings.size() == 1 && warnings[0].find("mystery") != std::string::npos, "unknown key warned");

  std::vector<std::string> positional;
  cfg = arbiter::resolve_config({"--config", path, "--concurrency", "8", "extra"}, env, nullptr, &positional);
  expect(cfg.concurrency == 8, "flag beats env");
  expect(positional.size() == 1 && positional[0] == "extra", "positional args returned");

  bool threw = false;
  try {
    arbiter::resolve_config({"--no-such-flag", "1"}, env, nullptr);
  } catch (const arbiter::ConfigError&) {
    threw = true;
  }
  expect(threw, "unknown flag rejected");
  fs::remove_all(tmp);
}

void test_config_validation() {
  arbiter::EvaluatorConfig cfg;
  expect(arbiter::validate_config(cfg).ok, "defaults are valid");

  auto bad = cfg;
  bad.command_timeout_s = 0;
  bad.cpu_limit = 0;
  bad.memory_limit_bytes = 1 << 20;
  bad.concurrency = 0;
  bad.samples_per_task = 0;
  bad.pass_k = {0};
  bad.engine = "lxc";
  bad.model.protocol = "grpc";
  bad.output_dir = "";
  const auto r = arbiter::validate_config(bad);
  expect(!r.ok, "invalid config rejected");
  expect(r.errors.size() >= 9, "each problem reported (" + std::to_string(r.errors.size()) + ")");

  expect(arbiter::parse_memory_size("4g") == (4ull << 30), "4g");
  expect(arbiter::parse_memory_size("512m") == (512ull << 20), "512m");
  expect(arbiter::parse_memory_size("2GiB") == (2ull << 30), "2GiB");
  expect(arbiter::parse_memory_size("1024") == 1024u, "plain bytes");
  expect(!arbiter::parse_memory_size("lots").has_value(), "garbage rejected");
}

// ============================================================================
// Evaluator
// ============================================================================

arbiter::EvaluatorConfig evaluator_config(const fs::path& root) {
  arbiter::EvaluatorConfig cfg;
  cfg.engine = "process";
  cfg.output_dir = (root / "results").string();
  cfg.workspace_root = (root / "workspaces").string();
  cfg.grade_command = "/bin/sh {file}";
  cfg.pass_k = {1};
  cfg.concurrency = 2;
  cfg.task_timeout_s = 30;
  cfg.grading_timeout_s = 10;
  return cfg;
}

std::shared_ptr<ScriptedModel> solving_model(const std::string& solution) {
  return std::make_shared<ScriptedModel>([solution](const arbiter::ModelRequest& req) {
    if (!has_tool_result(req)) {
      arbiter::jsonlite::Object args{{"path", arbiter::jsonlite::Value{std::string("solution.py")}},
                                     {"content", arbiter::jsonlite::Value{solution}}};
      return tool_response("write_file", arbiter::jsonlite::to_json(arbiter::jsonlite::Value{args}));
    }
    return final_response("Solution written. TASK COMPLETE");
  });
}

arbiter::Task shell_task(const std::string& id) {
  arbiter::Task t;
  t.id = id;
  t.prompt = "Write a shell function answer that prints 42.";
  t.entry_point = "answer";
  t.test_code = "[ \"$(answer)\" = \"42\" ] || exit 1";
  t.metadata["dataset"] = "shell";
  return t;
}

void test_evaluator_isolates_task_failures() {
  const fs::path root = fresh_dir("evaluator");
  arbiter::RunContext run("reval", (root / "events.ndjson").string());
  auto engine = std::make_shared<FlakyEngine>("task_b");
  arbiter::BenchmarkEvaluator evaluator(evaluator_config(root), engine,
                                        solving_model("answer() { echo 42; }\n"), run);
  const auto report = evaluator.evaluate_tasks({shell_task("task_a"), shell_task("task_b")}, "shell", "test");

  expect(report.task_results.size() == 2, "two task results");
  const auto& a = report.task_results[0];
  const auto& b = report.task_results[1];
  expect(a.task_id == "task_a" && b.task_id == "task_b", "dataset order kept");
  expect(a.success && a.passed_tests, "task A passes: " + a.error.value_or(""));
  expect(!a.error.has_value(), "task A has no error");
  expect(!b.success && !b.passed_tests, "task B failed");
  expect(b.error && b.error->rfind("provisioning_failed", 0) == 0, "B error is provisioning_failed");
  expect(report.passed_tasks == 1 && report.errored_tasks == 1, "counts");
  expect(near(report.pass_at_k.at(1), 0.5), "pass@1 = 0.5");
  expect(report.efficiency_score > 0.0, "efficiency computed");
  expect(fs::exists(evaluator.report_path()), "report written");
  expect(fs::exists(root / "results" / "task_a_result.json"), "per-task result written");
  expect(fs::exists(root / "results" / "task_b_result.json"), "failed task result written");

  expect(a.attempts.size() == 1, "one attempt");
  const fs::path snap(a.attempts[0].snapshot_dir);
  expect(fs::exists(snap / "metadata.json") && fs::exists(snap / "filesystem.tar"), "snapshot saved");
  expect(fs::exists(snap / "transcript.json"), "transcript saved");
  expect(a.agent_transcript_ref == (snap / "transcript.json").string(), "transcript referenced");
  expect(a.sandbox_metrics.commands_executed == 1, "grading command counted");
  expect(run.stats.provisioning_failures.load() == 1, "provisioning failure counted");
  expect(!fs::exists(root / "workspaces" / "reval" / a.attempts[0].sandbox_name), "workspace cleaned");

  const auto events = arbiter::read_file_bytes((root / "events.ndjson").string());
  expect(events && events->find("\"run_finished\"") != std::string::npos, "run_finished event");
  fs::remove_all(root);
}

void test_evaluator_grading_outcomes() {
  const fs::path root = fresh_dir("grading");
  arbiter::RunContext run("rgrade");
  auto engine = std::make_shared<arbiter::ProcessEngine>();

  auto cfg = evaluator_config(root);
  cfg.grading_timeout_s = 0.5;
  cfg.samples_per_task = 2;
  cfg.pass_k = {1, 2};
  arbiter::BenchmarkEvaluator slow(cfg, engine, solving_model("answer() { sleep 5; echo 42; }\n"), run);
  const auto timed_out = slow.evaluate_attempt(shell_task("slow"), 0);
  expect(!timed_out.passed_tests && timed_out.error_code == "grading_timeout", "grading timeout recorded");

  arbiter::BenchmarkEvaluator wrong(cfg, engine, solving_model("answer() { echo 41; }\n"), run);
  const auto report = wrong.evaluate_tasks({shell_task("wrong")}, "shell", "test");
  const auto& r = report.task_results[0];
  expect(r.num_samples == 2 && r.num_correct == 0, "both samples graded");
  expect(r.success && !r.passed_tests, "graded but failing");
  expect(r.error && r.error->rfind("tests_failed", 0) == 0, "tests_failed recorded");
  expect(report.failed_tasks == 1, "counted as failed, not errored");
  fs::remove_all(root);
}

void test_evaluator_solution_from_code_block() {
  const fs::path root = fresh_dir("codeblock");
  arbiter::RunContext run("rblock");
  auto model = std::make_shared<ScriptedModel>([](const arbiter::ModelRequest&) {
    return final_response("Here you go:\n```sh\nanswer() { echo 42; }\n```\n");
  });
  arbiter::BenchmarkEvaluator evaluator(evaluator_config(root), std::make_shared<arbiter::ProcessEngine>(),
                                        model, run);
  const auto a = evaluator.evaluate_attempt(shell_task("block"), 0);
  expect(a.passed_tests, "code block solution graded: " + a.error);

  auto silent = std::make_shared<ScriptedModel>([](const arbiter::ModelRequest&) {
    return final_response("I cannot do that.");
  });
  arbiter::BenchmarkEvaluator none(evaluator_config(root), std::make_shared<arbiter::ProcessEngine>(),
                                   silent, run);
  const auto m = none.evaluate_attempt(shell_task("none"), 0);
  expect(!m.success && m.error_code == "solution_missing", "missing solution recorded");

  expect(arbiter::extract_code_block("a\n```py\nx = 1\n```\nb\n```\ny = 2\n```") == std::string("y = 2\n"),
         "last fenced block wins");
  arbiter::Task py;
  py.entry_point = "add";
  py.test_code = "def check(candidate):\n    assert candidate(1, 2) == 3\n";
  const std::string program = arbiter::build_test_program("def add(a, b):\n    return a + b", py);
  expect(program.find("check(add)") != std::string::npos, "check(entry_point) appended");
  fs::remove_all(root);
}

void test_evaluator_run_scoped_errors() {
  const fs::path root = fresh_dir("runscoped");
  arbiter::RunContext run("rdown");
  arbiter::BenchmarkEvaluator evaluator(evaluator_config(root), std::make_shared<DownEngine>(),
                                        solving_model("x"), run);
  bool threw = false;
  try {
    evaluator.evaluate_tasks({shell_task("t")}, "shell", "test");
  } catch (const arbiter::EngineUnavailableError&) {
    threw = true;
  }
  expect(threw, "unreachable engine aborts the run");
  expect(run.stats.sandboxes_created.load() == 0, "no task started");

  auto cfg = evaluator_config(root);
  cfg.concurrency = 0;
  threw = false;
  try {
    arbiter::BenchmarkEvaluator invalid(cfg, std::make_shared<arbiter::ProcessEngine>(), solving_model("x"), run);
  } catch (const arbiter::ConfigError&) {
    threw = true;
  }
  expect(threw, "invalid config aborts before the run");
  fs::remove_all(root);
}

}  // namespace

int main() {
  std::cout << "=== arbiter test suite ===\n";

  std::cout << "\n[Hashing, JSON, storage]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("JSON canonical and strict", test_json_canonical_and_strict);
  run_test("CAS zstd round-trip", test_cas_zstd_round_trip);
  run_test("CAS corruption detection", test_cas_corruption_detection);

  std::cout << "\n[Sandbox]\n";
  run_test("process timeout", test_process_timeout);
  run_test("command timeout kills process group", test_command_timeout_kills_process_group);
  run_test("negative timeout rejected", test_negative_timeout_rejected);
  run_test("workspace isolation", test_workspace_isolation);
  run_test("path escape blocked", test_path_escape_blocked);
  run_test("planted symlink rejected", test_planted_symlink_rejected);
  run_test("oversized timeout clamped", test_oversized_timeout_clamped);
  run_test("metadata and cleanup idempotent", test_metadata_and_cleanup_idempotent);
  run_test("audit chain tamper detection", test_audit_chain_tamper_detection);

  std::cout << "\n[Tools and model protocol]\n";
  run_test("tool dispatch", test_tool_dispatch);
  run_test("model response parsing", test_model_response_parsing);

  std::cout << "\n[Coding agent]\n";
  run_test("iteration budget", test_agent_iteration_budget);
  run_test("completion and system prompt", test_agent_completion_and_system_prompt);
  run_test("path escape is fatal", test_agent_path_escape_is_fatal);
  run_test("deadline bounds tool commands", test_agent_deadline_bounds_tool_commands);
  run_test("retry backoff bound", test_agent_retry_backoff_bound);

  std::cout << "\n[Datasets]\n";
  run_test("dataset parsers", test_dataset_parsers);
  run_test("dataset cache bit-identical", test_dataset_cache_bit_identical);

  std::cout << "\n[Scoring]\n";
  run_test("pass@k", test_pass_at_k);
  run_test("efficiency ordering", test_efficiency_ordering);
  run_test("baseline comparison", test_baseline_comparison);

  std::cout << "\n[Configuration]\n";
  run_test("config precedence", test_config_precedence);
  run_test("config validation", test_config_validation);

  std::cout << "\n[Evaluator]\n";
  run_test("task failures stay task-scoped", test_evaluator_isolates_task_failures);
  run_test("grading outcomes", test_evaluator_grading_outcomes);
  run_test("solution from code block", test_evaluator_solution_from_code_block);
  run_test("run-scoped errors", test_evaluator_run_scoped_errors);

  std::cout << "\n" << g_tests_passed << "/" << g_tests_run << " tests passed\n";
  return 0;
}
