#include "arbiter/evaluator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <mutex>
#include <thread>

#include "arbiter/fsutil.hpp"
#include "arbiter/sandbox.hpp"
#include "arbiter/version.hpp"

namespace fs = std::filesystem;

namespace arbiter {

using jsonlite::Object;
using jsonlite::Value;

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kSolutionFile = "solution.py";
constexpr const char* kTestFile = "test_solution.py";
constexpr std::size_t kGradeOutputTail = 2000;

Value str(const std::string& s) { return Value{s}; }
Value u64(std::uint64_t v) { return Value{v}; }

double seconds_since(Clock::time_point start) {
  return std::chrono::duration<double>(Clock::now() - start).count();
}

std::uint64_t remaining_ms(Clock::time_point deadline) {
  const auto now = Clock::now();
  if (now >= deadline) return 0;
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());
}

std::string tail(const std::string& s, std::size_t n) {
  return s.size() <= n ? s : "..." + s.substr(s.size() - n);
}

bool defines_check(const std::string& test_code) {
  return test_code.rfind("def check(", 0) == 0 || test_code.find("\ndef check(") != std::string::npos;
}

}  // namespace

// ---------------------------------------------------------------------------
// Prompt and grading helpers
// ---------------------------------------------------------------------------

std::string build_task_prompt(const Task& task) {
  std::string out = "Task: " + task.prompt;
  if (!task.entry_point.empty()) out += "\n\nFunction signature: " + task.entry_point;
  if (!task.test_code.empty()) {
    out += "\n\nTests that must pass:\n```python\n" + task.test_code + "\n```";
  }
  out += "\n\nPlease implement a solution. Write your code to `solution.py` in the workspace.";
  return out;
}

std::optional<std::string> extract_code_block(const std::string& text) {
  std::optional<std::string> last;
  size_t pos = 0;
  while (true) {
    const size_t open = text.find("```", pos);
    if (open == std::string::npos) break;
    const size_t line_end = text.find('\n', open + 3);
    if (line_end == std::string::npos) break;
    const size_t close = text.find("```", line_end + 1);
    if (close == std::string::npos) break;
    std::string body = text.substr(line_end + 1, close - line_end - 1);
    if (body.find_first_not_of(" \t\r\n") != std::string::npos) last = std::move(body);
    pos = close + 3;
  }
  return last;
}

std::string build_test_program(const std::string& solution, const Task& task) {
  std::string out = solution;
  if (!out.empty() && out.back() != '\n') out += "\n";
  out += "\n\n" + task.test_code;
  if (!out.empty() && out.back() != '\n') out += "\n";
  if (!task.entry_point.empty() && defines_check(task.test_code)) {
    out += "\n\ncheck(" + task.entry_point + ")\n";
  }
  return out;
}

std::string grade_command_for(const std::string& grade_command, const std::string& file) {
  std::string out;
  const std::string placeholder = "{file}";
  size_t pos = 0;
  while (true) {
    const size_t hit = grade_command.find(placeholder, pos);
    if (hit == std::string::npos) {
      out += grade_command.substr(pos);
      break;
    }
    out += grade_command.substr(pos, hit - pos) + file;
    pos = hit + placeholder.size();
  }
  return out;
}

std::shared_ptr<ModelClient> make_model_client(const ModelConfig& config) {
  if (config.protocol == "subprocess") {
    return std::make_shared<SubprocessModelClient>(config.runner_argv, config.name);
  }
  if (config.protocol == "http") {
    HttpModelOptions options;
    options.url = config.url;
    options.model = config.name;
    options.api_key_env = config.api_key_env;
    return std::make_shared<HttpModelClient>(std::move(options));
  }
  throw ConfigError("unknown model protocol: " + config.protocol);
}

// ---------------------------------------------------------------------------
// BenchmarkEvaluator
// ---------------------------------------------------------------------------

BenchmarkEvaluator::BenchmarkEvaluator(EvaluatorConfig config, std::shared_ptr<ContainerEngine> engine,
                                       std::shared_ptr<ModelClient> model, RunContext& run)
    : config_(std::move(config)), engine_(std::move(engine)), model_(std::move(model)), run_(run) {
  const auto validation = validate_config(config_);
  if (!validation.ok) {
    std::string message = "invalid configuration:";
    for (const auto& e : validation.errors) message += " " + e + ";";
    message.pop_back();
    throw ConfigError(message);
  }
  if (!engine_) throw ConfigError("evaluator requires a container engine");
  if (!model_) throw ConfigError("evaluator requires a model client");
  baselines_ = config_.baselines_path.empty() ? builtin_baselines() : load_baselines(config_.baselines_path);
}

std::string BenchmarkEvaluator::report_path() const {
  return (fs::path(config_.output_dir) / "evaluation_report.json").string();
}

std::string BenchmarkEvaluator::sandbox_name(const Task& task, std::uint32_t sample) const {
  return "arbiter-" + run_.run_id + "-" + sanitize_name(task.id) + "-s" + std::to_string(sample);
}

void BenchmarkEvaluator::require_engine() {
  std::string why;
  if (!engine_->ping(&why)) {
    throw EngineUnavailableError(engine_->engine_id() + " engine unreachable: " + why);
  }
}

EvaluationReport BenchmarkEvaluator::evaluate(DatasetLoader& loader) {
  require_engine();
  Dataset ds;
  if (!config_.dataset_path.empty()) {
    const auto format = parse_dataset_format(config_.dataset);
    if (!format) throw ConfigError("dataset_path needs dataset set to humaneval or mbpp");
    ds = loader.load_file(config_.dataset_path, *format, config_.max_tasks);
  } else {
    ds = loader.load(config_.dataset, config_.dataset_version, config_.max_tasks);
  }
  for (const auto& w : ds.warnings) {
    run_.events.emit("dataset_warning", {{"dataset", str(ds.name)}, {"warning", str(w)}});
  }
  return evaluate_tasks(ds.tasks, ds.name, ds.version);
}

AttemptResult BenchmarkEvaluator::evaluate_attempt(const Task& task, std::uint32_t sample) {
  const auto started = Clock::now();
  const auto deadline =
      started + std::chrono::milliseconds(static_cast<std::uint64_t>(config_.task_timeout_s * 1000.0));

  AttemptResult attempt;
  attempt.sample_index = sample;
  attempt.sandbox_name = sandbox_name(task, sample);
  attempt.agent_state = to_string(AgentState::idle);

  auto note = [&](const Error& e) {
    attempt.error_code = to_string(e.code());
    attempt.error = e.describe();
  };
  auto fail = [&](const Error& e) {
    note(e);
    run_.stats.record_failure(e.code());
  };

  SandboxOptions options;
  options.name = attempt.sandbox_name;
  options.task_id = task.id;
  options.snapshot_label = attempt.sandbox_name;
  options.base_image = config_.base_image;
  options.workspace_dir =
      (fs::path(config_.workspace_root) / run_.run_id / attempt.sandbox_name).string();
  options.cpu_limit = config_.cpu_limit;
  options.memory_limit_bytes = config_.memory_limit_bytes;
  options.network_enabled = config_.network_enabled;
  options.default_command_timeout_ms = static_cast<std::uint64_t>(config_.command_timeout_s * 1000.0);
  // No single command may outlive the task.
  options.max_command_timeout_ms = static_cast<std::uint64_t>(config_.task_timeout_s * 1000.0);
  options.max_output_bytes = static_cast<std::size_t>(config_.max_output_bytes);
  options.keep_workspace = config_.keep_workspaces;

  std::unique_ptr<Sandbox> sandbox;
  try {
    sandbox = Sandbox::create(engine_, std::move(options), run_);
  } catch (const ProvisioningError& e) {
    // Sandbox::create already counted it.
    note(e);
  } catch (const Error& e) {
    fail(e);
  } catch (const std::exception& e) {
    fail(Error(ErrorCode::internal_error, e.what()));
  }

  jsonlite::Array transcript;
  if (sandbox) {
    try {
      AgentLimits limits;
      limits.max_iterations = config_.agent.max_iterations;
      limits.max_duration_ms = remaining_ms(deadline);
      limits.model_retries = config_.agent.model_retries;
      limits.retry_backoff_ms = config_.agent.retry_backoff_ms;
      limits.model_timeout_ms = static_cast<std::uint64_t>(config_.model.timeout_s * 1000.0);
      limits.temperature = config_.model.temperature;
      limits.max_tokens = config_.model.max_tokens;

      CodingAgent agent(model_, limits, run_);
      if (agent_sleep_) agent.set_sleep(agent_sleep_);
      agent.set_workspace(*sandbox);
      AgentRunResult run = agent.send_coding_task(build_task_prompt(task));
      attempt.agent_iterations = run.iterations;
      attempt.agent_state = to_string(run.state);
      attempt.tokens_used = run.tokens_used;
      transcript = std::move(run.transcript);

      if (run.state == AgentState::failed) {
        // The agent already recorded the failure category.
        attempt.error_code = run.error_code;
        attempt.error = run.error;
      } else {
        std::optional<std::string> solution;
        try {
          solution = sandbox->read_file(kSolutionFile);
        } catch (const PathEscapeError&) {
          throw;
        } catch (const Error&) {
          solution = extract_code_block(run.final_text);
          if (solution) sandbox->write_file(kSolutionFile, *solution);
        }
        if (!solution) {
          throw Error(ErrorCode::solution_missing,
                      std::string("no ") + kSolutionFile + " in the workspace and no code block in the answer");
        }

        const std::uint64_t left = remaining_ms(deadline);
        if (left == 0) throw Error(ErrorCode::agent_timeout, "task time exhausted before grading");
        const double grading_s =
            std::min(config_.grading_timeout_s, static_cast<double>(left) / 1000.0);

        sandbox->write_file(kTestFile, build_test_program(*solution, task));
        const CommandLog log =
            sandbox->execute_command(grade_command_for(config_.grade_command, kTestFile), grading_s);
        if (log.timed_out) {
          throw GradingTimeoutError("tests did not finish within " + jsonlite::format_double(grading_s) + " s");
        }
        require_success(log);
        attempt.success = true;
        attempt.passed_tests = log.exit_code == 0;
        if (!attempt.passed_tests) {
          const std::string output = log.stderr_text.empty() ? log.stdout_text : log.stderr_text;
          attempt.error_code = to_string(ErrorCode::tests_failed);
          attempt.error = attempt.error_code + ": exit " + std::to_string(log.exit_code) + ": " +
                          tail(output, kGradeOutputTail);
          run_.stats.record_failure(ErrorCode::tests_failed);
        }
      }
    } catch (const Error& e) {
      fail(e);
    } catch (const std::exception& e) {
      fail(Error(ErrorCode::internal_error, e.what()));
    }

    sandbox->mark_result(attempt.passed_tests, attempt.error);
    const fs::path snapshots = fs::path(config_.output_dir) / "snapshots" / sanitize_name(task.id);
    try {
      attempt.snapshot_dir = sandbox->save_metadata(snapshots.string());
      const std::string transcript_path = (fs::path(attempt.snapshot_dir) / "transcript.json").string();
      if (atomic_write(transcript_path, jsonlite::to_json_pretty(Value{std::move(transcript)}))) {
        attempt.agent_transcript_ref = transcript_path;
      } else {
        run_.events.emit("transcript_write_failed", {{"sandbox", str(attempt.sandbox_name)},
                                                     {"path", str(transcript_path)}});
      }
    } catch (const Error& e) {
      run_.events.emit("snapshot_failed", {{"sandbox", str(attempt.sandbox_name)},
                                           {"error", str(e.describe())}});
    }
    sandbox->cleanup(true);
    for (const auto& err : sandbox->cleanup_errors()) {
      run_.events.emit("cleanup_error", {{"sandbox", str(attempt.sandbox_name)}, {"error", str(err)}});
    }
    attempt.sandbox_metrics = sandbox->metrics();
  }

  attempt.execution_time_seconds = seconds_since(started);
  run_.stats.attempt_latency.record(
      static_cast<std::uint64_t>(attempt.execution_time_seconds * 1e9));
  if (attempt.passed_tests) {
    run_.stats.attempts_passed.fetch_add(1, std::memory_order_relaxed);
  } else {
    run_.stats.attempts_failed.fetch_add(1, std::memory_order_relaxed);
  }
  run_.events.emit("attempt_finished", {{"task_id", str(task.id)},
                                        {"sample", u64(sample)},
                                        {"sandbox", str(attempt.sandbox_name)},
                                        {"passed", Value{attempt.passed_tests}},
                                        {"agent_state", str(attempt.agent_state)},
                                        {"iterations", u64(attempt.agent_iterations)},
                                        {"error_code", str(attempt.error_code)},
                                        {"duration_s", Value{attempt.execution_time_seconds}}});
  return attempt;
}

TaskResult BenchmarkEvaluator::assemble_task_result(const Task& task,
                                                    std::vector<AttemptResult> attempts) const {
  TaskResult r;
  r.task_id = task.id;
  r.num_samples = static_cast<std::uint32_t>(attempts.size());
  for (const auto& a : attempts) {
    if (a.passed_tests) ++r.num_correct;
    r.tokens_used += a.tokens_used;
  }
  if (!attempts.empty()) {
    auto rep = std::find_if(attempts.begin(), attempts.end(),
                            [](const AttemptResult& a) { return a.passed_tests; });
    if (rep == attempts.end()) rep = attempts.begin();
    r.success = rep->success;
    r.passed_tests = rep->passed_tests;
    r.execution_time_seconds = rep->execution_time_seconds;
    r.agent_iterations = rep->agent_iterations;
    r.sandbox_metrics = rep->sandbox_metrics;
    r.agent_transcript_ref = rep->agent_transcript_ref;
    if (!rep->error.empty()) r.error = rep->error;
  }
  r.attempts = std::move(attempts);
  return r;
}

void BenchmarkEvaluator::write_task_result(const TaskResult& result) {
  const std::string path =
      (fs::path(config_.output_dir) / (sanitize_name(result.task_id) + "_result.json")).string();
  if (!atomic_write(path, jsonlite::to_json_pretty(task_result_to_value(result)))) {
    run_.events.emit("result_write_failed", {{"task_id", str(result.task_id)}, {"path", str(path)}});
  }
  run_.events.emit("task_finished", {{"task_id", str(result.task_id)},
                                     {"passed", Value{result.passed_tests}},
                                     {"num_correct", u64(result.num_correct)},
                                     {"num_samples", u64(result.num_samples)}});
}

EvaluationReport BenchmarkEvaluator::evaluate_tasks(const std::vector<Task>& tasks,
                                                    const std::string& dataset_name,
                                                    const std::string& dataset_version) {
  require_engine();
  std::error_code ec;
  fs::create_directories(config_.output_dir, ec);
  if (ec) throw Error(ErrorCode::io_error, "cannot create " + config_.output_dir + ": " + ec.message());

  const auto run_started = Clock::now();
  const std::uint32_t samples = config_.samples_per_task;
  const std::size_t total = tasks.size() * samples;
  run_.events.emit("run_started", {{"dataset", str(dataset_name)},
                                   {"dataset_version", str(dataset_version)},
                                   {"model", str(model_->model_name())},
                                   {"engine", str(engine_->engine_id())},
                                   {"tasks", u64(tasks.size())},
                                   {"samples_per_task", u64(samples)},
                                   {"concurrency", u64(config_.concurrency)}});

  std::vector<AttemptResult> slots(total);
  std::vector<TaskResult> results(tasks.size());
  std::vector<std::uint32_t> outstanding(tasks.size(), samples);
  std::mutex outstanding_mu;
  std::atomic<std::size_t> cursor{0};

  auto worker = [&]() {
    while (true) {
      const std::size_t idx = cursor.fetch_add(1, std::memory_order_relaxed);
      if (idx >= total) return;
      const std::size_t t = idx / samples;
      const auto sample = static_cast<std::uint32_t>(idx % samples);
      slots[idx] = evaluate_attempt(tasks[t], sample);

      bool last = false;
      {
        std::lock_guard<std::mutex> lk(outstanding_mu);
        last = --outstanding[t] == 0;
      }
      if (last) {
        // Every sample of task t is in its slot; no other worker touches them.
        std::vector<AttemptResult> attempts(std::make_move_iterator(slots.begin() + t * samples),
                                            std::make_move_iterator(slots.begin() + (t + 1) * samples));
        results[t] = assemble_task_result(tasks[t], std::move(attempts));
        write_task_result(results[t]);
      }
    }
  };

  const std::size_t n_threads = std::min<std::size_t>(config_.concurrency, std::max<std::size_t>(total, 1));
  {
    std::vector<std::thread> threads;
    threads.reserve(n_threads);
    for (std::size_t i = 0; i < n_threads; ++i) threads.emplace_back(worker);
    for (auto& th : threads) th.join();
  }

  EvaluationReport report;
  report.format_version = version::REPORT_FORMAT_VERSION;
  report.run_id = run_.run_id;
  report.dataset_name = dataset_name;
  report.dataset_version = dataset_version;
  report.model_name = model_->model_name();
  report.total_tasks = tasks.size();
  report.samples_per_task = samples;
  for (const auto& r : results) {
    if (r.passed_tests) {
      ++report.passed_tasks;
    } else if (r.success) {
      ++report.failed_tasks;
    } else {
      ++report.errored_tasks;
    }
  }
  report.pass_at_k = aggregate_pass_at_k(results, config_.pass_k, samples);
  report.efficiency_score = efficiency_score(results, config_.efficiency);
  report.efficiency_weights = config_.efficiency.to_object();
  if (!results.empty()) {
    // Time, iterations and commands describe representative attempts;
    // tokens are averaged over every attempt.
    const double n = static_cast<double>(results.size());
    std::uint64_t tokens = 0;
    for (const auto& r : results) {
      report.average_execution_time += r.execution_time_seconds / n;
      report.average_iterations += static_cast<double>(r.agent_iterations) / n;
      report.average_commands += static_cast<double>(r.sandbox_metrics.commands_executed) / n;
      tokens += r.tokens_used;
    }
    report.average_tokens = static_cast<double>(tokens) / static_cast<double>(total);
  }
  report.baseline_comparisons = compare_baselines(baselines_, dataset_name, run_pass_rate(results));
  report.task_results = std::move(results);
  report.generated_at = utc_timestamp_iso8601();
  report.stats = run_.stats.to_object();

  if (!atomic_write(report_path(), report_to_json(report))) {
    throw Error(ErrorCode::io_error, "cannot write " + report_path());
  }
  run_.events.emit("run_finished", {{"tasks", u64(report.total_tasks)},
                                    {"passed", u64(report.passed_tasks)},
                                    {"failed", u64(report.failed_tasks)},
                                    {"errored", u64(report.errored_tasks)},
                                    {"report", str(report_path())},
                                    {"duration_s", Value{seconds_since(run_started)}}});
  return report;
}

}  // namespace arbiter
