#include "arbiter/config.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <set>

#include "arbiter/dataset.hpp"
#include "arbiter/fsutil.hpp"

namespace arbiter {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

namespace {

constexpr std::uint64_t kMinMemoryBytes = 4ull << 20;

Value str(const std::string& s) { return Value{s}; }

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::optional<std::uint64_t> parse_u64(const std::string& text) {
  if (text.empty()) return std::nullopt;
  std::uint64_t v = 0;
  for (char c : text) {
    if (c < '0' || c > '9') return std::nullopt;
    const std::uint64_t d = static_cast<std::uint64_t>(c - '0');
    if (v > (std::numeric_limits<std::uint64_t>::max() - d) / 10) return std::nullopt;
    v = v * 10 + d;
  }
  return v;
}

std::optional<double> parse_number(const std::string& text) {
  if (text.empty()) return std::nullopt;
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0' || !std::isfinite(v)) return std::nullopt;
  return v;
}

std::optional<bool> parse_flag(const std::string& text) {
  const std::string t = lower(text);
  if (t == "1" || t == "true" || t == "yes" || t == "on") return true;
  if (t == "0" || t == "false" || t == "no" || t == "off" || t.empty()) return false;
  return std::nullopt;
}

// Split on whitespace. The runner argv has no quoting rules.
std::vector<std::string> split_words(const std::string& text) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!cur.empty()) out.push_back(std::move(cur));
      cur.clear();
    } else {
      cur += c;
    }
  }
  if (!cur.empty()) out.push_back(std::move(cur));
  return out;
}

// Typed setters shared by env and CLI handling. `source` names the variable
// or flag in error messages.
void set_u64(std::uint64_t& out, const std::string& value, const std::string& source) {
  const auto v = parse_u64(value);
  if (!v) throw ConfigError(source + " expects a non-negative integer, got \"" + value + "\"");
  out = *v;
}

void set_u32(std::uint32_t& out, const std::string& value, const std::string& source) {
  std::uint64_t v = 0;
  set_u64(v, value, source);
  if (v > std::numeric_limits<std::uint32_t>::max()) throw ConfigError(source + " is out of range");
  out = static_cast<std::uint32_t>(v);
}

void set_double(double& out, const std::string& value, const std::string& source) {
  const auto v = parse_number(value);
  if (!v) throw ConfigError(source + " expects a number, got \"" + value + "\"");
  out = *v;
}

void set_bool(bool& out, const std::string& value, const std::string& source) {
  const auto v = parse_flag(value);
  if (!v) throw ConfigError(source + " expects a boolean, got \"" + value + "\"");
  out = *v;
}

void set_memory(std::uint64_t& out, const std::string& value, const std::string& source) {
  const auto v = parse_memory_size(value);
  if (!v) throw ConfigError(source + " expects a size like 4g or 512m, got \"" + value + "\"");
  out = *v;
}

void set_pass_k(std::vector<std::uint32_t>& out, const std::string& value, const std::string& source) {
  std::vector<std::uint32_t> ks;
  std::string item;
  auto flush = [&] {
    if (item.empty()) return;
    std::uint32_t k = 0;
    set_u32(k, item, source);
    ks.push_back(k);
    item.clear();
  };
  for (char c : value) {
    if (c == ',') {
      flush();
    } else if (!std::isspace(static_cast<unsigned char>(c))) {
      item += c;
    }
  }
  flush();
  if (ks.empty()) throw ConfigError(source + " expects a comma-separated list of k values");
  out = std::move(ks);
}

// JSON readers. A present key with the wrong type is an error; absent keys
// leave the field alone.
class JsonOverlay {
 public:
  JsonOverlay(const Object& obj, std::string prefix, std::vector<std::string>* warnings)
      : obj_(obj), prefix_(std::move(prefix)), warnings_(warnings) {}

  const Value* find(const std::string& key) {
    seen_.insert(key);
    auto it = obj_.find(key);
    return it == obj_.end() ? nullptr : &it->second;
  }

  void str_field(const std::string& key, std::string& out) {
    if (const Value* v = find(key)) {
      if (!jsonlite::is_string(*v)) type_error(key, "a string");
      out = std::get<std::string>(v->v);
    }
  }

  void bool_field(const std::string& key, bool& out) {
    if (const Value* v = find(key)) {
      if (!std::holds_alternative<bool>(v->v)) type_error(key, "a boolean");
      out = std::get<bool>(v->v);
    }
  }

  void u64_field(const std::string& key, std::uint64_t& out) {
    if (const Value* v = find(key)) {
      if (!std::holds_alternative<std::uint64_t>(v->v)) type_error(key, "a non-negative integer");
      out = std::get<std::uint64_t>(v->v);
    }
  }

  void u32_field(const std::string& key, std::uint32_t& out) {
    std::uint64_t v = out;
    u64_field(key, v);
    if (v > std::numeric_limits<std::uint32_t>::max()) type_error(key, "a 32-bit integer");
    out = static_cast<std::uint32_t>(v);
  }

  void double_field(const std::string& key, double& out) {
    if (const Value* v = find(key)) {
      if (std::holds_alternative<double>(v->v)) {
        out = std::get<double>(v->v);
      } else if (std::holds_alternative<std::uint64_t>(v->v)) {
        out = static_cast<double>(std::get<std::uint64_t>(v->v));
      } else {
        type_error(key, "a number");
      }
    }
  }

  void memory_field(const std::string& key, std::uint64_t& out) {
    if (const Value* v = find(key)) {
      if (std::holds_alternative<std::uint64_t>(v->v)) {
        out = std::get<std::uint64_t>(v->v);
      } else if (jsonlite::is_string(*v)) {
        const auto bytes = parse_memory_size(std::get<std::string>(v->v));
        if (!bytes) type_error(key, "a size like \"4g\"");
        out = *bytes;
      } else {
        type_error(key, "a byte count or size string");
      }
    }
  }

  void string_array_field(const std::string& key, std::vector<std::string>& out) {
    if (const Value* v = find(key)) {
      if (!jsonlite::is_array(*v)) type_error(key, "an array of strings");
      std::vector<std::string> items;
      for (const auto& item : std::get<Array>(v->v)) {
        if (!jsonlite::is_string(item)) type_error(key, "an array of strings");
        items.push_back(std::get<std::string>(item.v));
      }
      out = std::move(items);
    }
  }

  void k_array_field(const std::string& key, std::vector<std::uint32_t>& out) {
    if (const Value* v = find(key)) {
      if (!jsonlite::is_array(*v)) type_error(key, "an array of integers");
      std::vector<std::uint32_t> items;
      for (const auto& item : std::get<Array>(v->v)) {
        if (!std::holds_alternative<std::uint64_t>(item.v) ||
            std::get<std::uint64_t>(item.v) > std::numeric_limits<std::uint32_t>::max()) {
          type_error(key, "an array of integers");
        }
        items.push_back(static_cast<std::uint32_t>(std::get<std::uint64_t>(item.v)));
      }
      out = std::move(items);
    }
  }

  const Object* object_field(const std::string& key) {
    if (const Value* v = find(key)) {
      if (!jsonlite::is_object(*v)) type_error(key, "an object");
      return &std::get<Object>(v->v);
    }
    return nullptr;
  }

  void report_unknown() const {
    if (!warnings_) return;
    for (const auto& [key, _] : obj_) {
      if (seen_.count(key) == 0) warnings_->push_back("unknown config key: " + prefix_ + key);
    }
  }

 private:
  [[noreturn]] void type_error(const std::string& key, const char* expected) const {
    throw ConfigError("config key " + prefix_ + key + " must be " + expected);
  }

  const Object& obj_;
  std::string prefix_;
  std::vector<std::string>* warnings_;
  std::set<std::string> seen_;
};

}  // namespace

std::optional<std::uint64_t> parse_memory_size(const std::string& text) {
  std::string t = lower(text);
  while (!t.empty() && std::isspace(static_cast<unsigned char>(t.back()))) t.pop_back();
  size_t digits = 0;
  while (digits < t.size() && t[digits] >= '0' && t[digits] <= '9') ++digits;
  const auto number = parse_u64(t.substr(0, digits));
  if (!number) return std::nullopt;

  std::string suffix = t.substr(digits);
  if (suffix.size() > 1 && suffix.back() == 'b') suffix.pop_back();
  if (suffix.size() > 1 && suffix.back() == 'i') suffix.pop_back();
  unsigned shift = 0;
  if (suffix.empty() || suffix == "b") {
    shift = 0;
  } else if (suffix == "k") {
    shift = 10;
  } else if (suffix == "m") {
    shift = 20;
  } else if (suffix == "g") {
    shift = 30;
  } else if (suffix == "t") {
    shift = 40;
  } else {
    return std::nullopt;
  }
  if (shift > 0 && *number > (std::numeric_limits<std::uint64_t>::max() >> shift)) return std::nullopt;
  return *number << shift;
}

void apply_config_json(EvaluatorConfig& cfg, const Object& doc, std::vector<std::string>* warnings) {
  JsonOverlay top(doc, "", warnings);
  top.str_field("dataset", cfg.dataset);
  top.str_field("dataset_version", cfg.dataset_version);
  top.str_field("dataset_path", cfg.dataset_path);
  top.str_field("cache_dir", cfg.cache_dir);
  top.u64_field("max_tasks", cfg.max_tasks);
  top.u32_field("samples_per_task", cfg.samples_per_task);
  top.k_array_field("pass_k", cfg.pass_k);
  top.double_field("command_timeout_s", cfg.command_timeout_s);
  top.double_field("task_timeout_s", cfg.task_timeout_s);
  top.double_field("grading_timeout_s", cfg.grading_timeout_s);
  top.double_field("cpu_limit", cfg.cpu_limit);
  top.memory_field("memory_limit", cfg.memory_limit_bytes);
  top.u32_field("concurrency", cfg.concurrency);
  top.bool_field("network_enabled", cfg.network_enabled);
  top.str_field("output_dir", cfg.output_dir);
  top.str_field("workspace_root", cfg.workspace_root);
  top.str_field("engine", cfg.engine);
  top.str_field("base_image", cfg.base_image);
  top.str_field("baselines_path", cfg.baselines_path);
  top.str_field("event_log", cfg.event_log);
  top.bool_field("verbose", cfg.verbose);
  top.bool_field("keep_workspaces", cfg.keep_workspaces);
  top.str_field("grade_command", cfg.grade_command);
  top.u64_field("max_output_bytes", cfg.max_output_bytes);

  if (const Object* m = top.object_field("model")) {
    JsonOverlay model(*m, "model.", warnings);
    model.str_field("protocol", cfg.model.protocol);
    model.str_field("url", cfg.model.url);
    model.str_field("name", cfg.model.name);
    model.str_field("api_key_env", cfg.model.api_key_env);
    model.double_field("temperature", cfg.model.temperature);
    model.u32_field("max_tokens", cfg.model.max_tokens);
    model.double_field("timeout_s", cfg.model.timeout_s);
    model.string_array_field("runner_argv", cfg.model.runner_argv);
    model.report_unknown();
  }
  if (const Object* a = top.object_field("agent")) {
    JsonOverlay agent(*a, "agent.", warnings);
    agent.u32_field("max_iterations", cfg.agent.max_iterations);
    agent.u32_field("model_retries", cfg.agent.model_retries);
    agent.u64_field("retry_backoff_ms", cfg.agent.retry_backoff_ms);
    agent.report_unknown();
  }
  if (const Object* e = top.object_field("efficiency")) {
    JsonOverlay eff(*e, "efficiency.", warnings);
    eff.double_field("correctness_weight", cfg.efficiency.correctness_weight);
    eff.double_field("time_weight", cfg.efficiency.time_weight);
    eff.double_field("commands_weight", cfg.efficiency.commands_weight);
    eff.double_field("tokens_weight", cfg.efficiency.tokens_weight);
    eff.double_field("time_scale_seconds", cfg.efficiency.time_scale_seconds);
    eff.double_field("commands_scale", cfg.efficiency.commands_scale);
    eff.double_field("tokens_scale", cfg.efficiency.tokens_scale);
    eff.report_unknown();
  }
  top.report_unknown();
}

void load_config_file(const std::string& path, EvaluatorConfig& cfg, std::vector<std::string>* warnings) {
  const auto text = read_file_bytes(path);
  if (!text) throw ConfigError("cannot read config file " + path);
  std::optional<jsonlite::JsonError> err;
  const Object doc = jsonlite::parse(*text, &err);
  if (err) throw ConfigError("config file " + path + ": " + err->message);
  apply_config_json(cfg, doc, warnings);
}

void apply_env(EvaluatorConfig& cfg, const EnvLookup& env) {
  auto get = [&](const char* name) -> std::optional<std::string> {
    const char* v = env(name);
    if (!v || !v[0]) return std::nullopt;
    return std::string(v);
  };
  if (auto v = get("ARBITER_DATASET")) cfg.dataset = *v;
  if (auto v = get("ARBITER_DATASET_VERSION")) cfg.dataset_version = *v;
  if (auto v = get("ARBITER_DATASET_PATH")) cfg.dataset_path = *v;
  if (auto v = get("ARBITER_CACHE_DIR")) cfg.cache_dir = *v;
  if (auto v = get("ARBITER_MAX_TASKS")) set_u64(cfg.max_tasks, *v, "ARBITER_MAX_TASKS");
  if (auto v = get("ARBITER_SAMPLES")) set_u32(cfg.samples_per_task, *v, "ARBITER_SAMPLES");
  if (auto v = get("ARBITER_COMMAND_TIMEOUT")) set_double(cfg.command_timeout_s, *v, "ARBITER_COMMAND_TIMEOUT");
  if (auto v = get("ARBITER_TASK_TIMEOUT")) set_double(cfg.task_timeout_s, *v, "ARBITER_TASK_TIMEOUT");
  if (auto v = get("ARBITER_GRADING_TIMEOUT")) set_double(cfg.grading_timeout_s, *v, "ARBITER_GRADING_TIMEOUT");
  if (auto v = get("ARBITER_SANDBOX_CPU")) set_double(cfg.cpu_limit, *v, "ARBITER_SANDBOX_CPU");
  if (auto v = get("ARBITER_SANDBOX_MEMORY")) set_memory(cfg.memory_limit_bytes, *v, "ARBITER_SANDBOX_MEMORY");
  if (auto v = get("ARBITER_CONCURRENCY")) set_u32(cfg.concurrency, *v, "ARBITER_CONCURRENCY");
  if (auto v = get("ARBITER_ENABLE_NETWORK")) set_bool(cfg.network_enabled, *v, "ARBITER_ENABLE_NETWORK");
  if (auto v = get("ARBITER_OUTPUT_DIR")) cfg.output_dir = *v;
  if (auto v = get("ARBITER_WORKSPACE_ROOT")) cfg.workspace_root = *v;
  if (auto v = get("ARBITER_ENGINE")) cfg.engine = *v;
  if (auto v = get("ARBITER_SANDBOX_IMAGE")) cfg.base_image = *v;
  if (auto v = get("ARBITER_LLM_URL")) cfg.model.url = *v;
  if (auto v = get("ARBITER_MODEL_NAME")) cfg.model.name = *v;
  if (auto v = get("ARBITER_MAX_ITERATIONS")) set_u32(cfg.agent.max_iterations, *v, "ARBITER_MAX_ITERATIONS");
  if (auto v = get("ARBITER_EVENT_LOG")) cfg.event_log = *v;
}

std::vector<std::string> apply_cli_flags(EvaluatorConfig& cfg, const std::vector<std::string>& args) {
  std::vector<std::string> positional;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& flag = args[i];
    if (flag.rfind("--", 0) != 0) {
      positional.push_back(flag);
      continue;
    }
    if (flag == "--enable-network") {
      cfg.network_enabled = true;
      continue;
    }
    if (flag == "--verbose") {
      cfg.verbose = true;
      continue;
    }
    if (flag == "--keep-workspaces") {
      cfg.keep_workspaces = true;
      continue;
    }
    if (i + 1 >= args.size()) throw ConfigError(flag + " requires a value");
    const std::string& value = args[++i];

    if (flag == "--config") {
      // Consumed by resolve_config().
    } else if (flag == "--dataset") {
      cfg.dataset = value;
    } else if (flag == "--dataset-version") {
      cfg.dataset_version = value;
    } else if (flag == "--dataset-path") {
      cfg.dataset_path = value;
    } else if (flag == "--cache-dir") {
      cfg.cache_dir = value;
    } else if (flag == "--max-tasks") {
      set_u64(cfg.max_tasks, value, flag);
    } else if (flag == "--samples") {
      set_u32(cfg.samples_per_task, value, flag);
    } else if (flag == "--pass-k") {
      set_pass_k(cfg.pass_k, value, flag);
    } else if (flag == "--command-timeout") {
      set_double(cfg.command_timeout_s, value, flag);
    } else if (flag == "--task-timeout") {
      set_double(cfg.task_timeout_s, value, flag);
    } else if (flag == "--grading-timeout") {
      set_double(cfg.grading_timeout_s, value, flag);
    } else if (flag == "--cpu") {
      set_double(cfg.cpu_limit, value, flag);
    } else if (flag == "--memory") {
      set_memory(cfg.memory_limit_bytes, value, flag);
    } else if (flag == "--concurrency") {
      set_u32(cfg.concurrency, value, flag);
    } else if (flag == "--output-dir") {
      cfg.output_dir = value;
    } else if (flag == "--workspace-root") {
      cfg.workspace_root = value;
    } else if (flag == "--engine") {
      cfg.engine = value;
    } else if (flag == "--image") {
      cfg.base_image = value;
    } else if (flag == "--protocol") {
      cfg.model.protocol = value;
    } else if (flag == "--llm-url") {
      cfg.model.url = value;
    } else if (flag == "--model-name") {
      cfg.model.name = value;
    } else if (flag == "--runner") {
      cfg.model.runner_argv = split_words(value);
    } else if (flag == "--max-iterations") {
      set_u32(cfg.agent.max_iterations, value, flag);
    } else if (flag == "--baselines") {
      cfg.baselines_path = value;
    } else if (flag == "--event-log") {
      cfg.event_log = value;
    } else if (flag == "--grade-command") {
      cfg.grade_command = value;
    } else {
      throw ConfigError("unknown flag " + flag);
    }
  }
  return positional;
}

EvaluatorConfig resolve_config(const std::vector<std::string>& args, const EnvLookup& env,
                               std::vector<std::string>* warnings,
                               std::vector<std::string>* positional) {
  EvaluatorConfig cfg;
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == "--config") {
      load_config_file(args[i + 1], cfg, warnings);
      break;
    }
  }
  apply_env(cfg, env);
  auto rest = apply_cli_flags(cfg, args);
  if (positional) *positional = std::move(rest);
  return cfg;
}

ConfigValidationResult validate_config(const EvaluatorConfig& cfg) {
  ConfigValidationResult r;
  auto error = [&](const std::string& m) { r.errors.push_back(m); };
  auto warning = [&](const std::string& m) { r.warnings.push_back(m); };

  if (cfg.dataset_path.empty() && !find_dataset(cfg.dataset)) {
    error("unknown dataset \"" + cfg.dataset + "\" (humaneval | mbpp)");
  }
  if (!(cfg.command_timeout_s > 0.0)) error("command_timeout_s must be > 0");
  if (!(cfg.task_timeout_s > 0.0)) error("task_timeout_s must be > 0");
  if (!(cfg.grading_timeout_s > 0.0)) error("grading_timeout_s must be > 0");
  if (!(cfg.model.timeout_s > 0.0)) error("model.timeout_s must be > 0");
  if (!(cfg.cpu_limit > 0.0)) error("cpu_limit must be > 0");
  if (cfg.memory_limit_bytes < kMinMemoryBytes) error("memory_limit must be at least 4 MiB");
  if (cfg.concurrency == 0) error("concurrency must be >= 1");
  if (cfg.samples_per_task == 0) error("samples_per_task must be >= 1");
  if (cfg.pass_k.empty()) error("pass_k must name at least one k");
  for (const auto k : cfg.pass_k) {
    if (k < 1) error("pass_k values must be >= 1");
  }
  if (cfg.agent.max_iterations == 0) error("agent.max_iterations must be >= 1");
  if (cfg.engine != "docker" && cfg.engine != "process") {
    error("unknown engine \"" + cfg.engine + "\" (docker | process)");
  }
  if (cfg.model.protocol != "http" && cfg.model.protocol != "subprocess") {
    error("unknown model.protocol \"" + cfg.model.protocol + "\" (http | subprocess)");
  }
  if (cfg.model.protocol == "subprocess" && cfg.model.runner_argv.empty()) {
    error("model.runner_argv is required for the subprocess protocol");
  }
  if (cfg.model.protocol == "http" && cfg.model.url.empty()) error("model.url must not be empty");
  if (cfg.model.temperature < 0.0 || cfg.model.temperature > 2.0) {
    error("model.temperature must be in [0, 2]");
  }
  for (const auto& m : validate_weights(cfg.efficiency)) error(m);
  if (cfg.output_dir.empty()) error("output_dir must not be empty");
  if (cfg.workspace_root.empty()) error("workspace_root must not be empty");
  if (cfg.grade_command.find("{file}") == std::string::npos) {
    error("grade_command must contain the {file} placeholder");
  }
  if (cfg.max_output_bytes == 0) error("max_output_bytes must be > 0");

  for (const auto k : cfg.pass_k) {
    if (k > cfg.samples_per_task) {
      warning("pass@" + std::to_string(k) + " needs at least " + std::to_string(k) +
              " samples per task and will be omitted");
    }
  }
  if (cfg.engine == "process") {
    warning("the process engine runs agent commands on the host without isolation");
  }
  if (cfg.network_enabled) warning("sandbox network access is enabled");
  if (cfg.grading_timeout_s > cfg.task_timeout_s) {
    warning("grading_timeout_s exceeds task_timeout_s; grading is capped by the task budget");
  }
  r.ok = r.errors.empty();
  return r;
}

Object config_to_object(const EvaluatorConfig& cfg) {
  Array ks;
  for (const auto k : cfg.pass_k) ks.push_back(Value{static_cast<std::uint64_t>(k)});
  Array runner;
  for (const auto& a : cfg.model.runner_argv) runner.push_back(str(a));

  Object model{{"protocol", str(cfg.model.protocol)},
               {"url", str(cfg.model.url)},
               {"name", str(cfg.model.name)},
               {"api_key_env", str(cfg.model.api_key_env)},
               {"temperature", Value{cfg.model.temperature}},
               {"max_tokens", Value{static_cast<std::uint64_t>(cfg.model.max_tokens)}},
               {"timeout_s", Value{cfg.model.timeout_s}},
               {"runner_argv", Value{std::move(runner)}}};
  Object agent{{"max_iterations", Value{static_cast<std::uint64_t>(cfg.agent.max_iterations)}},
               {"model_retries", Value{static_cast<std::uint64_t>(cfg.agent.model_retries)}},
               {"retry_backoff_ms", Value{cfg.agent.retry_backoff_ms}}};

  return Object{{"dataset", str(cfg.dataset)},
                {"dataset_version", str(cfg.dataset_version)},
                {"dataset_path", str(cfg.dataset_path)},
                {"cache_dir", str(cfg.cache_dir)},
                {"max_tasks", Value{cfg.max_tasks}},
                {"samples_per_task", Value{static_cast<std::uint64_t>(cfg.samples_per_task)}},
                {"pass_k", Value{std::move(ks)}},
                {"command_timeout_s", Value{cfg.command_timeout_s}},
                {"task_timeout_s", Value{cfg.task_timeout_s}},
                {"grading_timeout_s", Value{cfg.grading_timeout_s}},
                {"cpu_limit", Value{cfg.cpu_limit}},
                {"memory_limit", Value{cfg.memory_limit_bytes}},
                {"concurrency", Value{static_cast<std::uint64_t>(cfg.concurrency)}},
                {"network_enabled", Value{cfg.network_enabled}},
                {"output_dir", str(cfg.output_dir)},
                {"workspace_root", str(cfg.workspace_root)},
                {"engine", str(cfg.engine)},
                {"base_image", str(cfg.base_image)},
                {"model", Value{std::move(model)}},
                {"agent", Value{std::move(agent)}},
                {"efficiency", Value{cfg.efficiency.to_object()}},
                {"baselines_path", str(cfg.baselines_path)},
                {"event_log", str(cfg.event_log)},
                {"verbose", Value{cfg.verbose}},
                {"keep_workspaces", Value{cfg.keep_workspaces}},
                {"grade_command", str(cfg.grade_command)},
                {"max_output_bytes", Value{cfg.max_output_bytes}}};
}

EnvLookup process_env() {
  return [](const char* name) -> const char* { return std::getenv(name); };
}

}  // namespace arbiter
