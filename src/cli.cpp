#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "arbiter/audit.hpp"
#include "arbiter/config.hpp"
#include "arbiter/container.hpp"
#include "arbiter/dataset.hpp"
#include "arbiter/evaluator.hpp"
#include "arbiter/fsutil.hpp"
#include "arbiter/hash.hpp"
#include "arbiter/jsonlite.hpp"
#include "arbiter/observability.hpp"
#include "arbiter/process.hpp"
#include "arbiter/scoring.hpp"
#include "arbiter/version.hpp"

namespace fs = std::filesystem;

namespace {

using arbiter::jsonlite::Array;
using arbiter::jsonlite::Object;
using arbiter::jsonlite::Value;

Value str(const std::string& s) { return Value{s}; }
Value u64(std::uint64_t v) { return Value{v}; }

Array str_array(const std::vector<std::string>& items) {
  Array out;
  for (const auto& i : items) out.push_back(str(i));
  return out;
}

void print(const Object& o) {
  std::cout << arbiter::jsonlite::to_json(Value{o}) << "\n";
}

int print_error(const arbiter::Error& e) {
  Object err{{"code", str(arbiter::to_string(e.code()))}, {"message", str(e.what())}};
  std::cerr << arbiter::jsonlite::to_json(Value{Object{{"error", Value{std::move(err)}}}}) << "\n";
  return 2;
}

// Value following `flag` in args, or def.
std::string flag_value(const std::vector<std::string>& args, const std::string& flag,
                       const std::string& def = "") {
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) return args[i + 1];
  }
  return def;
}

std::uint32_t flag_u32(const std::vector<std::string>& args, const std::string& flag) {
  const std::string v = flag_value(args, flag);
  if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos || v.size() > 9) {
    throw arbiter::InvalidArgument(flag + " expects a non-negative integer");
  }
  return static_cast<std::uint32_t>(std::stoul(v));
}

// Known BLAKE3 test vectors
bool verify_hash_vectors() {
  if (arbiter::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262") {
    return false;
  }
  if (arbiter::blake3_hex("hello") !=
      "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f") {
    return false;
  }
  return true;
}

void usage() {
  std::cerr << "usage: arbiter <command> [options]\n"
               "  run [--config FILE] [flags]    evaluate a dataset\n"
               "  doctor [--engine E]            check the host for required tools\n"
               "  config check|show [flags]      validate or print the resolved configuration\n"
               "  dataset fetch|list [flags]     populate the dataset cache\n"
               "  passk --n N --c C --k K        pass@k estimator\n"
               "  review <snapshot_dir>          verify a saved sandbox snapshot\n"
               "  version                        format versions\n";
}

int cmd_run(const std::vector<std::string>& args) {
  std::vector<std::string> warnings;
  const arbiter::EvaluatorConfig cfg = arbiter::resolve_config(args, arbiter::process_env(), &warnings);
  const auto validation = arbiter::validate_config(cfg);
  if (!validation.ok) {
    std::string message;
    for (const auto& e : validation.errors) message += (message.empty() ? "" : "; ") + e;
    throw arbiter::ConfigError(message);
  }
  warnings.insert(warnings.end(), validation.warnings.begin(), validation.warnings.end());

  arbiter::RunContext run(arbiter::new_run_id(), cfg.event_log, cfg.verbose);
  for (const auto& w : warnings) run.events.emit("config_warning", {{"warning", str(w)}});

  auto engine = arbiter::make_container_engine(cfg.engine);
  auto model = arbiter::make_model_client(cfg.model);
  auto fetcher = std::make_shared<arbiter::CurlFetcher>((fs::path(cfg.cache_dir) / "downloads").string());
  arbiter::DatasetLoader loader(cfg.cache_dir, fetcher, run);
  arbiter::BenchmarkEvaluator evaluator(cfg, engine, model, run);
  const arbiter::EvaluationReport report = evaluator.evaluate(loader);

  Object pass_at_k;
  for (const auto& [k, v] : report.pass_at_k) pass_at_k[std::to_string(k)] = Value{v};
  print(Object{{"run_id", str(report.run_id)},
               {"report", str(evaluator.report_path())},
               {"dataset", str(report.dataset_name)},
               {"total_tasks", u64(report.total_tasks)},
               {"passed_tasks", u64(report.passed_tasks)},
               {"failed_tasks", u64(report.failed_tasks)},
               {"errored_tasks", u64(report.errored_tasks)},
               {"pass_at_k", Value{std::move(pass_at_k)}},
               {"efficiency_score", Value{report.efficiency_score}},
               {"warnings", Value{str_array(warnings)}}});
  return 0;
}

int cmd_doctor(const std::vector<std::string>& args) {
  std::vector<std::string> blockers;
  std::vector<std::string> warnings;

  const auto h = arbiter::hash_runtime_info();
  if (h.primitive != "blake3") blockers.push_back("hash_primitive_not_blake3");
  if (!verify_hash_vectors()) blockers.push_back("hash_vectors_failed");

  const std::string engine_kind = flag_value(args, "--engine", "docker");
  auto engine = arbiter::make_container_engine(engine_kind);
  std::string engine_error;
  const bool engine_ok = engine->ping(&engine_error);
  if (!engine_ok) blockers.push_back("engine_unreachable");
  if (engine_kind == "process") warnings.push_back("process engine provides no isolation");

  Object tools;
  for (const char* tool : {"curl", "gzip", "tar"}) {
    const std::string path = arbiter::find_executable(tool);
    tools[tool] = str(path);
    if (path.empty()) blockers.push_back(std::string(tool) + "_not_found");
  }

  print(Object{{"ok", Value{blockers.empty()}},
               {"blockers", Value{str_array(blockers)}},
               {"warnings", Value{str_array(warnings)}},
               {"version", str(arbiter::version::kSemver)},
               {"hash_primitive", str(h.primitive)},
               {"hash_version", str(h.version)},
               {"engine", Value{Object{{"kind", str(engine->engine_id())},
                                       {"reachable", Value{engine_ok}},
                                       {"error", str(engine_error)}}}},
               {"tools", Value{std::move(tools)}}});
  return blockers.empty() ? 0 : 2;
}

int cmd_config(const std::vector<std::string>& args) {
  const std::string sub = args.empty() ? "check" : args[0];
  if (sub != "check" && sub != "show") throw arbiter::InvalidArgument("unknown config subcommand: " + sub);
  const std::vector<std::string> rest(args.begin() + (args.empty() ? 0 : 1), args.end());

  std::vector<std::string> warnings;
  const auto cfg = arbiter::resolve_config(rest, arbiter::process_env(), &warnings);
  auto validation = arbiter::validate_config(cfg);
  warnings.insert(warnings.end(), validation.warnings.begin(), validation.warnings.end());

  Object out{{"ok", Value{validation.ok}},
             {"errors", Value{str_array(validation.errors)}},
             {"warnings", Value{str_array(warnings)}}};
  if (sub == "show") out["config"] = Value{arbiter::config_to_object(cfg)};
  print(out);
  return validation.ok ? 0 : 2;
}

int cmd_dataset(const std::vector<std::string>& args) {
  const std::string sub = args.empty() ? "" : args[0];
  if (sub == "list") {
    Array rows;
    for (const auto& d : arbiter::dataset_registry()) {
      rows.push_back(Value{Object{{"name", str(d.name)},
                                  {"format", str(arbiter::to_string(d.format))},
                                  {"url", str(d.url)},
                                  {"gzip", Value{d.gzip}}}});
    }
    print(Object{{"datasets", Value{std::move(rows)}}});
    return 0;
  }
  if (sub != "fetch") throw arbiter::InvalidArgument("usage: arbiter dataset fetch|list [flags]");

  std::vector<std::string> warnings;
  const std::vector<std::string> rest(args.begin() + 1, args.end());
  const auto cfg = arbiter::resolve_config(rest, arbiter::process_env(), &warnings);
  arbiter::RunContext run(arbiter::new_run_id(), cfg.event_log, cfg.verbose);
  auto fetcher = std::make_shared<arbiter::CurlFetcher>((fs::path(cfg.cache_dir) / "downloads").string());
  arbiter::DatasetLoader loader(cfg.cache_dir, fetcher, run);
  const auto ds = loader.load(cfg.dataset, cfg.dataset_version, cfg.max_tasks);
  warnings.insert(warnings.end(), ds.warnings.begin(), ds.warnings.end());

  print(Object{{"dataset", str(ds.name)},
               {"version", str(ds.version)},
               {"digest", str(ds.digest)},
               {"from_cache", Value{ds.from_cache}},
               {"tasks", u64(ds.tasks.size())},
               {"first_task", str(ds.tasks.front().id)},
               {"warnings", Value{str_array(warnings)}}});
  return 0;
}

int cmd_passk(const std::vector<std::string>& args) {
  const std::uint32_t n = flag_u32(args, "--n");
  const std::uint32_t c = flag_u32(args, "--c");
  const std::uint32_t k = flag_u32(args, "--k");
  if (c > n) throw arbiter::InvalidArgument("--c must not exceed --n");
  if (k < 1 || k > n) throw arbiter::InvalidArgument("--k must be in [1, n]");
  print(Object{{"n", u64(n)}, {"c", u64(c)}, {"k", u64(k)},
               {"pass_at_k", Value{arbiter::pass_at_k(n, c, k)}}});
  return 0;
}

// Recomputes the audit chain and snapshot digest of a saved sandbox.
int cmd_review(const std::vector<std::string>& args) {
  if (args.empty()) throw arbiter::InvalidArgument("usage: arbiter review <snapshot_dir>");
  const fs::path dir(args[0]);
  const auto text = arbiter::read_file_bytes((dir / "metadata.json").string());
  if (!text) throw arbiter::Error(arbiter::ErrorCode::io_error, "cannot read " + (dir / "metadata.json").string());
  std::optional<arbiter::jsonlite::JsonError> err;
  const Object meta = arbiter::jsonlite::parse(*text, &err);
  if (err) throw arbiter::Error(arbiter::ErrorCode::json_parse_error, err->message);

  std::vector<std::string> problems;
  std::vector<arbiter::CommandLog> entries;
  for (const auto& v : arbiter::jsonlite::get_array(meta, "command_log")) {
    if (arbiter::jsonlite::is_object(v)) {
      entries.push_back(arbiter::command_log_from_object(std::get<Object>(v.v)));
    }
  }
  const auto chain = arbiter::verify_audit_chain(entries);
  if (!chain.ok) problems.push_back("command_log: " + chain.reason);
  const Object audit = arbiter::jsonlite::get_object(meta, "audit");
  if (chain.ok && chain.head_digest != arbiter::jsonlite::get_string(audit, "head_digest")) {
    problems.push_back("audit head digest does not match command_log");
  }

  Object stream_out;
  const fs::path stream = dir / "audit.ndjson";
  std::error_code ec;
  if (fs::exists(stream, ec)) {
    const auto s = arbiter::verify_audit_stream(stream.string());
    if (!s.ok) problems.push_back("audit.ndjson: " + s.reason);
    stream_out = Object{{"ok", Value{s.ok}}, {"entries", u64(s.entries)}, {"reason", str(s.reason)}};
  }

  const Object snapshot = arbiter::jsonlite::get_object(meta, "snapshot");
  const std::string expected = arbiter::jsonlite::get_string(snapshot, "digest");
  const std::string actual = arbiter::hash_file_blake3_hex((dir / "filesystem.tar").string());
  if (actual.empty()) {
    problems.push_back("filesystem.tar missing or unreadable");
  } else if (actual != expected) {
    problems.push_back("filesystem.tar digest mismatch");
  }

  print(Object{{"ok", Value{problems.empty()}},
               {"task_id", str(arbiter::jsonlite::get_string(meta, "task_id"))},
               {"sandbox", str(arbiter::jsonlite::get_string(meta, "sandbox_name"))},
               {"commands", u64(entries.size())},
               {"head_digest", str(chain.head_digest)},
               {"stream", Value{std::move(stream_out)}},
               {"snapshot_digest", str(actual)},
               {"problems", Value{str_array(problems)}}});
  return problems.empty() ? 0 : 2;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  const std::string cmd = argv[1];
  const std::vector<std::string> args(argv + 2, argv + argc);

  try {
    if (cmd == "run") return cmd_run(args);
    if (cmd == "doctor") return cmd_doctor(args);
    if (cmd == "config") return cmd_config(args);
    if (cmd == "dataset") return cmd_dataset(args);
    if (cmd == "passk") return cmd_passk(args);
    if (cmd == "review") return cmd_review(args);
    if (cmd == "version") {
      std::cout << arbiter::version::manifest_to_json(arbiter::version::current_manifest()) << "\n";
      return 0;
    }
  } catch (const arbiter::Error& e) {
    return print_error(e);
  } catch (const std::exception& e) {
    return print_error(arbiter::Error(arbiter::ErrorCode::internal_error, e.what()));
  }

  usage();
  return 1;
}
