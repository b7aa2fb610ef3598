#include "arbiter/dataset.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <sstream>

#include "arbiter/fsutil.hpp"
#include "arbiter/jsonlite.hpp"
#include "arbiter/process.hpp"

namespace fs = std::filesystem;

namespace arbiter {

using jsonlite::Object;
using jsonlite::Value;

namespace {

bool is_ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

// task_id may be a string or a non-negative integer.
std::string id_field(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return {};
  if (std::holds_alternative<std::string>(it->second.v)) return std::get<std::string>(it->second.v);
  if (std::holds_alternative<std::uint64_t>(it->second.v)) {
    return std::to_string(std::get<std::uint64_t>(it->second.v));
  }
  return {};
}

std::string join_lines(const std::vector<std::string>& lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) out += "\n";
    out += lines[i];
  }
  return out;
}

void warn(std::vector<std::string>* warnings, const std::string& message) {
  if (warnings) warnings->push_back(message);
}

// Records of a JSONL document, or of a top-level JSON array.
std::vector<std::pair<size_t, Object>> records_of(const std::string& text,
                                                  std::vector<std::string>* warnings) {
  std::vector<std::pair<size_t, Object>> out;
  const size_t first = text.find_first_not_of(" \t\r\n");
  if (first != std::string::npos && text[first] == '[') {
    std::optional<jsonlite::JsonError> err;
    const Value doc = jsonlite::parse_value(text, &err);
    if (err || !jsonlite::is_array(doc)) {
      warn(warnings, "document is not a JSON array: " + (err ? err->message : std::string("wrong type")));
      return out;
    }
    const auto& items = std::get<jsonlite::Array>(doc.v);
    for (size_t i = 0; i < items.size(); ++i) {
      if (!jsonlite::is_object(items[i])) {
        warn(warnings, "item " + std::to_string(i + 1) + " is not an object");
        continue;
      }
      out.emplace_back(i + 1, std::get<Object>(items[i].v));
    }
    return out;
  }

  std::istringstream in(text);
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) continue;
    std::optional<jsonlite::JsonError> err;
    Object obj = jsonlite::parse(line, &err);
    if (err) {
      warn(warnings, "line " + std::to_string(line_no) + ": " + err->message);
      continue;
    }
    out.emplace_back(line_no, std::move(obj));
  }
  return out;
}

std::string index_key(const std::string& name, const std::string& version) {
  return name + "@" + (version.empty() ? "latest" : version);
}

}  // namespace

std::string to_string(DatasetFormat format) {
  switch (format) {
    case DatasetFormat::humaneval: return "humaneval";
    case DatasetFormat::mbpp: return "mbpp";
  }
  return "unknown";
}

std::optional<DatasetFormat> parse_dataset_format(const std::string& name) {
  if (name == "humaneval") return DatasetFormat::humaneval;
  if (name == "mbpp") return DatasetFormat::mbpp;
  return std::nullopt;
}

const std::vector<DatasetSpec>& dataset_registry() {
  static const std::vector<DatasetSpec> registry = {
      {"humaneval", DatasetFormat::humaneval,
       "https://github.com/openai/human-eval/raw/master/data/HumanEval.jsonl.gz", true},
      {"mbpp", DatasetFormat::mbpp,
       "https://raw.githubusercontent.com/google-research/google-research/master/mbpp/mbpp.jsonl",
       false},
  };
  return registry;
}

std::optional<DatasetSpec> find_dataset(const std::string& name) {
  for (const auto& spec : dataset_registry()) {
    if (spec.name == name) return spec;
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Parsers
// ---------------------------------------------------------------------------

std::string mbpp_entry_point(const std::string& test) {
  static const std::set<std::string> kBuiltins = {
      "abs", "all", "any", "bool", "dict", "float", "frozenset", "int", "isclose", "len",
      "list", "math", "max", "min", "round", "set", "sorted", "str", "sum", "tuple", "not"};
  const size_t a = test.find("assert");
  if (a == std::string::npos) return {};
  size_t i = a + 6;
  while (i < test.size()) {
    if (!is_ident_start(test[i])) {
      ++i;
      continue;
    }
    const size_t start = i;
    while (i < test.size() && is_ident_char(test[i])) ++i;
    const std::string ident = test.substr(start, i - start);
    size_t j = i;
    while (j < test.size() && test[j] == ' ') ++j;
    const bool called = j < test.size() && test[j] == '(';
    const bool attribute = start > 0 && test[start - 1] == '.';
    if (called && !attribute && kBuiltins.count(ident) == 0) return ident;
  }
  return {};
}

std::vector<Task> parse_humaneval(const std::string& text, std::vector<std::string>* warnings) {
  std::vector<Task> tasks;
  for (auto& [line_no, obj] : records_of(text, warnings)) {
    const std::string original = id_field(obj, "task_id");
    const std::string prompt = jsonlite::get_string(obj, "prompt");
    const std::string test = jsonlite::get_string(obj, "test");
    const std::string entry_point = jsonlite::get_string(obj, "entry_point");
    if (original.empty() || prompt.empty() || test.empty() || entry_point.empty()) {
      warn(warnings, "record " + std::to_string(line_no) + ": missing task_id/prompt/test/entry_point");
      continue;
    }
    Task task;
    task.id = "humaneval_" + original;
    std::replace(task.id.begin(), task.id.end(), '/', '_');
    task.prompt = prompt;
    task.entry_point = entry_point;
    task.test_code = test;
    if (obj.count("canonical_solution")) task.canonical_solution = jsonlite::get_string(obj, "canonical_solution");
    task.metadata["dataset"] = "humaneval";
    task.metadata["source_id"] = original;
    task.metadata["line_number"] = std::to_string(line_no);
    tasks.push_back(std::move(task));
  }
  return tasks;
}

std::vector<Task> parse_mbpp(const std::string& text, std::vector<std::string>* warnings) {
  std::vector<Task> tasks;
  for (auto& [line_no, obj] : records_of(text, warnings)) {
    const std::string original = id_field(obj, "task_id");
    const std::string description = jsonlite::get_string(obj, "text");
    const std::vector<std::string> tests = jsonlite::get_string_array(obj, "test_list");
    if (original.empty() || description.empty() || tests.empty()) {
      warn(warnings, "record " + std::to_string(line_no) + ": missing task_id/text/test_list");
      continue;
    }
    const std::string setup = jsonlite::get_string(obj, "test_setup_code");
    const std::string joined = join_lines(tests);

    Task task;
    task.id = "mbpp_" + original;
    task.prompt = description + "\n\nYour code should pass these tests:\n" + joined;
    task.entry_point = mbpp_entry_point(tests.front());
    task.test_code = setup.empty() ? joined : setup + "\n" + joined;
    if (obj.count("code")) task.canonical_solution = jsonlite::get_string(obj, "code");
    task.metadata["dataset"] = "mbpp";
    task.metadata["source_id"] = original;
    task.metadata["test_count"] = std::to_string(tests.size());
    tasks.push_back(std::move(task));
  }
  return tasks;
}

std::vector<Task> parse_dataset(const std::string& text, DatasetFormat format,
                                std::vector<std::string>* warnings) {
  switch (format) {
    case DatasetFormat::humaneval: return parse_humaneval(text, warnings);
    case DatasetFormat::mbpp: return parse_mbpp(text, warnings);
  }
  return {};
}

// ---------------------------------------------------------------------------
// CurlFetcher
// ---------------------------------------------------------------------------

CurlFetcher::CurlFetcher(std::string scratch_dir, std::uint64_t timeout_ms)
    : scratch_dir_(std::move(scratch_dir)), timeout_ms_(timeout_ms) {}

std::string CurlFetcher::fetch(const std::string& url, bool gzip) {
  std::error_code ec;
  fs::create_directories(scratch_dir_, ec);
  if (ec) throw DatasetUnavailableError("cannot create " + scratch_dir_ + ": " + ec.message());

  const std::string download = make_tmp_name(scratch_dir_);
  const std::string plain = download + ".plain";
  struct Remove {
    std::vector<std::string> paths;
    ~Remove() {
      std::error_code e;
      for (const auto& p : paths) fs::remove(p, e);
    }
  } remove_after{{download, plain}};

  ProcessSpec curl;
  curl.command = "curl";
  curl.argv = {"-fsSL", "--max-time", std::to_string(std::max<std::uint64_t>(1, timeout_ms_ / 1000)),
               url};
  curl.inherit_env = true;
  curl.stdout_path = download;
  curl.timeout_ms = timeout_ms_ + 5000;
  curl.limit_cpu_time = false;
  const ProcessResult r = run_process(curl);
  if (!r.ok()) {
    throw DatasetUnavailableError("download of " + url + " failed: " +
                                  (r.spawned() ? "curl exit " + std::to_string(r.exit_code) + " " +
                                                     r.stderr_text
                                               : r.error_message));
  }

  std::string source = download;
  if (gzip) {
    ProcessSpec gunzip;
    gunzip.command = "gzip";
    gunzip.argv = {"-dc", download};
    gunzip.inherit_env = true;
    gunzip.stdout_path = plain;
    gunzip.timeout_ms = 120000;
    gunzip.limit_cpu_time = false;
    const ProcessResult g = run_process(gunzip);
    if (!g.ok()) {
      throw DatasetUnavailableError("decompressing " + url + " failed: " +
                                    (g.spawned() ? g.stderr_text : g.error_message));
    }
    source = plain;
  }
  auto bytes = read_file_bytes(source);
  if (!bytes) throw DatasetUnavailableError("cannot read downloaded artifact for " + url);
  return *bytes;
}

// ---------------------------------------------------------------------------
// DatasetLoader
// ---------------------------------------------------------------------------

DatasetLoader::DatasetLoader(std::string cache_dir, std::shared_ptr<ArtifactFetcher> fetcher,
                             RunContext& run)
    : cache_dir_(std::move(cache_dir)),
      cas_((fs::path(cache_dir_) / "cas").string()),
      fetcher_(std::move(fetcher)),
      run_(run) {}

std::string DatasetLoader::index_path() const {
  return (fs::path(cache_dir_) / "datasets.json").string();
}

Dataset DatasetLoader::load(const std::string& name, const std::string& version, std::size_t max_tasks) {
  const auto spec = find_dataset(name);
  if (!spec) throw DatasetUnavailableError("unknown dataset: " + name);

  Dataset ds;
  ds.name = name;
  ds.version = version.empty() ? "latest" : version;
  const std::string key = index_key(name, version);

  std::lock_guard<std::mutex> lk(index_mu_);
  Object index;
  if (auto text = read_file_bytes(index_path())) {
    std::optional<jsonlite::JsonError> err;
    index = jsonlite::parse(*text, &err);
    if (err) {
      ds.warnings.push_back("dataset index unreadable, ignoring: " + err->message);
      index.clear();
    }
  }

  std::string bytes;
  const std::string pinned = jsonlite::get_string(jsonlite::get_object(index, key), "digest");
  if (!pinned.empty()) {
    std::string why;
    if (auto cached = cas_.get(pinned, &why)) {
      bytes = std::move(*cached);
      ds.digest = pinned;
      ds.from_cache = true;
      run_.stats.cas_hits.fetch_add(1, std::memory_order_relaxed);
    } else {
      ds.warnings.push_back("cached " + key + " unusable (" + why + "), refetching");
    }
  }

  if (!ds.from_cache) {
    if (!fetcher_) throw DatasetUnavailableError(key + " is not cached and no fetcher is configured");
    try {
      bytes = fetcher_->fetch(spec->url, spec->gzip);
    } catch (const DatasetUnavailableError& e) {
      throw DatasetUnavailableError(key + " is not cached and could not be fetched: " + e.what());
    }
    ds.digest = cas_.put(bytes, "zstd");
    if (ds.digest.empty()) {
      ds.warnings.push_back("could not store " + key + " in the cache at " + cas_.root());
    } else {
      run_.stats.cas_puts.fetch_add(1, std::memory_order_relaxed);
      Object entry;
      entry["digest"] = Value{ds.digest};
      entry["url"] = Value{spec->url};
      entry["format"] = Value{to_string(spec->format)};
      entry["fetched_at"] = Value{utc_timestamp_iso8601()};
      entry["size_bytes"] = Value{static_cast<std::uint64_t>(bytes.size())};
      index[key] = Value{std::move(entry)};
      if (!atomic_write(index_path(), jsonlite::to_json_pretty(Value{index}))) {
        ds.warnings.push_back("could not update " + index_path());
      }
    }
  }

  ds.tasks = parse_dataset(bytes, spec->format, &ds.warnings);
  if (ds.tasks.empty()) throw DatasetUnavailableError(key + " contains no parseable tasks");
  if (max_tasks > 0 && ds.tasks.size() > max_tasks) ds.tasks.resize(max_tasks);

  run_.events.emit("dataset_loaded", {{"dataset", Value{key}},
                                      {"digest", Value{ds.digest}},
                                      {"from_cache", Value{ds.from_cache}},
                                      {"tasks", Value{static_cast<std::uint64_t>(ds.tasks.size())}},
                                      {"warnings", Value{static_cast<std::uint64_t>(ds.warnings.size())}}});
  return ds;
}

Dataset DatasetLoader::load_file(const std::string& path, DatasetFormat format, std::size_t max_tasks) {
  auto bytes = read_file_bytes(path);
  if (!bytes) throw DatasetUnavailableError("cannot read dataset file " + path);
  Dataset ds;
  ds.name = to_string(format);
  ds.version = "file:" + path;
  ds.tasks = parse_dataset(*bytes, format, &ds.warnings);
  if (ds.tasks.empty()) throw DatasetUnavailableError(path + " contains no parseable tasks");
  if (max_tasks > 0 && ds.tasks.size() > max_tasks) ds.tasks.resize(max_tasks);
  run_.events.emit("dataset_loaded", {{"dataset", Value{ds.version}},
                                      {"tasks", Value{static_cast<std::uint64_t>(ds.tasks.size())}},
                                      {"warnings", Value{static_cast<std::uint64_t>(ds.warnings.size())}}});
  return ds;
}

}  // namespace arbiter
