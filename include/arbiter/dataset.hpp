#pragma once

// arbiter/dataset.hpp — Benchmark datasets as ordered Task sequences.
//
// CACHING:
//   The first load of name@version fetches the artifact, stores the
//   decompressed bytes in the CAS (<cache>/cas) and pins the digest in
//   <cache>/datasets.json. Every later load of the same key reads the pinned
//   object, so the same name+version always yields the same ordered Tasks.
//   A pinned object that fails integrity verification is refetched.
//
// FORMATS:
//   humaneval  JSONL: task_id, prompt, canonical_solution, test, entry_point
//   mbpp       JSON array or JSONL: task_id, text, code, test_list,
//              test_setup_code
//
// EXTENSION_POINT: new datasets
//   Add a registry row and, if the layout is new, a DatasetFormat with its
//   parser. Task ids must stay stable across releases of the artifact.

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "arbiter/cas.hpp"
#include "arbiter/observability.hpp"
#include "arbiter/types.hpp"

namespace arbiter {

enum class DatasetFormat { humaneval, mbpp };

std::string to_string(DatasetFormat format);
std::optional<DatasetFormat> parse_dataset_format(const std::string& name);

struct DatasetSpec {
  std::string name;
  DatasetFormat format{DatasetFormat::humaneval};
  std::string url;
  bool gzip{false};
};

const std::vector<DatasetSpec>& dataset_registry();
std::optional<DatasetSpec> find_dataset(const std::string& name);

// Retrieves an artifact's decompressed bytes. Throws DatasetUnavailableError.
class ArtifactFetcher {
 public:
  virtual ~ArtifactFetcher() = default;
  virtual std::string fetch(const std::string& url, bool gzip) = 0;
};

// curl CLI download followed by `gzip -dc` when the artifact is compressed.
class CurlFetcher : public ArtifactFetcher {
 public:
  explicit CurlFetcher(std::string scratch_dir, std::uint64_t timeout_ms = 300000);
  std::string fetch(const std::string& url, bool gzip) override;

 private:
  std::string scratch_dir_;
  std::uint64_t timeout_ms_;
};

struct Dataset {
  std::string name;
  std::string version;
  std::string digest;                        // CAS key of the artifact bytes, "" for local files
  bool from_cache{false};
  std::vector<Task> tasks;
  std::vector<std::string> warnings;         // skipped records, cache problems
};

class DatasetLoader {
 public:
  DatasetLoader(std::string cache_dir, std::shared_ptr<ArtifactFetcher> fetcher, RunContext& run);

  // version "" means "latest". max_tasks 0 means all.
  Dataset load(const std::string& name, const std::string& version = "", std::size_t max_tasks = 0);

  // Local file, no caching. Throws DatasetUnavailableError.
  Dataset load_file(const std::string& path, DatasetFormat format, std::size_t max_tasks = 0);

  std::string index_path() const;

 private:
  std::string cache_dir_;
  CasStore cas_;
  std::shared_ptr<ArtifactFetcher> fetcher_;
  RunContext& run_;
  std::mutex index_mu_;
};

// Parsers. Unparseable records are skipped and described in *warnings.
std::vector<Task> parse_humaneval(const std::string& text, std::vector<std::string>* warnings);
std::vector<Task> parse_mbpp(const std::string& text, std::vector<std::string>* warnings);
std::vector<Task> parse_dataset(const std::string& text, DatasetFormat format,
                                std::vector<std::string>* warnings);

// Function under test in an MBPP assertion: "assert f(1) == 2" -> "f".
std::string mbpp_entry_point(const std::string& test);

}  // namespace arbiter
