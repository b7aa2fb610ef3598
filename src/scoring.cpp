#include "arbiter/scoring.hpp"

#include <algorithm>
#include <cmath>

#include "arbiter/fsutil.hpp"

namespace arbiter {

using jsonlite::Object;
using jsonlite::Value;

double pass_at_k(std::uint32_t n, std::uint32_t c, std::uint32_t k) {
  if (n == 0 || k == 0) return 0.0;
  c = std::min(c, n);
  if (n - c < k) return 1.0;
  double miss = 1.0;
  for (std::uint32_t i = n - c + 1; i <= n; ++i) {
    miss *= 1.0 - static_cast<double>(k) / static_cast<double>(i);
  }
  return 1.0 - miss;
}

std::map<std::uint32_t, double> aggregate_pass_at_k(const std::vector<TaskResult>& results,
                                                    const std::vector<std::uint32_t>& ks,
                                                    std::uint32_t samples_per_task) {
  std::map<std::uint32_t, double> out;
  if (results.empty()) return out;
  for (const std::uint32_t k : ks) {
    if (k == 0 || k > samples_per_task) continue;
    double sum = 0.0;
    for (const auto& r : results) sum += pass_at_k(r.num_samples, r.num_correct, k);
    out[k] = sum / static_cast<double>(results.size());
  }
  return out;
}

Object EfficiencyWeights::to_object() const {
  return Object{{"correctness_weight", Value{correctness_weight}},
                {"time_weight", Value{time_weight}},
                {"commands_weight", Value{commands_weight}},
                {"tokens_weight", Value{tokens_weight}},
                {"time_scale_seconds", Value{time_scale_seconds}},
                {"commands_scale", Value{commands_scale}},
                {"tokens_scale", Value{tokens_scale}}};
}

std::vector<std::string> validate_weights(const EfficiencyWeights& w) {
  std::vector<std::string> errors;
  if (!(w.correctness_weight > 0.0 && w.correctness_weight < 1.0)) {
    errors.push_back("efficiency.correctness_weight must be in (0, 1)");
  }
  if (w.time_weight < 0.0 || w.commands_weight < 0.0 || w.tokens_weight < 0.0) {
    errors.push_back("efficiency cost weights must be >= 0");
  }
  if (w.time_weight + w.commands_weight + w.tokens_weight <= 0.0) {
    errors.push_back("at least one efficiency cost weight must be positive");
  }
  if (!(w.time_scale_seconds > 0.0 && w.commands_scale > 0.0 && w.tokens_scale > 0.0)) {
    errors.push_back("efficiency scales must be > 0");
  }
  return errors;
}

double attempt_efficiency(const AttemptResult& attempt, const EfficiencyWeights& w) {
  if (!attempt.passed_tests) return 0.0;
  const double total = w.time_weight + w.commands_weight + w.tokens_weight;
  if (total <= 0.0) return w.correctness_weight;
  const double cost =
      (w.time_weight / (1.0 + attempt.execution_time_seconds / w.time_scale_seconds) +
       w.commands_weight /
           (1.0 + static_cast<double>(attempt.sandbox_metrics.commands_executed) / w.commands_scale) +
       w.tokens_weight / (1.0 + static_cast<double>(attempt.tokens_used) / w.tokens_scale)) /
      total;
  return w.correctness_weight + (1.0 - w.correctness_weight) * cost;
}

double efficiency_score(const std::vector<TaskResult>& results, const EfficiencyWeights& w) {
  double sum = 0.0;
  std::size_t n = 0;
  for (const auto& r : results) {
    for (const auto& a : r.attempts) {
      sum += attempt_efficiency(a, w);
      ++n;
    }
  }
  return n == 0 ? 0.0 : sum / static_cast<double>(n);
}

const BaselineTable& builtin_baselines() {
  // Published pass@1 figures.
  static const BaselineTable table = {
      {"humaneval",
       {{"GPT-4", 0.674}, {"Claude-3-Opus", 0.84}, {"Qwen2.5-32B", 0.75}, {"GPT-3.5-Turbo", 0.48}}},
      {"mbpp", {{"GPT-4", 0.83}, {"Claude-3-Opus", 0.87}, {"Qwen2.5-32B", 0.80}}},
  };
  return table;
}

BaselineTable load_baselines(const std::string& path) {
  const auto text = read_file_bytes(path);
  if (!text) throw ConfigError("cannot read baselines file " + path);
  std::optional<jsonlite::JsonError> err;
  const Object doc = jsonlite::parse(*text, &err);
  if (err) throw ConfigError("baselines file " + path + ": " + err->message);

  BaselineTable table;
  for (const auto& [dataset, entry] : doc) {
    if (!jsonlite::is_object(entry)) {
      throw ConfigError("baselines file " + path + ": \"" + dataset + "\" must be an object");
    }
    auto& rows = table[dataset];
    for (const auto& [name, rate] : std::get<Object>(entry.v)) {
      double v = 0.0;
      if (std::holds_alternative<double>(rate.v)) {
        v = std::get<double>(rate.v);
      } else if (std::holds_alternative<std::uint64_t>(rate.v)) {
        v = static_cast<double>(std::get<std::uint64_t>(rate.v));
      } else {
        throw ConfigError("baselines file " + path + ": " + dataset + "." + name + " is not a number");
      }
      if (v < 0.0 || v > 1.0) {
        throw ConfigError("baselines file " + path + ": " + dataset + "." + name + " outside [0, 1]");
      }
      rows.push_back(Baseline{name, v});
    }
  }
  return table;
}

double run_pass_rate(const std::vector<TaskResult>& results) {
  if (results.empty()) return 0.0;
  double sum = 0.0;
  for (const auto& r : results) {
    if (r.num_samples == 0) {
      sum += r.passed_tests ? 1.0 : 0.0;
    } else {
      sum += pass_at_k(r.num_samples, r.num_correct, 1);
    }
  }
  return sum / static_cast<double>(results.size());
}

std::vector<BaselineComparison> compare_baselines(const BaselineTable& table,
                                                  const std::string& dataset,
                                                  double this_run_pass_rate) {
  std::vector<BaselineComparison> out;
  const auto it = table.find(dataset);
  if (it == table.end()) return out;
  for (const auto& b : it->second) {
    BaselineComparison cmp;
    cmp.baseline_name = b.name;
    cmp.baseline_pass_rate = b.pass_rate;
    cmp.this_run_pass_rate = this_run_pass_rate;
    cmp.delta = this_run_pass_rate - b.pass_rate;
    out.push_back(std::move(cmp));
  }
  return out;
}

}  // namespace arbiter
