#pragma once

// arbiter/scoring.hpp — pass@k, efficiency score, baseline comparison.
//
// pass@k:
//   Unbiased estimator over n samples with c correct:
//     pass@k = 1 - C(n-c, k) / C(n, k)        (1 when n - c < k)
//   evaluated as 1 - prod_{i=n-c+1..n} (1 - k/i) so large n never overflows.
//   The estimator is non-decreasing in k for fixed n, c.
//
// efficiency:
//   cost(x) = w_x / (1 + x / scale_x) summed over time, commands and tokens,
//   then divided by the weight sum so it lies in (0, 1].
//   score = correctness_weight + (1 - correctness_weight) * cost if passed,
//   else 0. A correct cheap attempt always outranks a correct expensive one,
//   and both outrank any incorrect attempt.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "arbiter/jsonlite.hpp"
#include "arbiter/types.hpp"

namespace arbiter {

double pass_at_k(std::uint32_t n, std::uint32_t c, std::uint32_t k);

// Mean pass@k across tasks for each k <= samples_per_task. Ks larger than the
// sample count are omitted: the estimator is undefined there.
std::map<std::uint32_t, double> aggregate_pass_at_k(const std::vector<TaskResult>& results,
                                                    const std::vector<std::uint32_t>& ks,
                                                    std::uint32_t samples_per_task);

struct EfficiencyWeights {
  double correctness_weight{0.5};
  double time_weight{1.0};
  double commands_weight{1.0};
  double tokens_weight{1.0};
  double time_scale_seconds{60.0};
  double commands_scale{10.0};
  double tokens_scale{4000.0};

  jsonlite::Object to_object() const;
};

// Empty when valid, otherwise one message per problem.
std::vector<std::string> validate_weights(const EfficiencyWeights& w);

double attempt_efficiency(const AttemptResult& attempt, const EfficiencyWeights& w);

// Mean of attempt_efficiency over every attempt of every task.
double efficiency_score(const std::vector<TaskResult>& results, const EfficiencyWeights& w);

struct Baseline {
  std::string name;
  double pass_rate{0.0};
};

// dataset name -> published pass@1 rates.
using BaselineTable = std::map<std::string, std::vector<Baseline>>;

const BaselineTable& builtin_baselines();

// {"humaneval": {"GPT-4": 0.67, ...}, ...}. Throws ConfigError.
BaselineTable load_baselines(const std::string& path);

// Mean unbiased pass@1 over tasks, comparable with published pass@1 figures
// whatever samples_per_task is.
double run_pass_rate(const std::vector<TaskResult>& results);

std::vector<BaselineComparison> compare_baselines(const BaselineTable& table,
                                                  const std::string& dataset,
                                                  double this_run_pass_rate);

}  // namespace arbiter
