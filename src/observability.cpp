#include "arbiter/observability.hpp"

#include <bit>
#include <cstdio>
#include <iostream>
#include <random>

namespace arbiter {

using jsonlite::Object;
using jsonlite::Value;

namespace {

// std::bit_width gives the bucket index in O(1) (BSR/CLZ).
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

Value u64(uint64_t v) { return Value{static_cast<std::uint64_t>(v)}; }

uint64_t load(const std::atomic<uint64_t>& a) { return a.load(std::memory_order_relaxed); }

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  const size_t b = bucket_for_us(us);
  buckets_[b].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      // Midpoint of bucket i; bucket 0 covers [0,1)us.
      const double bucket_lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double bucket_hi = static_cast<double>(1ULL << i);
      return (bucket_lo + bucket_hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

Object LatencyHistogram::to_object() const {
  Object o;
  o["count"] = u64(count());
  o["mean_ms"] = Value{mean_us() / 1000.0};
  o["p50_ms"] = Value{percentile(0.50) / 1000.0};
  o["p95_ms"] = Value{percentile(0.95) / 1000.0};
  o["p99_ms"] = Value{percentile(0.99) / 1000.0};
  return o;
}

// ---------------------------------------------------------------------------
// RunStats
// ---------------------------------------------------------------------------

void RunStats::record_failure(ErrorCode code) {
  std::lock_guard<std::mutex> lk(failure_mu_);
  ++failures_[to_string(code)];
}

std::map<std::string, uint64_t> RunStats::failure_categories() const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  return failures_;
}

Object RunStats::to_object() const {
  Object o;
  o["sandboxes_created"] = u64(load(sandboxes_created));
  o["provisioning_failures"] = u64(load(provisioning_failures));
  o["commands_executed"] = u64(load(commands_executed));
  o["command_timeouts"] = u64(load(command_timeouts));
  o["container_resets"] = u64(load(container_resets));
  o["path_escapes"] = u64(load(path_escapes));
  o["tool_calls"] = u64(load(tool_calls));
  o["unknown_tools"] = u64(load(unknown_tools));
  o["model_calls"] = u64(load(model_calls));
  o["model_retries"] = u64(load(model_retries));
  o["model_failures"] = u64(load(model_failures));
  o["tokens_used"] = u64(load(tokens_used));
  o["attempts_passed"] = u64(load(attempts_passed));
  o["attempts_failed"] = u64(load(attempts_failed));

  Object cas;
  const uint64_t puts = load(cas_puts);
  const uint64_t hits = load(cas_hits);
  cas["puts"] = u64(puts);
  cas["hits"] = u64(hits);
  cas["hit_rate"] = Value{(puts + hits) > 0 ? static_cast<double>(hits) / static_cast<double>(puts + hits) : 0.0};
  o["cas"] = Value{std::move(cas)};

  Object latency;
  latency["attempt"] = Value{attempt_latency.to_object()};
  latency["command"] = Value{command_latency.to_object()};
  latency["model"] = Value{model_latency.to_object()};
  o["latency"] = Value{std::move(latency)};

  Object failures;
  for (const auto& [k, v] : failure_categories()) failures[k] = u64(v);
  o["failure_categories"] = Value{std::move(failures)};
  return o;
}

// ---------------------------------------------------------------------------
// EventSink
// ---------------------------------------------------------------------------

EventSink::EventSink(std::string run_id, std::string path, bool mirror_stderr)
    : run_id_(std::move(run_id)), path_(std::move(path)), mirror_stderr_(mirror_stderr) {
  if (!path_.empty()) {
    file_ = std::fopen(path_.c_str(), "a");
    if (!file_) {
      std::cerr << "{\"warning\":\"event log unavailable\",\"path\":\""
                << jsonlite::escape(path_) << "\"}\n";
    }
  }
}

EventSink::~EventSink() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

void EventSink::emit(const std::string& event, Object fields) noexcept {
  if (!file_ && !mirror_stderr_) return;
  try {
    fields["event"] = Value{event};
    fields["run_id"] = Value{run_id_};
    fields["ts_ms"] = Value{static_cast<std::uint64_t>(unix_time_ms())};
    const std::string line = jsonlite::to_json(Value{std::move(fields)}) + "\n";

    std::lock_guard<std::mutex> lk(mu_);
    if (file_) {
      if (std::fwrite(line.data(), 1, line.size(), file_) != line.size() || std::fflush(file_) != 0) {
        write_failures_.fetch_add(1, std::memory_order_relaxed);
      }
    }
    if (mirror_stderr_) {
      std::fwrite(line.data(), 1, line.size(), stderr);
    }
    emitted_.fetch_add(1, std::memory_order_relaxed);
  } catch (const std::exception&) {
    // Allocation failure while formatting; the event is counted as lost.
    write_failures_.fetch_add(1, std::memory_order_relaxed);
  }
}

std::string new_run_id() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  char buf[16];
  std::snprintf(buf, sizeof(buf), "r%010llx",
                static_cast<unsigned long long>(rng() & 0xffffffffffULL));
  return buf;
}

}  // namespace arbiter
