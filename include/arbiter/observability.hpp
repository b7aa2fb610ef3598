#pragma once

// arbiter/observability.hpp — Per-run counters and the structured event stream.
//
// DESIGN:
//   Everything observable about one evaluator run lives in one RunContext,
//   constructed by whoever starts the run and passed by reference into the
//   Sandbox, CodingAgent and BenchmarkEvaluator. There are no process-wide
//   stats singletons, so two evaluator runs in one process (or in one test
//   binary) never see each other's counters.
//
//   RunStats   atomics + latency histograms, serialized into the report.
//   EventSink  one JSON object per line appended to the configured event log,
//              optionally mirrored to stderr (--verbose). This is the
//              project's logging channel.
//
// Invariant: event emission never throws and never blocks on anything but
// the sink's own mutex.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <map>
#include <mutex>
#include <string>

#include "arbiter/jsonlite.hpp"
#include "arbiter/types.hpp"

namespace arbiter {

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
// Bucket boundaries are part of the report format. Do not change them
// without bumping REPORT_FORMAT_VERSION.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 40;  // up to ~6 days in doubling steps

  void record(uint64_t duration_ns);

  // Approximate percentile in microseconds. p in [0.0, 1.0].
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  jsonlite::Object to_object() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// RunStats — aggregated statistics for one evaluator run. Thread-safe.
// ---------------------------------------------------------------------------
class RunStats {
 public:
  // Counters are aligned to separate cache lines; workers increment them
  // concurrently.
  alignas(64) std::atomic<uint64_t> sandboxes_created{0};
  alignas(64) std::atomic<uint64_t> provisioning_failures{0};
  alignas(64) std::atomic<uint64_t> commands_executed{0};
  alignas(64) std::atomic<uint64_t> command_timeouts{0};
  alignas(64) std::atomic<uint64_t> container_resets{0};
  alignas(64) std::atomic<uint64_t> path_escapes{0};
  alignas(64) std::atomic<uint64_t> tool_calls{0};
  alignas(64) std::atomic<uint64_t> unknown_tools{0};
  alignas(64) std::atomic<uint64_t> model_calls{0};
  alignas(64) std::atomic<uint64_t> model_retries{0};
  alignas(64) std::atomic<uint64_t> model_failures{0};
  alignas(64) std::atomic<uint64_t> tokens_used{0};
  alignas(64) std::atomic<uint64_t> attempts_passed{0};
  alignas(64) std::atomic<uint64_t> attempts_failed{0};
  alignas(64) std::atomic<uint64_t> cas_puts{0};
  alignas(64) std::atomic<uint64_t> cas_hits{0};

  LatencyHistogram attempt_latency;
  LatencyHistogram command_latency;
  LatencyHistogram model_latency;

  void record_failure(ErrorCode code);
  std::map<std::string, uint64_t> failure_categories() const;

  jsonlite::Object to_object() const;

 private:
  mutable std::mutex failure_mu_;
  std::map<std::string, uint64_t> failures_;
};

// ---------------------------------------------------------------------------
// EventSink — JSONL structured event stream.
// ---------------------------------------------------------------------------
// Every line carries: ts_ms, run_id, event, plus the caller's fields.
class EventSink {
 public:
  EventSink(std::string run_id, std::string path, bool mirror_stderr);
  ~EventSink();

  EventSink(const EventSink&) = delete;
  EventSink& operator=(const EventSink&) = delete;

  void emit(const std::string& event, jsonlite::Object fields = {}) noexcept;

  uint64_t emitted() const { return emitted_.load(std::memory_order_relaxed); }
  uint64_t write_failures() const { return write_failures_.load(std::memory_order_relaxed); }
  const std::string& path() const { return path_; }

 private:
  std::string run_id_;
  std::string path_;
  bool mirror_stderr_{false};
  std::mutex mu_;
  FILE* file_{nullptr};
  std::atomic<uint64_t> emitted_{0};
  std::atomic<uint64_t> write_failures_{0};
};

// ---------------------------------------------------------------------------
// RunContext — the per-run bundle passed down through constructors.
// ---------------------------------------------------------------------------
struct RunContext {
  RunContext(std::string id, const std::string& event_log = "", bool verbose = false)
      : run_id(std::move(id)), events(run_id, event_log, verbose) {}

  RunContext(const RunContext&) = delete;
  RunContext& operator=(const RunContext&) = delete;

  std::string run_id;
  RunStats stats;
  EventSink events;
};

// Short random identifier for runs ("r" + 10 hex chars).
std::string new_run_id();

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace arbiter
