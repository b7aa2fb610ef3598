#pragma once

// arbiter/process.hpp — Bounded child-process execution.
//
// Every subprocess arbiter starts goes through run_process(): agent commands
// (ProcessEngine), the docker CLI (DockerCliEngine), curl (model RPC and
// dataset download), gzip and tar. One code path means one place where
// timeouts, output caps and process-group teardown are enforced.
//
// TIMEOUT CONTRACT:
//   The child runs in its own session. At the deadline the whole process
//   group receives SIGKILL and is reaped before run_process() returns, so a
//   timed-out command never leaks processes. exit_code is 124, timed_out is
//   true. A child killed by a signal reports 128 + signal.
//
// THREAD SAFETY:
//   run_process() is safe to call concurrently. argv/envp are prepared
//   before fork() so the child only calls async-signal-safe functions, and
//   all pipe fds are O_CLOEXEC so concurrent spawns never inherit each
//   other's pipes.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace arbiter {

struct ProcessSpec {
  std::string command;                       // absolute path or PATH-resolved name
  std::vector<std::string> argv;             // arguments after argv[0]
  std::map<std::string, std::string> env;    // explicit environment
  bool inherit_env{false};                   // start from the parent's environ
  std::string cwd;
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{4096};
  std::string stdin_text;                    // fed to the child, then closed
  std::string stdout_path;                   // redirect stdout to this file
  bool enforce_network_isolation{false};     // best-effort unshare(CLONE_NEWNET)
  bool limit_cpu_time{true};                 // RLIMIT_CPU derived from timeout_ms
  std::uint64_t max_memory_bytes{0};         // RLIMIT_AS, 0 = unlimited
  std::uint64_t max_file_descriptors{0};     // RLIMIT_NOFILE, 0 = unlimited
};

struct ResourceUsage {
  std::uint64_t cpu_user_us{0};
  std::uint64_t cpu_system_us{0};
  std::uint64_t max_rss_bytes{0};
  std::uint64_t block_input_ops{0};
  std::uint64_t block_output_ops{0};
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;                 // non-empty when the spawn itself failed
  std::uint64_t duration_ns{0};
  ResourceUsage usage;

  bool spawned() const { return error_message.empty(); }
  bool ok() const { return spawned() && !timed_out && exit_code == 0; }
};

ProcessResult run_process(const ProcessSpec& spec);

// Resolve a program name through PATH. Names containing '/' are returned
// unchanged if executable. Returns "" if not found.
std::string find_executable(const std::string& name);

}  // namespace arbiter
