#include "arbiter/container.hpp"

// DockerCliEngine — docker CLI driven through run_process().
//
// Container lifecycle:
//   create  docker run -d ... <image> tail -f /dev/null
//   exec    docker exec -w /workspace[/<rel>] <id> /bin/sh -c <cmd>
//   reset   docker restart -t 0 <id>   (kills every process, keeps the bind mount)
//   export  docker cp <id>:/workspace/. -   (tar stream to a file)
//   remove  docker rm -f <id>
//
// Killing the docker CLI on an exec timeout does not stop the process inside
// the container; the Sandbox follows every timed-out exec with reset().

#include <unistd.h>

#include <cstdio>
#include <sstream>

#include "arbiter/types.hpp"

namespace arbiter {

namespace {

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::string format_cpus(double cpus) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", cpus);
  return buf;
}

std::string describe_failure(const ProcessResult& r) {
  if (!r.spawned()) return r.error_message;
  if (r.timed_out) return "docker cli timed out";
  const std::string err = trim(r.stderr_text);
  return "docker exited " + std::to_string(r.exit_code) + (err.empty() ? "" : ": " + err);
}

}  // namespace

DockerCliEngine::DockerCliEngine(DockerEngineOptions options) : options_(std::move(options)) {}

ProcessResult DockerCliEngine::docker(const std::vector<std::string>& args, std::uint64_t timeout_ms,
                                      std::size_t max_output, const std::string& stdout_path) const {
  ProcessSpec spec;
  spec.command = options_.docker_binary;
  spec.argv = args;
  spec.inherit_env = true;  // DOCKER_HOST, DOCKER_CONFIG, PATH
  spec.timeout_ms = timeout_ms;
  spec.max_output_bytes = max_output;
  spec.stdout_path = stdout_path;
  spec.limit_cpu_time = false;
  return run_process(spec);
}

bool DockerCliEngine::ping(std::string* error) {
  const auto r = docker({"version", "--format", "{{.Server.Version}}"}, 15000);
  if (r.ok() && !trim(r.stdout_text).empty()) return true;
  if (error) *error = describe_failure(r);
  return false;
}

ContainerHandle DockerCliEngine::create(const ContainerSpec& spec) {
  std::vector<std::string> args = {"run", "-d", "--name", spec.name,
                                   "--label", "arbiter.managed=true"};
  for (const auto& [k, v] : spec.labels) {
    args.push_back("--label");
    args.push_back(k + "=" + v);
  }
  if (spec.cpu_limit > 0) {
    args.push_back("--cpus");
    args.push_back(format_cpus(spec.cpu_limit));
  }
  if (spec.memory_limit_bytes > 0) {
    args.push_back("--memory");
    args.push_back(std::to_string(spec.memory_limit_bytes));
    // No swap beyond the memory limit.
    args.push_back("--memory-swap");
    args.push_back(std::to_string(spec.memory_limit_bytes));
  }
  if (spec.pids_limit > 0) {
    args.push_back("--pids-limit");
    args.push_back(std::to_string(spec.pids_limit));
  }
  if (!spec.network_enabled) {
    args.push_back("--network");
    args.push_back("none");
  }
  if (options_.run_as_host_user) {
    args.push_back("--user");
    args.push_back(std::to_string(getuid()) + ":" + std::to_string(getgid()));
    args.push_back("-e");
    args.push_back("HOME=/tmp");
  }
  args.push_back("-e");
  args.push_back("PYTHONHASHSEED=0");
  args.push_back("-v");
  args.push_back(spec.workspace_dir + ":" + kContainerWorkdir);
  args.push_back("-w");
  args.push_back(kContainerWorkdir);
  args.push_back(spec.image);
  args.push_back("tail");
  args.push_back("-f");
  args.push_back("/dev/null");

  const auto r = docker(args, options_.cli_timeout_ms);
  if (!r.ok()) {
    // A half-created container must not outlive the failed attempt.
    (void)docker({"rm", "-f", spec.name}, 30000);
    throw ProvisioningError("container " + spec.name + " (" + spec.image + "): " + describe_failure(r));
  }

  ContainerHandle handle;
  handle.id = trim(r.stdout_text);
  handle.name = spec.name;
  handle.image = spec.image;
  handle.workspace_dir = spec.workspace_dir;
  handle.memory_limit_bytes = spec.memory_limit_bytes;
  handle.network_enabled = spec.network_enabled;
  if (handle.id.empty()) handle.id = spec.name;
  return handle;
}

ProcessResult DockerCliEngine::exec(const ContainerHandle& handle, const ExecRequest& request) {
  std::string workdir = kContainerWorkdir;
  if (!request.working_directory.empty()) workdir += "/" + request.working_directory;
  return docker({"exec", "-w", workdir, handle.id, "/bin/sh", "-c", request.command},
                request.timeout_ms, request.max_output_bytes);
}

bool DockerCliEngine::reset(const ContainerHandle& handle, std::string* error) {
  const auto r = docker({"restart", "-t", "0", handle.id}, options_.cli_timeout_ms);
  if (!r.ok()) {
    if (error) *error = describe_failure(r);
    return false;
  }
  const auto inspect = docker({"inspect", "-f", "{{.State.Running}}", handle.id}, 15000);
  if (!inspect.ok() || trim(inspect.stdout_text) != "true") {
    if (error) *error = "container not running after reset: " + describe_failure(inspect);
    return false;
  }
  return true;
}

std::optional<ContainerStats> DockerCliEngine::stats(const ContainerHandle& handle) {
  const auto r = docker(
      {"exec", handle.id, "/bin/sh", "-c",
       "cat /sys/fs/cgroup/cpu.stat; echo ---; "
       "cat /sys/fs/cgroup/memory.peak 2>/dev/null || cat /sys/fs/cgroup/memory.current; "
       "echo ---; cat /sys/fs/cgroup/io.stat 2>/dev/null"},
      15000);
  if (!r.ok()) return std::nullopt;
  return parse_cgroup_stats(r.stdout_text);
}

bool DockerCliEngine::export_workspace(const ContainerHandle& handle, const std::string& tar_path,
                                       std::string* error) {
  const auto r = docker({"cp", handle.id + ":" + kContainerWorkdir + "/.", "-"},
                        options_.cli_timeout_ms, 65536, tar_path);
  if (!r.ok()) {
    if (error) *error = describe_failure(r);
    return false;
  }
  return true;
}

bool DockerCliEngine::remove(const ContainerHandle& handle) noexcept {
  try {
    const auto r = docker({"rm", "-f", handle.id}, options_.cli_timeout_ms);
    if (r.ok()) return true;
    return r.stderr_text.find("No such container") != std::string::npos;
  } catch (const std::exception&) {
    return false;
  }
}

ContainerStats parse_cgroup_stats(const std::string& text) {
  ContainerStats stats;
  std::istringstream in(text);
  std::string line;
  int section = 0;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line == "---") {
      ++section;
      continue;
    }
    if (line.empty()) continue;
    if (section == 0) {
      std::istringstream ls(line);
      std::string key;
      unsigned long long value = 0;
      if (ls >> key >> value && key == "usage_usec") {
        stats.cpu_seconds = static_cast<double>(value) / 1e6;
      }
    } else if (section == 1) {
      try {
        stats.memory_peak_bytes = std::stoull(line);
      } catch (const std::exception&) {
        stats.memory_peak_bytes = 0;
      }
    } else {
      // "<major>:<minor> rbytes=N wbytes=N rios=N ..."
      std::istringstream ls(line);
      std::string field;
      while (ls >> field) {
        const auto eq = field.find('=');
        if (eq == std::string::npos) continue;
        const std::string key = field.substr(0, eq);
        if (key != "rbytes" && key != "wbytes") continue;
        try {
          stats.disk_io_bytes += std::stoull(field.substr(eq + 1));
        } catch (const std::exception&) {
          continue;
        }
      }
    }
  }
  return stats;
}

}  // namespace arbiter
