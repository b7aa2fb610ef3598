#pragma once

// arbiter/container.hpp — Isolation primitive behind every Sandbox.
//
// DESIGN:
//   ContainerEngine is a stateless client. One instance is constructed per
//   evaluator run and shared by all workers; it holds only immutable
//   configuration, never per-task state. Per-container facts travel in the
//   ContainerHandle value returned by create().
//
//   DockerCliEngine  drives the docker CLI through run_process(). Every call
//                    is bounded by a timeout; nothing talks to the daemon
//                    socket directly.
//   ProcessEngine    runs commands as host processes inside the workspace
//                    with rlimits. It provides NO filesystem or process
//                    isolation and exists for development and tests.
//
// EXTENSION_POINT: podman / containerd
//   Implement ContainerEngine against another CLI. The contract: create()
//   throws ProvisioningError, remove() is idempotent and never throws, and
//   reset() leaves no process from a timed-out exec alive.

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "arbiter/process.hpp"

namespace arbiter {

// Mount point of the workspace inside the container.
constexpr const char* kContainerWorkdir = "/workspace";

struct ContainerSpec {
  std::string name;
  std::string image;
  std::string workspace_dir;               // host path, bind-mounted at kContainerWorkdir
  double cpu_limit{2.0};
  std::uint64_t memory_limit_bytes{0};     // 0 = engine default
  bool network_enabled{false};
  std::uint32_t pids_limit{256};
  std::map<std::string, std::string> labels;
};

struct ContainerHandle {
  std::string id;
  std::string name;
  std::string image;
  std::string workspace_dir;
  std::uint64_t memory_limit_bytes{0};
  bool network_enabled{false};
};

struct ExecRequest {
  std::string command;                     // passed to /bin/sh -c
  std::string working_directory;           // relative to the workspace, "" = root
  std::uint64_t timeout_ms{30000};
  std::size_t max_output_bytes{65536};
};

struct ContainerStats {
  double cpu_seconds{0.0};
  std::uint64_t memory_peak_bytes{0};
  std::uint64_t disk_io_bytes{0};
};

class ContainerEngine {
 public:
  virtual ~ContainerEngine() = default;

  virtual std::string engine_id() const = 0;

  // Reachability check. Returns false and fills *error when unusable.
  virtual bool ping(std::string* error) = 0;

  // Throws ProvisioningError.
  virtual ContainerHandle create(const ContainerSpec& spec) = 0;

  virtual ProcessResult exec(const ContainerHandle& handle, const ExecRequest& request) = 0;

  // Kill every process in the container and confirm it is usable again.
  virtual bool reset(const ContainerHandle& handle, std::string* error) = 0;

  // Resource counters of the container since its (re)start, when the engine
  // can observe them. nullopt means the caller accounts from exec rusage.
  virtual std::optional<ContainerStats> stats(const ContainerHandle& handle) = 0;

  // Write a tar of the workspace tree to tar_path.
  virtual bool export_workspace(const ContainerHandle& handle, const std::string& tar_path,
                                std::string* error) = 0;

  // Idempotent. Returns true when the container is gone afterwards.
  virtual bool remove(const ContainerHandle& handle) noexcept = 0;
};

struct DockerEngineOptions {
  std::string docker_binary{"docker"};
  std::uint64_t cli_timeout_ms{120000};
  bool run_as_host_user{true};             // keep bind-mounted files owned by us
};

class DockerCliEngine : public ContainerEngine {
 public:
  explicit DockerCliEngine(DockerEngineOptions options = {});

  std::string engine_id() const override { return "docker"; }
  bool ping(std::string* error) override;
  ContainerHandle create(const ContainerSpec& spec) override;
  ProcessResult exec(const ContainerHandle& handle, const ExecRequest& request) override;
  bool reset(const ContainerHandle& handle, std::string* error) override;
  std::optional<ContainerStats> stats(const ContainerHandle& handle) override;
  bool export_workspace(const ContainerHandle& handle, const std::string& tar_path,
                        std::string* error) override;
  bool remove(const ContainerHandle& handle) noexcept override;

 private:
  ProcessResult docker(const std::vector<std::string>& args, std::uint64_t timeout_ms,
                       std::size_t max_output = 65536, const std::string& stdout_path = "") const;

  DockerEngineOptions options_;
};

struct ProcessEngineOptions {
  std::string shell{"/bin/sh"};
  std::string path_env{"/usr/local/bin:/usr/bin:/bin"};
  std::uint64_t max_file_descriptors{1024};
};

class ProcessEngine : public ContainerEngine {
 public:
  explicit ProcessEngine(ProcessEngineOptions options = {});

  std::string engine_id() const override { return "process"; }
  bool ping(std::string* error) override;
  ContainerHandle create(const ContainerSpec& spec) override;
  ProcessResult exec(const ContainerHandle& handle, const ExecRequest& request) override;
  bool reset(const ContainerHandle& handle, std::string* error) override;
  std::optional<ContainerStats> stats(const ContainerHandle& handle) override;
  bool export_workspace(const ContainerHandle& handle, const std::string& tar_path,
                        std::string* error) override;
  bool remove(const ContainerHandle& handle) noexcept override;

 private:
  ProcessEngineOptions options_;
};

// "docker" | "process". Throws ConfigError for anything else.
std::shared_ptr<ContainerEngine> make_container_engine(const std::string& kind);

// Parse the concatenated cgroup v2 files emitted by DockerCliEngine::stats():
// cpu.stat, "---", memory.peak, "---", io.stat.
ContainerStats parse_cgroup_stats(const std::string& text);

}  // namespace arbiter
