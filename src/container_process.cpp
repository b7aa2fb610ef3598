#include "arbiter/container.hpp"

// ProcessEngine — host processes confined only by rlimits and the workspace
// cwd. Agent commands can read and write anything the evaluator user can.
// Use it for development and tests, never for untrusted agents.

#include <filesystem>
#include <system_error>

#include "arbiter/types.hpp"

namespace fs = std::filesystem;

namespace arbiter {

ProcessEngine::ProcessEngine(ProcessEngineOptions options) : options_(std::move(options)) {}

bool ProcessEngine::ping(std::string* error) {
  if (find_executable(options_.shell).empty()) {
    if (error) *error = "shell not executable: " + options_.shell;
    return false;
  }
  return true;
}

ContainerHandle ProcessEngine::create(const ContainerSpec& spec) {
  std::error_code ec;
  fs::create_directories(spec.workspace_dir, ec);
  if (ec || !fs::is_directory(spec.workspace_dir)) {
    throw ProvisioningError("workspace " + spec.workspace_dir + ": " +
                            (ec ? ec.message() : std::string("not a directory")));
  }
  if (!ping(nullptr)) {
    throw ProvisioningError("shell not executable: " + options_.shell);
  }
  ContainerHandle handle;
  handle.id = "proc-" + spec.name;
  handle.name = spec.name;
  handle.image = spec.image;
  handle.workspace_dir = spec.workspace_dir;
  handle.memory_limit_bytes = spec.memory_limit_bytes;
  handle.network_enabled = spec.network_enabled;
  return handle;
}

ProcessResult ProcessEngine::exec(const ContainerHandle& handle, const ExecRequest& request) {
  ProcessSpec spec;
  spec.command = options_.shell;
  spec.argv = {"-c", request.command};
  spec.cwd = request.working_directory.empty()
                 ? handle.workspace_dir
                 : (fs::path(handle.workspace_dir) / request.working_directory).string();
  spec.env = {{"PATH", options_.path_env},
              {"HOME", handle.workspace_dir},
              {"PYTHONHASHSEED", "0"},
              {"LANG", "C.UTF-8"}};
  spec.timeout_ms = request.timeout_ms;
  spec.max_output_bytes = request.max_output_bytes;
  spec.enforce_network_isolation = !handle.network_enabled;
  spec.max_memory_bytes = handle.memory_limit_bytes;
  spec.max_file_descriptors = options_.max_file_descriptors;
  return run_process(spec);
}

bool ProcessEngine::reset(const ContainerHandle&, std::string*) {
  // run_process() already killed the whole process group.
  return true;
}

std::optional<ContainerStats> ProcessEngine::stats(const ContainerHandle&) {
  return std::nullopt;
}

bool ProcessEngine::export_workspace(const ContainerHandle& handle, const std::string& tar_path,
                                     std::string* error) {
  ProcessSpec spec;
  spec.command = "tar";
  spec.argv = {"-cf", tar_path, "-C", handle.workspace_dir, "."};
  spec.inherit_env = true;
  spec.timeout_ms = 120000;
  spec.limit_cpu_time = false;
  const auto r = run_process(spec);
  if (!r.ok()) {
    if (error) {
      *error = r.spawned() ? "tar exited " + std::to_string(r.exit_code) + ": " + r.stderr_text
                           : r.error_message;
    }
    return false;
  }
  return true;
}

bool ProcessEngine::remove(const ContainerHandle&) noexcept {
  return true;
}

std::shared_ptr<ContainerEngine> make_container_engine(const std::string& kind) {
  if (kind == "docker") return std::make_shared<DockerCliEngine>();
  if (kind == "process") return std::make_shared<ProcessEngine>();
  throw ConfigError("unknown engine: " + kind + " (expected docker|process)");
}

}  // namespace arbiter
