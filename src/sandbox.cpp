#include "arbiter/sandbox.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <filesystem>

#include "arbiter/fsutil.hpp"
#include "arbiter/hash.hpp"
#include "arbiter/jsonlite.hpp"
#include "arbiter/version.hpp"

namespace fs = std::filesystem;

namespace arbiter {

using jsonlite::Object;
using jsonlite::Value;

namespace {

inline bool starts_with(const std::string& v, const std::string& prefix) {
  return v.size() >= prefix.size() && v.compare(0, prefix.size(), prefix) == 0;
}

// Ceiling for command timeouts when no explicit maximum is configured.
constexpr uint64_t kUnboundedTimeoutMs = 7ull * 24 * 3600 * 1000;

Value str(const std::string& s) { return Value{s}; }
Value u64(uint64_t v) { return Value{static_cast<std::uint64_t>(v)}; }

// Workspace-relative spelling of an absolute path already confined to root.
std::string relative_to(const std::string& root, const std::string& abs) {
  if (abs == root) return "";
  return abs.substr(root.size() + 1);
}

std::string container_path(const std::string& rel) {
  return rel.empty() ? std::string(kContainerWorkdir) : std::string(kContainerWorkdir) + "/" + rel;
}

}  // namespace

std::string to_string(SandboxState state) {
  switch (state) {
    case SandboxState::active: return "active";
    case SandboxState::snapshotted: return "snapshotted";
    case SandboxState::destroyed: return "destroyed";
  }
  return "unknown";
}

std::string sanitize_name(const std::string& id) {
  std::string out;
  out.reserve(id.size());
  for (char c : id) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
        c == '-' || c == '_' || c == '.') {
      out.push_back(c);
    } else {
      out.push_back('_');
    }
  }
  if (out.empty() || out == "." || out == "..") out = "_" + out;
  return out;
}

namespace {

// True when some existing component of base/rel, walked lexically, is a
// symlink. weakly_canonical leaves a dangling link unresolved, so the walk is
// what stops a planted link from redirecting host-side writes.
bool crosses_symlink(const fs::path& base, const std::string& rel) {
  fs::path lexical = fs::path(rel).lexically_normal();
  if (lexical.is_absolute()) lexical = lexical.lexically_relative(base);
  fs::path cur = base;
  for (const auto& part : lexical) {
    if (part.empty() || part == ".") continue;
    if (part == "..") return false;  // left to the prefix check
    cur /= part;
    std::error_code ec;
    const auto st = fs::symlink_status(cur, ec);
    if (st.type() == fs::file_type::not_found) return false;
    if (ec) return true;
    if (st.type() == fs::file_type::symlink) return true;
  }
  return false;
}

}  // namespace

// Path normalization with symlink rejection and confinement check.
// EXTENSION_POINT: landlock
//   Current: canonicalization plus symlink rejection only. The container mount
//   is the real boundary for agent commands; this guards the host-side file
//   operations the evaluator performs on the agent's behalf.
std::string normalize_under(const std::string& workspace, const std::string& p) {
  if (p.find('\0') != std::string::npos) return "";
  std::string rel = p;
  const std::string mount = kContainerWorkdir;
  if (rel == mount) {
    rel.clear();
  } else if (starts_with(rel, mount + "/")) {
    rel = rel.substr(mount.size() + 1);
  }

  std::error_code ec;
  const fs::path base = fs::weakly_canonical(fs::path(workspace), ec);
  if (ec) return "";
  if (!rel.empty() && crosses_symlink(base, rel)) return "";
  const fs::path in = rel.empty() ? base : fs::weakly_canonical(base / rel, ec);
  if (ec) return "";
  const std::string base_str = base.string();
  std::string in_str = in.string();
  while (in_str.size() > 1 && in_str.back() == '/') in_str.pop_back();
  if (in_str != base_str && !starts_with(in_str, base_str + "/")) return "";
  return in_str;
}

std::map<std::string, std::string> workspace_manifest(const std::string& root) {
  std::map<std::string, std::string> manifest;
  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) return manifest;
  const std::string base = fs::path(root).string();
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) break;
    const fs::directory_entry& entry = *it;
    const std::string rel = fs::relative(entry.path(), base, ec).generic_string();
    if (ec) {
      ec.clear();
      continue;
    }
    if (entry.is_symlink(ec)) {
      manifest[rel] = hash_domain("ws:", "link:" + fs::read_symlink(entry.path(), ec).string());
      ec.clear();
    } else if (entry.is_regular_file(ec)) {
      manifest[rel] = hash_file_blake3_hex(entry.path().string());
    }
  }
  return manifest;
}

void require_success(const CommandLog& log) {
  if (log.timed_out) {
    throw CommandTimeoutError("'" + log.command + "' exceeded its timeout after " +
                              jsonlite::format_double(log.duration_seconds) + "s");
  }
  if (log.error_code == to_string(ErrorCode::spawn_failed)) {
    throw Error(ErrorCode::spawn_failed, log.stderr_text);
  }
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Sandbox::Sandbox(std::shared_ptr<ContainerEngine> engine, SandboxOptions options, RunContext& run,
                 std::string workspace, std::string state_dir)
    : engine_(std::move(engine)),
      options_(std::move(options)),
      run_(run),
      workspace_(std::move(workspace)),
      state_dir_(std::move(state_dir)),
      audit_((fs::path(state_dir_) / "audit.ndjson").string()),
      created_at_(utc_timestamp_iso8601()),
      started_(std::chrono::steady_clock::now()) {}

std::unique_ptr<Sandbox> Sandbox::create(std::shared_ptr<ContainerEngine> engine,
                                         SandboxOptions options, RunContext& run) {
  if (!engine) throw InvalidArgument("sandbox requires a container engine");
  if (options.name.empty()) throw InvalidArgument("sandbox name must not be empty");
  if (options.workspace_dir.empty()) throw InvalidArgument("sandbox workspace_dir must not be empty");
  if (options.default_command_timeout_ms == 0) {
    throw InvalidArgument("default command timeout must be > 0");
  }

  auto fail = [&](const std::string& why) {
    run.stats.provisioning_failures.fetch_add(1, std::memory_order_relaxed);
    run.stats.record_failure(ErrorCode::provisioning_failed);
    run.events.emit("sandbox_failed", {{"sandbox", str(options.name)},
                                       {"task_id", str(options.task_id)},
                                       {"error", str(why)}});
  };

  // Workspaces are never shared: the directory must be new or empty.
  std::error_code ec;
  const fs::path ws(options.workspace_dir);
  if (fs::exists(ws, ec)) {
    if (!fs::is_directory(ws, ec) || !fs::is_empty(ws, ec)) {
      const std::string why = "workspace already in use: " + options.workspace_dir;
      fail(why);
      throw ProvisioningError(why);
    }
  } else if (!fs::create_directories(ws, ec) || ec) {
    const std::string why = "cannot create workspace " + options.workspace_dir + ": " + ec.message();
    fail(why);
    throw ProvisioningError(why);
  }

  const std::string workspace = fs::weakly_canonical(ws, ec).string();
  if (ec || workspace.empty()) {
    const std::string why = "cannot resolve workspace " + options.workspace_dir;
    fail(why);
    throw ProvisioningError(why);
  }
  const std::string state_dir =
      options.state_dir.empty() ? workspace + ".state" : options.state_dir;
  fs::create_directories(state_dir, ec);
  if (ec) {
    fs::remove_all(ws, ec);
    const std::string why = "cannot create state dir " + state_dir;
    fail(why);
    throw ProvisioningError(why);
  }

  ContainerSpec spec;
  spec.name = options.name;
  spec.image = options.base_image;
  spec.workspace_dir = workspace;
  spec.cpu_limit = options.cpu_limit;
  spec.memory_limit_bytes = options.memory_limit_bytes;
  spec.network_enabled = options.network_enabled;
  spec.labels = options.labels;
  spec.labels["arbiter.task"] = options.task_id;
  spec.labels["arbiter.run"] = run.run_id;

  ContainerHandle handle;
  try {
    handle = engine->create(spec);
  } catch (const ProvisioningError& e) {
    std::error_code rm_ec;
    fs::remove_all(state_dir, rm_ec);
    fs::remove_all(workspace, rm_ec);
    fail(e.what());
    throw;
  }

  std::unique_ptr<Sandbox> sandbox(
      new Sandbox(std::move(engine), std::move(options), run, workspace, state_dir));
  sandbox->handle_ = std::move(handle);
  sandbox->baseline_manifest_ = workspace_manifest(workspace);

  run.stats.sandboxes_created.fetch_add(1, std::memory_order_relaxed);
  run.events.emit("sandbox_created", {{"sandbox", str(sandbox->options_.name)},
                                      {"task_id", str(sandbox->options_.task_id)},
                                      {"container_id", str(sandbox->handle_.id)},
                                      {"engine", str(sandbox->engine_->engine_id())},
                                      {"workspace", str(workspace)}});
  return sandbox;
}

Sandbox::~Sandbox() {
  cleanup(true);
}

void Sandbox::require_live(const char* op) const {
  if (state_ == SandboxState::destroyed) {
    throw SandboxTerminatedError(std::string(op) + " on destroyed sandbox " + options_.name);
  }
}

std::string Sandbox::resolve_path(const std::string& path) const {
  const std::string resolved = normalize_under(workspace_, path);
  if (resolved.empty()) {
    run_.stats.path_escapes.fetch_add(1, std::memory_order_relaxed);
    run_.events.emit("path_escape", {{"sandbox", str(options_.name)},
                                     {"task_id", str(options_.task_id)},
                                     {"path", str(path)}});
    throw PathEscapeError("path resolves outside the workspace: " + path);
  }
  return resolved;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

CommandLog Sandbox::execute_command(const std::string& command, double timeout_seconds,
                                    const std::string& working_directory) {
  if (!std::isfinite(timeout_seconds) || timeout_seconds < 0.0) {
    throw InvalidArgument("timeout must be a positive number of seconds");
  }

  std::lock_guard<std::mutex> lk(mu_);
  require_live("execute_command");

  // Clamp in double: the model supplies timeout_seconds and may send 1e30.
  const uint64_t ceiling_ms =
      options_.max_command_timeout_ms > 0 ? options_.max_command_timeout_ms : kUnboundedTimeoutMs;
  uint64_t timeout_ms = std::min(options_.default_command_timeout_ms, ceiling_ms);
  if (timeout_seconds > 0.0) {
    const double requested_ms = std::ceil(timeout_seconds * 1000.0);
    timeout_ms = requested_ms >= static_cast<double>(ceiling_ms)
                     ? ceiling_ms
                     : static_cast<uint64_t>(requested_ms);
  }
  timeout_ms = std::max<uint64_t>(timeout_ms, 1);

  std::string rel_wd;
  if (!working_directory.empty()) {
    rel_wd = relative_to(workspace_, resolve_path(working_directory));
  }

  ExecRequest request;
  request.command = command;
  request.working_directory = rel_wd;
  request.timeout_ms = timeout_ms;
  request.max_output_bytes = options_.max_output_bytes;

  CommandLog log;
  log.command = command;
  log.working_directory = container_path(rel_wd);
  log.started_at_unix_ms = unix_time_ms();

  const ProcessResult r = engine_->exec(handle_, request);

  log.duration_seconds = static_cast<double>(r.duration_ns) / 1e9;
  log.exit_code = r.exit_code;
  log.timed_out = r.timed_out;
  log.stdout_text = r.stdout_text;
  log.stderr_text = r.stderr_text;

  rusage_.cpu_seconds +=
      static_cast<double>(r.usage.cpu_user_us + r.usage.cpu_system_us) / 1e6;
  rusage_.memory_peak_bytes = std::max(rusage_.memory_peak_bytes, r.usage.max_rss_bytes);
  rusage_.disk_io_bytes += (r.usage.block_input_ops + r.usage.block_output_ops) * 512u;

  if (!r.spawned()) {
    log.exit_code = 127;
    log.error_code = to_string(ErrorCode::spawn_failed);
    log.stderr_text = r.error_message;
  } else if (r.timed_out) {
    log.error_code = to_string(ErrorCode::command_timeout);
    run_.stats.command_timeouts.fetch_add(1, std::memory_order_relaxed);
    // Counters restart with the container; fold them in before the reset.
    refresh_resource_metrics(true);
    std::string reset_error;
    if (engine_->reset(handle_, &reset_error)) {
      run_.stats.container_resets.fetch_add(1, std::memory_order_relaxed);
    } else {
      // A container that cannot be confirmed clean is not reused.
      log.stderr_text += "\nsandbox reset failed: " + reset_error;
      engine_->remove(handle_);
      state_ = SandboxState::destroyed;
      metrics_.error_message = "sandbox reset failed after timeout: " + reset_error;
    }
  }

  if (!container_stats_seen_) {
    metrics_.cpu_time_seconds = rusage_.cpu_seconds;
    metrics_.memory_peak_bytes = rusage_.memory_peak_bytes;
    metrics_.disk_io_bytes = rusage_.disk_io_bytes;
  }

  ++metrics_.commands_executed;
  run_.stats.commands_executed.fetch_add(1, std::memory_order_relaxed);
  run_.stats.command_latency.record(r.duration_ns);

  if (!audit_.append(log)) {
    run_.events.emit("audit_stream_failure", {{"sandbox", str(options_.name)},
                                              {"path", str(audit_.stream_path())}});
  }
  run_.events.emit("command_executed", {{"sandbox", str(options_.name)},
                                        {"task_id", str(options_.task_id)},
                                        {"sequence_no", u64(log.sequence_no)},
                                        {"exit_code", u64(static_cast<uint64_t>(log.exit_code < 0 ? 0 : log.exit_code))},
                                        {"timed_out", Value{log.timed_out}},
                                        {"duration_s", Value{log.duration_seconds}}});
  return log;
}

// ---------------------------------------------------------------------------
// File operations
// ---------------------------------------------------------------------------

std::string Sandbox::read_file(const std::string& path) {
  std::lock_guard<std::mutex> lk(mu_);
  require_live("read_file");
  const std::string target = resolve_path(path);
  std::error_code ec;
  if (!fs::is_regular_file(target, ec)) {
    throw Error(ErrorCode::io_error, "no such file: " + path);
  }
  const auto size = fs::file_size(target, ec);
  if (!ec && size > options_.max_read_bytes) {
    throw Error(ErrorCode::io_error, "file too large to read (" + std::to_string(size) +
                                         " bytes): " + path);
  }
  auto data = read_file_bytes(target);
  if (!data) throw Error(ErrorCode::io_error, "cannot read " + path);
  return *data;
}

void Sandbox::write_file(const std::string& path, const std::string& content) {
  std::lock_guard<std::mutex> lk(mu_);
  require_live("write_file");
  const std::string target = resolve_path(path);
  if (target == workspace_) {
    throw InvalidArgument("write_file needs a file path, got the workspace root");
  }
  std::error_code ec;
  if (fs::is_directory(target, ec)) {
    throw Error(ErrorCode::io_error, "is a directory: " + path);
  }
  fs::create_directories(fs::path(target).parent_path(), ec);
  if (ec) {
    throw Error(ErrorCode::io_error, "cannot create parent of " + path + ": " + ec.message());
  }
  // O_NOFOLLOW: a link planted after resolve_path still cannot redirect the write.
  const int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW, 0644);
  if (fd < 0) {
    if (errno == ELOOP) throw PathEscapeError("refusing to write through a symlink: " + path);
    throw Error(ErrorCode::io_error,
                "cannot open " + path + " for writing: " + std::strerror(errno));
  }
  std::size_t off = 0;
  while (off < content.size()) {
    const ssize_t n = ::write(fd, content.data() + off, content.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      const int err = errno;
      ::close(fd);
      throw Error(ErrorCode::io_error, "short write to " + path + ": " + std::strerror(err));
    }
    off += static_cast<std::size_t>(n);
  }
  if (::close(fd) != 0) throw Error(ErrorCode::io_error, "cannot close " + path);
}

std::vector<FileEntry> Sandbox::list_files(const std::string& path) {
  std::lock_guard<std::mutex> lk(mu_);
  require_live("list_files");
  const std::string dir = resolve_path(path);
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) throw Error(ErrorCode::io_error, "not a directory: " + path);

  std::vector<FileEntry> out;
  for (fs::directory_iterator it(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    FileEntry e;
    e.path = relative_to(workspace_, it->path().string());
    const auto st = it->symlink_status(ec);
    e.is_directory = fs::is_directory(st);
    if (fs::is_regular_file(st)) e.size_bytes = it->file_size(ec);
    ec.clear();
    out.push_back(std::move(e));
  }
  if (ec) throw Error(ErrorCode::io_error, "cannot list " + path + ": " + ec.message());
  std::sort(out.begin(), out.end(),
            [](const FileEntry& a, const FileEntry& b) { return a.path < b.path; });
  return out;
}

std::vector<FileEntry> Sandbox::read_directory(const std::string& path, std::size_t max_entries) {
  std::lock_guard<std::mutex> lk(mu_);
  require_live("read_directory");
  const std::string dir = resolve_path(path);
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) throw Error(ErrorCode::io_error, "not a directory: " + path);

  std::vector<FileEntry> out;
  fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (out.size() >= max_entries) break;
    FileEntry e;
    e.path = relative_to(workspace_, it->path().string());
    const auto st = it->symlink_status(ec);
    e.is_directory = fs::is_directory(st);
    if (fs::is_regular_file(st)) e.size_bytes = it->file_size(ec);
    ec.clear();
    out.push_back(std::move(e));
  }
  if (ec) throw Error(ErrorCode::io_error, "cannot walk " + path + ": " + ec.message());
  std::sort(out.begin(), out.end(),
            [](const FileEntry& a, const FileEntry& b) { return a.path < b.path; });
  return out;
}

// ---------------------------------------------------------------------------
// Metrics
// ---------------------------------------------------------------------------

void Sandbox::refresh_resource_metrics(bool fold) {
  if (state_ == SandboxState::destroyed) return;
  const auto s = engine_->stats(handle_);
  if (!s) return;
  container_stats_seen_ = true;
  if (fold) {
    stats_carry_.cpu_seconds += s->cpu_seconds;
    stats_carry_.disk_io_bytes += s->disk_io_bytes;
    stats_carry_.memory_peak_bytes = std::max(stats_carry_.memory_peak_bytes, s->memory_peak_bytes);
    metrics_.cpu_time_seconds = stats_carry_.cpu_seconds;
    metrics_.disk_io_bytes = stats_carry_.disk_io_bytes;
    metrics_.memory_peak_bytes = stats_carry_.memory_peak_bytes;
    return;
  }
  metrics_.cpu_time_seconds = stats_carry_.cpu_seconds + s->cpu_seconds;
  metrics_.disk_io_bytes = stats_carry_.disk_io_bytes + s->disk_io_bytes;
  metrics_.memory_peak_bytes = std::max(stats_carry_.memory_peak_bytes, s->memory_peak_bytes);
}

void Sandbox::finalize_file_metrics() {
  if (files_finalized_) return;
  std::error_code ec;
  if (!fs::is_directory(workspace_, ec)) return;
  const auto current = workspace_manifest(workspace_);
  uint64_t created = 0;
  uint64_t modified = 0;
  for (const auto& [rel, digest] : current) {
    auto it = baseline_manifest_.find(rel);
    if (it == baseline_manifest_.end()) {
      ++created;
    } else if (it->second != digest) {
      ++modified;
    }
  }
  metrics_.files_created = created;
  metrics_.files_modified = modified;
  files_finalized_ = true;
}

void Sandbox::refresh_duration() {
  if (frozen_) return;
  metrics_.duration_seconds =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
}

SandboxMetrics Sandbox::metrics() const {
  std::lock_guard<std::mutex> lk(mu_);
  SandboxMetrics m = metrics_;
  if (!frozen_) {
    m.duration_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
  }
  return m;
}

void Sandbox::mark_result(bool success, const std::string& error_message) {
  std::lock_guard<std::mutex> lk(mu_);
  if (frozen_) return;
  metrics_.success = success;
  if (!error_message.empty()) metrics_.error_message = error_message;
}

SandboxState Sandbox::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

std::string Sandbox::saved_dir() const {
  std::lock_guard<std::mutex> lk(mu_);
  return saved_dir_;
}

std::vector<std::string> Sandbox::cleanup_errors() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cleanup_errors_;
}

// ---------------------------------------------------------------------------
// Snapshot + metadata
// ---------------------------------------------------------------------------

SnapshotArchive Sandbox::snapshot_filesystem() {
  std::lock_guard<std::mutex> lk(mu_);
  if (snapshot_) return *snapshot_;
  require_live("snapshot_filesystem");

  const std::string tar_path = (fs::path(state_dir_) / "filesystem.tar").string();
  std::string error;
  if (!engine_->export_workspace(handle_, tar_path, &error)) {
    throw Error(ErrorCode::io_error, "workspace export failed: " + error);
  }
  SnapshotArchive archive;
  archive.path = tar_path;
  archive.digest = hash_file_blake3_hex(tar_path);
  std::error_code ec;
  archive.size_bytes = fs::file_size(tar_path, ec);
  if (archive.digest.empty() || ec) {
    throw Error(ErrorCode::io_error, "cannot read snapshot archive " + tar_path);
  }

  finalize_file_metrics();
  refresh_resource_metrics(false);
  refresh_duration();
  state_ = SandboxState::snapshotted;
  snapshot_ = archive;
  return archive;
}

Object Sandbox::metadata_object() const {
  Object o;
  o["format_version"] = u64(version::SNAPSHOT_FORMAT_VERSION);
  o["task_id"] = str(options_.task_id);
  o["sandbox_name"] = str(options_.name);
  o["state"] = str(to_string(state_));
  o["workspace_dir"] = str(workspace_);
  o["created_at"] = str(created_at_);
  o["saved_at"] = str(utc_timestamp_iso8601());

  Object container;
  container["id"] = str(handle_.id);
  container["name"] = str(handle_.name);
  container["image"] = str(options_.base_image);
  container["engine"] = str(engine_->engine_id());
  o["container"] = Value{std::move(container)};

  Object limits;
  limits["cpu_limit"] = Value{options_.cpu_limit};
  limits["memory_limit_bytes"] = u64(options_.memory_limit_bytes);
  limits["network_enabled"] = Value{options_.network_enabled};
  limits["command_timeout_ms"] = u64(options_.default_command_timeout_ms);
  limits["max_output_bytes"] = u64(options_.max_output_bytes);
  o["limits"] = Value{std::move(limits)};

  jsonlite::Array logs;
  for (const auto& log : audit_.entries()) logs.push_back(command_log_to_value(log));
  o["command_log"] = Value{std::move(logs)};
  o["metrics"] = sandbox_metrics_to_value(metrics_);

  Object audit;
  audit["version"] = u64(version::AUDIT_LOG_VERSION);
  audit["entries"] = u64(audit_.entry_count());
  audit["head_digest"] = str(audit_.head_digest());
  audit["stream"] = str("audit.ndjson");
  o["audit"] = Value{std::move(audit)};

  if (snapshot_) {
    Object snap;
    snap["file"] = str("filesystem.tar");
    snap["digest"] = str(snapshot_->digest);
    snap["size_bytes"] = u64(snapshot_->size_bytes);
    o["snapshot"] = Value{std::move(snap)};
  } else {
    o["snapshot"] = Value{nullptr};
  }
  return o;
}

void Sandbox::write_metadata(const std::string& dir) const {
  const std::string path = (fs::path(dir) / "metadata.json").string();
  if (!atomic_write(path, jsonlite::to_json_pretty(Value{metadata_object()}))) {
    throw Error(ErrorCode::io_error, "cannot write " + path);
  }
}

std::string Sandbox::save_metadata(const std::string& output_dir) {
  if (output_dir.empty()) throw InvalidArgument("save_metadata needs an output directory");
  const std::string label = sanitize_name(
      !options_.snapshot_label.empty() ? options_.snapshot_label
                                       : (!options_.task_id.empty() ? options_.task_id : options_.name));
  const std::string dir = (fs::path(output_dir) / label).string();
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (saved_dir_ == dir) return dir;
    require_live("save_metadata");
  }

  const SnapshotArchive archive = snapshot_filesystem();

  std::lock_guard<std::mutex> lk(mu_);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) throw Error(ErrorCode::io_error, "cannot create " + dir + ": " + ec.message());
  fs::copy_file(archive.path, fs::path(dir) / "filesystem.tar",
                fs::copy_options::overwrite_existing, ec);
  if (ec) throw Error(ErrorCode::io_error, "cannot copy snapshot to " + dir + ": " + ec.message());
  if (fs::exists(audit_.stream_path(), ec)) {
    fs::copy_file(audit_.stream_path(), fs::path(dir) / "audit.ndjson",
                  fs::copy_options::overwrite_existing, ec);
    if (ec) throw Error(ErrorCode::io_error, "cannot copy audit stream to " + dir + ": " + ec.message());
  }
  refresh_duration();
  write_metadata(dir);
  saved_dir_ = dir;
  return dir;
}

// ---------------------------------------------------------------------------
// Teardown
// ---------------------------------------------------------------------------

void Sandbox::cleanup(bool keep_snapshot) noexcept {
  try {
    std::lock_guard<std::mutex> lk(mu_);
    std::error_code ec;
    if (state_ == SandboxState::destroyed && frozen_) {
      if (!keep_snapshot && !saved_dir_.empty()) {
        fs::remove_all(saved_dir_, ec);
        if (ec) cleanup_errors_.push_back("remove " + saved_dir_ + ": " + ec.message());
        saved_dir_.clear();
      }
      return;
    }

    refresh_resource_metrics(false);
    finalize_file_metrics();
    refresh_duration();
    frozen_ = true;

    if (state_ != SandboxState::destroyed && !engine_->remove(handle_)) {
      cleanup_errors_.push_back("container remove failed: " + handle_.id);
    }
    state_ = SandboxState::destroyed;

    if (!saved_dir_.empty()) {
      if (keep_snapshot) {
        // Persisted metadata reflects the frozen metrics and terminal state.
        try {
          write_metadata(saved_dir_);
        } catch (const Error& e) {
          cleanup_errors_.push_back(e.describe());
        }
      } else {
        fs::remove_all(saved_dir_, ec);
        if (ec) cleanup_errors_.push_back("remove " + saved_dir_ + ": " + ec.message());
        saved_dir_.clear();
      }
    }

    fs::remove_all(state_dir_, ec);
    if (ec) cleanup_errors_.push_back("remove " + state_dir_ + ": " + ec.message());
    ec.clear();
    if (!options_.keep_workspace) {
      fs::remove_all(workspace_, ec);
      if (ec) cleanup_errors_.push_back("remove " + workspace_ + ": " + ec.message());
    }

    run_.events.emit("sandbox_destroyed", {{"sandbox", str(options_.name)},
                                           {"task_id", str(options_.task_id)},
                                           {"commands", u64(metrics_.commands_executed)},
                                           {"cleanup_errors", u64(cleanup_errors_.size())}});
  } catch (const std::exception& e) {
    run_.events.emit("sandbox_cleanup_failed", {{"sandbox", str(options_.name)},
                                                {"error", str(e.what())}});
  }
}

}  // namespace arbiter
