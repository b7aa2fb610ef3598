#include "arbiter/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>

extern char** environ;

namespace arbiter {

namespace {
void append_limited(std::string &dst, const char *src, ssize_t n,
                    std::size_t limit, bool &truncated) {
  if (n <= 0)
    return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take =
      std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) {
    truncated = true;
  }
}

// Drain whatever is currently readable without blocking.
void drain(int fd, std::string &dst, std::size_t limit, bool &truncated) {
  if (fd < 0)
    return;
  char buf[4096];
  while (true) {
    const ssize_t n = read(fd, buf, sizeof(buf));
    if (n <= 0)
      break;
    append_limited(dst, buf, n, limit, truncated);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

void ignore_sigpipe_once() {
  static std::once_flag once;
  std::call_once(once, [] { signal(SIGPIPE, SIG_IGN); });
}

bool is_executable(const std::string &path) {
  struct stat st{};
  return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
         access(path.c_str(), X_OK) == 0;
}

// Child-side failure report: write errno to the status pipe, then exit.
[[noreturn]] void child_fail(int status_fd, int code) {
  const int err = errno;
  ssize_t ignored = write(status_fd, &code, sizeof(code));
  ignored = write(status_fd, &err, sizeof(err));
  (void)ignored;
  _exit(127);
}

const char *child_stage_name(int stage) {
  switch (stage) {
  case 1: return "chdir";
  case 2: return "execve";
  default: return "setup";
  }
}
} // namespace

std::string find_executable(const std::string &name) {
  if (name.empty())
    return {};
  if (name.find('/') != std::string::npos)
    return is_executable(name) ? name : std::string{};
  const char *path_env = std::getenv("PATH");
  std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  std::stringstream ss(path);
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (dir.empty())
      continue;
    const std::string candidate = dir + "/" + name;
    if (is_executable(candidate))
      return candidate;
  }
  return {};
}

ProcessResult run_process(const ProcessSpec &spec) {
  ProcessResult result;
  ignore_sigpipe_once();

  const std::string exe = find_executable(spec.command);
  if (exe.empty()) {
    result.exit_code = 127;
    result.error_message = "spawn_failed: executable not found: " + spec.command;
    return result;
  }

  // Everything the child needs is built here, before fork().
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char *> argv;
  argv.reserve(all.size() + 1);
  for (auto &s : all)
    argv.push_back(s.data());
  argv.push_back(nullptr);

  std::map<std::string, std::string> env_map;
  if (spec.inherit_env) {
    for (char **e = environ; e && *e; ++e) {
      const std::string kv(*e);
      const auto eq = kv.find('=');
      if (eq != std::string::npos)
        env_map[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
  }
  for (const auto &[k, v] : spec.env)
    env_map[k] = v;
  std::vector<std::string> envs;
  envs.reserve(env_map.size());
  for (const auto &[k, v] : env_map)
    envs.push_back(k + "=" + v);
  std::vector<char *> envp;
  envp.reserve(envs.size() + 1);
  for (auto &e : envs)
    envp.push_back(e.data());
  envp.push_back(nullptr);

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int in_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  int stdout_file = -1;
  if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
      pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0) {
    result.error_message = std::string("spawn_failed: pipe: ") + std::strerror(errno);
    for (int *p : {out_pipe, err_pipe, in_pipe, status_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    return result;
  }
  if (!spec.stdout_path.empty()) {
    stdout_file = open(spec.stdout_path.c_str(),
                       O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (stdout_file < 0) {
      result.error_message = "spawn_failed: cannot open " + spec.stdout_path +
                             ": " + std::strerror(errno);
      for (int *p : {out_pipe, err_pipe, in_pipe, status_pipe}) {
        close_fd(p[0]);
        close_fd(p[1]);
      }
      return result;
    }
  }

  const auto started = std::chrono::steady_clock::now();
  pid_t pid = fork();
  if (pid < 0) {
    result.error_message = std::string("spawn_failed: fork: ") + std::strerror(errno);
    for (int *p : {out_pipe, err_pipe, in_pipe, status_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    close_fd(stdout_file);
    return result;
  }

  if (pid == 0) {
    setsid();
    if (spec.enforce_network_isolation) {
      // Requires CAP_SYS_ADMIN on most distros; best-effort.
      (void)unshare(CLONE_NEWNET);
    }
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(stdout_file >= 0 ? stdout_file : out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);

    if (!spec.cwd.empty()) {
      if (chdir(spec.cwd.c_str()) != 0)
        child_fail(status_pipe[1], 1);
    }

    if (spec.max_memory_bytes > 0) {
      struct rlimit rl;
      rl.rlim_cur = spec.max_memory_bytes;
      rl.rlim_max = spec.max_memory_bytes;
      setrlimit(RLIMIT_AS, &rl);
    }
    if (spec.max_file_descriptors > 0) {
      struct rlimit rl;
      rl.rlim_cur = spec.max_file_descriptors;
      rl.rlim_max = spec.max_file_descriptors;
      setrlimit(RLIMIT_NOFILE, &rl);
    }
    if (spec.limit_cpu_time && spec.timeout_ms > 0) {
      struct rlimit rl;
      rl.rlim_cur = (spec.timeout_ms + 999) / 1000;
      rl.rlim_max = rl.rlim_cur + 1;
      setrlimit(RLIMIT_CPU, &rl);
    }

    execve(exe.c_str(), argv.data(), envp.data());
    child_fail(status_pipe[1], 2);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(in_pipe[0]);
  close_fd(status_pipe[1]);
  close_fd(stdout_file);
  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(in_pipe[1], F_SETFL, O_NONBLOCK);
  if (spec.stdin_text.empty())
    close_fd(in_pipe[1]);

  const auto deadline = started + std::chrono::milliseconds(spec.timeout_ms);
  std::size_t stdin_offset = 0;
  int status = 0;
  struct rusage ru{};
  while (true) {
    if (in_pipe[1] >= 0) {
      const ssize_t w = write(in_pipe[1], spec.stdin_text.data() + stdin_offset,
                              spec.stdin_text.size() - stdin_offset);
      if (w > 0)
        stdin_offset += static_cast<std::size_t>(w);
      if ((w < 0 && errno != EAGAIN && errno != EINTR) ||
          stdin_offset >= spec.stdin_text.size())
        close_fd(in_pipe[1]);
    }

    drain(out_pipe[0], result.stdout_text, spec.max_output_bytes,
          result.stdout_truncated);
    drain(err_pipe[0], result.stderr_text, spec.max_output_bytes,
          result.stderr_truncated);

    const pid_t w = wait4(pid, &status, WNOHANG, &ru);
    if (w == pid)
      break;
    if (std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      wait4(pid, &status, 0, &ru);
      result.timed_out = true;
      break;
    }

    struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    poll(fds, 2, 5);
  }
  // Reap stragglers the command left behind in its process group.
  kill(-pid, SIGKILL);
  result.duration_ns = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::steady_clock::now() - started)
          .count());

  drain(out_pipe[0], result.stdout_text, spec.max_output_bytes,
        result.stdout_truncated);
  drain(err_pipe[0], result.stderr_text, spec.max_output_bytes,
        result.stderr_truncated);
  close_fd(out_pipe[0]);
  close_fd(err_pipe[0]);
  close_fd(in_pipe[1]);

  int child_stage = 0;
  int child_errno = 0;
  if (read(status_pipe[0], &child_stage, sizeof(child_stage)) ==
          static_cast<ssize_t>(sizeof(child_stage)) &&
      read(status_pipe[0], &child_errno, sizeof(child_errno)) ==
          static_cast<ssize_t>(sizeof(child_errno))) {
    result.error_message = std::string("spawn_failed: ") +
                           child_stage_name(child_stage) + ": " +
                           std::strerror(child_errno);
  }
  close_fd(status_pipe[0]);

  if (result.stdout_truncated)
    result.stdout_text += "(truncated)";
  if (result.stderr_truncated)
    result.stderr_text += "(truncated)";

  result.usage.cpu_user_us =
      static_cast<std::uint64_t>(ru.ru_utime.tv_sec) * 1000000u +
      static_cast<std::uint64_t>(ru.ru_utime.tv_usec);
  result.usage.cpu_system_us =
      static_cast<std::uint64_t>(ru.ru_stime.tv_sec) * 1000000u +
      static_cast<std::uint64_t>(ru.ru_stime.tv_usec);
  // Linux reports ru_maxrss in kilobytes.
  result.usage.max_rss_bytes = static_cast<std::uint64_t>(ru.ru_maxrss) * 1024u;
  result.usage.block_input_ops = static_cast<std::uint64_t>(ru.ru_inblock);
  result.usage.block_output_ops = static_cast<std::uint64_t>(ru.ru_oublock);

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace arbiter
