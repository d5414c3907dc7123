#include "stagehand/preview/process.hpp"

#include "stagehand/util/log.hpp"

#include <sys/syscall.h>
#include <sys/wait.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

extern char** environ;

namespace stagehand {

namespace {

auto pidfd_open(pid_t pid, unsigned int flags) -> int {
  return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}

auto create_pipe() -> std::pair<int, int> {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) < 0) {
    return {-1, -1};
  }
  return {fds[0], fds[1]};
}

// Built before vfork(): the child may only touch memory it does not own.
auto build_environment(
    const std::vector<std::pair<std::string, std::string>>& overrides)
    -> std::vector<std::string> {
  std::vector<std::string> env;
  for (char** e = environ; e && *e; ++e) {
    std::string_view entry{*e};
    auto eq = entry.find('=');
    auto key = entry.substr(0, eq);
    bool overridden = false;
    for (const auto& [k, _] : overrides) {
      if (k == key) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      env.emplace_back(entry);
    }
  }
  for (const auto& [k, v] : overrides) {
    env.push_back(k + "=" + v);
  }
  return env;
}

}  // namespace

auto substitute_port(std::string_view command, std::uint16_t port)
    -> std::string {
  constexpr std::string_view kPlaceholder = "{port}";
  auto port_str = std::to_string(port);

  std::string out;
  out.reserve(command.size());
  std::size_t pos = 0;
  while (true) {
    auto hit = command.find(kPlaceholder, pos);
    if (hit == std::string_view::npos) {
      out.append(command.substr(pos));
      break;
    }
    out.append(command.substr(pos, hit - pos)).append(port_str);
    pos = hit + kPlaceholder.size();
  }
  return out;
}

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

auto ProcessHandle::spawn(const SpawnOptions& options)
    -> Result<ProcessHandle> {
  auto [read_fd, write_fd] = create_pipe();
  if (read_fd < 0) {
    log::error("Failed to create pipe: {}", std::strerror(errno));
    return fail(Error::ProcessSpawnFailed);
  }

  auto env_strings = build_environment(options.env);
  std::vector<char*> envp;
  envp.reserve(env_strings.size() + 1);
  for (auto& s : env_strings) {
    envp.push_back(s.data());
  }
  envp.push_back(nullptr);

  const char* cmd = options.command.c_str();
  const char* dir =
      options.working_dir.empty() ? nullptr : options.working_dir.c_str();
  char sh[] = "sh";
  char dash_c[] = "-c";
  char* argv[] = {sh, dash_c, const_cast<char*>(cmd), nullptr};

  pid_t pid = vfork();
  if (pid < 0) {
    close(read_fd);
    close(write_fd);
    log::error("vfork failed: {}", std::strerror(errno));
    return fail(Error::ProcessSpawnFailed);
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only.
    setpgid(0, 0);

    dup2(write_fd, STDOUT_FILENO);
    dup2(write_fd, STDERR_FILENO);
    close(write_fd);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }

    if (dir && chdir(dir) < 0) {
      _exit(127);
    }

    execve("/bin/sh", argv, envp.data());
    _exit(127);
  }

  close(write_fd);
  setpgid(pid, pid);

  ProcessHandle handle;
  handle.pid_ = pid;
  handle.output_fd_ = read_fd;
  handle.pidfd_ = pidfd_open(pid, 0);
  if (handle.pidfd_ >= 0) {
    fcntl(handle.pidfd_, F_SETFD, FD_CLOEXEC);
  }
  log::debug("Spawned pid {}: {}", pid, options.command);
  return handle;
}

ProcessHandle::~ProcessHandle() {
  reset();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      output_fd_(std::exchange(other.output_fd_, -1)),
      pidfd_(std::exchange(other.pidfd_, -1)),
      exit_code_(std::exchange(other.exit_code_, std::nullopt)) {
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
  if (this != &other) {
    reset();
    pid_ = std::exchange(other.pid_, -1);
    output_fd_ = std::exchange(other.output_fd_, -1);
    pidfd_ = std::exchange(other.pidfd_, -1);
    exit_code_ = std::exchange(other.exit_code_, std::nullopt);
  }
  return *this;
}

auto ProcessHandle::reset() -> void {
  if (pid_ > 0 && !exit_code_) {
    signal_group(SIGKILL);
    (void)reap(true);
  }
  close_output();
  if (pidfd_ >= 0) {
    close(pidfd_);
    pidfd_ = -1;
  }
  pid_ = -1;
}

auto ProcessHandle::close_output() -> void {
  if (output_fd_ >= 0) {
    close(output_fd_);
    output_fd_ = -1;
  }
}

// Once the leader is reaped its pid may name someone else's group.
auto ProcessHandle::signal_group(int sig) -> void {
  if (pid_ > 0 && !exit_code_) {
    kill(-pid_, sig);
  }
}

// The exited leader stays a zombie until waitpid(), which keeps the group id
// from being reused; stragglers in the group are killed in that window.
auto ProcessHandle::reap(bool block) -> std::optional<int> {
  siginfo_t info{};
  int flags = WEXITED | WNOWAIT | (block ? 0 : WNOHANG);
  while (waitid(P_PID, static_cast<id_t>(pid_), &info, flags) != 0) {
    if (errno == EINTR) {
      continue;
    }
    log::warn("waitid failed for pid {}: {}", pid_, std::strerror(errno));
    exit_code_ = -1;
    return exit_code_;
  }
  if (info.si_pid != pid_) {
    return std::nullopt;
  }

  kill(-pid_, SIGKILL);
  int status = 0;
  if (waitpid(pid_, &status, 0) == pid_) {
    exit_code_ = get_exit_code(status);
  } else {
    exit_code_ = -1;
  }
  return exit_code_;
}

auto ProcessHandle::try_wait() -> std::optional<int> {
  if (exit_code_ || pid_ <= 0) {
    return exit_code_;
  }
  return reap(false);
}

auto ProcessHandle::wait_for(std::chrono::milliseconds timeout)
    -> std::optional<int> {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!try_wait()) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      break;
    }
    if (pidfd_ >= 0) {
      pollfd pfd{.fd = pidfd_, .events = POLLIN, .revents = 0};
      ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    } else {
      std::this_thread::sleep_for(
          std::min(remaining, std::chrono::milliseconds(10)));
    }
  }
  return exit_code_;
}

auto ProcessHandle::terminate(std::chrono::milliseconds grace) -> int {
  if (exit_code_ || pid_ <= 0) {
    return exit_code_.value_or(-1);
  }
  signal_group(SIGTERM);
  if (auto code = wait_for(grace)) {
    return *code;
  }
  log::warn("pid {} ignored SIGTERM for {}ms, killing", pid_, grace.count());
  signal_group(SIGKILL);
  return reap(true).value_or(-1);
}

}  // namespace stagehand
