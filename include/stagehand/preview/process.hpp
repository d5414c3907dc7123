#pragma once

#include "stagehand/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace stagehand {

struct SpawnOptions {
  std::string command;
  std::string working_dir;
  std::vector<std::pair<std::string, std::string>> env;
};

// Replaces every "{port}" in `command`.
[[nodiscard]] auto substitute_port(std::string_view command,
                                   std::uint16_t port) -> std::string;

[[nodiscard]] auto get_exit_code(int status) -> int;

// A child running `/bin/sh -c command` in its own process group, with
// stdout and stderr merged into one non-blocking pipe. Destroying a handle
// whose child is still alive kills the whole group and reaps it.
class ProcessHandle {
public:
  [[nodiscard]] static auto spawn(const SpawnOptions& options)
      -> Result<ProcessHandle>;

  ProcessHandle() = default;
  ~ProcessHandle();

  ProcessHandle(ProcessHandle&& other) noexcept;
  ProcessHandle& operator=(ProcessHandle&& other) noexcept;
  ProcessHandle(const ProcessHandle&) = delete;
  ProcessHandle& operator=(const ProcessHandle&) = delete;

  [[nodiscard]] auto pid() const noexcept -> pid_t {
    return pid_;
  }
  [[nodiscard]] auto output_fd() const noexcept -> int {
    return output_fd_;
  }
  // -1 when the kernel has no pidfd_open.
  [[nodiscard]] auto pidfd() const noexcept -> int {
    return pidfd_;
  }
  [[nodiscard]] auto exit_code() const noexcept -> std::optional<int> {
    return exit_code_;
  }

  auto close_output() -> void;
  // No-op once the child has been reaped.
  auto signal_group(int sig) -> void;

  // Non-blocking reap. Kills whatever is left of the group when the leader
  // has exited.
  auto try_wait() -> std::optional<int>;
  // Blocks up to `timeout` for the child to exit.
  auto wait_for(std::chrono::milliseconds timeout) -> std::optional<int>;
  // SIGTERM, then SIGKILL after `grace`; always reaps.
  auto terminate(std::chrono::milliseconds grace) -> int;

private:
  auto reset() -> void;
  auto reap(bool block) -> std::optional<int>;

  pid_t pid_{-1};
  int output_fd_{-1};
  int pidfd_{-1};
  std::optional<int> exit_code_;
};

}  // namespace stagehand
