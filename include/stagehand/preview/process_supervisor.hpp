#pragma once

#include "stagehand/config/system_config.hpp"
#include "stagehand/core/error.hpp"
#include "stagehand/preview/port_allocator.hpp"
#include "stagehand/util/id.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace stagehand {

class EventHub;

enum class PreviewState : std::uint8_t {
  Idle,
  Starting,
  Running,
  Ready,
  Error,
  Stopped,
};

[[nodiscard]] constexpr auto preview_state_to_string(PreviewState s) noexcept
    -> std::string_view {
  switch (s) {
    case PreviewState::Idle: return "idle";
    case PreviewState::Starting: return "starting";
    case PreviewState::Running: return "running";
    case PreviewState::Ready: return "ready";
    case PreviewState::Error: return "error";
    case PreviewState::Stopped: return "stopped";
  }
  return "idle";
}

[[nodiscard]] constexpr auto is_active(PreviewState s) noexcept -> bool {
  return s == PreviewState::Starting || s == PreviewState::Running ||
         s == PreviewState::Ready;
}

struct PreviewDescriptor {
  ProjectId project;
  PreviewState status{PreviewState::Idle};
  std::optional<std::uint16_t> port;
  std::string url;
  std::optional<int> pid;
  std::string detail;

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

// Returns true once the dev server accepts connections on `port`.
using ReadyProbe = std::function<bool(std::uint16_t port)>;

// TCP connect to 127.0.0.1:port with a short timeout.
[[nodiscard]] auto tcp_ready_probe(std::uint16_t port) -> bool;

// At most one dev-server process per project.
//
// start() and stop() for the same project are serialized by a per-project
// lock held across port allocation and spawn, so concurrent start() calls
// share one process. Each live process has a monitor thread that forwards
// its output as log events and drives running -> ready | error.
class ProcessSupervisor {
public:
  ProcessSupervisor(PreviewConfig config, PortAllocator& allocator,
                    EventHub& hub);
  ~ProcessSupervisor();

  ProcessSupervisor(const ProcessSupervisor&) = delete;
  auto operator=(const ProcessSupervisor&) -> ProcessSupervisor& = delete;

  auto set_ready_probe(ReadyProbe probe) -> void;

  // Returns the live instance's descriptor when one is already starting,
  // running or ready.
  [[nodiscard]] auto start(const ProjectId& project)
      -> Result<PreviewDescriptor>;
  // Idempotent.
  auto stop(const ProjectId& project) -> PreviewDescriptor;
  [[nodiscard]] auto status(const ProjectId& project) const
      -> PreviewDescriptor;
  auto stop_all() -> void;
  [[nodiscard]] auto active_count() const -> std::size_t;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace stagehand
