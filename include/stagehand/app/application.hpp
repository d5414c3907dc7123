#pragma once

#include "stagehand/config/config.hpp"
#include "stagehand/core/error.hpp"
#include "stagehand/util/id.hpp"

#include <atomic>
#include <memory>
#include <string_view>

namespace stagehand {

class ApiServer;
class EventChannel;
class EventHub;
class EventService;
class IRequestStore;
class PermissionBroker;
class PermissionService;
class PortAllocator;
class ProcessSupervisor;
class TaskStatusTracker;

// Owns every component and wires them together. Components exist from
// construction; start() brings up the threads and the API server.
class Application {
public:
  explicit Application(SystemConfig config = {});
  // Uses `store` instead of opening storage.db_file.
  Application(SystemConfig config, std::shared_ptr<IRequestStore> store);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  [[nodiscard]] auto config() const noexcept -> const Config&;

  // Lifecycle
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Service access
  [[nodiscard]] auto hub() -> EventHub&;
  [[nodiscard]] auto broker() -> PermissionBroker&;
  [[nodiscard]] auto supervisor() -> ProcessSupervisor&;
  [[nodiscard]] auto tracker() -> TaskStatusTracker&;
  [[nodiscard]] auto events() -> EventService&;
  [[nodiscard]] auto permissions() -> PermissionService&;
  [[nodiscard]] auto request_store() -> IRequestStore&;
  [[nodiscard]] auto api_server() -> ApiServer*;

  // In-process subscription sized by stream.channel_capacity. A reader that
  // falls that far behind is dropped by the hub.
  [[nodiscard]] auto open_stream(const ProjectId& project)
      -> Result<std::shared_ptr<EventChannel>>;

private:
  auto wire() -> void;

  std::atomic<bool> running_{false};
  Config config_;

  std::shared_ptr<IRequestStore> store_;
  std::unique_ptr<TaskStatusTracker> tracker_;
  std::unique_ptr<EventHub> hub_;
  std::unique_ptr<PortAllocator> allocator_;
  std::unique_ptr<ProcessSupervisor> supervisor_;
  std::unique_ptr<PermissionBroker> broker_;
  std::unique_ptr<EventService> events_;
  std::unique_ptr<PermissionService> permissions_;

  std::unique_ptr<ApiServer> api_;
};

}  // namespace stagehand
