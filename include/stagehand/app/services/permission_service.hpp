#pragma once

#include "stagehand/config/system_config.hpp"
#include "stagehand/core/error.hpp"
#include "stagehand/permission/permission_broker.hpp"
#include "stagehand/util/id.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace stagehand {

class EventService;

struct ToolPermissionRequest {
  ProjectId project;
  std::string request_id;
  std::string tool_name;
  nlohmann::json input;
  // Generated when absent.
  std::optional<PermissionId> id;
};

// Applies the auto-approve policy in front of the broker and announces
// pending and settled permissions on the project's stream.
class PermissionService {
public:
  PermissionService(PermissionBroker& broker, EventService& events,
                    PermissionMode mode);

  PermissionService(const PermissionService&) = delete;
  auto operator=(const PermissionService&) -> PermissionService& = delete;

  auto set_mode(PermissionMode mode) noexcept -> void;
  [[nodiscard]] auto mode() const noexcept -> PermissionMode;

  [[nodiscard]] auto request(ToolPermissionRequest req)
      -> Result<std::future<bool>>;

  // PermissionNotFound or PermissionAlreadyResolved on failure.
  [[nodiscard]] auto confirm(const PermissionId& id, bool approved)
      -> Result<PermissionState>;

  auto on_expired(const PendingPermission& entry) -> void;

  [[nodiscard]] auto pending(const std::optional<ProjectId>& project =
                                 std::nullopt) const
      -> std::vector<PendingPermission>;

private:
  PermissionBroker& broker_;
  EventService& events_;
  std::atomic<PermissionMode> mode_;
};

}  // namespace stagehand
