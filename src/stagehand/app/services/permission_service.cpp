#include "stagehand/app/services/permission_service.hpp"

#include "stagehand/app/services/event_service.hpp"
#include "stagehand/core/constants.hpp"
#include "stagehand/permission/permission_policy.hpp"
#include "stagehand/util/log.hpp"
#include "stagehand/util/util.hpp"

namespace stagehand {

PermissionService::PermissionService(PermissionBroker& broker,
                                     EventService& events, PermissionMode mode)
    : broker_(broker), events_(events), mode_(mode) {
}

auto PermissionService::set_mode(PermissionMode mode) noexcept -> void {
  mode_.store(mode);
}

auto PermissionService::mode() const noexcept -> PermissionMode {
  return mode_.load();
}

auto PermissionService::request(ToolPermissionRequest req)
    -> Result<std::future<bool>> {
  auto mode = mode_.load();
  if (should_auto_approve(mode, req.tool_name)) {
    log::info("Auto-approved {} for request {} ({})", req.tool_name,
              req.request_id, permission_mode_to_string(mode));
    std::promise<bool> approved;
    approved.set_value(true);
    return approved.get_future();
  }

  auto id = req.id.value_or(PermissionId{generate_uuid()});
  auto preview = make_input_preview(req.input, io::kInputPreviewLimit);
  auto project = req.project;
  auto request_id = req.request_id;
  auto tool_name = req.tool_name;

  auto future = broker_.create({.id = id,
                                .project = std::move(req.project),
                                .request_id = std::move(req.request_id),
                                .kind = std::move(req.tool_name),
                                .payload = std::move(req.input)});
  if (!future) {
    return std::unexpected(future.error());
  }

  events_.emit_status(project, "permission_required",
                      {{"requestId", request_id},
                       {"metadata",
                        {{"permissionId", id.value()},
                         {"toolName", tool_name},
                         {"inputPreview", preview}}}});
  return std::move(*future);
}

auto PermissionService::confirm(const PermissionId& id, bool approved)
    -> Result<PermissionState> {
  auto settled = broker_.settle(id, approved);
  if (!settled) {
    return std::unexpected(settled.error());
  }

  events_.emit_status(settled->project, "permission_resolved",
                      {{"requestId", settled->request_id},
                       {"metadata",
                        {{"permissionId", id.value()},
                         {"approved", approved},
                         {"toolName", settled->kind}}}});
  return approved ? PermissionState::Approved : PermissionState::Denied;
}

auto PermissionService::on_expired(const PendingPermission& entry) -> void {
  events_.emit_status(entry.project, "permission_resolved",
                      {{"requestId", entry.request_id},
                       {"metadata",
                        {{"permissionId", entry.id.value()},
                         {"approved", false},
                         {"expired", true},
                         {"toolName", entry.kind}}}});
}

auto PermissionService::pending(const std::optional<ProjectId>& project) const
    -> std::vector<PendingPermission> {
  return broker_.list(project);
}

}  // namespace stagehand
