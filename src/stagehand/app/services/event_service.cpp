#include "stagehand/app/services/event_service.hpp"

#include "stagehand/event/event_hub.hpp"
#include "stagehand/preview/process_supervisor.hpp"
#include "stagehand/util/log.hpp"

namespace stagehand {

namespace {

auto is_task_lifecycle(EventType type) noexcept -> bool {
  return type == EventType::TaskStarted || type == EventType::TaskCompleted ||
         type == EventType::TaskInterrupted || type == EventType::TaskError;
}

}  // namespace

EventService::EventService(EventHub& hub, TaskStatusTracker& tracker)
    : hub_(hub), tracker_(tracker) {
}

auto EventService::emit_preview_status(const PreviewDescriptor& desc) -> void {
  hub_.publish(desc.project,
               events::preview_status(preview_state_to_string(desc.status),
                                      desc.to_json()));
}

auto EventService::emit_log(const ProjectId& project, std::string_view level,
                            std::string_view content, std::string_view source)
    -> void {
  hub_.publish(project, events::log(level, content, source, project));
}

auto EventService::emit_request_status(const ProjectId& project) -> void {
  hub_.publish(project, request_summary(project).to_event());
}

auto EventService::emit_task_lifecycle(const ProjectId& project,
                                       EventType lifecycle,
                                       nlohmann::json data) -> void {
  if (!is_task_lifecycle(lifecycle)) {
    log::warn("Ignoring non-lifecycle event {} for project {}",
              event_type_to_string(lifecycle), project);
    return;
  }
  if (data.is_object() && !data.contains("projectId")) {
    data["projectId"] = project.value();
  }
  hub_.publish(project, events::task(lifecycle, std::move(data)));
  emit_request_status(project);
}

auto EventService::emit_error(const ProjectId& project,
                              std::string_view message, nlohmann::json data)
    -> void {
  hub_.publish(project, events::error(message, std::move(data)));
}

auto EventService::emit_status(const ProjectId& project,
                               std::string_view status, nlohmann::json extra)
    -> void {
  hub_.publish(project, events::status(status, std::move(extra)));
}

auto EventService::emit_message(const ProjectId& project, nlohmann::json data)
    -> void {
  hub_.publish(project, events::message(std::move(data)));
}

auto EventService::request_summary(const ProjectId& project) const
    -> TaskStatusSummary {
  auto summary = tracker_.summarize(project);
  if (!summary) {
    log::warn("Request summary for {} unavailable: {}", project,
              summary.error().message());
    return {};
  }
  return *summary;
}

}  // namespace stagehand
