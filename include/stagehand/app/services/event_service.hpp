#pragma once

#include "stagehand/event/event.hpp"
#include "stagehand/status/task_status_tracker.hpp"
#include "stagehand/util/id.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace stagehand {

class EventHub;
struct PreviewDescriptor;

// Typed publishing front for the event hub.
class EventService {
public:
  EventService(EventHub& hub, TaskStatusTracker& tracker);

  EventService(const EventService&) = delete;
  auto operator=(const EventService&) -> EventService& = delete;

  auto emit_preview_status(const PreviewDescriptor& desc) -> void;
  auto emit_log(const ProjectId& project, std::string_view level,
                std::string_view content, std::string_view source) -> void;
  auto emit_request_status(const ProjectId& project) -> void;
  auto emit_task_lifecycle(const ProjectId& project, EventType lifecycle,
                           nlohmann::json data) -> void;
  auto emit_error(const ProjectId& project, std::string_view message,
                  nlohmann::json data = nlohmann::json::object()) -> void;
  auto emit_status(const ProjectId& project, std::string_view status,
                   nlohmann::json extra = nlohmann::json::object()) -> void;
  auto emit_message(const ProjectId& project, nlohmann::json data) -> void;

  // Store failures read as "nothing active".
  [[nodiscard]] auto request_summary(const ProjectId& project) const
      -> TaskStatusSummary;

private:
  EventHub& hub_;
  TaskStatusTracker& tracker_;
};

}  // namespace stagehand
