#include "stagehand/status/task_status_tracker.hpp"

#include <algorithm>

namespace stagehand {

auto TaskStatusSummary::to_json() const -> nlohmann::json {
  return {{"hasActiveRequests", has_active_requests},
          {"activeCount", active_count}};
}

auto TaskStatusSummary::to_event() const -> Event {
  return events::request_status(has_active_requests, active_count);
}

auto TaskStatusTracker::summarize(const ProjectId& project) const
    -> Result<TaskStatusSummary> {
  auto requests = store_.list_requests(project);
  if (!requests) {
    return std::unexpected(requests.error());
  }

  auto count = std::ranges::count_if(*requests, [this](const RequestRecord& r) {
    return store_.is_open_status(r.status);
  });
  return TaskStatusSummary{.has_active_requests = count > 0,
                           .active_count = static_cast<int>(count)};
}

}  // namespace stagehand
