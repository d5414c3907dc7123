#pragma once

#include "stagehand/core/error.hpp"
#include "stagehand/event/event.hpp"
#include "stagehand/storage/request_store.hpp"
#include "stagehand/util/id.hpp"

namespace stagehand {

struct TaskStatusSummary {
  bool has_active_requests{false};
  int active_count{0};

  [[nodiscard]] auto to_json() const -> nlohmann::json;
  [[nodiscard]] auto to_event() const -> Event;
};

// Counts a project's open requests. Nothing is cached; every call reads
// the store.
class TaskStatusTracker {
public:
  explicit TaskStatusTracker(IRequestStore& store) : store_(store) {
  }

  [[nodiscard]] auto summarize(const ProjectId& project) const
      -> Result<TaskStatusSummary>;

private:
  IRequestStore& store_;
};

}  // namespace stagehand
