#pragma once

#include "stagehand/core/constants.hpp"
#include "stagehand/core/error.hpp"
#include "stagehand/event/connection.hpp"
#include "stagehand/event/event.hpp"
#include "stagehand/util/id.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace stagehand {

// Produces the state events a new subscriber receives right after the
// connection ack (preview status, request summary).
using SnapshotProvider =
    std::function<std::vector<Event>(const ProjectId& project)>;

// Per-project publish/subscribe broadcast.
//
// Delivery is best effort and at most once. Each connection sees events in
// publish order; a connection that fails a write is dropped without
// affecting the others. Events published while nobody is subscribed are
// discarded. A project's registry is dropped once its last connection
// leaves.
class EventHub {
public:
  explicit EventHub(std::chrono::milliseconds heartbeat_interval =
                        timing::kHeartbeatInterval);
  ~EventHub();

  EventHub(const EventHub&) = delete;
  auto operator=(const EventHub&) -> EventHub& = delete;

  auto set_snapshot_provider(SnapshotProvider provider) -> void;

  // Heartbeat thread.
  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Sends the connection ack and the snapshot before the connection becomes
  // visible to publish(). Fails if either write fails.
  [[nodiscard]] auto subscribe(const ProjectId& project,
                               std::unique_ptr<IConnection> conn,
                               std::string_view transport = "sse")
      -> Result<ConnectionId>;
  auto unsubscribe(const ProjectId& project, const ConnectionId& id) -> bool;

  // Returns the number of connections the event was written to.
  auto publish(const ProjectId& project, const Event& event) -> std::size_t;

  [[nodiscard]] auto stream_count(const ProjectId& project) const
      -> std::size_t;
  [[nodiscard]] auto total_stream_count() const -> std::size_t;
  // Projects with at least one live or registering connection.
  [[nodiscard]] auto project_count() const -> std::size_t;
  auto close_project_streams(const ProjectId& project) -> std::size_t;
  auto close_all_streams() -> std::size_t;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace stagehand
