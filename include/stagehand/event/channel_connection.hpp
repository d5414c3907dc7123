#pragma once

#include "stagehand/core/constants.hpp"
#include "stagehand/core/lockfree_queue.hpp"
#include "stagehand/event/connection.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace stagehand {

// In-process bounded event channel. Any number of writers, one reader.
class EventChannel {
public:
  explicit EventChannel(std::size_t capacity = io::kChannelCapacity);

  EventChannel(const EventChannel&) = delete;
  auto operator=(const EventChannel&) -> EventChannel& = delete;

  [[nodiscard]] auto push(Event event) -> Result<void>;
  [[nodiscard]] auto try_pop() -> std::optional<Event>;
  [[nodiscard]] auto pop_for(std::chrono::milliseconds timeout)
      -> std::optional<Event>;

  auto close() -> void;
  [[nodiscard]] auto is_closed() const noexcept -> bool;
  [[nodiscard]] auto size() const noexcept -> std::size_t;

private:
  auto notify() -> void;

  BoundedMPSCQueue<Event> queue_;
  std::atomic<bool> closed_{false};
  std::mutex mu_;
  std::condition_variable cv_;
};

class ChannelConnection : public IConnection {
public:
  explicit ChannelConnection(std::shared_ptr<EventChannel> channel);

  [[nodiscard]] auto send(const Event& event) -> Result<void> override;
  auto close() -> void override;
  [[nodiscard]] auto is_open() const noexcept -> bool override;

private:
  std::shared_ptr<EventChannel> channel_;
};

// Returns the reader side and a connection ready to hand to EventHub.
[[nodiscard]] auto make_channel_connection(
    std::size_t capacity = io::kChannelCapacity)
    -> std::pair<std::shared_ptr<EventChannel>, std::unique_ptr<IConnection>>;

}  // namespace stagehand
