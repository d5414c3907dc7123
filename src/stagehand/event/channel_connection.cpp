#include "stagehand/event/channel_connection.hpp"

namespace stagehand {

EventChannel::EventChannel(std::size_t capacity) : queue_(capacity) {
}

auto EventChannel::push(Event event) -> Result<void> {
  if (closed_.load(std::memory_order_acquire)) {
    return fail(Error::ConnectionClosed);
  }
  if (!queue_.push(std::move(event))) {
    return fail(Error::ConnectionWriteFailed);
  }
  notify();
  return ok();
}

auto EventChannel::try_pop() -> std::optional<Event> {
  return queue_.try_pop();
}

auto EventChannel::pop_for(std::chrono::milliseconds timeout)
    -> std::optional<Event> {
  if (auto ev = queue_.try_pop()) {
    return ev;
  }
  std::unique_lock lock(mu_);
  cv_.wait_for(lock, timeout, [this] {
    return !queue_.empty() || closed_.load(std::memory_order_acquire);
  });
  return queue_.try_pop();
}

auto EventChannel::close() -> void {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  notify();
}

auto EventChannel::is_closed() const noexcept -> bool {
  return closed_.load(std::memory_order_acquire);
}

auto EventChannel::size() const noexcept -> std::size_t {
  return queue_.size();
}

auto EventChannel::notify() -> void {
  // Taking the mutex orders the notify after a concurrent waiter's
  // predicate check.
  { std::lock_guard lock(mu_); }
  cv_.notify_all();
}

ChannelConnection::ChannelConnection(std::shared_ptr<EventChannel> channel)
    : channel_(std::move(channel)) {
}

auto ChannelConnection::send(const Event& event) -> Result<void> {
  return channel_->push(event);
}

auto ChannelConnection::close() -> void {
  channel_->close();
}

auto ChannelConnection::is_open() const noexcept -> bool {
  return !channel_->is_closed();
}

auto make_channel_connection(std::size_t capacity)
    -> std::pair<std::shared_ptr<EventChannel>, std::unique_ptr<IConnection>> {
  auto channel = std::make_shared<EventChannel>(capacity);
  auto conn = std::make_unique<ChannelConnection>(channel);
  return {std::move(channel), std::move(conn)};
}

}  // namespace stagehand
