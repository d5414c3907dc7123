#include "stagehand/event/event_hub.hpp"

#include "stagehand/util/log.hpp"
#include "stagehand/util/util.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>

namespace stagehand {

namespace {

using Clock = std::chrono::steady_clock;

struct Subscriber {
  ConnectionId id;
  std::shared_ptr<IConnection> conn;
  Clock::time_point next_heartbeat;
};

using SubscriberPtr = std::shared_ptr<Subscriber>;

// publish_mu serializes every write to the project's connections (ack,
// snapshot, publish, heartbeat) so that each connection observes a single
// total order. registry_mu guards only the subscriber list; unsubscribe takes
// it alone and may run while a publish is iterating its own copy.
// `pending` counts subscribe() calls that hold the channel but have not
// registered yet; a channel is pruned only when both are zero.
struct ProjectChannel {
  std::mutex publish_mu;
  mutable std::mutex registry_mu;
  std::vector<SubscriberPtr> subscribers;
  std::size_t pending{0};

  [[nodiscard]] auto snapshot() const -> std::vector<SubscriberPtr> {
    std::lock_guard lock(registry_mu);
    return subscribers;
  }

  auto remove(const std::vector<SubscriberPtr>& dead) -> void {
    if (dead.empty()) {
      return;
    }
    std::lock_guard lock(registry_mu);
    std::erase_if(subscribers, [&](const SubscriberPtr& s) {
      return std::ranges::find(dead, s) != dead.end();
    });
  }
};

using ChannelPtr = std::shared_ptr<ProjectChannel>;

}  // namespace

struct EventHub::Impl {
  std::chrono::milliseconds heartbeat_interval;
  SnapshotProvider snapshot_provider;

  mutable std::mutex projects_mu;
  std::unordered_map<ProjectId, ChannelPtr> projects;

  std::atomic<bool> running{false};
  std::jthread heartbeat_thread;
  std::mutex wake_mu;
  std::condition_variable_any wake_cv;

  explicit Impl(std::chrono::milliseconds interval)
      : heartbeat_interval(interval) {
  }

  [[nodiscard]] auto find(const ProjectId& project) const -> ChannelPtr {
    std::lock_guard lock(projects_mu);
    auto it = projects.find(project);
    return it == projects.end() ? nullptr : it->second;
  }

  // Pins the channel for a subscribe() in progress.
  [[nodiscard]] auto acquire(const ProjectId& project) -> ChannelPtr {
    std::lock_guard lock(projects_mu);
    auto& slot = projects[project];
    if (!slot) {
      slot = std::make_shared<ProjectChannel>();
    }
    std::lock_guard registry_lock(slot->registry_mu);
    ++slot->pending;
    return slot;
  }

  // Lock order: projects_mu, then registry_mu.
  auto prune(const ProjectId& project, const ChannelPtr& ch) -> void {
    std::lock_guard lock(projects_mu);
    auto it = projects.find(project);
    if (it == projects.end() || it->second != ch) {
      return;
    }
    std::lock_guard registry_lock(ch->registry_mu);
    if (ch->subscribers.empty() && ch->pending == 0) {
      projects.erase(it);
    }
  }

  [[nodiscard]] auto all_channels() const -> std::vector<ChannelPtr> {
    std::lock_guard lock(projects_mu);
    std::vector<ChannelPtr> out;
    out.reserve(projects.size());
    for (const auto& [_, ch] : projects) {
      out.push_back(ch);
    }
    return out;
  }

  static auto drop(const ProjectId& project, const SubscriberPtr& sub,
                   const std::error_code& ec) -> void {
    log::warn("Dropping connection {} on project {}: {}", sub->id, project,
              ec.message());
    sub->conn->close();
  }

  // Transports serialize inside send(); a throw there counts as a failed
  // write for that connection only.
  static auto send_to(const SubscriberPtr& sub, const Event& event)
      -> Result<void> {
    try {
      return sub->conn->send(event);
    } catch (const std::exception& e) {
      log::error("Connection {} failed to send {}: {}", sub->id,
                 event_type_to_string(event.type), e.what());
      return fail(Error::ConnectionWriteFailed);
    }
  }

  // Caller holds ch.publish_mu.
  auto deliver(const ProjectId& project, const ChannelPtr& ch,
               const Event& event) -> std::size_t {
    auto subs = ch->snapshot();
    std::vector<SubscriberPtr> dead;
    std::size_t delivered = 0;

    for (const auto& sub : subs) {
      if (auto r = send_to(sub, event); !r) {
        dead.push_back(sub);
        drop(project, sub, r.error());
        continue;
      }
      ++delivered;
    }
    if (!dead.empty()) {
      ch->remove(dead);
      prune(project, ch);
    }
    return delivered;
  }

  // Returns the earliest pending heartbeat deadline.
  auto beat(Clock::time_point now) -> Clock::time_point {
    auto next = now + heartbeat_interval;

    std::vector<std::pair<ProjectId, ChannelPtr>> channels;
    {
      std::lock_guard lock(projects_mu);
      channels.assign(projects.begin(), projects.end());
    }

    for (auto& [project, ch] : channels) {
      std::lock_guard publish_lock(ch->publish_mu);
      std::vector<SubscriberPtr> dead;
      for (const auto& sub : ch->snapshot()) {
        if (sub->next_heartbeat <= now) {
          if (auto r = send_to(sub, events::heartbeat(sub->id)); !r) {
            dead.push_back(sub);
            drop(project, sub, r.error());
            continue;
          }
          sub->next_heartbeat = now + heartbeat_interval;
        }
        next = std::min(next, sub->next_heartbeat);
      }
      if (!dead.empty()) {
        ch->remove(dead);
        prune(project, ch);
      }
    }
    return next;
  }

  auto heartbeat_loop(std::stop_token st) -> void {
    while (!st.stop_requested()) {
      auto next = beat(Clock::now());
      std::unique_lock lock(wake_mu);
      (void)wake_cv.wait_until(lock, st, next, [] { return false; });
    }
  }
};

EventHub::EventHub(std::chrono::milliseconds heartbeat_interval)
    : impl_(std::make_unique<Impl>(heartbeat_interval)) {
}

EventHub::~EventHub() {
  stop();
}

auto EventHub::set_snapshot_provider(SnapshotProvider provider) -> void {
  impl_->snapshot_provider = std::move(provider);
}

auto EventHub::start() -> void {
  if (impl_->running.exchange(true)) {
    return;
  }
  impl_->heartbeat_thread = std::jthread(
      [this](std::stop_token st) { impl_->heartbeat_loop(std::move(st)); });
  log::info("EventHub started (heartbeat every {}ms)",
            impl_->heartbeat_interval.count());
}

auto EventHub::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }
  if (impl_->heartbeat_thread.joinable()) {
    impl_->heartbeat_thread.request_stop();
    impl_->heartbeat_thread.join();
  }
  log::info("EventHub stopped");
}

auto EventHub::is_running() const noexcept -> bool {
  return impl_->running.load();
}

auto EventHub::subscribe(const ProjectId& project,
                         std::unique_ptr<IConnection> conn,
                         std::string_view transport) -> Result<ConnectionId> {
  if (!conn || project.empty()) {
    return fail(Error::InvalidArgument);
  }

  auto sub = std::make_shared<Subscriber>();
  sub->id = ConnectionId{generate_uuid()};
  sub->conn = std::shared_ptr<IConnection>(std::move(conn));

  auto ch = impl_->acquire(project);
  std::unique_lock publish_lock(ch->publish_mu);

  auto abandon = [&](const std::error_code& ec) -> Result<ConnectionId> {
    sub->conn->close();
    {
      std::lock_guard lock(ch->registry_mu);
      --ch->pending;
    }
    publish_lock.unlock();
    impl_->prune(project, ch);
    return fail(ec);
  };

  if (auto r =
          Impl::send_to(sub, events::connected(project, sub->id, transport));
      !r) {
    return abandon(r.error());
  }

  if (impl_->snapshot_provider) {
    for (const auto& ev : impl_->snapshot_provider(project)) {
      if (auto r = Impl::send_to(sub, ev); !r) {
        return abandon(r.error());
      }
    }
  }

  sub->next_heartbeat = Clock::now() + impl_->heartbeat_interval;
  {
    std::lock_guard lock(ch->registry_mu);
    --ch->pending;
    ch->subscribers.push_back(sub);
  }

  log::debug("Connection {} subscribed to project {} via {}", sub->id, project,
             transport);
  return sub->id;
}

auto EventHub::unsubscribe(const ProjectId& project, const ConnectionId& id)
    -> bool {
  auto ch = impl_->find(project);
  if (!ch) {
    return false;
  }

  SubscriberPtr removed;
  {
    std::lock_guard lock(ch->registry_mu);
    auto it = std::ranges::find_if(
        ch->subscribers, [&](const SubscriberPtr& s) { return s->id == id; });
    if (it == ch->subscribers.end()) {
      return false;
    }
    removed = std::move(*it);
    ch->subscribers.erase(it);
  }
  impl_->prune(project, ch);

  removed->conn->close();
  log::debug("Connection {} unsubscribed from project {}", id, project);
  return true;
}

auto EventHub::publish(const ProjectId& project, const Event& event)
    -> std::size_t {
  auto ch = impl_->find(project);
  if (!ch) {
    return 0;
  }
  std::lock_guard publish_lock(ch->publish_mu);
  return impl_->deliver(project, ch, event);
}

auto EventHub::stream_count(const ProjectId& project) const -> std::size_t {
  auto ch = impl_->find(project);
  if (!ch) {
    return 0;
  }
  std::lock_guard lock(ch->registry_mu);
  return ch->subscribers.size();
}

auto EventHub::total_stream_count() const -> std::size_t {
  std::size_t total = 0;
  for (const auto& ch : impl_->all_channels()) {
    std::lock_guard lock(ch->registry_mu);
    total += ch->subscribers.size();
  }
  return total;
}

auto EventHub::project_count() const -> std::size_t {
  std::lock_guard lock(impl_->projects_mu);
  return impl_->projects.size();
}

auto EventHub::close_project_streams(const ProjectId& project) -> std::size_t {
  auto ch = impl_->find(project);
  if (!ch) {
    return 0;
  }

  std::vector<SubscriberPtr> closing;
  {
    std::lock_guard lock(ch->registry_mu);
    closing.swap(ch->subscribers);
  }
  impl_->prune(project, ch);
  for (const auto& sub : closing) {
    sub->conn->close();
  }
  if (!closing.empty()) {
    log::info("Closed {} stream(s) for project {}", closing.size(), project);
  }
  return closing.size();
}

auto EventHub::close_all_streams() -> std::size_t {
  std::vector<std::pair<ProjectId, ChannelPtr>> channels;
  {
    std::lock_guard lock(impl_->projects_mu);
    channels.assign(impl_->projects.begin(), impl_->projects.end());
  }

  std::size_t total = 0;
  for (const auto& [project, ch] : channels) {
    std::vector<SubscriberPtr> closing;
    {
      std::lock_guard lock(ch->registry_mu);
      closing.swap(ch->subscribers);
    }
    impl_->prune(project, ch);
    for (const auto& sub : closing) {
      sub->conn->close();
    }
    total += closing.size();
  }
  if (total > 0) {
    log::info("Closed {} stream(s)", total);
  }
  return total;
}

}  // namespace stagehand
