#include "stagehand/permission/permission_broker.hpp"

#include "stagehand/permission/permission_policy.hpp"
#include "stagehand/util/log.hpp"
#include "stagehand/util/util.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>

namespace stagehand {

namespace {

using SteadyClock = std::chrono::steady_clock;

struct Entry {
  PendingPermission info;
  SteadyClock::time_point deadline;
  std::promise<bool> promise;
};

struct Tombstone {
  PermissionState state;
  SteadyClock::time_point settled_at;
};

}  // namespace

auto PendingPermission::to_json() const -> nlohmann::json {
  return {{"id", id.value()},
          {"projectId", project.value()},
          {"requestId", request_id},
          {"toolName", kind},
          {"input", payload},
          {"inputPreview", input_preview},
          {"createdAt", format_timestamp(created_at)},
          {"expiresAt", format_timestamp(expires_at)}};
}

struct PermissionBroker::Impl {
  std::chrono::milliseconds timeout;
  std::chrono::milliseconds retention;
  ExpiryCallback on_expired;

  mutable std::mutex mu;
  std::unordered_map<PermissionId, Entry> pending;
  std::unordered_map<PermissionId, Tombstone> settled;

  std::atomic<bool> running{false};
  std::jthread timer_thread;
  std::condition_variable_any cv;

  Impl(std::chrono::milliseconds t, std::chrono::milliseconds r)
      : timeout(t), retention(r) {
  }

  // Caller holds mu. The single removal point for pending entries.
  [[nodiscard]] auto take(const PermissionId& id, PermissionState outcome,
                          SteadyClock::time_point now) -> std::optional<Entry> {
    auto it = pending.find(id);
    if (it == pending.end()) {
      return std::nullopt;
    }
    Entry entry = std::move(it->second);
    pending.erase(it);
    settled[id] = Tombstone{outcome, now};
    return entry;
  }

  // Caller holds mu.
  auto prune(SteadyClock::time_point now) -> void {
    std::erase_if(settled, [&](const auto& kv) {
      return kv.second.settled_at + retention <= now;
    });
  }

  // Caller holds mu. Every entry gets the same timeout, so one created after
  // this wakeup was computed never expires before it.
  [[nodiscard]] auto next_wakeup(SteadyClock::time_point now) const
      -> SteadyClock::time_point {
    auto next = now + std::min(timeout, retention);
    for (const auto& [_, e] : pending) {
      next = std::min(next, e.deadline);
    }
    return next;
  }

  auto timer_loop(std::stop_token st, PermissionBroker& self) -> void {
    while (!st.stop_requested()) {
      (void)self.expire_due(SteadyClock::now());

      std::unique_lock lock(mu);
      auto wake = next_wakeup(SteadyClock::now());
      (void)cv.wait_until(lock, st, wake, [] { return false; });
    }
  }
};

PermissionBroker::PermissionBroker(std::chrono::milliseconds timeout,
                                   std::chrono::milliseconds retention)
    : impl_(std::make_unique<Impl>(timeout, retention)) {
}

PermissionBroker::~PermissionBroker() {
  (void)shutdown();
}

auto PermissionBroker::set_on_expired(ExpiryCallback cb) -> void {
  impl_->on_expired = std::move(cb);
}

auto PermissionBroker::start() -> void {
  if (impl_->running.exchange(true)) {
    return;
  }
  impl_->timer_thread = std::jthread(
      [this](std::stop_token st) { impl_->timer_loop(std::move(st), *this); });
  log::info("PermissionBroker started (timeout {}ms)", impl_->timeout.count());
}

auto PermissionBroker::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }
  if (impl_->timer_thread.joinable()) {
    impl_->timer_thread.request_stop();
    impl_->timer_thread.join();
  }
  log::info("PermissionBroker stopped");
}

auto PermissionBroker::is_running() const noexcept -> bool {
  return impl_->running.load();
}

auto PermissionBroker::create(PermissionRequest request)
    -> Result<std::future<bool>> {
  if (request.id.empty()) {
    return fail(Error::InvalidArgument);
  }
  start();

  auto now = std::chrono::system_clock::now();
  Entry entry{
      .info = {.id = request.id,
               .project = std::move(request.project),
               .request_id = std::move(request.request_id),
               .kind = std::move(request.kind),
               .payload = std::move(request.payload),
               .input_preview = {},
               .created_at = now,
               .expires_at = now + impl_->timeout},
      .deadline = SteadyClock::now() + impl_->timeout,
      .promise = {},
  };
  entry.info.input_preview =
      make_input_preview(entry.info.payload, io::kInputPreviewLimit);
  auto future = entry.promise.get_future();

  {
    std::lock_guard lock(impl_->mu);
    if (impl_->pending.contains(request.id)) {
      log::error("Permission {} is already pending", request.id);
      return fail(Error::InvalidArgument);
    }
    impl_->settled.erase(request.id);
    impl_->pending.emplace(request.id, std::move(entry));
  }

  log::info("Permission {} pending ({}ms to decide)", request.id,
            impl_->timeout.count());
  return future;
}

auto PermissionBroker::resolve(const PermissionId& id, bool approved) -> bool {
  return settle(id, approved).has_value();
}

auto PermissionBroker::settle(const PermissionId& id, bool approved)
    -> Result<PendingPermission> {
  auto outcome = approved ? PermissionState::Approved : PermissionState::Denied;
  std::optional<Entry> entry;
  {
    std::lock_guard lock(impl_->mu);
    entry = impl_->take(id, outcome, SteadyClock::now());
    if (!entry) {
      return fail(impl_->settled.contains(id) ? Error::PermissionAlreadyResolved
                                              : Error::PermissionNotFound);
    }
  }

  entry->promise.set_value(approved);
  log::info("Permission {} {} ({})", id, permission_state_to_string(outcome),
            entry->info.kind);
  return std::move(entry->info);
}

auto PermissionBroker::lookup(const PermissionId& id) const
    -> std::optional<PermissionState> {
  std::lock_guard lock(impl_->mu);
  if (impl_->pending.contains(id)) {
    return PermissionState::Pending;
  }
  if (auto it = impl_->settled.find(id); it != impl_->settled.end()) {
    return it->second.state;
  }
  return std::nullopt;
}

auto PermissionBroker::list(const std::optional<ProjectId>& project) const
    -> std::vector<PendingPermission> {
  std::vector<PendingPermission> out;
  {
    std::lock_guard lock(impl_->mu);
    out.reserve(impl_->pending.size());
    for (const auto& [_, e] : impl_->pending) {
      if (!project || e.info.project == *project) {
        out.push_back(e.info);
      }
    }
  }
  std::ranges::sort(out, {}, &PendingPermission::created_at);
  return out;
}

auto PermissionBroker::pending_count() const -> std::size_t {
  std::lock_guard lock(impl_->mu);
  return impl_->pending.size();
}

auto PermissionBroker::expire_due(SteadyClock::time_point now) -> std::size_t {
  std::vector<Entry> expired;
  {
    std::lock_guard lock(impl_->mu);
    std::vector<PermissionId> due;
    for (const auto& [id, e] : impl_->pending) {
      if (e.deadline <= now) {
        due.push_back(id);
      }
    }
    for (const auto& id : due) {
      if (auto e = impl_->take(id, PermissionState::Expired, now)) {
        expired.push_back(std::move(*e));
      }
    }
    impl_->prune(now);
  }

  for (auto& e : expired) {
    e.promise.set_value(false);
    log::warn("Permission {} for {} timed out, denying", e.info.id,
              e.info.kind);
    if (impl_->on_expired) {
      impl_->on_expired(e.info);
    }
  }
  return expired.size();
}

auto PermissionBroker::shutdown() -> std::size_t {
  stop();

  std::vector<Entry> outstanding;
  {
    std::lock_guard lock(impl_->mu);
    auto now = SteadyClock::now();
    for (auto& [id, e] : impl_->pending) {
      impl_->settled[id] = Tombstone{PermissionState::Denied, now};
      outstanding.push_back(std::move(e));
    }
    impl_->pending.clear();
  }

  for (auto& e : outstanding) {
    e.promise.set_value(false);
  }
  if (!outstanding.empty()) {
    log::info("Denied {} outstanding permission(s) on shutdown",
              outstanding.size());
  }
  return outstanding.size();
}

}  // namespace stagehand
