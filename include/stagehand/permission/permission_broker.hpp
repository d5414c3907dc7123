#pragma once

#include "stagehand/core/constants.hpp"
#include "stagehand/core/error.hpp"
#include "stagehand/util/id.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stagehand {

enum class PermissionState : std::uint8_t { Pending, Approved, Denied, Expired };

[[nodiscard]] constexpr auto permission_state_to_string(
    PermissionState state) noexcept -> std::string_view {
  switch (state) {
    case PermissionState::Pending: return "pending";
    case PermissionState::Approved: return "approved";
    case PermissionState::Denied: return "denied";
    case PermissionState::Expired: return "expired";
  }
  return "pending";
}

struct PermissionRequest {
  PermissionId id;
  ProjectId project;
  std::string request_id;
  std::string kind;
  nlohmann::json payload;
};

struct PendingPermission {
  PermissionId id;
  ProjectId project;
  std::string request_id;
  std::string kind;
  nlohmann::json payload;
  std::string input_preview;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point expires_at;

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

using ExpiryCallback = std::function<void(const PendingPermission&)>;

// Registry of actions waiting on a human decision.
//
// create() hands back a future that resolves exactly once: true on approval,
// false on denial, timeout or shutdown. Removal from the pending map is the
// single point where resolve() and the timeout race; whichever removes the
// entry decides the outcome and the other observes it as already settled.
// Destroying the broker denies whatever is still pending.
class PermissionBroker {
public:
  explicit PermissionBroker(
      std::chrono::milliseconds timeout = timing::kPermissionTimeout,
      std::chrono::milliseconds retention = timing::kPermissionRetention);
  ~PermissionBroker();

  PermissionBroker(const PermissionBroker&) = delete;
  auto operator=(const PermissionBroker&) -> PermissionBroker& = delete;

  auto set_on_expired(ExpiryCallback cb) -> void;

  // Expiry timer thread. create() starts it if needed.
  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto create(PermissionRequest request)
      -> Result<std::future<bool>>;

  // false when the id is unknown or already settled.
  auto resolve(const PermissionId& id, bool approved) -> bool;

  // Like resolve() but reports why it failed (PermissionNotFound or
  // PermissionAlreadyResolved) and returns the settled entry.
  [[nodiscard]] auto settle(const PermissionId& id, bool approved)
      -> Result<PendingPermission>;

  [[nodiscard]] auto lookup(const PermissionId& id) const
      -> std::optional<PermissionState>;
  [[nodiscard]] auto list(const std::optional<ProjectId>& project =
                              std::nullopt) const
      -> std::vector<PendingPermission>;
  [[nodiscard]] auto pending_count() const -> std::size_t;

  // Denies every entry whose deadline is at or before `now`; returns how
  // many expired.
  auto expire_due(std::chrono::steady_clock::time_point now) -> std::size_t;

  // Denies every outstanding entry and stops the timer.
  auto shutdown() -> std::size_t;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace stagehand
