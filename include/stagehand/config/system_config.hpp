#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace stagehand {

struct StorageConfig {
  std::string db_file{"stagehand.db"};
};

struct ServerConfig {
  std::string log_level{"info"};
};

struct ApiConfig {
  bool enabled{true};
  uint16_t port{8080};
  std::string host{"127.0.0.1"};
};

struct PreviewConfig {
  std::optional<int64_t> port_start;
  std::optional<int64_t> port_end;
  std::optional<int64_t> preferred_port;
  std::string command{"npm run dev -- --port {port}"};
  std::string projects_root{"./projects"};
  int ready_timeout_ms{60000};
  int ready_poll_interval_ms{250};
  int stop_grace_ms{3000};
};

enum class PermissionMode { Default, AcceptEdits, BypassPermissions };

[[nodiscard]] constexpr auto permission_mode_to_string(
    PermissionMode mode) noexcept -> std::string_view {
  switch (mode) {
    case PermissionMode::Default: return "default";
    case PermissionMode::AcceptEdits: return "acceptEdits";
    case PermissionMode::BypassPermissions: return "bypassPermissions";
  }
  return "default";
}

[[nodiscard]] inline auto string_to_permission_mode(
    std::string_view str) noexcept -> PermissionMode {
  if (str == "acceptEdits") return PermissionMode::AcceptEdits;
  if (str == "bypassPermissions") return PermissionMode::BypassPermissions;
  return PermissionMode::Default;
}

struct PermissionConfig {
  int timeout_ms{60000};
  PermissionMode mode{PermissionMode::Default};
  int retention_ms{120000};
};

struct StreamConfig {
  int heartbeat_interval_ms{30000};
  int write_timeout_ms{1000};
  std::size_t channel_capacity{1024};
};

struct SystemConfig {
  StorageConfig storage;
  ServerConfig server;
  ApiConfig api;
  PreviewConfig preview;
  PermissionConfig permissions;
  StreamConfig stream;
};

}  // namespace stagehand
