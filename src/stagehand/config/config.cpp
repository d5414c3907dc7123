#include "stagehand/config/config.hpp"

#include "stagehand/config/yaml_utils.hpp"
#include "stagehand/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<stagehand::StorageConfig> {
  static bool decode(const Node& node, stagehand::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file =
        stagehand::yaml_get_or<std::string>(node, "db_file", "stagehand.db");
    return true;
  }
};

template <>
struct convert<stagehand::ServerConfig> {
  static bool decode(const Node& node, stagehand::ServerConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.log_level = stagehand::yaml_get_or<std::string>(node, "log_level", "info");
    return true;
  }
};

template <>
struct convert<stagehand::ApiConfig> {
  static bool decode(const Node& node, stagehand::ApiConfig& a) {
    if (!node.IsMap()) {
      return false;
    }
    a.enabled = stagehand::yaml_get_or(node, "enabled", true);
    a.port = stagehand::yaml_get_or<uint16_t>(node, "port", 8080);
    a.host = stagehand::yaml_get_or<std::string>(node, "host", "127.0.0.1");
    return true;
  }
};

template <>
struct convert<stagehand::PreviewConfig> {
  static bool decode(const Node& node, stagehand::PreviewConfig& p) {
    if (!node.IsMap()) {
      return false;
    }
    p.port_start = stagehand::yaml_get_optional<int64_t>(node, "port_start");
    p.port_end = stagehand::yaml_get_optional<int64_t>(node, "port_end");
    p.preferred_port =
        stagehand::yaml_get_optional<int64_t>(node, "preferred_port");
    p.command = stagehand::yaml_get_or<std::string>(
        node, "command", "npm run dev -- --port {port}");
    p.projects_root =
        stagehand::yaml_get_or<std::string>(node, "projects_root", "./projects");
    p.ready_timeout_ms = stagehand::yaml_get_or(node, "ready_timeout_ms", 60000);
    p.ready_poll_interval_ms =
        stagehand::yaml_get_or(node, "ready_poll_interval_ms", 250);
    p.stop_grace_ms = stagehand::yaml_get_or(node, "stop_grace_ms", 3000);
    return true;
  }
};

template <>
struct convert<stagehand::PermissionConfig> {
  static bool decode(const Node& node, stagehand::PermissionConfig& p) {
    if (!node.IsMap()) {
      return false;
    }
    p.timeout_ms = stagehand::yaml_get_or(node, "timeout_ms", 60000);
    p.mode = stagehand::string_to_permission_mode(
        stagehand::yaml_get_or<std::string>(node, "mode", "default"));
    p.retention_ms = stagehand::yaml_get_or(node, "retention_ms", 120000);
    return true;
  }
};

template <>
struct convert<stagehand::StreamConfig> {
  static bool decode(const Node& node, stagehand::StreamConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.heartbeat_interval_ms =
        stagehand::yaml_get_or(node, "heartbeat_interval_ms", 30000);
    s.write_timeout_ms = stagehand::yaml_get_or(node, "write_timeout_ms", 1000);
    s.channel_capacity =
        stagehand::yaml_get_or<std::size_t>(node, "channel_capacity", 1024);
    return true;
  }
};

template <>
struct convert<stagehand::SystemConfig> {
  static bool decode(const Node& node, stagehand::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<stagehand::StorageConfig>();
    }
    if (auto server = node["server"]) {
      c.server = server.as<stagehand::ServerConfig>();
    }
    if (auto api = node["api"]) {
      c.api = api.as<stagehand::ApiConfig>();
    }
    if (auto preview = node["preview"]) {
      c.preview = preview.as<stagehand::PreviewConfig>();
    }
    if (auto permissions = node["permissions"]) {
      c.permissions = permissions.as<stagehand::PermissionConfig>();
    }
    if (auto stream = node["stream"]) {
      c.stream = stream.as<stagehand::StreamConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace stagehand {

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto parse_integer(std::string_view text) -> std::optional<int64_t> {
  if (text.empty()) {
    return std::nullopt;
  }
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

auto process_env() -> EnvLookup {
  return [](std::string_view name) -> std::optional<std::string> {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

auto apply_env_overrides(SystemConfig& config, const EnvLookup& env) -> void {
  auto read = [&](std::string_view name) -> std::optional<int64_t> {
    auto raw = env(name);
    if (!raw) {
      return std::nullopt;
    }
    auto value = parse_integer(*raw);
    if (!value) {
      log::warn("Ignoring non-integer {}={}", name, *raw);
    }
    return value;
  };

  if (auto start = read("PREVIEW_PORT_START")) {
    config.preview.port_start = start;
  }
  if (auto end = read("PREVIEW_PORT_END")) {
    config.preview.port_end = end;
  }
  if (auto preferred = read("PORT")) {
    config.preview.preferred_port = preferred;
  }
}

}  // namespace stagehand
