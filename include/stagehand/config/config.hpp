#pragma once

#include "stagehand/config/system_config.hpp"
#include "stagehand/core/error.hpp"

#include <functional>
#include <optional>
#include <string>

namespace stagehand {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;
};

using EnvLookup =
    std::function<std::optional<std::string>(std::string_view name)>;

// Reads the process environment.
[[nodiscard]] auto process_env() -> EnvLookup;

// PREVIEW_PORT_START, PREVIEW_PORT_END and PORT override the preview port
// settings; values that are not integers are ignored.
auto apply_env_overrides(SystemConfig& config, const EnvLookup& env) -> void;

// Strict base-10 parse of a whole string; nullopt on any trailing garbage.
[[nodiscard]] auto parse_integer(std::string_view text)
    -> std::optional<int64_t>;

}  // namespace stagehand
