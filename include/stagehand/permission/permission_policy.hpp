#pragma once

#include "stagehand/config/system_config.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace stagehand {

// Whether a tool call may proceed without asking a human under `mode`.
[[nodiscard]] auto should_auto_approve(PermissionMode mode,
                                       std::string_view tool_name) noexcept
    -> bool;

// Pretty-printed JSON, cut to `limit` characters with a trailing "...".
[[nodiscard]] auto make_input_preview(const nlohmann::json& input,
                                      std::size_t limit) -> std::string;

}  // namespace stagehand
