#include "stagehand/permission/permission_policy.hpp"

#include "stagehand/util/util.hpp"

#include <algorithm>
#include <array>

namespace stagehand {

namespace {

constexpr std::array<std::string_view, 10> kReadOnlyTools{
    "Read",  "Glob",     "Grep",      "LS",       "ListDirectory",
    "Task",  "TodoRead", "TodoWrite", "WebFetch", "WebSearch",
};

constexpr std::array<std::string_view, 3> kEditTools{
    "Write",
    "Edit",
    "NotebookEdit",
};

}  // namespace

auto should_auto_approve(PermissionMode mode,
                         std::string_view tool_name) noexcept -> bool {
  switch (mode) {
    case PermissionMode::BypassPermissions:
      return true;
    case PermissionMode::AcceptEdits:
      if (std::ranges::find(kEditTools, tool_name) != kEditTools.end()) {
        return true;
      }
      [[fallthrough]];
    case PermissionMode::Default:
      return std::ranges::find(kReadOnlyTools, tool_name) !=
             kReadOnlyTools.end();
  }
  return false;
}

auto make_input_preview(const nlohmann::json& input, std::size_t limit)
    -> std::string {
  auto text = input.dump(2, ' ', false,
                         nlohmann::json::error_handler_t::replace);
  if (text.size() > limit) {
    text.resize(utf8_prefix_length(text, limit));
    text.append("...");
  }
  return text;
}

}  // namespace stagehand
