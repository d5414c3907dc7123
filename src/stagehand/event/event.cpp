#include "stagehand/event/event.hpp"

#include "stagehand/util/util.hpp"

#include <array>
#include <utility>

namespace stagehand {

namespace {

constexpr std::array<std::pair<EventType, std::string_view>, 12> kTypeNames{{
    {EventType::Connected, "connected"},
    {EventType::Heartbeat, "heartbeat"},
    {EventType::Message, "message"},
    {EventType::Status, "status"},
    {EventType::PreviewStatus, "preview_status"},
    {EventType::RequestStatus, "request_status"},
    {EventType::Log, "log"},
    {EventType::Error, "error"},
    {EventType::TaskStarted, "task_started"},
    {EventType::TaskCompleted, "task_completed"},
    {EventType::TaskInterrupted, "task_interrupted"},
    {EventType::TaskError, "task_error"},
}};

auto merge_status(std::string_view status, nlohmann::json extra)
    -> nlohmann::json {
  if (!extra.is_object()) {
    extra = nlohmann::json::object();
  }
  extra["status"] = status;
  return extra;
}

}  // namespace

auto event_type_to_string(EventType type) noexcept -> std::string_view {
  for (const auto& [t, name] : kTypeNames) {
    if (t == type) {
      return name;
    }
  }
  return "status";
}

auto string_to_event_type(std::string_view str) noexcept
    -> std::optional<EventType> {
  for (const auto& [t, name] : kTypeNames) {
    if (name == str) {
      return t;
    }
  }
  return std::nullopt;
}

auto Event::to_json() const -> nlohmann::json {
  nlohmann::json j = {{"type", event_type_to_string(type)}};
  if (!data.is_null()) {
    j["data"] = data;
  }
  if (error) {
    j["error"] = *error;
  }
  return j;
}

auto Event::to_json_string() const -> std::string {
  // Process output and tool input may carry invalid UTF-8.
  return to_json().dump(-1, ' ', false,
                        nlohmann::json::error_handler_t::replace);
}

auto Event::to_sse_frame() const -> std::string {
  std::string frame;
  auto body = to_json_string();
  frame.reserve(body.size() + 8);
  frame.append("data: ").append(body).append("\n\n");
  return frame;
}

auto parse_event(std::string_view text) -> std::optional<Event> {
  auto j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object() || !j.contains("type") ||
      !j["type"].is_string()) {
    return std::nullopt;
  }
  auto type = string_to_event_type(j["type"].get<std::string>());
  if (!type) {
    return std::nullopt;
  }
  Event ev{.type = *type, .data = j.value("data", nlohmann::json{})};
  if (j.contains("error") && j["error"].is_string()) {
    ev.error = j["error"].get<std::string>();
  }
  return ev;
}

namespace events {

auto connected(const ProjectId& project, const ConnectionId& connection,
               std::string_view transport) -> Event {
  return {.type = EventType::Connected,
          .data = {{"projectId", project.value()},
                   {"timestamp", format_timestamp()},
                   {"transport", transport},
                   {"connectionId", connection.value()}}};
}

auto heartbeat(const ConnectionId& connection) -> Event {
  return {.type = EventType::Heartbeat,
          .data = {{"timestamp", format_timestamp()},
                   {"connectionId", connection.value()}}};
}

auto status(std::string_view status, nlohmann::json extra) -> Event {
  return {.type = EventType::Status,
          .data = merge_status(status, std::move(extra))};
}

auto preview_status(std::string_view status, nlohmann::json extra) -> Event {
  return {.type = EventType::PreviewStatus,
          .data = merge_status(status, std::move(extra))};
}

auto request_status(bool has_active_requests, int active_count) -> Event {
  return {.type = EventType::RequestStatus,
          .data = {{"hasActiveRequests", has_active_requests},
                   {"activeCount", active_count}}};
}

auto log(std::string_view level, std::string_view content,
         std::string_view source, const ProjectId& project) -> Event {
  return {.type = EventType::Log,
          .data = {{"level", level},
                   {"content", content},
                   {"source", source},
                   {"projectId", project.value()},
                   {"timestamp", format_timestamp()}}};
}

auto error(std::string_view message, nlohmann::json data) -> Event {
  if (data.is_object() && !data.contains("message")) {
    data["message"] = message;
  }
  return {.type = EventType::Error,
          .data = std::move(data),
          .error = std::string(message)};
}

auto message(nlohmann::json data) -> Event {
  return {.type = EventType::Message, .data = std::move(data)};
}

auto task(EventType lifecycle, nlohmann::json data) -> Event {
  return {.type = lifecycle, .data = std::move(data)};
}

}  // namespace events

}  // namespace stagehand
