#pragma once

#include "stagehand/util/id.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace stagehand {

enum class EventType : std::uint8_t {
  Connected,
  Heartbeat,
  Message,
  Status,
  PreviewStatus,
  RequestStatus,
  Log,
  Error,
  TaskStarted,
  TaskCompleted,
  TaskInterrupted,
  TaskError,
};

[[nodiscard]] auto event_type_to_string(EventType type) noexcept
    -> std::string_view;
[[nodiscard]] auto string_to_event_type(std::string_view str) noexcept
    -> std::optional<EventType>;

struct Event {
  EventType type{EventType::Status};
  nlohmann::json data;
  std::optional<std::string> error;

  [[nodiscard]] auto to_json() const -> nlohmann::json;
  [[nodiscard]] auto to_json_string() const -> std::string;
  // Text event-stream framing: "data: <json>\n\n".
  [[nodiscard]] auto to_sse_frame() const -> std::string;
};

[[nodiscard]] auto parse_event(std::string_view text) -> std::optional<Event>;

namespace events {

[[nodiscard]] auto connected(const ProjectId& project,
                             const ConnectionId& connection,
                             std::string_view transport) -> Event;
[[nodiscard]] auto heartbeat(const ConnectionId& connection) -> Event;

// {status, ...extra}
[[nodiscard]] auto status(std::string_view status,
                          nlohmann::json extra = nlohmann::json::object())
    -> Event;
[[nodiscard]] auto preview_status(std::string_view status,
                                  nlohmann::json extra =
                                      nlohmann::json::object()) -> Event;
[[nodiscard]] auto request_status(bool has_active_requests, int active_count)
    -> Event;
[[nodiscard]] auto log(std::string_view level, std::string_view content,
                       std::string_view source, const ProjectId& project)
    -> Event;
[[nodiscard]] auto error(std::string_view message,
                         nlohmann::json data = nlohmann::json::object())
    -> Event;
[[nodiscard]] auto message(nlohmann::json data) -> Event;
[[nodiscard]] auto task(EventType lifecycle, nlohmann::json data) -> Event;

}  // namespace events

}  // namespace stagehand
