#include "stagehand/app/api/api_server.hpp"

#include "stagehand/app/application.hpp"
#include "stagehand/app/services/event_service.hpp"
#include "stagehand/app/services/permission_service.hpp"
#include "stagehand/event/connection.hpp"
#include "stagehand/event/event_hub.hpp"
#include "stagehand/permission/permission_broker.hpp"
#include "stagehand/preview/process_supervisor.hpp"
#include "stagehand/util/log.hpp"
#include "stagehand/util/util.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

#include <crow.h>

namespace stagehand {

using json = nlohmann::json;

namespace {

auto json_response(const json& j, int status = 200) -> crow::response {
  crow::response resp(
      status, j.dump(-1, ' ', false, json::error_handler_t::replace));
  resp.set_header("Content-Type", "application/json");
  return resp;
}

auto error_response(int status, std::string_view code,
                    std::string_view message) -> crow::response {
  json j = {{"success", false},
            {"error", message},
            {"code", code}};
  return json_response(j, status);
}

auto error_code_name(const std::error_code& ec) -> std::string_view {
  if (ec == Error::PortRangeExhausted) return "PORT_RANGE_EXHAUSTED";
  if (ec == Error::InvalidPortRange) return "INVALID_PORT_RANGE";
  if (ec == Error::ProcessSpawnFailed) return "PROCESS_SPAWN_FAILED";
  if (ec == Error::InvalidArgument) return "INVALID_ARGUMENT";
  return "INTERNAL_ERROR";
}

// Shared between the hub-owned connection and the crow callbacks. Once
// crow reports the socket closed, `conn` is cleared under `mu` and never
// touched again.
struct WebSocketLink {
  std::mutex mu;
  crow::websocket::connection* conn;
  std::atomic<bool> open{true};

  explicit WebSocketLink(crow::websocket::connection* c) : conn(c) {
  }

  auto detach() -> void {
    std::lock_guard lock(mu);
    conn = nullptr;
    open.store(false);
  }
};

class WebSocketConnection : public IConnection {
public:
  explicit WebSocketConnection(std::shared_ptr<WebSocketLink> link)
      : link_(std::move(link)) {
  }

  [[nodiscard]] auto send(const Event& event) -> Result<void> override {
    std::lock_guard lock(link_->mu);
    if (!link_->conn) {
      return fail(Error::ConnectionClosed);
    }
    link_->conn->send_text(event.to_json_string());
    return ok();
  }

  auto close() -> void override {
    std::lock_guard lock(link_->mu);
    if (link_->conn) {
      link_->conn->close("stream closed");
      link_->conn = nullptr;
    }
    link_->open.store(false);
  }

  [[nodiscard]] auto is_open() const noexcept -> bool override {
    return link_->open.load();
  }

private:
  std::shared_ptr<WebSocketLink> link_;
};

struct Session {
  ProjectId project;
  ConnectionId id;
  std::shared_ptr<WebSocketLink> link;
};

}  // namespace

struct ApiServer::Impl {
  Application& app;
  uint16_t port;
  std::string host;

  std::unique_ptr<crow::SimpleApp> crow_app;
  std::thread server_thread;
  std::atomic<bool> running{false};

  std::mutex sessions_mu;
  std::unordered_map<crow::websocket::connection*, Session> sessions;

  // Project ids accepted by a handshake but not yet opened, keyed by the
  // token crow carries in the connection's userdata.
  std::mutex accepted_mu;
  std::uintptr_t next_token{1};
  std::unordered_map<std::uintptr_t, ProjectId> accepted;

  Impl(Application& a, uint16_t p, const std::string& h)
      : app(a), port(p), host(h) {
  }

  auto setup_routes() -> void;
  auto setup_websocket() -> void;
  auto close_sessions() -> void;

  auto accept(std::string_view project, void** userdata) -> void {
    std::lock_guard lock(accepted_mu);
    auto token = next_token++;
    accepted.emplace(token, ProjectId{std::string(project)});
    *userdata = reinterpret_cast<void*>(token);
  }

  auto take_accepted(crow::websocket::connection& conn)
      -> std::optional<ProjectId> {
    auto token = reinterpret_cast<std::uintptr_t>(conn.userdata());
    conn.userdata(nullptr);
    std::lock_guard lock(accepted_mu);
    auto node = accepted.extract(token);
    if (node.empty()) {
      return std::nullopt;
    }
    return std::move(node.mapped());
  }
};

ApiServer::ApiServer(Application& app, uint16_t port, const std::string& host)
    : impl_(std::make_unique<Impl>(app, port, host)) {
}

ApiServer::~ApiServer() {
  stop();
}

auto ApiServer::start() -> void {
  if (impl_->running.exchange(true)) {
    return;
  }

  impl_->crow_app = std::make_unique<crow::SimpleApp>();
  impl_->setup_routes();
  impl_->setup_websocket();

  impl_->crow_app->signal_clear();
  impl_->crow_app->loglevel(crow::LogLevel::Warning);

  impl_->server_thread = std::thread([this]() {
    log::info("API server starting on {}:{}", impl_->host, impl_->port);
    impl_->crow_app->bindaddr(impl_->host)
        .port(impl_->port)
        .multithreaded()
        .run();
  });
}

auto ApiServer::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }

  log::info("Stopping API server...");

  impl_->close_sessions();

  if (impl_->crow_app) {
    impl_->crow_app->stop();
  }

  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }

  impl_->crow_app.reset();
  {
    std::lock_guard lock(impl_->accepted_mu);
    impl_->accepted.clear();
  }
  log::info("API server stopped");
}

auto ApiServer::is_running() const noexcept -> bool {
  return impl_->running.load();
}

auto ApiServer::pending_handshakes() const -> std::size_t {
  std::lock_guard lock(impl_->accepted_mu);
  return impl_->accepted.size();
}

auto ApiServer::Impl::close_sessions() -> void {
  std::unordered_map<crow::websocket::connection*, Session> closing;
  {
    std::lock_guard lock(sessions_mu);
    closing.swap(sessions);
  }
  for (auto& [_, session] : closing) {
    // Closes the socket through the link while crow is still running.
    if (!app.hub().unsubscribe(session.project, session.id)) {
      WebSocketConnection(session.link).close();
    }
    session.link->detach();
  }
}

auto ApiServer::Impl::setup_routes() -> void {
  CROW_ROUTE((*crow_app), "/api/health")
  ([this]() {
    json j = {{"status", app.is_running() ? "healthy" : "stopped"},
              {"timestamp", format_timestamp()},
              {"streams", app.hub().total_stream_count()},
              {"pendingPermissions", app.broker().pending_count()},
              {"activePreviews", app.supervisor().active_count()}};
    return json_response(j);
  });

  // ========== Permission Routes ==========

  CROW_ROUTE((*crow_app), "/api/permissions/pending")
  ([this](const crow::request& req) {
    std::optional<ProjectId> project;
    if (const char* p = req.url_params.get("projectId"); p && *p) {
      project = ProjectId{p};
    }
    json data = json::array();
    for (const auto& entry : app.permissions().pending(project)) {
      data.push_back(entry.to_json());
    }
    return json_response({{"success", true}, {"data", data}});
  });

  CROW_ROUTE((*crow_app), "/api/permissions/confirm")
      .methods(crow::HTTPMethod::POST)([this](const crow::request& req) {
        auto body = json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
          return error_response(400, "PARSE_ERROR", "Invalid JSON body");
        }
        if (!body.contains("permissionId") ||
            !body["permissionId"].is_string() ||
            body["permissionId"].get<std::string>().empty()) {
          return error_response(400, "INVALID_ARGUMENT",
                                "permissionId is required");
        }
        if (!body.contains("approved") || !body["approved"].is_boolean()) {
          return error_response(400, "INVALID_ARGUMENT",
                                "approved must be a boolean");
        }

        PermissionId id{body["permissionId"].get<std::string>()};
        bool approved = body["approved"].get<bool>();

        auto result = app.permissions().confirm(id, approved);
        if (!result) {
          if (result.error() == Error::PermissionAlreadyResolved) {
            auto state = app.broker().lookup(id).value_or(
                PermissionState::Denied);
            return error_response(
                400, "ALREADY_RESOLVED",
                std::format("Permission already {}",
                            permission_state_to_string(state)));
          }
          return error_response(404, "NOT_FOUND", "Permission not found");
        }

        auto status = permission_state_to_string(*result);
        return json_response(
            {{"success", true},
             {"status", status},
             {"data", {{"permissionId", id.value()}, {"status", status}}}});
      });

  // ========== Preview Routes ==========

  CROW_ROUTE((*crow_app), "/api/projects/<string>/preview/start")
      .methods(crow::HTTPMethod::POST)([this](const std::string& project_id) {
        auto result = app.supervisor().start(ProjectId{project_id});
        if (!result) {
          auto desc = app.supervisor().status(ProjectId{project_id});
          json j = {{"success", false},
                    {"error", desc.detail.empty() ? result.error().message()
                                                  : desc.detail},
                    {"code", error_code_name(result.error())},
                    {"data", desc.to_json()}};
          return json_response(j, 500);
        }
        return json_response({{"success", true}, {"data", result->to_json()}});
      });

  CROW_ROUTE((*crow_app), "/api/projects/<string>/preview/stop")
      .methods(crow::HTTPMethod::POST)([this](const std::string& project_id) {
        auto desc = app.supervisor().stop(ProjectId{project_id});
        return json_response({{"success", true}, {"data", desc.to_json()}});
      });

  CROW_ROUTE((*crow_app), "/api/projects/<string>/preview/status")
  ([this](const std::string& project_id) {
    auto desc = app.supervisor().status(ProjectId{project_id});
    return json_response({{"success", true}, {"data", desc.to_json()}});
  });

  CROW_ROUTE((*crow_app), "/api/projects/<string>/request-status")
  ([this](const std::string& project_id) {
    auto summary = app.events().request_summary(ProjectId{project_id});
    return json_response({{"success", true}, {"data", summary.to_json()}});
  });
}

auto ApiServer::Impl::setup_websocket() -> void {
  CROW_WEBSOCKET_ROUTE((*crow_app), "/ws/stream")
      .onaccept([this](const crow::request& req, void** userdata) {
        const char* p = req.url_params.get("projectId");
        if (!p || !*p) {
          log::debug("Rejecting stream without projectId");
          return false;
        }
        accept(p, userdata);
        return true;
      })
      .onopen([this](crow::websocket::connection& conn) {
        auto accepted_project = take_accepted(conn);
        if (!accepted_project) {
          conn.close("missing projectId");
          return;
        }

        ProjectId project = std::move(*accepted_project);
        auto link = std::make_shared<WebSocketLink>(&conn);
        auto id = app.hub().subscribe(
            project, std::make_unique<WebSocketConnection>(link), "websocket");
        if (!id) {
          log::warn("Stream subscription for {} failed: {}", project,
                    id.error().message());
          return;
        }

        std::lock_guard lock(sessions_mu);
        sessions.emplace(&conn, Session{project, *id, std::move(link)});
      })
      .onclose(
          [this](crow::websocket::connection& conn, const std::string& reason) {
            // Closed before onopen ran.
            (void)take_accepted(conn);

            std::optional<Session> session;
            {
              std::lock_guard lock(sessions_mu);
              if (auto it = sessions.find(&conn); it != sessions.end()) {
                session = std::move(it->second);
                sessions.erase(it);
              }
            }
            if (!session) {
              return;
            }
            session->link->detach();
            app.hub().unsubscribe(session->project, session->id);
            log::debug("Stream {} closed: {}", session->id, reason);
          })
      .onmessage([](crow::websocket::connection&, const std::string&, bool) {
      });
}

}  // namespace stagehand
