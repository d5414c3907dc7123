#include "stagehand/app/application.hpp"

#include "stagehand/app/api/api_server.hpp"
#include "stagehand/app/services/event_service.hpp"
#include "stagehand/app/services/permission_service.hpp"
#include "stagehand/event/channel_connection.hpp"
#include "stagehand/event/event_hub.hpp"
#include "stagehand/permission/permission_broker.hpp"
#include "stagehand/preview/port_allocator.hpp"
#include "stagehand/preview/process_supervisor.hpp"
#include "stagehand/status/task_status_tracker.hpp"
#include "stagehand/storage/request_store.hpp"
#include "stagehand/util/log.hpp"

namespace stagehand {

namespace {

auto make_store(const StorageConfig& storage)
    -> std::shared_ptr<IRequestStore> {
  if (storage.db_file.empty()) {
    return std::make_shared<InMemoryRequestStore>();
  }
  return std::make_shared<SqliteRequestStore>(storage.db_file);
}

}  // namespace

Application::Application(SystemConfig config)
    : Application(config, make_store(config.storage)) {
}

Application::Application(SystemConfig config,
                         std::shared_ptr<IRequestStore> store)
    : config_(std::move(config)), store_(std::move(store)) {
  wire();
}

Application::~Application() {
  stop();
}

auto Application::wire() -> void {
  tracker_ = std::make_unique<TaskStatusTracker>(*store_);
  hub_ = std::make_unique<EventHub>(
      std::chrono::milliseconds(config_.stream.heartbeat_interval_ms));
  allocator_ = std::make_unique<PortAllocator>();
  supervisor_ =
      std::make_unique<ProcessSupervisor>(config_.preview, *allocator_, *hub_);
  broker_ = std::make_unique<PermissionBroker>(
      std::chrono::milliseconds(config_.permissions.timeout_ms),
      std::chrono::milliseconds(config_.permissions.retention_ms));
  events_ = std::make_unique<EventService>(*hub_, *tracker_);
  permissions_ = std::make_unique<PermissionService>(*broker_, *events_,
                                                     config_.permissions.mode);

  hub_->set_snapshot_provider([this](const ProjectId& project) {
    auto preview = supervisor_->status(project);
    return std::vector<Event>{
        events::preview_status(preview_state_to_string(preview.status),
                               preview.to_json()),
        events_->request_summary(project).to_event(),
    };
  });
  broker_->set_on_expired(
      [this](const PendingPermission& entry) { permissions_->on_expired(entry); });
}

auto Application::config() const noexcept -> const Config& {
  return config_;
}

auto Application::start() -> Result<void> {
  if (running_.exchange(true))
    return ok();

  if (auto* sqlite = dynamic_cast<SqliteRequestStore*>(store_.get())) {
    if (auto r = sqlite->open(); !r) {
      log::error("Failed to open request store: {}", r.error().message());
      running_.store(false);
      return r;
    }
  }

  hub_->start();
  broker_->start();

  if (config_.api.enabled) {
    api_ = std::make_unique<ApiServer>(*this, config_.api.port,
                                       config_.api.host);
    api_->start();
  }

  log::info("Stagehand started (permission mode: {})",
            permission_mode_to_string(permissions_->mode()));
  return ok();
}

auto Application::stop() -> void {
  if (!running_.exchange(false))
    return;

  log::info("Stopping Stagehand...");

  if (api_) {
    api_->stop();
    api_.reset();
  }

  supervisor_->stop_all();
  broker_->shutdown();
  hub_->close_all_streams();
  hub_->stop();

  if (auto* sqlite = dynamic_cast<SqliteRequestStore*>(store_.get())) {
    sqlite->close();
  }

  log::info("Stagehand stopped");
}

auto Application::is_running() const noexcept -> bool {
  return running_.load();
}

auto Application::hub() -> EventHub& {
  return *hub_;
}

auto Application::broker() -> PermissionBroker& {
  return *broker_;
}

auto Application::supervisor() -> ProcessSupervisor& {
  return *supervisor_;
}

auto Application::tracker() -> TaskStatusTracker& {
  return *tracker_;
}

auto Application::events() -> EventService& {
  return *events_;
}

auto Application::permissions() -> PermissionService& {
  return *permissions_;
}

auto Application::request_store() -> IRequestStore& {
  return *store_;
}

auto Application::api_server() -> ApiServer* {
  return api_.get();
}

auto Application::open_stream(const ProjectId& project)
    -> Result<std::shared_ptr<EventChannel>> {
  auto [channel, conn] =
      make_channel_connection(config_.stream.channel_capacity);
  if (auto id = hub_->subscribe(project, std::move(conn), "channel"); !id) {
    return std::unexpected(id.error());
  }
  return channel;
}

}  // namespace stagehand
