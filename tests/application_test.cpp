#include "stagehand/app/application.hpp"
#include "stagehand/app/services/event_service.hpp"
#include "stagehand/app/services/permission_service.hpp"
#include "stagehand/event/channel_connection.hpp"
#include "stagehand/event/event_hub.hpp"
#include "stagehand/permission/permission_broker.hpp"
#include "stagehand/preview/process_supervisor.hpp"
#include "stagehand/storage/request_store.hpp"

#include <signal.h>

#include "gtest/gtest.h"

#include "test_utils.hpp"

using namespace stagehand;
using namespace std::chrono_literals;

class ApplicationTest : public ::testing::Test {
protected:
  void SetUp() override {
    SystemConfig config;
    config.api.enabled = false;
    config.preview.projects_root = dir_.path().string();
    config.permissions.timeout_ms = 100;
    store_ = std::make_shared<InMemoryRequestStore>();
    app_ = std::make_unique<Application>(config, store_);
  }

  void TearDown() override {
    app_->stop();
  }

  test::TempDir dir_;
  std::shared_ptr<InMemoryRequestStore> store_;
  std::unique_ptr<Application> app_;
};

TEST_F(ApplicationTest, StartStopLifecycle) {
  EXPECT_FALSE(app_->is_running());

  ASSERT_TRUE(app_->start().has_value());
  EXPECT_TRUE(app_->is_running());
  EXPECT_TRUE(app_->hub().is_running());
  EXPECT_TRUE(app_->broker().is_running());
  EXPECT_EQ(app_->api_server(), nullptr);

  app_->stop();
  EXPECT_FALSE(app_->is_running());
  EXPECT_FALSE(app_->hub().is_running());
}

TEST_F(ApplicationTest, SubscriberGetsSnapshot) {
  store_->upsert({.id = "r1", .project = test::project_id("alpha"),
                  .status = "planning", .created_at = 1});
  ASSERT_TRUE(app_->start().has_value());

  auto [channel, conn] = make_channel_connection();
  ASSERT_TRUE(
      app_->hub().subscribe(test::project_id("alpha"), std::move(conn))
          .has_value());
  test::ChannelReader reader(channel);

  const auto& seen = reader.events();
  ASSERT_EQ(seen.size(), 3u);
  EXPECT_EQ(seen[0].type, EventType::Connected);
  EXPECT_EQ(seen[1].type, EventType::PreviewStatus);
  EXPECT_EQ(seen[1].data["status"], "idle");
  EXPECT_EQ(seen[2].type, EventType::RequestStatus);
  EXPECT_EQ(seen[2].data["activeCount"], 1);
}

TEST(ApplicationStreamTest, OpenStreamHonoursChannelCapacity) {
  SystemConfig config;
  config.api.enabled = false;
  config.stream.channel_capacity = 4;
  Application app(config, std::make_shared<InMemoryRequestStore>());
  ASSERT_TRUE(app.start().has_value());
  auto project = test::project_id("alpha");

  auto channel = app.open_stream(project);
  ASSERT_TRUE(channel.has_value());
  // Ack plus two snapshot events.
  EXPECT_EQ((*channel)->size(), 3u);
  EXPECT_EQ(app.hub().stream_count(project), 1u);

  EXPECT_EQ(app.hub().publish(project, events::status("one")), 1u);
  EXPECT_EQ(app.hub().publish(project, events::status("overflow")), 0u);

  EXPECT_EQ(app.hub().stream_count(project), 0u);
  EXPECT_TRUE((*channel)->is_closed());
  EXPECT_EQ((*channel)->size(), 4u);
  app.stop();
}

TEST_F(ApplicationTest, PermissionTimeoutPublishedToStream) {
  ASSERT_TRUE(app_->start().has_value());
  auto project = test::project_id("alpha");
  auto [channel, conn] = make_channel_connection();
  ASSERT_TRUE(app_->hub().subscribe(project, std::move(conn)).has_value());
  test::ChannelReader reader(channel);

  auto fut = app_->permissions().request(
      {.project = project, .request_id = "r1", .tool_name = "Bash",
       .input = {{"command", "make"}}});
  ASSERT_TRUE(fut.has_value());

  ASSERT_EQ(fut->wait_for(5s), std::future_status::ready);
  EXPECT_FALSE(fut->get());
  auto resolved = reader.wait_event(EventType::Status, [](const auto& d) {
    return d["status"] == "permission_resolved";
  });
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(resolved->data["metadata"]["expired"], true);
}

TEST_F(ApplicationTest, StopDeniesPendingAndClosesStreams) {
  ASSERT_TRUE(app_->start().has_value());
  auto [channel, conn] = make_channel_connection();
  ASSERT_TRUE(app_->hub()
                  .subscribe(test::project_id("alpha"), std::move(conn))
                  .has_value());

  auto fut = app_->broker().create({.id = test::permission_id("p1"),
                                    .project = test::project_id("alpha"),
                                    .request_id = "r1",
                                    .kind = "Bash",
                                    .payload = {}});
  ASSERT_TRUE(fut.has_value());

  app_->stop();

  EXPECT_FALSE(fut->get());
  EXPECT_TRUE(channel->is_closed());
  EXPECT_EQ(app_->hub().total_stream_count(), 0u);
}

TEST_F(ApplicationTest, StopTerminatesPreviews) {
  SystemConfig config;
  config.api.enabled = false;
  config.preview.projects_root = dir_.path().string();
  config.preview.command = "sleep 30";
  config.preview.port_start = 42000;
  config.preview.port_end = 42100;
  dir_.make_subdir("alpha");
  Application app(config, std::make_shared<InMemoryRequestStore>());
  ASSERT_TRUE(app.start().has_value());

  auto desc = app.supervisor().start(test::project_id("alpha"));
  ASSERT_TRUE(desc.has_value());

  app.stop();

  EXPECT_EQ(app.supervisor().status(test::project_id("alpha")).status,
            PreviewState::Stopped);
  EXPECT_NE(::kill(*desc->pid, 0), 0);
}

TEST(ApplicationStorageTest, SqliteStoreOpenedOnStart) {
  test::TempDir dir;
  SystemConfig config;
  config.api.enabled = false;
  config.storage.db_file = (dir.path() / "requests.db").string();
  Application app(config);

  ASSERT_TRUE(app.start().has_value());
  auto summary = app.tracker().summarize(test::project_id("alpha"));
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->active_count, 0);
  app.stop();
}

TEST(ApplicationStorageTest, UnopenableDatabaseFailsStart) {
  SystemConfig config;
  config.api.enabled = false;
  config.storage.db_file = "/nonexistent-dir/requests.db";
  Application app(config);

  auto result = app.start();

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::DatabaseOpenFailed);
  EXPECT_FALSE(app.is_running());
}

TEST(ApplicationStorageTest, EmptyDbFileUsesMemoryStore) {
  SystemConfig config;
  config.api.enabled = false;
  config.storage.db_file.clear();
  Application app(config);

  EXPECT_NE(dynamic_cast<InMemoryRequestStore*>(&app.request_store()), nullptr);
}
