#include "stagehand/app/services/event_service.hpp"
#include "stagehand/app/services/permission_service.hpp"
#include "stagehand/event/channel_connection.hpp"
#include "stagehand/event/event_hub.hpp"
#include "stagehand/permission/permission_broker.hpp"
#include "stagehand/preview/process_supervisor.hpp"
#include "stagehand/storage/request_store.hpp"

#include "gtest/gtest.h"

#include "test_utils.hpp"

using namespace stagehand;
using namespace std::chrono_literals;

class ServicesTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto [channel, conn] = make_channel_connection(256);
    ASSERT_TRUE(hub_.subscribe(project_, std::move(conn)).has_value());
    reader_ = std::make_unique<test::ChannelReader>(channel);
  }

  auto status_events(std::string_view status) -> std::vector<Event> {
    std::vector<Event> out;
    for (const auto& ev : reader_->events()) {
      if (ev.type == EventType::Status && ev.data["status"] == status) {
        out.push_back(ev);
      }
    }
    return out;
  }

  ProjectId project_ = test::project_id("alpha");
  InMemoryRequestStore store_;
  TaskStatusTracker tracker_{store_};
  EventHub hub_{1h};
  EventService events_{hub_, tracker_};
  PermissionBroker broker_{1h, 1h};
  PermissionService permissions_{broker_, events_, PermissionMode::Default};
  std::unique_ptr<test::ChannelReader> reader_;
};

// ---------- EventService ----------

TEST_F(ServicesTest, TaskLifecycleFollowedByRequestStatus) {
  store_.upsert({.id = "r1", .project = project_, .status = "implementing",
                 .created_at = 1});

  events_.emit_task_lifecycle(project_, EventType::TaskStarted,
                              {{"requestId", "r1"}});

  const auto& seen = reader_->events();
  ASSERT_GE(seen.size(), 3u);
  const auto& task = seen[seen.size() - 2];
  const auto& summary = seen.back();
  EXPECT_EQ(task.type, EventType::TaskStarted);
  EXPECT_EQ(task.data["projectId"], "alpha");
  EXPECT_EQ(task.data["requestId"], "r1");
  EXPECT_EQ(summary.type, EventType::RequestStatus);
  EXPECT_EQ(summary.data["activeCount"], 1);
}

TEST_F(ServicesTest, NonLifecycleTypeIgnored) {
  auto before = reader_->events().size();

  events_.emit_task_lifecycle(project_, EventType::Log, {});

  EXPECT_EQ(reader_->events().size(), before);
}

TEST_F(ServicesTest, EmitLogAndError) {
  events_.emit_log(project_, "stderr", "compile failed", "preview");
  events_.emit_error(project_, "port busy", {{"errorType", "port"}});

  auto log = reader_->wait_event(EventType::Log);
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->data["level"], "stderr");
  EXPECT_EQ(log->data["content"], "compile failed");
  EXPECT_EQ(log->data["source"], "preview");

  auto err = reader_->wait_event(EventType::Error);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->error, "port busy");
}

TEST_F(ServicesTest, EmitPreviewStatus) {
  PreviewDescriptor desc{.project = project_,
                         .status = PreviewState::Ready,
                         .port = 3135,
                         .url = "http://localhost:3135",
                         .pid = 42,
                         .detail = {}};

  events_.emit_preview_status(desc);

  auto ev = reader_->wait_event(EventType::PreviewStatus);
  ASSERT_TRUE(ev.has_value());
  EXPECT_EQ(ev->data["status"], "ready");
  EXPECT_EQ(ev->data["port"], 3135);
  EXPECT_EQ(ev->data["url"], "http://localhost:3135");
}

// ---------- PermissionService ----------

TEST_F(ServicesTest, ReadOnlyToolAutoApproved) {
  auto fut = permissions_.request({.project = project_,
                                   .request_id = "r1",
                                   .tool_name = "Read",
                                   .input = {{"file", "a.txt"}}});

  ASSERT_TRUE(fut.has_value());
  ASSERT_EQ(fut->wait_for(0s), std::future_status::ready);
  EXPECT_TRUE(fut->get());
  EXPECT_EQ(broker_.pending_count(), 0u);
  EXPECT_TRUE(status_events("permission_required").empty());
}

TEST_F(ServicesTest, GatedToolWaitsAndAnnounces) {
  auto fut = permissions_.request({.project = project_,
                                   .request_id = "r1",
                                   .tool_name = "Bash",
                                   .input = {{"command", "ls"}},
                                   .id = test::permission_id("perm-1")});

  ASSERT_TRUE(fut.has_value());
  EXPECT_EQ(fut->wait_for(0s), std::future_status::timeout);

  auto required = status_events("permission_required");
  ASSERT_EQ(required.size(), 1u);
  EXPECT_EQ(required[0].data["requestId"], "r1");
  EXPECT_EQ(required[0].data["metadata"]["permissionId"], "perm-1");
  EXPECT_EQ(required[0].data["metadata"]["toolName"], "Bash");

  auto state = permissions_.confirm(test::permission_id("perm-1"), true);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(*state, PermissionState::Approved);
  EXPECT_TRUE(fut->get());

  auto resolved = status_events("permission_resolved");
  ASSERT_EQ(resolved.size(), 1u);
  EXPECT_EQ(resolved[0].data["metadata"]["approved"], true);
}

TEST_F(ServicesTest, GeneratedIdWhenAbsent) {
  auto fut = permissions_.request(
      {.project = project_, .request_id = "r1", .tool_name = "Bash",
       .input = {}});
  ASSERT_TRUE(fut.has_value());

  auto pending = permissions_.pending(project_);
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_FALSE(pending[0].id.empty());
}

TEST_F(ServicesTest, ConfirmTwiceReportsAlreadyResolved) {
  ASSERT_TRUE(permissions_
                  .request({.project = project_,
                            .request_id = "r1",
                            .tool_name = "Bash",
                            .input = {},
                            .id = test::permission_id("perm-1")})
                  .has_value());
  ASSERT_TRUE(
      permissions_.confirm(test::permission_id("perm-1"), false).has_value());

  auto again = permissions_.confirm(test::permission_id("perm-1"), true);

  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), Error::PermissionAlreadyResolved);
  EXPECT_EQ(status_events("permission_resolved").size(), 1u);
}

TEST_F(ServicesTest, ConfirmUnknown) {
  auto r = permissions_.confirm(test::permission_id("nope"), true);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::PermissionNotFound);
}

TEST_F(ServicesTest, ExpiryAnnouncedAsDenied) {
  broker_.set_on_expired(
      [this](const PendingPermission& p) { permissions_.on_expired(p); });
  auto fut = permissions_.request({.project = project_,
                                   .request_id = "r1",
                                   .tool_name = "Bash",
                                   .input = {},
                                   .id = test::permission_id("perm-1")});
  ASSERT_TRUE(fut.has_value());

  broker_.expire_due(std::chrono::steady_clock::now() + 2h);

  EXPECT_FALSE(fut->get());
  auto resolved = status_events("permission_resolved");
  ASSERT_EQ(resolved.size(), 1u);
  EXPECT_EQ(resolved[0].data["metadata"]["approved"], false);
  EXPECT_EQ(resolved[0].data["metadata"]["expired"], true);
}

TEST_F(ServicesTest, ModeSwitchTakesEffect) {
  permissions_.set_mode(PermissionMode::AcceptEdits);
  EXPECT_EQ(permissions_.mode(), PermissionMode::AcceptEdits);

  auto fut = permissions_.request({.project = project_,
                                   .request_id = "r1",
                                   .tool_name = "Edit",
                                   .input = {}});

  ASSERT_TRUE(fut.has_value());
  EXPECT_TRUE(fut->get());
}
