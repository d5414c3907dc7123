#include "stagehand/event/channel_connection.hpp"
#include "stagehand/event/event_hub.hpp"
#include "stagehand/event/stream_connection.hpp"
#include "stagehand/preview/port_allocator.hpp"
#include "stagehand/preview/process.hpp"
#include "stagehand/preview/process_supervisor.hpp"

#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <atomic>
#include <charconv>
#include <format>
#include <fstream>
#include <future>
#include <thread>

#include "gtest/gtest.h"

#include "test_utils.hpp"

using namespace stagehand;
using namespace std::chrono_literals;

namespace {

// False once the pid is gone or only a zombie is left.
auto process_alive(pid_t pid) -> bool {
  std::ifstream in(std::format("/proc/{}/stat", pid));
  std::string stat;
  if (!std::getline(in, stat)) {
    return false;
  }
  auto paren = stat.rfind(')');
  return paren != std::string::npos && paren + 2 < stat.size() &&
         stat[paren + 2] != 'Z';
}

class RefusingProbe : public IPortProbe {
public:
  auto try_bind(ProbeAddress, std::uint16_t, std::chrono::milliseconds)
      -> bool override {
    return false;
  }
};

}  // namespace

// ---------- ProcessHandle ----------

TEST(ProcessTest, SubstitutePort) {
  EXPECT_EQ(substitute_port("vite --port {port}", 3135), "vite --port 3135");
  EXPECT_EQ(substitute_port("a {port} b {port}", 80), "a 80 b 80");
  EXPECT_EQ(substitute_port("npm start", 80), "npm start");
}

TEST(ProcessTest, SpawnCapturesExitCode) {
  auto proc = ProcessHandle::spawn({.command = "exit 7", .working_dir = {},
                                    .env = {}});
  ASSERT_TRUE(proc.has_value());

  EXPECT_EQ(proc->wait_for(5s), 7);
}

TEST(ProcessTest, TerminateStopsLongRunningProcess) {
  auto proc = ProcessHandle::spawn({.command = "sleep 30", .working_dir = {},
                                    .env = {}});
  ASSERT_TRUE(proc.has_value());
  auto pid = proc->pid();

  auto code = proc->terminate(2s);

  EXPECT_EQ(code, 128 + SIGTERM);
  EXPECT_NE(::kill(pid, 0), 0);
}

TEST(ProcessTest, LeaderExitKillsLeftoverGroupMembers) {
  auto proc = ProcessHandle::spawn(
      {.command = "sleep 30 & echo $!", .working_dir = {}, .env = {}});
  ASSERT_TRUE(proc.has_value());

  ASSERT_EQ(proc->wait_for(5s), 0);

  std::array<char, 64> buf{};
  auto n = ::read(proc->output_fd(), buf.data(), buf.size());
  ASSERT_GT(n, 0);
  pid_t straggler = 0;
  std::from_chars(buf.data(), buf.data() + n, straggler);
  ASSERT_GT(straggler, 0);
  EXPECT_TRUE(test::wait_for([&] { return !process_alive(straggler); }));
}

TEST(ProcessTest, TerminateAfterExitReturnsRecordedCode) {
  auto proc = ProcessHandle::spawn({.command = "exit 4", .working_dir = {},
                                    .env = {}});
  ASSERT_TRUE(proc.has_value());
  ASSERT_EQ(proc->wait_for(5s), 4);

  // The leader is reaped; nothing may be signalled under its old pid.
  proc->signal_group(SIGKILL);

  EXPECT_EQ(proc->terminate(1s), 4);
  EXPECT_EQ(proc->exit_code(), 4);
}

// ---------- Supervisor ----------

class ProcessSupervisorTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_.make_subdir("alpha");
    dir_.make_subdir("beta");

    auto [channel, conn] = make_channel_connection(1024);
    ASSERT_TRUE(hub_.subscribe(alpha_, std::move(conn)).has_value());
    reader_ = std::make_unique<test::ChannelReader>(channel);
  }

  void TearDown() override {
    if (supervisor_) {
      supervisor_->stop_all();
    }
  }

  auto make_supervisor(std::string command, bool ready = true,
                       int ready_timeout_ms = 10000) -> ProcessSupervisor& {
    PreviewConfig config;
    config.command = std::move(command);
    config.projects_root = dir_.path().string();
    config.port_start = 41000;
    config.port_end = 41200;
    config.ready_timeout_ms = ready_timeout_ms;
    config.ready_poll_interval_ms = 20;
    config.stop_grace_ms = 2000;
    supervisor_ = std::make_unique<ProcessSupervisor>(config, allocator_, hub_);
    supervisor_->set_ready_probe([this, ready](std::uint16_t) {
      return ready && ready_.load();
    });
    return *supervisor_;
  }

  auto wait_state(const ProjectId& project, PreviewState state) -> bool {
    return test::wait_for(
        [&] { return supervisor_->status(project).status == state; });
  }

  test::TempDir dir_;
  EventHub hub_{1h};
  PortAllocator allocator_;
  std::unique_ptr<ProcessSupervisor> supervisor_;
  std::unique_ptr<test::ChannelReader> reader_;
  std::atomic<bool> ready_{true};
  ProjectId alpha_ = test::project_id("alpha");
  ProjectId beta_ = test::project_id("beta");
};

TEST_F(ProcessSupervisorTest, StatusOfUnknownProjectIsIdle) {
  auto& sup = make_supervisor("sleep 30");

  auto desc = sup.status(test::project_id("nobody"));

  EXPECT_EQ(desc.status, PreviewState::Idle);
  EXPECT_FALSE(desc.port.has_value());
  EXPECT_EQ(sup.active_count(), 0u);
}

TEST_F(ProcessSupervisorTest, StartReachesReady) {
  auto& sup = make_supervisor("sleep 30");

  auto desc = sup.start(alpha_);

  ASSERT_TRUE(desc.has_value());
  EXPECT_EQ(desc->status, PreviewState::Starting);
  ASSERT_TRUE(desc->port.has_value());
  EXPECT_GE(*desc->port, 41000);
  EXPECT_LE(*desc->port, 41200);
  EXPECT_EQ(desc->url, std::format("http://localhost:{}", *desc->port));
  ASSERT_TRUE(desc->pid.has_value());

  ASSERT_TRUE(wait_state(alpha_, PreviewState::Ready));
  EXPECT_EQ(sup.active_count(), 1u);

  std::vector<std::string> states;
  for (const auto& ev : reader_->events()) {
    if (ev.type == EventType::PreviewStatus) {
      states.push_back(ev.data["status"]);
    }
  }
  ASSERT_GE(states.size(), 3u);
  EXPECT_EQ(states[0], "starting");
  EXPECT_EQ(states[1], "running");
  EXPECT_EQ(states[2], "ready");
}

TEST_F(ProcessSupervisorTest, StartIsIdempotentWhileActive) {
  auto& sup = make_supervisor("sleep 30");

  auto first = sup.start(alpha_);
  auto second = sup.start(alpha_);

  ASSERT_TRUE(first.has_value() && second.has_value());
  EXPECT_EQ(first->pid, second->pid);
  EXPECT_EQ(first->port, second->port);
}

TEST_F(ProcessSupervisorTest, ConcurrentStartsShareOneProcess) {
  auto& sup = make_supervisor("sleep 30");

  std::vector<std::future<Result<PreviewDescriptor>>> starts;
  for (int i = 0; i < 4; ++i) {
    starts.push_back(
        std::async(std::launch::async, [&] { return sup.start(alpha_); }));
  }

  std::optional<int> pid;
  for (auto& f : starts) {
    auto desc = f.get();
    ASSERT_TRUE(desc.has_value());
    if (!pid) {
      pid = desc->pid;
    }
    EXPECT_EQ(desc->pid, pid);
  }
  EXPECT_EQ(sup.active_count(), 1u);
}

TEST_F(ProcessSupervisorTest, ProjectsRunIndependently) {
  auto& sup = make_supervisor("sleep 30");
  ready_ = false;

  auto a = sup.start(alpha_);
  ASSERT_TRUE(a.has_value());
  auto b = sup.start(beta_);
  ASSERT_TRUE(b.has_value());

  EXPECT_NE(a->pid, b->pid);
  // Neither dev server has bound its port yet; the reservation alone must
  // keep them apart.
  EXPECT_NE(a->port, b->port);
  EXPECT_TRUE(allocator_.is_reserved(*a->port));
  EXPECT_TRUE(allocator_.is_reserved(*b->port));
  EXPECT_EQ(sup.active_count(), 2u);
}

TEST_F(ProcessSupervisorTest, PortReleasedOnStop) {
  auto& sup = make_supervisor("sleep 30");
  auto desc = sup.start(alpha_);
  ASSERT_TRUE(desc.has_value());
  ASSERT_EQ(allocator_.reserved_count(), 1u);

  sup.stop(alpha_);

  EXPECT_FALSE(allocator_.is_reserved(*desc->port));
  EXPECT_EQ(allocator_.reserved_count(), 0u);
}

TEST_F(ProcessSupervisorTest, PortReleasedOnCrash) {
  auto& sup = make_supervisor("exit 2", false);
  auto desc = sup.start(alpha_);
  ASSERT_TRUE(desc.has_value());

  ASSERT_TRUE(wait_state(alpha_, PreviewState::Error));

  EXPECT_EQ(allocator_.reserved_count(), 0u);
  sup.stop(alpha_);
  EXPECT_EQ(allocator_.reserved_count(), 0u);
}

TEST_F(ProcessSupervisorTest, ExhaustedRangeNamedInDetail) {
  PortAllocator refusing(std::make_shared<RefusingProbe>(), 10ms);
  PreviewConfig config;
  config.command = "sleep 30";
  config.projects_root = dir_.path().string();
  config.port_start = 41300;
  config.port_end = 41302;
  ProcessSupervisor sup(config, refusing, hub_);

  auto desc = sup.start(alpha_);

  ASSERT_FALSE(desc.has_value());
  EXPECT_EQ(desc.error(), Error::PortRangeExhausted);
  auto status = sup.status(alpha_);
  EXPECT_EQ(status.status, PreviewState::Error);
  EXPECT_EQ(status.detail, "no available port in range 41300-41302");

  auto err = reader_->wait_event(EventType::Error);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->data["errorType"], "port");
  EXPECT_EQ(refusing.reserved_count(), 0u);
}

TEST_F(ProcessSupervisorTest, StopIsIdempotent) {
  auto& sup = make_supervisor("sleep 30");
  auto started = sup.start(alpha_);
  ASSERT_TRUE(started.has_value());
  auto pid = *started->pid;

  auto stopped = sup.stop(alpha_);

  EXPECT_EQ(stopped.status, PreviewState::Stopped);
  EXPECT_FALSE(stopped.port.has_value());
  EXPECT_FALSE(stopped.pid.has_value());
  EXPECT_TRUE(stopped.url.empty());
  EXPECT_NE(::kill(pid, 0), 0);

  auto again = sup.stop(alpha_);
  EXPECT_EQ(again.status, PreviewState::Stopped);
  EXPECT_EQ(sup.stop(test::project_id("never")).status, PreviewState::Stopped);
  EXPECT_EQ(sup.active_count(), 0u);
}

TEST_F(ProcessSupervisorTest, RestartAfterStopSpawnsNewProcess) {
  auto& sup = make_supervisor("sleep 30");
  auto first = sup.start(alpha_);
  ASSERT_TRUE(first.has_value());
  sup.stop(alpha_);

  auto second = sup.start(alpha_);

  ASSERT_TRUE(second.has_value());
  EXPECT_NE(first->pid, second->pid);
}

TEST_F(ProcessSupervisorTest, OutputForwardedAsLogWithPortEnv) {
  auto& sup = make_supervisor("echo listening on $PORT; sleep 30", false);

  auto desc = sup.start(alpha_);
  ASSERT_TRUE(desc.has_value());

  auto expected = std::format("listening on {}", *desc->port);
  auto log = reader_->wait_event(EventType::Log, [&](const nlohmann::json& d) {
    return d["content"] == expected;
  });
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->data["source"], "preview");
  EXPECT_EQ(log->data["projectId"], "alpha");
}

TEST_F(ProcessSupervisorTest, InvalidUtf8OutputReachesStreamSubscribers) {
  std::array<int, 2> fds{};
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds.data()), 0);
  ASSERT_TRUE(hub_.subscribe(alpha_, std::make_unique<StreamConnection>(
                                         fds[0], true, 1000ms))
                  .has_value());
  auto& sup = make_supervisor("printf 'caf\\351 ok\\n'; sleep 30", false);

  ASSERT_TRUE(sup.start(alpha_).has_value());

  auto log = reader_->wait_event(EventType::Log);
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(hub_.stream_count(alpha_), 2u);
  EXPECT_TRUE(is_active(sup.status(alpha_).status));

  std::string received;
  ASSERT_TRUE(test::wait_for([&] {
    std::array<char, 4096> buf{};
    auto n = ::recv(fds[1], buf.data(), buf.size(), MSG_DONTWAIT);
    if (n > 0) {
      received.append(buf.data(), static_cast<std::size_t>(n));
    }
    return received.find(" ok") != std::string::npos;
  }));
  EXPECT_NE(received.find("caf\xEF\xBF\xBD"), std::string::npos);
  ::close(fds[1]);
}

TEST_F(ProcessSupervisorTest, CrashMovesToError) {
  auto& sup = make_supervisor("echo booting; exit 3", false);

  ASSERT_TRUE(sup.start(alpha_).has_value());

  ASSERT_TRUE(wait_state(alpha_, PreviewState::Error));
  auto desc = sup.status(alpha_);
  EXPECT_NE(desc.detail.find("code 3"), std::string::npos);

  auto err = reader_->wait_event(EventType::Error);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->data["errorType"], "process_exit");
  EXPECT_EQ(sup.active_count(), 0u);
}

TEST_F(ProcessSupervisorTest, StartAfterCrashSpawnsAgain) {
  auto& sup = make_supervisor("exit 1", false);
  ASSERT_TRUE(sup.start(alpha_).has_value());
  ASSERT_TRUE(wait_state(alpha_, PreviewState::Error));

  auto again = sup.start(alpha_);

  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->status, PreviewState::Starting);
}

TEST_F(ProcessSupervisorTest, ReadinessTimeoutKillsProcess) {
  auto& sup = make_supervisor("sleep 30", false, 200);

  auto desc = sup.start(alpha_);
  ASSERT_TRUE(desc.has_value());

  ASSERT_TRUE(wait_state(alpha_, PreviewState::Error));
  EXPECT_NE(::kill(*desc->pid, 0), 0);

  auto err = reader_->wait_event(EventType::Error);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->data["errorType"], "timeout");
}

TEST_F(ProcessSupervisorTest, MissingProjectDirectory) {
  auto& sup = make_supervisor("sleep 30");
  auto ghost = test::project_id("ghost");
  auto [channel, conn] = make_channel_connection();
  ASSERT_TRUE(hub_.subscribe(ghost, std::move(conn)).has_value());
  test::ChannelReader ghost_reader(channel);

  auto desc = sup.start(ghost);

  ASSERT_FALSE(desc.has_value());
  EXPECT_EQ(desc.error(), Error::ProcessSpawnFailed);
  EXPECT_EQ(sup.status(ghost).status, PreviewState::Error);

  auto err = ghost_reader.wait_event(EventType::Error);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->data["errorType"], "structure");
}

TEST_F(ProcessSupervisorTest, StopAllStopsEveryProject) {
  auto& sup = make_supervisor("sleep 30");
  ASSERT_TRUE(sup.start(alpha_).has_value());
  ASSERT_TRUE(sup.start(beta_).has_value());

  sup.stop_all();

  EXPECT_EQ(sup.status(alpha_).status, PreviewState::Stopped);
  EXPECT_EQ(sup.status(beta_).status, PreviewState::Stopped);
  EXPECT_EQ(sup.active_count(), 0u);
}

TEST_F(ProcessSupervisorTest, DescriptorJson) {
  PreviewDescriptor desc{.project = alpha_, .status = PreviewState::Idle};

  auto j = desc.to_json();

  EXPECT_EQ(j["projectId"], "alpha");
  EXPECT_EQ(j["status"], "idle");
  EXPECT_TRUE(j["port"].is_null());
  EXPECT_TRUE(j["url"].is_null());
  EXPECT_TRUE(j["pid"].is_null());
}
