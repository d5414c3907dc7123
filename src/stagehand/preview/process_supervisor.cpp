#include "stagehand/preview/process_supervisor.hpp"

#include "stagehand/core/constants.hpp"
#include "stagehand/event/event.hpp"
#include "stagehand/event/event_hub.hpp"
#include "stagehand/preview/process.hpp"
#include "stagehand/util/log.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <filesystem>
#include <format>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace stagehand {

namespace {

using Clock = std::chrono::steady_clock;

struct Instance {
  mutable std::mutex state_mu;
  PreviewDescriptor desc;
  // Held in the allocator from spawn until the process is gone.
  std::optional<std::uint16_t> reserved_port;

  // Owned by the monitor thread while it runs; stop() touches it only after
  // joining the monitor.
  ProcessHandle proc;
  std::jthread monitor;

  [[nodiscard]] auto snapshot() const -> PreviewDescriptor {
    std::lock_guard lock(state_mu);
    return desc;
  }

  auto transition(PreviewState state, std::string detail = {})
      -> PreviewDescriptor {
    std::lock_guard lock(state_mu);
    desc.status = state;
    desc.detail = std::move(detail);
    if (state == PreviewState::Stopped) {
      desc.port.reset();
      desc.pid.reset();
      desc.url.clear();
    }
    return desc;
  }

  auto join_monitor() -> void {
    if (monitor.joinable()) {
      monitor.request_stop();
      monitor.join();
    }
  }
};

// lifecycle_mu serializes start/stop. current_mu only guards the pointer so
// status() never waits behind a start() that is busy allocating a port.
struct Slot {
  std::mutex lifecycle_mu;
  mutable std::mutex current_mu;
  std::shared_ptr<Instance> current;

  [[nodiscard]] auto get() const -> std::shared_ptr<Instance> {
    std::lock_guard lock(current_mu);
    return current;
  }

  auto set(std::shared_ptr<Instance> inst) -> void {
    std::lock_guard lock(current_mu);
    current = std::move(inst);
  }
};

auto idle_descriptor(const ProjectId& project, PreviewState state)
    -> PreviewDescriptor {
  return PreviewDescriptor{.project = project, .status = state};
}

}  // namespace

auto PreviewDescriptor::to_json() const -> nlohmann::json {
  nlohmann::json j = {{"projectId", project.value()},
                      {"status", preview_state_to_string(status)},
                      {"port", nullptr},
                      {"url", nullptr},
                      {"pid", nullptr}};
  if (port) {
    j["port"] = *port;
  }
  if (!url.empty()) {
    j["url"] = url;
  }
  if (pid) {
    j["pid"] = *pid;
  }
  if (!detail.empty()) {
    j["detail"] = detail;
  }
  return j;
}

auto tcp_ready_probe(std::uint16_t port) -> bool {
  int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (fd < 0) {
    return false;
  }

  sockaddr_in sa{};
  sa.sin_family = AF_INET;
  sa.sin_port = htons(port);
  sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  bool ready = false;
  if (::connect(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) == 0) {
    ready = true;
  } else if (errno == EINPROGRESS) {
    pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
    if (::poll(&pfd, 1, 200) == 1) {
      int err = 0;
      socklen_t len = sizeof(err);
      ready = ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 &&
              err == 0;
    }
  }
  ::close(fd);
  return ready;
}

struct ProcessSupervisor::Impl {
  PreviewConfig config;
  PortAllocator& allocator;
  EventHub& hub;
  ReadyProbe ready_probe{tcp_ready_probe};

  mutable std::mutex slots_mu;
  std::unordered_map<ProjectId, std::shared_ptr<Slot>> slots;

  Impl(PreviewConfig cfg, PortAllocator& a, EventHub& h)
      : config(std::move(cfg)), allocator(a), hub(h) {
  }

  [[nodiscard]] auto slot(const ProjectId& project) -> std::shared_ptr<Slot> {
    std::lock_guard lock(slots_mu);
    auto& s = slots[project];
    if (!s) {
      s = std::make_shared<Slot>();
    }
    return s;
  }

  [[nodiscard]] auto find(const ProjectId& project) const
      -> std::shared_ptr<Slot> {
    std::lock_guard lock(slots_mu);
    auto it = slots.find(project);
    return it == slots.end() ? nullptr : it->second;
  }

  [[nodiscard]] auto all_projects() const -> std::vector<ProjectId> {
    std::lock_guard lock(slots_mu);
    std::vector<ProjectId> out;
    out.reserve(slots.size());
    for (const auto& [project, _] : slots) {
      out.push_back(project);
    }
    return out;
  }

  // Safe to call from both the monitor and stop(); only the first call
  // returns the port.
  auto release_port(Instance& inst) -> void {
    std::optional<std::uint16_t> port;
    {
      std::lock_guard lock(inst.state_mu);
      port = std::exchange(inst.reserved_port, std::nullopt);
    }
    if (port) {
      allocator.release(*port);
    }
  }

  auto publish_state(const PreviewDescriptor& desc) -> void {
    hub.publish(desc.project,
                events::preview_status(preview_state_to_string(desc.status),
                                       desc.to_json()));
  }

  auto publish_error(const ProjectId& project, std::string_view message,
                     std::string_view error_type) -> void {
    hub.publish(project,
                events::error(message, {{"projectId", project.value()},
                                        {"errorType", error_type}}));
  }

  // Records a failed start on a fresh instance so status() reports it.
  auto fail_start(Slot& s, const ProjectId& project, std::string detail,
                  std::string_view error_type) -> void {
    auto inst = std::make_shared<Instance>();
    inst->desc = idle_descriptor(project, PreviewState::Error);
    inst->desc.detail = detail;
    s.set(inst);
    log::error("Preview for {} failed to start: {}", project, detail);
    publish_state(inst->snapshot());
    publish_error(project, detail, error_type);
  }

  auto emit_line(const ProjectId& project, std::string_view line) -> void {
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (line.empty()) {
      return;
    }
    hub.publish(project, events::log("stdout", line, "preview", project));
  }

  // Returns false once the pipe reached EOF.
  auto drain_output(Instance& inst, const ProjectId& project,
                    std::string& pending) -> bool {
    std::array<char, io::kReadBufferSize> buf;
    while (true) {
      ssize_t n = ::read(inst.proc.output_fd(), buf.data(), buf.size());
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
      }
      if (n == 0) {
        if (!pending.empty()) {
          emit_line(project, pending);
          pending.clear();
        }
        return false;
      }

      pending.append(buf.data(), static_cast<std::size_t>(n));
      std::size_t start = 0;
      for (auto nl = pending.find('\n'); nl != std::string::npos;
           nl = pending.find('\n', start)) {
        emit_line(project, std::string_view(pending).substr(start, nl - start));
        start = nl + 1;
      }
      pending.erase(0, start);
      if (pending.size() > io::kMaxLogLineSize) {
        emit_line(project, pending);
        pending.clear();
      }
    }
  }

  auto monitor(std::stop_token st, Instance& inst) -> void {
    auto desc = inst.snapshot();
    const auto project = desc.project;
    const auto port = desc.port.value_or(0);

    publish_state(inst.transition(PreviewState::Running));

    const auto started = Clock::now();
    const auto ready_timeout = std::chrono::milliseconds(config.ready_timeout_ms);
    const auto probe_interval =
        std::chrono::milliseconds(config.ready_poll_interval_ms);
    auto next_probe = started;
    bool ready = false;
    std::string pending;

    while (!st.stop_requested()) {
      std::array<pollfd, 2> fds{};
      nfds_t nfds = 0;
      if (inst.proc.output_fd() >= 0) {
        fds[nfds++] = {.fd = inst.proc.output_fd(), .events = POLLIN,
                       .revents = 0};
      }
      if (inst.proc.pidfd() >= 0) {
        fds[nfds++] = {.fd = inst.proc.pidfd(), .events = POLLIN,
                       .revents = 0};
      }
      ::poll(fds.data(), nfds,
             static_cast<int>(timing::kMonitorPollInterval.count()));

      if (inst.proc.output_fd() >= 0 &&
          !drain_output(inst, project, pending)) {
        inst.proc.close_output();
      }

      if (auto code = inst.proc.try_wait()) {
        if (inst.proc.output_fd() >= 0) {
          (void)drain_output(inst, project, pending);
        }
        if (st.stop_requested()) {
          return;
        }
        release_port(inst);
        auto d = inst.transition(
            PreviewState::Error,
            std::format("dev server exited with code {}", *code));
        log::error("Preview for {} exited unexpectedly (code {})", project,
                   *code);
        publish_state(d);
        publish_error(project, d.detail, "process_exit");
        return;
      }

      auto now = Clock::now();
      if (!ready && now >= next_probe) {
        if (ready_probe(port)) {
          ready = true;
          log::info("Preview for {} ready on port {}", project, port);
          publish_state(inst.transition(PreviewState::Ready));
        } else if (now - started >= ready_timeout) {
          auto code = inst.proc.terminate(
              std::chrono::milliseconds(config.stop_grace_ms));
          auto d = inst.transition(
              PreviewState::Error,
              std::format("dev server not ready within {}ms (exit code {})",
                          ready_timeout.count(), code));
          release_port(inst);
          log::error("Preview for {}: {}", project, d.detail);
          publish_state(d);
          publish_error(project, d.detail, "timeout");
          return;
        } else {
          next_probe = now + probe_interval;
        }
      }
    }
  }
};

ProcessSupervisor::ProcessSupervisor(PreviewConfig config,
                                     PortAllocator& allocator, EventHub& hub)
    : impl_(std::make_unique<Impl>(std::move(config), allocator, hub)) {
}

ProcessSupervisor::~ProcessSupervisor() {
  stop_all();
}

auto ProcessSupervisor::set_ready_probe(ReadyProbe probe) -> void {
  impl_->ready_probe = std::move(probe);
}

auto ProcessSupervisor::start(const ProjectId& project)
    -> Result<PreviewDescriptor> {
  if (project.empty()) {
    return fail(Error::InvalidArgument);
  }

  auto s = impl_->slot(project);
  std::lock_guard lifecycle(s->lifecycle_mu);

  if (auto inst = s->get()) {
    auto d = inst->snapshot();
    if (is_active(d.status)) {
      log::debug("Preview for {} already {}, reusing", project,
                 preview_state_to_string(d.status));
      return d;
    }
    inst->join_monitor();
  }

  std::error_code ec;
  auto workdir = std::filesystem::path(impl_->config.projects_root) /
                 std::string(project.value());
  if (!std::filesystem::is_directory(workdir, ec)) {
    impl_->fail_start(*s, project,
                      std::format("project directory not found: {}",
                                  workdir.string()),
                      "structure");
    return fail(Error::ProcessSpawnFailed);
  }

  auto range = resolve_port_range(std::nullopt, std::nullopt, impl_->config);
  if (!range) {
    impl_->fail_start(*s, project, "invalid preview port range", "port");
    return std::unexpected(range.error());
  }
  auto port = impl_->allocator.reserve(*range);
  if (!port) {
    impl_->fail_start(*s, project, exhausted_message(*range), "port");
    return std::unexpected(port.error());
  }

  auto command = substitute_port(impl_->config.command, *port);
  auto proc = ProcessHandle::spawn(
      {.command = command,
       .working_dir = workdir.string(),
       .env = {{"PORT", std::to_string(*port)}}});
  if (!proc) {
    impl_->allocator.release(*port);
    impl_->fail_start(*s, project, proc.error().message(), "spawn");
    return std::unexpected(proc.error());
  }

  auto inst = std::make_shared<Instance>();
  inst->desc = PreviewDescriptor{
      .project = project,
      .status = PreviewState::Starting,
      .port = *port,
      .url = std::format("http://localhost:{}", *port),
      .pid = static_cast<int>(proc->pid()),
      .detail = {},
  };
  inst->reserved_port = *port;
  inst->proc = std::move(*proc);
  s->set(inst);

  auto desc = inst->snapshot();
  log::info("Preview for {} starting on port {} (pid {}): {}", project, *port,
            *desc.pid, command);
  impl_->publish_state(desc);

  Instance* raw = inst.get();
  inst->monitor = std::jthread(
      [this, raw](std::stop_token st) { impl_->monitor(std::move(st), *raw); });
  return desc;
}

auto ProcessSupervisor::stop(const ProjectId& project) -> PreviewDescriptor {
  auto s = impl_->find(project);
  if (!s) {
    return idle_descriptor(project, PreviewState::Stopped);
  }

  std::lock_guard lifecycle(s->lifecycle_mu);
  auto inst = s->get();
  if (!inst) {
    return idle_descriptor(project, PreviewState::Stopped);
  }
  if (auto d = inst->snapshot(); d.status == PreviewState::Stopped) {
    return d;
  }

  inst->join_monitor();
  if (inst->proc.pid() > 0) {
    auto code =
        inst->proc.terminate(std::chrono::milliseconds(impl_->config.stop_grace_ms));
    log::info("Preview for {} stopped (exit code {})", project, code);
  }
  impl_->release_port(*inst);

  auto d = inst->transition(PreviewState::Stopped);
  impl_->publish_state(d);
  return d;
}

auto ProcessSupervisor::status(const ProjectId& project) const
    -> PreviewDescriptor {
  auto s = impl_->find(project);
  if (!s) {
    return idle_descriptor(project, PreviewState::Idle);
  }
  auto inst = s->get();
  return inst ? inst->snapshot() : idle_descriptor(project, PreviewState::Idle);
}

auto ProcessSupervisor::stop_all() -> void {
  for (const auto& project : impl_->all_projects()) {
    if (is_active(status(project).status)) {
      (void)stop(project);
    } else if (auto s = impl_->find(project)) {
      std::lock_guard lifecycle(s->lifecycle_mu);
      if (auto inst = s->get()) {
        inst->join_monitor();
      }
    }
  }
}

auto ProcessSupervisor::active_count() const -> std::size_t {
  std::size_t count = 0;
  for (const auto& project : impl_->all_projects()) {
    if (is_active(status(project).status)) {
      ++count;
    }
  }
  return count;
}

}  // namespace stagehand
