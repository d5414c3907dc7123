#include "stagehand/event/stream_connection.hpp"

#include "stagehand/util/log.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <unistd.h>

namespace stagehand {

StreamConnection::StreamConnection(int fd, bool owns_fd,
                                   std::chrono::milliseconds write_timeout)
    : fd_(fd), owns_fd_(owns_fd), write_timeout_(write_timeout) {
}

StreamConnection::~StreamConnection() {
  close();
}

auto StreamConnection::send(const Event& event) -> Result<void> {
  std::lock_guard lock(mu_);
  if (!open_.load(std::memory_order_acquire)) {
    return fail(Error::ConnectionClosed);
  }
  return write_all(event.to_sse_frame());
}

auto StreamConnection::close() -> void {
  std::lock_guard lock(mu_);
  if (!open_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  if (owns_fd_ && fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = -1;
}

auto StreamConnection::is_open() const noexcept -> bool {
  return open_.load(std::memory_order_acquire);
}

auto StreamConnection::write_all(std::string_view data) -> Result<void> {
  auto deadline = std::chrono::steady_clock::now() + write_timeout_;
  bool is_socket = true;

  while (!data.empty()) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return fail(Error::Timeout);
    }

    pollfd pfd{.fd = fd_, .events = POLLOUT, .revents = 0};
    int pr = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (pr < 0) {
      if (errno == EINTR) {
        continue;
      }
      return fail(Error::ConnectionWriteFailed);
    }
    if (pr == 0) {
      return fail(Error::Timeout);
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      return fail(Error::ConnectionClosed);
    }

    ssize_t n = -1;
    if (is_socket) {
      n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
      if (n < 0 && errno == ENOTSOCK) {
        is_socket = false;
      }
    }
    if (!is_socket) {
      n = ::write(fd_, data.data(), data.size());
    }

    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      }
      log::debug("Stream write failed on fd {}: {}", fd_, std::strerror(errno));
      return fail(Error::ConnectionWriteFailed);
    }
    data.remove_prefix(static_cast<std::size_t>(n));
  }
  return ok();
}

}  // namespace stagehand
