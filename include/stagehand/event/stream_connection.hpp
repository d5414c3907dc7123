#pragma once

#include "stagehand/core/constants.hpp"
#include "stagehand/event/connection.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string_view>

namespace stagehand {

// Writes SSE frames to a socket, pipe or terminal. Each frame must be fully
// written within write_timeout or the connection is reported as failed.
class StreamConnection : public IConnection {
public:
  StreamConnection(int fd, bool owns_fd,
                   std::chrono::milliseconds write_timeout =
                       timing::kWriteTimeout);
  ~StreamConnection() override;

  StreamConnection(const StreamConnection&) = delete;
  auto operator=(const StreamConnection&) -> StreamConnection& = delete;

  [[nodiscard]] auto send(const Event& event) -> Result<void> override;
  auto close() -> void override;
  [[nodiscard]] auto is_open() const noexcept -> bool override;

private:
  [[nodiscard]] auto write_all(std::string_view data) -> Result<void>;

  int fd_;
  bool owns_fd_;
  std::chrono::milliseconds write_timeout_;
  std::atomic<bool> open_{true};
  std::mutex mu_;
};

}  // namespace stagehand
