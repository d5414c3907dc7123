#pragma once

#include "stagehand/core/error.hpp"
#include "stagehand/event/event.hpp"

namespace stagehand {

// A single subscriber sink. Implementations must tolerate close() racing
// with send() from another thread; send() must return within a bounded time.
class IConnection {
public:
  virtual ~IConnection() = default;

  [[nodiscard]] virtual auto send(const Event& event) -> Result<void> = 0;
  virtual auto close() -> void = 0;
  [[nodiscard]] virtual auto is_open() const noexcept -> bool = 0;
};

}  // namespace stagehand
