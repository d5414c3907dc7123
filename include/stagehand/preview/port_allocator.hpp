#pragma once

#include "stagehand/config/system_config.hpp"
#include "stagehand/core/constants.hpp"
#include "stagehand/core/error.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace stagehand {

struct PortRange {
  std::uint16_t start;
  std::uint16_t end;

  [[nodiscard]] auto to_string() const -> std::string;
  [[nodiscard]] auto contains(std::uint16_t port) const noexcept -> bool {
    return port >= start && port <= end;
  }
};

enum class ProbeAddress : std::uint8_t {
  Ipv4Any,
  Ipv6Any,
  Ipv4Loopback,
  Ipv6Loopback,
};

inline constexpr std::array<ProbeAddress, 4> kProbeAddresses{
    ProbeAddress::Ipv4Any,
    ProbeAddress::Ipv6Any,
    ProbeAddress::Ipv4Loopback,
    ProbeAddress::Ipv6Loopback,
};

[[nodiscard]] auto probe_address_to_string(ProbeAddress addr) noexcept
    -> std::string_view;

// One bind attempt on a single address.
class IPortProbe {
public:
  virtual ~IPortProbe() = default;

  [[nodiscard]] virtual auto try_bind(ProbeAddress addr, std::uint16_t port,
                                      std::chrono::milliseconds timeout)
      -> bool = 0;
};

// Binds, listens and closes a real TCP socket.
class SocketPortProbe : public IPortProbe {
public:
  [[nodiscard]] auto try_bind(ProbeAddress addr, std::uint16_t port,
                              std::chrono::milliseconds timeout)
      -> bool override;
};

// nullopt unless 1 <= value <= 65535.
[[nodiscard]] auto normalize_port(std::optional<std::int64_t> value) noexcept
    -> std::optional<std::uint16_t>;

// Explicit bounds win over configured ones. A lone start spans
// kDefaultSpan ports; nothing at all yields the fallback band.
[[nodiscard]] auto resolve_port_range(std::optional<std::int64_t> start,
                                      std::optional<std::int64_t> end,
                                      const PreviewConfig& config)
    -> Result<PortRange>;

// "no available port in range 3135-3135"
[[nodiscard]] auto exhausted_message(const PortRange& range) -> std::string;

class PortAllocator {
public:
  explicit PortAllocator(std::shared_ptr<IPortProbe> probe =
                             std::make_shared<SocketPortProbe>(),
                         std::chrono::milliseconds probe_timeout =
                             timing::kProbeTimeout);

  // Accepted only when both IPv4 binds succeed; IPv6 results are recorded
  // in the debug log but never disqualify a port.
  [[nodiscard]] auto is_port_available(std::uint16_t port) -> bool;

  // Lowest accepted port in [range.start, range.end].
  [[nodiscard]] auto allocate(const PortRange& range) -> Result<std::uint16_t>;

  [[nodiscard]] auto allocate(std::optional<std::int64_t> start,
                              std::optional<std::int64_t> end,
                              const PreviewConfig& config)
      -> Result<std::uint16_t>;

  // Like allocate(range), but skips ports reserved earlier and keeps the
  // result reserved until release(). A freshly spawned server has not bound
  // its port yet, so probing alone would hand the same port out twice.
  [[nodiscard]] auto reserve(const PortRange& range) -> Result<std::uint16_t>;
  auto release(std::uint16_t port) -> void;
  [[nodiscard]] auto is_reserved(std::uint16_t port) const -> bool;
  [[nodiscard]] auto reserved_count() const -> std::size_t;

private:
  std::shared_ptr<IPortProbe> probe_;
  std::chrono::milliseconds probe_timeout_;

  mutable std::mutex reserved_mu_;
  std::unordered_set<std::uint16_t> reserved_;
};

}  // namespace stagehand
