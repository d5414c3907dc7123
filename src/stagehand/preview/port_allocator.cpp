#include "stagehand/preview/port_allocator.hpp"

#include "stagehand/util/log.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <format>

#include <unistd.h>

namespace stagehand {

namespace {

class SocketGuard {
public:
  explicit SocketGuard(int fd) noexcept : fd_(fd) {
  }
  ~SocketGuard() {
    if (fd_ >= 0)
      ::close(fd_);
  }
  SocketGuard(const SocketGuard&) = delete;
  SocketGuard& operator=(const SocketGuard&) = delete;

  [[nodiscard]] auto get() const noexcept -> int {
    return fd_;
  }

private:
  int fd_;
};

auto bind_v4(int fd, in_addr_t addr, std::uint16_t port) -> bool {
  sockaddr_in sa{};
  sa.sin_family = AF_INET;
  sa.sin_port = htons(port);
  sa.sin_addr.s_addr = htonl(addr);
  return ::bind(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) == 0;
}

auto bind_v6(int fd, const in6_addr& addr, std::uint16_t port) -> bool {
  int on = 1;
  // Keep the IPv6 probe from also claiming the IPv4 port.
  ::setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &on, sizeof(on));

  sockaddr_in6 sa{};
  sa.sin6_family = AF_INET6;
  sa.sin6_port = htons(port);
  sa.sin6_addr = addr;
  return ::bind(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) == 0;
}

}  // namespace

auto PortRange::to_string() const -> std::string {
  return std::format("{}-{}", start, end);
}

auto probe_address_to_string(ProbeAddress addr) noexcept -> std::string_view {
  switch (addr) {
    case ProbeAddress::Ipv4Any: return "0.0.0.0";
    case ProbeAddress::Ipv6Any: return "::";
    case ProbeAddress::Ipv4Loopback: return "127.0.0.1";
    case ProbeAddress::Ipv6Loopback: return "::1";
  }
  return "?";
}

auto SocketPortProbe::try_bind(ProbeAddress addr, std::uint16_t port,
                               std::chrono::milliseconds timeout) -> bool {
  auto started = std::chrono::steady_clock::now();
  bool v6 = addr == ProbeAddress::Ipv6Any || addr == ProbeAddress::Ipv6Loopback;

  SocketGuard sock(
      ::socket(v6 ? AF_INET6 : AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (sock.get() < 0) {
    return false;
  }

  int on = 1;
  ::setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

  bool bound = false;
  switch (addr) {
    case ProbeAddress::Ipv4Any:
      bound = bind_v4(sock.get(), INADDR_ANY, port);
      break;
    case ProbeAddress::Ipv4Loopback:
      bound = bind_v4(sock.get(), INADDR_LOOPBACK, port);
      break;
    case ProbeAddress::Ipv6Any:
      bound = bind_v6(sock.get(), in6addr_any, port);
      break;
    case ProbeAddress::Ipv6Loopback:
      bound = bind_v6(sock.get(), in6addr_loopback, port);
      break;
  }
  if (!bound || ::listen(sock.get(), 1) != 0) {
    return false;
  }

  return std::chrono::steady_clock::now() - started <= timeout;
}

auto normalize_port(std::optional<std::int64_t> value) noexcept
    -> std::optional<std::uint16_t> {
  if (!value || *value <= 0 || *value > ports::kMaxPort) {
    return std::nullopt;
  }
  return static_cast<std::uint16_t>(*value);
}

auto resolve_port_range(std::optional<std::int64_t> start,
                        std::optional<std::int64_t> end,
                        const PreviewConfig& config) -> Result<PortRange> {
  auto span_from = [](std::uint16_t from) {
    return static_cast<std::uint16_t>(
        std::min<std::uint32_t>(from + ports::kDefaultSpan, ports::kMaxPort));
  };

  auto explicit_start = normalize_port(start);
  auto explicit_end = normalize_port(end);
  auto preferred = normalize_port(config.preferred_port);

  std::uint16_t default_start =
      normalize_port(config.port_start).value_or(ports::kFallbackStart);
  std::uint16_t default_end =
      normalize_port(config.port_end).value_or(span_from(default_start));

  PortRange range{};
  if (explicit_start) {
    range.start = *explicit_start;
    range.end = explicit_end.value_or(span_from(*explicit_start));
  } else if (preferred) {
    range.start = *preferred;
    range.end = explicit_end.value_or(span_from(*preferred));
  } else {
    range.start = default_start;
    range.end = explicit_end.value_or(default_end);
  }

  if (range.end < range.start) {
    log::error("Invalid port range: start {} end {}", range.start, range.end);
    return fail(Error::InvalidPortRange);
  }
  return range;
}

auto exhausted_message(const PortRange& range) -> std::string {
  return std::format("no available port in range {}", range.to_string());
}

PortAllocator::PortAllocator(std::shared_ptr<IPortProbe> probe,
                             std::chrono::milliseconds probe_timeout)
    : probe_(std::move(probe)), probe_timeout_(probe_timeout) {
}

auto PortAllocator::is_port_available(std::uint16_t port) -> bool {
  // Probes run one after another: two listeners on the same port in one
  // process would collide with each other.
  std::array<bool, kProbeAddresses.size()> results{};
  for (std::size_t i = 0; i < kProbeAddresses.size(); ++i) {
    results[i] = probe_->try_bind(kProbeAddresses[i], port, probe_timeout_);
  }

  if (!results[1] || !results[3]) {
    log::trace("Port {}: IPv6 probe failed (any={}, loopback={}), ignored",
               port, results[1], results[3]);
  }
  return results[0] && results[2];
}

auto PortAllocator::allocate(const PortRange& range) -> Result<std::uint16_t> {
  for (std::uint32_t port = range.start; port <= range.end; ++port) {
    auto candidate = static_cast<std::uint16_t>(port);
    if (is_port_available(candidate)) {
      log::debug("Allocated port {} from {}", candidate, range.to_string());
      return candidate;
    }
  }
  log::error("Port allocation failed: {}", exhausted_message(range));
  return fail(Error::PortRangeExhausted);
}

auto PortAllocator::reserve(const PortRange& range) -> Result<std::uint16_t> {
  for (std::uint32_t port = range.start; port <= range.end; ++port) {
    auto candidate = static_cast<std::uint16_t>(port);
    if (is_reserved(candidate) || !is_port_available(candidate)) {
      continue;
    }
    // Another caller may have reserved it while we were probing.
    std::lock_guard lock(reserved_mu_);
    if (reserved_.insert(candidate).second) {
      log::debug("Reserved port {} from {}", candidate, range.to_string());
      return candidate;
    }
  }
  log::error("Port reservation failed: {}", exhausted_message(range));
  return fail(Error::PortRangeExhausted);
}

auto PortAllocator::release(std::uint16_t port) -> void {
  std::lock_guard lock(reserved_mu_);
  if (reserved_.erase(port) > 0) {
    log::debug("Released port {}", port);
  }
}

auto PortAllocator::is_reserved(std::uint16_t port) const -> bool {
  std::lock_guard lock(reserved_mu_);
  return reserved_.contains(port);
}

auto PortAllocator::reserved_count() const -> std::size_t {
  std::lock_guard lock(reserved_mu_);
  return reserved_.size();
}

auto PortAllocator::allocate(std::optional<std::int64_t> start,
                             std::optional<std::int64_t> end,
                             const PreviewConfig& config)
    -> Result<std::uint16_t> {
  auto range = resolve_port_range(start, end, config);
  if (!range) {
    return std::unexpected(range.error());
  }
  return allocate(*range);
}

}  // namespace stagehand
