#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace stagehand {

namespace ports {
inline constexpr std::uint32_t kMaxPort = 65535;
inline constexpr std::uint16_t kFallbackStart = 3135;
inline constexpr std::uint16_t kFallbackEnd = 3999;
inline constexpr std::uint32_t kDefaultSpan = kFallbackEnd - kFallbackStart;
}  // namespace ports

namespace timing {
inline constexpr auto kProbeTimeout = std::chrono::milliseconds(500);
inline constexpr auto kHeartbeatInterval = std::chrono::milliseconds(30'000);
inline constexpr auto kPermissionTimeout = std::chrono::milliseconds(60'000);
inline constexpr auto kPermissionRetention = std::chrono::milliseconds(120'000);
inline constexpr auto kWriteTimeout = std::chrono::milliseconds(1'000);
inline constexpr auto kMonitorPollInterval = std::chrono::milliseconds(100);
}  // namespace timing

namespace io {
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kMaxLogLineSize = 16 * 1024;
inline constexpr std::size_t kInputPreviewLimit = 500;
inline constexpr std::size_t kChannelCapacity = 1024;
}  // namespace io

}  // namespace stagehand
