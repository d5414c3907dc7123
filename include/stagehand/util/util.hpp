#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <random>
#include <string>
#include <string_view>

namespace stagehand {

inline auto generate_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t a = dis(gen);
  std::uint64_t b = dis(gen);

  return std::format(
      "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
      static_cast<std::uint32_t>(a >> 32), static_cast<std::uint16_t>(a >> 16),
      static_cast<std::uint16_t>(a), static_cast<std::uint16_t>(b >> 48),
      b & 0xFFFFFFFFFFFFULL);
}

// Longest prefix of at most `limit` bytes that ends on a UTF-8 sequence
// boundary.
[[nodiscard]] inline auto utf8_prefix_length(std::string_view s,
                                             std::size_t limit) noexcept
    -> std::size_t {
  if (s.size() <= limit) {
    return s.size();
  }
  std::size_t n = limit;
  while (n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80) {
    --n;
  }
  return n;
}

// ISO-8601 UTC with millisecond precision, e.g. 2024-01-01T00:00:00.000Z
inline auto format_timestamp(std::chrono::system_clock::time_point tp)
    -> std::string {
  auto ms = std::chrono::floor<std::chrono::milliseconds>(tp);
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z", ms);
}

inline auto format_timestamp() -> std::string {
  return format_timestamp(std::chrono::system_clock::now());
}

}  // namespace stagehand
