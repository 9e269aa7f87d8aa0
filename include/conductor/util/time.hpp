#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace conductor::util {

// Formats time point to ISO 8601 (YYYY-MM-DDTHH:MM:SSZ); empty for unset.
[[nodiscard]] inline auto
format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
  if (tp == std::chrono::system_clock::time_point{})
    return {};
  auto const sec_tp = std::chrono::floor<std::chrono::seconds>(tp);
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}", sec_tp);
}

// Formats time point to local timestamp (YYYY-MM-DD HH:MM:SS)
[[nodiscard]] inline auto
format_local_timestamp(std::chrono::system_clock::time_point tp)
    -> std::string {
  if (tp == std::chrono::system_clock::time_point{}) {
    return "-";
  }
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

[[nodiscard]] inline auto
to_unix_millis(std::chrono::system_clock::time_point tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

template <typename Rep, typename Period>
[[nodiscard]] inline auto
to_millis(std::chrono::duration<Rep, Period> d) noexcept -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

} // namespace conductor::util
