#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace conductor {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  ParseError,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  Timeout,
  Cancelled,
  CycleDetected,
  HasDependents,
  InvalidState,
  ResourceExhausted,
  CircularDependency,
  DependencyTooDeep,
  CircularHierarchy,
  HierarchyTooDeep,
  CapacityExceeded,
  RateLimitExceeded,
  NoAgentAvailable,
  HandlerNotFound,
  HandlerFailed,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 22> messages = {
      "success",
      "file not found",
      "parse error",
      "invalid argument",
      "not found",
      "already exists",
      "timeout",
      "cancelled",
      "cycle detected in step graph",
      "resource has dependents",
      "invalid state transition",
      "resource exhausted",
      "dependency would create a cycle",
      "dependency chain exceeds depth limit",
      "parent assignment would create a cycle",
      "task hierarchy exceeds depth limit",
      "capacity exceeded",
      "rate limit exceeded",
      "no agent available",
      "no handler registered for event source",
      "event handler failed",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "conductor";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return std::string{messages.back()};
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace conductor

template <>
struct std::is_error_code_enum<conductor::Error> : std::true_type {};
