#pragma once

#include <algorithm>
#include <cctype>
#include <compare>
#include <concepts>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace conductor {

[[nodiscard]] inline auto has_control_chars(std::string_view value) noexcept
    -> bool {
  return std::any_of(value.begin(), value.end(),
                     [](unsigned char ch) { return std::iscntrl(ch) != 0; });
}

[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  return !value.empty() && !has_control_chars(value);
}

// Phantom type tags
struct TenantTag {};
struct TaskTag {};
struct PipelineTag {};
struct ExecutionTag {};
struct StepTag {};
struct AgentTag {};
struct AgentTaskTag {};
struct EventTag {};
struct IntegrationTag {};
struct NotificationTag {};

// Type-safe ID wrapper; different entity ids cannot be mixed up at compile
// time even though all of them are strings underneath.
template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

private:
  std::string value_;
};

using TenantId = TypedId<TenantTag>;
using TaskId = TypedId<TaskTag>;
using PipelineId = TypedId<PipelineTag>;
using ExecutionId = TypedId<ExecutionTag>;
using StepId = TypedId<StepTag>;
using AgentId = TypedId<AgentTag>;
using AgentTaskId = TypedId<AgentTaskTag>;
using EventId = TypedId<EventTag>;
using IntegrationId = TypedId<IntegrationTag>;
using NotificationId = TypedId<NotificationTag>;

template <typename T>
concept IsTypedId = requires(T id) {
  { id.value() } -> std::convertible_to<std::string_view>;
  { id.empty() } -> std::convertible_to<bool>;
};

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

} // namespace conductor

// `is_avalanching` tells ankerl::unordered_dense::hash to delegate to
// std::hash<TypedId<T>> instead of hashing the object bytes.
template <typename Tag> struct std::hash<conductor::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const conductor::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<conductor::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const conductor::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};

namespace conductor {

namespace detail {
[[nodiscard]] auto generate_uuid_v7_like() -> std::string;
} // namespace detail

// Time-ordered id: 12 hex digits of epoch milliseconds, 16 random hex
// digits, prefixed with a short entity marker.
template <typename Id>
  requires IsTypedId<Id>
[[nodiscard]] auto generate_id(std::string_view prefix) -> Id {
  return Id{std::format("{}-{}", prefix, detail::generate_uuid_v7_like())};
}

} // namespace conductor
