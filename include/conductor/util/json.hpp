#pragma once

#include "conductor/core/error.hpp"

#include <glaze/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace conductor {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

[[nodiscard]] inline auto empty_json_object() -> JsonValue {
  JsonValue value{};
  value = JsonValue::object_t{};
  return value;
}

// Returns the string member `key` of a JSON object, if present.
[[nodiscard]] inline auto json_string(const JsonValue &value,
                                      std::string_view key)
    -> std::optional<std::string> {
  if (!value.is_object()) {
    return std::nullopt;
  }
  const auto &obj = value.get_object();
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_string()) {
    return std::nullopt;
  }
  return it->second.as<std::string>();
}

} // namespace conductor
