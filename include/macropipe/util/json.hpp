#pragma once

#include "macropipe/core/error.hpp"

#include <glaze/json.hpp>

#include <string>
#include <string_view>

namespace macropipe {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? std::move(*out) : std::string{"null"};
}

/// Serialize any glz::meta-described value.
template <typename T>
[[nodiscard]] auto to_json(const T &value) -> Result<std::string> {
  auto out = glz::write_json(value);
  if (!out) {
    return fail(Error::ProtocolError);
  }
  return ok(std::move(*out));
}

/// Parse a complete JSON document from a non null-terminated buffer.
/// Empty input is Incomplete, anything glaze rejects is ProtocolError.
template <typename T>
[[nodiscard]] auto from_json(std::string_view payload) -> Result<T> {
  if (payload.empty()) {
    return fail(Error::Incomplete);
  }
  T value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, payload); ec) {
    return fail(Error::ProtocolError);
  }
  return ok(std::move(value));
}

} // namespace macropipe
