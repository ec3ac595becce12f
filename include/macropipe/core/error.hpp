#pragma once

#include <array>
#include <cerrno>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace macropipe {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  FileOpenFailed,
  ParseError,
  InvalidArgument,
  UnsupportedMode,
  UnknownOperation,
  ClientNotConfigured,
  ClusterNotRunning,
  InvalidState,
  TaskException,
  WorkerDied,
  ProcessForkFailed,
  ProtocolError,
  Incomplete,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 16> messages = {
      "success",
      "file not found",
      "failed to open file",
      "parse error",
      "invalid argument",
      "unsupported execution mode",
      "unknown operation",
      "client not configured",
      "cluster not running",
      "invalid state",
      "task raised an exception",
      "worker process died",
      "failed to fork process",
      "protocol error",
      "incomplete data",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "macropipe";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
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

/// Failure taxonomy. Configuration and contract errors are returned by the
/// call that detected them; execution errors only ever appear in outcomes.
enum class ErrorClass : std::uint8_t {
  None,
  Configuration,
  Contract,
  Dispatch,
  Execution,
};

[[nodiscard]] inline auto classify(std::error_code ec) noexcept -> ErrorClass {
  if (!ec) {
    return ErrorClass::None;
  }
  if (ec.category() != error_category()) {
    return ErrorClass::Execution;
  }
  switch (static_cast<Error>(ec.value())) {
  case Error::Success:
    return ErrorClass::None;
  case Error::FileNotFound:
  case Error::FileOpenFailed:
  case Error::ParseError:
  case Error::UnsupportedMode:
  case Error::UnknownOperation:
    return ErrorClass::Configuration;
  case Error::InvalidArgument:
  case Error::ClientNotConfigured:
  case Error::InvalidState:
    return ErrorClass::Contract;
  case Error::ClusterNotRunning:
    return ErrorClass::Dispatch;
  case Error::TaskException:
  case Error::WorkerDied:
  case Error::ProcessForkFailed:
  case Error::ProtocolError:
  case Error::Incomplete:
  case Error::Unknown:
    break;
  }
  return ErrorClass::Execution;
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

/// errno of the last failed syscall as a system_category code.
[[nodiscard]] inline auto last_system_error() -> std::error_code {
  return {errno, std::system_category()};
}

template <typename T> [[nodiscard]] auto sys_check(T val) -> Result<T> {
  if (val < 0)
    return fail(last_system_error());
  return ok(val);
}

} // namespace macropipe

template <> struct std::is_error_code_enum<macropipe::Error> : std::true_type {};
