#pragma once

#include <optional>
#include <string>

namespace macropipe::cli {

/// Exit codes shared by every subcommand.
inline constexpr int kExitOk = 0;
inline constexpr int kExitTaskFailed = 1;
inline constexpr int kExitConfigError = 2;

struct RunOptions {
  std::string batch_file;
  std::optional<std::string> outcome_file;
  std::optional<std::string> log_level;
  std::optional<unsigned> workers;
  std::optional<unsigned> threads;
  bool processes{false};
};

struct ValidateOptions {
  std::string batch_file;
  bool json{false};
};

[[nodiscard]] auto cmd_run(const RunOptions &opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;

} // namespace macropipe::cli
