#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace macropipe {

/// Result of running one task.
struct TaskOutcome {
  std::string label;
  bool success{true};
  std::error_code error;
  std::string detail;

  [[nodiscard]] static auto completed(std::string label) -> TaskOutcome {
    return TaskOutcome{.label = std::move(label)};
  }

  [[nodiscard]] static auto failed(std::string label, std::error_code error,
                                   std::string detail) -> TaskOutcome {
    return TaskOutcome{.label = std::move(label),
                       .success = false,
                       .error = error,
                       .detail = std::move(detail)};
  }
};

/// Error kind and detail of a failed task.
struct TaskError {
  std::error_code kind;
  std::string detail;

  auto operator==(const TaskError &) const -> bool = default;
};

/// std::nullopt means the task completed.
using ErrorEntry = std::optional<TaskError>;

[[nodiscard]] inline auto to_error_entry(const TaskOutcome &outcome)
    -> ErrorEntry {
  if (outcome.success) {
    return std::nullopt;
  }
  return TaskError{.kind = outcome.error, .detail = outcome.detail};
}

/// Unit of work the orchestrator dispatches. Implementations must not rely
/// on being run on the thread (or in the process) that created them.
class ITask {
public:
  virtual ~ITask() = default;

  [[nodiscard]] virtual auto label() const -> std::string_view = 0;
  virtual auto set_label(std::string label) -> void = 0;

  /// Execute the task. Failures are reported in the outcome, not thrown.
  [[nodiscard]] virtual auto run() -> TaskOutcome = 0;
};

} // namespace macropipe
