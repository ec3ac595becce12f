#pragma once

#include "macropipe/core/cluster.hpp"
#include "macropipe/core/error.hpp"
#include "macropipe/executor/executor.hpp"
#include "macropipe/pipeline/task.hpp"
#include "macropipe/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace macropipe {

enum class PipelineState : std::uint8_t {
  Unconfigured,
  ClientConfigured,
  Running,
  Completed,
};
BOOST_DESCRIBE_ENUM(PipelineState, Unconfigured, ClientConfigured, Running,
                    Completed)
MACROPIPE_DEFINE_ENUM_SERDE(PipelineState, PipelineState::Unconfigured)

inline constexpr std::string_view kCompletedToken = "Completed";

/// Runs a batch of independent tasks concurrently on a client and keeps one
/// outcome per task, aligned by position with tasks().
///
/// Configuration and contract errors are returned from the offending call;
/// task failures never fail run() and are only visible through errors(),
/// outcomes(), failed_pipelines() and the outcome report.
class MacroPipeline {
public:
  using TaskPtr = std::shared_ptr<ITask>;

  MacroPipeline() = default;

  MacroPipeline(const MacroPipeline &) = delete;
  MacroPipeline &operator=(const MacroPipeline &) = delete;
  MacroPipeline(MacroPipeline &&) noexcept = default;
  MacroPipeline &operator=(MacroPipeline &&) noexcept = default;

  [[nodiscard]] auto tasks() const noexcept -> const std::vector<TaskPtr> & {
    return tasks_;
  }

  /// Replace the task list. A null entry, or the same task listed twice, is
  /// rejected and the current list is kept. add_task() refuses a task that is
  /// already present.
  [[nodiscard]] auto set_tasks(std::vector<TaskPtr> tasks) -> Result<void>;
  [[nodiscard]] auto add_task(TaskPtr task) -> Result<void>;

  /// tasks()[i]->set_label(labels[i]); the sizes must match.
  [[nodiscard]] auto set_labels(std::span<const std::string> labels)
      -> Result<void>;

  /// Attach to a cluster the caller owns and will close.
  [[nodiscard]] auto setup_client(Cluster &cluster) -> Result<void>;
  /// Create a cluster in `mode` (only "local" is supported).
  [[nodiscard]] auto setup_client(std::string_view mode,
                                  ClusterOptions options = {})
      -> Result<void>;

  [[nodiscard]] auto client() noexcept -> Client * {
    return client_ ? &*client_ : nullptr;
  }

  /// Dispatch every task and block until all of them finished.
  [[nodiscard]] auto run() -> Result<void>;

  [[nodiscard]] auto state() const noexcept -> PipelineState { return state_; }

  /// Empty until the first completed run.
  [[nodiscard]] auto errors() const noexcept -> const std::vector<ErrorEntry> & {
    return errors_;
  }
  [[nodiscard]] auto outcomes() const noexcept
      -> const std::vector<TaskOutcome> & {
    return outcomes_;
  }

  /// Tasks whose last run failed, in task order.
  [[nodiscard]] auto failed_pipelines() const -> std::vector<TaskPtr>;

  /// One line per task: label followed by `Completed` or a failure token.
  [[nodiscard]] auto format_outcome() const -> std::string;
  /// Write format_outcome() to `to_file` (truncated), or stdout.
  [[nodiscard]] auto
  print_outcome(const std::optional<std::filesystem::path> &to_file =
                    std::nullopt) const -> Result<void>;

private:
  std::vector<TaskPtr> tasks_;
  std::optional<Client> client_;
  std::vector<TaskOutcome> outcomes_;
  std::vector<ErrorEntry> errors_;
  PipelineState state_{PipelineState::Unconfigured};
};

/// Status token for one outcome line: `Completed` or `Failed(<cat>:<code>)`.
[[nodiscard]] auto status_token(const TaskOutcome &outcome) -> std::string;

} // namespace macropipe
