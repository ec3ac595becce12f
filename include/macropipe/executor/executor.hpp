#pragma once

#include "macropipe/core/cluster.hpp"
#include "macropipe/core/error.hpp"
#include "macropipe/pipeline/task.hpp"
#include "macropipe/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace macropipe {

/// Cluster construction modes understood by make_client().
enum class ClientMode : std::uint8_t {
  Local,
};
BOOST_DESCRIBE_ENUM(ClientMode, Local)
MACROPIPE_DEFINE_ENUM_SERDE(ClientMode, ClientMode::Local)

/// An independent unit of work; `label` names it in failure outcomes.
struct WorkUnit {
  std::string label;
  std::move_only_function<TaskOutcome()> run;
};

/// Cluster supplied by the caller. Never started or closed implicitly.
struct ExternalExecutor {
  Cluster *cluster{nullptr};
};

/// Cluster created for (and owned by) the client.
struct LocalExecutor {
  std::unique_ptr<Cluster> cluster;
};

using ExecutorHandle = std::variant<ExternalExecutor, LocalExecutor>;

/// Uniform "submit N units, gather N results" front-end over a cluster,
/// whichever way the cluster came to exist.
class Client {
public:
  explicit Client(ExecutorHandle handle) : handle_{std::move(handle)} {}

  Client(Client &&) noexcept = default;
  Client &operator=(Client &&) noexcept = default;
  Client(const Client &) = delete;
  Client &operator=(const Client &) = delete;

  [[nodiscard]] auto cluster() noexcept -> Cluster &;
  [[nodiscard]] auto cluster() const noexcept -> const Cluster &;
  [[nodiscard]] auto status() const noexcept -> ClusterStatus {
    return cluster().status();
  }
  [[nodiscard]] auto owns_cluster() const noexcept -> bool {
    return std::holds_alternative<LocalExecutor>(handle_);
  }

  /// Run every unit concurrently and block until all have finished.
  /// result[i] always belongs to units[i], whatever the completion order.
  /// Unit failures (including exceptions) become failed outcomes; only
  /// dispatch problems make the call itself fail.
  [[nodiscard]] auto submit_and_gather(std::vector<WorkUnit> units)
      -> Result<std::vector<TaskOutcome>>;

  /// Shut the underlying cluster down.
  auto close() noexcept -> void { cluster().close(); }

private:
  ExecutorHandle handle_;
};

/// Wrap a cluster owned by the caller. A closed cluster is rejected.
[[nodiscard]] auto attach(Cluster &cluster) -> Result<Client>;

/// Create and start a local cluster; returns once it is running.
[[nodiscard]] auto create_local(ClusterOptions options) -> Result<Client>;

/// `mode` must be a ClientMode name exactly ("local"); anything else,
/// including other spellings, is Error::UnsupportedMode.
[[nodiscard]] auto make_client(std::string_view mode, ClusterOptions options)
    -> Result<Client>;

namespace detail {

/// TaskException outcome carrying what() (or a fixed text for exceptions not
/// derived from std::exception).
[[nodiscard]] auto outcome_from_exception(std::string label,
                                          std::exception_ptr ep)
    -> TaskOutcome;

/// Invoke the unit, turning anything it throws into a failed outcome.
[[nodiscard]] auto run_guarded(WorkUnit &unit) -> TaskOutcome;

} // namespace detail

} // namespace macropipe
