#pragma once

#include "macropipe/core/error.hpp"
#include "macropipe/core/worker.hpp"
#include "macropipe/util/enum.hpp"

#include <boost/asio/post.hpp>
#include <boost/describe/enum.hpp>

#include <atomic>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace macropipe {

enum class ClusterStatus : std::uint8_t { Created, Running, Closed };
BOOST_DESCRIBE_ENUM(ClusterStatus, Created, Running, Closed)
MACROPIPE_DEFINE_ENUM_SERDE(ClusterStatus, ClusterStatus::Created)

struct ClusterOptions {
  unsigned n_workers{0}; // 0 = hardware_concurrency
  unsigned threads_per_worker{1};
  bool processes{false}; // run every unit of work in a forked child
  std::string local_directory;

  auto operator==(const ClusterOptions &) const -> bool = default;
};

/// A local pool of workers. Work is posted to a worker's io_context and runs
/// on one of that worker's threads.
class Cluster {
public:
  explicit Cluster(ClusterOptions options = {});
  ~Cluster() noexcept;

  Cluster(const Cluster &) = delete;
  Cluster &operator=(const Cluster &) = delete;

  /// Idempotent while running; a closed cluster cannot be restarted.
  [[nodiscard]] auto start() -> Result<void>;
  auto close() noexcept -> void;

  [[nodiscard]] auto status() const noexcept -> ClusterStatus {
    return status_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return status() == ClusterStatus::Running;
  }
  [[nodiscard]] auto options() const noexcept -> const ClusterOptions & {
    return options_;
  }
  [[nodiscard]] auto worker_count() const noexcept -> unsigned {
    return static_cast<unsigned>(workers_.size());
  }
  [[nodiscard]] auto worker(worker_id id) noexcept -> Worker & {
    assert(id < workers_.size());
    return *workers_[id];
  }

  /// Worker executing the calling thread, kInvalidWorker outside the pool.
  [[nodiscard]] auto current_worker() const noexcept -> worker_id;

  template <typename F> auto post_to(worker_id target, F &&fn) -> void {
    assert(target < workers_.size());
    boost::asio::post(workers_[target]->ctx().get_executor(),
                      std::forward<F>(fn));
  }

  /// Post to the next worker in round-robin order.
  template <typename F> auto post(F &&fn) -> void {
    post_to(next_worker(), std::forward<F>(fn));
  }

  /// Start `coro` on a worker. `on_done` receives the coroutine's
  /// completion (`std::exception_ptr` first); the default drops it.
  template <typename T, typename Handler = boost::asio::detached_t>
  auto spawn_on(worker_id target, task<T> coro, Handler &&on_done = {})
      -> void {
    assert(target < workers_.size());
    co_spawn(workers_[target]->ctx().get_executor(), std::move(coro),
             std::forward<Handler>(on_done));
  }

private:
  [[nodiscard]] auto next_worker() noexcept -> worker_id {
    return static_cast<worker_id>(
        next_rr_.fetch_add(1, std::memory_order_relaxed) % workers_.size());
  }

  ClusterOptions options_;
  std::vector<std::unique_ptr<Worker>> workers_;
  std::atomic<ClusterStatus> status_{ClusterStatus::Created};
  std::atomic<std::uint64_t> next_rr_{0};
};

namespace detail {
inline thread_local worker_id current_worker_id = kInvalidWorker;
inline thread_local const Cluster *current_cluster = nullptr;
} // namespace detail

} // namespace macropipe
