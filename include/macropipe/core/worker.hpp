#pragma once

#include "macropipe/core/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <filesystem>
#include <functional>
#include <limits>
#include <optional>
#include <thread>
#include <vector>

namespace macropipe {

template <typename T = void> using task = boost::asio::awaitable<T>;
using spawn_task = task<void>;

using boost::asio::co_spawn;
using boost::asio::detached;

/// Yields `[ec, value...]` instead of throwing.
inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

using worker_id = unsigned;

inline constexpr worker_id kInvalidWorker =
    std::numeric_limits<worker_id>::max();

/// One slot of a cluster: an io_context driven by a fixed number of threads.
class Worker {
public:
  using ThreadInit = std::function<void(worker_id)>;
  /// Counting gate: a buffered token per live child process, capacity
  /// thread_count(). Sending suspends while the worker is saturated.
  using ProcessGate = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code)>;

  Worker(worker_id id, unsigned threads);
  ~Worker();

  Worker(const Worker &) = delete;
  Worker &operator=(const Worker &) = delete;

  /// Spawn the worker threads; `on_thread_start` runs first on each of them.
  auto start(const ThreadInit &on_thread_start) -> void;
  auto stop() noexcept -> void;

  /// Create `root/worker-<id>` and remember it as this worker's scratch space.
  [[nodiscard]] auto acquire_scratch(const std::filesystem::path &root)
      -> Result<void>;
  auto release_scratch() noexcept -> void;

  [[nodiscard]] auto id() const noexcept -> worker_id { return id_; }
  [[nodiscard]] auto thread_count() const noexcept -> unsigned {
    return thread_count_;
  }
  [[nodiscard]] auto ctx() noexcept -> boost::asio::io_context & {
    return ctx_;
  }
  [[nodiscard]] auto scratch_dir() const -> const std::filesystem::path & {
    return scratch_dir_;
  }
  [[nodiscard]] auto process_gate() noexcept -> ProcessGate & {
    return process_gate_;
  }

private:
  worker_id id_;
  unsigned thread_count_;
  boost::asio::io_context ctx_;
  ProcessGate process_gate_;
  std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::jthread> threads_;
  std::filesystem::path scratch_dir_;
};

} // namespace macropipe
