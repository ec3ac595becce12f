#include "macropipe/core/cluster.hpp"

#include "macropipe/util/log.hpp"

#include <algorithm>
#include <ranges>
#include <thread>

namespace macropipe {

Cluster::Cluster(ClusterOptions options) : options_{std::move(options)} {
  if (options_.n_workers == 0) {
    options_.n_workers = std::max(1U, std::thread::hardware_concurrency());
  }
  options_.threads_per_worker = std::max(1U, options_.threads_per_worker);

  workers_.reserve(options_.n_workers);
  for (auto i : std::views::iota(0U, options_.n_workers)) {
    workers_.emplace_back(
        std::make_unique<Worker>(i, options_.threads_per_worker));
  }
}

Cluster::~Cluster() noexcept { close(); }

auto Cluster::start() -> Result<void> {
  auto expected = ClusterStatus::Created;
  if (!status_.compare_exchange_strong(expected, ClusterStatus::Running,
                                       std::memory_order_acq_rel)) {
    if (expected == ClusterStatus::Running) {
      return ok();
    }
    log::error("cluster: cannot start a closed cluster");
    return fail(Error::InvalidState);
  }

  if (!options_.local_directory.empty()) {
    for (auto &w : workers_) {
      if (auto r = w->acquire_scratch(options_.local_directory); !r) {
        for (auto &acquired : workers_) {
          acquired->release_scratch();
        }
        status_.store(ClusterStatus::Closed, std::memory_order_release);
        return fail(r.error());
      }
    }
  }

  log::debug("cluster: starting {} workers x {} threads ({} mode)",
             workers_.size(), options_.threads_per_worker,
             options_.processes ? "process" : "thread");

  for (auto &w : workers_) {
    w->start([this](worker_id id) {
      detail::current_worker_id = id;
      detail::current_cluster = this;
    });
  }
  return ok();
}

auto Cluster::close() noexcept -> void {
  auto previous =
      status_.exchange(ClusterStatus::Closed, std::memory_order_acq_rel);
  if (previous == ClusterStatus::Closed) {
    return;
  }
  for (auto &w : workers_) {
    w->stop();
  }
  if (!options_.local_directory.empty()) {
    for (auto &w : workers_) {
      w->release_scratch();
    }
    std::error_code ec;
    // Only removes the root when nothing else lives in it.
    std::filesystem::remove(options_.local_directory, ec);
  }
  if (previous == ClusterStatus::Running) {
    log::debug("cluster: closed");
  }
}

auto Cluster::current_worker() const noexcept -> worker_id {
  return detail::current_cluster == this ? detail::current_worker_id
                                         : kInvalidWorker;
}

} // namespace macropipe
