#include "macropipe/executor/executor.hpp"

#include "macropipe/executor/process_runner.hpp"
#include "macropipe/util/log.hpp"

#include <exception>
#include <latch>
#include <ranges>

namespace macropipe {

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

namespace detail {

auto outcome_from_exception(std::string label, std::exception_ptr ep)
    -> TaskOutcome {
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception &ex) {
    return TaskOutcome::failed(std::move(label),
                               make_error_code(Error::TaskException),
                               ex.what());
  } catch (...) {
    return TaskOutcome::failed(std::move(label),
                               make_error_code(Error::TaskException),
                               "non-standard exception");
  }
}

auto run_guarded(WorkUnit &unit) -> TaskOutcome {
  try {
    return unit.run();
  } catch (...) {
    return outcome_from_exception(unit.label, std::current_exception());
  }
}

} // namespace detail

auto Client::cluster() noexcept -> Cluster & {
  return std::visit(
      overloaded{[](ExternalExecutor &e) -> Cluster & { return *e.cluster; },
                 [](LocalExecutor &l) -> Cluster & { return *l.cluster; }},
      handle_);
}

auto Client::cluster() const noexcept -> const Cluster & {
  return std::visit(
      overloaded{
          [](const ExternalExecutor &e) -> const Cluster & {
            return *e.cluster;
          },
          [](const LocalExecutor &l) -> const Cluster & { return *l.cluster; }},
      handle_);
}

auto Client::submit_and_gather(std::vector<WorkUnit> units)
    -> Result<std::vector<TaskOutcome>> {
  auto &target = cluster();
  if (!target.is_running()) {
    log::error("client: cannot dispatch {} units, cluster is {}",
               units.size(), target.status());
    return fail(Error::ClusterNotRunning);
  }
  if (target.current_worker() != kInvalidWorker) {
    // Blocking a worker on its own pool can starve the units it waits for.
    log::error("client: submit_and_gather called from inside a worker");
    return fail(Error::InvalidState);
  }

  std::vector<TaskOutcome> results(units.size());
  if (units.empty()) {
    return ok(std::move(results));
  }

  std::latch done(static_cast<std::ptrdiff_t>(units.size()));
  const bool processes = target.options().processes;
  const auto workers = target.worker_count();

  for (auto [i, unit] : units | std::views::enumerate) {
    auto *slot = &results[static_cast<std::size_t>(i)];
    const auto worker = static_cast<worker_id>(i % workers);

    if (processes) {
      auto label = unit.label;
      auto &gate = target.worker(worker).process_gate();
      target.spawn_on(
          worker,
          [](WorkUnit u, Worker::ProcessGate &g,
             TaskOutcome *out) -> spawn_task {
            *out = co_await detail::run_in_child_process(std::move(u), g);
          }(std::move(unit), gate, slot),
          // The slot is settled and the latch released however the
          // coroutine ends.
          [slot, &done, label = std::move(label)](std::exception_ptr ep) {
            if (ep) {
              log::error("client: process unit '{}' aborted", label);
              *slot = detail::outcome_from_exception(label, ep);
            }
            done.count_down();
          });
    } else {
      target.post_to(worker,
                     [u = std::move(unit), slot, &done]() mutable {
                       *slot = detail::run_guarded(u);
                       done.count_down();
                     });
    }
  }

  done.wait();
  log::debug("client: gathered {} outcomes", results.size());
  return ok(std::move(results));
}

auto attach(Cluster &cluster) -> Result<Client> {
  if (cluster.status() == ClusterStatus::Closed) {
    log::error("client: refusing to attach to a closed cluster");
    return fail(Error::ClusterNotRunning);
  }
  return ok(Client{ExternalExecutor{.cluster = &cluster}});
}

auto create_local(ClusterOptions options) -> Result<Client> {
  auto cluster = std::make_unique<Cluster>(std::move(options));
  if (auto r = cluster->start(); !r) {
    return fail(r.error());
  }
  log::info("client: local cluster running ({} workers x {} threads, {})",
            cluster->worker_count(), cluster->options().threads_per_worker,
            cluster->options().processes ? "processes" : "threads");
  return ok(Client{LocalExecutor{.cluster = std::move(cluster)}});
}

auto make_client(std::string_view mode, ClusterOptions options)
    -> Result<Client> {
  auto parsed = util::find_enum_exact<ClientMode>(mode);
  if (!parsed) {
    log::error("client: unsupported mode '{}'", mode);
    return fail(Error::UnsupportedMode);
  }
  switch (*parsed) {
  case ClientMode::Local:
    return create_local(std::move(options));
  }
  return fail(Error::UnsupportedMode);
}

} // namespace macropipe
