#include "macropipe/executor/process_runner.hpp"

#include "macropipe/pipeline/file_io_pipeline.hpp"
#include "macropipe/util/json.hpp"
#include "macropipe/util/log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/this_coro.hpp>

#include <glaze/json.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <format>
#include <sys/wait.h>
#include <unistd.h>

namespace macropipe::detail {

struct OutcomeWire {
  std::string label;
  bool success{true};
  std::string category;
  int code{0};
  std::string detail;
};

} // namespace macropipe::detail

namespace glz {
template <> struct meta<macropipe::detail::OutcomeWire> {
  using T = macropipe::detail::OutcomeWire;
  static constexpr auto value =
      object("label", &T::label, "success", &T::success, "category",
             &T::category, "code", &T::code, "detail", &T::detail);
};
} // namespace glz

namespace macropipe::detail {

namespace {

inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr int kChildFailureExit = 127;

[[nodiscard]] auto category_from_name(std::string_view name)
    -> const std::error_category * {
  if (name == std::system_category().name()) {
    return &std::system_category();
  }
  if (name == std::generic_category().name()) {
    return &std::generic_category();
  }
  if (name == error_category().name()) {
    return &error_category();
  }
  return nullptr;
}

// Runs in the forked child: no asio, no logging, no return.
[[noreturn]] auto child_main(WorkUnit &unit, int out_fd) -> void {
  log::logger().detach_after_fork();
  auto payload = encode_outcome(run_guarded(unit));
  std::string_view rest = payload;
  while (!rest.empty()) {
    auto n = ::write(out_fd, rest.data(), rest.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ::_exit(kChildFailureExit);
    }
    rest.remove_prefix(static_cast<std::size_t>(n));
  }
  ::_exit(0);
}

// Returns a gate token when the child is done with its slot.
class GateSlot {
public:
  explicit GateSlot(Worker::ProcessGate &gate) : gate_{gate} {}
  ~GateSlot() {
    (void)gate_.try_receive([](boost::system::error_code) {});
  }
  GateSlot(const GateSlot &) = delete;
  GateSlot &operator=(const GateSlot &) = delete;

private:
  Worker::ProcessGate &gate_;
};

// Reaps the child exactly once, even when the reading coroutine unwinds.
class ChildReaper {
public:
  explicit ChildReaper(pid_t pid) : pid_{pid} {}
  ~ChildReaper() {
    if (pid_ > 0) {
      (void)wait();
    }
  }
  ChildReaper(const ChildReaper &) = delete;
  ChildReaper &operator=(const ChildReaper &) = delete;

  auto wait() -> int {
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
      if (errno != EINTR) {
        log::warn("process worker: waitpid({}) failed: {}", pid_,
                  last_system_error().message());
        break;
      }
    }
    pid_ = -1;
    return status;
  }

private:
  pid_t pid_;
};

} // namespace

auto encode_outcome(const TaskOutcome &outcome) -> std::string {
  OutcomeWire wire{.label = outcome.label,
                   .success = outcome.success,
                   .category = outcome.error ? outcome.error.category().name()
                                             : std::string{},
                   .code = outcome.error.value(),
                   .detail = outcome.detail};
  auto out = to_json(wire);
  return out ? std::move(*out) : std::string{};
}

auto decode_outcome(std::string_view payload) -> Result<TaskOutcome> {
  auto parsed = from_json<OutcomeWire>(payload);
  if (!parsed) {
    return fail(parsed.error());
  }
  auto &wire = *parsed;

  if (wire.success) {
    return ok(TaskOutcome::completed(std::move(wire.label)));
  }
  if (const auto *category = category_from_name(wire.category)) {
    return ok(TaskOutcome::failed(std::move(wire.label),
                                  std::error_code{wire.code, *category},
                                  std::move(wire.detail)));
  }
  return ok(TaskOutcome::failed(
      std::move(wire.label), make_error_code(Error::Unknown),
      std::format("{}:{} {}", wire.category, wire.code, wire.detail)));
}

auto describe_wait_status(int status) -> std::string {
  if (WIFSIGNALED(status)) {
    return std::format("killed by signal {}", WTERMSIG(status));
  }
  if (WIFEXITED(status)) {
    return std::format("exit status {}", WEXITSTATUS(status));
  }
  return std::format("wait status {}", status);
}

auto outcome_from_child(std::string label, std::string_view payload,
                        int wait_status) -> TaskOutcome {
  auto decoded = decode_outcome(payload);
  if (decoded) {
    return std::move(*decoded);
  }
  const bool clean_exit =
      WIFEXITED(wait_status) && WEXITSTATUS(wait_status) == 0;
  if (!clean_exit || decoded.error() == Error::Incomplete) {
    auto reason = describe_wait_status(wait_status);
    log::error("process worker: '{}' died without an outcome: {}", label,
               reason);
    return TaskOutcome::failed(std::move(label),
                               make_error_code(Error::WorkerDied),
                               std::move(reason));
  }
  log::error("process worker: '{}' sent a malformed outcome", label);
  return TaskOutcome::failed(std::move(label),
                             make_error_code(Error::ProtocolError),
                             "malformed outcome payload");
}

auto run_in_child_process(WorkUnit unit, Worker::ProcessGate &gate)
    -> task<TaskOutcome> {
  // Holds one of the worker's thread_count() slots until the child is reaped.
  if (auto [ec] = co_await gate.async_send(boost::system::error_code{},
                                           use_nothrow);
      ec) {
    co_return TaskOutcome::failed(unit.label,
                                  make_error_code(Error::ClusterNotRunning),
                                  ec.message());
  }
  GateSlot slot{gate};

  std::array<int, 2> fds{-1, -1};
  if (::pipe2(fds.data(), O_CLOEXEC) < 0) {
    auto ec = last_system_error();
    log::error("process worker: pipe() failed for '{}': {}", unit.label,
               ec.message());
    co_return TaskOutcome::failed(unit.label, ec, "pipe: " + ec.message());
  }
  FileDescriptor read_end{fds[0]};
  FileDescriptor write_end{fds[1]};

  const pid_t pid = ::fork();
  if (pid < 0) {
    auto ec = last_system_error();
    log::error("process worker: fork() failed for '{}': {}", unit.label,
               ec.message());
    co_return TaskOutcome::failed(unit.label,
                                  make_error_code(Error::ProcessForkFailed),
                                  ec.message());
  }
  if (pid == 0) {
    read_end.reset();
    child_main(unit, write_end.get());
  }
  ChildReaper reaper{pid};

  write_end.reset();
  log::debug("process worker: '{}' running in pid {}", unit.label, pid);

  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::readable_pipe pipe(executor, read_end.release());
  std::string payload;
  std::array<char, kReadBufferSize> buffer{};
  for (;;) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()), use_nothrow);
    payload.append(buffer.data(), bytes);
    if (ec) {
      break;
    }
  }

  co_return outcome_from_child(std::move(unit.label), payload, reaper.wait());
}

} // namespace macropipe::detail
