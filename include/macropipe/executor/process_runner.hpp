#pragma once

#include "macropipe/core/error.hpp"
#include "macropipe/core/worker.hpp"
#include "macropipe/executor/executor.hpp"
#include "macropipe/pipeline/task.hpp"

#include <string>
#include <string_view>

namespace macropipe::detail {

/// Run `unit` in a forked child and report its outcome. The child sends the
/// outcome back as JSON over a pipe; the awaiting coroutine never blocks its
/// worker while the child runs. At most `gate`'s capacity of children run at
/// once; later units wait for a slot before forking.
[[nodiscard]] auto run_in_child_process(WorkUnit unit,
                                        Worker::ProcessGate &gate)
    -> task<TaskOutcome>;

/// Wire form of an outcome crossing the process boundary.
[[nodiscard]] auto encode_outcome(const TaskOutcome &outcome) -> std::string;
[[nodiscard]] auto decode_outcome(std::string_view payload)
    -> Result<TaskOutcome>;

/// Outcome for a reaped child: its decoded payload, else WorkerDied when it
/// exited abnormally or sent nothing, else ProtocolError.
[[nodiscard]] auto outcome_from_child(std::string label,
                                      std::string_view payload,
                                      int wait_status) -> TaskOutcome;

/// "exit status N" / "killed by signal N" for a waitpid() status.
[[nodiscard]] auto describe_wait_status(int status) -> std::string;

} // namespace macropipe::detail
