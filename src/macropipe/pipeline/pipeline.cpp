#include "macropipe/pipeline/pipeline.hpp"

#include "macropipe/util/log.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace macropipe {

auto Pipeline::register_operation(std::string name, Operation op) -> void {
  operations_.insert_or_assign(std::move(name), std::move(op));
}

auto Pipeline::has_operation(std::string_view name) const -> bool {
  return operations_.find(name) != operations_.end();
}

auto Pipeline::operation_names() const -> std::vector<std::string> {
  return operations_ | std::views::keys | std::ranges::to<std::vector>();
}

auto Pipeline::set_input(std::vector<Step> steps) -> Result<void> {
  auto unknown = std::ranges::find_if(
      steps, [this](const Step &s) { return !has_operation(s.name); });
  if (unknown != steps.end()) {
    log::error("pipeline '{}': unknown operation '{}'", label_,
               unknown->name);
    return fail(Error::UnknownOperation);
  }
  steps_ = std::move(steps);
  return ok();
}

auto Pipeline::run() -> TaskOutcome {
  for (const auto &step : steps_) {
    auto it = operations_.find(step.name);
    if (it == operations_.end()) {
      return TaskOutcome::failed(label_, make_error_code(Error::UnknownOperation),
                                 step.name);
    }

    log::trace("pipeline '{}': {}", label_, step.name);
    if (auto r = it->second(step.args); !r) {
      log::debug("pipeline '{}': step '{}' failed: {}", label_, step.name,
                 r.error().message());
      return TaskOutcome::failed(
          label_, r.error(),
          std::format("{}: {}", step.name, r.error().message()));
    }
  }
  return TaskOutcome::completed(label_);
}

} // namespace macropipe
