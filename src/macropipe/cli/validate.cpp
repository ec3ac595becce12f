#include "macropipe/cli/commands.hpp"
#include "macropipe/cli/formatting.hpp"
#include "macropipe/config/batch_config.hpp"
#include "macropipe/executor/executor.hpp"
#include "macropipe/pipeline/file_io_pipeline.hpp"
#include "macropipe/util/json.hpp"
#include "macropipe/util/log.hpp"

#include <cstdint>
#include <format>
#include <print>
#include <ranges>
#include <vector>

namespace macropipe::cli {

namespace {

struct ValidationResult {
  std::string label;
  std::size_t steps{0};
  bool valid{false};
  std::string error;
};

auto validate_task(const TaskDefinition &def) -> ValidationResult {
  ValidationResult vr{
      .label = def.label, .steps = def.steps.size(), .valid = false, .error = {}};
  FileIoPipeline probe;
  if (auto r = probe.set_input(def.steps); !r) {
    vr.error = r.error().message();
    for (const auto &step : def.steps) {
      if (!probe.has_operation(step.name)) {
        vr.error = std::format("{}: '{}'", vr.error, step.name);
        break;
      }
    }
    return vr;
  }
  vr.valid = true;
  return vr;
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();

  std::string diagnostic;
  auto cfg_res = BatchLoader::load_from_file(opts.batch_file, &diagnostic);
  if (!cfg_res) {
    std::println(stderr, "Error: {}",
                 diagnostic.empty() ? cfg_res.error().message() : diagnostic);
    return kExitConfigError;
  }
  const auto &cfg = *cfg_res;

  const bool mode_ok =
      util::find_enum_exact<ClientMode>(cfg.client.mode).has_value();

  std::vector<ValidationResult> results;
  results.reserve(cfg.tasks.size());
  for (const auto &def : cfg.tasks) {
    results.push_back(validate_task(def));
  }
  const auto invalid_count = std::ranges::count_if(
      results, [](const ValidationResult &vr) { return !vr.valid; });
  const auto valid_count =
      static_cast<std::int64_t>(results.size()) - invalid_count;

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (auto [index, vr] : results | std::views::enumerate) {
      JsonValue obj{
          {"index", static_cast<std::int64_t>(index)},
          {"label", vr.label},
          {"steps", static_cast<std::int64_t>(vr.steps)},
          {"valid", vr.valid},
      };
      if (!vr.valid) {
        obj.get_object().emplace("error", vr.error);
      }
      arr.get_array().emplace_back(std::move(obj));
    }
    JsonValue output{
        {"mode", cfg.client.mode},
        {"mode_supported", mode_ok},
        {"tasks", std::move(arr)},
        {"summary",
         JsonValue{
             {"valid", valid_count},
             {"invalid", static_cast<std::int64_t>(invalid_count)},
             {"total", static_cast<std::int64_t>(results.size())},
         }},
    };
    std::println("{}", dump_json(output));
  } else {
    if (mode_ok) {
      std::println("{} client mode '{}'", fmt::mark(true), cfg.client.mode);
    } else {
      std::println("{} client mode '{}' - {}", fmt::mark(false),
                   cfg.client.mode,
                   fmt::paint(fmt::Tone::Bad,
                              make_error_code(Error::UnsupportedMode)
                                  .message()));
    }
    for (auto [index, vr] : results | std::views::enumerate) {
      const auto name =
          vr.label.empty() ? std::format("task-{}", index) : vr.label;
      if (vr.valid) {
        std::println("{} {} ({} steps) - {}", fmt::mark(true), name,
                     vr.steps, fmt::paint(fmt::Tone::Good, "Valid"));
      } else {
        std::println("{} {} - {}", fmt::mark(false), name,
                     fmt::paint(fmt::Tone::Bad, vr.error));
      }
    }
    std::println("\nSummary: {} valid, {} invalid out of {} tasks",
                 fmt::paint(fmt::Tone::Good, valid_count),
                 fmt::paint(invalid_count > 0 ? fmt::Tone::Bad
                                              : fmt::Tone::Plain,
                            invalid_count),
                 results.size());
  }

  return (invalid_count > 0 || !mode_ok) ? kExitConfigError : kExitOk;
}

} // namespace macropipe::cli
