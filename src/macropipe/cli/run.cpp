#include "macropipe/cli/commands.hpp"
#include "macropipe/config/batch_config.hpp"
#include "macropipe/pipeline/macro_pipeline.hpp"
#include "macropipe/util/log.hpp"

#include <filesystem>
#include <optional>
#include <print>
#include <system_error>

namespace macropipe::cli {

namespace {

// Logger lifetime for one command invocation.
class LogSession {
public:
  LogSession(const LogConfig &cfg, const std::optional<std::string> &level) {
    log::set_level(level.value_or(cfg.level));
    if (!cfg.file.empty() && !log::set_output_file(cfg.file)) {
      std::println(stderr, "Warning: cannot open log file {}, using stderr",
                   cfg.file);
      log::set_output_stderr();
    }
    log::start();
  }
  ~LogSession() { log::stop(); }

  LogSession(const LogSession &) = delete;
  LogSession &operator=(const LogSession &) = delete;
};

auto apply_overrides(BatchConfig &cfg, const RunOptions &opts) -> void {
  if (opts.outcome_file) {
    cfg.report.outcome_file = *opts.outcome_file;
  }
  if (opts.workers) {
    cfg.client.cluster.n_workers = *opts.workers;
  }
  if (opts.threads) {
    cfg.client.cluster.threads_per_worker = *opts.threads;
  }
  if (opts.processes) {
    cfg.client.cluster.processes = true;
  }
}

[[nodiscard]] auto exit_code_for(std::error_code ec) -> int {
  switch (classify(ec)) {
  case ErrorClass::None:
    return kExitOk;
  case ErrorClass::Configuration:
  case ErrorClass::Contract:
    return kExitConfigError;
  case ErrorClass::Dispatch:
  case ErrorClass::Execution:
    break;
  }
  return kExitTaskFailed;
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  log::set_output_stderr();

  std::string diagnostic;
  auto cfg_res = BatchLoader::load_from_file(opts.batch_file, &diagnostic);
  if (!cfg_res) {
    std::println(stderr, "Error: {}",
                 diagnostic.empty() ? cfg_res.error().message() : diagnostic);
    return exit_code_for(cfg_res.error());
  }
  auto cfg = std::move(*cfg_res);
  apply_overrides(cfg, opts);

  if (cfg.client.cluster.threads_per_worker == 0) {
    std::println(stderr, "Error: --threads must be at least 1");
    return kExitConfigError;
  }

  LogSession session{cfg.log, opts.log_level};

  auto tasks = build_tasks(cfg, &diagnostic);
  if (!tasks) {
    std::println(stderr, "Error: {}", diagnostic);
    return exit_code_for(tasks.error());
  }

  MacroPipeline pipeline;
  if (auto r = pipeline.set_tasks(std::move(*tasks)); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return exit_code_for(r.error());
  }
  if (auto r = pipeline.setup_client(cfg.client.mode, cfg.client.cluster);
      !r) {
    std::println(stderr, "Error: client mode '{}': {}", cfg.client.mode,
                 r.error().message());
    return exit_code_for(r.error());
  }

  if (auto r = pipeline.run(); !r) {
    std::println(stderr, "Error: dispatch failed: {}", r.error().message());
    pipeline.client()->close();
    return exit_code_for(r.error());
  }

  std::optional<std::filesystem::path> outcome_file;
  if (!cfg.report.outcome_file.empty()) {
    outcome_file = cfg.report.outcome_file;
  }
  auto printed = pipeline.print_outcome(outcome_file);
  pipeline.client()->close();
  if (!printed) {
    std::println(stderr, "Error: cannot write outcome report: {}",
                 printed.error().message());
    return kExitTaskFailed;
  }

  return pipeline.failed_pipelines().empty() ? kExitOk : kExitTaskFailed;
}

} // namespace macropipe::cli
