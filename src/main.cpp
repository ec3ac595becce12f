#include "macropipe/cli/commands.hpp"
#include "macropipe/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_batch() -> std::string {
  if (const char *env = std::getenv("MACROPIPE_BATCH"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  macropipe::log::set_output_stderr();
  macropipe::log::set_level(macropipe::log::Level::Warn);

  CLI::App app{"macropipe", "Run independent pipelines concurrently"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  macropipe run -b batch.toml\n"
             "  macropipe run -b batch.toml --processes --workers 4\n"
             "  macropipe validate -b batch.toml --json\n"
             "\nTip: Set MACROPIPE_BATCH=batch.toml to skip -b on every "
             "command.");

  const std::string env_batch = default_batch();

  macropipe::cli::RunOptions run_opts;
  auto *run = app.add_subcommand("run", "Run every task in a batch file");
  run_opts.batch_file = env_batch;
  auto *run_batch = run->add_option("-b,--batch", run_opts.batch_file,
                                    "Batch file (TOML)")
                        ->check(CLI::ExistingFile);
  if (env_batch.empty())
    run_batch->required();
  run->add_option("-o,--outcome-file", run_opts.outcome_file,
                  "Write the outcome report here instead of stdout");
  run->add_option("--log-level", run_opts.log_level,
                  "Log level override: trace|debug|info|warn|error|off");
  run->add_option("--workers", run_opts.workers,
                  "Number of workers (0: one per CPU core)");
  run->add_option("--threads", run_opts.threads, "Threads per worker")
      ->check(CLI::PositiveNumber);
  run->add_flag("--processes", run_opts.processes,
                "Run every task in its own child process");
  run->callback(
      [&run_opts]() { std::exit(macropipe::cli::cmd_run(run_opts)); });

  macropipe::cli::ValidateOptions validate_opts;
  auto *validate = app.add_subcommand(
      "validate", "Check a batch file without running anything");
  validate_opts.batch_file = env_batch;
  auto *validate_batch =
      validate
          ->add_option("-b,--batch", validate_opts.batch_file,
                       "Batch file (TOML)")
          ->check(CLI::ExistingFile);
  if (env_batch.empty())
    validate_batch->required();
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(macropipe::cli::cmd_validate(validate_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
