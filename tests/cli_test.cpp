#include "macropipe/cli/commands.hpp"

#include "test_utils.hpp"

#include <format>
#include <fstream>
#include <string>

#include "gtest/gtest.h"

using namespace macropipe;
using namespace macropipe::cli;

namespace {

auto write_batch(const test::TempDir &tmp, const std::string &body)
    -> std::string {
  const auto path = tmp.file("batch.toml");
  std::ofstream out(path);
  out << body;
  return path;
}

} // namespace

TEST(CLITest, RunOptionsDefaults) {
  RunOptions opts;
  EXPECT_TRUE(opts.batch_file.empty());
  EXPECT_FALSE(opts.outcome_file.has_value());
  EXPECT_FALSE(opts.log_level.has_value());
  EXPECT_FALSE(opts.workers.has_value());
  EXPECT_FALSE(opts.threads.has_value());
  EXPECT_FALSE(opts.processes);
}

TEST(CLITest, ValidateOptionsDefaults) {
  ValidateOptions opts;
  EXPECT_TRUE(opts.batch_file.empty());
  EXPECT_FALSE(opts.json);
}

TEST(CLITest, RunAllTasksComplete) {
  test::TempDir tmp;
  const auto report = tmp.file("report.txt");
  const auto batch = write_batch(
      tmp, std::format(R"(
[client]
n_workers = 2

[log]
level = "off"

[[tasks]]
label = "a"
steps = [["open", "{0}/a.txt"], ["write", "hello world"], ["close"]]

[[tasks]]
label = "b"
steps = [["open", "{0}/b.txt"], ["write", "hello world"], ["close"]]
)",
                       tmp.path().string()));

  RunOptions opts{.batch_file = batch, .outcome_file = report};
  EXPECT_EQ(cmd_run(opts), kExitOk);
  EXPECT_EQ(test::slurp(tmp.path() / "a.txt"), "hello world\n");
  EXPECT_EQ(test::slurp(tmp.path() / "b.txt"), "hello world\n");
  EXPECT_EQ(test::slurp(report),
            std::format("{:<30} Completed\n{:<30} Completed\n", "a", "b"));
}

TEST(CLITest, RunReportsTaskFailure) {
  test::TempDir tmp;
  const auto report = tmp.file("report.txt");
  const auto batch = write_batch(
      tmp, std::format(R"(
[log]
level = "off"

[[tasks]]
label = "dir"
steps = [["open", "{0}"], ["close"]]
)",
                       tmp.path().string()));

  RunOptions opts{.batch_file = batch,
                  .outcome_file = report,
                  .workers = 1u,
                  .processes = true};
  EXPECT_EQ(cmd_run(opts), kExitTaskFailed);
  EXPECT_TRUE(test::slurp(report).starts_with("dir"));
  EXPECT_EQ(test::slurp(report).find("Completed"), std::string::npos);
}

TEST(CLITest, RunRejectsUnsupportedMode) {
  test::TempDir tmp;
  const auto batch = write_batch(tmp, R"(
[client]
mode = "yarn"

[log]
level = "off"
)");
  RunOptions opts{.batch_file = batch};
  EXPECT_EQ(cmd_run(opts), kExitConfigError);
}

TEST(CLITest, RunRejectsUnknownOperation) {
  test::TempDir tmp;
  const auto batch = write_batch(tmp, R"(
[log]
level = "off"

[[tasks]]
label = "x"
steps = [["explode"]]
)");
  RunOptions opts{.batch_file = batch};
  EXPECT_EQ(cmd_run(opts), kExitConfigError);
}

TEST(CLITest, RunMissingBatchFile) {
  RunOptions opts{.batch_file = "/nonexistent/batch.toml"};
  EXPECT_EQ(cmd_run(opts), kExitConfigError);
}

TEST(CLITest, ValidateAcceptsGoodBatch) {
  test::TempDir tmp;
  const auto batch = write_batch(tmp, R"(
[[tasks]]
label = "ok"
steps = [["open", "x.txt"], ["write", "y"], ["close"]]
)");
  EXPECT_EQ(cmd_validate(ValidateOptions{.batch_file = batch, .json = true}),
            kExitOk);
}

TEST(CLITest, ValidateFlagsBadStep) {
  test::TempDir tmp;
  const auto batch = write_batch(tmp, R"(
[[tasks]]
label = "bad"
steps = [["open", "x.txt"], ["rename", "y"]]
)");
  EXPECT_EQ(cmd_validate(ValidateOptions{.batch_file = batch}),
            kExitConfigError);
}

TEST(CLITest, ValidateFlagsUnsupportedMode) {
  test::TempDir tmp;
  const auto batch = write_batch(tmp, "[client]\nmode = \"cloud\"\n");
  EXPECT_EQ(cmd_validate(ValidateOptions{.batch_file = batch}),
            kExitConfigError);
}

TEST(CLITest, ValidateRejectsOtherSpellingsOfLocal) {
  test::TempDir tmp;
  const auto batch = write_batch(tmp, "[client]\nmode = \"LOCAL\"\n");
  EXPECT_EQ(cmd_validate(ValidateOptions{.batch_file = batch}),
            kExitConfigError);
}
