#include "macropipe/pipeline/file_io_pipeline.hpp"
#include "macropipe/pipeline/macro_pipeline.hpp"

#include "test_utils.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <memory>
#include <ranges>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

#include "gtest/gtest.h"

using namespace macropipe;
using test::ScriptedTask;

namespace {

auto make_writer(const std::string &path, std::string text)
    -> std::shared_ptr<FileIoPipeline> {
  auto p = std::make_shared<FileIoPipeline>();
  auto r = p->set_input({Step{.name = "open", .args = {path}},
                         Step{.name = "write", .args = {std::move(text)}},
                         Step{.name = "close", .args = {}}});
  EXPECT_TRUE(r.has_value());
  return p;
}

auto split_lines(const std::string &text) -> std::vector<std::string> {
  std::vector<std::string> lines;
  std::istringstream in(text);
  for (std::string line; std::getline(in, line);) {
    lines.push_back(line);
  }
  return lines;
}

auto last_token(const std::string &line) -> std::string {
  auto pos = line.find_last_of(' ');
  return pos == std::string::npos ? line : line.substr(pos + 1);
}

} // namespace

// Element types are checked by the compiler, not at run time.
static_assert(!std::is_invocable_v<decltype(&MacroPipeline::add_task),
                                   MacroPipeline &, int>);
static_assert(!std::is_invocable_v<decltype(&MacroPipeline::add_task),
                                   MacroPipeline &, std::string>);
static_assert(!std::is_invocable_v<decltype(&MacroPipeline::add_task),
                                   MacroPipeline &, std::vector<int>>);
static_assert(!std::is_invocable_v<decltype(&MacroPipeline::set_tasks),
                                   MacroPipeline &, int>);
static_assert(!std::is_invocable_v<decltype(&MacroPipeline::set_tasks),
                                   MacroPipeline &, std::vector<std::string>>);

TEST(MacroPipelineTest, InitialState) {
  MacroPipeline mp;
  EXPECT_EQ(mp.state(), PipelineState::Unconfigured);
  EXPECT_TRUE(mp.tasks().empty());
  EXPECT_TRUE(mp.errors().empty());
  EXPECT_TRUE(mp.outcomes().empty());
  EXPECT_TRUE(mp.failed_pipelines().empty());
  EXPECT_EQ(mp.client(), nullptr);
}

TEST(MacroPipelineTest, TasksKeepOrderAndIdentity) {
  std::vector<MacroPipeline::TaskPtr> tasks;
  for (int i = 0; i < 5; ++i) {
    tasks.push_back(std::make_shared<ScriptedTask>(std::format("t{}", i)));
  }

  MacroPipeline mp;
  ASSERT_TRUE(mp.set_tasks(tasks).has_value());
  ASSERT_EQ(mp.tasks().size(), tasks.size());
  for (auto [mine, theirs] : std::views::zip(mp.tasks(), tasks)) {
    EXPECT_EQ(mine.get(), theirs.get());
  }
}

TEST(MacroPipelineTest, SetTasksRejectsNullAndKeepsPreviousList) {
  auto keep = std::make_shared<ScriptedTask>("keep");
  MacroPipeline mp;
  ASSERT_TRUE(mp.set_tasks({keep}).has_value());

  auto r = mp.set_tasks({std::make_shared<ScriptedTask>("a"), nullptr});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
  ASSERT_EQ(mp.tasks().size(), 1U);
  EXPECT_EQ(mp.tasks().front().get(), keep.get());
}

TEST(MacroPipelineTest, AddTaskAppends) {
  auto a = std::make_shared<ScriptedTask>("a");
  auto b = std::make_shared<ScriptedTask>("b");
  MacroPipeline mp;
  ASSERT_TRUE(mp.add_task(a).has_value());
  ASSERT_TRUE(mp.add_task(b).has_value());
  ASSERT_EQ(mp.tasks().size(), 2U);
  EXPECT_EQ(mp.tasks()[0].get(), a.get());
  EXPECT_EQ(mp.tasks()[1].get(), b.get());
}

TEST(MacroPipelineTest, SameTaskCannotBeListedTwice) {
  auto shared = std::make_shared<ScriptedTask>("shared");
  MacroPipeline mp;
  auto r = mp.set_tasks({shared, std::make_shared<ScriptedTask>("b"), shared});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
  EXPECT_TRUE(mp.tasks().empty());

  ASSERT_TRUE(mp.add_task(shared).has_value());
  auto again = mp.add_task(shared);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), make_error_code(Error::InvalidArgument));
  ASSERT_EQ(mp.tasks().size(), 1U);
  EXPECT_EQ(shared.use_count(), 2);
}

TEST(MacroPipelineTest, AddTaskRejectsNull) {
  MacroPipeline mp;
  auto r = mp.add_task(nullptr);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
  EXPECT_TRUE(mp.tasks().empty());
}

TEST(MacroPipelineTest, SetLabelsPositionally) {
  MacroPipeline mp;
  ASSERT_TRUE(mp.add_task(std::make_shared<ScriptedTask>()).has_value());
  ASSERT_TRUE(mp.add_task(std::make_shared<ScriptedTask>()).has_value());

  const std::vector<std::string> labels{"a", "b"};
  ASSERT_TRUE(mp.set_labels(labels).has_value());
  EXPECT_EQ(mp.tasks()[0]->label(), "a");
  EXPECT_EQ(mp.tasks()[1]->label(), "b");
}

TEST(MacroPipelineTest, SetLabelsAllowsDuplicates) {
  MacroPipeline mp;
  ASSERT_TRUE(mp.add_task(std::make_shared<ScriptedTask>()).has_value());
  ASSERT_TRUE(mp.add_task(std::make_shared<ScriptedTask>()).has_value());

  const std::vector<std::string> labels{"same", "same"};
  ASSERT_TRUE(mp.set_labels(labels).has_value());
  EXPECT_EQ(mp.tasks()[0]->label(), mp.tasks()[1]->label());
}

TEST(MacroPipelineTest, SetLabelsSizeMismatchChangesNothing) {
  MacroPipeline mp;
  ASSERT_TRUE(mp.add_task(std::make_shared<ScriptedTask>("x")).has_value());
  ASSERT_TRUE(mp.add_task(std::make_shared<ScriptedTask>("y")).has_value());

  const std::vector<std::string> labels{"only-one"};
  auto r = mp.set_labels(labels);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
  EXPECT_EQ(mp.tasks()[0]->label(), "x");
  EXPECT_EQ(mp.tasks()[1]->label(), "y");
}

TEST(MacroPipelineTest, SetupClientWithRunningCluster) {
  Cluster cluster(ClusterOptions{.n_workers = 2});
  ASSERT_TRUE(cluster.start().has_value());

  MacroPipeline mp;
  ASSERT_TRUE(mp.setup_client(cluster).has_value());
  ASSERT_NE(mp.client(), nullptr);
  EXPECT_EQ(to_string_view(mp.client()->status()), "running");
  EXPECT_EQ(mp.state(), PipelineState::ClientConfigured);
}

TEST(MacroPipelineTest, SetupClientUnknownMode) {
  for (auto mode : {"unknownMode", "LOCAL", "Local", "lo-cal"}) {
    MacroPipeline mp;
    auto r = mp.setup_client(mode);
    ASSERT_FALSE(r.has_value()) << mode;
    EXPECT_EQ(r.error(), make_error_code(Error::UnsupportedMode));
    EXPECT_EQ(mp.client(), nullptr);
    EXPECT_EQ(mp.state(), PipelineState::Unconfigured);
  }
}

TEST(MacroPipelineTest, SetupClientLocal) {
  MacroPipeline mp;
  ASSERT_TRUE(mp.setup_client("local", ClusterOptions{.n_workers = 2,
                                                       .threads_per_worker = 1})
                  .has_value());
  ASSERT_NE(mp.client(), nullptr);
  EXPECT_TRUE(mp.client()->owns_cluster());
  EXPECT_EQ(mp.client()->status(), ClusterStatus::Running);
  mp.client()->close();
  EXPECT_EQ(mp.client()->status(), ClusterStatus::Closed);
}

TEST(MacroPipelineTest, RunWithoutClientFails) {
  MacroPipeline mp;
  ASSERT_TRUE(mp.add_task(std::make_shared<ScriptedTask>("a")).has_value());
  auto r = mp.run();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ClientNotConfigured));
  EXPECT_TRUE(mp.errors().empty());
  EXPECT_EQ(mp.state(), PipelineState::Unconfigured);
}

TEST(MacroPipelineTest, RunOnClosedClusterLeavesNoOutcomes) {
  Cluster cluster(ClusterOptions{.n_workers = 1});
  ASSERT_TRUE(cluster.start().has_value());

  MacroPipeline mp;
  ASSERT_TRUE(mp.add_task(std::make_shared<ScriptedTask>("a")).has_value());
  ASSERT_TRUE(mp.setup_client(cluster).has_value());
  cluster.close();

  auto r = mp.run();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ClusterNotRunning));
  EXPECT_TRUE(mp.outcomes().empty());
  EXPECT_EQ(mp.state(), PipelineState::ClientConfigured);
}

TEST(MacroPipelineTest, StateMachine) {
  Cluster cluster(ClusterOptions{.n_workers = 1});
  ASSERT_TRUE(cluster.start().has_value());

  MacroPipeline mp;
  EXPECT_EQ(to_string_view(mp.state()), "unconfigured");
  ASSERT_TRUE(mp.add_task(std::make_shared<ScriptedTask>("a")).has_value());
  ASSERT_TRUE(mp.setup_client(cluster).has_value());
  EXPECT_EQ(mp.state(), PipelineState::ClientConfigured);
  ASSERT_TRUE(mp.run().has_value());
  EXPECT_EQ(mp.state(), PipelineState::Completed);
  EXPECT_EQ(to_string_view(mp.state()), "completed");

  // A completed pipeline may run again.
  ASSERT_TRUE(mp.run().has_value());
  EXPECT_EQ(mp.state(), PipelineState::Completed);
}

TEST(MacroPipelineTest, TaskFailuresDoNotFailRun) {
  Cluster cluster(ClusterOptions{.n_workers = 3});
  ASSERT_TRUE(cluster.start().has_value());

  auto good = std::make_shared<ScriptedTask>("good");
  auto bad = std::make_shared<ScriptedTask>("bad", std::chrono::milliseconds(0),
                                            ScriptedTask::Mode::Fail);
  auto thrower = std::make_shared<ScriptedTask>(
      "thrower", std::chrono::milliseconds(0), ScriptedTask::Mode::Throw);

  MacroPipeline mp;
  ASSERT_TRUE(mp.set_tasks({good, bad, thrower}).has_value());
  ASSERT_TRUE(mp.setup_client(cluster).has_value());
  ASSERT_TRUE(mp.run().has_value());

  ASSERT_EQ(mp.errors().size(), 3U);
  EXPECT_EQ(mp.errors()[0], std::nullopt);
  ASSERT_TRUE(mp.errors()[1].has_value());
  EXPECT_EQ(mp.errors()[1]->kind, std::errc::io_error);
  ASSERT_TRUE(mp.errors()[2].has_value());
  EXPECT_EQ(mp.errors()[2]->kind, make_error_code(Error::TaskException));
  EXPECT_EQ(mp.errors()[2]->detail, "scripted throw");

  auto failed = mp.failed_pipelines();
  ASSERT_EQ(failed.size(), 2U);
  EXPECT_EQ(failed[0].get(), bad.get());
  EXPECT_EQ(failed[1].get(), thrower.get());

  EXPECT_EQ(good->runs(), 1);
  EXPECT_EQ(bad->runs(), 1);
}

TEST(MacroPipelineTest, RerunReplacesOutcomes) {
  Cluster cluster(ClusterOptions{.n_workers = 2});
  ASSERT_TRUE(cluster.start().has_value());

  MacroPipeline mp;
  ASSERT_TRUE(mp.add_task(std::make_shared<ScriptedTask>(
                              "bad", std::chrono::milliseconds(0),
                              ScriptedTask::Mode::Fail))
                  .has_value());
  ASSERT_TRUE(mp.setup_client(cluster).has_value());
  ASSERT_TRUE(mp.run().has_value());
  EXPECT_EQ(mp.failed_pipelines().size(), 1U);

  auto good = std::make_shared<ScriptedTask>("good");
  ASSERT_TRUE(mp.set_tasks({good}).has_value());
  ASSERT_TRUE(mp.run().has_value());
  ASSERT_EQ(mp.errors().size(), 1U);
  EXPECT_EQ(mp.errors()[0], std::nullopt);
  EXPECT_TRUE(mp.failed_pipelines().empty());
}

TEST(MacroPipelineTest, OutcomesFollowTaskOrderNotCompletionOrder) {
  Cluster cluster(ClusterOptions{.n_workers = 6});
  ASSERT_TRUE(cluster.start().has_value());

  constexpr int kTasks = 6;
  MacroPipeline mp;
  for (int i = 0; i < kTasks; ++i) {
    // Task 0 is the slowest; odd tasks fail.
    auto mode = (i % 2 == 1) ? ScriptedTask::Mode::Fail
                             : ScriptedTask::Mode::Succeed;
    ASSERT_TRUE(mp.add_task(std::make_shared<ScriptedTask>(
                                std::format("t{}", i),
                                std::chrono::milliseconds((kTasks - i) * 20),
                                mode))
                    .has_value());
  }
  ASSERT_TRUE(mp.setup_client(cluster).has_value());
  ASSERT_TRUE(mp.run().has_value());

  ASSERT_EQ(mp.outcomes().size(), static_cast<std::size_t>(kTasks));
  for (int i = 0; i < kTasks; ++i) {
    EXPECT_EQ(mp.outcomes()[i].label, std::format("t{}", i));
    EXPECT_EQ(mp.errors()[i].has_value(), i % 2 == 1);
  }
}

TEST(MacroPipelineTest, ReportLineFormat) {
  Cluster cluster(ClusterOptions{.n_workers = 2});
  ASSERT_TRUE(cluster.start().has_value());

  MacroPipeline mp;
  ASSERT_TRUE(mp.add_task(std::make_shared<ScriptedTask>("named")).has_value());
  ASSERT_TRUE(mp.add_task(std::make_shared<ScriptedTask>(
                              "", std::chrono::milliseconds(0),
                              ScriptedTask::Mode::Fail))
                  .has_value());
  ASSERT_TRUE(mp.setup_client(cluster).has_value());
  ASSERT_TRUE(mp.run().has_value());

  auto lines = split_lines(mp.format_outcome());
  ASSERT_EQ(lines.size(), 2U);
  EXPECT_EQ(lines[0], std::format("{:<30} Completed", "named"));
  EXPECT_EQ(lines[1], std::format("{:<30} Failed(generic:{})", "task-1",
                                  static_cast<int>(std::errc::io_error)));
}

TEST(MacroPipelineTest, ReportEscapesControlCharactersInLabels) {
  Cluster cluster(ClusterOptions{.n_workers = 1});
  ASSERT_TRUE(cluster.start().has_value());

  MacroPipeline mp;
  ASSERT_TRUE(
      mp.add_task(std::make_shared<ScriptedTask>("two\nlines")).has_value());
  ASSERT_TRUE(
      mp.add_task(std::make_shared<ScriptedTask>("tab\there\x01")).has_value());
  ASSERT_TRUE(mp.setup_client(cluster).has_value());
  ASSERT_TRUE(mp.run().has_value());

  auto lines = split_lines(mp.format_outcome());
  ASSERT_EQ(lines.size(), 2U);
  EXPECT_EQ(lines[0], std::format("{:<30} Completed", "two\\nlines"));
  EXPECT_EQ(lines[1], std::format("{:<30} Completed", "tab\\there\\x01"));
}

TEST(MacroPipelineTest, StatusToken) {
  EXPECT_EQ(status_token(TaskOutcome::completed("x")), kCompletedToken);
  EXPECT_EQ(status_token(TaskOutcome::failed(
                "x", make_error_code(Error::WorkerDied), "killed")),
            std::format("Failed(macropipe:{})",
                        static_cast<int>(Error::WorkerDied)));
}

TEST(MacroPipelineTest, PrintOutcomeToUnwritablePath) {
  test::TempDir tmp;
  MacroPipeline mp;
  auto r = mp.print_outcome(tmp.path() / "missing" / "report.txt");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::FileOpenFailed));
}

TEST(MacroPipelineTest, PrintOutcomeBeforeRunIsEmpty) {
  test::TempDir tmp;
  const auto report = tmp.path() / "report.txt";
  MacroPipeline mp;
  ASSERT_TRUE(mp.add_task(std::make_shared<ScriptedTask>("a")).has_value());
  ASSERT_TRUE(mp.print_outcome(report).has_value());
  EXPECT_TRUE(test::slurp(report).empty());
}

class MacroPipelineScenarioTest : public ::testing::TestWithParam<bool> {
protected:
  [[nodiscard]] auto options() const -> ClusterOptions {
    return ClusterOptions{.n_workers = 2, .processes = GetParam()};
  }
};

TEST_P(MacroPipelineScenarioTest, AllSucceed) {
  test::TempDir tmp;
  const auto file_a = tmp.file("a.txt");
  const auto file_b = tmp.file("b.txt");
  const auto report = tmp.path() / "report.txt";

  MacroPipeline mp;
  ASSERT_TRUE(mp.add_task(make_writer(file_a, "same text")).has_value());
  ASSERT_TRUE(mp.add_task(make_writer(file_b, "same text")).has_value());
  const std::vector<std::string> labels{"writer_a", "writer_b"};
  ASSERT_TRUE(mp.set_labels(labels).has_value());
  ASSERT_TRUE(mp.setup_client("local", options()).has_value());
  ASSERT_TRUE(mp.run().has_value());

  ASSERT_TRUE(std::filesystem::exists(file_a));
  ASSERT_TRUE(std::filesystem::exists(file_b));
  EXPECT_EQ(test::slurp(file_a), "same text\n");
  EXPECT_EQ(test::slurp(file_a), test::slurp(file_b));
  EXPECT_TRUE(mp.failed_pipelines().empty());

  ASSERT_TRUE(mp.print_outcome(report).has_value());
  auto lines = split_lines(test::slurp(report));
  ASSERT_EQ(lines.size(), 2U);
  EXPECT_EQ(last_token(lines[0]), "Completed");
  EXPECT_EQ(last_token(lines[1]), "Completed");
  EXPECT_TRUE(lines[0].starts_with("writer_a"));
  EXPECT_TRUE(lines[1].starts_with("writer_b"));

  mp.client()->close();
}

TEST_P(MacroPipelineScenarioTest, OneFails) {
  test::TempDir tmp;
  const auto file_a = tmp.file("a.txt");
  const auto report = tmp.path() / "report.txt";

  auto task_a = make_writer(file_a, "payload");
  auto task_b = make_writer(tmp.path().string(), "payload");

  MacroPipeline mp;
  ASSERT_TRUE(mp.set_tasks({task_a, task_b}).has_value());
  ASSERT_TRUE(mp.setup_client("local", options()).has_value());
  ASSERT_TRUE(mp.run().has_value());

  ASSERT_EQ(mp.errors().size(), 2U);
  EXPECT_EQ(mp.errors()[0], std::nullopt);
  ASSERT_TRUE(mp.errors()[1].has_value());
  EXPECT_EQ(mp.errors()[1]->kind, std::errc::is_a_directory);
  EXPECT_FALSE(mp.errors()[1]->detail.empty());

  auto failed = mp.failed_pipelines();
  ASSERT_EQ(failed.size(), 1U);
  EXPECT_EQ(failed[0].get(), task_b.get());

  EXPECT_EQ(test::slurp(file_a), "payload\n");

  ASSERT_TRUE(mp.print_outcome(report).has_value());
  auto lines = split_lines(test::slurp(report));
  ASSERT_EQ(lines.size(), 2U);
  EXPECT_EQ(last_token(lines[0]), "Completed");
  EXPECT_NE(last_token(lines[1]), "Completed");

  mp.client()->close();
}

INSTANTIATE_TEST_SUITE_P(Modes, MacroPipelineScenarioTest, ::testing::Bool(),
                         [](const ::testing::TestParamInfo<bool> &info) {
                           return info.param ? "Processes" : "Threads";
                         });
