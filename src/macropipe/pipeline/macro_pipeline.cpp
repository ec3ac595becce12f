#include "macropipe/pipeline/macro_pipeline.hpp"

#include "macropipe/util/log.hpp"

#include <algorithm>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <ranges>
#include <set>

namespace macropipe {

namespace {

struct FileCloser {
  auto operator()(std::FILE *f) const noexcept -> void { std::fclose(f); }
};
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

[[nodiscard]] auto is_null(const MacroPipeline::TaskPtr &task) -> bool {
  return task == nullptr;
}

// Control characters would split a report line; write them as escapes.
[[nodiscard]] auto printable_label(std::string_view label) -> std::string {
  std::string out;
  out.reserve(label.size());
  for (char c : label) {
    const auto uc = static_cast<unsigned char>(c);
    switch (c) {
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (uc < 0x20 || uc == 0x7f) {
        std::format_to(std::back_inserter(out), "\\x{:02x}",
                       static_cast<unsigned>(uc));
      } else {
        out.push_back(c);
      }
    }
  }
  return out;
}

} // namespace

auto status_token(const TaskOutcome &outcome) -> std::string {
  if (outcome.success) {
    return std::string{kCompletedToken};
  }
  return std::format("Failed({}:{})", outcome.error.category().name(),
                     outcome.error.value());
}

auto MacroPipeline::set_tasks(std::vector<TaskPtr> tasks) -> Result<void> {
  if (auto it = std::ranges::find_if(tasks, is_null); it != tasks.end()) {
    log::error("macro pipeline: task #{} is null",
               std::distance(tasks.begin(), it));
    return fail(Error::InvalidArgument);
  }
  std::set<const ITask *> seen;
  for (auto [i, task] : tasks | std::views::enumerate) {
    if (!seen.insert(task.get()).second) {
      log::error("macro pipeline: task #{} is already in the list", i);
      return fail(Error::InvalidArgument);
    }
  }
  tasks_ = std::move(tasks);
  return ok();
}

auto MacroPipeline::add_task(TaskPtr task) -> Result<void> {
  if (is_null(task)) {
    log::error("macro pipeline: cannot add a null task");
    return fail(Error::InvalidArgument);
  }
  if (std::ranges::find(tasks_, task) != tasks_.end()) {
    log::error("macro pipeline: task '{}' is already in the list",
               task->label());
    return fail(Error::InvalidArgument);
  }
  tasks_.push_back(std::move(task));
  return ok();
}

auto MacroPipeline::set_labels(std::span<const std::string> labels)
    -> Result<void> {
  if (labels.size() != tasks_.size()) {
    log::error("macro pipeline: {} labels given for {} tasks", labels.size(),
               tasks_.size());
    return fail(Error::InvalidArgument);
  }
  for (auto [task, label] : std::views::zip(tasks_, labels)) {
    task->set_label(label);
  }
  return ok();
}

auto MacroPipeline::setup_client(Cluster &cluster) -> Result<void> {
  auto client = attach(cluster);
  if (!client) {
    return fail(client.error());
  }
  client_.emplace(std::move(*client));
  state_ = PipelineState::ClientConfigured;
  return ok();
}

auto MacroPipeline::setup_client(std::string_view mode, ClusterOptions options)
    -> Result<void> {
  auto client = make_client(mode, std::move(options));
  if (!client) {
    return fail(client.error());
  }
  client_.emplace(std::move(*client));
  state_ = PipelineState::ClientConfigured;
  return ok();
}

auto MacroPipeline::run() -> Result<void> {
  if (!client_) {
    log::error("macro pipeline: run() called before setup_client()");
    return fail(Error::ClientNotConfigured);
  }

  std::vector<WorkUnit> units;
  units.reserve(tasks_.size());
  for (const auto &task : tasks_) {
    units.push_back(WorkUnit{.label = std::string{task->label()},
                             .run = [task] { return task->run(); }});
  }

  log::info("macro pipeline: dispatching {} tasks", tasks_.size());
  state_ = PipelineState::Running;
  auto gathered = client_->submit_and_gather(std::move(units));
  if (!gathered) {
    outcomes_.clear();
    errors_.clear();
    state_ = PipelineState::ClientConfigured;
    return fail(gathered.error());
  }

  outcomes_ = std::move(*gathered);
  errors_ = outcomes_ | std::views::transform(to_error_entry) |
            std::ranges::to<std::vector>();
  state_ = PipelineState::Completed;

  const auto failed = std::ranges::count_if(
      outcomes_, [](const TaskOutcome &o) { return !o.success; });
  if (failed > 0) {
    log::warn("macro pipeline: {} of {} tasks failed", failed,
              outcomes_.size());
  } else {
    log::info("macro pipeline: all {} tasks completed", outcomes_.size());
  }
  return ok();
}

auto MacroPipeline::failed_pipelines() const -> std::vector<TaskPtr> {
  std::vector<TaskPtr> failed;
  for (auto [task, entry] : std::views::zip(tasks_, errors_)) {
    if (entry.has_value()) {
      failed.push_back(task);
    }
  }
  return failed;
}

auto MacroPipeline::format_outcome() const -> std::string {
  std::string out;
  for (auto [i, pair] : std::views::zip(tasks_, outcomes_) |
                            std::views::enumerate) {
    const auto &[task, outcome] = pair;
    auto label = task->label().empty() ? std::format("task-{}", i)
                                       : printable_label(task->label());
    std::format_to(std::back_inserter(out), "{:<30} {}\n", label,
                   status_token(outcome));
  }
  return out;
}

auto MacroPipeline::print_outcome(
    const std::optional<std::filesystem::path> &to_file) const -> Result<void> {
  const auto text = format_outcome();
  if (!to_file) {
    std::fwrite(text.data(), 1, text.size(), stdout);
    std::fflush(stdout);
    return ok();
  }

  FilePtr file{std::fopen(to_file->c_str(), "w")};
  if (!file) {
    log::error("macro pipeline: cannot open outcome file {}: {}",
               to_file->string(), last_system_error().message());
    return fail(Error::FileOpenFailed);
  }
  if (std::fwrite(text.data(), 1, text.size(), file.get()) != text.size() ||
      std::fflush(file.get()) != 0) {
    auto ec = last_system_error();
    log::error("macro pipeline: failed writing {}: {}", to_file->string(),
               ec.message());
    return fail(ec);
  }
  return ok();
}

} // namespace macropipe
