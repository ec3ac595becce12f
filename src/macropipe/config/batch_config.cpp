#include "macropipe/config/batch_config.hpp"
#include "macropipe/config/toml_util.hpp"

#include "macropipe/pipeline/file_io_pipeline.hpp"
#include "macropipe/util/log.hpp"

#include <glaze/toml.hpp>

#include <filesystem>
#include <format>
#include <iterator>
#include <ranges>
#include <string>
#include <string_view>

namespace macropipe {
namespace detail {

struct ClientToml {
  std::string mode{"local"};
  int n_workers{0};
  int threads_per_worker{1};
  bool processes{false};
  std::string local_directory;
};

struct ReportToml {
  std::string outcome_file;
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct TaskToml {
  std::string label;
  std::vector<std::vector<std::string>> steps;
};

struct BatchToml {
  ClientToml client{};
  ReportToml report{};
  LogToml log{};
  std::vector<TaskToml> tasks;
};

} // namespace detail
} // namespace macropipe

namespace glz {
template <> struct meta<macropipe::detail::ClientToml> {
  using T = macropipe::detail::ClientToml;
  static constexpr auto value =
      object("mode", &T::mode, "n_workers", &T::n_workers,
             "threads_per_worker", &T::threads_per_worker, "processes",
             &T::processes, "local_directory", &T::local_directory);
};

template <> struct meta<macropipe::detail::ReportToml> {
  using T = macropipe::detail::ReportToml;
  static constexpr auto value = object("outcome_file", &T::outcome_file);
};

template <> struct meta<macropipe::detail::LogToml> {
  using T = macropipe::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<macropipe::detail::TaskToml> {
  using T = macropipe::detail::TaskToml;
  static constexpr auto value = object("label", &T::label, "steps", &T::steps);
};

template <> struct meta<macropipe::detail::BatchToml> {
  using T = macropipe::detail::BatchToml;
  static constexpr auto value = object("client", &T::client, "report",
                                       &T::report, "log", &T::log, "tasks",
                                       &T::tasks);
};
} // namespace glz

namespace macropipe {
namespace {

auto set_diagnostic(std::string *diagnostic, std::string message) -> void {
  log::error("batch: {}", message);
  if (diagnostic) {
    *diagnostic = std::move(message);
  }
}

[[nodiscard]] auto convert_toml(std::string_view toml_text,
                                std::string_view source,
                                std::string *diagnostic)
    -> Result<BatchConfig> {
  std::string parse_error;
  auto raw_result = toml_util::parse_toml<detail::BatchToml>(
      toml_text, source, &parse_error);
  if (!raw_result) {
    set_diagnostic(diagnostic, std::move(parse_error));
    return fail(raw_result.error());
  }
  auto &raw = *raw_result;

  if (raw.client.n_workers < 0 || raw.client.threads_per_worker < 1) {
    set_diagnostic(diagnostic,
                   std::format("invalid client shape: n_workers={} "
                               "threads_per_worker={}",
                               raw.client.n_workers,
                               raw.client.threads_per_worker));
    return fail(Error::InvalidArgument);
  }

  BatchConfig cfg{};
  cfg.client.mode = std::move(raw.client.mode);
  cfg.client.cluster.n_workers = static_cast<unsigned>(raw.client.n_workers);
  cfg.client.cluster.threads_per_worker =
      static_cast<unsigned>(raw.client.threads_per_worker);
  cfg.client.cluster.processes = raw.client.processes;
  cfg.client.cluster.local_directory = std::move(raw.client.local_directory);
  cfg.report.outcome_file = std::move(raw.report.outcome_file);
  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  cfg.tasks.reserve(raw.tasks.size());
  for (auto [index, task] : raw.tasks | std::views::enumerate) {
    TaskDefinition def{.label = std::move(task.label), .steps = {}};
    def.steps.reserve(task.steps.size());
    for (auto &step : task.steps) {
      if (step.empty() || step.front().empty()) {
        set_diagnostic(diagnostic,
                       std::format("task #{} ('{}') has an empty step", index,
                                   def.label));
        return fail(Error::InvalidArgument);
      }
      Step parsed{.name = std::move(step.front()), .args = {}};
      parsed.args.assign(std::make_move_iterator(step.begin() + 1),
                         std::make_move_iterator(step.end()));
      def.steps.push_back(std::move(parsed));
    }
    cfg.tasks.push_back(std::move(def));
  }

  return ok(std::move(cfg));
}

} // namespace

auto BatchLoader::load_from_file(std::string_view path,
                                 std::string *diagnostic)
    -> Result<BatchConfig> {
  auto content = toml_util::read_file(std::filesystem::path{path});
  if (!content) {
    set_diagnostic(diagnostic, std::format("cannot read {}: {}", path,
                                           content.error().message()));
    return fail(content.error());
  }
  return convert_toml(*content, path, diagnostic);
}

auto BatchLoader::load_from_string(std::string_view toml_str,
                                   std::string *diagnostic)
    -> Result<BatchConfig> {
  return convert_toml(toml_str, "<string>", diagnostic);
}

auto build_tasks(const BatchConfig &config, std::string *diagnostic)
    -> Result<std::vector<std::shared_ptr<ITask>>> {
  std::vector<std::shared_ptr<ITask>> tasks;
  tasks.reserve(config.tasks.size());

  for (const auto &def : config.tasks) {
    auto pipeline = std::make_shared<FileIoPipeline>();
    pipeline->set_label(def.label);
    if (auto r = pipeline->set_input(def.steps); !r) {
      set_diagnostic(diagnostic,
                     std::format("task '{}': {}", def.label,
                                 r.error().message()));
      return fail(r.error());
    }
    tasks.push_back(std::move(pipeline));
  }
  return ok(std::move(tasks));
}

} // namespace macropipe
