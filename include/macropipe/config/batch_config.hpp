#pragma once

#include "macropipe/core/cluster.hpp"
#include "macropipe/core/error.hpp"
#include "macropipe/pipeline/pipeline.hpp"
#include "macropipe/pipeline/task.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace macropipe {

struct ClientConfig {
  std::string mode{"local"};
  ClusterOptions cluster;

  auto operator==(const ClientConfig &) const -> bool = default;
};

struct ReportConfig {
  std::string outcome_file; // empty = stdout

  auto operator==(const ReportConfig &) const -> bool = default;
};

struct LogConfig {
  std::string level{"info"};
  std::string file;

  auto operator==(const LogConfig &) const -> bool = default;
};

struct TaskDefinition {
  std::string label;
  std::vector<Step> steps;

  auto operator==(const TaskDefinition &) const -> bool = default;
};

/// A batch file: how to build the client and which tasks to run on it.
struct BatchConfig {
  ClientConfig client;
  ReportConfig report;
  LogConfig log;
  std::vector<TaskDefinition> tasks;

  auto operator==(const BatchConfig &) const -> bool = default;
};

class BatchLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<BatchConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<BatchConfig>;
};

/// Instantiate one FileIoPipeline per task definition, in file order.
[[nodiscard]] auto build_tasks(const BatchConfig &config,
                               std::string *diagnostic = nullptr)
    -> Result<std::vector<std::shared_ptr<ITask>>>;

} // namespace macropipe
