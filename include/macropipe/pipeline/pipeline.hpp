#pragma once

#include "macropipe/core/error.hpp"
#include "macropipe/pipeline/task.hpp"

#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace macropipe {

/// One entry of a pipeline's input: an operation name and its arguments.
struct Step {
  std::string name;
  std::vector<std::string> args;

  auto operator==(const Step &) const -> bool = default;
};

/// A task made of named operations executed in input order. The first
/// failing operation ends the run; operations already done are not undone.
class Pipeline : public ITask {
public:
  using Operation =
      std::move_only_function<Result<void>(std::span<const std::string>)>;

  Pipeline() = default;
  ~Pipeline() override = default;

  // Registered operations capture `this`.
  Pipeline(const Pipeline &) = delete;
  Pipeline &operator=(const Pipeline &) = delete;
  Pipeline(Pipeline &&) = delete;
  Pipeline &operator=(Pipeline &&) = delete;

  [[nodiscard]] auto label() const -> std::string_view override {
    return label_;
  }
  auto set_label(std::string label) -> void override {
    label_ = std::move(label);
  }

  /// Replace the step list. Fails with UnknownOperation, leaving the current
  /// input untouched, when a step names an operation this pipeline lacks.
  [[nodiscard]] auto set_input(std::vector<Step> steps) -> Result<void>;
  [[nodiscard]] auto input() const noexcept -> const std::vector<Step> & {
    return steps_;
  }

  [[nodiscard]] auto has_operation(std::string_view name) const -> bool;
  [[nodiscard]] auto operation_names() const -> std::vector<std::string>;

  [[nodiscard]] auto run() -> TaskOutcome override;

protected:
  auto register_operation(std::string name, Operation op) -> void;

private:
  std::string label_;
  std::vector<Step> steps_;
  std::map<std::string, Operation, std::less<>> operations_;
};

} // namespace macropipe
