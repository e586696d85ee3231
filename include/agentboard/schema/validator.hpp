#pragma once

#include "agentboard/core/error.hpp"
#include "agentboard/schema/schema.hpp"
#include "agentboard/task/task.hpp"
#include "agentboard/util/clock.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace agentboard {

struct ValidationLimits {
  std::size_t max_description_bytes = 65536;
  std::size_t max_dependencies = 256;
};

struct Violation {
  std::string field;
  std::string message;
};

class ValidationReport {
public:
  auto add(std::string_view field, std::string message) -> void {
    violations_.push_back(Violation{std::string{field}, std::move(message)});
  }

  [[nodiscard]] auto ok() const noexcept -> bool {
    return violations_.empty();
  }
  [[nodiscard]] auto violations() const noexcept
      -> const std::vector<Violation>& {
    return violations_;
  }

  // "field: message; field: message"
  [[nodiscard]] auto joined() const -> std::string;

  [[nodiscard]] auto to_failure(std::string task_id = {}) const -> Failure;

private:
  std::vector<Violation> violations_;
};

[[nodiscard]] auto is_valid_task_id(std::string_view id) noexcept -> bool;

using TaskList = std::vector<Task>;

enum class ReferenceMode : std::uint8_t {
  NewTask,  // the id must not exist anywhere yet
  Replace,  // the task replaces its own existing record
};

class SchemaValidator {
public:
  SchemaValidator() = default;
  explicit SchemaValidator(ValidationLimits limits) : limits_(limits) {}

  [[nodiscard]] auto limits() const noexcept -> const ValidationLimits& {
    return limits_;
  }

  [[nodiscard]] auto check_new_task(const nlohmann::json& record) const
      -> ValidationReport;
  [[nodiscard]] auto check_stored_task(const nlohmann::json& record) const
      -> ValidationReport;
  [[nodiscard]] auto check_patch(const nlohmann::json& patch) const
      -> ValidationReport;

  // Accepted input becomes an UNCLAIMED task with its creation entry.
  [[nodiscard]] auto normalize_new_task(const nlohmann::json& record,
                                        Timestamp now) const -> Result<Task>;

  // Id uniqueness, dependency resolution and acyclicity of `task` against
  // every task on `boards`.
  [[nodiscard]] static auto
  check_references(const Task& task,
                   const std::vector<const TaskList*>& boards,
                   ReferenceMode mode) -> Result<void>;

private:
  auto check_type(const FieldSpec& spec, const nlohmann::json& value,
                  ValidationReport& report) const -> bool;
  auto check_dependencies(const nlohmann::json& value,
                          const nlohmann::json* self_id,
                          ValidationReport& report) const -> void;
  auto check_history(const nlohmann::json& history,
                     ValidationReport& report) const -> void;

  ValidationLimits limits_;
};

}  // namespace agentboard
