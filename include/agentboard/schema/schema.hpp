#pragma once

#include "agentboard/task/state_strings.hpp"
#include "agentboard/task/task_json.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace agentboard {

enum class FieldType : std::uint8_t {
  String,
  NullableString,
  Integer,
  StringArray,
  Object,
  HistoryArray,
};

// How a field may appear in an add_task record.
enum class OnCreate : std::uint8_t {
  Required,
  Optional,
  Forbidden,
};

struct FieldSpec {
  std::string_view name;
  FieldType type;
  bool required;  // in a stored record
  OnCreate on_create;
  bool patchable;
  std::span<const std::string_view> allowed;  // empty: any value
};

namespace schema {

inline constexpr std::array<std::string_view, 5> kPriorityInputNames = {
    "CRITICAL", "HIGH", "NORMAL", "LOW", "MEDIUM",
};

inline constexpr std::uint32_t kSchemaVersion = 1;
inline constexpr std::size_t kMaxTaskIdBytes = 128;

// clang-format off
inline constexpr std::array<FieldSpec, 13> kTaskFields = {{
    {field::kTaskId,          FieldType::String,         true,  OnCreate::Required,  false, {}},
    {field::kDescription,     FieldType::String,         true,  OnCreate::Required,  true,  {}},
    {field::kStatus,          FieldType::String,         true,  OnCreate::Optional,  true,  detail::kTaskStatusNames},
    {field::kAssignedAgentId, FieldType::NullableString, false, OnCreate::Forbidden, false, {}},
    {field::kDependencies,    FieldType::StringArray,    true,  OnCreate::Optional,  true,  {}},
    {field::kPriority,        FieldType::String,         true,  OnCreate::Optional,  true,  kPriorityInputNames},
    {field::kHistory,         FieldType::HistoryArray,   true,  OnCreate::Forbidden, false, {}},
    {field::kCreatedAt,       FieldType::Integer,        true,  OnCreate::Forbidden, false, {}},
    {field::kUpdatedAt,       FieldType::Integer,        true,  OnCreate::Forbidden, false, {}},
    {field::kCreatedBy,       FieldType::String,         false, OnCreate::Optional,  false, {}},
    {field::kSummary,         FieldType::String,         false, OnCreate::Forbidden, false, {}},
    {field::kOutputs,         FieldType::Object,         false, OnCreate::Forbidden, false, {}},
    {field::kFailureReason,   FieldType::String,         false, OnCreate::Forbidden, false, {}},
}};
// clang-format on

[[nodiscard]] constexpr auto find_field(std::string_view name)
    -> const FieldSpec* {
  for (const auto& spec : kTaskFields) {
    if (spec.name == name) {
      return &spec;
    }
  }
  return nullptr;
}

[[nodiscard]] constexpr auto field_type_name(FieldType type) noexcept
    -> std::string_view {
  switch (type) {
    case FieldType::String:
      return "string";
    case FieldType::NullableString:
      return "string or null";
    case FieldType::Integer:
      return "integer";
    case FieldType::StringArray:
      return "array of strings";
    case FieldType::Object:
      return "object";
    case FieldType::HistoryArray:
      return "array of history entries";
  }
  return "unknown";
}

}  // namespace schema

}  // namespace agentboard
