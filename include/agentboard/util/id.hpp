#pragma once

#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace agentboard {

// Phantom type tags for type-safe ID disambiguation
struct TaskTag {};
struct AgentTag {};

// Type-safe ID wrapper using phantom type pattern
// Prevents accidentally passing an agent id where a task id is expected
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }
  [[nodiscard]] auto c_str() const -> const char* { return value_.c_str(); }

  [[nodiscard]] explicit operator std::string() const { return value_; }
  [[nodiscard]] explicit operator std::string_view() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs, const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs) -> bool = default;

  [[nodiscard]] auto size() const -> size_t { return value_.size(); }

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;
using AgentId = TypedId<AgentTag>;

inline const AgentId kSystemActor{"system"};

namespace detail {
inline auto generate_short_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  return fmt::format("{:08x}", dis(gen));
}
}  // namespace detail

inline auto generate_task_id(std::string_view prefix = "TASK") -> TaskId {
  return TaskId{fmt::format("{}-{}", prefix, detail::generate_short_uuid())};
}

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace agentboard

// Enable std::unordered_map<TypedId<Tag>, V> usage
template <typename Tag>
struct std::hash<agentboard::TypedId<Tag>> {
  auto operator()(const agentboard::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct fmt::formatter<agentboard::TypedId<Tag>> : fmt::formatter<std::string_view> {
  auto format(const agentboard::TypedId<Tag>& id, fmt::format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(id.value(), ctx);
  }
};
