#pragma once

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace agentboard {

enum class Error : int {
  Success,
  Validation,
  DuplicateTask,
  NotFound,
  AlreadyClaimed,
  PermissionDenied,
  InvalidTransition,
  DependencyUnresolved,
  LockTimeout,
  Corruption,
  IoError,
  DatabaseError,
  ParseError,
  InvalidArgument,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "validation error",
      "duplicate task",
      "not found",
      "already claimed",
      "permission denied",
      "invalid transition",
      "dependency unresolved",
      "lock timeout",
      "board corrupted",
      "i/o error",
      "database error",
      "parse error",
      "invalid argument",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "agentboard";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

}  // namespace agentboard

template <>
struct std::is_error_code_enum<agentboard::Error> : std::true_type {};

namespace agentboard {

// Every failure names the task it concerns (when there is one) and a reason
// precise enough to reproduce the condition.
struct Failure {
  std::error_code code;
  std::string reason;
  std::string task_id;

  [[nodiscard]] auto is(Error e) const noexcept -> bool {
    return code == make_error_code(e);
  }

  [[nodiscard]] auto message() const -> std::string {
    std::string out = code.message();
    if (!reason.empty()) {
      out += ": ";
      out += reason;
    }
    if (!task_id.empty()) {
      out += " [task ";
      out += task_id;
      out += "]";
    }
    return out;
  }
};

template <typename T>
using Result = std::expected<T, Failure>;

template <typename T>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e, std::string reason = {},
                               std::string task_id = {})
    -> std::unexpected<Failure> {
  return std::unexpected{
      Failure{make_error_code(e), std::move(reason), std::move(task_id)}};
}

[[nodiscard]] inline auto fail(Failure failure) -> std::unexpected<Failure> {
  return std::unexpected{std::move(failure)};
}

}  // namespace agentboard
