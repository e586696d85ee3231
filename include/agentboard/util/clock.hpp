#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace agentboard {

using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;
using Clock = std::function<Timestamp()>;

[[nodiscard]] inline auto system_now() -> Timestamp {
  return std::chrono::floor<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
}

[[nodiscard]] inline auto to_millis(Timestamp ts) noexcept -> std::int64_t {
  return ts.time_since_epoch().count();
}

[[nodiscard]] inline auto from_millis(std::int64_t ms) noexcept -> Timestamp {
  return Timestamp{std::chrono::milliseconds{ms}};
}

}  // namespace agentboard
